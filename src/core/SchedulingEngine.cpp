#include "SchedulingEngine.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace schedview {

SchedulingEngine::SchedulingEngine(SchedulingPolicy policy, std::size_t maxProcesses)
    : policy_(std::move(policy)), max_processes_(maxProcesses) {}

EngineResult SchedulingEngine::addProcess(const ProcessSpec& spec) {
    if (spec.burst_total <= 0) {
        return EngineResult::fail(ErrorCode::InvalidProcessSpec,
                                  "burst_total must be positive");
    }
    const Tick arrival = spec.arrival_tick.value_or(current_tick_);
    if (arrival < current_tick_) {
        std::ostringstream oss;
        oss << "arrival_tick " << arrival
            << " is before current tick " << current_tick_;
        return EngineResult::fail(ErrorCode::InvalidProcessSpec, oss.str());
    }
    if (max_processes_ != 0 && processes_.size() >= max_processes_) {
        return EngineResult::fail(ErrorCode::ProcessLimit, "process table is full");
    }

    Process proc;
    proc.id = static_cast<ProcessId>(processes_.size()) + 1;
    proc.name = spec.name.empty() ? "P" + std::to_string(proc.id) : spec.name;
    proc.arrival_tick = arrival;
    proc.burst_total = spec.burst_total;
    proc.remaining = spec.burst_total;
    proc.priority = spec.priority;
    proc.state = ProcessState::PENDING;
    processes_.push_back(proc);
    return EngineResult::ok(proc.id, "process created");
}

Snapshot SchedulingEngine::tick() {
    if (isComplete()) {
        return snapshot();
    }
    const Tick slot = current_tick_;
    promoteArrivals(slot);
    applyPolicy();
    runSlot(slot);
    current_tick_ = slot + 1;
    return snapshot();
}

EngineResult SchedulingEngine::setPolicy(const SchedulingPolicy& policy) {
    if (started_) {
        return EngineResult::fail(ErrorCode::PolicyLocked,
                                  "policy cannot change once a process has run");
    }
    if (auto quantum = policyQuantum(policy); quantum && *quantum <= 0) {
        return EngineResult::fail(ErrorCode::InvalidQuantum, "quantum must be positive");
    }
    policy_ = policy;
    return EngineResult::ok(0, std::string("policy set to ") + policyName(policy_));
}

bool SchedulingEngine::isComplete() const {
    return std::all_of(processes_.begin(), processes_.end(), [](const Process& p) {
        return p.state == ProcessState::FINISHED;
    });
}

const Process* SchedulingEngine::getProcess(ProcessId id) const {
    if (id < 1 || static_cast<std::size_t>(id) > processes_.size()) {
        return nullptr;
    }
    return &processes_[static_cast<std::size_t>(id) - 1];
}

void SchedulingEngine::promoteArrivals(Tick slot) {
    for (auto& proc : processes_) {
        if (proc.state == ProcessState::PENDING && proc.arrival_tick <= slot) {
            makeReady(proc);
        }
    }
}

void SchedulingEngine::applyPolicy() {
    if (Process* running = runningProcess()) {
        if (shouldPreempt(policy_, *running, slice_used_, readyProcesses())) {
            makeReady(*running);
            running_index_.reset();
        }
    }
    if (running_index_) {
        return;
    }
    const Process* next = selectNext(policy_, readyProcesses());
    if (next != nullptr) {
        dispatch(processes_[static_cast<std::size_t>(next->id) - 1]);
    }
}

void SchedulingEngine::dispatch(Process& next) {
    next.state = ProcessState::RUNNING;
    running_index_ = static_cast<std::size_t>(next.id) - 1;
    slice_used_ = 0;
    started_ = true;
    if (last_runner_ != next.id) {
        ++context_switches_;
        last_runner_ = next.id;
    }
}

void SchedulingEngine::makeReady(Process& proc) {
    proc.state = ProcessState::READY;
    proc.ready_seq = next_ready_seq_++;
}

void SchedulingEngine::runSlot(Tick slot) {
    for (auto& proc : processes_) {
        if (proc.state == ProcessState::READY) {
            ++proc.waiting;
        }
    }

    Process* running = runningProcess();
    if (running == nullptr) {
        recordGantt(std::nullopt, slot);
        return;
    }
    if (!running->start_tick) {
        running->start_tick = slot;
    }
    --running->remaining;
    ++slice_used_;
    ++busy_ticks_;
    recordGantt(running->id, slot);

    if (running->remaining == 0) {
        running->state = ProcessState::FINISHED;
        running->finish_tick = slot + 1;
        running_index_.reset();
    }
}

void SchedulingEngine::recordGantt(std::optional<ProcessId> id, Tick slot) {
    if (!gantt_.empty() && gantt_.back().id == id && gantt_.back().end == slot) {
        gantt_.back().end = slot + 1;
        return;
    }
    gantt_.push_back({id, slot, slot + 1});
    if (gantt_.size() > kGanttWindow) {
        gantt_.pop_front();
    }
}

std::vector<const Process*> SchedulingEngine::readyProcesses() const {
    std::vector<const Process*> ready;
    for (const auto& proc : processes_) {
        if (proc.state == ProcessState::READY) {
            ready.push_back(&proc);
        }
    }
    return ready;
}

Process* SchedulingEngine::runningProcess() {
    if (!running_index_) {
        return nullptr;
    }
    return &processes_[*running_index_];
}

SnapshotStats SchedulingEngine::computeStats() const {
    SnapshotStats stats;
    stats.total = processes_.size();
    Tick waiting = 0;
    Tick turnaround = 0;
    Tick response = 0;
    for (const auto& proc : processes_) {
        if (proc.state != ProcessState::FINISHED) {
            continue;
        }
        ++stats.completed;
        waiting += proc.waiting;
        turnaround += proc.turnaround().value_or(0);
        response += proc.response().value_or(0);
    }
    if (stats.completed > 0) {
        const double n = static_cast<double>(stats.completed);
        stats.avg_waiting = static_cast<double>(waiting) / n;
        stats.avg_turnaround = static_cast<double>(turnaround) / n;
        stats.avg_response = static_cast<double>(response) / n;
    }
    if (current_tick_ > 0) {
        const double elapsed = static_cast<double>(current_tick_);
        stats.cpu_utilization = static_cast<double>(busy_ticks_) * 100.0 / elapsed;
        stats.throughput = static_cast<double>(stats.completed) / elapsed;
    }
    return stats;
}

Snapshot SchedulingEngine::snapshot() const {
    Snapshot snap;
    snap.tick = current_tick_;
    snap.policy = policyName(policy_);
    snap.quantum = policyQuantum(policy_);
    snap.complete = isComplete();
    if (running_index_) {
        snap.running_id = processes_[*running_index_].id;
    }
    snap.context_switches = context_switches_;
    snap.processes = processes_;
    snap.stats = computeStats();
    snap.gantt.assign(gantt_.begin(), gantt_.end());
    return snap;
}

} // namespace schedview
