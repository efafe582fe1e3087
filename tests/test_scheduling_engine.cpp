#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "core/SchedulingEngine.hpp"
#include "ipc/LineBuffer.hpp"
#include "ipc/Message.hpp"

using namespace schedview;

namespace {

ProcessSpec spec(std::optional<Tick> arrival, Tick burst, int priority = 5,
                 const std::string& name = std::string()) {
    ProcessSpec s;
    s.arrival_tick = arrival;
    s.burst_total = burst;
    s.priority = priority;
    s.name = name;
    return s;
}

int add(SchedulingEngine& engine, const ProcessSpec& s) {
    EngineResult result = engine.addProcess(s);
    REQUIRE(result.success, "addProcess failed: " << result.message);
    return result.value;
}

// Process id that consumed each slot, or 0 for an idle slot.
std::vector<int> runToCompletion(SchedulingEngine& engine, int limit = 100) {
    std::vector<int> order;
    while (!engine.isComplete() && limit-- > 0) {
        Snapshot snap = engine.tick();
        const GanttSlice& last = snap.gantt.back();
        REQUIRE(last.end == snap.tick, "gantt does not reach the current tick");
        order.push_back(last.id.value_or(0));
    }
    REQUIRE(engine.isComplete(), "run did not complete");
    return order;
}

std::string join(const std::vector<int>& ids) {
    std::string out;
    for (int id : ids) {
        out += std::to_string(id);
    }
    return out;
}

void testFcfsRunsInArrivalOrder() {
    SchedulingEngine engine(Fcfs{});
    int a = add(engine, spec(0, 3, 5, "A"));
    int b = add(engine, spec(1, 2, 5, "B"));

    REQUIRE(join(runToCompletion(engine)) == "11122", "FCFS order");
    REQUIRE(engine.getProcess(a)->finish_tick == Tick{3}, "A finishes at 3");
    REQUIRE(engine.getProcess(b)->finish_tick == Tick{5}, "B finishes at 5");
    REQUIRE(engine.currentTick() == 5, "five slots executed");
}

void testSrtfPreemptsForShorterArrival() {
    SchedulingEngine engine(Srtf{});
    int a = add(engine, spec(0, 5, 5, "A"));
    int b = add(engine, spec(2, 2, 5, "B"));

    engine.tick();
    engine.tick();
    Snapshot third = engine.tick();
    REQUIRE(third.running_id == b, "B takes the CPU at tick 2");
    REQUIRE(third.find(a)->state == ProcessState::READY, "A preempted back to Ready");
    REQUIRE(third.find(a)->remaining == 3, "A has 3 left");

    runToCompletion(engine);
    REQUIRE(engine.getProcess(b)->finish_tick == Tick{4}, "B finishes at 4");
    REQUIRE(engine.getProcess(a)->finish_tick == Tick{7}, "A resumes and finishes at 7");

    Snapshot done = engine.snapshot();
    REQUIRE(done.gantt.size() == 3, "A, B, A slices");
    REQUIRE(done.gantt[1].id == b && done.gantt[1].start == 2 && done.gantt[1].end == 4,
            "B slice spans 2-4");
}

void testRoundRobinRequeuesBehindWaitingProcess() {
    SchedulingEngine engine(RoundRobin{2});
    add(engine, spec(0, 3, 5, "A"));
    add(engine, spec(0, 3, 5, "B"));

    REQUIRE(join(runToCompletion(engine)) == "112212", "RR quantum 2 order");
}

void testRoundRobinArrivalQueuesAheadOfPreempted() {
    SchedulingEngine engine(RoundRobin{2});
    add(engine, spec(0, 4, 5, "A"));
    add(engine, spec(2, 1, 5, "B"));

    // B arrives in the slot where A's quantum expires and is queued first.
    REQUIRE(join(runToCompletion(engine)) == "11211", "arrival ahead of requeued process");
}

void testSjfDoesNotPreempt() {
    SchedulingEngine engine(Sjf{});
    add(engine, spec(0, 5));
    add(engine, spec(1, 1));
    add(engine, spec(1, 3));

    REQUIRE(join(runToCompletion(engine)) == "111112333", "SJF keeps the running job");
}

void testPriorityPicksLowestValue() {
    SchedulingEngine engine(PriorityFirst{});
    add(engine, spec(0, 3, 5));
    add(engine, spec(1, 2, 3));
    add(engine, spec(1, 2, 1));

    REQUIRE(join(runToCompletion(engine)) == "1113322", "priority order after A finishes");
}

void testTickAfterCompletionIsIdempotent() {
    SchedulingEngine engine(Fcfs{});
    add(engine, spec(0, 2));
    runToCompletion(engine);

    std::string first = ipc::encodeSnapshot(engine.tick());
    std::string second = ipc::encodeSnapshot(engine.tick());
    REQUIRE(first == second, "repeated ticks after completion differ");
    REQUIRE(engine.currentTick() == 2, "clock must not advance once complete");
}

void testEmptyEngineDoesNotAdvance() {
    SchedulingEngine engine;
    Snapshot snap = engine.tick();
    REQUIRE(snap.tick == 0 && snap.complete, "empty engine is complete at tick 0");
    REQUIRE(snap.gantt.empty(), "no gantt entries without processes");
}

void testRejectsNonPositiveBurst() {
    SchedulingEngine engine;
    add(engine, spec(0, 1));

    EngineResult zero = engine.addProcess(spec(0, 0));
    REQUIRE(!zero.success && zero.error == ErrorCode::InvalidProcessSpec, "burst 0 rejected");
    EngineResult negative = engine.addProcess(spec(0, -4));
    REQUIRE(!negative.success && negative.error == ErrorCode::InvalidProcessSpec,
            "negative burst rejected");
    REQUIRE(engine.snapshot().processes.size() == 1, "table unchanged by rejected adds");
}

void testRejectsArrivalInThePast() {
    SchedulingEngine engine;
    add(engine, spec(0, 10));
    engine.tick();
    engine.tick();
    engine.tick();

    EngineResult late = engine.addProcess(spec(1, 2));
    REQUIRE(!late.success && late.error == ErrorCode::InvalidProcessSpec, "past arrival rejected");

    int now = add(engine, spec(std::nullopt, 2, 5, "now"));
    REQUIRE(engine.getProcess(now)->arrival_tick == 3, "missing arrival means current tick");
    REQUIRE(engine.getProcess(now)->name == "now", "name kept");

    int unnamed = add(engine, spec(5, 1));
    REQUIRE(engine.getProcess(unnamed)->name == "P3", "default name from id");
}

void testProcessLimit() {
    SchedulingEngine engine(Fcfs{}, 2);
    add(engine, spec(0, 1));
    add(engine, spec(0, 1));
    EngineResult full = engine.addProcess(spec(0, 1));
    REQUIRE(!full.success && full.error == ErrorCode::ProcessLimit, "third process refused");
}

void testPolicyLocksOnceStarted() {
    SchedulingEngine engine;
    REQUIRE(engine.setPolicy(Sjf{}).success, "change before start");

    EngineResult badQuantum = engine.setPolicy(RoundRobin{0});
    REQUIRE(!badQuantum.success && badQuantum.error == ErrorCode::InvalidQuantum,
            "quantum 0 rejected");
    REQUIRE(std::holds_alternative<Sjf>(engine.policy()), "policy unchanged by bad quantum");

    // Idle ticks before the first arrival do not lock the policy.
    add(engine, spec(2, 1));
    engine.tick();
    REQUIRE(!engine.policyLocked(), "idle ticks keep the policy open");
    REQUIRE(engine.setPolicy(RoundRobin{3}).success, "change while idle");

    engine.tick();
    engine.tick();
    REQUIRE(engine.policyLocked(), "locked after the first dispatch");
    EngineResult locked = engine.setPolicy(Fcfs{});
    REQUIRE(!locked.success && locked.error == ErrorCode::PolicyLocked, "PolicyLocked");
    REQUIRE(engine.snapshot().policy == "RR" && engine.snapshot().quantum == 3,
            "policy unchanged after rejection");
}

void testInvariantsHoldUnderEveryPolicy() {
    const std::vector<SchedulingPolicy> policies = {
        Fcfs{}, Sjf{}, Srtf{}, RoundRobin{1}, RoundRobin{3}, PriorityFirst{},
    };
    for (const auto& policy : policies) {
        SchedulingEngine engine(policy);
        const Tick arrivals[] = {0, 0, 1, 3, 3, 7, 12};
        const Tick bursts[] = {4, 2, 6, 1, 3, 5, 2};
        const int priorities[] = {3, 1, 4, 1, 5, 9, 2};
        for (int i = 0; i < 7; ++i) {
            add(engine, spec(arrivals[i], bursts[i], priorities[i]));
        }

        std::map<ProcessId, Tick> lastRemaining;
        std::map<ProcessId, Tick> finishedAt;
        Tick busy = 0;
        while (!engine.isComplete()) {
            Snapshot snap = engine.tick();
            REQUIRE(snap.tick <= 100, policyName(policy) << " did not finish");
            int running = 0;
            for (const auto& p : snap.processes) {
                if (p.state == ProcessState::RUNNING) {
                    ++running;
                }
                auto prev = lastRemaining.find(p.id);
                REQUIRE(prev == lastRemaining.end() || p.remaining <= prev->second,
                        policyName(policy) << " remaining grew for " << p.id);
                lastRemaining[p.id] = p.remaining;
                if (p.state == ProcessState::FINISHED) {
                    REQUIRE(p.remaining == 0, "finished with work left");
                    auto first = finishedAt.emplace(p.id, *p.finish_tick);
                    REQUIRE(first.first->second == *p.finish_tick, "finish_tick changed");
                }
            }
            REQUIRE(running <= 1, policyName(policy) << " has " << running << " running");
            if (snap.gantt.back().id) {
                ++busy;
            }
        }
        REQUIRE(busy == 23, policyName(policy) << " executed " << busy << " busy slots");
    }
}

void testStatistics() {
    SchedulingEngine engine(Fcfs{});
    add(engine, spec(0, 3));
    add(engine, spec(1, 2));
    runToCompletion(engine);

    Snapshot snap = engine.snapshot();
    REQUIRE(snap.find(1)->waiting == 0, "A never waits");
    REQUIRE(snap.find(2)->waiting == 2, "B waits slots 1 and 2");
    REQUIRE(snap.stats.completed == 2 && snap.stats.total == 2, "counts");
    REQUIRE(snap.stats.avg_waiting == 1.0, "avg waiting " << snap.stats.avg_waiting);
    REQUIRE(snap.stats.avg_turnaround == 3.5, "avg turnaround " << snap.stats.avg_turnaround);
    REQUIRE(snap.stats.avg_response == 1.0, "avg response " << snap.stats.avg_response);
    REQUIRE(snap.stats.cpu_utilization == 100.0, "cpu always busy");
    REQUIRE(snap.stats.throughput == 0.4, "throughput " << snap.stats.throughput);
    REQUIRE(snap.context_switches == 2, "two dispatches");
}

void testIdleSlotsAppearInGantt() {
    SchedulingEngine engine;
    add(engine, spec(2, 1));
    REQUIRE(join(runToCompletion(engine)) == "001", "two idle slots then the process");

    Snapshot snap = engine.snapshot();
    REQUIRE(snap.gantt.size() == 2, "idle slice then busy slice");
    REQUIRE(!snap.gantt[0].id && snap.gantt[0].start == 0 && snap.gantt[0].end == 2,
            "idle slice merged");
    REQUIRE(snap.stats.cpu_utilization > 33.3 && snap.stats.cpu_utilization < 33.4,
            "one busy slot in three");
}

void testLateInjectionRestartsRun() {
    SchedulingEngine engine;
    add(engine, spec(0, 1));
    runToCompletion(engine);
    REQUIRE(engine.isComplete(), "first batch done");

    int id = add(engine, spec(std::nullopt, 2));
    REQUIRE(!engine.isComplete(), "new work reopens the run");
    runToCompletion(engine);
    REQUIRE(engine.getProcess(id)->finish_tick == Tick{3}, "runs right after injection");
}

void testLongRunSnapshotStaysBounded() {
    SchedulingEngine engine(RoundRobin{1});
    add(engine, spec(0, 5000, 5, "left"));
    add(engine, spec(0, 5000, 5, "right"));
    Snapshot snap;
    for (int i = 0; i < 3000; ++i) {
        snap = engine.tick();
    }
    REQUIRE(snap.tick == 3000, "3000 slots executed");
    REQUIRE(snap.gantt.size() == SchedulingEngine::kGanttWindow, "timeline capped, got " << snap.gantt.size());
    REQUIRE(snap.gantt.back().end == 3000, "newest slice kept");
    REQUIRE(snap.gantt.front().start == 3000 - static_cast<Tick>(SchedulingEngine::kGanttWindow),
            "oldest slices dropped");

    std::string line = ipc::encodeSnapshot(snap) + "\n";
    ipc::LineBuffer buffer;
    buffer.append(line.data(), line.size());
    std::string received;
    REQUIRE(!buffer.overflowed() && buffer.nextLine(received),
            "snapshot of " << line.size() << " bytes does not fit one frame");
    REQUIRE(ipc::decodeSnapshot(received), "framed snapshot decodes");
}

} // namespace

int main() {
    RUN_TEST(testFcfsRunsInArrivalOrder);
    RUN_TEST(testSrtfPreemptsForShorterArrival);
    RUN_TEST(testRoundRobinRequeuesBehindWaitingProcess);
    RUN_TEST(testRoundRobinArrivalQueuesAheadOfPreempted);
    RUN_TEST(testSjfDoesNotPreempt);
    RUN_TEST(testPriorityPicksLowestValue);
    RUN_TEST(testTickAfterCompletionIsIdempotent);
    RUN_TEST(testEmptyEngineDoesNotAdvance);
    RUN_TEST(testRejectsNonPositiveBurst);
    RUN_TEST(testRejectsArrivalInThePast);
    RUN_TEST(testProcessLimit);
    RUN_TEST(testPolicyLocksOnceStarted);
    RUN_TEST(testInvariantsHoldUnderEveryPolicy);
    RUN_TEST(testStatistics);
    RUN_TEST(testIdleSlotsAppearInGantt);
    RUN_TEST(testLateInjectionRestartsRun);
    RUN_TEST(testLongRunSnapshotStaysBounded);
    std::cout << "All scheduling engine tests passed" << std::endl;
    return 0;
}
