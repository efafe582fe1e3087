#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

#include "core/EngineResult.hpp"
#include "core/SchedulingPolicy.hpp"
#include "core/Snapshot.hpp"
#include "process/Process.hpp"

namespace schedview {

/**
 * Single-CPU scheduling state machine advanced one logical tick at a time.
 *
 * `currentTick()` is the index of the next slot to execute. tick() executes
 * that slot: arrivals with arrival_tick <= slot become Ready, the policy
 * picks or preempts, the running process consumes one unit and, if it is
 * done, finishes with finish_tick = slot + 1.
 *
 * Not thread safe. SimulationHost serializes every call.
 */
class SchedulingEngine {
public:
    /// Most recent Gantt slices carried by a snapshot; older ones are discarded.
    static constexpr std::size_t kGanttWindow = 256;

    /**
     * @param policy       Algorithm for the run
     * @param maxProcesses Capacity of the process table, 0 for unlimited
     */
    explicit SchedulingEngine(SchedulingPolicy policy = Fcfs{}, std::size_t maxProcesses = 0);

    /**
     * Register a process that becomes eligible at spec.arrival_tick, or at
     * the current tick when the spec leaves it empty.
     * Fails with InvalidProcessSpec for a non-positive burst or an arrival
     * before the current tick, ProcessLimit when the table is full.
     * On success `value` holds the new id.
     */
    EngineResult addProcess(const ProcessSpec& spec);

    /** Execute one slot. After completion this is a no-op. */
    Snapshot tick();

    /**
     * Replace the algorithm. Only legal until the first process has run;
     * PolicyLocked afterwards, InvalidQuantum for a non-positive RR quantum.
     */
    EngineResult setPolicy(const SchedulingPolicy& policy);

    /** Current state without advancing. */
    Snapshot snapshot() const;

    /** True when no process is Pending, Ready or Running. */
    bool isComplete() const;

    bool policyLocked() const { return started_; }
    Tick currentTick() const { return current_tick_; }
    const SchedulingPolicy& policy() const { return policy_; }

    /** Look up a process by id. Returns nullptr if unknown. */
    const Process* getProcess(ProcessId id) const;

private:
    void promoteArrivals(Tick slot);
    void applyPolicy();
    void dispatch(Process& next);
    void makeReady(Process& proc);
    void runSlot(Tick slot);
    void recordGantt(std::optional<ProcessId> id, Tick slot);
    std::vector<const Process*> readyProcesses() const;
    Process* runningProcess();
    SnapshotStats computeStats() const;

    SchedulingPolicy policy_;
    std::size_t max_processes_;
    std::vector<Process> processes_;            ///< Index is id - 1.
    std::optional<std::size_t> running_index_;  ///< Slot in processes_ holding the CPU.
    std::optional<ProcessId> last_runner_;      ///< Last process dispatched, for context switches.
    Tick current_tick_{0};
    Tick busy_ticks_{0};
    int slice_used_{0};
    std::uint64_t next_ready_seq_{1};
    std::uint64_t context_switches_{0};
    bool started_{false};
    std::deque<GanttSlice> gantt_;              ///< At most kGanttWindow slices, oldest first.
};

} // namespace schedview
