#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "process/Process.hpp"

namespace schedview {

/// One contiguous run of the CPU on a process, or idle when `id` is empty.
struct GanttSlice {
    std::optional<ProcessId> id;
    Tick start{0};
    Tick end{0};
};

/// Aggregate metrics over finished processes.
struct SnapshotStats {
    std::size_t completed{0};
    std::size_t total{0};
    double avg_waiting{0.0};
    double avg_turnaround{0.0};
    double avg_response{0.0};
    double cpu_utilization{0.0}; ///< Percentage of elapsed ticks the CPU was busy.
    double throughput{0.0};      ///< Finished processes per tick.
};

/**
 * Immutable view of the whole simulation after one tick. Produced only by
 * SchedulingEngine; everything outside the engine works on these copies.
 */
struct Snapshot {
    Tick tick{0};
    std::string policy;
    std::optional<int> quantum;
    bool paused{false};
    bool complete{true};
    std::optional<ProcessId> running_id;
    std::uint64_t context_switches{0};
    std::vector<Process> processes; ///< Insertion (id) order.
    SnapshotStats stats;
    std::vector<GanttSlice> gantt;  ///< Latest slices only, oldest first.

    const Process* find(ProcessId id) const {
        for (const auto& p : processes) {
            if (p.id == id) {
                return &p;
            }
        }
        return nullptr;
    }
};

} // namespace schedview
