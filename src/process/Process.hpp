#ifndef SCHEDVIEW_PROCESS_HPP
#define SCHEDVIEW_PROCESS_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "ProcessState.hpp"

namespace schedview {

using ProcessId = int;
using Tick = std::int64_t;

// Parameters an injector supplies for a new process.
struct ProcessSpec {
    std::optional<Tick> arrival_tick; // empty means the tick at acceptance
    Tick burst_total{0};
    int priority{5};
    std::string name; // empty means "P<id>"
};

// One schedulable unit. Only SchedulingEngine mutates these; everyone else
// works on the copies carried by a Snapshot.
struct Process {
    ProcessId id{0};
    std::string name;
    Tick arrival_tick{0};
    Tick burst_total{0};
    Tick remaining{0};
    int priority{5};
    ProcessState state{ProcessState::PENDING};
    std::optional<Tick> finish_tick;
    std::optional<Tick> start_tick;  // first slot it ran
    Tick waiting{0};                 // slots spent Ready while another process ran
    std::uint64_t ready_seq{0};      // stamped on every entry into Ready

    std::optional<Tick> turnaround() const {
        if (!finish_tick) {
            return std::nullopt;
        }
        return *finish_tick - arrival_tick;
    }

    std::optional<Tick> response() const {
        if (!start_tick) {
            return std::nullopt;
        }
        return *start_tick - arrival_tick;
    }
};

} // namespace schedview

#endif // SCHEDVIEW_PROCESS_HPP
