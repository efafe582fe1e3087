#pragma once

#include <optional>
#include <string>

namespace schedview {

/**
 * Lifecycle state of a simulated process.
 */
enum class ProcessState {
    PENDING,  ///< Created, waiting for its arrival tick.
    READY,    ///< Arrived and waiting for the CPU.
    RUNNING,  ///< Holding the CPU in the current tick slot.
    FINISHED  ///< All burst ticks consumed.
};

inline const char* toString(ProcessState state) {
    switch (state) {
    case ProcessState::PENDING:  return "Pending";
    case ProcessState::READY:    return "Ready";
    case ProcessState::RUNNING:  return "Running";
    case ProcessState::FINISHED: return "Finished";
    }
    return "Unknown";
}

inline std::optional<ProcessState> parseProcessState(const std::string& text) {
    if (text == "Pending")  return ProcessState::PENDING;
    if (text == "Ready")    return ProcessState::READY;
    if (text == "Running")  return ProcessState::RUNNING;
    if (text == "Finished") return ProcessState::FINISHED;
    return std::nullopt;
}

} // namespace schedview
