#pragma once

#include <string>
#include <utility>

namespace schedview {

enum class ErrorCode : int {
    None = 0,
    InvalidProcessSpec,
    ProcessLimit,
    PolicyLocked,
    InvalidQuantum,
    UnknownPolicy,
    ProtocolError,
    ConnectionLost,
};

inline const char* toString(ErrorCode code) {
    switch (code) {
    case ErrorCode::None:               return "None";
    case ErrorCode::InvalidProcessSpec: return "InvalidProcessSpec";
    case ErrorCode::ProcessLimit:       return "ProcessLimit";
    case ErrorCode::PolicyLocked:       return "PolicyLocked";
    case ErrorCode::InvalidQuantum:     return "InvalidQuantum";
    case ErrorCode::UnknownPolicy:      return "UnknownPolicy";
    case ErrorCode::ProtocolError:      return "ProtocolError";
    case ErrorCode::ConnectionLost:     return "ConnectionLost";
    }
    return "Unknown";
}

// Outcome of a request against the engine. `value` carries the assigned id
// for add requests.
struct EngineResult {
    bool success{false};
    int value{-1};
    std::string message;
    ErrorCode error{ErrorCode::None};

    static EngineResult ok(int value, std::string message) {
        return {true, value, std::move(message), ErrorCode::None};
    }

    static EngineResult fail(ErrorCode error, std::string message) {
        return {false, -1, std::move(message), error};
    }
};

} // namespace schedview
