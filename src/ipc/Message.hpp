#pragma once

#include <optional>
#include <string>

#include "core/EngineResult.hpp"
#include "core/Snapshot.hpp"
#include "ipc/Json.hpp"
#include "process/Process.hpp"

// Wire protocol between the server and its clients. Every message is one
// JSON object on a single line; framing (the trailing '\n') is added by the
// transport, never by the encoders below.
namespace schedview {
namespace ipc {

enum class ClientRole {
    Renderer, // read only, receives a snapshot after every tick
    Injector, // submits processes and operator commands
};

const char* toString(ClientRole role);

enum class RequestType {
    AddProcess = 0,
    SetPolicy,
    Pause,
    Resume,
    State,
};

// One decoded injector line.
struct InjectorRequest {
    RequestType type{RequestType::AddProcess};
    ProcessSpec spec;            // AddProcess
    std::string policy;          // SetPolicy
    std::optional<int> quantum;  // SetPolicy, RR only
};

// Outcome of decoding an injector line. ProtocolError means the line could
// not be understood at all and the connection should be dropped; any other
// error is reported back and the session continues.
struct DecodedRequest {
    std::optional<InjectorRequest> request;
    ErrorCode error{ErrorCode::None};
    std::string reason;
};

// Reply as seen by a client.
struct Reply {
    bool ok{false};
    std::optional<int> id;          // assigned process id for add requests
    std::string reason;
    std::optional<Snapshot> snapshot; // present for "state" replies
};

// Handshake
std::string encodeHandshake(ClientRole role);
std::optional<ClientRole> decodeHandshake(const std::string& line, std::string& reason);
std::string encodeHandshakeReply(bool ok, const std::string& reason = std::string());

// Snapshots
JsonValue snapshotToJson(const Snapshot& snap);
std::string encodeSnapshot(const Snapshot& snap);
std::optional<Snapshot> snapshotFromJson(const JsonValue& json, std::string* error = nullptr);
std::optional<Snapshot> decodeSnapshot(const std::string& line, std::string* error = nullptr);

// Injector requests
std::string encodeRequest(const InjectorRequest& request);
DecodedRequest decodeRequest(const std::string& line);

// Server replies to injectors
std::string encodeAddReply(const EngineResult& result);
std::string encodeCommandReply(const EngineResult& result);
std::string encodeStateReply(const Snapshot& snap);
std::string encodeErrorReply(const std::string& reason);

/** Parse any server reply (handshake, add or command). */
std::optional<Reply> decodeReply(const std::string& line);

} // namespace ipc
} // namespace schedview
