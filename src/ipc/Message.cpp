#include "Message.hpp"

#include <limits>
#include <utility>

namespace schedview {
namespace ipc {

namespace {

constexpr std::size_t kMaxNameLength = 64;

JsonValue optionalInt(const std::optional<Tick>& value) {
    return value ? JsonValue(static_cast<std::int64_t>(*value)) : JsonValue();
}

std::optional<JsonValue> parseObject(const std::string& line, std::string& reason) {
    std::string error;
    auto json = JsonValue::parse(line, &error);
    if (!json) {
        reason = "malformed JSON: " + error;
        return std::nullopt;
    }
    if (!json->isObject()) {
        reason = "expected a JSON object";
        return std::nullopt;
    }
    return json;
}

// Reads an integer member. Absent or null leaves `out` untouched.
bool readInt(const JsonValue& obj, const char* key, std::optional<std::int64_t>& out,
             std::string& reason) {
    const JsonValue* value = obj.get(key);
    if (value == nullptr || value->isNull()) {
        return true;
    }
    auto number = value->asInt();
    if (!number) {
        reason = std::string(key) + " must be an integer";
        return false;
    }
    out = number;
    return true;
}

bool fitsInt(std::int64_t value) {
    return value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max();
}

std::optional<Tick> tickField(const JsonValue& obj, const char* key) {
    const JsonValue* value = obj.get(key);
    if (value == nullptr) {
        return std::nullopt;
    }
    return value->asInt();
}

std::optional<Process> processFromJson(const JsonValue& json) {
    if (!json.isObject()) {
        return std::nullopt;
    }
    auto id = tickField(json, "id");
    auto remaining = tickField(json, "remaining");
    auto burst = tickField(json, "burst_total");
    auto arrival = tickField(json, "arrival_tick");
    auto priority = tickField(json, "priority");
    const JsonValue* state = json.get("state");
    if (!id || !remaining || !burst || !arrival || !priority || !state || !state->isString()) {
        return std::nullopt;
    }
    auto parsedState = parseProcessState(state->asString());
    if (!parsedState) {
        return std::nullopt;
    }
    Process proc;
    proc.id = static_cast<ProcessId>(*id);
    proc.remaining = *remaining;
    proc.burst_total = *burst;
    proc.arrival_tick = *arrival;
    proc.priority = static_cast<int>(*priority);
    proc.state = *parsedState;
    proc.finish_tick = tickField(json, "finish_tick");
    proc.start_tick = tickField(json, "start_tick");
    proc.waiting = tickField(json, "waiting").value_or(0);
    if (const JsonValue* name = json.get("name"); name && name->isString()) {
        proc.name = name->asString();
    }
    return proc;
}

double numberField(const JsonValue& obj, const char* key) {
    const JsonValue* value = obj.get(key);
    return value && value->isNumber() ? value->asDouble() : 0.0;
}

} // namespace

const char* toString(ClientRole role) {
    return role == ClientRole::Renderer ? "renderer" : "injector";
}

std::string encodeHandshake(ClientRole role) {
    return JsonValue::object().set("role", toString(role)).dump();
}

std::optional<ClientRole> decodeHandshake(const std::string& line, std::string& reason) {
    auto json = parseObject(line, reason);
    if (!json) {
        return std::nullopt;
    }
    const JsonValue* role = json->get("role");
    if (role == nullptr || !role->isString()) {
        reason = "handshake must carry a role";
        return std::nullopt;
    }
    if (role->asString() == "renderer") {
        return ClientRole::Renderer;
    }
    if (role->asString() == "injector") {
        return ClientRole::Injector;
    }
    reason = "unknown role '" + role->asString() + "'";
    return std::nullopt;
}

std::string encodeHandshakeReply(bool ok, const std::string& reason) {
    JsonValue reply = JsonValue::object().set("ok", ok);
    if (!ok) {
        reply.set("reason", reason);
    }
    return reply.dump();
}

JsonValue snapshotToJson(const Snapshot& snap) {
    JsonValue processes = JsonValue::array();
    for (const auto& proc : snap.processes) {
        processes.push(JsonValue::object()
            .set("id", proc.id)
            .set("name", proc.name)
            .set("state", toString(proc.state))
            .set("remaining", static_cast<std::int64_t>(proc.remaining))
            .set("burst_total", static_cast<std::int64_t>(proc.burst_total))
            .set("arrival_tick", static_cast<std::int64_t>(proc.arrival_tick))
            .set("priority", proc.priority)
            .set("finish_tick", optionalInt(proc.finish_tick))
            .set("start_tick", optionalInt(proc.start_tick))
            .set("waiting", static_cast<std::int64_t>(proc.waiting)));
    }

    JsonValue gantt = JsonValue::array();
    for (const auto& slice : snap.gantt) {
        gantt.push(JsonValue::object()
            .set("id", slice.id ? JsonValue(*slice.id) : JsonValue())
            .set("start", static_cast<std::int64_t>(slice.start))
            .set("end", static_cast<std::int64_t>(slice.end)));
    }

    JsonValue stats = JsonValue::object()
        .set("completed", static_cast<std::uint64_t>(snap.stats.completed))
        .set("total", static_cast<std::uint64_t>(snap.stats.total))
        .set("avg_waiting", snap.stats.avg_waiting)
        .set("avg_turnaround", snap.stats.avg_turnaround)
        .set("avg_response", snap.stats.avg_response)
        .set("cpu_utilization", snap.stats.cpu_utilization)
        .set("throughput", snap.stats.throughput);

    return JsonValue::object()
        .set("tick", static_cast<std::int64_t>(snap.tick))
        .set("policy", snap.policy)
        .set("quantum", snap.quantum ? JsonValue(*snap.quantum) : JsonValue())
        .set("paused", snap.paused)
        .set("complete", snap.complete)
        .set("running_id", snap.running_id ? JsonValue(*snap.running_id) : JsonValue())
        .set("context_switches", snap.context_switches)
        .set("processes", std::move(processes))
        .set("stats", std::move(stats))
        .set("gantt", std::move(gantt));
}

std::string encodeSnapshot(const Snapshot& snap) {
    return snapshotToJson(snap).dump();
}

std::optional<Snapshot> snapshotFromJson(const JsonValue& json, std::string* error) {
    auto fail = [error](const char* message) -> std::optional<Snapshot> {
        if (error) {
            *error = message;
        }
        return std::nullopt;
    };
    if (!json.isObject()) {
        return fail("snapshot must be an object");
    }
    auto tick = tickField(json, "tick");
    const JsonValue* policy = json.get("policy");
    const JsonValue* processes = json.get("processes");
    if (!tick || !policy || !policy->isString() || !processes || !processes->isArray()) {
        return fail("snapshot is missing tick, policy or processes");
    }

    Snapshot snap;
    snap.tick = *tick;
    snap.policy = policy->asString();
    if (auto quantum = tickField(json, "quantum")) {
        snap.quantum = static_cast<int>(*quantum);
    }
    if (auto running = tickField(json, "running_id")) {
        snap.running_id = static_cast<ProcessId>(*running);
    }
    if (const JsonValue* paused = json.get("paused"); paused && paused->isBool()) {
        snap.paused = paused->asBool();
    }
    if (const JsonValue* complete = json.get("complete"); complete && complete->isBool()) {
        snap.complete = complete->asBool();
    }
    snap.context_switches = static_cast<std::uint64_t>(tickField(json, "context_switches").value_or(0));
    for (const auto& item : processes->items()) {
        auto proc = processFromJson(item);
        if (!proc) {
            return fail("malformed process entry");
        }
        snap.processes.push_back(std::move(*proc));
    }
    if (const JsonValue* stats = json.get("stats"); stats && stats->isObject()) {
        snap.stats.completed = static_cast<std::size_t>(numberField(*stats, "completed"));
        snap.stats.total = static_cast<std::size_t>(numberField(*stats, "total"));
        snap.stats.avg_waiting = numberField(*stats, "avg_waiting");
        snap.stats.avg_turnaround = numberField(*stats, "avg_turnaround");
        snap.stats.avg_response = numberField(*stats, "avg_response");
        snap.stats.cpu_utilization = numberField(*stats, "cpu_utilization");
        snap.stats.throughput = numberField(*stats, "throughput");
    }
    if (const JsonValue* gantt = json.get("gantt"); gantt && gantt->isArray()) {
        for (const auto& item : gantt->items()) {
            auto start = tickField(item, "start");
            auto end = tickField(item, "end");
            if (!start || !end) {
                return fail("malformed gantt entry");
            }
            GanttSlice slice;
            slice.start = *start;
            slice.end = *end;
            if (auto id = tickField(item, "id")) {
                slice.id = static_cast<ProcessId>(*id);
            }
            snap.gantt.push_back(slice);
        }
    }
    return snap;
}

std::optional<Snapshot> decodeSnapshot(const std::string& line, std::string* error) {
    std::string reason;
    auto json = parseObject(line, reason);
    if (!json) {
        if (error) {
            *error = reason;
        }
        return std::nullopt;
    }
    return snapshotFromJson(*json, error);
}

std::string encodeRequest(const InjectorRequest& request) {
    JsonValue json = JsonValue::object();
    switch (request.type) {
    case RequestType::AddProcess:
        if (request.spec.arrival_tick) {
            json.set("arrival_tick", static_cast<std::int64_t>(*request.spec.arrival_tick));
        }
        json.set("burst_total", static_cast<std::int64_t>(request.spec.burst_total));
        json.set("priority", request.spec.priority);
        if (!request.spec.name.empty()) {
            json.set("name", request.spec.name);
        }
        break;
    case RequestType::SetPolicy:
        json.set("command", "set_policy").set("policy", request.policy);
        if (request.quantum) {
            json.set("quantum", *request.quantum);
        }
        break;
    case RequestType::Pause:
        json.set("command", "pause");
        break;
    case RequestType::Resume:
        json.set("command", "resume");
        break;
    case RequestType::State:
        json.set("command", "state");
        break;
    }
    return json.dump();
}

DecodedRequest decodeRequest(const std::string& line) {
    DecodedRequest decoded;
    auto json = parseObject(line, decoded.reason);
    if (!json) {
        decoded.error = ErrorCode::ProtocolError;
        return decoded;
    }

    InjectorRequest request;
    if (const JsonValue* command = json->get("command")) {
        if (!command->isString()) {
            decoded.error = ErrorCode::ProtocolError;
            decoded.reason = "command must be a string";
            return decoded;
        }
        const std::string& name = command->asString();
        if (name == "pause") {
            request.type = RequestType::Pause;
        } else if (name == "resume") {
            request.type = RequestType::Resume;
        } else if (name == "state") {
            request.type = RequestType::State;
        } else if (name == "set_policy") {
            request.type = RequestType::SetPolicy;
            const JsonValue* policy = json->get("policy");
            if (policy == nullptr || !policy->isString()) {
                decoded.error = ErrorCode::UnknownPolicy;
                decoded.reason = "set_policy needs a policy name";
                return decoded;
            }
            request.policy = policy->asString();
            std::optional<std::int64_t> quantum;
            if (!readInt(*json, "quantum", quantum, decoded.reason)) {
                decoded.error = ErrorCode::InvalidQuantum;
                return decoded;
            }
            if (quantum) {
                if (!fitsInt(*quantum)) {
                    decoded.error = ErrorCode::InvalidQuantum;
                    decoded.reason = "quantum out of range";
                    return decoded;
                }
                request.quantum = static_cast<int>(*quantum);
            }
        } else {
            decoded.error = ErrorCode::ProtocolError;
            decoded.reason = "unknown command '" + name + "'";
            return decoded;
        }
        decoded.request = std::move(request);
        return decoded;
    }

    request.type = RequestType::AddProcess;
    std::optional<std::int64_t> arrival;
    std::optional<std::int64_t> burst;
    std::optional<std::int64_t> priority;
    if (!readInt(*json, "arrival_tick", arrival, decoded.reason) ||
        !readInt(*json, "burst_total", burst, decoded.reason) ||
        !readInt(*json, "priority", priority, decoded.reason)) {
        decoded.error = ErrorCode::InvalidProcessSpec;
        return decoded;
    }
    if (!burst) {
        decoded.error = ErrorCode::InvalidProcessSpec;
        decoded.reason = "burst_total is required";
        return decoded;
    }
    if (priority && !fitsInt(*priority)) {
        decoded.error = ErrorCode::InvalidProcessSpec;
        decoded.reason = "priority out of range";
        return decoded;
    }
    if (const JsonValue* name = json->get("name"); name && !name->isNull()) {
        if (!name->isString() || name->asString().size() > kMaxNameLength) {
            decoded.error = ErrorCode::InvalidProcessSpec;
            decoded.reason = "name must be a string of at most 64 characters";
            return decoded;
        }
        request.spec.name = name->asString();
    }
    request.spec.arrival_tick = arrival;
    request.spec.burst_total = *burst;
    if (priority) {
        request.spec.priority = static_cast<int>(*priority);
    }
    decoded.request = std::move(request);
    return decoded;
}

std::string encodeAddReply(const EngineResult& result) {
    JsonValue reply = JsonValue::object().set("accepted", result.success);
    if (result.success) {
        reply.set("id", result.value);
    } else {
        reply.set("reason", result.message);
    }
    return reply.dump();
}

std::string encodeCommandReply(const EngineResult& result) {
    JsonValue reply = JsonValue::object().set("ok", result.success);
    if (!result.success) {
        reply.set("reason", result.message);
    }
    return reply.dump();
}

std::string encodeStateReply(const Snapshot& snap) {
    return JsonValue::object().set("ok", true).set("snapshot", snapshotToJson(snap)).dump();
}

std::string encodeErrorReply(const std::string& reason) {
    return JsonValue::object().set("ok", false).set("reason", reason).dump();
}

std::optional<Reply> decodeReply(const std::string& line) {
    std::string reason;
    auto json = parseObject(line, reason);
    if (!json) {
        return std::nullopt;
    }
    const JsonValue* flag = json->get("accepted");
    if (flag == nullptr) {
        flag = json->get("ok");
    }
    if (flag == nullptr || !flag->isBool()) {
        return std::nullopt;
    }
    Reply reply;
    reply.ok = flag->asBool();
    if (auto id = tickField(*json, "id")) {
        reply.id = static_cast<int>(*id);
    }
    if (const JsonValue* text = json->get("reason"); text && text->isString()) {
        reply.reason = text->asString();
    }
    if (const JsonValue* snap = json->get("snapshot")) {
        reply.snapshot = snapshotFromJson(*snap);
    }
    return reply;
}

} // namespace ipc
} // namespace schedview
