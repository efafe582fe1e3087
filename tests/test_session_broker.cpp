#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <sys/socket.h>

#include "TestSupport.hpp"
#include "core/SimulationClock.hpp"
#include "core/SimulationHost.hpp"
#include "ipc/Message.hpp"
#include "log/Log.hpp"
#include "net/ClientConnection.hpp"
#include "net/SessionBroker.hpp"

using namespace schedview;
using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

// Server stack on an ephemeral loopback port. The clock is never started:
// tests drive ticks through the host so every broadcast is deterministic.
struct Server {
    explicit Server(std::size_t maxClients = 10, std::size_t queueDepth = 64)
        : host(SchedulingEngine()), clock(host, 1000ms),
          broker(host, clock, options(maxClients, queueDepth)) {
        host.setSnapshotListener([this](const Snapshot& snap) { broker.broadcast(snap); });
        host.start();
        std::string error;
        REQUIRE(broker.start(error), "broker failed to start: " << error);
    }

    ~Server() {
        broker.stop();
        host.stop();
    }

    static SessionBroker::Options options(std::size_t maxClients, std::size_t queueDepth) {
        SessionBroker::Options opts;
        opts.port = 0;
        opts.max_clients = maxClients;
        opts.queue_depth = queueDepth;
        opts.send_timeout = 500ms;
        opts.handshake_timeout = 1000ms;
        return opts;
    }

    std::unique_ptr<net::ClientConnection> connect(ipc::ClientRole role) {
        auto client = std::make_unique<net::ClientConnection>();
        std::string error;
        REQUIRE(client->open("127.0.0.1", broker.port(), role, error), "connect: " << error);
        REQUIRE(client->setReceiveTimeout(2000ms), "receive timeout");
        return client;
    }

    void addProcess(Tick burst) {
        ProcessSpec spec;
        spec.burst_total = burst;
        REQUIRE(host.submitProcess(spec).get().success, "seed process");
    }

    SimulationHost host;
    SimulationClock clock;
    SessionBroker broker;
};

std::string nextLine(net::ClientConnection& client) {
    std::string line;
    auto status = client.readLine(line);
    REQUIRE(status == net::Socket::ReadStatus::Line, "no line from server");
    return line;
}

std::string exchange(net::ClientConnection& client, const std::string& request) {
    REQUIRE(client.send(request), "send failed");
    return nextLine(client);
}

void testRenderersReceiveIdenticalSnapshots() {
    Server server;
    server.addProcess(3);
    auto first = server.connect(ipc::ClientRole::Renderer);
    auto second = server.connect(ipc::ClientRole::Renderer);
    REQUIRE(server.broker.rendererCount() == 2, "both renderers registered");

    for (Tick expected = 1; expected <= 4; ++expected) {
        server.host.requestTick().wait();
        std::string a = nextLine(*first);
        std::string b = nextLine(*second);
        REQUIRE(a == b, "renderers saw different bytes at tick " << expected);
        auto snap = ipc::decodeSnapshot(a);
        REQUIRE(snap && snap->tick == std::min<Tick>(expected, 3), "tick " << expected);
    }
}

void testInjectorRequests() {
    Server server;
    auto injector = server.connect(ipc::ClientRole::Injector);
    REQUIRE(server.broker.rendererCount() == 0, "injectors are not renderers");

    auto added = ipc::decodeReply(exchange(*injector, R"({"arrival_tick":0,"burst_total":4,"name":"db"})"));
    REQUIRE(added && added->ok && added->id == 1, "first process accepted as id 1");

    auto rejected = ipc::decodeReply(exchange(*injector, R"({"arrival_tick":0,"burst_total":0})"));
    REQUIRE(rejected && !rejected->ok && !rejected->reason.empty(), "burst 0 rejected");

    auto badField = ipc::decodeReply(exchange(*injector, R"({"burst_total":"lots"})"));
    REQUIRE(badField && !badField->ok, "non-integer burst rejected without disconnect");

    auto rr = ipc::decodeReply(exchange(*injector, R"({"command":"set_policy","policy":"rr","quantum":3})"));
    REQUIRE(rr && rr->ok, "policy accepted before start");

    auto unknown = ipc::decodeReply(exchange(*injector, R"({"command":"set_policy","policy":"LOTTERY"})"));
    REQUIRE(unknown && !unknown->ok, "unknown policy refused");

    auto state = ipc::decodeReply(exchange(*injector, R"({"command":"state"})"));
    REQUIRE(state && state->ok && state->snapshot, "state carries a snapshot");
    REQUIRE(state->snapshot->policy == "RR" && state->snapshot->quantum == 3, "RR q=3 active");
    REQUIRE(state->snapshot->processes.size() == 1, "one process");

    server.host.requestTick().wait();
    auto locked = ipc::decodeReply(exchange(*injector, R"({"command":"set_policy","policy":"FCFS"})"));
    REQUIRE(locked && !locked->ok, "policy locked once running");

    auto paused = ipc::decodeReply(exchange(*injector, R"({"command":"pause"})"));
    REQUIRE(paused && paused->ok && server.clock.isPaused(), "pause reaches the clock");
    auto resumed = ipc::decodeReply(exchange(*injector, R"({"command":"resume"})"));
    REQUIRE(resumed && resumed->ok && !server.clock.isPaused(), "resume reaches the clock");

    auto late = ipc::decodeReply(exchange(*injector, R"({"burst_total":2})"));
    REQUIRE(late && late->ok && late->id == 2, "arrival defaults to the current tick");

    // Garbage is a protocol error: error reply, then the server hangs up.
    auto error = ipc::decodeReply(exchange(*injector, "this is not json"));
    REQUIRE(error && !error->ok, "protocol error reply");
    std::string line;
    REQUIRE(injector->readLine(line) == net::Socket::ReadStatus::Closed, "connection closed");

    Snapshot after = server.host.requestSnapshot().get();
    REQUIRE(after.processes.size() == 2 && after.tick == 1, "engine unaffected by the bad client");
}

void testBadHandshakeRejected() {
    Server server;
    std::string error;
    net::Socket raw = net::Socket::connectTcp("127.0.0.1", server.broker.port(), error);
    REQUIRE(raw.valid(), "connect: " << error);
    REQUIRE(raw.setReceiveTimeout(2000ms), "receive timeout");
    REQUIRE(raw.sendLine(R"({"role":"admin"})"), "send handshake");

    ipc::LineBuffer buffer;
    std::string line;
    REQUIRE(raw.readLine(buffer, line) == net::Socket::ReadStatus::Line, "handshake reply");
    auto reply = ipc::decodeReply(line);
    REQUIRE(reply && !reply->ok, "unknown role refused");
    REQUIRE(raw.readLine(buffer, line) == net::Socket::ReadStatus::Closed, "connection closed");

    net::ClientConnection client;
    REQUIRE(client.open("127.0.0.1", server.broker.port(), ipc::ClientRole::Renderer, error),
            "server keeps accepting after a bad client: " << error);
}

void testRendererDisconnectDoesNotAffectOthers() {
    Server server;
    server.addProcess(50);
    auto leaving = server.connect(ipc::ClientRole::Renderer);
    auto staying = server.connect(ipc::ClientRole::Renderer);

    server.host.requestTick().wait();
    REQUIRE(nextLine(*leaving) == nextLine(*staying), "same first snapshot");
    leaving->close();

    Tick expected = 2;
    bool dropped = waitFor([&] {
        server.host.requestTick().wait();
        auto snap = ipc::decodeSnapshot(nextLine(*staying));
        REQUIRE(snap && snap->tick == expected, "remaining renderer missed tick " << expected);
        ++expected;
        return server.broker.rendererCount() == 1;
    });
    REQUIRE(dropped, "disconnected renderer was never removed");

    for (int i = 0; i < 5; ++i) {
        server.host.requestTick().wait();
        auto snap = ipc::decodeSnapshot(nextLine(*staying));
        REQUIRE(snap && snap->tick == expected, "delivery continues after the drop");
        ++expected;
    }
}

void testServerFull() {
    Server server(2);
    auto first = server.connect(ipc::ClientRole::Renderer);
    auto second = server.connect(ipc::ClientRole::Injector);

    std::string error;
    net::Socket raw = net::Socket::connectTcp("127.0.0.1", server.broker.port(), error);
    REQUIRE(raw.valid(), "connect: " << error);
    REQUIRE(raw.setReceiveTimeout(2000ms), "receive timeout");
    ipc::LineBuffer buffer;
    std::string line;
    REQUIRE(raw.readLine(buffer, line) == net::Socket::ReadStatus::Line, "rejection reply");
    auto reply = ipc::decodeReply(line);
    REQUIRE(reply && !reply->ok && reply->reason == "server full", "server full reply");

    // A freed slot can be reused.
    second->close();
    REQUIRE(waitFor([&] { return server.broker.sessionCount() == 1; }), "slot released");
    auto third = server.connect(ipc::ClientRole::Renderer);
    REQUIRE(third->connected(), "third client admitted");
}

void testIdleRendererHangUpFreesSlot() {
    Server server(1);
    auto renderer = server.connect(ipc::ClientRole::Renderer);
    REQUIRE(server.broker.sessionCount() == 1 && server.broker.rendererCount() == 1, "renderer joined");

    // No tick is ever issued, so only the hang-up itself can free the slot.
    renderer->close();
    REQUIRE(waitFor([&] {
                return server.broker.sessionCount() == 0 && server.broker.rendererCount() == 0;
            }),
            "closed renderer still holds its slot");

    net::ClientConnection next;
    std::string error;
    REQUIRE(next.open("127.0.0.1", server.broker.port(), ipc::ClientRole::Injector, error),
            "slot not reusable: " << error);
}

void testStalledRendererIsDropped() {
    const std::size_t queueDepth = 4;
    Server server(10, queueDepth);
    // Wide snapshots fill the stalled peer's socket buffers within a few hundred ticks.
    for (int i = 0; i < 200; ++i) {
        ProcessSpec spec;
        spec.arrival_tick = 0;
        spec.burst_total = 1000000;
        spec.name = std::string(48, 'w') + std::to_string(i);
        REQUIRE(server.host.submitProcess(spec).get().success, "seed process " << i);
    }
    auto stalled = server.connect(ipc::ClientRole::Renderer);
    auto steady = server.connect(ipc::ClientRole::Renderer);

    Tick expected = 1;
    auto slowest = std::chrono::steady_clock::duration::zero();
    bool dropped = waitFor([&] {
        auto begin = std::chrono::steady_clock::now();
        server.host.requestTick().wait();
        slowest = std::max(slowest, std::chrono::steady_clock::now() - begin);
        auto snap = ipc::decodeSnapshot(nextLine(*steady));
        REQUIRE(snap && snap->tick == expected, "steady renderer missed tick " << expected);
        ++expected;
        return server.broker.rendererCount() == 1;
    }, 20000ms);
    REQUIRE(dropped, "stalled renderer was never dropped");
    REQUIRE(slowest < 500ms, "a tick waited on the stalled renderer");

    for (int i = 0; i < 5; ++i) {
        server.host.requestTick().wait();
        auto snap = ipc::decodeSnapshot(nextLine(*steady));
        REQUIRE(snap && snap->tick == expected, "delivery continues after the drop");
        ++expected;
    }
    REQUIRE(server.broker.sessionCount() == 1, "only the steady renderer remains");
}

void testReadLineDeliversLinesBeforeOverflow() {
    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0, "socketpair");
    net::Socket writer(fds[0]);
    net::Socket reader(fds[1]);
    REQUIRE(writer.sendAll("first\nsecond\n" + std::string(100, 'x') + "\nthird\n"), "write");

    ipc::LineBuffer buffer(16);
    std::string line;
    REQUIRE(reader.readLine(buffer, line) == net::Socket::ReadStatus::Line && line == "first",
            "first line");
    REQUIRE(reader.readLine(buffer, line) == net::Socket::ReadStatus::Line && line == "second",
            "second line");
    REQUIRE(reader.readLine(buffer, line) == net::Socket::ReadStatus::Overflow, "oversized line");
}

void testStopDisconnectsClients() {
    auto server = std::make_unique<Server>();
    auto renderer = server->connect(ipc::ClientRole::Renderer);
    auto injector = server->connect(ipc::ClientRole::Injector);
    server->broker.stop();

    std::string line;
    REQUIRE(renderer->readLine(line) == net::Socket::ReadStatus::Closed, "renderer closed");
    REQUIRE(injector->readLine(line) == net::Socket::ReadStatus::Closed, "injector closed");
    REQUIRE(server->broker.sessionCount() == 0, "no sessions after stop");
}

} // namespace

int main() {
    log::setLevel(log::Level::WARN);
    RUN_TEST(testRenderersReceiveIdenticalSnapshots);
    RUN_TEST(testInjectorRequests);
    RUN_TEST(testBadHandshakeRejected);
    RUN_TEST(testRendererDisconnectDoesNotAffectOthers);
    RUN_TEST(testServerFull);
    RUN_TEST(testIdleRendererHangUpFreesSlot);
    RUN_TEST(testStalledRendererIsDropped);
    RUN_TEST(testReadLineDeliversLinesBeforeOverflow);
    RUN_TEST(testStopDisconnectsClients);
    std::cout << "All session broker tests passed" << std::endl;
    return 0;
}
