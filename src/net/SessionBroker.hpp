#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "core/Snapshot.hpp"
#include "ipc/LineBuffer.hpp"
#include "ipc/Message.hpp"
#include "net/Socket.hpp"

namespace schedview {

class SimulationHost;
class SimulationClock;

/**
 * SessionBroker multiplexes one simulation across many TCP clients.
 *
 * Every connection gets its own thread. After the handshake a renderer is
 * registered for broadcasts and its thread becomes the writer draining a
 * bounded queue of encoded snapshots, checking for a hang-up whenever the
 * queue stays empty. An injector's thread reads requests
 * and waits on the host for each answer. No connection ever touches live
 * engine state, and no connection can stall another or the clock.
 */
class SessionBroker {
public:
    struct Options {
        std::string host{"127.0.0.1"};
        std::uint16_t port{5555};
        std::size_t max_clients{10};
        std::chrono::milliseconds send_timeout{2000};
        std::chrono::milliseconds handshake_timeout{5000};
        std::size_t queue_depth{64};   ///< Snapshots buffered per renderer before it is dropped.
        int default_quantum{2};        ///< Used by set_policy "RR" without a quantum.
    };

    SessionBroker(SimulationHost& host, SimulationClock& clock, Options options);
    ~SessionBroker();

    SessionBroker(const SessionBroker&) = delete;
    SessionBroker& operator=(const SessionBroker&) = delete;

    /** Bind the listener and start accepting. False with `error` if binding fails. */
    bool start(std::string& error);

    /** Close the listener and every session, then join all threads. */
    void stop();

    /** Port actually bound; useful when started with port 0. */
    std::uint16_t port() const { return boundPort_; }

    /**
     * Encode the snapshot once and queue the same bytes for every renderer,
     * in registration order. Never blocks on network I/O.
     */
    void broadcast(const Snapshot& snap);

    std::size_t rendererCount() const;
    std::size_t sessionCount() const;

private:
    struct Session {
        std::uint64_t id{0};
        std::string peer;
        net::Socket socket;
        std::optional<ipc::ClientRole> role;
        std::thread thread;
        std::atomic<bool> done{false};

        std::mutex outMutex;                                   ///< Protects outbound and closing.
        std::condition_variable outCv;
        std::deque<std::shared_ptr<const std::string>> outbound;
        bool closing{false};
    };
    using SessionPtr = std::shared_ptr<Session>;

    void acceptLoop();
    void serveSession(SessionPtr session);
    bool admit(const SessionPtr& session, ipc::ClientRole role);
    void runRenderer(const SessionPtr& session);
    void runInjector(const SessionPtr& session, ipc::LineBuffer& buffer);
    bool handleInjectorLine(const SessionPtr& session, const std::string& line);
    void unregister(const SessionPtr& session);
    void reapFinished();
    void sendFinal(const Session& session, const std::string& line) const;
    std::string label(const Session& session) const;

    SimulationHost& host_;
    SimulationClock& clock_;
    Options options_;
    net::Socket listener_;
    std::uint16_t boundPort_{0};
    std::thread acceptThread_;
    std::atomic<bool> running_{false};

    mutable std::mutex sessionsMutex_;      ///< Protects the two lists below.
    std::vector<SessionPtr> sessions_;      ///< Every live connection, accept order.
    std::vector<SessionPtr> renderers_;     ///< Registered renderers, registration order.
    std::uint64_t nextSessionId_{1};
};

} // namespace schedview
