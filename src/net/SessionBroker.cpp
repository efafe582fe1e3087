#include "SessionBroker.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "core/SimulationClock.hpp"
#include "core/SimulationHost.hpp"
#include "log/Log.hpp"

namespace schedview {

namespace {

// How long an idle renderer session waits before checking for a hang-up.
constexpr std::chrono::milliseconds kPeerCheckInterval{100};

} // namespace

SessionBroker::SessionBroker(SimulationHost& host, SimulationClock& clock, Options options)
    : host_(host), clock_(clock), options_(std::move(options)) {}

SessionBroker::~SessionBroker() {
    stop();
}

bool SessionBroker::start(std::string& error) {
    if (running_) {
        return true;
    }
    listener_ = net::Socket::listenTcp(options_.host, options_.port,
                                       static_cast<int>(options_.max_clients), error);
    if (!listener_.valid()) {
        return false;
    }
    boundPort_ = listener_.localPort();
    running_ = true;
    acceptThread_ = std::thread(&SessionBroker::acceptLoop, this);
    std::ostringstream oss;
    oss << "[*] listening on " << options_.host << ":" << boundPort_;
    log::info(oss.str());
    return true;
}

void SessionBroker::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    listener_.shutdown();
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    listener_.close();

    std::vector<SessionPtr> sessions;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        sessions = sessions_;
        for (const auto& session : sessions_) {
            {
                std::lock_guard<std::mutex> out(session->outMutex);
                session->closing = true;
            }
            session->outCv.notify_all();
            session->socket.shutdown();
        }
    }
    for (const auto& session : sessions) {
        if (session->thread.joinable()) {
            session->thread.join();
        }
    }
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    sessions_.clear();
    renderers_.clear();
    log::info("[*] broker stopped");
}

void SessionBroker::broadcast(const Snapshot& snap) {
    auto payload = std::make_shared<const std::string>(ipc::encodeSnapshot(snap) + "\n");
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    for (const auto& renderer : renderers_) {
        std::lock_guard<std::mutex> out(renderer->outMutex);
        if (renderer->closing) {
            continue;
        }
        if (renderer->outbound.size() >= options_.queue_depth) {
            // Too far behind: drop this renderer rather than buffer without bound.
            renderer->closing = true;
            renderer->outCv.notify_one();
            renderer->socket.shutdown();
            log::warn("[!] " + label(*renderer) + " fell behind, disconnecting");
            continue;
        }
        renderer->outbound.push_back(payload);
        renderer->outCv.notify_one();
    }
}

std::size_t SessionBroker::rendererCount() const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    return renderers_.size();
}

std::size_t SessionBroker::sessionCount() const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    return static_cast<std::size_t>(std::count_if(sessions_.begin(), sessions_.end(),
        [](const SessionPtr& s) { return !s->done; }));
}

void SessionBroker::acceptLoop() {
    while (running_) {
        std::string peer;
        net::Socket client = listener_.accept(&peer);
        if (!running_) {
            break;
        }
        reapFinished();
        if (!client.valid()) {
            log::warn("[!] accept failed");
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        if (!client.setSendTimeout(options_.send_timeout)) {
            log::warn("[!] dropping " + peer + ": cannot set send timeout");
            continue;
        }

        if (sessionCount() >= options_.max_clients) {
            log::warn("[!] rejecting " + peer + ": server full");
            if (!client.sendLine(ipc::encodeHandshakeReply(false, "server full"))) {
                log::debug("[-] " + peer + " gone before rejection was sent");
            }
            continue;
        }

        auto session = std::make_shared<Session>();
        session->peer = peer;
        session->socket = std::move(client);
        {
            std::lock_guard<std::mutex> lock(sessionsMutex_);
            session->id = nextSessionId_++;
            sessions_.push_back(session);
        }
        log::info("[+] client connected: " + label(*session));
        session->thread = std::thread(&SessionBroker::serveSession, this, session);
    }
}

void SessionBroker::serveSession(SessionPtr session) {
    ipc::LineBuffer buffer;
    std::string line;
    auto status = session->socket.setReceiveTimeout(options_.handshake_timeout)
        ? session->socket.readLine(buffer, line)
        : net::Socket::ReadStatus::Error;
    if (status == net::Socket::ReadStatus::Line) {
        std::string reason;
        auto role = ipc::decodeHandshake(line, reason);
        if (!role) {
            log::warn("[!] " + label(*session) + " ProtocolError: " + reason);
            sendFinal(*session, ipc::encodeHandshakeReply(false, reason));
        } else if (!admit(session, *role)) {
            sendFinal(*session, ipc::encodeHandshakeReply(false, "server shutting down"));
        } else if (session->socket.sendLine(ipc::encodeHandshakeReply(true)) &&
                   session->socket.setReceiveTimeout(std::chrono::milliseconds(0))) {
            log::info("[+] " + label(*session) + " joined as " + ipc::toString(*role));
            if (*role == ipc::ClientRole::Renderer) {
                runRenderer(session);
            } else {
                runInjector(session, buffer);
            }
        }
    } else if (status == net::Socket::ReadStatus::Overflow) {
        log::warn("[!] " + label(*session) + " ProtocolError: handshake too long");
        sendFinal(*session, ipc::encodeHandshakeReply(false, "handshake too long"));
    } else {
        log::warn("[!] " + label(*session) + " ConnectionLost before handshake");
    }

    unregister(session);
    session->socket.shutdown();
    log::info("[-] client disconnected: " + label(*session));
    session->done = true;
}

bool SessionBroker::admit(const SessionPtr& session, ipc::ClientRole role) {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    if (!running_) {
        return false;
    }
    session->role = role;
    // Must precede the handshake reply: no tick after the join may be missed.
    if (role == ipc::ClientRole::Renderer) {
        renderers_.push_back(session);
    }
    return true;
}

void SessionBroker::runRenderer(const SessionPtr& session) {
    for (;;) {
        std::shared_ptr<const std::string> payload;
        {
            std::unique_lock<std::mutex> lock(session->outMutex);
            session->outCv.wait_for(lock, kPeerCheckInterval, [&session] {
                return session->closing || !session->outbound.empty();
            });
            if (session->closing) {
                return;
            }
            if (!session->outbound.empty()) {
                payload = std::move(session->outbound.front());
                session->outbound.pop_front();
            }
        }
        if (!payload) {
            // No ticks while paused, so hang-ups must be noticed here.
            if (session->socket.peerClosed()) {
                log::info("[-] " + label(*session) + " closed by peer");
                return;
            }
            continue;
        }
        if (!session->socket.sendAll(*payload)) {
            log::warn("[!] " + label(*session) + " ConnectionLost while sending snapshot");
            return;
        }
    }
}

void SessionBroker::runInjector(const SessionPtr& session, ipc::LineBuffer& buffer) {
    std::string line;
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(session->outMutex);
            if (session->closing) {
                return;
            }
        }
        switch (session->socket.readLine(buffer, line)) {
        case net::Socket::ReadStatus::Line:
            if (!handleInjectorLine(session, line)) {
                return;
            }
            break;
        case net::Socket::ReadStatus::Closed:
            return;
        case net::Socket::ReadStatus::Overflow:
            log::warn("[!] " + label(*session) + " ProtocolError: line too long");
            sendFinal(*session, ipc::encodeErrorReply("line too long"));
            return;
        case net::Socket::ReadStatus::Timeout:
        case net::Socket::ReadStatus::Error:
            log::warn("[!] " + label(*session) + " ConnectionLost");
            return;
        }
    }
}

bool SessionBroker::handleInjectorLine(const SessionPtr& session, const std::string& line) {
    ipc::DecodedRequest decoded = ipc::decodeRequest(line);
    if (!decoded.request) {
        if (decoded.error == ErrorCode::ProtocolError) {
            log::warn("[!] " + label(*session) + " ProtocolError: " + decoded.reason);
            sendFinal(*session, ipc::encodeErrorReply(decoded.reason));
            return false;
        }
        log::info("[<] " + label(*session) + " rejected: " + decoded.reason);
        EngineResult failure = EngineResult::fail(decoded.error, decoded.reason);
        std::string reply = decoded.error == ErrorCode::InvalidProcessSpec
            ? ipc::encodeAddReply(failure)
            : ipc::encodeCommandReply(failure);
        return session->socket.sendLine(reply);
    }

    const ipc::InjectorRequest& request = *decoded.request;
    std::string reply;
    switch (request.type) {
    case ipc::RequestType::AddProcess: {
        EngineResult result = host_.submitProcess(request.spec).get();
        if (result.success) {
            log::info("[<] " + label(*session) + " added process " + std::to_string(result.value));
        } else {
            log::info("[<] " + label(*session) + " " + toString(result.error) + ": " + result.message);
        }
        reply = ipc::encodeAddReply(result);
        break;
    }
    case ipc::RequestType::SetPolicy: {
        auto policy = parsePolicy(request.policy, request.quantum.value_or(options_.default_quantum));
        EngineResult result = policy
            ? host_.submitPolicy(*policy).get()
            : EngineResult::fail(ErrorCode::UnknownPolicy, "unknown policy '" + request.policy + "'");
        if (result.success) {
            log::info("[*] " + label(*session) + " " + result.message);
            host_.publish();
        } else {
            log::info("[<] " + label(*session) + " " + toString(result.error) + ": " + result.message);
        }
        reply = ipc::encodeCommandReply(result);
        break;
    }
    case ipc::RequestType::Pause:
        clock_.pause();
        reply = ipc::encodeCommandReply(EngineResult::ok(0, "paused"));
        break;
    case ipc::RequestType::Resume:
        clock_.resume();
        reply = ipc::encodeCommandReply(EngineResult::ok(0, "resumed"));
        break;
    case ipc::RequestType::State:
        reply = ipc::encodeStateReply(host_.requestSnapshot().get());
        break;
    }
    return session->socket.sendLine(reply);
}

void SessionBroker::unregister(const SessionPtr& session) {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    renderers_.erase(std::remove(renderers_.begin(), renderers_.end(), session), renderers_.end());
}

void SessionBroker::reapFinished() {
    std::vector<SessionPtr> finished;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        auto split = std::stable_partition(sessions_.begin(), sessions_.end(),
                                           [](const SessionPtr& s) { return !s->done; });
        finished.assign(split, sessions_.end());
        sessions_.erase(split, sessions_.end());
    }
    for (const auto& session : finished) {
        if (session->thread.joinable()) {
            session->thread.join();
        }
    }
}

void SessionBroker::sendFinal(const Session& session, const std::string& line) const {
    if (!session.socket.sendLine(line)) {
        log::debug("[-] " + label(session) + " closed before the last reply was sent");
    }
}

std::string SessionBroker::label(const Session& session) const {
    return "#" + std::to_string(session.id) + " " + session.peer;
}

} // namespace schedview
