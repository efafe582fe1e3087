#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "ipc/LineBuffer.hpp"
#include "ipc/Message.hpp"
#include "net/Socket.hpp"

namespace schedview {
namespace net {

/**
 * Client side of a session: connects, performs the handshake for a role and
 * then exchanges single-line messages with the server.
 */
class ClientConnection {
public:
    /**
     * Connect and complete the handshake.
     * @return false with `error` set if the connection or the handshake fails
     */
    bool open(const std::string& host, std::uint16_t port, ipc::ClientRole role,
              std::string& error);

    /** Next line from the server. */
    Socket::ReadStatus readLine(std::string& line);

    /** Send one message line. */
    bool send(const std::string& line) { return socket_.sendLine(line); }

    /** Send a request and wait for its reply. */
    std::optional<ipc::Reply> request(const std::string& line, std::string& error);

    bool setReceiveTimeout(std::chrono::milliseconds timeout) const {
        return socket_.setReceiveTimeout(timeout);
    }

    void close() { socket_.close(); }
    bool connected() const { return socket_.valid(); }

private:
    Socket socket_;
    ipc::LineBuffer buffer_;
};

} // namespace net
} // namespace schedview
