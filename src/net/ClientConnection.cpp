#include "ClientConnection.hpp"

namespace schedview {
namespace net {

namespace {

const char* describe(Socket::ReadStatus status) {
    switch (status) {
    case Socket::ReadStatus::Line:     return "line";
    case Socket::ReadStatus::Closed:   return "connection closed by server";
    case Socket::ReadStatus::Timeout:  return "timed out waiting for the server";
    case Socket::ReadStatus::Error:    return "connection lost";
    case Socket::ReadStatus::Overflow: return "reply too long";
    }
    return "unknown";
}

} // namespace

bool ClientConnection::open(const std::string& host, std::uint16_t port, ipc::ClientRole role,
                            std::string& error) {
    buffer_.clear();
    socket_ = Socket::connectTcp(host, port, error);
    if (!socket_.valid()) {
        return false;
    }
    auto reply = request(ipc::encodeHandshake(role), error);
    if (!reply) {
        socket_.close();
        return false;
    }
    if (!reply->ok) {
        error = "handshake rejected: " + reply->reason;
        socket_.close();
        return false;
    }
    return true;
}

Socket::ReadStatus ClientConnection::readLine(std::string& line) {
    return socket_.readLine(buffer_, line);
}

std::optional<ipc::Reply> ClientConnection::request(const std::string& line, std::string& error) {
    if (!socket_.sendLine(line)) {
        error = "send failed";
        return std::nullopt;
    }
    std::string response;
    auto status = readLine(response);
    if (status != Socket::ReadStatus::Line) {
        error = describe(status);
        return std::nullopt;
    }
    auto reply = ipc::decodeReply(response);
    if (!reply) {
        error = "malformed reply: " + response;
    }
    return reply;
}

} // namespace net
} // namespace schedview
