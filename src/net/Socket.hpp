#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "ipc/LineBuffer.hpp"

namespace schedview {
namespace net {

/**
 * Owning wrapper around a TCP socket descriptor. Closed on destruction.
 * All calls report failure through return values; none throw.
 */
class Socket {
public:
    enum class ReadStatus {
        Line,     // a complete line was produced
        Closed,   // orderly shutdown by the peer
        Timeout,  // receive timeout expired
        Error,    // transport failure
        Overflow, // peer sent a line longer than the buffer allows
    };

    Socket() = default;
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket();

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    /**
     * Bind and listen on host:port. Port 0 lets the kernel pick one.
     * Returns an invalid socket and fills `error` on failure.
     */
    static Socket listenTcp(const std::string& host, std::uint16_t port, int backlog,
                            std::string& error);

    /** Connect to host:port. Returns an invalid socket on failure. */
    static Socket connectTcp(const std::string& host, std::uint16_t port, std::string& error);

    /** Wait for a connection. Returns an invalid socket on failure or shutdown. */
    Socket accept(std::string* peer = nullptr) const;

    /** Write the whole buffer. False on error or send timeout. */
    bool sendAll(const std::string& data) const;

    /** Write `line` followed by '\n'. */
    bool sendLine(const std::string& line) const;

    /** Receive up to `size` bytes: > 0 bytes read, 0 closed, -1 error, -2 timeout. */
    long receive(char* buffer, std::size_t size) const;

    /**
     * Return the next complete line, reading from the socket as needed.
     * Lines already queued in `buffer` are handed out first, so Overflow is
     * reported only once every line before the oversized one was returned.
     */
    ReadStatus readLine(ipc::LineBuffer& buffer, std::string& line);

    /**
     * Non-blocking check whether the peer closed the connection or it
     * failed. Input the peer sent meanwhile is read and discarded.
     */
    bool peerClosed() const;

    bool setSendTimeout(std::chrono::milliseconds timeout) const;
    bool setReceiveTimeout(std::chrono::milliseconds timeout) const;

    /** Port the socket is bound to, 0 if unknown. */
    std::uint16_t localPort() const;

    /** Wake any thread blocked on this socket without releasing the descriptor. */
    void shutdown() const;

    void close();
    bool valid() const { return fd_ >= 0; }
    int fd() const { return fd_; }

private:
    int fd_{-1};
};

} // namespace net
} // namespace schedview
