#include "Socket.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>


namespace schedview {
namespace net {

namespace {

struct AddrInfoList {
    addrinfo* head{nullptr};
    ~AddrInfoList() {
        if (head) {
            freeaddrinfo(head);
        }
    }
};

bool resolve(const std::string& host, std::uint16_t port, bool passive,
             AddrInfoList& out, std::string& error) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = passive ? AI_PASSIVE : 0;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &out.head);
    if (rc != 0) {
        error = "cannot resolve " + host + ": " + gai_strerror(rc);
        return false;
    }
    return true;
}

timeval toTimeval(std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return tv;
}

bool setNoDelay(int fd) {
    int yes = 1;
    return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes)) == 0;
}

} // namespace

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Socket Socket::listenTcp(const std::string& host, std::uint16_t port, int backlog,
                         std::string& error) {
    AddrInfoList addrs;
    if (!resolve(host, port, true, addrs, error)) {
        return Socket();
    }
    for (addrinfo* ai = addrs.head; ai != nullptr; ai = ai->ai_next) {
        Socket sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!sock.valid()) {
            error = std::string("socket: ") + std::strerror(errno);
            continue;
        }
        int yes = 1;
        if (::setsockopt(sock.fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) != 0) {
            error = std::string("setsockopt: ") + std::strerror(errno);
            continue;
        }
        if (::bind(sock.fd_, ai->ai_addr, ai->ai_addrlen) != 0) {
            error = "bind " + host + ":" + std::to_string(port) + ": " + std::strerror(errno);
            continue;
        }
        if (::listen(sock.fd_, backlog) != 0) {
            error = std::string("listen: ") + std::strerror(errno);
            continue;
        }
        return sock;
    }
    return Socket();
}

Socket Socket::connectTcp(const std::string& host, std::uint16_t port, std::string& error) {
    AddrInfoList addrs;
    if (!resolve(host, port, false, addrs, error)) {
        return Socket();
    }
    for (addrinfo* ai = addrs.head; ai != nullptr; ai = ai->ai_next) {
        Socket sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!sock.valid()) {
            error = std::string("socket: ") + std::strerror(errno);
            continue;
        }
        if (::connect(sock.fd_, ai->ai_addr, ai->ai_addrlen) != 0) {
            error = "connect " + host + ":" + std::to_string(port) + ": " + std::strerror(errno);
            continue;
        }
        if (!setNoDelay(sock.fd_)) {
            error = std::string("setsockopt: ") + std::strerror(errno);
            continue;
        }
        return sock;
    }
    return Socket();
}

Socket Socket::accept(std::string* peer) const {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    int fd;
    do {
        fd = ::accept(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        return Socket();
    }
    Socket client(fd);
    if (!setNoDelay(fd)) {
        return Socket();
    }
    if (peer) {
        char host[NI_MAXHOST] = {0};
        char service[NI_MAXSERV] = {0};
        if (getnameinfo(reinterpret_cast<sockaddr*>(&addr), len, host, sizeof(host),
                        service, sizeof(service), NI_NUMERICHOST | NI_NUMERICSERV) == 0) {
            *peer = std::string(host) + ":" + service;
        } else {
            *peer = "unknown";
        }
    }
    return client;
}

bool Socket::sendAll(const std::string& data) const {
    std::size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false; // EAGAIN here means the send timeout expired
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

bool Socket::sendLine(const std::string& line) const {
    std::string framed;
    framed.reserve(line.size() + 1);
    framed += line;
    framed += '\n';
    return sendAll(framed);
}

long Socket::receive(char* buffer, std::size_t size) const {
    for (;;) {
        ssize_t n = ::recv(fd_, buffer, size, 0);
        if (n >= 0) {
            return static_cast<long>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return -2;
        }
        return -1;
    }
}

Socket::ReadStatus Socket::readLine(ipc::LineBuffer& buffer, std::string& line) {
    char chunk[4096];
    for (;;) {
        if (buffer.nextLine(line)) {
            return ReadStatus::Line;
        }
        if (buffer.overflowed()) {
            return ReadStatus::Overflow;
        }
        long n = receive(chunk, sizeof(chunk));
        if (n == 0) {
            return ReadStatus::Closed;
        }
        if (n == -2) {
            return ReadStatus::Timeout;
        }
        if (n < 0) {
            return ReadStatus::Error;
        }
        buffer.append(chunk, static_cast<std::size_t>(n));
    }
}

bool Socket::peerClosed() const {
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, 0);
    if (rc < 0) {
        return errno != EINTR;
    }
    if (rc == 0) {
        return false;
    }
    if (pfd.revents & (POLLERR | POLLNVAL)) {
        return true;
    }
    char discard[512];
    ssize_t n = ::recv(fd_, discard, sizeof(discard), MSG_DONTWAIT);
    if (n < 0) {
        return errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR;
    }
    return n == 0;
}

bool Socket::setSendTimeout(std::chrono::milliseconds timeout) const {
    timeval tv = toTimeval(timeout);
    return ::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

bool Socket::setReceiveTimeout(std::chrono::milliseconds timeout) const {
    timeval tv = toTimeval(timeout);
    return ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

std::uint16_t Socket::localPort() const {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return 0;
    }
    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    }
    return 0;
}

void Socket::shutdown() const {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

void Socket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace net
} // namespace schedview
