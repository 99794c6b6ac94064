// ============================================================
// socket.cpp -- TcpSocket implementation
// ============================================================

#include "socket.hpp"
#include "errors.hpp"
#include <cstring>
#include <string>
#include <algorithm>
#include <climits>

// Buffer size for SO_SNDBUF / SO_RCVBUF = 4 MB
static constexpr int SOCKET_BUF_SIZE = 4 * 1024 * 1024;

namespace {

// getaddrinfo wrapper; the result list is freed on scope exit
struct AddrInfo {
    addrinfo* list{nullptr};

    AddrInfo(const std::string& host, u16 port, bool passive) {
        addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_protocol = IPPROTO_TCP;
        if (passive) hints.ai_flags = AI_PASSIVE;

        std::string service = std::to_string(port);
        const char* node = host.empty() ? nullptr : host.c_str();
        int rc = ::getaddrinfo(node, service.c_str(), &hints, &list);
        if (rc != 0) {
            throw TransportError("cannot resolve '" + host + ":" + service + "': " +
                                 gai_strerror(rc));
        }
    }
    ~AddrInfo() { if (list) ::freeaddrinfo(list); }

    AddrInfo(const AddrInfo&) = delete;
    AddrInfo& operator=(const AddrInfo&) = delete;
};

std::string format_sockaddr(const sockaddr* sa, socklen_t len) {
    char host[NI_MAXHOST] = {0};
    char serv[NI_MAXSERV] = {0};
    if (::getnameinfo(sa, len, host, sizeof(host), serv, sizeof(serv),
                      NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
        return "unknown";
    }
    if (sa->sa_family == AF_INET6) {
        return "[" + std::string(host) + "]:" + serv;
    }
    return std::string(host) + ":" + serv;
}

} // namespace

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {}

TcpSocket::~TcpSocket() {
    release();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        release();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void TcpSocket::tune() {
    int nodelay = 1;
    int keepalive = 1;
    int sndbuf = SOCKET_BUF_SIZE;
    int rcvbuf = SOCKET_BUF_SIZE;

#ifdef _WIN32
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  (const char*)&nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, (const char*)&keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    (const char*)&sndbuf,    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    (const char*)&rcvbuf,    sizeof(rcvbuf));
#else
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  &nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, &keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    &sndbuf,    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    &rcvbuf,    sizeof(rcvbuf));
#endif
}

void TcpSocket::connect(const std::string& host, u16 port) {
    AddrInfo ai(host, port, false);

    std::string last_err = "no usable address";
    for (addrinfo* p = ai.list; p; p = p->ai_next) {
        socket_t fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (fd == INVALID_SOCKET_VAL) {
            last_err = "socket() failed: " + socket_error_str(last_socket_error());
            continue;
        }
        if (::connect(fd, p->ai_addr, (socklen_t)p->ai_addrlen) == SOCKET_ERROR_VAL) {
            last_err = "connect() failed: " + socket_error_str(last_socket_error());
            CLOSE_SOCKET(fd);
            continue;
        }
        release();
        fd_ = fd;
        tune();
        return;
    }
    throw TransportError("cannot connect to " + host + ":" + std::to_string(port) +
                         ": " + last_err);
}

void TcpSocket::bind_and_listen(const std::string& host, u16 port, int backlog) {
    AddrInfo ai(host, port, true);

    std::string last_err = "no usable address";
    for (addrinfo* p = ai.list; p; p = p->ai_next) {
        socket_t fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (fd == INVALID_SOCKET_VAL) {
            last_err = "socket() failed: " + socket_error_str(last_socket_error());
            continue;
        }
        int on = 1;
#ifdef _WIN32
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, (const char*)&on, sizeof(on));
#else
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
#endif
        if (::bind(fd, p->ai_addr, (socklen_t)p->ai_addrlen) == SOCKET_ERROR_VAL) {
            last_err = "bind() failed: " + socket_error_str(last_socket_error());
            CLOSE_SOCKET(fd);
            continue;
        }
        if (::listen(fd, backlog) == SOCKET_ERROR_VAL) {
            last_err = "listen() failed: " + socket_error_str(last_socket_error());
            CLOSE_SOCKET(fd);
            continue;
        }
        release();
        fd_ = fd;
        return;
    }
    throw TransportError("cannot listen on " + host + ":" + std::to_string(port) +
                         ": " + last_err);
}

TcpSocket TcpSocket::accept() {
    for (;;) {
        sockaddr_storage peer{};
        socklen_t peer_len = sizeof(peer);
        socket_t client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
        if (client == INVALID_SOCKET_VAL) {
            int err = last_socket_error();
            if (interrupted(err)) continue;
            throw TransportError("accept() failed: " + socket_error_str(err));
        }
        TcpSocket s(client);
        s.tune();
        return s;
    }
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
#ifdef _WIN32
        int sent = ::send(fd_, p, (int)std::min(remaining, (size_t)INT_MAX), 0);
#else
        ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
#endif
        if (sent <= 0) {
            if (sent == 0) {
                throw TransportError("connection closed during send");
            }
            int err = last_socket_error();
            if (interrupted(err)) continue;
            throw TransportError("send() failed: " + socket_error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

size_t TcpSocket::recv_some(void* buf, size_t len) {
    for (;;) {
#ifdef _WIN32
        int received = ::recv(fd_, static_cast<char*>(buf), (int)std::min(len, (size_t)INT_MAX), 0);
#else
        ssize_t received = ::recv(fd_, buf, len, 0);
#endif
        if (received >= 0) return static_cast<size_t>(received);
        int err = last_socket_error();
        if (interrupted(err)) continue;
        throw TransportError("recv() failed: " + socket_error_str(err));
    }
}

void TcpSocket::close() {
    if (fd_ == INVALID_SOCKET_VAL) return;
    socket_t fd = fd_;
    fd_ = INVALID_SOCKET_VAL;
    if (CLOSE_SOCKET(fd) == SOCKET_ERROR_VAL) {
        throw TransportError("close() failed: " + socket_error_str(last_socket_error()));
    }
}

void TcpSocket::release() noexcept {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

u16 TcpSocket::local_port() const {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd_, (sockaddr*)&addr, &len) != 0) return 0;
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    }
    return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
}

std::string TcpSocket::peer_addr() const {
    sockaddr_storage peer{};
    socklen_t len = sizeof(peer);
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0) {
        return format_sockaddr((const sockaddr*)&peer, len);
    }
    return "unknown";
}
