#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "platform.hpp"
#include "stream.hpp"
#include <string>

class TcpSocket {
public:
    TcpSocket() = default;
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: resolve host (name or literal) and connect
    void connect(const std::string& host, u16 port);

    // Server: bind + listen; empty host means all interfaces
    void bind_and_listen(const std::string& host, u16 port, int backlog = 1);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Send exactly 'len' bytes; throws TransportError
    void send_all(const void* buf, size_t len);

    // Receive up to 'len' bytes; returns 0 on clean close
    size_t recv_some(void* buf, size_t len);

    // Apply TCP performance tuning
    void tune();

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    // Close and report failure; a second call is a no-op
    void close();

    // Port the socket is bound to (after bind_and_listen)
    u16 local_port() const;

    // Get peer address as string
    std::string peer_addr() const;

private:
    socket_t fd_{INVALID_SOCKET_VAL};

    // Close without reporting (destructor / move-assign)
    void release() noexcept;
};

// ---- Stream adapters ----

class SocketWriter : public ByteWriter {
public:
    explicit SocketWriter(TcpSocket& sock) : sock_(sock) {}
    void write(const void* data, size_t len) override { sock_.send_all(data, len); }

private:
    TcpSocket& sock_;
};

class SocketReader : public ByteReader {
public:
    explicit SocketReader(TcpSocket& sock) : sock_(sock) {}
    size_t read(void* buf, size_t len) override { return sock_.recv_some(buf, len); }

private:
    TcpSocket& sock_;
};
