#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "platform.hpp"
#include "peer_stream.hpp"
#include <string>
#include <stdexcept>
#include <vector>

class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: resolve host (name or IPv4 literal) and connect, giving up
    // after timeout_ms. Throws std::runtime_error on failure.
    void connect(const std::string& host, u16 port, u32 timeout_ms);

    // Server: bind + listen. port 0 picks an ephemeral port.
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 16);

    // Accept one connection; returns an invalid socket on timeout
    TcpSocket accept(int timeout_ms);

    // Send exactly 'len' bytes; throws on error
    void send_all(const void* buf, size_t len);

    // Receive up to cap bytes within timeout_ms (< 0 = forever)
    RecvStatus recv_some(void* buf, size_t cap, int timeout_ms, size_t& got);

    // Apply TCP performance tuning
    void tune();

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    void close();

    // Get peer address as string
    std::string peer_addr() const;

    // Bound local port (after bind_and_listen)
    u16 local_port() const;

private:
    socket_t fd_{INVALID_SOCKET_VAL};

    void apply_socket_opts();
};
