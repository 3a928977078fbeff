// ============================================================
// socket.cpp -- TcpSocket implementation (POSIX)
// ============================================================

#include "socket.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <algorithm>

// Buffer size for SO_SNDBUF / SO_RCVBUF = 4 MB
static constexpr int SOCKET_BUF_SIZE = 4 * 1024 * 1024;

TcpSocket::TcpSocket() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw std::runtime_error("socket() failed: " + socket_error_str(last_socket_error()));
    }
    apply_socket_opts();
}

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {
    if (fd_ != INVALID_SOCKET_VAL) {
        apply_socket_opts();
    }
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void TcpSocket::apply_socket_opts() {
    int on = 1;
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
}

void TcpSocket::tune() {
    int nodelay = 1;
    int keepalive = 1;
    int sndbuf = SOCKET_BUF_SIZE;
    int rcvbuf = SOCKET_BUF_SIZE;
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  &nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, &keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    &sndbuf,    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    &rcvbuf,    sizeof(rcvbuf));
}

static sockaddr_in resolve_ipv4(const std::string& host, u16 port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1) {
        return addr;
    }

    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || !res) {
        throw std::runtime_error("Cannot resolve " + host + ": " + gai_strerror(rc));
    }
    addr.sin_addr = ((sockaddr_in*)res->ai_addr)->sin_addr;
    freeaddrinfo(res);
    return addr;
}

void TcpSocket::connect(const std::string& host, u16 port, u32 timeout_ms) {
    sockaddr_in addr = resolve_ipv4(host, port);

    platform::set_nonblocking(fd_, true);
    if (::connect(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        int err = last_socket_error();
        if (!connect_in_progress(err)) {
            throw std::runtime_error("connect() failed: " + socket_error_str(err));
        }
        int ready = platform::wait_socket(fd_, true, (int)timeout_ms);
        if (ready == 0) {
            throw std::runtime_error("connect() timed out after " + std::to_string(timeout_ms) + " ms");
        }
        if (ready < 0) {
            throw std::runtime_error("poll() failed: " + socket_error_str(last_socket_error()));
        }
        int so_err = 0;
        socklen_t len = sizeof(so_err);
        getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_err, &len);
        if (so_err != 0) {
            throw std::runtime_error("connect() failed: " + socket_error_str(so_err));
        }
    }
    platform::set_nonblocking(fd_, false);
    tune();
}

void TcpSocket::bind_and_listen(const std::string& ip, u16 port, int backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid IP address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("bind() failed: " + socket_error_str(last_socket_error()));
    }
    if (::listen(fd_, backlog) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("listen() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept(int timeout_ms) {
    int ready = platform::wait_socket(fd_, false, timeout_ms);
    if (ready < 0) {
        throw std::runtime_error("poll() failed: " + socket_error_str(last_socket_error()));
    }
    if (ready == 0) return TcpSocket(INVALID_SOCKET_VAL);

    sockaddr_in peer{};
    socklen_t peer_len = sizeof(peer);
    socket_t client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
    if (client == INVALID_SOCKET_VAL) {
        int err = last_socket_error();
        if (would_block(err) || err == EINTR || err == ECONNABORTED) {
            return TcpSocket(INVALID_SOCKET_VAL);
        }
        throw std::runtime_error("accept() failed: " + socket_error_str(err));
    }
    TcpSocket s(client);
    s.tune();
    return s;
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (sent == 0) {
                throw std::runtime_error("Connection closed during send");
            }
            int err = last_socket_error();
            if (err == EINTR) continue;
            if (would_block(err)) {
                platform::wait_socket(fd_, true, 1000);
                continue;
            }
            throw std::runtime_error("send() failed: " + socket_error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

RecvStatus TcpSocket::recv_some(void* buf, size_t cap, int timeout_ms, size_t& got) {
    got = 0;
    int ready = platform::wait_socket(fd_, false, timeout_ms);
    if (ready < 0) {
        throw std::runtime_error("poll() failed: " + socket_error_str(last_socket_error()));
    }
    if (ready == 0) return RecvStatus::TIMEOUT;

    ssize_t received = ::recv(fd_, buf, cap, 0);
    if (received == 0) return RecvStatus::CLOSED;
    if (received < 0) {
        int err = last_socket_error();
        if (would_block(err) || err == EINTR) return RecvStatus::TIMEOUT;
        if (err == ECONNRESET) return RecvStatus::CLOSED;
        throw std::runtime_error("recv() failed: " + socket_error_str(err));
    }
    got = (size_t)received;
    return RecvStatus::DATA;
}

void TcpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0) {
        char buf[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf))) {
            return std::string(buf) + ":" + std::to_string(ntohs(peer.sin_port));
        }
    }
    return "unknown";
}

u16 TcpSocket::local_port() const {
    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (getsockname(fd_, (sockaddr*)&local, &len) != 0) {
        throw std::runtime_error("getsockname() failed: " + socket_error_str(last_socket_error()));
    }
    return ntohs(local.sin_port);
}
