// ============================================================
// tcp_connectivity.cpp -- TcpStream / TcpConnectivity
// ============================================================

#include "tcp_connectivity.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

TcpStream::TcpStream(TcpSocket sock) : sock_(std::move(sock)) {
    peer_ = sock_.peer_addr();
}

void TcpStream::send_all(const void* buf, size_t len) {
    if (!sock_.is_valid()) {
        throw TransferError(ErrorKind::CONNECT_FAILURE, "send on closed stream to " + peer_);
    }
    try {
        sock_.send_all(buf, len);
    } catch (const std::runtime_error& e) {
        throw TransferError(ErrorKind::CONNECT_FAILURE, peer_ + ": " + e.what());
    }
}

RecvStatus TcpStream::recv_some(void* buf, size_t cap, int timeout_ms, size_t& got) {
    got = 0;
    if (!sock_.is_valid()) return RecvStatus::CLOSED;
    try {
        return sock_.recv_some(buf, cap, timeout_ms, got);
    } catch (const std::runtime_error& e) {
        throw TransferError(ErrorKind::CONNECT_FAILURE, peer_ + ": " + e.what());
    }
}

void TcpStream::close() {
    if (sock_.is_valid()) {
        ::shutdown(sock_.native(), SHUT_RDWR);
        sock_.close();
    }
}

std::unique_ptr<PeerStream> TcpConnectivity::connect(const std::string& peer_id, u32 timeout_ms) {
    std::string host;
    int port = 0;
    if (!utils::split_host_port(peer_id, host, port)) {
        throw TransferError(ErrorKind::CONNECT_FAILURE, "invalid peer id (want host:port): " + peer_id);
    }
    try {
        TcpSocket sock;
        sock.connect(host, (u16)port, timeout_ms);
        LOG_DEBUG("Connected to " + peer_id);
        return std::make_unique<TcpStream>(std::move(sock));
    } catch (const std::runtime_error& e) {
        throw TransferError(ErrorKind::CONNECT_FAILURE, peer_id + ": " + e.what());
    }
}

void TcpConnectivity::listen() {
    if (listener_) return;
    auto sock = std::make_unique<TcpSocket>();
    try {
        sock->bind_and_listen(listen_ip_, listen_port_);
    } catch (const std::runtime_error& e) {
        throw TransferError(ErrorKind::CONNECT_FAILURE,
                            "cannot listen on " + listen_ip_ + ":" + std::to_string(listen_port_) +
                            ": " + e.what());
    }
    listener_ = std::move(sock);
    LOG_INFO("Listening on " + listen_ip_ + ":" + std::to_string(local_port()));
}

std::unique_ptr<PeerStream> TcpConnectivity::next_incoming(u32 timeout_ms) {
    if (!listener_) listen();
    TcpSocket client = listener_->accept((int)timeout_ms);
    if (!client.is_valid()) return nullptr;
    auto stream = std::make_unique<TcpStream>(std::move(client));
    LOG_INFO("Incoming stream from " + stream->describe());
    return stream;
}

u16 TcpConnectivity::local_port() const {
    if (!listener_) return listen_port_;
    return listener_->local_port();
}
