#pragma once

// ============================================================
// tcp_connectivity.hpp -- Direct TCP connectivity provider
//
// Peer ids are "host:port". listen() binds the address given at
// construction; port 0 binds an ephemeral port (see local_port()).
// ============================================================

#include "peer_stream.hpp"
#include "socket.hpp"
#include <memory>
#include <string>

class TcpStream : public PeerStream {
public:
    explicit TcpStream(TcpSocket sock);

    void send_all(const void* buf, size_t len) override;
    RecvStatus recv_some(void* buf, size_t cap, int timeout_ms, size_t& got) override;
    void close() override;
    std::string describe() const override { return peer_; }

private:
    TcpSocket   sock_;
    std::string peer_;
};

class TcpConnectivity : public Connectivity {
public:
    TcpConnectivity() = default;
    TcpConnectivity(std::string listen_ip, u16 listen_port)
        : listen_ip_(std::move(listen_ip)), listen_port_(listen_port) {}

    std::unique_ptr<PeerStream> connect(const std::string& peer_id, u32 timeout_ms) override;
    void listen() override;
    std::unique_ptr<PeerStream> next_incoming(u32 timeout_ms) override;

    u16 local_port() const;

private:
    std::string                listen_ip_ = "0.0.0.0";
    u16                        listen_port_ = 0;
    std::unique_ptr<TcpSocket> listener_;
};
