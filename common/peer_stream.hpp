#pragma once

// ============================================================
// peer_stream.hpp -- Connectivity provider interfaces
//
// A PeerStream is an opaque bidirectional byte channel to one peer,
// used by exactly one session. Connectivity hands them out.
// ============================================================

#include "platform.hpp"
#include <memory>
#include <string>

enum class RecvStatus {
    DATA,      // at least one byte was read
    TIMEOUT,   // nothing arrived before the timeout
    CLOSED,    // peer closed the stream
};

class PeerStream {
public:
    virtual ~PeerStream() = default;

    // Send exactly len bytes. Throws TransferError(CONNECT_FAILURE) if
    // the stream is broken.
    virtual void send_all(const void* buf, size_t len) = 0;

    // Read up to cap bytes, waiting at most timeout_ms (< 0 = forever).
    // `got` receives the byte count for DATA. Throws on a stream error.
    virtual RecvStatus recv_some(void* buf, size_t cap, int timeout_ms, size_t& got) = 0;

    virtual void close() = 0;

    // Human-readable peer description for logs
    virtual std::string describe() const = 0;
};

class Connectivity {
public:
    virtual ~Connectivity() = default;

    // Open a stream to peer_id within timeout_ms.
    // Throws TransferError(CONNECT_FAILURE) on failure or timeout.
    virtual std::unique_ptr<PeerStream> connect(const std::string& peer_id, u32 timeout_ms) = 0;

    // Start accepting incoming streams
    virtual void listen() = 0;

    // Next incoming stream, or nullptr if none arrived within timeout_ms
    virtual std::unique_ptr<PeerStream> next_incoming(u32 timeout_ms) = 0;
};
