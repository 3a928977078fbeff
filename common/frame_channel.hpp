#pragma once

// ============================================================
// frame_channel.hpp -- Length-prefixed frames over a PeerStream
//
// Frames are an 8-byte FrameHeader followed by payload_len bytes.
// read_frame() parses incrementally: a timeout in the middle of a
// frame keeps the partial bytes for the next call.
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "peer_stream.hpp"
#include <vector>

enum class FrameStatus {
    FRAME,
    TIMEOUT,
    CLOSED,
};

class FrameChannel {
public:
    explicit FrameChannel(PeerStream& stream) : stream_(stream) {}

    // Send a frame whose payload is `fixed` followed by `body`.
    // Either part may be empty.
    void write_frame(MsgType type, const void* fixed, size_t fixed_len,
                     const void* body = nullptr, size_t body_len = 0);

    void write_empty(MsgType type) { write_frame(type, nullptr, 0); }

    // Wait up to timeout_ms for one complete frame.
    // Throws TransferError(PROTOCOL_FAILURE) on an oversized frame and
    // TransferError(CONNECT_FAILURE) if the stream breaks.
    FrameStatus read_frame(FrameHeader& hdr, std::vector<u8>& payload, int timeout_ms);

    PeerStream& stream() { return stream_; }

    u64 frames_sent() const { return frames_sent_; }

private:
    bool take_frame(FrameHeader& hdr, std::vector<u8>& payload);

    PeerStream&     stream_;
    std::vector<u8> rbuf_;
    size_t          rpos_ = 0;
    u64             frames_sent_ = 0;
};
