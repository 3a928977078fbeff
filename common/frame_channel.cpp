// ============================================================
// frame_channel.cpp -- FrameChannel implementation
// ============================================================

#include "frame_channel.hpp"
#include "protocol_io.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <cstring>

static constexpr size_t RECV_SLICE = 256 * 1024;

void FrameChannel::write_frame(MsgType type, const void* fixed, size_t fixed_len,
                               const void* body, size_t body_len) {
    size_t payload_len = fixed_len + body_len;
    if (payload_len > MAX_PAYLOAD_LEN) {
        throw TransferError(ErrorKind::PROTOCOL_FAILURE,
                            "frame payload too large: " + std::to_string(payload_len));
    }

    FrameHeader hdr;
    hdr.msg_type    = static_cast<u16>(type);
    hdr.flags       = 0;
    hdr.payload_len = (u32)payload_len;

    // Header and fixed part go out in one write; the body follows as-is
    std::vector<u8> head(8 + fixed_len);
    proto::encode_header(hdr, head.data());
    if (fixed_len > 0) std::memcpy(head.data() + 8, fixed, fixed_len);
    stream_.send_all(head.data(), head.size());
    if (body_len > 0) stream_.send_all(body, body_len);
    ++frames_sent_;
}

bool FrameChannel::take_frame(FrameHeader& hdr, std::vector<u8>& payload) {
    size_t avail = rbuf_.size() - rpos_;
    if (avail < 8) return false;
    FrameHeader h = proto::decode_header(rbuf_.data() + rpos_);
    if (h.payload_len > MAX_PAYLOAD_LEN) {
        throw TransferError(ErrorKind::PROTOCOL_FAILURE,
                            "payload too large: " + std::to_string(h.payload_len));
    }
    if (avail < 8 + (size_t)h.payload_len) return false;

    const u8* p = rbuf_.data() + rpos_ + 8;
    payload.assign(p, p + h.payload_len);
    rpos_ += 8 + h.payload_len;
    if (rpos_ == rbuf_.size()) {
        rbuf_.clear();
        rpos_ = 0;
    }
    hdr = h;
    return true;
}

FrameStatus FrameChannel::read_frame(FrameHeader& hdr, std::vector<u8>& payload, int timeout_ms) {
    u64 deadline = timeout_ms < 0 ? 0 : utils::steady_ms() + (u64)timeout_ms;
    for (;;) {
        if (take_frame(hdr, payload)) return FrameStatus::FRAME;

        // Compact consumed bytes before growing the buffer
        if (rpos_ > 0) {
            rbuf_.erase(rbuf_.begin(), rbuf_.begin() + (std::ptrdiff_t)rpos_);
            rpos_ = 0;
        }

        int wait = -1;
        if (timeout_ms >= 0) {
            u64 now = utils::steady_ms();
            wait = now >= deadline ? 0 : (int)(deadline - now);
        }

        size_t old = rbuf_.size();
        rbuf_.resize(old + RECV_SLICE);
        size_t got = 0;
        RecvStatus st = stream_.recv_some(rbuf_.data() + old, RECV_SLICE, wait, got);
        rbuf_.resize(old + got);

        if (st == RecvStatus::CLOSED)  return FrameStatus::CLOSED;
        if (st == RecvStatus::TIMEOUT) return FrameStatus::TIMEOUT;
    }
}
