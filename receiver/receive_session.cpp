// ============================================================
// receive_session.cpp -- ReceiveSession implementation
// ============================================================

#include "receive_session.hpp"
#include "../common/chunk_sink.hpp"
#include "../common/frame_channel.hpp"
#include "../common/protocol_io.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <cstring>
#include <memory>

const char* to_string(ReceiveOutcome o) {
    switch (o) {
        case ReceiveOutcome::COMPLETED: return "Completed";
        case ReceiveOutcome::CANCELLED: return "Cancelled";
        case ReceiveOutcome::REFUSED:   return "Refused";
    }
    return "?";
}

static void send_nack(FrameChannel& ch, NackReason reason, const std::string& text) {
    HelloNack n{};
    n.reason = static_cast<u32>(reason);
    proto::encode_hello_nack(n);
    ch.write_frame(MsgType::MT_HELLO_NACK, &n, sizeof(n), text.data(), text.size());
}

ReceiveResult ReceiveSession::run() {
    FrameChannel ch(stream_);
    FrameHeader hdr;
    std::vector<u8> payload;
    ReceiveResult res;

    // ---- Manifest header ----
    FrameStatus st = ch.read_frame(hdr, payload, (int)cfg_.connect_timeout_ms);
    if (st == FrameStatus::TIMEOUT) {
        throw TransferError(ErrorKind::CONNECT_FAILURE,
                            "no manifest from " + stream_.describe() + " within " +
                            std::to_string(cfg_.connect_timeout_ms) + " ms");
    }
    if (st == FrameStatus::CLOSED) {
        throw TransferError(ErrorKind::CONNECT_FAILURE,
                            stream_.describe() + " closed before sending a manifest");
    }
    if (static_cast<MsgType>(hdr.msg_type) != MsgType::MT_HELLO ||
        payload.size() < sizeof(SessionHello)) {
        throw TransferError(ErrorKind::PROTOCOL_FAILURE,
                            "expected manifest header, got frame type " + std::to_string(hdr.msg_type));
    }

    SessionHello hello;
    std::memcpy(&hello, payload.data(), sizeof(hello));
    proto::decode_hello(hello);

    if (!magic_valid(hello.magic, SHRLINK_MAGIC)) {
        send_nack(ch, NackReason::BAD_MAGIC, "bad magic");
        throw TransferError(ErrorKind::PROTOCOL_FAILURE, "bad session magic");
    }
    if (hello.version != SHRLINK_VERSION) {
        send_nack(ch, NackReason::BAD_VERSION, "unsupported version");
        throw TransferError(ErrorKind::PROTOCOL_FAILURE,
                            "unsupported protocol version " + std::to_string(hello.version));
    }
    if (hello.block_size < TransferConfig::MIN_BLOCK_SIZE ||
        hello.block_size > TransferConfig::MAX_BLOCK_SIZE ||
        hello.chunk_count != chunk_count_for(hello.total_size, hello.block_size) ||
        payload.size() != sizeof(SessionHello) + hello.name_len) {
        send_nack(ch, NackReason::BAD_MANIFEST, "inconsistent manifest");
        throw TransferError(ErrorKind::PROTOCOL_FAILURE, "inconsistent manifest header");
    }

    std::memcpy(res.file_id.data(), hello.file_id, 16);
    res.name       = std::string(payload.begin() + sizeof(SessionHello), payload.end());
    res.total_size = hello.total_size;
    res.chunks     = hello.chunk_count;

    if (wanted_ && *wanted_ != res.file_id) {
        LOG_INFO("Refusing " + file_id_hex(res.file_id) + " from " + stream_.describe() +
                 ": waiting for " + file_id_hex(*wanted_));
        send_nack(ch, NackReason::UNWANTED_FILE, "waiting for another file");
        res.outcome = ReceiveOutcome::REFUSED;
        return res;
    }

    std::unique_ptr<ChunkSink> sink;
    try {
        fs::path out = target_.resolve(res.name);
        sink = std::make_unique<ChunkSink>(out, hello.total_size, hello.block_size);
        res.path = out;
    } catch (const TransferError& e) {
        send_nack(ch, e.kind() == ErrorKind::PROTOCOL_FAILURE ? NackReason::BAD_MANIFEST
                                                              : NackReason::LOCAL_ERROR,
                  e.what());
        throw;
    }
    ch.write_empty(MsgType::MT_HELLO_ACK);
    LOG_INFO("Receiving " + res.name + " (" + utils::format_bytes(res.total_size) + ", " +
             std::to_string(res.chunks) + " chunks) from " + stream_.describe());

    // ---- Chunks ----
    u64 start = utils::steady_ms();
    for (;;) {
        st = ch.read_frame(hdr, payload, (int)cfg_.session_timeout_ms);
        if (st == FrameStatus::TIMEOUT) {
            throw TransferError(ErrorKind::CONNECT_FAILURE,
                                "sender idle for " + std::to_string(cfg_.session_timeout_ms) + " ms");
        }
        if (st == FrameStatus::CLOSED) {
            throw TransferError(ErrorKind::CONNECT_FAILURE,
                                "stream closed after " + std::to_string(sink->written()) + "/" +
                                std::to_string(res.chunks) + " chunks");
        }

        switch (static_cast<MsgType>(hdr.msg_type)) {
        case MsgType::MT_CHUNK: {
            if (payload.size() < sizeof(ChunkFrameHdr)) {
                throw TransferError(ErrorKind::PROTOCOL_FAILURE, "truncated chunk frame");
            }
            ChunkFrameHdr ch_hdr;
            std::memcpy(&ch_hdr, payload.data(), sizeof(ch_hdr));
            proto::decode_chunk_hdr(ch_hdr);

            ChunkDescriptor d;
            d.index        = ch_hdr.index;
            d.original_len = ch_hdr.original_len;
            d.stored_len   = ch_hdr.stored_len;
            std::memcpy(d.hash.data(), ch_hdr.hash, d.hash.size());
            d.compressed   = ch_hdr.compressed != 0;

            bool ok = sink->on_chunk(d, payload.data() + sizeof(ChunkFrameHdr),
                                     payload.size() - sizeof(ChunkFrameHdr));
            ChunkAck ack{};
            ack.index = d.index;
            ack.ok    = ok ? 1 : 0;
            proto::encode_ack(ack);
            ch.write_frame(MsgType::MT_ACK, &ack, sizeof(ack));
            break;
        }
        case MsgType::MT_SESSION_DONE: {
            if (!sink->complete()) {
                throw TransferError(ErrorKind::PROTOCOL_FAILURE,
                                    "sender finished with " + std::to_string(sink->written()) + "/" +
                                    std::to_string(res.chunks) + " chunks written");
            }
            res.path       = sink->finish();
            res.rejected   = sink->rejected();
            res.duplicates = sink->duplicates();
            res.outcome    = ReceiveOutcome::COMPLETED;
            u64 elapsed = utils::steady_ms() - start;
            double speed = elapsed > 0 ? (double)res.total_size * 1000.0 / (double)elapsed : 0.0;
            LOG_INFO("Received " + res.path.string() + " in " + utils::format_duration_ms(elapsed) +
                     " (" + utils::format_speed(speed) + ", " + std::to_string(res.rejected) +
                     " rejected, " + std::to_string(res.duplicates) + " duplicate)");
            return res;
        }
        case MsgType::MT_CANCEL:
            LOG_WARN("Sender cancelled " + res.name + " after " + std::to_string(sink->written()) +
                     "/" + std::to_string(res.chunks) + " chunks");
            res.outcome = ReceiveOutcome::CANCELLED;
            res.path.clear();
            return res;
        case MsgType::MT_ERROR_MSG:
            throw TransferError(ErrorKind::TRANSFER_FAILED,
                                "sender error: " + std::string(payload.begin(), payload.end()));
        default:
            LOG_WARN("Ignoring unexpected frame type " + std::to_string(hdr.msg_type));
            break;
        }
    }
}
