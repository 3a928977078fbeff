// ============================================================
// transfer_session.cpp -- TransferSession implementation
// ============================================================

#include "transfer_session.hpp"
#include "../common/protocol_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <thread>
#include <chrono>
#include <cstring>

// Longest single wait on the stream, so cancel() is noticed promptly
static constexpr u64 POLL_SLICE_MS = 50;

// Upper bound on waiting for the receiver to close after SESSION_DONE
static constexpr u64 LINGER_MS = 2000;

const char* to_string(SessionOutcome o) {
    switch (o) {
        case SessionOutcome::COMPLETED:          return "Completed";
        case SessionOutcome::FALLBACK_TRIGGERED: return "FallbackTriggered";
        case SessionOutcome::TRANSFER_FAILED:    return "TransferFailed";
        case SessionOutcome::CANCELLED:          return "Cancelled";
    }
    return "?";
}

const char* to_string(EndReason r) {
    switch (r) {
        case EndReason::NONE:            return "none";
        case EndReason::CONNECT_TIMEOUT: return "connect timeout";
        case EndReason::PEER_REFUSED:    return "peer refused";
        case EndReason::SESSION_TIMEOUT: return "session timeout";
        case EndReason::CHUNK_ABANDONED: return "chunk abandoned";
        case EndReason::STREAM_FAILED:   return "stream failed";
        case EndReason::PROTOCOL_ERROR:  return "protocol error";
        case EndReason::CANCELLED:       return "cancelled";
    }
    return "?";
}

TransferSession::TransferSession(Connectivity& conn, std::string peer_id, ChunkSource& source,
                                 SessionFile file, const TransferConfig& cfg)
    : conn_(conn)
    , peer_id_(std::move(peer_id))
    , source_(source)
    , file_(std::move(file))
    , cfg_(cfg)
    , chunk_count_(chunk_count_for(file_.total_size, cfg.block_size))
    , ledger_(chunk_count_, RetryPolicy::from(cfg))
{}

TransferSession::~TransferSession() {
    close_stream();
}

void TransferSession::close_stream() {
    if (stream_) {
        stream_->close();
    }
    channel_.reset();
    stream_.reset();
}

std::vector<PreparedChunk> TransferSession::take_pulled() {
    std::vector<PreparedChunk> out;
    out.reserve(pending_.size());
    for (auto& kv : pending_) {
        out.push_back(std::move(kv.second));
    }
    pending_.clear();
    return out;
}

void TransferSession::end_short(SessionReport& rep, EndReason reason, ErrorKind kind,
                                const std::string& detail) {
    rep.reason  = reason;
    rep.failure = kind;
    rep.detail  = detail;
    rep.outcome = ledger_.any_acked() ? SessionOutcome::TRANSFER_FAILED
                                      : SessionOutcome::FALLBACK_TRIGGERED;
    LOG_WARN("Session with " + peer_id_ + " ended: " + to_string(reason) + " (" + detail +
             ") -> " + to_string(rep.outcome));
    finished_ = true;

    // Tell the receiver, if the stream still works, so it drops its partial file
    if (channel_ && reason != EndReason::STREAM_FAILED) {
        try {
            channel_->write_frame(MsgType::MT_ERROR_MSG, detail.data(), detail.size());
        } catch (const TransferError& e) {
            LOG_DEBUG(std::string("Could not notify peer: ") + e.what());
        }
    }
}

SessionReport TransferSession::run() {
    SessionReport rep;
    start_ms_ = utils::steady_ms();

    try {
        if (connect_phase(rep)) {
            transfer_phase(rep);
        }
    } catch (const TransferError& e) {
        if (e.kind() != ErrorKind::IO_FAILURE) throw;
        // Local read failure: nothing to fall back to
        if (channel_) {
            try {
                std::string msg = e.what();
                channel_->write_frame(MsgType::MT_ERROR_MSG, msg.data(), msg.size());
            } catch (const TransferError& notify) {
                LOG_DEBUG(std::string("Could not notify peer: ") + notify.what());
            }
        }
        close_stream();
        throw;
    }

    if (channel_) rep.frames_sent = channel_->frames_sent();
    close_stream();
    rep.chunks_acked  = ledger_.acked_count();
    rep.resend_counts = ledger_.resend_counts();
    rep.elapsed_ms    = utils::steady_ms() - start_ms_;
    LOG_INFO("Session " + std::string(to_string(rep.outcome)) + ": " +
             std::to_string(rep.chunks_acked) + "/" + std::to_string(chunk_count_) +
             " chunks acked, " + std::to_string(rep.frames_sent) + " frames, " +
             utils::format_duration_ms(rep.elapsed_ms));
    return rep;
}

// ---- Connecting ----

bool TransferSession::connect_phase(SessionReport& rep) {
    // Connecting counts against the session budget too
    u64 deadline = start_ms_ + std::min(cfg_.connect_timeout_ms, cfg_.session_timeout_ms);
    u32 attempt = 0;

    while (!stream_) {
        if (cancel_requested_.load()) {
            rep.outcome = SessionOutcome::CANCELLED;
            rep.reason  = EndReason::CANCELLED;
            rep.failure = ErrorKind::CANCELLED;
            return false;
        }
        u64 now = utils::steady_ms();
        if (now >= deadline) {
            end_short(rep, EndReason::CONNECT_TIMEOUT, ErrorKind::CONNECT_FAILURE,
                      "no stream to " + peer_id_ + " within " +
                      std::to_string(cfg_.connect_timeout_ms) + " ms");
            return false;
        }
        ++attempt;
        try {
            stream_ = conn_.connect(peer_id_, (u32)(deadline - now));
        } catch (const TransferError& e) {
            LOG_DEBUG("Connect attempt " + std::to_string(attempt) + " failed: " + e.what());
            u64 left = deadline - std::min(deadline, utils::steady_ms());
            u64 pause = std::min<u64>({(u64)cfg_.backoff_base_ms, left, POLL_SLICE_MS});
            if (pause > 0) std::this_thread::sleep_for(std::chrono::milliseconds(pause));
        }
    }
    channel_ = std::make_unique<FrameChannel>(*stream_);

    // Manifest header
    SessionHello hello{};
    magic_init(hello.magic, SHRLINK_MAGIC);
    hello.version     = SHRLINK_VERSION;
    hello.flags       = cfg_.compression ? HELLO_COMPRESSION : 0;
    hello.block_size  = cfg_.block_size;
    hello.chunk_count = chunk_count_;
    hello.total_size  = file_.total_size;
    std::memcpy(hello.file_id, file_.file_id.data(), 16);
    hello.name_len    = (u16)file_.name.size();
    proto::encode_hello(hello);

    try {
        channel_->write_frame(MsgType::MT_HELLO, &hello, sizeof(hello),
                              file_.name.data(), file_.name.size());

        FrameHeader hdr;
        std::vector<u8> payload;
        for (;;) {
            if (cancel_requested_.load()) {
                channel_->write_empty(MsgType::MT_CANCEL);
                rep.outcome = SessionOutcome::CANCELLED;
                rep.reason  = EndReason::CANCELLED;
                rep.failure = ErrorKind::CANCELLED;
                return false;
            }
            u64 now = utils::steady_ms();
            if (now >= deadline) {
                end_short(rep, EndReason::CONNECT_TIMEOUT, ErrorKind::CONNECT_FAILURE,
                          "manifest not accepted within " +
                          std::to_string(cfg_.connect_timeout_ms) + " ms");
                return false;
            }
            int wait = (int)std::min<u64>(deadline - now, POLL_SLICE_MS);
            FrameStatus st = channel_->read_frame(hdr, payload, wait);
            if (st == FrameStatus::TIMEOUT) continue;
            if (st == FrameStatus::CLOSED) {
                end_short(rep, EndReason::STREAM_FAILED, ErrorKind::CONNECT_FAILURE,
                          "peer closed before accepting the manifest");
                return false;
            }
            MsgType mt = static_cast<MsgType>(hdr.msg_type);
            if (mt == MsgType::MT_HELLO_ACK) break;
            if (mt == MsgType::MT_HELLO_NACK) {
                std::string why = "refused";
                if (payload.size() >= sizeof(HelloNack)) {
                    HelloNack nack = proto::read_struct<HelloNack>(payload);
                    proto::decode_hello_nack(nack);
                    why = "refused (reason " + std::to_string(nack.reason) + ")";
                    if (payload.size() > sizeof(HelloNack)) {
                        why += ": " + std::string(payload.begin() + sizeof(HelloNack), payload.end());
                    }
                }
                end_short(rep, EndReason::PEER_REFUSED, ErrorKind::CONNECT_FAILURE, why);
                return false;
            }
            LOG_WARN("Unexpected frame type " + std::to_string(hdr.msg_type) + " before manifest ack");
        }
    } catch (const TransferError& e) {
        if (e.kind() == ErrorKind::IO_FAILURE) throw;
        end_short(rep, e.kind() == ErrorKind::PROTOCOL_FAILURE ? EndReason::PROTOCOL_ERROR
                                                               : EndReason::STREAM_FAILED,
                  e.kind(), e.what());
        return false;
    }

    LOG_INFO("Peer " + stream_->describe() + " accepted " + file_.name + " (" +
             std::to_string(chunk_count_) + " chunks)");
    return true;
}

// ---- Transferring ----

void TransferSession::send_chunk(const PreparedChunk& chunk) {
    ChunkFrameHdr h{};
    h.index        = chunk.desc.index;
    h.original_len = chunk.desc.original_len;
    h.stored_len   = chunk.desc.stored_len;
    std::memcpy(h.hash, chunk.desc.hash.data(), sizeof(h.hash));
    h.compressed   = chunk.desc.compressed ? 1 : 0;
    proto::encode_chunk_hdr(h);

    ledger_.mark_sent(chunk.desc.index, utils::steady_ms());
    channel_->write_frame(MsgType::MT_CHUNK, &h, sizeof(h),
                          chunk.payload.data(), chunk.payload.size());
}

void TransferSession::handle_frame(const FrameHeader& hdr, const std::vector<u8>& payload,
                                   SessionReport& rep) {
    MsgType mt = static_cast<MsgType>(hdr.msg_type);
    switch (mt) {
    case MsgType::MT_ACK: {
        ChunkAck ack = proto::read_struct<ChunkAck>(payload);
        proto::decode_ack(ack);
        if (ack.index >= chunk_count_) {
            LOG_WARN("Ack for unknown chunk " + std::to_string(ack.index));
            return;
        }
        LedgerEvent ev = ledger_.on_ack(ack.index, ack.ok != 0, utils::steady_ms());
        if (ev == LedgerEvent::ACKED) {
            pending_.erase(ack.index);
        } else if (ev == LedgerEvent::RETRY) {
            LOG_DEBUG("Chunk " + std::to_string(ack.index) + " rejected by peer, resending");
        } else if (ev == LedgerEvent::ABANDONED) {
            end_short(rep, EndReason::CHUNK_ABANDONED, ErrorKind::ABANDONED,
                      "chunk " + std::to_string(ack.index) + " exceeded " +
                      std::to_string(cfg_.max_retries) + " retries");
        }
        return;
    }
    case MsgType::MT_ERROR_MSG:
        end_short(rep, EndReason::STREAM_FAILED, ErrorKind::CONNECT_FAILURE,
                  "peer error: " + std::string(payload.begin(), payload.end()));
        return;
    default:
        LOG_WARN("Ignoring unexpected frame type " + std::to_string(hdr.msg_type));
        return;
    }
}

void TransferSession::transfer_phase(SessionReport& rep) {
    u64 session_deadline = start_ms_ + cfg_.session_timeout_ms;
    FrameHeader hdr;
    std::vector<u8> payload;

    try {
        while (!finished_) {
            if (cancel_requested_.load()) {
                drain_and_cancel(rep);
                return;
            }
            u64 now = utils::steady_ms();
            if (now >= session_deadline) {
                end_short(rep, EndReason::SESSION_TIMEOUT, ErrorKind::TRANSFER_FAILED,
                          "session exceeded " + std::to_string(cfg_.session_timeout_ms) + " ms");
                return;
            }

            // Ack deadlines
            for (u32 idx : ledger_.expired(now)) {
                LedgerEvent ev = ledger_.on_timeout(idx, now);
                if (ev == LedgerEvent::ABANDONED) {
                    end_short(rep, EndReason::CHUNK_ABANDONED, ErrorKind::ABANDONED,
                              "chunk " + std::to_string(idx) + " unacknowledged after " +
                              std::to_string(cfg_.max_retries) + " retries");
                    return;
                }
                if (ev == LedgerEvent::RETRY) {
                    LOG_DEBUG("Chunk " + std::to_string(idx) + " ack timeout, retry in " +
                              std::to_string(ledger_.entry(idx).last_delay_ms) + " ms");
                }
            }

            // Resends whose backoff elapsed
            for (u32 idx : ledger_.due_retries(now)) {
                auto it = pending_.find(idx);
                if (it != pending_.end()) send_chunk(it->second);
            }

            // New chunks while the window has room
            while (!source_done_ && pending_.size() < cfg_.window) {
                std::optional<PreparedChunk> c = source_.next();
                if (!c) {
                    source_done_ = true;
                    if (source_.yielded() != chunk_count_) {
                        throw TransferError(ErrorKind::IO_FAILURE,
                                            "source produced " + std::to_string(source_.yielded()) +
                                            " chunks, manifest has " + std::to_string(chunk_count_));
                    }
                    break;
                }
                u32 idx = c->desc.index;
                auto res = pending_.emplace(idx, std::move(*c));
                send_chunk(res.first->second);
            }

            if (source_done_ && ledger_.all_acked()) {
                channel_->write_empty(MsgType::MT_SESSION_DONE);
                rep.outcome = SessionOutcome::COMPLETED;
                finished_ = true;
                linger_until_closed();
                return;
            }

            // Wait for the next ack, timer or poll slice
            now = utils::steady_ms();
            u64 wake = ledger_.next_wakeup(now);
            u64 limit = std::min<u64>(now + POLL_SLICE_MS, session_deadline);
            if (wake != 0 && wake < limit) limit = wake;
            int wait = limit > now ? (int)(limit - now) : 0;

            FrameStatus st = channel_->read_frame(hdr, payload, wait);
            if (st == FrameStatus::CLOSED) {
                end_short(rep, EndReason::STREAM_FAILED, ErrorKind::CONNECT_FAILURE,
                          "peer closed the stream");
                return;
            }
            if (st == FrameStatus::FRAME) {
                handle_frame(hdr, payload, rep);
            }
        }
    } catch (const TransferError& e) {
        if (e.kind() == ErrorKind::IO_FAILURE) throw;
        end_short(rep, e.kind() == ErrorKind::PROTOCOL_FAILURE ? EndReason::PROTOCOL_ERROR
                                                               : EndReason::STREAM_FAILED,
                  e.kind(), e.what());
    } catch (const std::runtime_error& e) {
        // Truncated ack payloads surface from proto::read_struct
        end_short(rep, EndReason::PROTOCOL_ERROR, ErrorKind::PROTOCOL_FAILURE, e.what());
    }
}

// Closing with unread acks queued would reset the connection and could
// drop SESSION_DONE on the receiver side, so read until the peer closes.
void TransferSession::linger_until_closed() {
    u64 deadline = utils::steady_ms() + std::min<u64>(cfg_.ack_timeout_ms, LINGER_MS);
    FrameHeader hdr;
    std::vector<u8> payload;
    try {
        for (;;) {
            u64 now = utils::steady_ms();
            if (now >= deadline) return;
            if (channel_->read_frame(hdr, payload, (int)(deadline - now)) != FrameStatus::FRAME) return;
        }
    } catch (const TransferError& e) {
        LOG_DEBUG(std::string("Stream error after completion: ") + e.what());
    }
}

// ---- Cancel ----

void TransferSession::drain_and_cancel(SessionReport& rep) {
    LOG_INFO("Cancelling: draining " + std::to_string(ledger_.in_flight()) + " in-flight chunks");
    ledger_.clear_pending_retries();

    // Wait for acks of chunks already on the wire, up to their deadlines
    u64 drain_deadline = utils::steady_ms() + cfg_.ack_timeout_ms;
    FrameHeader hdr;
    std::vector<u8> payload;
    try {
        while (ledger_.in_flight() > 0) {
            u64 now = utils::steady_ms();
            if (now >= drain_deadline) break;
            FrameStatus st = channel_->read_frame(hdr, payload, (int)(drain_deadline - now));
            if (st != FrameStatus::FRAME) break;
            if (static_cast<MsgType>(hdr.msg_type) != MsgType::MT_ACK) continue;
            ChunkAck ack = proto::read_struct<ChunkAck>(payload);
            proto::decode_ack(ack);
            if (ack.index >= chunk_count_) continue;
            // No retries while draining: a rejection just ends that chunk
            if (ack.ok) {
                if (ledger_.on_ack(ack.index, true, now) == LedgerEvent::ACKED) {
                    pending_.erase(ack.index);
                }
            } else {
                ledger_.on_ack(ack.index, false, now);
                ledger_.clear_pending_retries();
            }
        }
        channel_->write_empty(MsgType::MT_CANCEL);
    } catch (const std::runtime_error& e) {
        LOG_DEBUG(std::string("Stream error while cancelling: ") + e.what());
    }

    rep.outcome = SessionOutcome::CANCELLED;
    rep.reason  = EndReason::CANCELLED;
    rep.failure = ErrorKind::CANCELLED;
    rep.detail  = "cancelled by caller";
    finished_ = true;
}
