#pragma once

// ============================================================
// transfer_session.hpp -- Sender-side P2P session
//
// Connecting -> Transferring -> {Completed | FallbackTriggered |
//                                TransferFailed | Cancelled}
//
// One cooperative loop multiplexes sends, acks, ack deadlines and
// backoff timers over a single stream. Compression happens upstream in
// ChunkSource; the session only pulls while the window has room.
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/manifest.hpp"
#include "../common/errors.hpp"
#include "../common/peer_stream.hpp"
#include "../common/frame_channel.hpp"
#include "../common/integrity_ledger.hpp"
#include "../common/chunk_source.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

enum class SessionOutcome {
    COMPLETED,
    FALLBACK_TRIGGERED,
    TRANSFER_FAILED,
    CANCELLED,
};

const char* to_string(SessionOutcome o);

// Why a session stopped short of completion
enum class EndReason {
    NONE,
    CONNECT_TIMEOUT,    // no stream, or manifest not accepted, in time
    PEER_REFUSED,       // receiver answered the manifest with a NACK
    SESSION_TIMEOUT,
    CHUNK_ABANDONED,
    STREAM_FAILED,      // stream closed or broke mid-session
    PROTOCOL_ERROR,     // malformed frame from the peer
    CANCELLED,
};

const char* to_string(EndReason r);

struct SessionReport {
    SessionOutcome   outcome     = SessionOutcome::TRANSFER_FAILED;
    EndReason        reason      = EndReason::NONE;
    ErrorKind        failure     = ErrorKind::TRANSFER_FAILED;   // meaningful unless COMPLETED
    std::string      detail;
    u64              frames_sent = 0;
    u32              chunks_acked = 0;
    std::vector<u32> resend_counts;
    u64              elapsed_ms  = 0;
};

class TransferSession {
public:
    TransferSession(Connectivity& conn, std::string peer_id, ChunkSource& source,
                    SessionFile file, const TransferConfig& cfg);
    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    // Drive the session to a terminal outcome. Throws TransferError only
    // for IO failures of the chunk source.
    SessionReport run();

    // Thread-safe; the running loop notices within one poll interval
    void cancel() { cancel_requested_.store(true); }

    // After FALLBACK_TRIGGERED: chunks pulled from the source but never
    // acked, in index order. Ownership moves to the caller.
    std::vector<PreparedChunk> take_pulled();

    const IntegrityLedger& ledger() const { return ledger_; }

private:
    bool connect_phase(SessionReport& rep);
    void transfer_phase(SessionReport& rep);
    void drain_and_cancel(SessionReport& rep);
    void linger_until_closed();
    void send_chunk(const PreparedChunk& chunk);
    void handle_frame(const FrameHeader& hdr, const std::vector<u8>& payload, SessionReport& rep);
    void end_short(SessionReport& rep, EndReason reason, ErrorKind kind, const std::string& detail);
    void close_stream();

    Connectivity&  conn_;
    std::string    peer_id_;
    ChunkSource&   source_;
    SessionFile    file_;
    TransferConfig cfg_;
    u32            chunk_count_;

    IntegrityLedger ledger_;
    std::map<u32, PreparedChunk>  pending_;   // pulled, not yet acked
    std::unique_ptr<PeerStream>   stream_;
    std::unique_ptr<FrameChannel> channel_;
    std::atomic<bool>             cancel_requested_{false};
    bool                          source_done_ = false;
    bool                          finished_    = false;
    u64                           start_ms_    = 0;
};
