#pragma once

// ============================================================
// integrity_ledger.hpp -- Per-chunk delivery state
//
// Sender side: drives NotSent -> Sent -> {Acked | Failed}, and
// Failed -> NotSent (retry after backoff) or Failed -> Abandoned.
// Receiver side: records which indices were verified and written.
//
// Every transition runs under one mutex, so an ack and an ack-timeout
// racing on the same chunk produce at most one terminal transition.
// ============================================================

#include "platform.hpp"
#include "config.hpp"
#include <vector>
#include <mutex>
#include <random>

enum class ChunkState : u8 {
    NOT_SENT,
    SENT,
    ACKED,
    FAILED,
    ABANDONED,
};

const char* to_string(ChunkState s);

// Result of feeding an event into the ledger
enum class LedgerEvent {
    ACKED,       // chunk reached Acked
    RETRY,       // chunk failed and is scheduled for resend
    ABANDONED,   // chunk failed past the retry budget
    IGNORED,     // duplicate / stale event, no transition
};

struct RetryPolicy {
    u32 ack_timeout_ms  = 10000;
    u32 max_retries     = 5;
    u32 backoff_base_ms = 200;
    u32 backoff_cap_ms  = 10000;
    u32 jitter_ms       = 100;

    static RetryPolicy from(const TransferConfig& cfg) {
        RetryPolicy p;
        p.ack_timeout_ms  = cfg.ack_timeout_ms;
        p.max_retries     = cfg.max_retries;
        p.backoff_base_ms = cfg.backoff_base_ms;
        p.backoff_cap_ms  = cfg.backoff_cap_ms;
        p.jitter_ms       = cfg.jitter_ms;
        return p;
    }
};

struct ChunkEntry {
    ChunkState state          = ChunkState::NOT_SENT;
    u32        attempts       = 0;   // sends so far
    u32        failures       = 0;
    u32        answers        = 0;   // acks received, ok or not
    u64        last_send_ms   = 0;
    u32        last_delay_ms  = 0;   // last scheduled backoff
    u64        eligible_at_ms = 0;   // earliest resend time
};

class IntegrityLedger {
public:
    IntegrityLedger(u32 chunk_count, const RetryPolicy& policy);
    IntegrityLedger(u32 chunk_count, const RetryPolicy& policy, u64 jitter_seed);

    IntegrityLedger(const IntegrityLedger&) = delete;
    IntegrityLedger& operator=(const IntegrityLedger&) = delete;

    u32 size() const { return (u32)entries_.size(); }

    // ---- Sender side ----

    // NotSent -> Sent. Returns false if the chunk is not in NotSent.
    bool mark_sent(u32 index, u64 now_ms);

    // Receiver answered for `index`. ok=false schedules an immediate resend,
    // unless it answers a send that already timed out and was repeated.
    LedgerEvent on_ack(u32 index, bool ok, u64 now_ms);

    // Ack deadline passed for a Sent chunk; schedules a backoff resend.
    LedgerEvent on_timeout(u32 index, u64 now_ms);

    // Sent chunks whose ack deadline is <= now
    std::vector<u32> expired(u64 now_ms) const;

    // Chunks waiting for a resend whose backoff has elapsed
    std::vector<u32> due_retries(u64 now_ms) const;

    // Earliest ack deadline or retry time after now; 0 if none pending
    u64 next_wakeup(u64 now_ms) const;

    // Drop pending retries (used when draining on cancel)
    void clear_pending_retries();

    // ---- Receiver side ----

    // Marks `index` Acked. Returns false if it already was.
    bool accept(u32 index);

    // ---- Queries ----

    ChunkEntry entry(u32 index) const;
    bool is_acked(u32 index) const;
    u32  acked_count() const;
    bool all_acked() const;
    bool any_acked() const;
    bool any_abandoned() const;
    u32  in_flight() const;
    u32  pending_retries() const;
    u32  resends(u32 index) const;
    std::vector<u32> resend_counts() const;

private:
    LedgerEvent fail_locked(ChunkEntry& e, u64 now_ms, bool immediate);
    u32 backoff_delay_locked(const ChunkEntry& e);
    void check_index(u32 index) const;

    RetryPolicy             policy_;
    std::vector<ChunkEntry> entries_;
    u32                     acked_ = 0;
    mutable std::mutex      mutex_;
    std::mt19937_64         rng_;
};
