// ============================================================
// integrity_ledger.cpp -- IntegrityLedger implementation
// ============================================================

#include "integrity_ledger.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

const char* to_string(ChunkState s) {
    switch (s) {
        case ChunkState::NOT_SENT:  return "NotSent";
        case ChunkState::SENT:      return "Sent";
        case ChunkState::ACKED:     return "Acked";
        case ChunkState::FAILED:    return "Failed";
        case ChunkState::ABANDONED: return "Abandoned";
    }
    return "?";
}

IntegrityLedger::IntegrityLedger(u32 chunk_count, const RetryPolicy& policy)
    : IntegrityLedger(chunk_count, policy, std::random_device{}()) {}

IntegrityLedger::IntegrityLedger(u32 chunk_count, const RetryPolicy& policy, u64 jitter_seed)
    : policy_(policy), entries_(chunk_count), rng_(jitter_seed) {}

void IntegrityLedger::check_index(u32 index) const {
    if (index >= entries_.size()) {
        throw std::out_of_range("chunk index " + std::to_string(index) +
                                " out of range (count " + std::to_string(entries_.size()) + ")");
    }
}

bool IntegrityLedger::mark_sent(u32 index, u64 now_ms) {
    std::lock_guard<std::mutex> lk(mutex_);
    check_index(index);
    ChunkEntry& e = entries_[index];
    if (e.state != ChunkState::NOT_SENT) return false;
    e.state        = ChunkState::SENT;
    e.attempts    += 1;
    e.last_send_ms = now_ms;
    return true;
}

LedgerEvent IntegrityLedger::on_ack(u32 index, bool ok, u64 now_ms) {
    std::lock_guard<std::mutex> lk(mutex_);
    check_index(index);
    ChunkEntry& e = entries_[index];

    if (e.state == ChunkState::ACKED || e.state == ChunkState::ABANDONED) {
        return LedgerEvent::IGNORED;
    }
    // The peer answers every chunk frame once, in stream order
    e.answers += 1;
    if (ok) {
        // A late ok for an attempt we already timed out still proves delivery
        if (e.state == ChunkState::SENT ||
            (e.state == ChunkState::NOT_SENT && e.attempts > 0)) {
            e.state = ChunkState::ACKED;
            ++acked_;
            return LedgerEvent::ACKED;
        }
        return LedgerEvent::IGNORED;
    }
    if (e.state != ChunkState::SENT) return LedgerEvent::IGNORED;
    if (e.answers < e.attempts) return LedgerEvent::IGNORED;
    return fail_locked(e, now_ms, true);
}

LedgerEvent IntegrityLedger::on_timeout(u32 index, u64 now_ms) {
    std::lock_guard<std::mutex> lk(mutex_);
    check_index(index);
    ChunkEntry& e = entries_[index];
    if (e.state != ChunkState::SENT) return LedgerEvent::IGNORED;
    if (now_ms < e.last_send_ms + policy_.ack_timeout_ms) return LedgerEvent::IGNORED;
    return fail_locked(e, now_ms, false);
}

LedgerEvent IntegrityLedger::fail_locked(ChunkEntry& e, u64 now_ms, bool immediate) {
    e.state = ChunkState::FAILED;
    e.failures += 1;
    if (e.failures > policy_.max_retries) {
        e.state = ChunkState::ABANDONED;
        return LedgerEvent::ABANDONED;
    }
    // Recorded for immediate resends too; delays never decrease per chunk
    u32 delay = backoff_delay_locked(e);
    e.last_delay_ms  = delay;
    e.eligible_at_ms = immediate ? now_ms : now_ms + delay;
    e.state = ChunkState::NOT_SENT;
    return LedgerEvent::RETRY;
}

u32 IntegrityLedger::backoff_delay_locked(const ChunkEntry& e) {
    u64 exp = policy_.backoff_base_ms;
    for (u32 i = 1; i < e.failures && exp < policy_.backoff_cap_ms; ++i) {
        exp *= 2;
    }
    exp = std::min<u64>(exp, policy_.backoff_cap_ms);

    u64 jitter = 0;
    if (policy_.jitter_ms > 0) {
        std::uniform_int_distribution<u64> dist(0, policy_.jitter_ms);
        jitter = dist(rng_);
    }
    u64 delay = std::max<u64>(e.last_delay_ms, exp + jitter);
    return (u32)std::min<u64>(delay, 0xFFFFFFFFull);
}

std::vector<u32> IntegrityLedger::expired(u64 now_ms) const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<u32> out;
    for (u32 i = 0; i < entries_.size(); ++i) {
        const ChunkEntry& e = entries_[i];
        if (e.state == ChunkState::SENT && now_ms >= e.last_send_ms + policy_.ack_timeout_ms) {
            out.push_back(i);
        }
    }
    return out;
}

std::vector<u32> IntegrityLedger::due_retries(u64 now_ms) const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<u32> out;
    for (u32 i = 0; i < entries_.size(); ++i) {
        const ChunkEntry& e = entries_[i];
        if (e.state == ChunkState::NOT_SENT && e.attempts > 0 && e.eligible_at_ms <= now_ms) {
            out.push_back(i);
        }
    }
    return out;
}

u64 IntegrityLedger::next_wakeup(u64 now_ms) const {
    std::lock_guard<std::mutex> lk(mutex_);
    u64 best = 0;
    for (const ChunkEntry& e : entries_) {
        u64 t = 0;
        if (e.state == ChunkState::SENT) {
            t = e.last_send_ms + policy_.ack_timeout_ms;
        } else if (e.state == ChunkState::NOT_SENT && e.attempts > 0) {
            t = e.eligible_at_ms;
        } else {
            continue;
        }
        if (t < now_ms) t = now_ms;
        if (best == 0 || t < best) best = t;
    }
    return best;
}

void IntegrityLedger::clear_pending_retries() {
    std::lock_guard<std::mutex> lk(mutex_);
    for (ChunkEntry& e : entries_) {
        if (e.state == ChunkState::NOT_SENT && e.attempts > 0) {
            e.state = ChunkState::FAILED;
        }
    }
}

bool IntegrityLedger::accept(u32 index) {
    std::lock_guard<std::mutex> lk(mutex_);
    check_index(index);
    ChunkEntry& e = entries_[index];
    if (e.state == ChunkState::ACKED) return false;
    e.state = ChunkState::ACKED;
    ++acked_;
    return true;
}

ChunkEntry IntegrityLedger::entry(u32 index) const {
    std::lock_guard<std::mutex> lk(mutex_);
    check_index(index);
    return entries_[index];
}

bool IntegrityLedger::is_acked(u32 index) const {
    std::lock_guard<std::mutex> lk(mutex_);
    check_index(index);
    return entries_[index].state == ChunkState::ACKED;
}

u32 IntegrityLedger::acked_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return acked_;
}

bool IntegrityLedger::all_acked() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return acked_ == entries_.size();
}

bool IntegrityLedger::any_acked() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return acked_ > 0;
}

bool IntegrityLedger::any_abandoned() const {
    std::lock_guard<std::mutex> lk(mutex_);
    for (const ChunkEntry& e : entries_) {
        if (e.state == ChunkState::ABANDONED) return true;
    }
    return false;
}

u32 IntegrityLedger::in_flight() const {
    std::lock_guard<std::mutex> lk(mutex_);
    u32 n = 0;
    for (const ChunkEntry& e : entries_) {
        if (e.state == ChunkState::SENT) ++n;
    }
    return n;
}

u32 IntegrityLedger::pending_retries() const {
    std::lock_guard<std::mutex> lk(mutex_);
    u32 n = 0;
    for (const ChunkEntry& e : entries_) {
        if (e.state == ChunkState::NOT_SENT && e.attempts > 0) ++n;
    }
    return n;
}

u32 IntegrityLedger::resends(u32 index) const {
    std::lock_guard<std::mutex> lk(mutex_);
    check_index(index);
    const ChunkEntry& e = entries_[index];
    return e.attempts > 0 ? e.attempts - 1 : 0;
}

std::vector<u32> IntegrityLedger::resend_counts() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<u32> out(entries_.size());
    for (size_t i = 0; i < entries_.size(); ++i) {
        out[i] = entries_[i].attempts > 0 ? entries_[i].attempts - 1 : 0;
    }
    return out;
}
