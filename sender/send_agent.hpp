#pragma once

// ============================================================
// send_agent.hpp -- send(file) -> peer locator | storage locator
//
// Tries a direct peer session first (unless fallback is forced or no
// peer is configured) and falls back to a storage bundle only when the
// session ended without a single acknowledged chunk.
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/peer_stream.hpp"
#include "../common/storage.hpp"
#include "../common/file_io.hpp"
#include "transfer_session.hpp"
#include <atomic>
#include <mutex>
#include <string>

enum class SendOutcome {
    PEER,        // delivered directly; locator is shr://
    FALLBACK,    // bundle uploaded; locator names the stored object
    CANCELLED,
};

const char* to_string(SendOutcome o);

struct SendResult {
    SendOutcome   outcome = SendOutcome::CANCELLED;
    std::string   locator;
    u64           expires_at_unix = 0;   // FALLBACK only
    bool          session_ran = false;
    SessionReport report;                // valid when session_ran
};

class SendAgent {
public:
    // conn and storage may be null: no peer path / no fallback path
    SendAgent(Connectivity* conn, Storage* storage, const TransferConfig& cfg)
        : conn_(conn), storage_(storage), cfg_(cfg) {}

    // Exactly one of: a locator, CANCELLED, or a thrown TransferError
    // (TRANSFER_FAILED after partial delivery, IO_FAILURE, STORAGE_FAILURE).
    // Throws std::invalid_argument for a bad configuration.
    SendResult send(const fs::path& file, const std::string& peer_id, bool force_fallback = false);

    // Thread-safe; forwarded to a running peer session
    void cancel();

private:
    Connectivity*  conn_;
    Storage*       storage_;
    TransferConfig cfg_;

    std::mutex        mutex_;
    TransferSession*  active_ = nullptr;
    std::atomic<bool> cancelled_{false};
};
