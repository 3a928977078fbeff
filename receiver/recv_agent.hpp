#pragma once

// ============================================================
// recv_agent.hpp -- recv(locator) -> file on disk
//
// A storage locator is downloaded and decoded as a bundle. A peer
// locator means "wait for that file": listen and accept sessions until
// one offers the named file id.
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/peer_stream.hpp"
#include "../common/storage.hpp"
#include "../common/chunk_sink.hpp"
#include "receive_session.hpp"
#include <atomic>
#include <optional>
#include <string>

class RecvAgent {
public:
    // conn and storage may be null when the matching locator kind is
    // not going to be used
    RecvAgent(Connectivity* conn, Storage* storage, const TransferConfig& cfg)
        : conn_(conn), storage_(storage), cfg_(cfg) {}

    // Accept incoming sessions until one completes (or the sender
    // cancels it). wanted restricts which file id is accepted.
    // Returns nullopt if stop() was called first.
    std::optional<ReceiveResult> listen(const ReceiveTarget& target,
                                        std::optional<FileId> wanted = std::nullopt);

    // Resolve a locator into a file. Throws TransferError.
    fs::path fetch(const std::string& locator, const ReceiveTarget& target);

    void stop() { stop_.store(true); }

private:
    Connectivity*     conn_;
    Storage*          storage_;
    TransferConfig    cfg_;
    std::atomic<bool> stop_{false};
};
