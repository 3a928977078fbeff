#pragma once

// ============================================================
// receive_session.hpp -- Receiver side of one peer session
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/manifest.hpp"
#include "../common/peer_stream.hpp"
#include "../common/file_io.hpp"
#include "../common/chunk_sink.hpp"
#include <optional>
#include <string>

enum class ReceiveOutcome {
    COMPLETED,
    CANCELLED,   // sender cancelled; partial output removed
    REFUSED,     // we refused the manifest (e.g. not the file we wait for)
};

const char* to_string(ReceiveOutcome o);

struct ReceiveResult {
    ReceiveOutcome outcome = ReceiveOutcome::REFUSED;
    fs::path       path;
    FileId         file_id{};
    std::string    name;
    u64            total_size = 0;
    u32            chunks     = 0;
    u32            rejected   = 0;
    u32            duplicates = 0;
};

class ReceiveSession {
public:
    ReceiveSession(PeerStream& stream, ReceiveTarget target, const TransferConfig& cfg,
                   std::optional<FileId> wanted = std::nullopt)
        : stream_(stream), target_(std::move(target)), cfg_(cfg), wanted_(wanted) {}

    // Runs until the sender finishes or cancels. Throws TransferError on
    // a broken stream, malformed frames or local IO failure.
    ReceiveResult run();

private:
    PeerStream&           stream_;
    ReceiveTarget         target_;
    TransferConfig        cfg_;
    std::optional<FileId> wanted_;
};
