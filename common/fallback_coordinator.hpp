#pragma once

// ============================================================
// fallback_coordinator.hpp -- Bundle upload and bundle fetch
//
// publish(): chunks the session already pulled plus the rest of the
// same ChunkSource are spooled to disk, wrapped in a bundle and
// uploaded with a single Storage::upload call.
//
// fetch(): download a bundle to a spool file, validate its manifest,
// verify every chunk through ChunkSink and publish the output.
// ============================================================

#include "platform.hpp"
#include "config.hpp"
#include "manifest.hpp"
#include "storage.hpp"
#include "chunk_source.hpp"
#include "chunk_sink.hpp"
#include <string>
#include <vector>

struct FallbackResult {
    std::string locator;
    u64         expires_at_unix = 0;
    u64         bundle_size     = 0;
    u32         chunk_count     = 0;
};

struct FetchResult {
    fs::path    path;
    FileId      file_id{};
    std::string name;
    u64         total_size = 0;
    u32         chunks     = 0;
};

class FallbackCoordinator {
public:
    FallbackCoordinator(Storage& storage, const TransferConfig& cfg)
        : storage_(storage), cfg_(cfg) {}

    // `pulled` must hold chunks 0..k-1 in order (k may be 0); the
    // source continues at index k. Throws TransferError: IO_FAILURE for
    // the source or spool, STORAGE_FAILURE if the upload fails.
    FallbackResult publish(const SessionFile& file, std::vector<PreparedChunk> pulled,
                           ChunkSource& source);

    // Throws TransferError: STORAGE_FAILURE if the download fails,
    // PROTOCOL_FAILURE for a malformed bundle, INTEGRITY_FAILURE if a
    // chunk or the whole file fails verification.
    FetchResult fetch(const std::string& locator, const ReceiveTarget& target);

private:
    Storage&       storage_;
    TransferConfig cfg_;
};
