#pragma once

// ============================================================
// chunk_sink.hpp -- Verify and reassemble chunks into a file
//
// Chunks may arrive in any order and more than once. Output goes to
// "<final>.part" and is renamed into place by finish().
// ============================================================

#include "platform.hpp"
#include "manifest.hpp"
#include "chunk_verify.hpp"
#include "integrity_ledger.hpp"
#include "file_io.hpp"
#include <string>
#include <vector>

// Where a received file lands: out_path if set, else out_dir / <name>
struct ReceiveTarget {
    fs::path out_dir;
    fs::path out_path;

    // Throws TransferError(PROTOCOL_FAILURE) for an unsafe name
    fs::path resolve(const std::string& name) const {
        if (!out_path.empty()) return out_path;
        return file_io::safe_join(out_dir, name);
    }
};

class ChunkSink {
public:
    ChunkSink(const fs::path& final_path, u64 total_size, u32 block_size);
    ~ChunkSink();

    ChunkSink(const ChunkSink&) = delete;
    ChunkSink& operator=(const ChunkSink&) = delete;

    // Process one chunk. Returns the ok flag to acknowledge with:
    // true once the chunk is (or already was) written, false if it
    // failed verification.
    bool on_chunk(const ChunkDescriptor& desc, const u8* payload, size_t payload_len);

    // Every index written
    bool complete() const { return ledger_.all_acked(); }

    // Flush, check the file length (and the whole-file digest when one
    // is given) and move it into place. Throws TransferError if
    // incomplete, on IO failure or on a digest mismatch.
    fs::path finish(const hash::Hash128* expected_digest = nullptr);

    u32 chunk_count() const { return chunk_count_; }
    u32 written() const { return ledger_.acked_count(); }
    u32 rejected() const { return rejected_; }
    u32 duplicates() const { return duplicates_; }

private:
    fs::path              final_path_;
    fs::path              part_path_;
    u64                   total_size_;
    u32                   block_size_;
    u32                   chunk_count_;
    IntegrityLedger       ledger_;
    file_io::MmapWriter   writer_;
    std::vector<u8>       scratch_;
    u32                   rejected_   = 0;
    u32                   duplicates_ = 0;
    bool                  published_  = false;
};
