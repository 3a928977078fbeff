// ============================================================
// chunk_sink.cpp -- ChunkSink implementation
// ============================================================

#include "chunk_sink.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <system_error>
#include <fstream>

static hash::Hash128 digest_of(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) {
        throw TransferError(ErrorKind::IO_FAILURE, "cannot reopen " + p.string());
    }
    hash::FileDigest d;
    std::vector<char> buf(1024 * 1024);
    while (in) {
        in.read(buf.data(), (std::streamsize)buf.size());
        std::streamsize got = in.gcount();
        if (got > 0) d.update(buf.data(), (size_t)got);
    }
    if (in.bad()) {
        throw TransferError(ErrorKind::IO_FAILURE, "read failed for " + p.string());
    }
    return d.digest();
}

ChunkSink::ChunkSink(const fs::path& final_path, u64 total_size, u32 block_size)
    : final_path_(final_path)
    , part_path_(file_io::part_path(final_path))
    , total_size_(total_size)
    , block_size_(block_size)
    , chunk_count_(chunk_count_for(total_size, block_size))
    , ledger_(chunk_count_, RetryPolicy{})
{
    if (block_size == 0) {
        throw TransferError(ErrorKind::PROTOCOL_FAILURE, "block size 0");
    }
    writer_.open(part_path_.string(), total_size_);
    LOG_DEBUG("Writing " + part_path_.string() + " (" + utils::format_bytes(total_size_) +
              ", " + std::to_string(chunk_count_) + " chunks)");
}

ChunkSink::~ChunkSink() {
    if (!published_) {
        writer_.close();
        std::error_code ec;
        fs::remove(part_path_, ec);
    }
}

bool ChunkSink::on_chunk(const ChunkDescriptor& desc, const u8* payload, size_t payload_len) {
    if (desc.index >= chunk_count_) {
        LOG_WARN("Chunk index " + std::to_string(desc.index) + " out of range (" +
                 std::to_string(chunk_count_) + " chunks)");
        ++rejected_;
        return false;
    }
    if (ledger_.is_acked(desc.index)) {
        ++duplicates_;
        return true;
    }

    u32 expected = expected_block_len(total_size_, block_size_, desc.index);
    VerifyResult vr = verify_chunk(desc, expected, payload, payload_len, scratch_);
    if (vr != VerifyResult::OK) {
        LOG_WARN("Chunk " + std::to_string(desc.index) + " rejected: " + to_string(vr));
        ++rejected_;
        return false;
    }

    writer_.write_at((u64)desc.index * block_size_, scratch_.data(), scratch_.size());
    ledger_.accept(desc.index);
    return true;
}

fs::path ChunkSink::finish(const hash::Hash128* expected_digest) {
    if (!complete()) {
        throw TransferError(ErrorKind::PROTOCOL_FAILURE,
                            "finish with " + std::to_string(written()) + "/" +
                            std::to_string(chunk_count_) + " chunks written");
    }
    if (!writer_.close()) {
        throw TransferError(ErrorKind::IO_FAILURE, "flush failed for " + part_path_.string());
    }
    u64 actual = file_io::get_file_size(part_path_.string());
    if (actual != total_size_) {
        throw TransferError(ErrorKind::IO_FAILURE,
                            "output length " + std::to_string(actual) + " != manifest " +
                            std::to_string(total_size_));
    }
    if (expected_digest && digest_of(part_path_) != *expected_digest) {
        throw TransferError(ErrorKind::INTEGRITY_FAILURE,
                            "whole-file digest mismatch for " + final_path_.string());
    }
    file_io::publish(part_path_, final_path_);
    published_ = true;
    return final_path_;
}
