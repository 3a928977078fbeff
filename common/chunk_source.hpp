#pragma once

// ============================================================
// chunk_source.hpp -- Split a byte stream into encoded chunks
//
// A reader thread pulls fixed-size blocks from the input stream and
// hands them to a bounded worker pool, which compresses and hashes
// each block. Results are parked in an index-keyed reorder buffer and
// released by next() strictly in index order. At most `read_ahead`
// blocks are held between the reader and the consumer.
// ============================================================

#include "platform.hpp"
#include "config.hpp"
#include "manifest.hpp"
#include "compress.hpp"
#include "thread_pool.hpp"
#include "hash.hpp"
#include <istream>
#include <optional>
#include <map>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <memory>
#include <vector>
#include <string>

class ChunkSource {
public:
    // expected_size, when given, must match the number of bytes the
    // stream delivers; a shorter or longer stream is an IO failure.
    ChunkSource(std::istream& in, const TransferConfig& cfg,
                std::optional<u64> expected_size = std::nullopt);
    ~ChunkSource();

    ChunkSource(const ChunkSource&) = delete;
    ChunkSource& operator=(const ChunkSource&) = delete;

    // Next chunk in index order; nullopt once the stream is exhausted.
    // Throws TransferError(IO_FAILURE) after a read error, and on every
    // call after that.
    std::optional<PreparedChunk> next();

    u32 block_size() const { return block_size_; }
    u32 yielded() const;

    // Valid once next() has returned nullopt
    u64 total_bytes() const;
    hash::Hash128 file_digest() const;

private:
    void reader_loop();
    void encode_block(u32 index, std::vector<u8> block);
    std::unique_ptr<compress::BlockEncoder> acquire_encoder();
    void release_encoder(std::unique_ptr<compress::BlockEncoder> enc);
    void fail(const std::string& msg);

    std::istream&      in_;
    u32                block_size_;
    bool               compression_;
    std::optional<u64> expected_size_;
    size_t             read_ahead_;

    mutable std::mutex      mutex_;
    std::condition_variable ready_cv_;    // consumer waits for results
    std::condition_variable space_cv_;    // reader waits for read-ahead room
    std::map<u32, PreparedChunk> results_;
    u32         blocks_read_  = 0;
    u32         next_yield_   = 0;
    u64         bytes_read_   = 0;
    bool        eof_          = false;
    bool        stop_         = false;
    std::string error_;

    hash::FileDigest file_digest_;

    std::mutex encoders_mutex_;
    std::vector<std::unique_ptr<compress::BlockEncoder>> encoders_;

    std::unique_ptr<ThreadPool> pool_;
    std::thread                 reader_;
};
