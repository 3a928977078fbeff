// ============================================================
// chunk_source.cpp -- ChunkSource implementation
// ============================================================

#include "chunk_source.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

ChunkSource::ChunkSource(std::istream& in, const TransferConfig& cfg,
                         std::optional<u64> expected_size)
    : in_(in)
    , block_size_(cfg.block_size)
    , compression_(cfg.compression)
    , expected_size_(expected_size)
{
    u32 workers = cfg.effective_workers();
    read_ahead_ = (size_t)workers * 2;
    pool_ = std::make_unique<ThreadPool>(workers, read_ahead_);
    reader_ = std::thread([this] { reader_loop(); });
}

ChunkSource::~ChunkSource() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stop_ = true;
    }
    space_cv_.notify_all();
    ready_cv_.notify_all();
    if (reader_.joinable()) reader_.join();
    pool_->shutdown();
}

void ChunkSource::fail(const std::string& msg) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (error_.empty()) error_ = msg;
    }
    ready_cv_.notify_all();
    space_cv_.notify_all();
}

void ChunkSource::reader_loop() {
    for (u32 index = 0;; ++index) {
        {
            std::unique_lock<std::mutex> lk(mutex_);
            space_cv_.wait(lk, [this] {
                return stop_ || !error_.empty() ||
                       (size_t)(blocks_read_ - next_yield_) < read_ahead_;
            });
            if (stop_ || !error_.empty()) return;
        }

        std::vector<u8> block(block_size_);
        in_.read(reinterpret_cast<char*>(block.data()), block_size_);
        size_t n = (size_t)in_.gcount();
        if (in_.bad()) {
            fail("read error at offset " + std::to_string(bytes_read_));
            return;
        }
        block.resize(n);

        u64 total = bytes_read_ + n;
        if (expected_size_ && total > *expected_size_) {
            fail("stream longer than expected " + std::to_string(*expected_size_) + " bytes");
            return;
        }
        if (n > 0) file_digest_.update(block.data(), n);

        if (n == 0) {
            if (expected_size_ && total < *expected_size_) {
                fail("stream ended after " + std::to_string(total) + " of " +
                     std::to_string(*expected_size_) + " bytes");
                return;
            }
            std::lock_guard<std::mutex> lk(mutex_);
            eof_ = true;
            ready_cv_.notify_all();
            return;
        }

        {
            std::lock_guard<std::mutex> lk(mutex_);
            bytes_read_ = total;
            blocks_read_ = index + 1;
        }

        try {
            pool_->enqueue([this, index, b = std::move(block)]() mutable {
                encode_block(index, std::move(b));
            });
        } catch (const std::exception& e) {
            fail(std::string("cannot schedule block: ") + e.what());
            return;
        }

        if (n < block_size_) {
            // A short read only happens at end of stream
            if (expected_size_ && total < *expected_size_) {
                fail("stream ended after " + std::to_string(total) + " of " +
                     std::to_string(*expected_size_) + " bytes");
                return;
            }
            std::lock_guard<std::mutex> lk(mutex_);
            eof_ = true;
            ready_cv_.notify_all();
            return;
        }
    }
}

std::unique_ptr<compress::BlockEncoder> ChunkSource::acquire_encoder() {
    {
        std::lock_guard<std::mutex> lk(encoders_mutex_);
        if (!encoders_.empty()) {
            auto enc = std::move(encoders_.back());
            encoders_.pop_back();
            return enc;
        }
    }
    return std::make_unique<compress::BlockEncoder>(compression_);
}

void ChunkSource::release_encoder(std::unique_ptr<compress::BlockEncoder> enc) {
    std::lock_guard<std::mutex> lk(encoders_mutex_);
    encoders_.push_back(std::move(enc));
}

void ChunkSource::encode_block(u32 index, std::vector<u8> block) {
    PreparedChunk chunk;
    try {
        auto enc = acquire_encoder();
        compress::EncodedBlock eb = enc->encode(block.data(), block.size());
        release_encoder(std::move(enc));

        chunk.desc.index        = index;
        chunk.desc.original_len = (u32)block.size();
        chunk.desc.stored_len   = (u32)eb.payload.size();
        chunk.desc.hash         = eb.hash;
        chunk.desc.compressed   = eb.compressed;
        chunk.payload           = std::move(eb.payload);
    } catch (const std::exception& e) {
        fail("block " + std::to_string(index) + ": " + e.what());
        return;
    }
    {
        std::lock_guard<std::mutex> lk(mutex_);
        results_.emplace(index, std::move(chunk));
    }
    ready_cv_.notify_all();
}

std::optional<PreparedChunk> ChunkSource::next() {
    std::unique_lock<std::mutex> lk(mutex_);
    ready_cv_.wait(lk, [this] {
        return !error_.empty() || stop_ ||
               results_.count(next_yield_) != 0 ||
               (eof_ && next_yield_ == blocks_read_);
    });
    if (!error_.empty()) {
        throw TransferError(ErrorKind::IO_FAILURE, error_);
    }
    auto it = results_.find(next_yield_);
    if (it == results_.end()) {
        return std::nullopt;
    }
    PreparedChunk out = std::move(it->second);
    results_.erase(it);
    ++next_yield_;
    lk.unlock();
    space_cv_.notify_all();
    LOG_DEBUG("chunk " + std::to_string(out.desc.index) + " ready: " +
              std::to_string(out.desc.original_len) + " -> " +
              std::to_string(out.desc.stored_len) + (out.desc.compressed ? " (zstd)" : " (raw)"));
    return out;
}

u32 ChunkSource::yielded() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return next_yield_;
}

u64 ChunkSource::total_bytes() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return bytes_read_;
}

hash::Hash128 ChunkSource::file_digest() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return file_digest_.digest();
}
