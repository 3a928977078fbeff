#pragma once

// ============================================================
// compress.hpp -- zstd block codec
//
// BlockEncoder compresses one block with the zstd streaming API and
// updates the block's SHA-256 from the same input slices, so the block
// is read once. A block whose compressed form is not strictly smaller
// than the original is stored raw.
// ============================================================

#include "platform.hpp"
#include "hash.hpp"
#include <vector>
#include <string>
#include <stdexcept>
#include <algorithm>

#include "zstd.h"

namespace compress {

// Compression level 1 = fastest
static constexpr int ZSTD_LEVEL = 1;

// Input slice fed to the compressor and the hasher per step
static constexpr size_t SLICE_SIZE = 64 * 1024;

struct EncodedBlock {
    hash::ContentHash hash{};
    bool              compressed = false;
    std::vector<u8>   payload;     // stored bytes (compressed or raw copy)
};

// One encoder per worker thread; not thread-safe
class BlockEncoder {
public:
    explicit BlockEncoder(bool compression_enabled)
        : enabled_(compression_enabled), cctx_(nullptr) {
        if (enabled_) {
            cctx_ = ZSTD_createCCtx();
            if (!cctx_) throw std::runtime_error("ZSTD_createCCtx failed");
        }
    }

    ~BlockEncoder() {
        if (cctx_) ZSTD_freeCCtx(cctx_);
    }

    BlockEncoder(const BlockEncoder&) = delete;
    BlockEncoder& operator=(const BlockEncoder&) = delete;

    EncodedBlock encode(const u8* src, size_t len) {
        EncodedBlock out;
        hasher_.reset();

        if (!enabled_ || len == 0) {
            hasher_.update(src, len);
            out.hash = hasher_.finish();
            out.payload.assign(src, src + len);
            return out;
        }

        check(ZSTD_CCtx_reset(cctx_, ZSTD_reset_session_only), "reset");
        check(ZSTD_CCtx_setParameter(cctx_, ZSTD_c_compressionLevel, ZSTD_LEVEL), "level");
        check(ZSTD_CCtx_setPledgedSrcSize(cctx_, (unsigned long long)len), "pledge");

        std::vector<u8> dst(ZSTD_compressBound(len));
        ZSTD_outBuffer ob{dst.data(), dst.size(), 0};

        size_t off = 0;
        while (off < len) {
            size_t n = std::min(SLICE_SIZE, len - off);
            hasher_.update(src + off, n);
            ZSTD_inBuffer ib{src + off, n, 0};
            bool last = (off + n == len);
            ZSTD_EndDirective mode = last ? ZSTD_e_end : ZSTD_e_continue;
            for (;;) {
                size_t rem = ZSTD_compressStream2(cctx_, &ob, &ib, mode);
                check(rem, "compressStream2");
                if (last ? rem == 0 : ib.pos == ib.size) break;
            }
            off += n;
        }

        out.hash = hasher_.finish();
        if (ob.pos < len) {
            dst.resize(ob.pos);
            out.payload    = std::move(dst);
            out.compressed = true;
        } else {
            out.payload.assign(src, src + len);
        }
        return out;
    }

private:
    static void check(size_t rc, const char* what) {
        if (ZSTD_isError(rc)) {
            throw std::runtime_error(std::string("ZSTD ") + what + " error: " +
                                     ZSTD_getErrorName(rc));
        }
    }

    bool         enabled_;
    ZSTD_CCtx*   cctx_;
    hash::Sha256 hasher_;
};

// Decompress a stored block that must expand to exactly original_len bytes.
// Returns false for undecodable input or a length mismatch.
inline bool decompress_block(const u8* src, size_t src_len, size_t original_len,
                             std::vector<u8>& out) {
    unsigned long long declared = ZSTD_getFrameContentSize(src, src_len);
    if (declared == ZSTD_CONTENTSIZE_ERROR) return false;
    if (declared != ZSTD_CONTENTSIZE_UNKNOWN && declared != original_len) return false;

    out.resize(original_len);
    size_t rc = ZSTD_decompress(out.data(), original_len, src, src_len);
    if (ZSTD_isError(rc) || rc != original_len) {
        out.clear();
        return false;
    }
    return true;
}

} // namespace compress
