#pragma once

// ============================================================
// hash.hpp -- Content hashing for shrlink
//
// Chunk content hashes are SHA-256 (OpenSSL EVP) over the original,
// uncompressed bytes. The whole-file digest and the bundle manifest
// checksum use xxHash3.
// ============================================================

#include "platform.hpp"
#include "utils.hpp"
#include <cstddef>
#include <array>
#include <string>
#include <stdexcept>

#include <openssl/evp.h>

#define XXH_STATIC_LINKING_ONLY
#include "xxhash.h"

namespace hash {

static constexpr size_t CONTENT_HASH_LEN = 32;

using ContentHash = std::array<u8, CONTENT_HASH_LEN>;
using Hash128     = std::array<u8, 16>;

// Streaming SHA-256
class Sha256 {
public:
    Sha256() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
        reset();
    }

    ~Sha256() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void reset() {
        if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
        }
    }

    void update(const void* data, size_t len) {
        if (len == 0) return;
        if (EVP_DigestUpdate(ctx_, data, len) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }

    // Finishes the digest; call reset() before reusing the hasher
    ContentHash finish() {
        ContentHash out{};
        unsigned int n = 0;
        if (EVP_DigestFinal_ex(ctx_, out.data(), &n) != 1 || n != CONTENT_HASH_LEN) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        return out;
    }

private:
    EVP_MD_CTX* ctx_;
};

// One-shot SHA-256 of a buffer
inline ContentHash sha256(const void* data, size_t len) {
    Sha256 h;
    h.update(data, len);
    return h.finish();
}

inline Hash128 to_bytes(XXH128_hash_t h) {
    Hash128 result;
    for (int i = 0; i < 8; ++i) {
        result[i]     = (u8)(h.high64 >> (56 - 8 * i));
        result[8 + i] = (u8)(h.low64  >> (56 - 8 * i));
    }
    return result;
}

// xxh3_64 of a memory buffer (bundle manifest checksum)
inline u64 xxh3_64(const void* data, size_t len) {
    return (u64)XXH3_64bits(data, len);
}

// Streaming xxh3_128 over a whole file, in read order
class FileDigest {
public:
    FileDigest() {
        state_ = XXH3_createState();
        if (!state_) throw std::runtime_error("XXH3_createState failed");
        reset();
    }

    ~FileDigest() {
        if (state_) XXH3_freeState(state_);
    }

    FileDigest(const FileDigest&) = delete;
    FileDigest& operator=(const FileDigest&) = delete;

    void reset() {
        XXH3_128bits_reset(state_);
    }

    void update(const void* data, size_t len) {
        XXH3_128bits_update(state_, data, len);
    }

    Hash128 digest() const {
        return to_bytes(XXH3_128bits_digest(state_));
    }

private:
    XXH3_state_t* state_;
};

inline std::string to_hex(const ContentHash& h) {
    return utils::to_hex(h.data(), h.size());
}

} // namespace hash
