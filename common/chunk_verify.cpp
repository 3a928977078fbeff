// ============================================================
// chunk_verify.cpp -- verify_chunk implementation
// ============================================================

#include "chunk_verify.hpp"
#include "compress.hpp"
#include "hash.hpp"

const char* to_string(VerifyResult r) {
    switch (r) {
        case VerifyResult::OK:            return "ok";
        case VerifyResult::BAD_LENGTH:    return "bad length";
        case VerifyResult::UNDECODABLE:   return "undecodable payload";
        case VerifyResult::HASH_MISMATCH: return "hash mismatch";
    }
    return "?";
}

VerifyResult verify_chunk(const ChunkDescriptor& desc, u32 expected_len,
                          const u8* payload, size_t payload_len,
                          std::vector<u8>& original) {
    if (desc.original_len != expected_len) return VerifyResult::BAD_LENGTH;
    if (desc.stored_len != payload_len)    return VerifyResult::BAD_LENGTH;
    if (desc.stored_len > desc.original_len) return VerifyResult::BAD_LENGTH;

    if (desc.compressed) {
        if (!compress::decompress_block(payload, payload_len, desc.original_len, original)) {
            return VerifyResult::UNDECODABLE;
        }
    } else {
        if (desc.stored_len != desc.original_len) return VerifyResult::BAD_LENGTH;
        original.assign(payload, payload + payload_len);
    }

    hash::ContentHash actual = hash::sha256(original.data(), original.size());
    if (actual != desc.hash) return VerifyResult::HASH_MISMATCH;
    return VerifyResult::OK;
}
