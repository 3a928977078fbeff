#pragma once

// ============================================================
// chunk_verify.hpp -- Verify one received chunk
//
// Used by both receive paths (peer session and bundle decode).
// ============================================================

#include "platform.hpp"
#include "manifest.hpp"
#include <vector>

enum class VerifyResult {
    OK,
    BAD_LENGTH,      // stored/original lengths inconsistent with the manifest
    UNDECODABLE,     // zstd rejected the payload or it expanded to the wrong size
    HASH_MISMATCH,   // SHA-256 of the original bytes differs
};

const char* to_string(VerifyResult r);

// Decode the stored payload of `desc` into `original` and check its hash.
// expected_len is the original length the manifest implies for this index.
// `original` is only meaningful when OK is returned.
VerifyResult verify_chunk(const ChunkDescriptor& desc, u32 expected_len,
                          const u8* payload, size_t payload_len,
                          std::vector<u8>& original);
