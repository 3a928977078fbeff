#pragma once

// ============================================================
// bundle.hpp -- Fallback bundle manifest
//
// Layout (all integers big-endian):
//   BundleHeader | name | BundleEntry[chunk_count] | u64 checksum
//   | payload[0] .. payload[chunk_count-1]
// The checksum is xxh3_64 over every manifest byte before it. Payload
// offsets follow from the stored lengths, so the manifest is the index.
// ============================================================

#include "platform.hpp"
#include "manifest.hpp"
#include "hash.hpp"
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace bundle {

struct BundleManifest {
    FileManifest  file;            // chunks[i].index == i
    hash::Hash128 digest{};        // xxh3_128 of the original file
    u64           manifest_len = 0;

    u64 payload_bytes() const {
        u64 n = 0;
        for (const auto& c : file.chunks) n += c.stored_len;
        return n;
    }
};

// Serialise the manifest part. Returns the number of bytes written.
// Throws TransferError(IO_FAILURE) if the stream fails.
u64 write_manifest(std::ostream& out, const FileManifest& file, const hash::Hash128& digest);

// Parse and validate the manifest of a bundle that is bundle_size bytes
// long: magic, version, name safety, checksum, per-chunk lengths and
// the overall size. Throws TransferError(PROTOCOL_FAILURE).
BundleManifest read_manifest(std::istream& in, u64 bundle_size);

// Object name used when uploading a bundle
inline std::string object_name(const FileId& id) {
    return file_id_hex(id) + ".shr";
}

} // namespace bundle
