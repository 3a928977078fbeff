#pragma once

// ============================================================
// manifest.hpp -- File manifest and chunk descriptors
// ============================================================

#include "platform.hpp"
#include "hash.hpp"
#include <string>
#include <vector>
#include <array>

using FileId = std::array<u8, 16>;

struct ChunkDescriptor {
    u32               index        = 0;
    u32               original_len = 0;
    u32               stored_len   = 0;
    hash::ContentHash hash{};
    bool              compressed   = false;
};

// A descriptor together with its stored bytes
struct PreparedChunk {
    ChunkDescriptor desc;
    std::vector<u8> payload;
};

struct FileManifest {
    FileId      file_id{};
    std::string name;
    u64         total_size = 0;
    u32         block_size = 0;
    std::vector<ChunkDescriptor> chunks;

    u32 chunk_count() const { return (u32)chunks.size(); }
};

// What a receiver is told about a file before any chunk
struct SessionFile {
    FileId      file_id{};
    std::string name;
    u64         total_size = 0;
};

// Number of blocks a file of total_size bytes splits into
inline u32 chunk_count_for(u64 total_size, u32 block_size) {
    if (total_size == 0 || block_size == 0) return 0;
    return (u32)((total_size + block_size - 1) / block_size);
}

// Expected original length of block `index`
inline u32 expected_block_len(u64 total_size, u32 block_size, u32 index) {
    u64 off = (u64)index * block_size;
    if (off >= total_size) return 0;
    u64 rem = total_size - off;
    return rem < block_size ? (u32)rem : block_size;
}

inline std::string file_id_hex(const FileId& id) {
    return utils::to_hex(id.data(), id.size());
}
