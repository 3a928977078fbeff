#pragma once

// protocol.hpp -- Wire and bundle format definitions for shrlink

#include "platform.hpp"
#include <cstring>

// Session magic: "SHR1"
static constexpr u32 SHRLINK_MAGIC   = 0x53485231u;
static constexpr u8  SHRLINK_VERSION = 1;

// Bundle magic: "SHB1"
static constexpr u32 SHRLINK_BUNDLE_MAGIC   = 0x53484231u;
static constexpr u8  SHRLINK_BUNDLE_VERSION = 1;

// Largest frame payload accepted from the wire (block cap + chunk header)
static constexpr u32 MAX_PAYLOAD_LEN   = 64u * 1024u * 1024u + 64u;
static constexpr u32 MAX_NAME_LEN      = 4096u;
static constexpr u32 DEFAULT_BLOCK_SIZE = 4u * 1024u * 1024u;

// ---- Message Types (all prefixed MT_ to avoid Windows macro collisions) ----
enum class MsgType : u16 {
    MT_HELLO        = 0x0001,   // sender -> receiver: SessionHello + file name
    MT_HELLO_ACK    = 0x0002,   // receiver accepts the manifest header
    MT_HELLO_NACK   = 0x0003,   // receiver refuses: HelloNack + reason text

    MT_CHUNK        = 0x0031,   // ChunkFrameHdr + stored payload
    MT_ACK          = 0x0050,   // ChunkAck

    MT_SESSION_DONE = 0x0060,   // sender: every chunk acked
    MT_CANCEL       = 0x0061,   // sender: caller cancelled, no more chunks
    MT_ERROR_MSG    = 0x00FF,   // free-form text
};

// ---- Frame Header (8 bytes, big-endian on wire) ----
struct FrameHeader {
    u16 msg_type;
    u16 flags;
    u32 payload_len;
};
static_assert(sizeof(FrameHeader) == 8, "FrameHeader must be 8 bytes");

// ---- Hello flags ----
enum HelloFlags : u8 {
    HELLO_COMPRESSION = 0x01,   // sender may send zstd-compressed chunks
};

// ---- Hello refusal reasons ----
enum class NackReason : u32 {
    BAD_MAGIC     = 1,
    BAD_VERSION   = 2,
    BAD_MANIFEST  = 3,
    UNWANTED_FILE = 4,   // receiver is waiting for a different file id
    LOCAL_ERROR   = 5,
};

// ============================================================
// Packed structures (wire format, big-endian)
// ============================================================
#pragma pack(push, 1)

// SessionHello: 48 bytes fixed + name
struct SessionHello {
    u8  magic[4];
    u8  version;
    u8  flags;
    u8  pad[2];
    u32 block_size;
    u32 chunk_count;
    u64 total_size;
    u8  file_id[16];
    u16 name_len;
    u8  pad2[6];
};
static_assert(sizeof(SessionHello) == 48, "SessionHello size mismatch");

// HelloNack: 8 bytes fixed + reason text
struct HelloNack {
    u32 reason;
    u8  pad[4];
};
static_assert(sizeof(HelloNack) == 8, "HelloNack size mismatch");

// ChunkFrameHdr: 48 bytes fixed + stored payload
struct ChunkFrameHdr {
    u32 index;
    u32 original_len;
    u32 stored_len;
    u8  hash[32];        // SHA-256 of the original bytes
    u8  compressed;      // 0=raw, 1=zstd
    u8  pad[3];
};
static_assert(sizeof(ChunkFrameHdr) == 48, "ChunkFrameHdr size mismatch");

// ChunkAck: 8 bytes
struct ChunkAck {
    u32 index;
    u8  ok;
    u8  pad[3];
};
static_assert(sizeof(ChunkAck) == 8, "ChunkAck size mismatch");

// ---- Bundle (fallback upload) ----
//
// BundleHeader | name | BundleEntry[chunk_count] | u64 xxh3_64(all before)
// | payload[0] .. payload[chunk_count-1]

// BundleHeader: 56 bytes
struct BundleHeader {
    u8  magic[4];
    u8  version;
    u8  flags;
    u16 name_len;
    u8  file_id[16];
    u64 total_size;
    u32 block_size;
    u32 chunk_count;
    u8  file_digest[16];   // xxh3_128 over the original file
};
static_assert(sizeof(BundleHeader) == 56, "BundleHeader size mismatch");

// BundleEntry: 44 bytes
struct BundleEntry {
    u32 original_len;
    u32 stored_len;
    u8  hash[32];
    u8  compressed;
    u8  pad[3];
};
static_assert(sizeof(BundleEntry) == 44, "BundleEntry size mismatch");

#pragma pack(pop)

// ---- Inline helpers ----
inline void magic_init(u8 out[4], u32 magic) {
    out[0] = (u8)(magic >> 24);
    out[1] = (u8)(magic >> 16);
    out[2] = (u8)(magic >>  8);
    out[3] = (u8)(magic      );
}

inline bool magic_valid(const u8 in[4], u32 magic) {
    return in[0] == (u8)(magic >> 24) && in[1] == (u8)(magic >> 16) &&
           in[2] == (u8)(magic >>  8) && in[3] == (u8)(magic      );
}
