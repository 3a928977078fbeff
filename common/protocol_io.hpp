#pragma once

// ============================================================
// protocol_io.hpp -- Byte-order handling for wire structs
// ============================================================

#include "protocol.hpp"
#include <vector>
#include <stdexcept>

#include <endian.h>

namespace proto {

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) { return htobe16(v); }
inline u32 hton32(u32 v) { return htobe32(v); }
inline u64 hton64(u64 v) { return htobe64(v); }
inline u16 ntoh16(u16 v) { return be16toh(v); }
inline u32 ntoh32(u32 v) { return be32toh(v); }
inline u64 ntoh64(u64 v) { return be64toh(v); }

// ---- Serialise / deserialise FrameHeader ----

inline void encode_header(const FrameHeader& h, u8 buf[8]) {
    u16 mt = hton16(h.msg_type);
    u16 fl = hton16(h.flags);
    u32 pl = hton32(h.payload_len);
    std::memcpy(buf,     &mt, 2);
    std::memcpy(buf + 2, &fl, 2);
    std::memcpy(buf + 4, &pl, 4);
}

inline FrameHeader decode_header(const u8 buf[8]) {
    FrameHeader h;
    u16 mt, fl; u32 pl;
    std::memcpy(&mt, buf,     2);
    std::memcpy(&fl, buf + 2, 2);
    std::memcpy(&pl, buf + 4, 4);
    h.msg_type    = ntoh16(mt);
    h.flags       = ntoh16(fl);
    h.payload_len = ntoh32(pl);
    return h;
}

// ---- Encode individual struct fields (in-place, host->network) ----

inline void encode_hello(SessionHello& h) {
    h.block_size  = hton32(h.block_size);
    h.chunk_count = hton32(h.chunk_count);
    h.total_size  = hton64(h.total_size);
    h.name_len    = hton16(h.name_len);
}

inline void decode_hello(SessionHello& h) {
    h.block_size  = ntoh32(h.block_size);
    h.chunk_count = ntoh32(h.chunk_count);
    h.total_size  = ntoh64(h.total_size);
    h.name_len    = ntoh16(h.name_len);
}

inline void encode_hello_nack(HelloNack& n) { n.reason = hton32(n.reason); }
inline void decode_hello_nack(HelloNack& n) { n.reason = ntoh32(n.reason); }

inline void encode_chunk_hdr(ChunkFrameHdr& c) {
    c.index        = hton32(c.index);
    c.original_len = hton32(c.original_len);
    c.stored_len   = hton32(c.stored_len);
}

inline void decode_chunk_hdr(ChunkFrameHdr& c) {
    c.index        = ntoh32(c.index);
    c.original_len = ntoh32(c.original_len);
    c.stored_len   = ntoh32(c.stored_len);
}

inline void encode_ack(ChunkAck& a) { a.index = hton32(a.index); }
inline void decode_ack(ChunkAck& a) { a.index = ntoh32(a.index); }

inline void encode_bundle_header(BundleHeader& b) {
    b.name_len    = hton16(b.name_len);
    b.total_size  = hton64(b.total_size);
    b.block_size  = hton32(b.block_size);
    b.chunk_count = hton32(b.chunk_count);
}

inline void decode_bundle_header(BundleHeader& b) {
    b.name_len    = ntoh16(b.name_len);
    b.total_size  = ntoh64(b.total_size);
    b.block_size  = ntoh32(b.block_size);
    b.chunk_count = ntoh32(b.chunk_count);
}

inline void encode_bundle_entry(BundleEntry& e) {
    e.original_len = hton32(e.original_len);
    e.stored_len   = hton32(e.stored_len);
}

inline void decode_bundle_entry(BundleEntry& e) {
    e.original_len = ntoh32(e.original_len);
    e.stored_len   = ntoh32(e.stored_len);
}

// Copy a fixed struct out of a received payload. Throws if the payload is short.
template<typename T>
inline T read_struct(const std::vector<u8>& payload, size_t offset = 0) {
    if (payload.size() < offset + sizeof(T)) {
        throw std::runtime_error("Truncated payload: need " + std::to_string(offset + sizeof(T)) +
                                 " bytes, have " + std::to_string(payload.size()));
    }
    T out;
    std::memcpy(&out, payload.data() + offset, sizeof(T));
    return out;
}

} // namespace proto
