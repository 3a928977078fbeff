// ============================================================
// bundle.cpp -- Bundle manifest encode / decode
// ============================================================

#include "bundle.hpp"
#include "protocol.hpp"
#include "protocol_io.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include <cstring>

namespace bundle {

static void put(std::ostream& out, std::vector<u8>& mirror, const void* p, size_t n) {
    out.write((const char*)p, (std::streamsize)n);
    mirror.insert(mirror.end(), (const u8*)p, (const u8*)p + n);
}

u64 write_manifest(std::ostream& out, const FileManifest& file, const hash::Hash128& digest) {
    std::vector<u8> bytes;
    bytes.reserve(sizeof(BundleHeader) + file.name.size() +
                  file.chunks.size() * sizeof(BundleEntry) + 8);

    BundleHeader h{};
    magic_init(h.magic, SHRLINK_BUNDLE_MAGIC);
    h.version     = SHRLINK_BUNDLE_VERSION;
    h.name_len    = (u16)file.name.size();
    std::memcpy(h.file_id, file.file_id.data(), 16);
    h.total_size  = file.total_size;
    h.block_size  = file.block_size;
    h.chunk_count = file.chunk_count();
    std::memcpy(h.file_digest, digest.data(), 16);
    proto::encode_bundle_header(h);
    put(out, bytes, &h, sizeof(h));
    put(out, bytes, file.name.data(), file.name.size());

    for (const auto& c : file.chunks) {
        BundleEntry e{};
        e.original_len = c.original_len;
        e.stored_len   = c.stored_len;
        std::memcpy(e.hash, c.hash.data(), c.hash.size());
        e.compressed   = c.compressed ? 1 : 0;
        proto::encode_bundle_entry(e);
        put(out, bytes, &e, sizeof(e));
    }

    u64 sum = proto::hton64(hash::xxh3_64(bytes.data(), bytes.size()));
    out.write((const char*)&sum, sizeof(sum));
    if (!out) {
        throw TransferError(ErrorKind::IO_FAILURE, "failed to write bundle manifest");
    }
    return bytes.size() + sizeof(sum);
}

static void take(std::istream& in, std::vector<u8>& mirror, void* p, size_t n, const char* what) {
    in.read((char*)p, (std::streamsize)n);
    if ((size_t)in.gcount() != n) {
        throw TransferError(ErrorKind::PROTOCOL_FAILURE, std::string("bundle truncated in ") + what);
    }
    mirror.insert(mirror.end(), (const u8*)p, (const u8*)p + n);
}

BundleManifest read_manifest(std::istream& in, u64 bundle_size) {
    std::vector<u8> bytes;
    BundleManifest m;

    BundleHeader h;
    take(in, bytes, &h, sizeof(h), "header");
    if (!magic_valid(h.magic, SHRLINK_BUNDLE_MAGIC)) {
        throw TransferError(ErrorKind::PROTOCOL_FAILURE, "not a shrlink bundle (bad magic)");
    }
    if (h.version != SHRLINK_BUNDLE_VERSION) {
        throw TransferError(ErrorKind::PROTOCOL_FAILURE,
                            "unsupported bundle version " + std::to_string(h.version));
    }
    proto::decode_bundle_header(h);

    if (h.name_len == 0 || h.name_len > MAX_NAME_LEN) {
        throw TransferError(ErrorKind::PROTOCOL_FAILURE, "bad name length " + std::to_string(h.name_len));
    }
    if (h.block_size < TransferConfig::MIN_BLOCK_SIZE || h.block_size > TransferConfig::MAX_BLOCK_SIZE) {
        throw TransferError(ErrorKind::PROTOCOL_FAILURE, "bad block size " + std::to_string(h.block_size));
    }
    if (h.chunk_count != chunk_count_for(h.total_size, h.block_size)) {
        throw TransferError(ErrorKind::PROTOCOL_FAILURE,
                            "chunk count " + std::to_string(h.chunk_count) + " does not match size " +
                            std::to_string(h.total_size));
    }
    u64 fixed = sizeof(BundleHeader) + h.name_len + (u64)h.chunk_count * sizeof(BundleEntry) + 8;
    if (fixed > bundle_size) {
        throw TransferError(ErrorKind::PROTOCOL_FAILURE, "manifest larger than bundle");
    }

    std::string name(h.name_len, '\0');
    take(in, bytes, &name[0], name.size(), "name");
    m.file.name = file_io::sanitize_name(name);

    std::memcpy(m.file.file_id.data(), h.file_id, 16);
    std::memcpy(m.digest.data(), h.file_digest, 16);
    m.file.total_size = h.total_size;
    m.file.block_size = h.block_size;
    m.file.chunks.reserve(h.chunk_count);

    for (u32 i = 0; i < h.chunk_count; ++i) {
        BundleEntry e;
        take(in, bytes, &e, sizeof(e), "chunk table");
        proto::decode_bundle_entry(e);
        ChunkDescriptor d;
        d.index        = i;
        d.original_len = e.original_len;
        d.stored_len   = e.stored_len;
        std::memcpy(d.hash.data(), e.hash, d.hash.size());
        d.compressed   = e.compressed != 0;
        m.file.chunks.push_back(d);
    }

    u64 stored_sum;
    in.read((char*)&stored_sum, sizeof(stored_sum));
    if (in.gcount() != (std::streamsize)sizeof(stored_sum)) {
        throw TransferError(ErrorKind::PROTOCOL_FAILURE, "bundle truncated in checksum");
    }
    if (proto::ntoh64(stored_sum) != hash::xxh3_64(bytes.data(), bytes.size())) {
        throw TransferError(ErrorKind::PROTOCOL_FAILURE, "bundle manifest checksum mismatch");
    }

    for (const auto& d : m.file.chunks) {
        u32 expected = expected_block_len(h.total_size, h.block_size, d.index);
        if (d.original_len != expected || d.stored_len > MAX_PAYLOAD_LEN ||
            (!d.compressed && d.stored_len != d.original_len)) {
            throw TransferError(ErrorKind::PROTOCOL_FAILURE,
                                "bad lengths for chunk " + std::to_string(d.index));
        }
    }

    m.manifest_len = bytes.size() + sizeof(stored_sum);
    if (m.manifest_len + m.payload_bytes() != bundle_size) {
        throw TransferError(ErrorKind::PROTOCOL_FAILURE,
                            "bundle is " + std::to_string(bundle_size) + " bytes, manifest describes " +
                            std::to_string(m.manifest_len + m.payload_bytes()));
    }
    return m;
}

} // namespace bundle
