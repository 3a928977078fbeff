// ============================================================
// fallback_coordinator.cpp -- FallbackCoordinator implementation
// ============================================================

#include "fallback_coordinator.hpp"
#include "bundle.hpp"
#include "file_io.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <fstream>
#include <vector>

static constexpr size_t COPY_BUF = 1024 * 1024;

static void append_payload(std::ofstream& out, const PreparedChunk& c) {
    out.write((const char*)c.payload.data(), (std::streamsize)c.payload.size());
    if (!out) {
        throw TransferError(ErrorKind::IO_FAILURE,
                            "spool write failed at chunk " + std::to_string(c.desc.index));
    }
}

FallbackResult FallbackCoordinator::publish(const SessionFile& file, std::vector<PreparedChunk> pulled,
                                            ChunkSource& source) {
    u64 start = utils::steady_ms();
    std::string spool_dir = cfg_.effective_spool_dir();

    FileManifest m;
    m.file_id    = file.file_id;
    m.name       = file.name;
    m.total_size = file.total_size;
    m.block_size = source.block_size();

    // ---- Payloads to a spool, descriptors kept in memory ----
    file_io::SpoolFile payloads(spool_dir, "shr-payload");
    u64 payload_bytes = 0;
    u64 original_sum  = 0;
    {
        std::ofstream out = payloads.open_write();
        auto add = [&](const PreparedChunk& c) {
            if (c.desc.index != m.chunks.size()) {
                throw TransferError(ErrorKind::IO_FAILURE,
                                    "chunk " + std::to_string(c.desc.index) + " out of order, expected " +
                                    std::to_string(m.chunks.size()));
            }
            append_payload(out, c);
            m.chunks.push_back(c.desc);
            payload_bytes += c.payload.size();
            original_sum  += c.desc.original_len;
        };
        for (const auto& c : pulled) add(c);
        pulled.clear();
        while (auto c = source.next()) add(*c);
        out.close();
        if (!out) {
            throw TransferError(ErrorKind::IO_FAILURE, "cannot flush " + payloads.path().string());
        }
    }

    if (original_sum != m.total_size || m.chunk_count() != chunk_count_for(m.total_size, m.block_size)) {
        throw TransferError(ErrorKind::IO_FAILURE,
                            "source produced " + std::to_string(original_sum) + " bytes in " +
                            std::to_string(m.chunk_count()) + " chunks, expected " +
                            std::to_string(m.total_size));
    }
    hash::Hash128 digest = source.file_digest();

    // ---- Bundle = manifest + payload spool ----
    file_io::SpoolFile bundle_file(spool_dir, "shr-bundle");
    u64 bundle_size = 0;
    {
        std::ofstream out = bundle_file.open_write();
        bundle_size = bundle::write_manifest(out, m, digest);
        std::ifstream in = payloads.open_read();
        std::vector<char> buf(COPY_BUF);
        while (in) {
            in.read(buf.data(), (std::streamsize)buf.size());
            std::streamsize got = in.gcount();
            if (got <= 0) break;
            out.write(buf.data(), got);
            bundle_size += (u64)got;
        }
        out.close();
        if (in.bad() || !out) {
            throw TransferError(ErrorKind::IO_FAILURE, "cannot assemble bundle " + bundle_file.path().string());
        }
    }

    LOG_INFO("Uploading bundle for " + file.name + " (" + utils::format_bytes(bundle_size) + ", " +
             std::to_string(m.chunk_count()) + " chunks, " + utils::format_bytes(payload_bytes) +
             " payload) to " + storage_.describe());

    std::ifstream in = bundle_file.open_read();
    UploadReceipt receipt = storage_.upload(in, bundle_size, bundle::object_name(file.file_id));

    FallbackResult r;
    r.locator         = receipt.locator;
    r.expires_at_unix = receipt.expires_at_unix;
    r.bundle_size     = bundle_size;
    r.chunk_count     = m.chunk_count();
    LOG_INFO("Bundle stored at " + r.locator + " in " +
             utils::format_duration_ms(utils::steady_ms() - start));
    return r;
}

FetchResult FallbackCoordinator::fetch(const std::string& locator, const ReceiveTarget& target) {
    u64 start = utils::steady_ms();
    file_io::SpoolFile spool(cfg_.effective_spool_dir(), "shr-fetch");
    {
        std::ofstream out = spool.open_write();
        storage_.download(locator, out);
        out.close();
        if (!out) {
            throw TransferError(ErrorKind::IO_FAILURE, "cannot write " + spool.path().string());
        }
    }

    u64 size = file_io::get_file_size(spool.path().string());
    std::ifstream in = spool.open_read();
    bundle::BundleManifest bm = bundle::read_manifest(in, size);

    FetchResult res;
    res.file_id    = bm.file.file_id;
    res.name       = bm.file.name;
    res.total_size = bm.file.total_size;
    res.chunks     = bm.file.chunk_count();

    ChunkSink sink(target.resolve(bm.file.name), bm.file.total_size, bm.file.block_size);
    std::vector<u8> payload;
    for (const auto& d : bm.file.chunks) {
        payload.resize(d.stored_len);
        in.read((char*)payload.data(), (std::streamsize)d.stored_len);
        if ((u64)in.gcount() != d.stored_len) {
            throw TransferError(ErrorKind::PROTOCOL_FAILURE,
                                "bundle truncated in payload " + std::to_string(d.index));
        }
        if (!sink.on_chunk(d, payload.data(), payload.size())) {
            throw TransferError(ErrorKind::INTEGRITY_FAILURE,
                                "chunk " + std::to_string(d.index) + " failed verification");
        }
    }
    res.path = sink.finish(&bm.digest);

    LOG_INFO("Fetched " + res.name + " (" + utils::format_bytes(res.total_size) + ") from " + locator +
             " into " + res.path.string() + " in " + utils::format_duration_ms(utils::steady_ms() - start));
    return res;
}
