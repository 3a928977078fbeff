#pragma once

// ============================================================
// cli_options.hpp -- Flags shared by shr-send and shr-recv
// ============================================================

#include "platform.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "storage.hpp"
#include "directory_storage.hpp"
#include "http_storage.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace cli {

struct StorageOptions {
    std::string dir;
    std::string url;
};

enum class FlagResult {
    MATCHED,
    UNKNOWN,
    BAD_VALUE,
};

inline bool parse_u64(const char* s, u64& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (*end != '\0') return false;
    out = (u64)v;
    return true;
}

inline bool parse_u32(const char* s, u32& out) {
    u64 v = 0;
    if (!parse_u64(s, v) || v > 0xFFFFFFFFull) return false;
    out = (u32)v;
    return true;
}

inline void print_common_usage(std::ostream& os) {
    os << "\nStorage:\n"
       << "  --storage-dir D       directory (or shared mount) holding bundles\n"
       << "  --storage-url URL     HTTP fallback server, e.g. http://host:8000\n"
       << "\nTuning:\n"
       << "  --block-size N        block size in bytes (default: 4194304)\n"
       << "  --workers N           compression workers (default: CPU count)\n"
       << "  --window N            chunks in flight (default: 8)\n"
       << "  --connect-timeout MS  (default: 5000)\n"
       << "  --session-timeout MS  (default: 600000)\n"
       << "  --ack-timeout MS      (default: 10000)\n"
       << "  --max-retries N       resends per chunk before abandoning (default: 5)\n"
       << "  --backoff-base MS     (default: 200)\n"
       << "  --backoff-cap MS      (default: 10000)\n"
       << "  --jitter MS           (default: 100)\n"
       << "  --no-compress         send blocks uncompressed\n"
       << "  --spool-dir D         temp directory for bundles (default: system temp)\n"
       << "  --expiry S            bundle lifetime in seconds (default: 86400)\n"
       << "\nLogging:\n"
       << "  --log-level L         debug|info|warn|error (default: info)\n"
       << "  --verbose             same as --log-level debug\n"
       << "  --log-file F          also append log lines to F\n"
       << "  --error-log F         fatal transfer errors (default: transfer_errors.log)\n";
}

// Consume argv[i] (and its value) if it is a shared flag
inline FlagResult apply_flag(int argc, char* argv[], int& i, TransferConfig& cfg, StorageOptions& st) {
    const char* a = argv[i];
    auto value = [&]() -> const char* { return i + 1 < argc ? argv[++i] : nullptr; };
    auto num32 = [&](u32& field) {
        return parse_u32(value(), field) ? FlagResult::MATCHED : FlagResult::BAD_VALUE;
    };

    if (std::strcmp(a, "--storage-dir") == 0) {
        const char* v = value();
        if (!v) return FlagResult::BAD_VALUE;
        st.dir = v;
        return FlagResult::MATCHED;
    }
    if (std::strcmp(a, "--storage-url") == 0) {
        const char* v = value();
        if (!v) return FlagResult::BAD_VALUE;
        st.url = v;
        return FlagResult::MATCHED;
    }
    if (std::strcmp(a, "--block-size") == 0)      return num32(cfg.block_size);
    if (std::strcmp(a, "--workers") == 0)         return num32(cfg.workers);
    if (std::strcmp(a, "--window") == 0)          return num32(cfg.window);
    if (std::strcmp(a, "--connect-timeout") == 0) return num32(cfg.connect_timeout_ms);
    if (std::strcmp(a, "--session-timeout") == 0) return num32(cfg.session_timeout_ms);
    if (std::strcmp(a, "--ack-timeout") == 0)     return num32(cfg.ack_timeout_ms);
    if (std::strcmp(a, "--max-retries") == 0)     return num32(cfg.max_retries);
    if (std::strcmp(a, "--backoff-base") == 0)    return num32(cfg.backoff_base_ms);
    if (std::strcmp(a, "--backoff-cap") == 0)     return num32(cfg.backoff_cap_ms);
    if (std::strcmp(a, "--jitter") == 0)          return num32(cfg.jitter_ms);
    if (std::strcmp(a, "--no-compress") == 0) {
        cfg.compression = false;
        return FlagResult::MATCHED;
    }
    if (std::strcmp(a, "--spool-dir") == 0) {
        const char* v = value();
        if (!v) return FlagResult::BAD_VALUE;
        cfg.spool_dir = v;
        return FlagResult::MATCHED;
    }
    if (std::strcmp(a, "--expiry") == 0) {
        return parse_u64(value(), cfg.expiry_secs) ? FlagResult::MATCHED : FlagResult::BAD_VALUE;
    }
    if (std::strcmp(a, "--log-level") == 0) {
        const char* v = value();
        LogLevel lvl;
        if (!v || !Logger::parse_level(v, lvl)) return FlagResult::BAD_VALUE;
        Logger::get().set_level(lvl);
        return FlagResult::MATCHED;
    }
    if (std::strcmp(a, "--verbose") == 0) {
        Logger::get().set_level(LogLevel::DEBUG);
        return FlagResult::MATCHED;
    }
    if (std::strcmp(a, "--log-file") == 0) {
        const char* v = value();
        if (!v) return FlagResult::BAD_VALUE;
        Logger::get().set_log_file(v);
        return FlagResult::MATCHED;
    }
    if (std::strcmp(a, "--error-log") == 0) {
        const char* v = value();
        if (!v) return FlagResult::BAD_VALUE;
        Logger::get().set_transfer_error_file(v);
        return FlagResult::MATCHED;
    }
    return FlagResult::UNKNOWN;
}

// nullptr when neither --storage-dir nor --storage-url was given
inline std::unique_ptr<Storage> make_storage(const StorageOptions& st, const TransferConfig& cfg) {
    if (!st.url.empty()) return std::make_unique<HttpStorage>(st.url, cfg.expiry_secs);
    if (!st.dir.empty()) return std::make_unique<DirectoryStorage>(st.dir, cfg.expiry_secs);
    return nullptr;
}

// Without --max-age, cleanup keeps every bundle whose locator has not expired
inline u64 cleanup_max_age(const std::optional<u64>& requested, const TransferConfig& cfg) {
    return requested ? *requested : cfg.expiry_secs;
}

} // namespace cli
