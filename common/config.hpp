#pragma once

// ============================================================
// config.hpp -- Transfer tuning, passed into each component
// ============================================================

#include "platform.hpp"
#include <string>
#include <thread>
#include <stdexcept>
#include <filesystem>

struct TransferConfig {
    u32  block_size        = 4u * 1024u * 1024u;
    u32  workers           = 0;        // 0 = hardware concurrency
    u32  window            = 8;        // max chunks Sent-and-unacked
    u32  connect_timeout_ms = 5000;
    u32  session_timeout_ms = 600000;
    u32  ack_timeout_ms    = 10000;
    u32  max_retries       = 5;
    u32  backoff_base_ms   = 200;
    u32  backoff_cap_ms    = 10000;
    u32  jitter_ms         = 100;
    bool compression       = true;
    std::string spool_dir;             // empty = system temp directory
    u64  expiry_secs       = 86400;    // fallback bundle lifetime

    static constexpr u32 MIN_BLOCK_SIZE = 4u * 1024u;
    static constexpr u32 MAX_BLOCK_SIZE = 64u * 1024u * 1024u;

    u32 effective_workers() const {
        if (workers != 0) return workers;
        unsigned hw = std::thread::hardware_concurrency();
        if (hw == 0) hw = 1;
        return hw > 256 ? 256u : (u32)hw;
    }

    std::string effective_spool_dir() const {
        if (!spool_dir.empty()) return spool_dir;
        return std::filesystem::temp_directory_path().string();
    }

    // Throws std::invalid_argument naming the first offending field
    void validate() const {
        if (block_size < MIN_BLOCK_SIZE || block_size > MAX_BLOCK_SIZE) {
            throw std::invalid_argument("block_size must be between 4 KiB and 64 MiB, got " +
                                        std::to_string(block_size));
        }
        if (window < 1 || window > 1024) {
            throw std::invalid_argument("window must be between 1 and 1024, got " +
                                        std::to_string(window));
        }
        if (workers > 256) {
            throw std::invalid_argument("workers must be between 1 and 256, got " +
                                        std::to_string(workers));
        }
        if (connect_timeout_ms == 0) throw std::invalid_argument("connect_timeout_ms must be positive");
        if (session_timeout_ms == 0) throw std::invalid_argument("session_timeout_ms must be positive");
        if (ack_timeout_ms == 0)     throw std::invalid_argument("ack_timeout_ms must be positive");
        if (connect_timeout_ms > session_timeout_ms) {
            throw std::invalid_argument("connect_timeout_ms must not exceed session_timeout_ms");
        }
        if (backoff_base_ms == 0)    throw std::invalid_argument("backoff_base_ms must be positive");
        if (backoff_cap_ms < backoff_base_ms) {
            throw std::invalid_argument("backoff_cap_ms must not be below backoff_base_ms");
        }
        if (expiry_secs == 0) throw std::invalid_argument("expiry_secs must be positive");
    }
};
