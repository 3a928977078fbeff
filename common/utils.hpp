#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <iomanip>
#include <random>
#include <array>

namespace utils {

// Wall-clock time in milliseconds since epoch
inline u64 now_ms() {
    using namespace std::chrono;
    return (u64)duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

// Wall-clock seconds since epoch (used for expiry stamps)
inline u64 now_unix() {
    return now_ms() / 1000;
}

// Monotonic milliseconds; deadlines and backoff are computed on this clock
inline u64 steady_ms() {
    using namespace std::chrono;
    return (u64)duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()
    ).count();
}

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    }
    static const char* const units[] = {"KB", "MB", "GB", "TB"};
    double v = (double)bytes / 1024.0;
    int u = 0;
    while (v >= 1024.0 && u < 3) {
        v /= 1024.0;
        ++u;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << v << " " << units[u];
    return ss.str();
}

// Format speed as "X.XX MB/s"
inline std::string format_speed(double bytes_per_sec) {
    if (bytes_per_sec < 1024.0) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << bytes_per_sec << " B/s";
        return ss.str();
    }
    return format_bytes((u64)bytes_per_sec) + "/s";
}

// Format milliseconds as "1m 02.345s" or "2.345s"
inline std::string format_duration_ms(u64 ms) {
    std::ostringstream ss;
    u64 s = ms / 1000;
    if (s >= 60) {
        ss << (s / 60) << "m ";
        s %= 60;
        ss << std::setfill('0') << std::setw(2);
    }
    ss << s << '.' << std::setfill('0') << std::setw(3) << (ms % 1000) << 's';
    return ss.str();
}

// Validate port number (1-65535)
inline bool validate_port(int port) {
    return port >= 1 && port <= 65535;
}

// Validate that a path is non-empty and doesn't contain null bytes
inline bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    for (char c : path) {
        if (c == '\0') return false;
    }
    return true;
}

// Split "host:port". The last ':' separates the port so bracket-less IPv6
// is not supported. Returns false on a malformed or out-of-range port.
inline bool split_host_port(const std::string& s, std::string& host, int& port) {
    auto pos = s.rfind(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 >= s.size()) return false;
    std::string p = s.substr(pos + 1);
    for (char c : p) {
        if (c < '0' || c > '9') return false;
    }
    if (p.size() > 5) return false;
    port = std::atoi(p.c_str());
    if (!validate_port(port)) return false;
    host = s.substr(0, pos);
    return true;
}

// Lowercase hex of a byte range
inline std::string to_hex(const u8* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

// Parse hex into exactly out_len bytes. Accepts upper and lower case.
inline bool from_hex(const std::string& hex, u8* out, size_t out_len) {
    if (hex.size() != out_len * 2) return false;
    auto nib = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    for (size_t i = 0; i < out_len; ++i) {
        int hi = nib(hex[2 * i]);
        int lo = nib(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        out[i] = (u8)((hi << 4) | lo);
    }
    return true;
}

// Random 128-bit identifier for a file being sent
inline std::array<u8, 16> generate_file_id() {
    static thread_local std::mt19937_64 rng(
        ((u64)std::random_device{}() << 32) ^ (u64)std::random_device{}() ^
        (u64)std::chrono::high_resolution_clock::now().time_since_epoch().count());
    std::array<u8, 16> id{};
    u64 a = rng(), b = rng();
    for (int i = 0; i < 8; ++i) {
        id[i]     = (u8)(a >> (56 - 8 * i));
        id[8 + i] = (u8)(b >> (56 - 8 * i));
    }
    return id;
}

} // namespace utils
