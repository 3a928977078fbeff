#pragma once

// ============================================================
// file_io.hpp -- Output files, spool files and path safety
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <fstream>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- MmapWriter: positional writes into a preallocated file ----
class MmapWriter {
public:
    MmapWriter() = default;
    ~MmapWriter();

    MmapWriter(const MmapWriter&) = delete;
    MmapWriter& operator=(const MmapWriter&) = delete;

    // Create/truncate file, preallocate to size, then mmap.
    // Throws TransferError(IO_FAILURE).
    void open(const std::string& path, u64 size);

    // Write data at given offset; throws if the range is out of bounds
    void write_at(u64 offset, const void* data, size_t len);

    // msync + unmap + close. Returns false if the flush failed.
    bool close();

    bool is_open() const { return fd_ >= 0; }
    u64 size() const { return size_; }
    const std::string& path() const { return path_; }

private:
    char*       data_{nullptr};
    u64         size_{0};
    int         fd_{-1};
    std::string path_;
};

// ---- SpoolFile: temp file removed on destruction ----
class SpoolFile {
public:
    // Creates a uniquely named empty file in dir
    SpoolFile(const std::string& dir, const std::string& prefix);
    ~SpoolFile();

    SpoolFile(const SpoolFile&) = delete;
    SpoolFile& operator=(const SpoolFile&) = delete;

    const fs::path& path() const { return path_; }

    // Open for writing (truncating) / reading
    std::ofstream open_write() const;
    std::ifstream open_read() const;

private:
    fs::path path_;
};

// ---- Utility functions ----

// Validate a file name received from a peer or bundle: a single path
// component, no separators, no "." / "..", no NUL. Throws
// TransferError(PROTOCOL_FAILURE) if unsafe.
std::string sanitize_name(const std::string& name);

// root_dir / sanitize_name(name)
fs::path safe_join(const fs::path& root_dir, const std::string& name);

// Temp sibling of the final output path
fs::path part_path(const fs::path& final_path);

// Atomically rename part into place. Throws TransferError(IO_FAILURE).
void publish(const fs::path& part, const fs::path& final_path);

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Get file size in bytes; throws TransferError(IO_FAILURE) if missing
u64 get_file_size(const std::string& path);

} // namespace file_io
