// ============================================================
// file_io.cpp -- Output files, spool files and path safety (POSIX)
// ============================================================

#include "file_io.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <cstring>
#include <system_error>
#include <cstdlib>

#include <sys/mman.h>
#include <sys/stat.h>

using namespace file_io;

// ============================================================
// MmapWriter
// ============================================================

MmapWriter::~MmapWriter() {
    close();
}

void MmapWriter::open(const std::string& file_path, u64 size) {
    close();
    path_ = file_path;
    size_ = size;

    ensure_parent_dirs(file_path);

    fd_ = ::open(file_path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
    if (fd_ < 0) {
        throw TransferError(ErrorKind::IO_FAILURE,
                            "Cannot create file: " + file_path + ": " + strerror(errno));
    }
    if (size == 0) {
        data_ = nullptr;
        return;
    }
    int rc = posix_fallocate(fd_, 0, (off_t)size);
    if (rc != 0 && ftruncate(fd_, (off_t)size) != 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw TransferError(ErrorKind::IO_FAILURE,
                            "Cannot size file: " + file_path + ": " + strerror(err));
    }
    void* p = mmap(nullptr, (size_t)size, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        ::close(fd_);
        fd_ = -1;
        throw TransferError(ErrorKind::IO_FAILURE, "mmap(write) failed: " + path_);
    }
    data_ = static_cast<char*>(p);
}

void MmapWriter::write_at(u64 offset, const void* data, size_t len) {
    if (len == 0) return;
    if (!data_ || offset + len > size_) {
        throw TransferError(ErrorKind::IO_FAILURE,
                            "write of " + std::to_string(len) + " bytes at " +
                            std::to_string(offset) + " outside " + path_);
    }
    std::memcpy(data_ + offset, data, len);
}

bool MmapWriter::close() {
    bool ok = true;
    if (data_ && size_ > 0) {
        if (msync(data_, (size_t)size_, MS_SYNC) != 0) ok = false;
        munmap(data_, (size_t)size_);
        data_ = nullptr;
    }
    if (fd_ >= 0) {
        if (::close(fd_) != 0) ok = false;
        fd_ = -1;
    }
    size_ = 0;
    return ok;
}

// ============================================================
// SpoolFile
// ============================================================

SpoolFile::SpoolFile(const std::string& dir, const std::string& prefix) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    std::string tmpl = (fs::path(dir) / (prefix + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        throw TransferError(ErrorKind::IO_FAILURE,
                            "Cannot create spool file in " + dir + ": " + strerror(errno));
    }
    ::close(fd);
    path_ = fs::path(buf.data());
}

SpoolFile::~SpoolFile() {
    std::error_code ec;
    fs::remove(path_, ec);
}

std::ofstream SpoolFile::open_write() const {
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out) throw TransferError(ErrorKind::IO_FAILURE, "Cannot write spool file " + path_.string());
    return out;
}

std::ifstream SpoolFile::open_read() const {
    std::ifstream in(path_, std::ios::binary);
    if (!in) throw TransferError(ErrorKind::IO_FAILURE, "Cannot read spool file " + path_.string());
    return in;
}

// ============================================================
// Utility functions
// ============================================================

std::string file_io::sanitize_name(const std::string& name) {
    if (name.empty()) {
        throw TransferError(ErrorKind::PROTOCOL_FAILURE, "Empty file name");
    }
    if (name == "." || name == "..") {
        throw TransferError(ErrorKind::PROTOCOL_FAILURE, "Path traversal rejected: " + name);
    }
    for (char c : name) {
        if (c == '/' || c == '\\') {
            throw TransferError(ErrorKind::PROTOCOL_FAILURE, "Path separator rejected: " + name);
        }
        if (c == '\0') {
            throw TransferError(ErrorKind::PROTOCOL_FAILURE, "NUL byte in file name");
        }
    }
    return name;
}

fs::path file_io::safe_join(const fs::path& root_dir, const std::string& name) {
    return root_dir / sanitize_name(name);
}

fs::path file_io::part_path(const fs::path& final_path) {
    fs::path p = final_path;
    p += ".part";
    return p;
}

void file_io::publish(const fs::path& part, const fs::path& final_path) {
    std::error_code ec;
    fs::rename(part, final_path, ec);
    if (ec) {
        throw TransferError(ErrorKind::IO_FAILURE,
                            "Cannot move " + part.string() + " to " + final_path.string() +
                            ": " + ec.message());
    }
}

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw TransferError(ErrorKind::IO_FAILURE,
                                "Cannot create " + parent.string() + ": " + ec.message());
        }
    }
}

u64 file_io::get_file_size(const std::string& path) {
    std::error_code ec;
    auto sz = fs::file_size(path, ec);
    if (ec) {
        throw TransferError(ErrorKind::IO_FAILURE, "Cannot stat " + path + ": " + ec.message());
    }
    return (u64)sz;
}
