// ============================================================
// directory_storage.cpp -- DirectoryStorage implementation
// ============================================================

#include "directory_storage.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include "file_io.hpp"
#include "locator.hpp"
#include <fstream>
#include <chrono>
#include <system_error>
#include <vector>

static constexpr const char* BUNDLE_EXT = ".shr";
static constexpr size_t COPY_BUF = 256 * 1024;

DirectoryStorage::DirectoryStorage(std::filesystem::path root, u64 expiry_secs)
    : root_(std::move(root))
    , expiry_secs_(expiry_secs)
{
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec || !fs::is_directory(root_)) {
        throw TransferError(ErrorKind::STORAGE_FAILURE,
                            "cannot use storage directory " + root_.string() +
                            (ec ? ": " + ec.message() : ""));
    }
    root_ = fs::absolute(root_);
}

std::string DirectoryStorage::to_locator(const std::filesystem::path& p) {
    return "file://" + fs::absolute(p).string();
}

std::filesystem::path DirectoryStorage::from_locator(const std::string& loc) {
    if (!locator::is_file_url(loc)) {
        throw TransferError(ErrorKind::STORAGE_FAILURE, "not a file:// locator: " + loc);
    }
    std::string p = loc.substr(7);
    if (p.empty() || p[0] != '/') {
        throw TransferError(ErrorKind::STORAGE_FAILURE, "file:// locator must be absolute: " + loc);
    }
    return fs::path(p);
}

UploadReceipt DirectoryStorage::upload(std::istream& data, u64 size, const std::string& name_hint) {
    std::string name;
    try {
        name = file_io::sanitize_name(name_hint);
    } catch (const TransferError& e) {
        throw TransferError(ErrorKind::STORAGE_FAILURE, e.what());
    }
    fs::path final_path = root_ / name;
    fs::path tmp_path   = file_io::part_path(final_path);

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw TransferError(ErrorKind::STORAGE_FAILURE, "cannot create " + tmp_path.string());
        }
        std::vector<char> buf(COPY_BUF);
        u64 left = size;
        while (left > 0) {
            size_t want = left < buf.size() ? (size_t)left : buf.size();
            data.read(buf.data(), (std::streamsize)want);
            size_t got = (size_t)data.gcount();
            if (got == 0) break;
            out.write(buf.data(), (std::streamsize)got);
            left -= got;
        }
        out.flush();
        if (left != 0 || !out) {
            out.close();
            std::error_code ec;
            fs::remove(tmp_path, ec);
            throw TransferError(ErrorKind::STORAGE_FAILURE,
                                left != 0 ? "upload source ended " + std::to_string(left) + " bytes short"
                                          : "write failed for " + tmp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, final_path, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        throw TransferError(ErrorKind::STORAGE_FAILURE,
                            "cannot publish " + final_path.string() + ": " + ec.message());
    }

    UploadReceipt r;
    r.locator         = to_locator(final_path);
    r.expires_at_unix = utils::now_unix() + expiry_secs_;
    LOG_DEBUG("Stored " + utils::format_bytes(size) + " at " + r.locator);
    return r;
}

void DirectoryStorage::download(const std::string& loc, std::ostream& out) {
    fs::path p = from_locator(loc);
    std::ifstream in(p, std::ios::binary);
    if (!in) {
        throw TransferError(ErrorKind::STORAGE_FAILURE, "cannot open " + p.string());
    }
    std::vector<char> buf(COPY_BUF);
    while (in) {
        in.read(buf.data(), (std::streamsize)buf.size());
        std::streamsize got = in.gcount();
        if (got <= 0) break;
        out.write(buf.data(), got);
        if (!out) {
            throw TransferError(ErrorKind::STORAGE_FAILURE, "write failed while downloading " + loc);
        }
    }
    if (in.bad()) {
        throw TransferError(ErrorKind::STORAGE_FAILURE, "read failed for " + p.string());
    }
}

u64 DirectoryStorage::cleanup(u64 max_age_secs) {
    auto now = fs::file_time_type::clock::now();
    u64 deleted = 0;
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        throw TransferError(ErrorKind::STORAGE_FAILURE, "cannot list " + root_.string() + ": " + ec.message());
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != BUNDLE_EXT) continue;
        auto mtime = entry.last_write_time(ec);
        if (ec) continue;
        auto age = std::chrono::duration_cast<std::chrono::seconds>(now - mtime).count();
        if (age > (long long)max_age_secs) {
            if (fs::remove(entry.path(), ec)) {
                ++deleted;
                LOG_DEBUG("Expired " + entry.path().string());
            } else if (ec) {
                LOG_WARN("Cannot remove " + entry.path().string() + ": " + ec.message());
            }
        }
    }
    return deleted;
}

StorageStats DirectoryStorage::stats() {
    StorageStats s;
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        throw TransferError(ErrorKind::STORAGE_FAILURE, "cannot list " + root_.string() + ": " + ec.message());
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != BUNDLE_EXT) continue;
        u64 sz = entry.file_size(ec);
        if (ec) continue;
        ++s.file_count;
        s.total_bytes += sz;
    }
    return s;
}
