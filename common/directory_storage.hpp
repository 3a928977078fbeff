#pragma once

// ============================================================
// directory_storage.hpp -- Storage backed by a directory
//
// Bundles are plain files under root (local disk or a shared mount);
// locators are file:// URLs. Age is judged by modification time.
// ============================================================

#include "storage.hpp"
#include <filesystem>

class DirectoryStorage : public Storage {
public:
    DirectoryStorage(std::filesystem::path root, u64 expiry_secs);

    UploadReceipt upload(std::istream& data, u64 size, const std::string& name_hint) override;
    void download(const std::string& locator, std::ostream& out) override;
    u64 cleanup(u64 max_age_secs) override;
    StorageStats stats() override;
    std::string describe() const override { return "dir:" + root_.string(); }

    static std::string to_locator(const std::filesystem::path& p);
    static std::filesystem::path from_locator(const std::string& locator);

private:
    std::filesystem::path root_;
    u64                   expiry_secs_;
};
