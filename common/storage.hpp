#pragma once

// ============================================================
// storage.hpp -- Intermediary storage collaborator
//
// Every operation throws TransferError(STORAGE_FAILURE) on failure.
// ============================================================

#include "platform.hpp"
#include <istream>
#include <ostream>
#include <string>

struct UploadReceipt {
    std::string locator;
    u64         expires_at_unix = 0;
};

struct StorageStats {
    u64 file_count  = 0;
    u64 total_bytes = 0;
};

class Storage {
public:
    virtual ~Storage() = default;

    // Store `size` bytes read from `data` as one object. name_hint is a
    // suggested object name ("<id>.shr"); the provider may pick another.
    virtual UploadReceipt upload(std::istream& data, u64 size, const std::string& name_hint) = 0;

    // Stream the object behind `locator` into `out`
    virtual void download(const std::string& locator, std::ostream& out) = 0;

    // Delete objects older than max_age_secs; returns how many
    virtual u64 cleanup(u64 max_age_secs) = 0;

    virtual StorageStats stats() = 0;

    virtual std::string describe() const = 0;
};
