// ============================================================
// send_agent.cpp -- SendAgent implementation
// ============================================================

#include "send_agent.hpp"
#include "../common/chunk_source.hpp"
#include "../common/fallback_coordinator.hpp"
#include "../common/locator.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <fstream>

const char* to_string(SendOutcome o) {
    switch (o) {
        case SendOutcome::PEER:      return "peer";
        case SendOutcome::FALLBACK:  return "fallback";
        case SendOutcome::CANCELLED: return "cancelled";
    }
    return "?";
}

// Clears the running-session pointer however run() exits
struct ActiveSlot {
    std::mutex&       mutex;
    TransferSession*& active;
    ~ActiveSlot() {
        std::lock_guard<std::mutex> lk(mutex);
        active = nullptr;
    }
};

void SendAgent::cancel() {
    cancelled_.store(true);
    std::lock_guard<std::mutex> lk(mutex_);
    if (active_) active_->cancel();
}

SendResult SendAgent::send(const fs::path& path, const std::string& peer_id, bool force_fallback) {
    cfg_.validate();

    SessionFile file;
    file.file_id    = utils::generate_file_id();
    file.name       = file_io::sanitize_name(path.filename().string());
    file.total_size = file_io::get_file_size(path.string());

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw TransferError(ErrorKind::IO_FAILURE, "cannot open " + path.string());
    }
    ChunkSource source(in, cfg_, file.total_size);
    LOG_INFO("Sending " + file.name + " (" + utils::format_bytes(file.total_size) + ", id " +
             file_id_hex(file.file_id) + ")");

    SendResult res;
    std::vector<PreparedChunk> pulled;

    bool try_peer = !force_fallback && conn_ && !peer_id.empty();
    if (!try_peer) {
        LOG_INFO(force_fallback ? "Fallback forced, skipping peer session"
                                : "No peer configured, uploading bundle");
    } else {
        TransferSession session(*conn_, peer_id, source, file, cfg_);
        {
            std::lock_guard<std::mutex> lk(mutex_);
            active_ = &session;
            if (cancelled_.load()) session.cancel();
        }
        {
            ActiveSlot slot{mutex_, active_};
            res.report = session.run();
        }
        res.session_ran = true;

        switch (res.report.outcome) {
        case SessionOutcome::COMPLETED:
            res.outcome = SendOutcome::PEER;
            res.locator = locator::make_peer(peer_id, file.file_id);
            return res;
        case SessionOutcome::CANCELLED:
            res.outcome = SendOutcome::CANCELLED;
            return res;
        case SessionOutcome::TRANSFER_FAILED:
            Logger::get().transfer_error(file.name + " -> " + peer_id + ": " +
                                         to_string(res.report.reason) + " after " +
                                         std::to_string(res.report.chunks_acked) + " acked chunks: " +
                                         res.report.detail);
            throw TransferError(ErrorKind::TRANSFER_FAILED,
                                std::string(to_string(res.report.reason)) + " after " +
                                std::to_string(res.report.chunks_acked) + " acknowledged chunks: " +
                                res.report.detail);
        case SessionOutcome::FALLBACK_TRIGGERED:
            LOG_WARN("Peer session ended (" + std::string(to_string(res.report.reason)) +
                     "), falling back to storage");
            pulled = session.take_pulled();
            break;
        }
    }

    if (cancelled_.load()) {
        res.outcome = SendOutcome::CANCELLED;
        return res;
    }
    if (!storage_) {
        throw TransferError(ErrorKind::STORAGE_FAILURE, "no storage configured for fallback");
    }

    FallbackCoordinator fallback(*storage_, cfg_);
    FallbackResult fr;
    try {
        fr = fallback.publish(file, std::move(pulled), source);
    } catch (const TransferError& e) {
        Logger::get().transfer_error(file.name + " -> " + storage_->describe() + ": " + e.what());
        throw;
    }
    res.outcome         = SendOutcome::FALLBACK;
    res.locator         = fr.locator;
    res.expires_at_unix = fr.expires_at_unix;
    return res;
}
