// ============================================================
// recv_agent.cpp -- RecvAgent implementation
// ============================================================

#include "recv_agent.hpp"
#include "../common/fallback_coordinator.hpp"
#include "../common/locator.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"

// How often listen() rechecks stop()
static constexpr u32 ACCEPT_SLICE_MS = 500;

std::optional<ReceiveResult> RecvAgent::listen(const ReceiveTarget& target, std::optional<FileId> wanted) {
    if (!conn_) {
        throw TransferError(ErrorKind::CONNECT_FAILURE, "no connectivity configured");
    }
    conn_->listen();

    while (!stop_.load()) {
        std::unique_ptr<PeerStream> stream = conn_->next_incoming(ACCEPT_SLICE_MS);
        if (!stream) continue;

        LOG_DEBUG("Incoming session from " + stream->describe());
        ReceiveSession session(*stream, target, cfg_, wanted);
        try {
            ReceiveResult r = session.run();
            stream->close();
            if (r.outcome == ReceiveOutcome::REFUSED) continue;
            return r;
        } catch (const TransferError& e) {
            // A broken or bogus session does not end the wait for the
            // right one; local IO failures do.
            Logger::get().transfer_error("session from " + stream->describe() + ": " + e.what());
            stream->close();
            if (e.kind() == ErrorKind::IO_FAILURE) throw;
        }
    }
    return std::nullopt;
}

fs::path RecvAgent::fetch(const std::string& loc, const ReceiveTarget& target) {
    switch (locator::classify(loc)) {
    case LocatorKind::STORAGE: {
        if (!storage_) {
            throw TransferError(ErrorKind::STORAGE_FAILURE, "no storage configured for " + loc);
        }
        FallbackCoordinator coord(*storage_, cfg_);
        return coord.fetch(loc, target).path;
    }
    case LocatorKind::PEER: {
        auto peer = locator::parse_peer(loc);
        LOG_INFO("Waiting for " + file_id_hex(peer->file_id) + " from " + peer->peer_id);
        auto r = listen(target, peer->file_id);
        if (!r) {
            throw TransferError(ErrorKind::CANCELLED, "stopped while waiting for " + loc);
        }
        if (r->outcome == ReceiveOutcome::CANCELLED) {
            throw TransferError(ErrorKind::CANCELLED, "sender cancelled " + r->name);
        }
        return r->path;
    }
    case LocatorKind::INVALID:
        break;
    }
    throw TransferError(ErrorKind::PROTOCOL_FAILURE, "unrecognised locator: " + loc);
}
