#pragma once

// ============================================================
// locator.hpp -- Peer and storage locators
//
//   shr://<peer_id>/<file_id_hex>     delivered directly to a peer
//   http://... https://... file://... bundle in intermediary storage
// ============================================================

#include "platform.hpp"
#include "manifest.hpp"
#include "utils.hpp"
#include <optional>
#include <string>

static constexpr const char* PEER_SCHEME = "shr://";

enum class LocatorKind {
    PEER,
    STORAGE,
    INVALID,
};

struct PeerLocator {
    std::string peer_id;
    FileId      file_id{};
};

namespace locator {

inline bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

inline bool is_http_url(const std::string& s) {
    return starts_with(s, "http://") || starts_with(s, "https://");
}

inline bool is_file_url(const std::string& s) {
    return starts_with(s, "file://");
}

inline std::string make_peer(const std::string& peer_id, const FileId& id) {
    return std::string(PEER_SCHEME) + peer_id + "/" + file_id_hex(id);
}

inline std::optional<PeerLocator> parse_peer(const std::string& s) {
    if (!starts_with(s, PEER_SCHEME)) return std::nullopt;
    std::string rest = s.substr(std::string(PEER_SCHEME).size());
    auto slash = rest.rfind('/');
    if (slash == std::string::npos || slash == 0) return std::nullopt;
    PeerLocator out;
    out.peer_id = rest.substr(0, slash);
    if (!utils::from_hex(rest.substr(slash + 1), out.file_id.data(), out.file_id.size())) {
        return std::nullopt;
    }
    return out;
}

inline LocatorKind classify(const std::string& s) {
    if (is_http_url(s) || is_file_url(s)) return LocatorKind::STORAGE;
    if (parse_peer(s)) return LocatorKind::PEER;
    return LocatorKind::INVALID;
}

} // namespace locator
