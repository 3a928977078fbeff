#pragma once

// ============================================================
// errors.hpp -- Transfer error taxonomy
//
// Fatal conditions are thrown as TransferError. Per-chunk conditions
// that the pipeline recovers from (integrity mismatch, ack timeout)
// are returned as values and never reach this type.
// ============================================================

#include <stdexcept>
#include <string>

enum class ErrorKind {
    IO_FAILURE,         // local read/write
    CONNECT_FAILURE,    // no usable stream to peer
    INTEGRITY_FAILURE,  // hash mismatch that could not be recovered
    PROTOCOL_FAILURE,   // malformed frame, manifest or bundle
    STORAGE_FAILURE,    // fallback storage collaborator error
    ABANDONED,          // chunk retry budget exhausted
    TRANSFER_FAILED,    // fatal after partial P2P delivery
    CANCELLED,          // caller-initiated cancel
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::IO_FAILURE:        return "IOFailure";
        case ErrorKind::CONNECT_FAILURE:   return "ConnectFailure";
        case ErrorKind::INTEGRITY_FAILURE: return "IntegrityFailure";
        case ErrorKind::PROTOCOL_FAILURE:  return "ProtocolFailure";
        case ErrorKind::STORAGE_FAILURE:   return "StorageFailure";
        case ErrorKind::ABANDONED:         return "Abandoned";
        case ErrorKind::TRANSFER_FAILED:   return "TransferFailed";
        case ErrorKind::CANCELLED:         return "Cancelled";
    }
    return "Unknown";
}

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(std::string(to_string(kind)) + ": " + msg)
        , kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};
