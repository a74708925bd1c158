#pragma once

#include <string>

namespace chunkbus {

/**
 * @brief Failure categories reported by the transfer protocol
 *
 * Per-chunk conditions (CorruptChunk, UnknownFile) are repaired through the
 * status/retry loop. SourceUnavailable and StorageWrite are surfaced to the
 * operator.
 */
enum class ErrorCode {
    CorruptChunk,       // chunk digest does not match the manifest
    CorruptWholeFile,   // all chunks verified but the file digest differs
    SourceUnavailable,  // publisher cannot read its byte source
    StorageWrite,       // subscriber cannot persist a chunk
    UnknownFile,        // message for a file_id without a manifest
    InvalidMessage,
    InvalidState,
    StateStore,
    Config
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::CorruptChunk: return "CorruptChunk";
        case ErrorCode::CorruptWholeFile: return "CorruptWholeFile";
        case ErrorCode::SourceUnavailable: return "SourceUnavailable";
        case ErrorCode::StorageWrite: return "StorageWrite";
        case ErrorCode::UnknownFile: return "UnknownFile";
        case ErrorCode::InvalidMessage: return "InvalidMessage";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::StateStore: return "StateStore";
        case ErrorCode::Config: return "Config";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code = ErrorCode::InvalidState;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    std::string describe() const {
        return std::string(to_string(code)) + ": " + message;
    }
};

} // namespace chunkbus
