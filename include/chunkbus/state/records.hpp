#pragma once

#include "chunkbus/transfer/bitmap.hpp"
#include "chunkbus/transfer/types.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace chunkbus::state {

enum class Role {
    Publisher,
    Subscriber
};

inline const char* to_string(Role role) {
    return role == Role::Publisher ? "publisher" : "subscriber";
}

/// Progress changes with every chunk; the manifest is written once per transfer.
enum class RecordPart {
    Progress,
    Manifest
};

struct RecordKey {
    std::string file_id;
    Role role = Role::Publisher;
    RecordPart part = RecordPart::Progress;

    friend bool operator==(const RecordKey& a, const RecordKey& b) {
        return a.file_id == b.file_id && a.role == b.role && a.part == b.part;
    }
};

/// "publisher", "subscriber", "publisher/manifests", "subscriber/manifests"
inline std::string section_name(const RecordKey& key) {
    std::string section = to_string(key.role);
    if (key.part == RecordPart::Manifest) {
        section += "/manifests";
    }
    return section;
}

/**
 * @brief Durable publisher-side progress for one file
 */
struct PublisherRecord {
    transfer::Manifest manifest;
    std::string source;                          ///< ByteSource locator (file path)
    bool acknowledged = false;
    std::set<std::uint32_t> retry_queue;         ///< Indices pending resend
    std::uint32_t next_first_pass_index = 0;     ///< == total_chunks once the first pass finished
    std::int64_t last_update = 0;                ///< Unix ms, diagnostics only

    [[nodiscard]] bool first_pass_done() const noexcept {
        return next_first_pass_index >= manifest.total_chunks;
    }
};

/**
 * @brief Durable subscriber-side progress for one file
 *
 * acked is set once the whole-file digest verified; ack_sent once the ack
 * message was handed to the transport.
 */
struct SubscriberRecord {
    std::string file_id;
    std::optional<transfer::Manifest> manifest;
    transfer::ChunkBitmap received;
    std::string destination;
    bool acked = false;
    bool ack_sent = false;
    std::int64_t last_update = 0;
};

} // namespace chunkbus::state
