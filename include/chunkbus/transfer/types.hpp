#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace chunkbus::transfer {

using Bytes = std::vector<std::uint8_t>;

/**
 * @brief Immutable description of one file transfer
 *
 * chunk_digests[i] covers bytes [i * chunk_size, min((i + 1) * chunk_size, size)).
 */
struct Manifest {
    std::string file_id;
    std::string name;                       ///< Base name of the source (may be empty)
    std::uint64_t size = 0;
    std::uint32_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    std::string file_digest;                ///< SHA-256 hex of the whole stream
    std::vector<std::string> chunk_digests; ///< SHA-256 hex per chunk
    std::string content_descriptor = "application/octet-stream";
    std::time_t timestamp = 0;

    [[nodiscard]] std::uint64_t chunk_offset(std::uint32_t index) const noexcept {
        return static_cast<std::uint64_t>(index) * chunk_size;
    }

    /// Length of chunk `index`; the last chunk may be shorter.
    [[nodiscard]] std::uint32_t chunk_length(std::uint32_t index) const noexcept {
        const std::uint64_t offset = chunk_offset(index);
        if (index >= total_chunks || offset >= size) {
            return 0;
        }
        const std::uint64_t remaining = size - offset;
        return static_cast<std::uint32_t>(remaining < chunk_size ? remaining : chunk_size);
    }

    friend bool operator==(const Manifest& lhs, const Manifest& rhs) {
        return lhs.file_id == rhs.file_id && lhs.size == rhs.size &&
               lhs.chunk_size == rhs.chunk_size && lhs.total_chunks == rhs.total_chunks &&
               lhs.file_digest == rhs.file_digest && lhs.chunk_digests == rhs.chunk_digests;
    }

    friend bool operator!=(const Manifest& lhs, const Manifest& rhs) { return !(lhs == rhs); }
};

/// ceil(size / chunk_size); zero when size is zero.
inline std::uint32_t chunk_count(std::uint64_t size, std::uint32_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    return static_cast<std::uint32_t>((size + chunk_size - 1) / chunk_size);
}

/**
 * @brief One chunk on the wire (first send or resend)
 */
struct ChunkMessage {
    std::string file_id;
    std::uint32_t chunk_index = 0;
    std::string digest;
    Bytes payload;
};

/**
 * @brief Receiver progress report; drives all retransmission
 *
 * total_chunks is zero when the receiver has not seen the manifest yet.
 */
struct StatusMessage {
    std::string file_id;
    std::uint32_t received_count = 0;
    std::uint32_t total_chunks = 0;
    std::vector<std::uint32_t> missing_indices;
    bool complete = false;
};

/**
 * @brief Publisher poll asking receivers for an immediate status
 */
struct StatusRequest {
    std::string file_id;
};

enum class AckOutcome {
    Ok,
    Failed
};

struct AckMessage {
    std::string file_id;
    AckOutcome outcome = AckOutcome::Ok;
    std::time_t timestamp = 0;
};

} // namespace chunkbus::transfer
