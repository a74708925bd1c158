/**
 * @file events.hpp
 * @brief Transfer lifecycle events
 *
 * NAMING CONVENTION:
 * Events are past-tense: ChunkAcceptedEvent, TransferCompletedEvent.
 *
 * WHO EMITS:
 * - PublisherSession: TransferStarted, ChunksResent, TransferCompleted (ack),
 *   TransferFailed (source)
 * - SubscriberSession: ChunkAccepted, ChunkRejected, StatusReported,
 *   IntegrityReset, TransferCompleted (verified), TransferFailed (storage)
 * - ReceiverService: TransferStalled
 */

#pragma once

#include "chunkbus/core/error.hpp"
#include "chunkbus/state/records.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkbus::events {

using Clock = std::chrono::system_clock;

// ════════════════════════════════════════════════════════
// Publisher side
// ════════════════════════════════════════════════════════

struct TransferStartedEvent {
    std::string file_id;
    std::string name;
    std::uint64_t size = 0;
    std::uint32_t total_chunks = 0;
    bool resumed = false;
    Clock::time_point timestamp{Clock::now()};
};

/**
 * @brief A status report made the publisher resend chunks
 */
struct ChunksResentEvent {
    std::string file_id;
    std::vector<std::uint32_t> indices;
    Clock::time_point timestamp{Clock::now()};
};

// ════════════════════════════════════════════════════════
// Subscriber side
// ════════════════════════════════════════════════════════

struct ChunkAcceptedEvent {
    std::string file_id;
    std::uint32_t chunk_index = 0;
    std::uint32_t received_count = 0;
    std::uint32_t total_chunks = 0;
    std::size_t bytes = 0;
    Clock::time_point timestamp{Clock::now()};
};

/**
 * @brief A chunk was discarded without touching storage or the bitmap
 *
 * reason is CorruptChunk (digest or length mismatch) or InvalidMessage
 * (index outside the manifest).
 */
struct ChunkRejectedEvent {
    std::string file_id;
    std::uint32_t chunk_index = 0;
    ErrorCode reason = ErrorCode::CorruptChunk;
    Clock::time_point timestamp{Clock::now()};
};

struct StatusReportedEvent {
    std::string file_id;
    std::uint32_t received_count = 0;
    std::uint32_t total_chunks = 0;
    std::size_t missing_count = 0;
    bool complete = false;
    Clock::time_point timestamp{Clock::now()};
};

/**
 * @brief All chunks verified individually but the whole-file digest did not match
 *
 * The subscriber forgot every chunk and requests the full range again.
 */
struct IntegrityResetEvent {
    std::string file_id;
    std::string expected_digest;
    std::string actual_digest;
    Clock::time_point timestamp{Clock::now()};
};

struct TransferStalledEvent {
    std::string file_id;
    std::uint32_t received_count = 0;
    std::uint32_t total_chunks = 0;
    std::uint32_t silent_intervals = 0;
    Clock::time_point timestamp{Clock::now()};
};

// ════════════════════════════════════════════════════════
// Both sides
// ════════════════════════════════════════════════════════

struct TransferCompletedEvent {
    std::string file_id;
    state::Role role = state::Role::Subscriber;
    std::uint64_t size = 0;
    std::string file_digest;
    Clock::time_point timestamp{Clock::now()};
};

struct TransferFailedEvent {
    std::string file_id;
    state::Role role = state::Role::Publisher;
    Error error;
    Clock::time_point timestamp{Clock::now()};
};

} // namespace chunkbus::events
