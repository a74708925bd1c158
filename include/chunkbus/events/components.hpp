/**
 * @file components.hpp
 * @brief Event-driven observers for transfers
 *
 * EXAMPLE:
 * EventBus bus;
 * TransferLogger logger(bus);
 * TransferMetrics metrics(bus);
 * // Sessions emitting on `bus` are now logged and counted
 */

#pragma once

#include "chunkbus/events/event_bus.hpp"
#include "chunkbus/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <vector>

namespace chunkbus::events {

/**
 * @brief Logs every transfer event through spdlog
 *
 * Per-chunk traffic goes to debug, lifecycle to info, anomalies to warn and
 * operator-facing failures to error. Listeners are removed on destruction,
 * so a logger may be destroyed before its bus.
 */
class TransferLogger {
public:
    explicit TransferLogger(EventBus& bus) : bus_(bus) {
        ids_.push_back(bus_.subscribe<TransferStartedEvent>([](const TransferStartedEvent& e) {
            spdlog::info("[TransferStarted] file={} name={} size={} chunks={}{}",
                         e.file_id, e.name, e.size, e.total_chunks, e.resumed ? " (resumed)" : "");
        }));

        ids_.push_back(bus_.subscribe<ChunksResentEvent>([](const ChunksResentEvent& e) {
            spdlog::info("[ChunksResent] file={} count={}", e.file_id, e.indices.size());
        }));

        ids_.push_back(bus_.subscribe<ChunkAcceptedEvent>([](const ChunkAcceptedEvent& e) {
            spdlog::debug("[ChunkAccepted] file={} chunk={} progress={}/{} bytes={}",
                          e.file_id, e.chunk_index, e.received_count, e.total_chunks, e.bytes);
        }));

        ids_.push_back(bus_.subscribe<ChunkRejectedEvent>([](const ChunkRejectedEvent& e) {
            spdlog::warn("[ChunkRejected] file={} chunk={} reason={}",
                         e.file_id, e.chunk_index, to_string(e.reason));
        }));

        ids_.push_back(bus_.subscribe<StatusReportedEvent>([](const StatusReportedEvent& e) {
            spdlog::debug("[StatusReported] file={} received={}/{} missing={} complete={}",
                          e.file_id, e.received_count, e.total_chunks, e.missing_count, e.complete);
        }));

        ids_.push_back(bus_.subscribe<IntegrityResetEvent>([](const IntegrityResetEvent& e) {
            spdlog::warn("[IntegrityReset] file={} expected={} actual={}",
                         e.file_id, e.expected_digest, e.actual_digest);
        }));

        ids_.push_back(bus_.subscribe<TransferStalledEvent>([](const TransferStalledEvent& e) {
            spdlog::warn("[TransferStalled] file={} received={}/{} silent_intervals={}",
                         e.file_id, e.received_count, e.total_chunks, e.silent_intervals);
        }));

        ids_.push_back(bus_.subscribe<TransferCompletedEvent>([](const TransferCompletedEvent& e) {
            spdlog::info("[TransferCompleted] file={} role={} size={} sha256={}",
                         e.file_id, state::to_string(e.role), e.size, e.file_digest);
        }));

        ids_.push_back(bus_.subscribe<TransferFailedEvent>([](const TransferFailedEvent& e) {
            spdlog::error("[TransferFailed] file={} role={} error={}",
                          e.file_id, state::to_string(e.role), e.error.describe());
        }));
    }

    ~TransferLogger() {
        for (auto id : ids_) {
            bus_.unsubscribe(id);
        }
    }

    TransferLogger(const TransferLogger&) = delete;
    TransferLogger& operator=(const TransferLogger&) = delete;

private:
    EventBus& bus_;
    std::vector<ListenerId> ids_;
};

/**
 * @brief Counters over transfer events
 *
 * USAGE:
 * TransferMetrics metrics(bus);
 * // Later...
 * metrics.get_stats().chunks_accepted.load();
 */
class TransferMetrics {
public:
    struct Stats {
        std::atomic<std::uint64_t> transfers_started{0};
        std::atomic<std::uint64_t> transfers_completed{0};
        std::atomic<std::uint64_t> transfers_failed{0};
        std::atomic<std::uint64_t> chunks_accepted{0};
        std::atomic<std::uint64_t> bytes_accepted{0};
        std::atomic<std::uint64_t> chunks_rejected{0};
        std::atomic<std::uint64_t> chunks_resent{0};
        std::atomic<std::uint64_t> status_reports{0};
        std::atomic<std::uint64_t> integrity_resets{0};
        std::atomic<std::uint64_t> stalls{0};
    };

    explicit TransferMetrics(EventBus& bus) : bus_(bus) {
        ids_.push_back(bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent&) {
            stats_.transfers_started++;
        }));
        ids_.push_back(bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent&) {
            stats_.transfers_completed++;
        }));
        ids_.push_back(bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent&) {
            stats_.transfers_failed++;
        }));
        ids_.push_back(bus_.subscribe<ChunkAcceptedEvent>([this](const ChunkAcceptedEvent& e) {
            stats_.chunks_accepted++;
            stats_.bytes_accepted += e.bytes;
        }));
        ids_.push_back(bus_.subscribe<ChunkRejectedEvent>([this](const ChunkRejectedEvent&) {
            stats_.chunks_rejected++;
        }));
        ids_.push_back(bus_.subscribe<ChunksResentEvent>([this](const ChunksResentEvent& e) {
            stats_.chunks_resent += e.indices.size();
        }));
        ids_.push_back(bus_.subscribe<StatusReportedEvent>([this](const StatusReportedEvent&) {
            stats_.status_reports++;
        }));
        ids_.push_back(bus_.subscribe<IntegrityResetEvent>([this](const IntegrityResetEvent&) {
            stats_.integrity_resets++;
        }));
        ids_.push_back(bus_.subscribe<TransferStalledEvent>([this](const TransferStalledEvent&) {
            stats_.stalls++;
        }));
    }

    ~TransferMetrics() {
        for (auto id : ids_) {
            bus_.unsubscribe(id);
        }
    }

    TransferMetrics(const TransferMetrics&) = delete;
    TransferMetrics& operator=(const TransferMetrics&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Transfer Statistics:");
        spdlog::info("  Transfers started:   {}", stats_.transfers_started.load());
        spdlog::info("  Transfers completed: {}", stats_.transfers_completed.load());
        spdlog::info("  Transfers failed:    {}", stats_.transfers_failed.load());
        spdlog::info("  Chunks accepted:     {}", stats_.chunks_accepted.load());
        spdlog::info("  Bytes accepted:      {}", stats_.bytes_accepted.load());
        spdlog::info("  Chunks rejected:     {}", stats_.chunks_rejected.load());
        spdlog::info("  Chunks resent:       {}", stats_.chunks_resent.load());
        spdlog::info("  Status reports:      {}", stats_.status_reports.load());
        spdlog::info("  Integrity resets:    {}", stats_.integrity_resets.load());
        spdlog::info("  Stalls:              {}", stats_.stalls.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    std::vector<ListenerId> ids_;
    Stats stats_;
};

} // namespace chunkbus::events
