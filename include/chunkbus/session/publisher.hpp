#pragma once

#include "chunkbus/core/result.hpp"
#include "chunkbus/session/context.hpp"
#include "chunkbus/session/state.hpp"
#include "chunkbus/state/records.hpp"
#include "chunkbus/transfer/chunker.hpp"
#include "chunkbus/transfer/topics.hpp"
#include "chunkbus/transfer/types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace chunkbus::session {

/**
 * @brief Sending side of one file transfer
 *
 * Publishes the manifest and every chunk once, then resends exactly the
 * indices receivers report missing until an ack arrives. There is no
 * timer-driven retransmission. Every state change is persisted before the
 * message it triggers is published.
 *
 * All entry points lock the session, so messages for the same file are
 * handled one at a time.
 */
class PublisherSession {
public:
    PublisherSession(SessionContext context, std::unique_ptr<transfer::ByteSource> source);

    PublisherSession(const PublisherSession&) = delete;
    PublisherSession& operator=(const PublisherSession&) = delete;

    /**
     * @brief Idle -> Sending -> AwaitingAck
     *
     * Computes the manifest over the whole source before anything is
     * published. An unreadable source fails the session with
     * SourceUnavailable and publishes nothing.
     */
    Result<void> start(const transfer::ManifestOptions& options);

    /**
     * @brief Continues from a persisted record without recomputing the manifest
     *
     * Re-publishes the manifest, finishes an interrupted first pass and
     * resends the persisted retry set. An acknowledged record goes straight
     * to Acked.
     */
    Result<void> resume(const state::PublisherRecord& record);

    void on_status(const transfer::StatusMessage& status);
    void on_ack(const transfer::AckMessage& ack);

    /// While awaiting the ack, asks receivers for a status; a verified-complete status counts as the ack.
    void poll();

    [[nodiscard]] PublisherState state() const;
    [[nodiscard]] std::string file_id() const;
    [[nodiscard]] std::optional<transfer::Manifest> manifest() const;
    [[nodiscard]] std::set<std::uint32_t> retry_queue() const;
    [[nodiscard]] std::optional<Error> last_error() const;

private:
    Result<void> transition_to(PublisherState next);
    Result<void> fail(Error error);
    Result<void> persist();

    void publish_manifest();
    Result<void> publish_chunk(std::uint32_t index, transfer::TopicKind kind);
    Result<void> run_first_pass();
    Result<void> flush_retry_queue();
    void request_status();
    void acknowledge();

    SessionContext ctx_;
    std::unique_ptr<transfer::ByteSource> source_;

    mutable std::mutex mutex_;
    PublisherState state_ = PublisherState::Idle;
    state::PublisherRecord record_;
    std::optional<transfer::FileTopics> topics_;
    std::optional<Error> last_error_;
};

} // namespace chunkbus::session
