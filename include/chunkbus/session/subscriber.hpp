#pragma once

#include "chunkbus/core/result.hpp"
#include "chunkbus/session/context.hpp"
#include "chunkbus/session/state.hpp"
#include "chunkbus/state/records.hpp"
#include "chunkbus/storage/storage.hpp"
#include "chunkbus/transfer/topics.hpp"
#include "chunkbus/transfer/types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace chunkbus::session {

/**
 * @brief Receiving side of one file transfer
 *
 * Verifies every chunk against the manifest before it reaches storage,
 * reports gaps through status messages and acknowledges only after the
 * whole-file digest over the destination matched.
 *
 * Chunks that arrive before the manifest are held in a bounded buffer and
 * replayed once the manifest is known.
 */
class SubscriberSession {
public:
    SubscriberSession(SessionContext context, storage::StorageProvider& storage, std::string file_id);

    SubscriberSession(const SubscriberSession&) = delete;
    SubscriberSession& operator=(const SubscriberSession&) = delete;

    /**
     * @brief Startup recovery from a persisted record
     *
     * A record acknowledged but without the ack_sent marker is re-verified
     * and the ack re-emitted without receiving anything again.
     */
    Result<void> restore(const state::SubscriberRecord& record);

    void on_manifest(const transfer::Manifest& manifest);
    void on_chunk(const transfer::ChunkMessage& chunk);

    /// Answers a publisher's status request with a status, or with the ack if it was never sent.
    void on_status_request();

    /**
     * @brief Status interval elapsed
     *
     * Emits a status for an unfinished transfer and raises a stall warning
     * after the configured number of intervals without progress.
     */
    void tick();

    /// After a transport reconnect: fresh status, or the ack again if it was never sent.
    void resync();

    [[nodiscard]] const std::string& file_id() const noexcept { return file_id_; }
    [[nodiscard]] SubscriberState state() const;
    [[nodiscard]] transfer::StatusMessage status() const;
    [[nodiscard]] std::optional<transfer::Manifest> manifest() const;
    [[nodiscard]] state::SubscriberRecord record() const;
    [[nodiscard]] std::size_t buffered_chunks() const;
    [[nodiscard]] std::optional<Error> last_error() const;

private:
    Result<void> transition_to(SubscriberState next);
    Result<void> persist();
    void surface(Error error);

    Result<void> attach_storage(const transfer::Manifest& manifest);
    void buffer_chunk(const transfer::ChunkMessage& chunk);
    void accept_chunk(const transfer::ChunkMessage& chunk);
    void verify_and_ack();
    void publish_ack();
    void answer_completed();

    transfer::StatusMessage build_status() const;
    void emit_status();

    SessionContext ctx_;
    storage::StorageProvider& storage_provider_;
    const std::string file_id_;
    const transfer::FileTopics topics_;

    mutable std::mutex mutex_;
    SubscriberState state_ = SubscriberState::AwaitingMeta;
    state::SubscriberRecord record_;
    std::unique_ptr<storage::Storage> storage_;
    std::map<std::uint32_t, transfer::ChunkMessage> pending_;   // before the manifest
    bool record_created_ = false;
    std::optional<Error> last_error_;

    std::uint32_t accepted_since_status_ = 0;
    std::uint64_t progress_ = 0;
    std::uint64_t progress_at_last_tick_ = 0;
    std::uint32_t silent_intervals_ = 0;
};

} // namespace chunkbus::session
