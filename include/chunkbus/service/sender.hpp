#pragma once

#include "chunkbus/core/config.hpp"
#include "chunkbus/core/result.hpp"
#include "chunkbus/events/event_bus.hpp"
#include "chunkbus/session/publisher.hpp"
#include "chunkbus/state/state_store.hpp"
#include "chunkbus/transfer/chunker.hpp"
#include "chunkbus/transport/transport.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkbus::service {

/// Reopens the byte source named by a persisted publisher record.
using SourceOpener = std::function<Result<std::unique_ptr<transfer::ByteSource>>(const std::string& locator)>;

/**
 * @brief Owns the publisher sessions of one process
 *
 * Subscribes to the status and ack topics of a file before anything about
 * it is published, routes decoded messages to the file's publisher and
 * re-subscribes after a transport reconnect.
 */
class SenderService {
public:
    SenderService(transport::Transport& transport,
                  state::TransferStateStore& store,
                  events::EventBus& bus,
                  const TransferConfig& config);
    ~SenderService();

    SenderService(const SenderService&) = delete;
    SenderService& operator=(const SenderService&) = delete;

    /// Sends a file from disk. An empty file_id is replaced by generate_file_id().
    Result<std::string> send_file(const std::filesystem::path& path, std::string file_id = {});

    /// Sends an arbitrary source; options.chunk_size of zero takes the configured size.
    Result<std::string> send(std::unique_ptr<transfer::ByteSource> source, transfer::ManifestOptions options);

    /**
     * @brief Resumes every unacknowledged publisher record
     *
     * Records whose source cannot be reopened are reported and skipped:
     * the failed publisher is not kept, its record is. Returns the number
     * of transfers resumed.
     */
    Result<std::size_t> recover(SourceOpener opener = {});

    /// Stops listening for the file and deletes its record.
    Result<void> abandon(const std::string& file_id);

    Result<std::size_t> purge_completed(std::chrono::milliseconds retention);

    [[nodiscard]] std::shared_ptr<session::PublisherSession> publisher(const std::string& file_id) const;
    [[nodiscard]] std::vector<std::string> file_ids() const;

    /// Status request for every transfer still awaiting its ack.
    void poll();

    /// True once every publisher reached Acked.
    [[nodiscard]] bool all_acknowledged() const;

private:
    struct Entry {
        std::shared_ptr<session::PublisherSession> publisher;
        std::vector<transport::SubscriptionId> subscriptions;
    };

    std::vector<transport::SubscriptionId> subscribe_file(const std::string& file_id,
                                                          const std::shared_ptr<session::PublisherSession>& publisher);
    void on_reconnect();
    /// Unsubscribes and forgets a transfer; its record is left alone.
    void release(const std::string& file_id);

    transport::Transport& transport_;
    state::TransferStateStore& store_;
    events::EventBus& bus_;
    const TransferConfig& config_;

    transport::SubscriptionId reconnect_id_ = 0;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace chunkbus::service
