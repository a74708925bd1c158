#pragma once

#include "chunkbus/core/config.hpp"
#include "chunkbus/core/result.hpp"
#include "chunkbus/events/event_bus.hpp"
#include "chunkbus/session/subscriber.hpp"
#include "chunkbus/state/state_store.hpp"
#include "chunkbus/storage/storage.hpp"
#include "chunkbus/transport/transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace chunkbus::service {

namespace asio = boost::asio;

/**
 * @brief Owns the subscriber sessions of one process
 *
 * WHAT IT DOES:
 * - Subscribes to every transfer under the namespace ({ns}/file/+/+) or to
 *   the topics of selected files
 * - Decodes messages and routes them to the file's session, creating it on
 *   the first meta, chunk or status request (after loading any persisted
 *   record for that file)
 * - Drives the status interval, on a Boost.Asio steady_timer or by tick()
 * - Re-subscribes and reports status for every transfer after a reconnect
 *
 * EXAMPLE:
 * ReceiverService receiver(transport, store, bus, config, storage);
 * receiver.recover();
 * receiver.listen_all();
 * receiver.start_timer(io_context);
 */
class ReceiverService {
public:
    ReceiverService(transport::Transport& transport,
                    state::TransferStateStore& store,
                    events::EventBus& bus,
                    const TransferConfig& config,
                    storage::StorageProvider& storage);
    ~ReceiverService();

    ReceiverService(const ReceiverService&) = delete;
    ReceiverService& operator=(const ReceiverService&) = delete;

    /// Receive every transfer published under the namespace.
    void listen_all();

    /// Receive only `file_id` (meta, chunk, retry and status topics).
    void watch(const std::string& file_id);

    /**
     * @brief Rebuilds sessions from persisted subscriber records
     *
     * Call before listening. Returns the number of sessions restored.
     */
    Result<std::size_t> recover();

    /// One status interval for every session.
    void tick();

    /// Runs tick() every status_interval on `io_context` until stop_timer().
    void start_timer(asio::io_context& io_context);
    void stop_timer();

    /// Deletes the record and ignores further traffic for the file.
    Result<void> abandon(const std::string& file_id);

    Result<std::size_t> purge_completed(std::chrono::milliseconds retention);

    [[nodiscard]] std::shared_ptr<session::SubscriberSession> subscriber(const std::string& file_id) const;
    [[nodiscard]] std::vector<std::string> file_ids() const;

    /// True when at least one session exists and all of them are Complete.
    [[nodiscard]] bool all_complete() const;

private:
    void subscribe(const std::string& filter);
    void handle_message(const std::string& topic, const std::string& payload);
    std::shared_ptr<session::SubscriberSession> find_or_create(const std::string& file_id);
    std::vector<std::shared_ptr<session::SubscriberSession>> snapshot() const;
    void schedule_tick();
    void on_reconnect();

    transport::Transport& transport_;
    state::TransferStateStore& store_;
    events::EventBus& bus_;
    const TransferConfig& config_;
    storage::StorageProvider& storage_;

    transport::SubscriptionId reconnect_id_ = 0;

    mutable std::mutex mutex_;
    std::vector<std::string> filters_;
    std::vector<transport::SubscriptionId> subscriptions_;
    std::unordered_map<std::string, std::shared_ptr<session::SubscriberSession>> sessions_;
    std::unordered_set<std::string> abandoned_;

    std::unique_ptr<asio::steady_timer> timer_;
};

} // namespace chunkbus::service
