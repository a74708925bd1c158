#pragma once

/**
 * @file memory_transport.hpp
 * @brief In-process pub/sub bus with fault injection
 *
 * WHAT IT DOES:
 * publish() only enqueues. Messages reach subscribers when drained, either
 * explicitly on the calling thread (drain(), deliver_one()) or by a
 * background delivery thread (start()/stop()). Loss, duplication,
 * reordering and disconnects can be injected to exercise the transfer
 * protocol's recovery paths.
 *
 * EXAMPLE:
 * MemoryTransport bus;
 * bus.subscribe("chunkbus/file/+/status", handler);
 * bus.publish("chunkbus/file/a/status", payload);
 * bus.drain();   // handler runs here
 */

#include "chunkbus/transport/delivery_queue.hpp"
#include "chunkbus/transport/transport.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace chunkbus::transport {

struct Envelope {
    std::string topic;
    std::string payload;
};

enum class FaultAction {
    Deliver,
    Drop,
    Duplicate
};

/// Decides the fate of each published message before it is queued.
using FaultHook = std::function<FaultAction(const Envelope&)>;

/**
 * @brief Random impairment applied after the fault hook
 */
struct LinkProfile {
    double drop_rate = 0.0;
    double duplicate_rate = 0.0;
    std::size_t max_overtake = 0;     ///< A message may jump ahead of up to this many queued ones
    std::uint32_t seed = 42;
};

class MemoryTransport : public Transport {
public:
    MemoryTransport();
    ~MemoryTransport() override;

    MemoryTransport(const MemoryTransport&) = delete;
    MemoryTransport& operator=(const MemoryTransport&) = delete;

    // Transport
    Result<void> publish(const std::string& topic, std::string payload) override;
    SubscriptionId subscribe(const std::string& filter, MessageHandler handler) override;
    void unsubscribe(SubscriptionId id) override;
    SubscriptionId on_reconnect(ReconnectHandler handler) override;

    // ────────────────────────────────────────────────────
    // Delivery
    // ────────────────────────────────────────────────────

    /// Delivers the next queued message; false if none was queued.
    bool deliver_one();

    /**
     * @brief Delivers until the queue stays empty
     *
     * Messages published by handlers during the drain are delivered too.
     * Stops after `limit` deliveries. Returns the number delivered.
     */
    std::size_t drain(std::size_t limit = 1000000);

    /// Background delivery thread. drain() must not be used while it runs.
    void start();
    void stop();

    // ────────────────────────────────────────────────────
    // Fault injection
    // ────────────────────────────────────────────────────

    void set_fault_hook(FaultHook hook);
    void set_link_profile(const LinkProfile& profile);

    /// Drops queued messages and every subscription; publish() fails until reconnect().
    void simulate_disconnect();

    /// Restores the link and runs the reconnect handlers on the calling thread.
    void reconnect();

    [[nodiscard]] bool connected() const noexcept { return connected_; }

    // ────────────────────────────────────────────────────
    // Inspection
    // ────────────────────────────────────────────────────

    [[nodiscard]] std::size_t pending() const { return queue_.size(); }

    /// Every accepted publish in order, before fault injection.
    [[nodiscard]] std::vector<Envelope> history() const;

    /// History entries whose topic matches `filter`.
    [[nodiscard]] std::vector<Envelope> published_on(const std::string& filter) const;

    void clear_history();

    [[nodiscard]] std::size_t subscription_count() const;

private:
    struct Subscription {
        std::string filter;
        MessageHandler handler;
    };

    void dispatch(const Envelope& envelope);

    DeliveryQueue<Envelope> queue_;

    mutable std::mutex mutex_;
    std::map<SubscriptionId, Subscription> subscriptions_;
    std::map<SubscriptionId, ReconnectHandler> reconnect_handlers_;
    std::vector<Envelope> history_;
    FaultHook fault_hook_;
    LinkProfile profile_;
    std::mt19937 rng_;
    SubscriptionId next_id_ = 1;

    std::atomic<bool> connected_{true};
    std::atomic<bool> running_{false};
    std::thread worker_;
};

} // namespace chunkbus::transport
