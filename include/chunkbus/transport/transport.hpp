#pragma once

#include "chunkbus/core/result.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace chunkbus::transport {

using SubscriptionId = std::uint64_t;

/// Receives (topic, payload) for every delivered message matching the filter.
using MessageHandler = std::function<void(const std::string& topic, const std::string& payload)>;

using ReconnectHandler = std::function<void()>;

/**
 * @brief Publish/subscribe capability the transfer services are built on
 *
 * Delivery is at-least-once with no ordering guarantee across topics or
 * publishers. publish() never invokes handlers on the caller's thread, so a
 * handler may publish while holding its own locks.
 *
 * Filters use MQTT syntax: '+' matches exactly one level, a trailing '#'
 * matches any number of remaining levels.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<void> publish(const std::string& topic, std::string payload) = 0;

    virtual SubscriptionId subscribe(const std::string& filter, MessageHandler handler) = 0;

    /// Removes a message subscription or a reconnect handler.
    virtual void unsubscribe(SubscriptionId id) = 0;

    /// Invoked after the connection was re-established; subscriptions do not survive a disconnect.
    virtual SubscriptionId on_reconnect(ReconnectHandler handler) = 0;
};

bool topic_matches(const std::string& filter, const std::string& topic);

} // namespace chunkbus::transport
