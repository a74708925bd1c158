#include "chunkbus/transport/memory_transport.hpp"

#include <spdlog/spdlog.h>

namespace chunkbus::transport {

MemoryTransport::MemoryTransport() : rng_(profile_.seed) {}

MemoryTransport::~MemoryTransport() {
    stop();
}

Result<void> MemoryTransport::publish(const std::string& topic, std::string payload) {
    if (!connected_) {
        return Err<void>(ErrorCode::InvalidState, "Transport disconnected, cannot publish to " + topic);
    }

    Envelope envelope{topic, std::move(payload)};

    std::size_t copies = 1;
    std::size_t overtake = 0;
    {
        std::lock_guard lock(mutex_);
        history_.push_back(envelope);

        FaultAction action = fault_hook_ ? fault_hook_(envelope) : FaultAction::Deliver;
        if (action == FaultAction::Deliver) {
            std::uniform_real_distribution<double> chance(0.0, 1.0);
            if (profile_.drop_rate > 0.0 && chance(rng_) < profile_.drop_rate) {
                action = FaultAction::Drop;
            } else if (profile_.duplicate_rate > 0.0 && chance(rng_) < profile_.duplicate_rate) {
                action = FaultAction::Duplicate;
            }
        }

        if (action == FaultAction::Drop) {
            spdlog::debug("Dropped message on {}", topic);
            return Ok();
        }
        copies = action == FaultAction::Duplicate ? 2 : 1;

        if (profile_.max_overtake > 0) {
            std::uniform_int_distribution<std::size_t> jump(0, profile_.max_overtake);
            overtake = jump(rng_);
        }
    }

    for (std::size_t i = 1; i < copies; ++i) {
        queue_.push(envelope, overtake);
    }
    queue_.push(std::move(envelope), overtake);
    return Ok();
}

SubscriptionId MemoryTransport::subscribe(const std::string& filter, MessageHandler handler) {
    std::lock_guard lock(mutex_);
    const auto id = next_id_++;
    subscriptions_[id] = Subscription{filter, std::move(handler)};
    return id;
}

void MemoryTransport::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mutex_);
    subscriptions_.erase(id);
    reconnect_handlers_.erase(id);
}

SubscriptionId MemoryTransport::on_reconnect(ReconnectHandler handler) {
    std::lock_guard lock(mutex_);
    const auto id = next_id_++;
    reconnect_handlers_[id] = std::move(handler);
    return id;
}

void MemoryTransport::dispatch(const Envelope& envelope) {
    std::vector<MessageHandler> targets;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, subscription] : subscriptions_) {
            if (topic_matches(subscription.filter, envelope.topic)) {
                targets.push_back(subscription.handler);
            }
        }
    }

    for (auto& handler : targets) {
        handler(envelope.topic, envelope.payload);
    }
}

bool MemoryTransport::deliver_one() {
    auto envelope = queue_.try_pop();
    if (!envelope) {
        return false;
    }
    dispatch(*envelope);
    return true;
}

std::size_t MemoryTransport::drain(std::size_t limit) {
    std::size_t delivered = 0;
    while (delivered < limit && deliver_one()) {
        ++delivered;
    }
    if (delivered == limit && pending() > 0) {
        spdlog::warn("Drain stopped after {} deliveries with {} message(s) still queued", delivered, pending());
    }
    return delivered;
}

void MemoryTransport::start() {
    if (running_.exchange(true)) {
        return;
    }
    queue_.reopen();
    worker_ = std::thread([this]() {
        while (auto envelope = queue_.pop()) {
            dispatch(*envelope);
        }
    });
}

void MemoryTransport::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    queue_.close();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void MemoryTransport::set_fault_hook(FaultHook hook) {
    std::lock_guard lock(mutex_);
    fault_hook_ = std::move(hook);
}

void MemoryTransport::set_link_profile(const LinkProfile& profile) {
    std::lock_guard lock(mutex_);
    profile_ = profile;
    rng_.seed(profile.seed);
}

void MemoryTransport::simulate_disconnect() {
    connected_ = false;
    const auto lost = queue_.clear();
    {
        std::lock_guard lock(mutex_);
        subscriptions_.clear();
    }
    spdlog::info("Transport disconnected ({} in-flight message(s) lost)", lost);
}

void MemoryTransport::reconnect() {
    std::vector<ReconnectHandler> handlers;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, handler] : reconnect_handlers_) {
            handlers.push_back(handler);
        }
    }
    connected_ = true;
    spdlog::info("Transport reconnected");

    for (auto& handler : handlers) {
        handler();
    }
}

std::vector<Envelope> MemoryTransport::history() const {
    std::lock_guard lock(mutex_);
    return history_;
}

std::vector<Envelope> MemoryTransport::published_on(const std::string& filter) const {
    std::lock_guard lock(mutex_);
    std::vector<Envelope> matches;
    for (const auto& envelope : history_) {
        if (topic_matches(filter, envelope.topic)) {
            matches.push_back(envelope);
        }
    }
    return matches;
}

void MemoryTransport::clear_history() {
    std::lock_guard lock(mutex_);
    history_.clear();
}

std::size_t MemoryTransport::subscription_count() const {
    std::lock_guard lock(mutex_);
    return subscriptions_.size();
}

} // namespace chunkbus::transport
