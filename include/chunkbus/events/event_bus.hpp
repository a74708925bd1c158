/**
 * @file event_bus.hpp
 * @brief In-process event bus connecting transfer sessions to observers
 *
 * WHAT IT DOES:
 * Sessions emit transfer lifecycle events (chunk accepted, status sent,
 * integrity reset, ...) without knowing who listens. Logging and metrics
 * attach as listeners keyed by event type.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<TransferCompletedEvent>([](const TransferCompletedEvent& e) { ... });
 * bus.emit(TransferCompletedEvent{...});
 * bus.unsubscribe(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace chunkbus::events {

using ListenerId = std::size_t;

/**
 * @brief Type-indexed publish/subscribe for in-process events
 *
 * THREAD SAFETY:
 * - emit/subscribe/unsubscribe may be called concurrently from any thread
 * - Listeners run synchronously on the emitting thread with no bus lock held,
 *   so a listener may subscribe or emit in turn
 * - A listener that throws is logged and skipped; the others still run
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    ListenerId subscribe(std::function<void(const EventType&)> listener) {
        auto erased = std::make_shared<Callback>(
            [fn = std::move(listener)](const void* event) { fn(*static_cast<const EventType*>(event)); });

        std::unique_lock lock(mutex_);
        const ListenerId id = ++last_id_;
        listeners_[std::type_index(typeid(EventType))].push_back(Listener{id, std::move(erased)});
        return id;
    }

    /// Ids are unique across event types; an unknown id is ignored.
    void unsubscribe(ListenerId id) {
        std::unique_lock lock(mutex_);
        for (auto& [type, list] : listeners_) {
            const auto before = list.size();
            list.erase(std::remove_if(list.begin(), list.end(),
                                      [id](const Listener& l) { return l.id == id; }),
                       list.end());
            if (list.size() != before) {
                return;
            }
        }
    }

    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<Callback>> targets;
        {
            std::shared_lock lock(mutex_);
            auto it = listeners_.find(std::type_index(typeid(EventType)));
            if (it == listeners_.end()) {
                return;
            }
            targets.reserve(it->second.size());
            for (const auto& listener : it->second) {
                targets.push_back(listener.callback);
            }
        }

        for (const auto& callback : targets) {
            try {
                (*callback)(&event);
            } catch (const std::exception& e) {
                spdlog::error("Listener for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = listeners_.find(std::type_index(typeid(EventType)));
        return it != listeners_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        listeners_.clear();
    }

private:
    using Callback = std::function<void(const void*)>;

    struct Listener {
        ListenerId id;
        std::shared_ptr<Callback> callback;
    };

    std::unordered_map<std::type_index, std::vector<Listener>> listeners_;
    mutable std::shared_mutex mutex_;
    ListenerId last_id_ = 0;
};

} // namespace chunkbus::events
