/**
 * @file delivery_queue.hpp
 * @brief Thread-safe FIFO for messages in flight on the in-memory bus
 *
 * EXAMPLE:
 * DeliveryQueue<Envelope> queue;
 * queue.push(envelope);        // publisher
 * auto next = queue.pop();     // delivery thread (blocks until available or closed)
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace chunkbus::transport {

/**
 * @brief Thread-safe FIFO with optional overtaking
 *
 * THREAD SAFETY:
 * - Multiple producers can push concurrently
 * - Multiple consumers can pop concurrently
 * - close() wakes every waiting consumer; pop() then drains what is left
 *   and returns nullopt once empty
 */
template<typename T>
class DeliveryQueue {
public:
    DeliveryQueue() = default;

    DeliveryQueue(const DeliveryQueue&) = delete;
    DeliveryQueue& operator=(const DeliveryQueue&) = delete;

    /**
     * @brief Enqueue an item
     *
     * `overtake` lets the item jump ahead of up to that many queued items,
     * which is how the in-memory bus simulates reordering.
     */
    void push(T item, std::size_t overtake = 0) {
        {
            std::unique_lock lock(mutex_);
            const auto jump = std::min(overtake, queue_.size());
            queue_.insert(queue_.end() - static_cast<std::ptrdiff_t>(jump), std::move(item));
        }
        cv_.notify_one();
    }

    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        return take_front();
    }

    /// Blocks until an item is available or the queue is closed and empty.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !queue_.empty() || closed_; });
        return take_front();
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; })) {
            return std::nullopt;
        }
        return take_front();
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    /// Drops every queued item; returns how many were discarded.
    size_t clear() {
        std::unique_lock lock(mutex_);
        const auto dropped = queue_.size();
        queue_.clear();
        return dropped;
    }

    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    void reopen() {
        std::unique_lock lock(mutex_);
        closed_ = false;
    }

private:
    std::optional<T> take_front() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;
};

} // namespace chunkbus::transport
