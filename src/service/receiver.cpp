#include "chunkbus/service/receiver.hpp"
#include "chunkbus/transfer/codec.hpp"
#include "chunkbus/transfer/topics.hpp"

#include <spdlog/spdlog.h>

#include <variant>

namespace chunkbus::service {

ReceiverService::ReceiverService(transport::Transport& transport,
                                 state::TransferStateStore& store,
                                 events::EventBus& bus,
                                 const TransferConfig& config,
                                 storage::StorageProvider& storage)
    : transport_(transport), store_(store), bus_(bus), config_(config), storage_(storage) {
    reconnect_id_ = transport_.on_reconnect([this]() { on_reconnect(); });
}

ReceiverService::~ReceiverService() {
    stop_timer();
    transport_.unsubscribe(reconnect_id_);
    std::lock_guard lock(mutex_);
    for (auto id : subscriptions_) {
        transport_.unsubscribe(id);
    }
}

void ReceiverService::listen_all() {
    subscribe(transfer::all_files_filter(config_.topic_namespace));
}

void ReceiverService::watch(const std::string& file_id) {
    const transfer::FileTopics topics(config_.topic_namespace, file_id);
    for (const auto* topic : {&topics.meta, &topics.chunk, &topics.retry, &topics.status}) {
        subscribe(*topic);
    }
}

Result<std::size_t> ReceiverService::recover() {
    auto ids = store_.list(state::Role::Subscriber);
    if (ids.is_error()) {
        return Err<std::size_t>(ids.error());
    }

    std::size_t restored = 0;
    for (const auto& file_id : ids.value()) {
        if (subscriber(file_id)) {
            continue;
        }
        if (find_or_create(file_id)) {
            ++restored;
        }
    }
    spdlog::info("Restored {} incoming transfer(s)", restored);
    return Ok(restored);
}

void ReceiverService::tick() {
    for (auto& subscriber : snapshot()) {
        subscriber->tick();
    }
}

void ReceiverService::start_timer(asio::io_context& io_context) {
    std::lock_guard lock(mutex_);
    if (timer_) {
        return;
    }
    timer_ = std::make_unique<asio::steady_timer>(io_context);
    schedule_tick();
}

void ReceiverService::stop_timer() {
    std::lock_guard lock(mutex_);
    if (timer_) {
        timer_->cancel();
        timer_.reset();
    }
}

Result<void> ReceiverService::abandon(const std::string& file_id) {
    {
        std::lock_guard lock(mutex_);
        sessions_.erase(file_id);
        abandoned_.insert(file_id);
    }
    spdlog::info("Abandoned incoming transfer {}", file_id);
    return store_.remove(file_id, state::Role::Subscriber);
}

Result<std::size_t> ReceiverService::purge_completed(std::chrono::milliseconds retention) {
    return store_.purge_completed(retention);
}

std::shared_ptr<session::SubscriberSession> ReceiverService::subscriber(const std::string& file_id) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(file_id);
    return it != sessions_.end() ? it->second : nullptr;
}

std::vector<std::string> ReceiverService::file_ids() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [file_id, subscriber] : sessions_) {
        ids.push_back(file_id);
    }
    return ids;
}

bool ReceiverService::all_complete() const {
    const auto subscribers = snapshot();
    if (subscribers.empty()) {
        return false;
    }
    for (const auto& subscriber : subscribers) {
        if (subscriber->state() != session::SubscriberState::Complete) {
            return false;
        }
    }
    return true;
}

void ReceiverService::subscribe(const std::string& filter) {
    auto id = transport_.subscribe(filter, [this](const std::string& topic, const std::string& payload) {
        handle_message(topic, payload);
    });
    std::lock_guard lock(mutex_);
    filters_.push_back(filter);
    subscriptions_.push_back(id);
}

void ReceiverService::handle_message(const std::string& topic, const std::string& payload) {
    const auto ref = transfer::parse_topic(config_.topic_namespace, topic);
    if (!ref) {
        spdlog::debug("Ignoring message on foreign topic {}", topic);
        return;
    }
    {
        std::lock_guard lock(mutex_);
        if (abandoned_.count(ref->file_id) > 0) {
            return;
        }
    }

    switch (ref->kind) {
        case transfer::TopicKind::Meta: {
            auto manifest = transfer::decode_manifest(payload);
            if (manifest.is_error()) {
                spdlog::warn("Invalid manifest on {}: {}", topic, manifest.error().message);
                return;
            }
            if (manifest.value().file_id != ref->file_id) {
                spdlog::warn("Manifest for {} published on {}", manifest.value().file_id, topic);
                return;
            }
            if (auto subscriber = find_or_create(ref->file_id)) {
                subscriber->on_manifest(manifest.value());
            }
            return;
        }
        case transfer::TopicKind::Chunk:
        case transfer::TopicKind::Retry: {
            auto chunk = transfer::decode_chunk(payload);
            if (chunk.is_error()) {
                spdlog::warn("Invalid chunk on {}: {}", topic, chunk.error().message);
                return;
            }
            if (chunk.value().file_id != ref->file_id) {
                return;
            }
            if (auto subscriber = find_or_create(ref->file_id)) {
                subscriber->on_chunk(chunk.value());
            }
            return;
        }
        case transfer::TopicKind::Status: {
            auto decoded = transfer::decode_status_payload(payload);
            if (decoded.is_error()) {
                spdlog::warn("Invalid status on {}: {}", topic, decoded.error().message);
                return;
            }
            // Status reports come from receivers, ours included.
            if (!std::holds_alternative<transfer::StatusRequest>(decoded.value())) {
                return;
            }
            if (auto subscriber = find_or_create(ref->file_id)) {
                subscriber->on_status_request();
            }
            return;
        }
        case transfer::TopicKind::Ack:
            return;
    }
}

std::shared_ptr<session::SubscriberSession> ReceiverService::find_or_create(const std::string& file_id) {
    std::lock_guard lock(mutex_);
    if (auto it = sessions_.find(file_id); it != sessions_.end()) {
        return it->second;
    }

    auto subscriber = std::make_shared<session::SubscriberSession>(
        session::SessionContext{transport_, store_, bus_, config_}, storage_, file_id);

    auto record = store_.load_subscriber(file_id);
    if (record.is_error()) {
        spdlog::error("Cannot load subscriber record {}: {}", file_id, record.error().describe());
        return nullptr;
    }
    if (record.value()) {
        if (auto res = subscriber->restore(*record.value()); res.is_error()) {
            return nullptr;
        }
    }

    sessions_.emplace(file_id, subscriber);
    return subscriber;
}

std::vector<std::shared_ptr<session::SubscriberSession>> ReceiverService::snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<std::shared_ptr<session::SubscriberSession>> subscribers;
    subscribers.reserve(sessions_.size());
    for (const auto& [file_id, subscriber] : sessions_) {
        subscribers.push_back(subscriber);
    }
    return subscribers;
}

void ReceiverService::schedule_tick() {
    timer_->expires_after(config_.status_interval);
    timer_->async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            return;  // cancelled
        }
        tick();

        std::lock_guard lock(mutex_);
        if (timer_) {
            schedule_tick();
        }
    });
}

void ReceiverService::on_reconnect() {
    std::vector<std::string> filters;
    {
        std::lock_guard lock(mutex_);
        filters.swap(filters_);
        subscriptions_.clear();
    }
    for (const auto& filter : filters) {
        subscribe(filter);
    }
    spdlog::info("Re-subscribed {} filter(s), reporting status for active transfers", filters.size());

    for (auto& subscriber : snapshot()) {
        subscriber->resync();
    }
}

} // namespace chunkbus::service
