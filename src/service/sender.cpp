#include "chunkbus/service/sender.hpp"
#include "chunkbus/transfer/codec.hpp"
#include "chunkbus/transfer/topics.hpp"

#include <spdlog/spdlog.h>

#include <variant>

namespace chunkbus::service {
namespace fs = std::filesystem;

namespace {

Result<std::unique_ptr<transfer::ByteSource>> open_file_source(const std::string& locator) {
    auto source = transfer::FileByteSource::open(locator);
    if (source.is_error()) {
        return Err<std::unique_ptr<transfer::ByteSource>>(source.error());
    }
    return Ok<std::unique_ptr<transfer::ByteSource>>(std::move(source.value()));
}

} // namespace

SenderService::SenderService(transport::Transport& transport,
                             state::TransferStateStore& store,
                             events::EventBus& bus,
                             const TransferConfig& config)
    : transport_(transport), store_(store), bus_(bus), config_(config) {
    reconnect_id_ = transport_.on_reconnect([this]() { on_reconnect(); });
}

SenderService::~SenderService() {
    transport_.unsubscribe(reconnect_id_);
    std::lock_guard lock(mutex_);
    for (auto& [file_id, entry] : entries_) {
        for (auto id : entry.subscriptions) {
            transport_.unsubscribe(id);
        }
    }
}

Result<std::string> SenderService::send_file(const fs::path& path, std::string file_id) {
    auto source = transfer::FileByteSource::open(path);
    if (source.is_error()) {
        spdlog::error("Cannot send {}: {}", path.string(), source.error().message);
        return Err<std::string>(source.error());
    }

    transfer::ManifestOptions options;
    options.name = path.filename().string();
    options.file_id = file_id.empty() ? transfer::generate_file_id(options.name, source.value()->size())
                                      : std::move(file_id);
    options.content_descriptor = transfer::guess_content_type(path);
    options.chunk_size = config_.chunk_size;
    return send(std::move(source.value()), std::move(options));
}

Result<std::string> SenderService::send(std::unique_ptr<transfer::ByteSource> source,
                                        transfer::ManifestOptions options) {
    if (options.file_id.empty()) {
        return Err<std::string>(ErrorCode::InvalidState, "file_id must not be empty");
    }
    if (options.chunk_size == 0) {
        options.chunk_size = config_.chunk_size;
    }

    const std::string file_id = options.file_id;
    auto publisher = std::make_shared<session::PublisherSession>(
        session::SessionContext{transport_, store_, bus_, config_}, std::move(source));

    {
        std::lock_guard lock(mutex_);
        if (entries_.count(file_id) > 0) {
            return Err<std::string>(ErrorCode::InvalidState, "Transfer " + file_id + " already in progress");
        }
        entries_[file_id] = Entry{publisher, subscribe_file(file_id, publisher)};
    }

    if (auto res = publisher->start(options); res.is_error()) {
        release(file_id);
        return Err<std::string>(res.error());
    }
    return Ok(file_id);
}

Result<std::size_t> SenderService::recover(SourceOpener opener) {
    if (!opener) {
        opener = &open_file_source;
    }

    auto ids = store_.list(state::Role::Publisher);
    if (ids.is_error()) {
        return Err<std::size_t>(ids.error());
    }

    std::size_t resumed = 0;
    for (const auto& file_id : ids.value()) {
        {
            std::lock_guard lock(mutex_);
            if (entries_.count(file_id) > 0) {
                continue;
            }
        }

        auto record = store_.load_publisher(file_id);
        if (record.is_error()) {
            spdlog::error("Cannot load publisher record {}: {}", file_id, record.error().describe());
            continue;
        }
        if (!record.value() || record.value()->acknowledged) {
            continue;
        }

        std::unique_ptr<transfer::ByteSource> source;
        if (auto opened = opener(record.value()->source); opened.is_ok()) {
            source = std::move(opened.value());
        } else {
            spdlog::error("Cannot reopen source {} for {}: {}", record.value()->source, file_id,
                          opened.error().message);
        }

        auto publisher = std::make_shared<session::PublisherSession>(
            session::SessionContext{transport_, store_, bus_, config_}, std::move(source));
        {
            std::lock_guard lock(mutex_);
            entries_[file_id] = Entry{publisher, subscribe_file(file_id, publisher)};
        }
        if (publisher->resume(*record.value()).is_error()) {
            // The record stays on disk; a later recover() can try again.
            release(file_id);
            continue;
        }
        ++resumed;
    }

    spdlog::info("Resumed {} publisher transfer(s)", resumed);
    return Ok(resumed);
}

Result<void> SenderService::abandon(const std::string& file_id) {
    release(file_id);
    spdlog::info("Abandoned outgoing transfer {}", file_id);
    return store_.remove(file_id, state::Role::Publisher);
}

void SenderService::release(const std::string& file_id) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(file_id);
    if (it == entries_.end()) {
        return;
    }
    for (auto id : it->second.subscriptions) {
        transport_.unsubscribe(id);
    }
    entries_.erase(it);
}

Result<std::size_t> SenderService::purge_completed(std::chrono::milliseconds retention) {
    return store_.purge_completed(retention);
}

std::shared_ptr<session::PublisherSession> SenderService::publisher(const std::string& file_id) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(file_id);
    return it != entries_.end() ? it->second.publisher : nullptr;
}

std::vector<std::string> SenderService::file_ids() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& [file_id, entry] : entries_) {
        ids.push_back(file_id);
    }
    return ids;
}

void SenderService::poll() {
    std::vector<std::shared_ptr<session::PublisherSession>> publishers;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [file_id, entry] : entries_) {
            publishers.push_back(entry.publisher);
        }
    }
    for (auto& publisher : publishers) {
        publisher->poll();
    }
}

bool SenderService::all_acknowledged() const {
    std::lock_guard lock(mutex_);
    for (const auto& [file_id, entry] : entries_) {
        if (entry.publisher->state() != session::PublisherState::Acked) {
            return false;
        }
    }
    return true;
}

std::vector<transport::SubscriptionId> SenderService::subscribe_file(
    const std::string& file_id, const std::shared_ptr<session::PublisherSession>& publisher) {
    const transfer::FileTopics topics(config_.topic_namespace, file_id);

    auto status_id = transport_.subscribe(topics.status, [publisher](const std::string& topic, const std::string& payload) {
        auto decoded = transfer::decode_status_payload(payload);
        if (decoded.is_error()) {
            spdlog::warn("Undecodable status on {}: {}", topic, decoded.error().message);
            return;
        }
        // Status requests are our own polls.
        if (const auto* status = std::get_if<transfer::StatusMessage>(&decoded.value())) {
            publisher->on_status(*status);
        }
    });

    auto ack_id = transport_.subscribe(topics.ack, [publisher](const std::string& topic, const std::string& payload) {
        auto ack = transfer::decode_ack(payload);
        if (ack.is_error()) {
            spdlog::warn("Undecodable ack on {}: {}", topic, ack.error().message);
            return;
        }
        publisher->on_ack(ack.value());
    });

    return {status_id, ack_id};
}

void SenderService::on_reconnect() {
    std::lock_guard lock(mutex_);
    for (auto& [file_id, entry] : entries_) {
        entry.subscriptions = subscribe_file(file_id, entry.publisher);
    }
    spdlog::info("Re-subscribed {} outgoing transfer(s)", entries_.size());
}

} // namespace chunkbus::service
