#include "chunkbus/session/publisher.hpp"
#include "chunkbus/events/events.hpp"
#include "chunkbus/transfer/codec.hpp"
#include "chunkbus/transfer/digest.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace chunkbus::session {

PublisherSession::PublisherSession(SessionContext context, std::unique_ptr<transfer::ByteSource> source)
    : ctx_(context), source_(std::move(source)) {}

Result<void> PublisherSession::start(const transfer::ManifestOptions& options) {
    std::lock_guard lock(mutex_);
    if (state_ != PublisherState::Idle) {
        return Err<void>(ErrorCode::InvalidState,
                         std::string("Publisher already started (state ") + to_string(state_) + ")");
    }
    if (!source_) {
        return fail(Error{ErrorCode::SourceUnavailable, "No byte source for " + options.file_id});
    }

    auto manifest = transfer::build_manifest(*source_, options);
    if (manifest.is_error()) {
        record_.manifest.file_id = options.file_id;
        return fail(manifest.error());
    }

    record_ = state::PublisherRecord{};
    record_.manifest = std::move(manifest.value());
    record_.source = source_->locator();
    topics_.emplace(ctx_.config.topic_namespace, record_.manifest.file_id);

    if (auto res = persist(); res.is_error()) {
        return fail(res.error());
    }
    if (auto res = transition_to(PublisherState::Sending); res.is_error()) {
        return res;
    }

    ctx_.bus.emit(events::TransferStartedEvent{record_.manifest.file_id, record_.manifest.name,
                                               record_.manifest.size, record_.manifest.total_chunks, false});

    publish_manifest();
    if (auto res = run_first_pass(); res.is_error()) {
        return res;
    }
    request_status();
    return transition_to(PublisherState::AwaitingAck);
}

Result<void> PublisherSession::resume(const state::PublisherRecord& record) {
    std::lock_guard lock(mutex_);
    if (state_ != PublisherState::Idle) {
        return Err<void>(ErrorCode::InvalidState,
                         std::string("Cannot resume a running publisher (state ") + to_string(state_) + ")");
    }

    record_ = record;
    topics_.emplace(ctx_.config.topic_namespace, record_.manifest.file_id);

    if (record_.acknowledged) {
        spdlog::info("Transfer {} already acknowledged, nothing to resume", record_.manifest.file_id);
        return transition_to(PublisherState::Acked);
    }

    if (!source_) {
        return fail(Error{ErrorCode::SourceUnavailable, "Source " + record_.source + " cannot be reopened"});
    }
    if (source_->size() != record_.manifest.size) {
        return fail(Error{ErrorCode::SourceUnavailable,
                          "Source " + record_.source + " changed size since the manifest was built"});
    }

    if (auto res = transition_to(PublisherState::Sending); res.is_error()) {
        return res;
    }
    spdlog::info("Resuming transfer {} at chunk {}/{} with {} queued resend(s)",
                 record_.manifest.file_id, record_.next_first_pass_index,
                 record_.manifest.total_chunks, record_.retry_queue.size());
    ctx_.bus.emit(events::TransferStartedEvent{record_.manifest.file_id, record_.manifest.name,
                                               record_.manifest.size, record_.manifest.total_chunks, true});

    publish_manifest();
    if (auto res = run_first_pass(); res.is_error()) {
        return res;
    }
    if (auto res = flush_retry_queue(); res.is_error()) {
        return res;
    }
    request_status();
    return transition_to(PublisherState::AwaitingAck);
}

void PublisherSession::on_status(const transfer::StatusMessage& status) {
    std::lock_guard lock(mutex_);
    if (state_ == PublisherState::Idle || state_ == PublisherState::Acked || state_ == PublisherState::Failed) {
        spdlog::debug("Ignoring status for {} in state {}", status.file_id, to_string(state_));
        return;
    }
    const auto& manifest = record_.manifest;
    if (status.file_id != manifest.file_id) {
        return;
    }

    // Only a verified receiver reports complete; it stands in for an ack that was lost.
    if (status.complete && state_ == PublisherState::AwaitingAck && status.missing_indices.empty() &&
        status.total_chunks == manifest.total_chunks && status.received_count == manifest.total_chunks) {
        spdlog::info("Receiver reports {} verified, treating as acknowledged", manifest.file_id);
        acknowledge();
        return;
    }

    if (status.total_chunks != manifest.total_chunks) {
        spdlog::info("Receiver reports {} chunk(s) for {} (expected {}), re-publishing manifest",
                     status.total_chunks, manifest.file_id, manifest.total_chunks);
        publish_manifest();
    }

    std::size_t queued = 0;
    for (auto index : status.missing_indices) {
        if (index >= manifest.total_chunks) {
            spdlog::warn("Status for {} lists out-of-range chunk {}", manifest.file_id, index);
            continue;
        }
        if (record_.retry_queue.insert(index).second) {
            ++queued;
        }
    }
    if (record_.retry_queue.empty()) {
        return;
    }

    if (auto res = persist(); res.is_error()) {
        spdlog::error("Cannot persist retry set for {}: {}", manifest.file_id, res.error().describe());
        return;
    }
    spdlog::debug("Status for {}: {}/{} received, {} newly queued", manifest.file_id,
                  status.received_count, status.total_chunks, queued);

    if (auto res = transition_to(PublisherState::Sending); res.is_error()) {
        spdlog::error("{}", res.error().describe());
        return;
    }
    if (auto res = flush_retry_queue(); res.is_error()) {
        return;
    }
    if (auto res = transition_to(PublisherState::AwaitingAck); res.is_error()) {
        spdlog::error("{}", res.error().describe());
    }
}

void PublisherSession::on_ack(const transfer::AckMessage& ack) {
    std::lock_guard lock(mutex_);
    if (ack.file_id != record_.manifest.file_id) {
        return;
    }
    if (state_ == PublisherState::Acked) {
        spdlog::debug("Duplicate ack for {}", ack.file_id);
        return;
    }
    if (ack.outcome == transfer::AckOutcome::Failed) {
        spdlog::warn("Receiver reported failure for {}, waiting for status", ack.file_id);
        return;
    }
    if (state_ != PublisherState::AwaitingAck) {
        spdlog::debug("Ignoring ack for {} in state {}", ack.file_id, to_string(state_));
        return;
    }
    acknowledge();
}

void PublisherSession::acknowledge() {
    const auto& file_id = record_.manifest.file_id;
    record_.acknowledged = true;
    record_.retry_queue.clear();
    if (auto res = persist(); res.is_error()) {
        spdlog::error("Cannot persist acknowledgement for {}: {}", file_id, res.error().describe());
        record_.acknowledged = false;
        return;
    }

    if (auto res = transition_to(PublisherState::Acked); res.is_error()) {
        spdlog::error("{}", res.error().describe());
        return;
    }
    spdlog::info("Transfer {} acknowledged", file_id);
    ctx_.bus.emit(events::TransferCompletedEvent{record_.manifest.file_id, state::Role::Publisher,
                                                 record_.manifest.size, record_.manifest.file_digest});
}

void PublisherSession::poll() {
    std::lock_guard lock(mutex_);
    if (state_ == PublisherState::AwaitingAck) {
        request_status();
    }
}

PublisherState PublisherSession::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

std::string PublisherSession::file_id() const {
    std::lock_guard lock(mutex_);
    return record_.manifest.file_id;
}

std::optional<transfer::Manifest> PublisherSession::manifest() const {
    std::lock_guard lock(mutex_);
    if (record_.manifest.chunk_size == 0) {
        return std::nullopt;
    }
    return record_.manifest;
}

std::set<std::uint32_t> PublisherSession::retry_queue() const {
    std::lock_guard lock(mutex_);
    return record_.retry_queue;
}

std::optional<Error> PublisherSession::last_error() const {
    std::lock_guard lock(mutex_);
    return last_error_;
}

// ──────────────────────────────────────────────────────────
// Internals (mutex_ held)
// ──────────────────────────────────────────────────────────

Result<void> PublisherSession::transition_to(PublisherState next) {
    if (!can_transition(state_, next)) {
        return Err<void>(ErrorCode::InvalidState, std::string("Illegal publisher transition ") +
                         to_string(state_) + " -> " + to_string(next));
    }
    if (state_ != next) {
        spdlog::debug("Publisher {}: {} -> {}", record_.manifest.file_id, to_string(state_), to_string(next));
    }
    state_ = next;
    return Ok();
}

Result<void> PublisherSession::fail(Error error) {
    spdlog::error("Transfer {} failed: {}", record_.manifest.file_id, error.describe());
    last_error_ = error;
    state_ = PublisherState::Failed;
    ctx_.bus.emit(events::TransferFailedEvent{record_.manifest.file_id, state::Role::Publisher, error});
    return Err<void>(std::move(error));
}

Result<void> PublisherSession::persist() {
    return ctx_.store.save_publisher(record_);
}

void PublisherSession::publish_manifest() {
    auto res = ctx_.transport.publish(topics_->meta, transfer::encode_manifest(record_.manifest));
    if (res.is_error()) {
        spdlog::warn("Manifest for {} not published: {}", record_.manifest.file_id, res.error().message);
    }
}

Result<void> PublisherSession::publish_chunk(std::uint32_t index, transfer::TopicKind kind) {
    auto chunk = transfer::read_chunk(*source_, record_.manifest, index);
    if (chunk.is_error()) {
        return fail(chunk.error());
    }
    if (transfer::digest_of(chunk.value().payload) != chunk.value().digest) {
        return fail(Error{ErrorCode::SourceUnavailable,
                          "Source " + record_.source + " no longer matches chunk " + std::to_string(index)});
    }

    auto res = ctx_.transport.publish(topics_->for_kind(kind), transfer::encode_chunk(chunk.value()));
    if (res.is_error()) {
        // Left to the status loop: the receiver will report the index missing.
        spdlog::warn("Chunk {} of {} not published: {}", index, record_.manifest.file_id, res.error().message);
    }
    return Ok();
}

Result<void> PublisherSession::run_first_pass() {
    const auto total = record_.manifest.total_chunks;
    const auto checkpoint = ctx_.config.checkpoint_interval;

    for (auto index = record_.next_first_pass_index; index < total; ++index) {
        if (auto res = publish_chunk(index, transfer::TopicKind::Chunk); res.is_error()) {
            return res;
        }
        if (checkpoint > 0 && (index + 1) % checkpoint == 0 && index + 1 < total) {
            record_.next_first_pass_index = index + 1;
            if (auto res = persist(); res.is_error()) {
                spdlog::warn("Checkpoint for {} not saved: {}", record_.manifest.file_id, res.error().message);
            }
        }
    }

    if (record_.next_first_pass_index != total) {
        record_.next_first_pass_index = total;
        if (auto res = persist(); res.is_error()) {
            return fail(res.error());
        }
    }
    spdlog::info("Published {} chunk(s) of {}", total, record_.manifest.file_id);
    return Ok();
}

Result<void> PublisherSession::flush_retry_queue() {
    if (record_.retry_queue.empty()) {
        return Ok();
    }

    const auto kind = ctx_.config.resend_on_chunk_channel ? transfer::TopicKind::Chunk : transfer::TopicKind::Retry;
    std::vector<std::uint32_t> resent(record_.retry_queue.begin(), record_.retry_queue.end());
    for (auto index : resent) {
        if (auto res = publish_chunk(index, kind); res.is_error()) {
            return res;
        }
    }

    record_.retry_queue.clear();
    if (auto res = persist(); res.is_error()) {
        spdlog::warn("Cleared retry set for {} not saved: {}", record_.manifest.file_id, res.error().message);
    }
    ctx_.bus.emit(events::ChunksResentEvent{record_.manifest.file_id, std::move(resent)});
    return Ok();
}

void PublisherSession::request_status() {
    auto payload = transfer::encode_status_request(transfer::StatusRequest{record_.manifest.file_id});
    if (auto res = ctx_.transport.publish(topics_->status, std::move(payload)); res.is_error()) {
        spdlog::warn("Status request for {} not published: {}", record_.manifest.file_id, res.error().message);
    }
}

} // namespace chunkbus::session
