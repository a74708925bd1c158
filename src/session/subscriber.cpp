#include "chunkbus/session/subscriber.hpp"
#include "chunkbus/events/events.hpp"
#include "chunkbus/transfer/codec.hpp"
#include "chunkbus/transfer/digest.hpp"

#include <spdlog/spdlog.h>

#include <ctime>

namespace chunkbus::session {

SubscriberSession::SubscriberSession(SessionContext context, storage::StorageProvider& storage, std::string file_id)
    : ctx_(context),
      storage_provider_(storage),
      file_id_(std::move(file_id)),
      topics_(ctx_.config.topic_namespace, file_id_) {
    record_.file_id = file_id_;
}

Result<void> SubscriberSession::restore(const state::SubscriberRecord& record) {
    std::lock_guard lock(mutex_);
    if (record.file_id != file_id_) {
        return Err<void>(ErrorCode::InvalidState, "Record " + record.file_id + " does not belong to " + file_id_);
    }
    record_ = record;
    record_created_ = true;

    if (!record_.manifest) {
        spdlog::info("Restored {} without manifest, waiting for meta", file_id_);
        return Ok();
    }
    if (record_.received.total() != record_.manifest->total_chunks) {
        record_.received = transfer::ChunkBitmap(record_.manifest->total_chunks);
    }

    if (auto res = attach_storage(*record_.manifest); res.is_error()) {
        surface(res.error());
        return res;
    }
    if (auto res = transition_to(SubscriberState::Receiving); res.is_error()) {
        return res;
    }
    spdlog::info("Restored {}: {}/{} chunk(s) received{}", file_id_, record_.received.count(),
                 record_.manifest->total_chunks, record_.acked ? ", acknowledged" : "");

    if (record_.acked && record_.ack_sent) {
        state_ = SubscriberState::Complete;
        return Ok();
    }
    if (record_.acked || record_.received.complete()) {
        verify_and_ack();
    }
    return Ok();
}

void SubscriberSession::on_manifest(const transfer::Manifest& manifest) {
    std::lock_guard lock(mutex_);
    if (manifest.file_id != file_id_) {
        return;
    }

    if (state_ != SubscriberState::AwaitingMeta) {
        if (record_.manifest && *record_.manifest != manifest) {
            spdlog::warn("Conflicting manifest for {} ignored", file_id_);
            return;
        }
        // A completed transfer seeing the manifest again means the publisher
        // restarted without our ack.
        if (state_ == SubscriberState::Complete) {
            spdlog::info("Manifest for completed {} received again", file_id_);
            answer_completed();
        }
        return;
    }

    if (auto res = attach_storage(manifest); res.is_error()) {
        surface(res.error());
        return;
    }

    if (!record_.manifest || *record_.manifest != manifest ||
        record_.received.total() != manifest.total_chunks) {
        record_.received = transfer::ChunkBitmap(manifest.total_chunks);
        record_.acked = false;
        record_.ack_sent = false;
    }
    record_.manifest = manifest;
    record_.destination = storage_->handle();
    if (auto res = persist(); res.is_error()) {
        surface(res.error());
        return;
    }
    record_created_ = true;

    if (auto res = transition_to(SubscriberState::Receiving); res.is_error()) {
        spdlog::error("{}", res.error().describe());
        return;
    }
    spdlog::info("Receiving {} ({} bytes, {} chunk(s)) into {}", file_id_, manifest.size,
                 manifest.total_chunks, record_.destination);

    if (record_.received.complete()) {
        verify_and_ack();
        pending_.clear();
        return;
    }

    auto buffered = std::move(pending_);
    pending_.clear();
    if (!buffered.empty()) {
        spdlog::debug("Replaying {} buffered chunk(s) for {}", buffered.size(), file_id_);
    }
    for (const auto& [index, chunk] : buffered) {
        accept_chunk(chunk);
        if (state_ != SubscriberState::Receiving) {
            break;
        }
    }

    if (state_ == SubscriberState::Receiving) {
        emit_status();
    }
}

void SubscriberSession::on_chunk(const transfer::ChunkMessage& chunk) {
    std::lock_guard lock(mutex_);
    if (chunk.file_id != file_id_) {
        return;
    }

    switch (state_) {
        case SubscriberState::AwaitingMeta:
            buffer_chunk(chunk);
            return;
        case SubscriberState::Receiving:
            accept_chunk(chunk);
            return;
        case SubscriberState::Verifying:
        case SubscriberState::Mismatched:
        case SubscriberState::Complete:
            spdlog::debug("Chunk {} of {} ignored in state {}", chunk.chunk_index, file_id_, to_string(state_));
            return;
    }
}

void SubscriberSession::on_status_request() {
    std::lock_guard lock(mutex_);
    if (state_ == SubscriberState::Complete) {
        answer_completed();
        return;
    }
    emit_status();
}

void SubscriberSession::tick() {
    std::lock_guard lock(mutex_);
    if (state_ == SubscriberState::Complete) {
        return;
    }

    // A completed bitmap whose verification could not finish earlier.
    if (state_ == SubscriberState::Receiving && record_.received.complete()) {
        verify_and_ack();
        return;
    }

    emit_status();

    if (progress_ == progress_at_last_tick_) {
        ++silent_intervals_;
    } else {
        silent_intervals_ = 0;
        progress_at_last_tick_ = progress_;
    }

    const auto limit = ctx_.config.stall_intervals;
    if (limit > 0 && silent_intervals_ > 0 && silent_intervals_ % limit == 0) {
        const auto status = build_status();
        ctx_.bus.emit(events::TransferStalledEvent{file_id_, status.received_count, status.total_chunks,
                                                   silent_intervals_});
    }
}

void SubscriberSession::resync() {
    std::lock_guard lock(mutex_);
    if (state_ == SubscriberState::Complete) {
        if (!record_.ack_sent) {
            publish_ack();
        }
        return;
    }
    emit_status();
}

SubscriberState SubscriberSession::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

transfer::StatusMessage SubscriberSession::status() const {
    std::lock_guard lock(mutex_);
    return build_status();
}

std::optional<transfer::Manifest> SubscriberSession::manifest() const {
    std::lock_guard lock(mutex_);
    return record_.manifest;
}

state::SubscriberRecord SubscriberSession::record() const {
    std::lock_guard lock(mutex_);
    return record_;
}

std::size_t SubscriberSession::buffered_chunks() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

std::optional<Error> SubscriberSession::last_error() const {
    std::lock_guard lock(mutex_);
    return last_error_;
}

// ──────────────────────────────────────────────────────────
// Internals (mutex_ held)
// ──────────────────────────────────────────────────────────

Result<void> SubscriberSession::transition_to(SubscriberState next) {
    if (!can_transition(state_, next)) {
        return Err<void>(ErrorCode::InvalidState, std::string("Illegal subscriber transition ") +
                         to_string(state_) + " -> " + to_string(next));
    }
    if (state_ != next) {
        spdlog::debug("Subscriber {}: {} -> {}", file_id_, to_string(state_), to_string(next));
    }
    state_ = next;
    return Ok();
}

Result<void> SubscriberSession::persist() {
    return ctx_.store.save_subscriber(record_);
}

void SubscriberSession::surface(Error error) {
    spdlog::error("Transfer {} (subscriber): {}", file_id_, error.describe());
    last_error_ = error;
    ctx_.bus.emit(events::TransferFailedEvent{file_id_, state::Role::Subscriber, std::move(error)});
}

Result<void> SubscriberSession::attach_storage(const transfer::Manifest& manifest) {
    auto storage = storage_provider_.open(manifest);
    if (storage.is_error()) {
        return Err<void>(storage.error());
    }
    storage_ = std::move(storage.value());
    return Ok();
}

void SubscriberSession::buffer_chunk(const transfer::ChunkMessage& chunk) {
    if (pending_.count(chunk.chunk_index) > 0) {
        return;
    }
    if (pending_.size() >= ctx_.config.max_buffered_chunks) {
        spdlog::debug("Buffer full for {}, dropping chunk {} received before manifest", file_id_, chunk.chunk_index);
        ctx_.bus.emit(events::ChunkRejectedEvent{file_id_, chunk.chunk_index, ErrorCode::UnknownFile});
        return;
    }

    const bool first = pending_.empty();
    pending_.emplace(chunk.chunk_index, chunk);

    if (!record_created_) {
        if (auto res = persist(); res.is_error()) {
            spdlog::warn("Cannot create record for {}: {}", file_id_, res.error().message);
        } else {
            record_created_ = true;
        }
    }
    if (first) {
        // total = 0 tells the publisher to send the manifest again.
        emit_status();
    }
}

void SubscriberSession::accept_chunk(const transfer::ChunkMessage& chunk) {
    const auto& manifest = *record_.manifest;
    const auto index = chunk.chunk_index;

    if (index >= manifest.total_chunks) {
        spdlog::warn("Chunk index {} out of range for {} ({} chunks)", index, file_id_, manifest.total_chunks);
        ctx_.bus.emit(events::ChunkRejectedEvent{file_id_, index, ErrorCode::InvalidMessage});
        return;
    }
    if (record_.received.test(index)) {
        spdlog::debug("Duplicate chunk {} of {}", index, file_id_);
        return;
    }

    if (chunk.payload.size() != manifest.chunk_length(index) ||
        transfer::digest_of(chunk.payload) != manifest.chunk_digests[index]) {
        spdlog::warn("Corrupt chunk {} of {} discarded", index, file_id_);
        ctx_.bus.emit(events::ChunkRejectedEvent{file_id_, index, ErrorCode::CorruptChunk});
        emit_status();
        return;
    }

    if (auto res = storage_->write_at(manifest.chunk_offset(index), chunk.payload); res.is_error()) {
        surface(res.error());
        return;
    }

    const bool gap = static_cast<std::int64_t>(index) > record_.received.highest() + 1;
    record_.received.set(index);
    ++progress_;
    ++accepted_since_status_;

    if (auto res = persist(); res.is_error()) {
        spdlog::warn("Progress for {} not saved: {}", file_id_, res.error().message);
    }
    ctx_.bus.emit(events::ChunkAcceptedEvent{file_id_, index, record_.received.count(),
                                             manifest.total_chunks, chunk.payload.size()});

    if (record_.received.complete()) {
        verify_and_ack();
        return;
    }
    const auto every = ctx_.config.status_every_n_chunks;
    if (gap || (every > 0 && accepted_since_status_ >= every)) {
        emit_status();
    }
}

void SubscriberSession::verify_and_ack() {
    if (auto res = transition_to(SubscriberState::Verifying); res.is_error()) {
        spdlog::error("{}", res.error().describe());
        return;
    }
    const auto& manifest = *record_.manifest;

    auto digest = storage_->digest();
    if (digest.is_error()) {
        surface(digest.error());
        state_ = SubscriberState::Receiving;
        return;
    }

    if (digest.value() != manifest.file_digest) {
        spdlog::warn("Whole-file digest mismatch for {}, requesting every chunk again", file_id_);
        ctx_.bus.emit(events::IntegrityResetEvent{file_id_, manifest.file_digest, digest.value()});
        state_ = SubscriberState::Mismatched;

        record_.received.clear();
        record_.acked = false;
        record_.ack_sent = false;
        if (auto res = persist(); res.is_error()) {
            spdlog::warn("Reset of {} not saved: {}", file_id_, res.error().message);
        }
        if (auto res = transition_to(SubscriberState::Receiving); res.is_error()) {
            spdlog::error("{}", res.error().describe());
            return;
        }
        emit_status();
        return;
    }

    record_.acked = true;
    if (auto res = persist(); res.is_error()) {
        // Retried from tick(); no ack goes out before acked is durable.
        spdlog::error("Cannot record verification of {}: {}", file_id_, res.error().describe());
        record_.acked = false;
        state_ = SubscriberState::Receiving;
        return;
    }

    state_ = SubscriberState::Complete;
    spdlog::info("Transfer {} verified ({} bytes)", file_id_, manifest.size);
    ctx_.bus.emit(events::TransferCompletedEvent{file_id_, state::Role::Subscriber, manifest.size,
                                                 manifest.file_digest});
    publish_ack();
}

void SubscriberSession::publish_ack() {
    const transfer::AckMessage ack{file_id_, transfer::AckOutcome::Ok, std::time(nullptr)};
    if (auto res = ctx_.transport.publish(topics_.ack, transfer::encode_ack(ack)); res.is_error()) {
        spdlog::warn("Ack for {} not published, will retry on reconnect: {}", file_id_, res.error().message);
        return;
    }
    if (record_.ack_sent) {
        return;
    }
    record_.ack_sent = true;
    if (auto res = persist(); res.is_error()) {
        spdlog::warn("ack_sent marker for {} not saved: {}", file_id_, res.error().message);
    }
}

// The ack goes out once; later queries get a verified-complete status.
void SubscriberSession::answer_completed() {
    if (!record_.ack_sent) {
        publish_ack();
        return;
    }
    emit_status();
}

transfer::StatusMessage SubscriberSession::build_status() const {
    transfer::StatusMessage status;
    status.file_id = file_id_;
    if (!record_.manifest) {
        status.received_count = static_cast<std::uint32_t>(pending_.size());
        status.total_chunks = 0;
        return status;
    }
    status.received_count = record_.received.count();
    status.total_chunks = record_.manifest->total_chunks;
    status.missing_indices = record_.received.missing();
    status.complete = state_ == SubscriberState::Complete;
    return status;
}

void SubscriberSession::emit_status() {
    const auto status = build_status();
    accepted_since_status_ = 0;

    if (auto res = ctx_.transport.publish(topics_.status, transfer::encode_status(status)); res.is_error()) {
        spdlog::warn("Status for {} not published: {}", file_id_, res.error().message);
        return;
    }
    ctx_.bus.emit(events::StatusReportedEvent{file_id_, status.received_count, status.total_chunks,
                                              status.missing_indices.size(), status.complete});
}

} // namespace chunkbus::session
