#include "chunkbus/state/state_store.hpp"
#include "chunkbus/transfer/codec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace chunkbus::state {

using json = nlohmann::json;

namespace {

Result<json> parse_blob(const std::string& blob) {
    auto j = json::parse(blob, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Err<json>(ErrorCode::StateStore, "Corrupt state record");
    }
    return Ok(std::move(j));
}

// Every manifest field except the per-chunk digests, which follow from the
// content (file digest) and the chunk size.
std::string fingerprint(const transfer::Manifest& manifest) {
    return manifest.file_id + '|' + manifest.file_digest + '|' + std::to_string(manifest.size) + '|' +
           std::to_string(manifest.chunk_size) + '|' + std::to_string(manifest.total_chunks) + '|' +
           manifest.name + '|' + manifest.content_descriptor + '|' + std::to_string(manifest.timestamp);
}

std::string cache_key(const std::string& file_id, Role role) {
    return std::string(to_string(role)) + '|' + file_id;
}

} // namespace

json publisher_record_to_json(const PublisherRecord& record) {
    json j;
    j["file_id"] = record.manifest.file_id;
    j["source"] = record.source;
    j["acknowledged"] = record.acknowledged;
    j["retry_queue"] = std::vector<std::uint32_t>(record.retry_queue.begin(), record.retry_queue.end());
    j["next_first_pass_index"] = record.next_first_pass_index;
    j["last_update"] = record.last_update;
    return j;
}

Result<PublisherRecord> publisher_record_from_json(const json& j, transfer::Manifest manifest) {
    PublisherRecord record;
    record.manifest = std::move(manifest);
    try {
        record.source = j.value("source", std::string{});
        record.acknowledged = j.value("acknowledged", false);
        const auto queue = j.value("retry_queue", std::vector<std::uint32_t>{});
        record.retry_queue.insert(queue.begin(), queue.end());
        record.next_first_pass_index = j.value("next_first_pass_index", 0u);
        record.last_update = j.value("last_update", std::int64_t{0});
    } catch (const json::exception& e) {
        return Err<PublisherRecord>(ErrorCode::StateStore, std::string("Malformed publisher record: ") + e.what());
    }
    return Ok(std::move(record));
}

json subscriber_record_to_json(const SubscriberRecord& record) {
    json j;
    j["file_id"] = record.file_id;
    j["received"] = record.received.to_hex();
    j["destination"] = record.destination;
    j["acked"] = record.acked;
    j["ack_sent"] = record.ack_sent;
    j["last_update"] = record.last_update;
    return j;
}

Result<SubscriberRecord> subscriber_record_from_json(const json& j, std::optional<transfer::Manifest> manifest) {
    SubscriberRecord record;
    record.manifest = std::move(manifest);
    try {
        record.file_id = j.at("file_id").get<std::string>();
        record.destination = j.value("destination", std::string{});
        record.acked = j.value("acked", false);
        record.ack_sent = j.value("ack_sent", false);
        record.last_update = j.value("last_update", std::int64_t{0});

        const auto total = record.manifest ? record.manifest->total_chunks : 0u;
        if (!transfer::ChunkBitmap::from_hex(j.value("received", std::string{}), total, record.received)) {
            return Err<SubscriberRecord>(ErrorCode::StateStore, "Corrupt received bitmap for " + record.file_id);
        }
    } catch (const json::exception& e) {
        return Err<SubscriberRecord>(ErrorCode::StateStore, std::string("Malformed subscriber record: ") + e.what());
    }
    return Ok(std::move(record));
}

TransferStateStore::TransferStateStore(RecordStore& records) : records_(records) {}

std::int64_t TransferStateStore::now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

Result<void> TransferStateStore::save_manifest(const transfer::Manifest& manifest, Role role) {
    const auto key = cache_key(manifest.file_id, role);
    const auto print = fingerprint(manifest);
    {
        std::lock_guard lock(written_mutex_);
        auto it = written_manifests_.find(key);
        if (it != written_manifests_.end() && it->second == print) {
            return Ok();
        }
    }

    auto res = records_.put({manifest.file_id, role, RecordPart::Manifest},
                            transfer::manifest_to_json(manifest).dump());
    if (res.is_error()) {
        return res;
    }
    std::lock_guard lock(written_mutex_);
    written_manifests_[key] = print;
    return Ok();
}

Result<std::optional<transfer::Manifest>> TransferStateStore::load_manifest(const std::string& file_id,
                                                                            Role role) const {
    auto blob = records_.get({file_id, role, RecordPart::Manifest});
    if (blob.is_error()) {
        return Err<std::optional<transfer::Manifest>>(blob.error());
    }
    if (!blob.value()) {
        return Ok(std::optional<transfer::Manifest>{});
    }
    auto j = parse_blob(*blob.value());
    if (j.is_error()) {
        return Err<std::optional<transfer::Manifest>>(j.error());
    }
    auto manifest = transfer::manifest_from_json(j.value());
    if (manifest.is_error()) {
        return Err<std::optional<transfer::Manifest>>(ErrorCode::StateStore,
                                                      "Corrupt manifest record for " + file_id + ": " +
                                                      manifest.error().message);
    }
    return Ok(std::optional<transfer::Manifest>{std::move(manifest.value())});
}

Result<std::optional<PublisherRecord>> TransferStateStore::load_publisher(const std::string& file_id) const {
    auto blob = records_.get({file_id, Role::Publisher});
    if (blob.is_error()) {
        return Err<std::optional<PublisherRecord>>(blob.error());
    }
    if (!blob.value()) {
        return Ok(std::optional<PublisherRecord>{});
    }
    auto j = parse_blob(*blob.value());
    if (j.is_error()) {
        return Err<std::optional<PublisherRecord>>(j.error());
    }

    auto manifest = load_manifest(file_id, Role::Publisher);
    if (manifest.is_error()) {
        return Err<std::optional<PublisherRecord>>(manifest.error());
    }
    if (!manifest.value()) {
        return Err<std::optional<PublisherRecord>>(ErrorCode::StateStore,
                                                   "Publisher record " + file_id + " has no manifest");
    }

    auto record = publisher_record_from_json(j.value(), std::move(*manifest.value()));
    if (record.is_error()) {
        return Err<std::optional<PublisherRecord>>(record.error());
    }
    return Ok(std::optional<PublisherRecord>{std::move(record.value())});
}

Result<void> TransferStateStore::save_publisher(PublisherRecord& record) {
    if (auto res = save_manifest(record.manifest, Role::Publisher); res.is_error()) {
        return res;
    }
    record.last_update = std::max(record.last_update, now_ms());
    return records_.put({record.manifest.file_id, Role::Publisher}, publisher_record_to_json(record).dump());
}

Result<std::optional<SubscriberRecord>> TransferStateStore::load_subscriber(const std::string& file_id) const {
    auto blob = records_.get({file_id, Role::Subscriber});
    if (blob.is_error()) {
        return Err<std::optional<SubscriberRecord>>(blob.error());
    }
    if (!blob.value()) {
        return Ok(std::optional<SubscriberRecord>{});
    }
    auto j = parse_blob(*blob.value());
    if (j.is_error()) {
        return Err<std::optional<SubscriberRecord>>(j.error());
    }

    auto manifest = load_manifest(file_id, Role::Subscriber);
    if (manifest.is_error()) {
        return Err<std::optional<SubscriberRecord>>(manifest.error());
    }

    auto record = subscriber_record_from_json(j.value(), std::move(manifest.value()));
    if (record.is_error()) {
        return Err<std::optional<SubscriberRecord>>(record.error());
    }
    return Ok(std::optional<SubscriberRecord>{std::move(record.value())});
}

Result<void> TransferStateStore::save_subscriber(SubscriberRecord& record) {
    if (record.manifest) {
        if (auto res = save_manifest(*record.manifest, Role::Subscriber); res.is_error()) {
            return res;
        }
    }
    record.last_update = std::max(record.last_update, now_ms());
    return records_.put({record.file_id, Role::Subscriber}, subscriber_record_to_json(record).dump());
}

Result<void> TransferStateStore::remove(const std::string& file_id, Role role) {
    {
        std::lock_guard lock(written_mutex_);
        written_manifests_.erase(cache_key(file_id, role));
    }
    if (auto res = records_.remove({file_id, role, RecordPart::Manifest}); res.is_error()) {
        return res;
    }
    return records_.remove({file_id, role});
}

Result<std::vector<std::string>> TransferStateStore::list(Role role) const {
    return records_.list(role);
}

Result<std::size_t> TransferStateStore::purge_completed(std::chrono::milliseconds retention) {
    const std::int64_t cutoff = now_ms() - retention.count();
    std::size_t removed = 0;

    auto publishers = list(Role::Publisher);
    if (publishers.is_error()) {
        return Err<std::size_t>(publishers.error());
    }
    for (const auto& file_id : publishers.value()) {
        auto record = load_publisher(file_id);
        if (record.is_error()) {
            spdlog::warn("Skipping unreadable publisher record {}: {}", file_id, record.error().message);
            continue;
        }
        if (record.value() && record.value()->acknowledged && record.value()->last_update < cutoff) {
            if (auto res = remove(file_id, Role::Publisher); res.is_error()) {
                return Err<std::size_t>(res.error());
            }
            ++removed;
        }
    }

    auto subscribers = list(Role::Subscriber);
    if (subscribers.is_error()) {
        return Err<std::size_t>(subscribers.error());
    }
    for (const auto& file_id : subscribers.value()) {
        auto record = load_subscriber(file_id);
        if (record.is_error()) {
            spdlog::warn("Skipping unreadable subscriber record {}: {}", file_id, record.error().message);
            continue;
        }
        if (record.value() && record.value()->ack_sent && record.value()->last_update < cutoff) {
            if (auto res = remove(file_id, Role::Subscriber); res.is_error()) {
                return Err<std::size_t>(res.error());
            }
            ++removed;
        }
    }

    if (removed > 0) {
        spdlog::info("Purged {} completed transfer record(s)", removed);
    }
    return Ok(removed);
}

} // namespace chunkbus::state
