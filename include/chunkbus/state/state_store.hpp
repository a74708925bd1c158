#pragma once

#include "chunkbus/core/result.hpp"
#include "chunkbus/state/record_store.hpp"
#include "chunkbus/state/records.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkbus::state {

/**
 * @brief Typed access to publisher/subscriber records over a RecordStore
 *
 * Records are encoded as JSON. The manifest is stored apart from the
 * progress fields and rewritten only when it differs from the one last
 * written through this store, so a per-chunk save costs a bitmap, not the
 * full digest list. save_* stamps last_update with a value that never
 * decreases for a given record, even if the wall clock steps back.
 */
class TransferStateStore {
public:
    explicit TransferStateStore(RecordStore& records);

    Result<std::optional<PublisherRecord>> load_publisher(const std::string& file_id) const;
    Result<void> save_publisher(PublisherRecord& record);

    Result<std::optional<SubscriberRecord>> load_subscriber(const std::string& file_id) const;
    Result<void> save_subscriber(SubscriberRecord& record);

    Result<void> remove(const std::string& file_id, Role role);

    Result<std::vector<std::string>> list(Role role) const;

    /**
     * @brief Deletes acknowledged records not updated within `retention`
     *
     * Publisher records qualify once acknowledged, subscriber records once
     * the ack was sent. Returns the number of records removed.
     */
    Result<std::size_t> purge_completed(std::chrono::milliseconds retention);

    static std::int64_t now_ms();

private:
    Result<void> save_manifest(const transfer::Manifest& manifest, Role role);
    Result<std::optional<transfer::Manifest>> load_manifest(const std::string& file_id, Role role) const;

    RecordStore& records_;

    std::mutex written_mutex_;
    std::unordered_map<std::string, std::string> written_manifests_;  // "role|file_id" -> fingerprint
};

/// Progress fields only; the manifest travels separately.
nlohmann::json publisher_record_to_json(const PublisherRecord& record);
Result<PublisherRecord> publisher_record_from_json(const nlohmann::json& j, transfer::Manifest manifest);

nlohmann::json subscriber_record_to_json(const SubscriberRecord& record);
Result<SubscriberRecord> subscriber_record_from_json(const nlohmann::json& j,
                                                     std::optional<transfer::Manifest> manifest);

} // namespace chunkbus::state
