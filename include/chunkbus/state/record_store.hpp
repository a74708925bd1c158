#pragma once

/**
 * @file record_store.hpp
 * @brief Key-value persistence for transfer records
 *
 * WHAT IT DOES:
 * Stores one opaque blob per (file_id, role, part). The protocol layer never
 * touches files directly; it goes through this interface so the same logic
 * runs against the in-memory store in tests and the directory store in a
 * deployment.
 *
 * IMPLEMENTATIONS:
 * - MemoryRecordStore: std::unordered_map behind a reader-writer lock
 * - DirectoryRecordStore: one JSON file per record, replaced atomically
 *
 * EXAMPLE:
 * DirectoryRecordStore store(".transfer/state");
 * store.put({"report.pdf-1024-ab12cd34", Role::Subscriber}, blob);
 * auto loaded = store.get({"report.pdf-1024-ab12cd34", Role::Subscriber});
 */

#include "chunkbus/core/result.hpp"
#include "chunkbus/state/records.hpp"

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkbus::state {

class RecordStore {
public:
    virtual ~RecordStore() = default;

    /// nullopt when no record exists; StateStore error on I/O failure.
    virtual Result<std::optional<std::string>> get(const RecordKey& key) const = 0;

    /// Replaces the record. Returns only after the write is durable.
    virtual Result<void> put(const RecordKey& key, const std::string& blob) = 0;

    /// Removing a missing record is not an error.
    virtual Result<void> remove(const RecordKey& key) = 0;

    /// file_ids with a progress record for `role`.
    virtual Result<std::vector<std::string>> list(Role role) const = 0;
};

/**
 * @brief Thread-safe in-memory record storage
 *
 * CONCURRENCY MODEL:
 * - get/list: shared_lock (concurrent readers)
 * - put/remove: unique_lock (exclusive writer)
 *
 * Survives a simulated restart as long as the instance is kept alive, which
 * is how the crash-recovery tests model durable state.
 */
class MemoryRecordStore : public RecordStore {
public:
    MemoryRecordStore() = default;

    Result<std::optional<std::string>> get(const RecordKey& key) const override;
    Result<void> put(const RecordKey& key, const std::string& blob) override;
    Result<void> remove(const RecordKey& key) override;
    Result<std::vector<std::string>> list(Role role) const override;

    size_t size() const;

private:
    static std::string make_key(const RecordKey& key);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::string> records_;  // "section|file_id" -> blob
};

/**
 * @brief One file per record under {root}/{role}/, manifests under {root}/{role}/manifests/
 *
 * put() writes a temporary sibling and renames it over the record, so a
 * crash leaves either the old or the new version. file_ids are
 * percent-encoded into file names.
 */
class DirectoryRecordStore : public RecordStore {
public:
    explicit DirectoryRecordStore(std::filesystem::path root);

    Result<std::optional<std::string>> get(const RecordKey& key) const override;
    Result<void> put(const RecordKey& key, const std::string& blob) override;
    Result<void> remove(const RecordKey& key) override;
    Result<std::vector<std::string>> list(Role role) const override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path path_for(const RecordKey& key) const;

    std::filesystem::path root_;
    mutable std::shared_mutex mutex_;
};

std::string encode_file_name(const std::string& file_id);
std::optional<std::string> decode_file_name(const std::string& name);

} // namespace chunkbus::state
