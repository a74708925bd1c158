#pragma once

#include "chunkbus/core/result.hpp"
#include "chunkbus/transfer/types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace chunkbus::storage {

using transfer::Bytes;

/**
 * @brief Positional destination for a received file
 *
 * Writes are idempotent at a given offset and never extend the storage
 * beyond the size it was opened with.
 */
class Storage {
public:
    virtual ~Storage() = default;

    [[nodiscard]] virtual std::uint64_t size() const = 0;

    /// StorageWrite on I/O failure or when the write would pass size().
    virtual Result<void> write_at(std::uint64_t offset, const Bytes& data) = 0;

    virtual Result<Bytes> read_at(std::uint64_t offset, std::size_t length) const = 0;

    /// SHA-256 hex over [0, size()).
    virtual Result<std::string> digest() const = 0;

    /// Handle persisted in the subscriber record.
    [[nodiscard]] virtual std::string handle() const = 0;
};

/**
 * @brief Creates or reopens the destination for a manifest
 *
 * Reopening an existing destination must preserve already-written bytes.
 */
class StorageProvider {
public:
    virtual ~StorageProvider() = default;

    virtual Result<std::unique_ptr<Storage>> open(const transfer::Manifest& manifest) = 0;
};

// ──────────────────────────────────────────────────────────
// File-backed storage
// ──────────────────────────────────────────────────────────

class FileStorage : public Storage {
public:
    /// Creates the file (and parents) if needed and resizes it to `size`.
    static Result<std::unique_ptr<FileStorage>> open(const std::filesystem::path& path, std::uint64_t size);

    [[nodiscard]] std::uint64_t size() const override { return size_; }
    Result<void> write_at(std::uint64_t offset, const Bytes& data) override;
    Result<Bytes> read_at(std::uint64_t offset, std::size_t length) const override;
    Result<std::string> digest() const override;
    [[nodiscard]] std::string handle() const override { return path_.string(); }

private:
    FileStorage(std::filesystem::path path, std::uint64_t size);

    std::filesystem::path path_;
    std::uint64_t size_ = 0;
};

/**
 * @brief Places files at {root}/{file_id}/{name} ({file_id}.bin when unnamed)
 */
class FileStorageProvider : public StorageProvider {
public:
    explicit FileStorageProvider(std::filesystem::path root);

    Result<std::unique_ptr<Storage>> open(const transfer::Manifest& manifest) override;

    [[nodiscard]] std::filesystem::path path_for(const transfer::Manifest& manifest) const;

private:
    std::filesystem::path root_;
};

// ──────────────────────────────────────────────────────────
// In-memory storage (tests, demos)
// ──────────────────────────────────────────────────────────

/**
 * @brief Shared byte buffer that outlives the Storage handles opened on it
 *
 * Models durable storage across a simulated process restart. Offsets added
 * with fail_writes_at() reject writes that start there.
 */
struct MemoryBlob {
    std::mutex mutex;
    Bytes bytes;
    std::set<std::uint64_t> failing_offsets;
    std::uint64_t writes = 0;
};

class MemoryStorage : public Storage {
public:
    MemoryStorage(std::shared_ptr<MemoryBlob> blob, std::string handle);

    [[nodiscard]] std::uint64_t size() const override;
    Result<void> write_at(std::uint64_t offset, const Bytes& data) override;
    Result<Bytes> read_at(std::uint64_t offset, std::size_t length) const override;
    Result<std::string> digest() const override;
    [[nodiscard]] std::string handle() const override { return handle_; }

private:
    std::shared_ptr<MemoryBlob> blob_;
    std::string handle_;
};

class MemoryStorageProvider : public StorageProvider {
public:
    Result<std::unique_ptr<Storage>> open(const transfer::Manifest& manifest) override;

    /// Blob for `file_id`, created empty if unknown.
    std::shared_ptr<MemoryBlob> blob(const std::string& file_id);

    [[nodiscard]] Bytes contents(const std::string& file_id);

    void fail_writes_at(const std::string& file_id, std::uint64_t offset);
    void clear_failures(const std::string& file_id);

private:
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<MemoryBlob>> blobs_;
};

} // namespace chunkbus::storage
