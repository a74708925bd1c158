#include "chunkbus/storage/storage.hpp"
#include "chunkbus/transfer/digest.hpp"

#include <algorithm>

namespace chunkbus::storage {

MemoryStorage::MemoryStorage(std::shared_ptr<MemoryBlob> blob, std::string handle)
    : blob_(std::move(blob)), handle_(std::move(handle)) {}

std::uint64_t MemoryStorage::size() const {
    std::lock_guard lock(blob_->mutex);
    return blob_->bytes.size();
}

Result<void> MemoryStorage::write_at(std::uint64_t offset, const Bytes& data) {
    std::lock_guard lock(blob_->mutex);
    if (blob_->failing_offsets.count(offset) > 0) {
        return Err<void>(ErrorCode::StorageWrite, "Injected write failure at offset " + std::to_string(offset));
    }
    if (offset + data.size() > blob_->bytes.size()) {
        return Err<void>(ErrorCode::StorageWrite,
                         "Write at offset " + std::to_string(offset) + " passes end of " + handle_);
    }
    std::copy(data.begin(), data.end(), blob_->bytes.begin() + static_cast<std::ptrdiff_t>(offset));
    ++blob_->writes;
    return Ok();
}

Result<Bytes> MemoryStorage::read_at(std::uint64_t offset, std::size_t length) const {
    std::lock_guard lock(blob_->mutex);
    if (offset >= blob_->bytes.size()) {
        return Ok(Bytes{});
    }
    const auto end = std::min<std::uint64_t>(offset + length, blob_->bytes.size());
    return Ok(Bytes(blob_->bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                    blob_->bytes.begin() + static_cast<std::ptrdiff_t>(end)));
}

Result<std::string> MemoryStorage::digest() const {
    std::lock_guard lock(blob_->mutex);
    return Ok(transfer::digest_of(blob_->bytes));
}

Result<std::unique_ptr<Storage>> MemoryStorageProvider::open(const transfer::Manifest& manifest) {
    auto target = blob(manifest.file_id);
    {
        std::lock_guard lock(target->mutex);
        target->bytes.resize(manifest.size, 0);
    }
    return Ok(std::unique_ptr<Storage>(std::make_unique<MemoryStorage>(target, "memory:" + manifest.file_id)));
}

std::shared_ptr<MemoryBlob> MemoryStorageProvider::blob(const std::string& file_id) {
    std::lock_guard lock(mutex_);
    auto& entry = blobs_[file_id];
    if (!entry) {
        entry = std::make_shared<MemoryBlob>();
    }
    return entry;
}

Bytes MemoryStorageProvider::contents(const std::string& file_id) {
    auto target = blob(file_id);
    std::lock_guard lock(target->mutex);
    return target->bytes;
}

void MemoryStorageProvider::fail_writes_at(const std::string& file_id, std::uint64_t offset) {
    auto target = blob(file_id);
    std::lock_guard lock(target->mutex);
    target->failing_offsets.insert(offset);
}

void MemoryStorageProvider::clear_failures(const std::string& file_id) {
    auto target = blob(file_id);
    std::lock_guard lock(target->mutex);
    target->failing_offsets.clear();
}

} // namespace chunkbus::storage
