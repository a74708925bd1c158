#include "chunkbus/storage/storage.hpp"
#include "chunkbus/transfer/digest.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace chunkbus::storage {
namespace fs = std::filesystem;

namespace {

Result<void> ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return Ok();
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return Err<void>(ErrorCode::StorageWrite, "Failed to create directory: " + parent.string());
    }
    return Ok();
}

} // namespace

FileStorage::FileStorage(fs::path path, std::uint64_t size)
    : path_(std::move(path)), size_(size) {}

Result<std::unique_ptr<FileStorage>> FileStorage::open(const fs::path& path, std::uint64_t size) {
    if (auto res = ensure_parent_exists(path); res.is_error()) {
        return Err<std::unique_ptr<FileStorage>>(res.error());
    }

    if (!fs::exists(path)) {
        std::ofstream create(path, std::ios::binary | std::ios::trunc);
        if (!create) {
            return Err<std::unique_ptr<FileStorage>>(ErrorCode::StorageWrite,
                                                     "Failed to create destination file: " + path.string());
        }
    }

    std::error_code ec;
    if (fs::file_size(path, ec) != size || ec) {
        fs::resize_file(path, size, ec);
        if (ec) {
            return Err<std::unique_ptr<FileStorage>>(ErrorCode::StorageWrite,
                                                     "Failed to size " + path.string() + ": " + ec.message());
        }
    }

    return Ok(std::unique_ptr<FileStorage>(new FileStorage(path, size)));
}

Result<void> FileStorage::write_at(std::uint64_t offset, const Bytes& data) {
    if (offset + data.size() > size_) {
        return Err<void>(ErrorCode::StorageWrite,
                         "Write of " + std::to_string(data.size()) + " bytes at offset " +
                         std::to_string(offset) + " passes end of " + path_.string());
    }

    std::fstream file(path_, std::ios::in | std::ios::out | std::ios::binary);
    if (!file) {
        return Err<void>(ErrorCode::StorageWrite, "Failed to open destination file: " + path_.string());
    }

    file.seekp(static_cast<std::streamoff>(offset));
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file) {
        return Err<void>(ErrorCode::StorageWrite,
                         "Failed to write at offset " + std::to_string(offset) + " of " + path_.string());
    }
    return Ok();
}

Result<Bytes> FileStorage::read_at(std::uint64_t offset, std::size_t length) const {
    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        return Err<Bytes>(ErrorCode::StorageWrite, "Failed to open destination file: " + path_.string());
    }
    input.seekg(static_cast<std::streamoff>(offset));
    Bytes buffer(length);
    input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    buffer.resize(static_cast<std::size_t>(input.gcount()));
    return Ok(std::move(buffer));
}

Result<std::string> FileStorage::digest() const {
    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorCode::StorageWrite, "Failed to open destination file: " + path_.string());
    }

    transfer::Sha256 hasher;
    std::uint64_t remaining = size_;
    Bytes buffer(1 << 16);
    while (remaining > 0) {
        const auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(buffer.size(), remaining));
        input.read(reinterpret_cast<char*>(buffer.data()), want);
        const auto got = input.gcount();
        if (got <= 0) {
            // Truncated destination: digest of what exists, which cannot match.
            break;
        }
        hasher.update(buffer.data(), static_cast<std::size_t>(got));
        remaining -= static_cast<std::uint64_t>(got);
    }
    return Ok(hasher.finish());
}

FileStorageProvider::FileStorageProvider(fs::path root) : root_(std::move(root)) {}

fs::path FileStorageProvider::path_for(const transfer::Manifest& manifest) const {
    // Only the final path component of a remote-supplied name is used.
    const auto name = fs::path(manifest.name).filename();
    if (name.empty() || name == "." || name == "..") {
        return root_ / manifest.file_id / (manifest.file_id + ".bin");
    }
    return root_ / manifest.file_id / name;
}

Result<std::unique_ptr<Storage>> FileStorageProvider::open(const transfer::Manifest& manifest) {
    auto storage = FileStorage::open(path_for(manifest), manifest.size);
    if (storage.is_error()) {
        return Err<std::unique_ptr<Storage>>(storage.error());
    }
    return Ok(std::unique_ptr<Storage>(std::move(storage.value())));
}

} // namespace chunkbus::storage
