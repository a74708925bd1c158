#include "chunkbus/transfer/chunker.hpp"
#include "chunkbus/transfer/digest.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>
#include <unordered_map>

namespace chunkbus::transfer {
namespace fs = std::filesystem;

// ──────────────────────────────────────────────────────────
// Byte sources
// ──────────────────────────────────────────────────────────

FileByteSource::FileByteSource(fs::path path, std::uint64_t size)
    : path_(std::move(path)), size_(size) {}

Result<std::unique_ptr<FileByteSource>> FileByteSource::open(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err<std::unique_ptr<FileByteSource>>(ErrorCode::SourceUnavailable,
                                                    "Not a regular file: " + path.string());
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<std::unique_ptr<FileByteSource>>(ErrorCode::SourceUnavailable,
                                                    "Cannot stat " + path.string() + ": " + ec.message());
    }
    return Ok(std::unique_ptr<FileByteSource>(new FileByteSource(path, size)));
}

Result<Bytes> FileByteSource::read(std::uint64_t offset, std::size_t length) {
    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        return Err<Bytes>(ErrorCode::SourceUnavailable, "Failed to open source file: " + path_.string());
    }

    input.seekg(static_cast<std::streamoff>(offset));
    Bytes buffer(length);
    input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    if (static_cast<std::size_t>(input.gcount()) != length) {
        return Err<Bytes>(ErrorCode::SourceUnavailable,
                          "Short read from " + path_.string() + " at offset " + std::to_string(offset));
    }
    return Ok(std::move(buffer));
}

MemoryByteSource::MemoryByteSource(Bytes data, std::string locator)
    : data_(std::move(data)), locator_(std::move(locator)) {}

Result<Bytes> MemoryByteSource::read(std::uint64_t offset, std::size_t length) {
    if (offset + length > fail_from_ || offset + length > data_.size()) {
        return Err<Bytes>(ErrorCode::SourceUnavailable,
                          "Read past readable region at offset " + std::to_string(offset));
    }
    const auto begin = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    return Ok(Bytes(begin, begin + static_cast<std::ptrdiff_t>(length)));
}

// ──────────────────────────────────────────────────────────
// Chunker
// ──────────────────────────────────────────────────────────

Chunker::Chunker(std::uint64_t total_size, std::uint32_t chunk_size)
    : total_size_(total_size),
      chunk_size_(chunk_size),
      total_chunks_(chunk_count(total_size, chunk_size)) {}

ChunkRange Chunker::range(std::uint32_t index) const noexcept {
    ChunkRange range;
    range.index = index;
    range.offset = static_cast<std::uint64_t>(index) * chunk_size_;
    if (index < total_chunks_) {
        range.length = static_cast<std::uint32_t>(
            std::min<std::uint64_t>(chunk_size_, total_size_ - range.offset));
    }
    return range;
}

Chunker::Iterator::Iterator(const Chunker* owner, std::uint32_t index)
    : owner_(owner), current_(owner->range(index)) {}

Chunker::Iterator& Chunker::Iterator::operator++() {
    current_ = owner_->range(current_.index + 1);
    return *this;
}

Chunker::Iterator Chunker::Iterator::operator++(int) {
    Iterator copy = *this;
    ++(*this);
    return copy;
}

// ──────────────────────────────────────────────────────────
// Manifest construction
// ──────────────────────────────────────────────────────────

Result<Manifest> build_manifest(ByteSource& source, const ManifestOptions& options) {
    if (options.chunk_size == 0) {
        return Err<Manifest>(ErrorCode::InvalidState, "chunk_size must be > 0");
    }

    Manifest manifest;
    manifest.file_id = options.file_id;
    manifest.name = options.name;
    manifest.content_descriptor = options.content_descriptor;
    manifest.size = source.size();
    manifest.chunk_size = options.chunk_size;
    manifest.timestamp = std::time(nullptr);

    const Chunker chunker(manifest.size, manifest.chunk_size);
    manifest.total_chunks = chunker.total_chunks();
    manifest.chunk_digests.reserve(manifest.total_chunks);

    Sha256 file_hasher;
    for (const ChunkRange& range : chunker) {
        auto data = source.read(range.offset, range.length);
        if (data.is_error()) {
            return Err<Manifest>(data.error());
        }
        file_hasher.update(data.value());
        manifest.chunk_digests.push_back(digest_of(data.value()));
    }
    manifest.file_digest = file_hasher.finish();

    return Ok(std::move(manifest));
}

Result<ChunkMessage> read_chunk(ByteSource& source, const Manifest& manifest, std::uint32_t index) {
    if (index >= manifest.total_chunks) {
        return Err<ChunkMessage>(ErrorCode::InvalidMessage,
                                 "Chunk index " + std::to_string(index) + " out of range for " + manifest.file_id);
    }

    auto data = source.read(manifest.chunk_offset(index), manifest.chunk_length(index));
    if (data.is_error()) {
        return Err<ChunkMessage>(data.error());
    }

    ChunkMessage chunk;
    chunk.file_id = manifest.file_id;
    chunk.chunk_index = index;
    chunk.digest = manifest.chunk_digests[index];
    chunk.payload = std::move(data.value());
    return Ok(std::move(chunk));
}

std::string generate_file_id(const std::string& name, std::uint64_t size) {
    static thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint32_t> dist;

    std::ostringstream oss;
    oss << name << '-' << size << '-'
        << std::hex << std::setw(8) << std::setfill('0') << dist(engine);
    return oss.str();
}

std::string guess_content_type(const fs::path& path) {
    static const std::unordered_map<std::string, std::string> types {
        {".txt", "text/plain"},
        {".json", "application/json"},
        {".csv", "text/csv"},
        {".html", "text/html"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".mp4", "video/mp4"},
        {".bin", "application/octet-stream"},
    };

    std::string extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto it = types.find(extension);
    return it != types.end() ? it->second : "application/octet-stream";
}

} // namespace chunkbus::transfer
