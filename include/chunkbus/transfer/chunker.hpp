#pragma once

#include "chunkbus/core/result.hpp"
#include "chunkbus/transfer/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <memory>
#include <string>

namespace chunkbus::transfer {

/**
 * @brief Random-access byte source of known length
 *
 * A failed read is reported as SourceUnavailable.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    [[nodiscard]] virtual std::uint64_t size() const = 0;

    virtual Result<Bytes> read(std::uint64_t offset, std::size_t length) = 0;

    /// Locator persisted in the publisher record so a restart can reopen the source.
    [[nodiscard]] virtual std::string locator() const = 0;
};

class FileByteSource : public ByteSource {
public:
    /// Fails with SourceUnavailable if the file does not exist or is not a regular file.
    static Result<std::unique_ptr<FileByteSource>> open(const std::filesystem::path& path);

    [[nodiscard]] std::uint64_t size() const override { return size_; }
    Result<Bytes> read(std::uint64_t offset, std::size_t length) override;
    [[nodiscard]] std::string locator() const override { return path_.string(); }

private:
    FileByteSource(std::filesystem::path path, std::uint64_t size);

    std::filesystem::path path_;
    std::uint64_t size_ = 0;
};

class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(Bytes data, std::string locator = "memory");

    [[nodiscard]] std::uint64_t size() const override { return data_.size(); }
    Result<Bytes> read(std::uint64_t offset, std::size_t length) override;
    [[nodiscard]] std::string locator() const override { return locator_; }

    /// Subsequent reads at or beyond `offset` fail (simulates a vanished source).
    void fail_reads_from(std::uint64_t offset) { fail_from_ = offset; }

private:
    Bytes data_;
    std::string locator_;
    std::uint64_t fail_from_ = UINT64_MAX;
};

struct ChunkRange {
    std::uint32_t index = 0;
    std::uint64_t offset = 0;
    std::uint32_t length = 0;

    friend bool operator==(const ChunkRange& a, const ChunkRange& b) {
        return a.index == b.index && a.offset == b.offset && a.length == b.length;
    }
};

/**
 * @brief Lazy, restartable sequence of chunk ranges over [0, total_size)
 *
 * Ranges are produced in index order and cover every byte exactly once; the
 * last range may be shorter. Iterating twice yields the same sequence.
 *
 * EXAMPLE:
 * for (const ChunkRange& range : Chunker(1000000, 262144)) {
 *     // range.index, range.offset, range.length
 * }
 */
class Chunker {
public:
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = ChunkRange;
        using difference_type = std::ptrdiff_t;
        using pointer = const ChunkRange*;
        using reference = const ChunkRange&;

        Iterator() = default;
        Iterator(const Chunker* owner, std::uint32_t index);

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }
        Iterator& operator++();
        Iterator operator++(int);

        friend bool operator==(const Iterator& a, const Iterator& b) {
            return a.owner_ == b.owner_ && a.current_.index == b.current_.index;
        }
        friend bool operator!=(const Iterator& a, const Iterator& b) { return !(a == b); }

    private:
        const Chunker* owner_ = nullptr;
        ChunkRange current_{};
    };

    Chunker(std::uint64_t total_size, std::uint32_t chunk_size);

    [[nodiscard]] std::uint32_t total_chunks() const noexcept { return total_chunks_; }
    [[nodiscard]] std::uint32_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] std::uint64_t total_size() const noexcept { return total_size_; }

    [[nodiscard]] ChunkRange range(std::uint32_t index) const noexcept;

    [[nodiscard]] Iterator begin() const { return Iterator(this, 0); }
    [[nodiscard]] Iterator end() const { return Iterator(this, total_chunks_); }

private:
    std::uint64_t total_size_ = 0;
    std::uint32_t chunk_size_ = 0;
    std::uint32_t total_chunks_ = 0;
};

struct ManifestOptions {
    std::string file_id;
    std::string name;
    std::string content_descriptor = "application/octet-stream";
    std::uint32_t chunk_size = 256 * 1024;
};

/**
 * @brief Full pass over the source computing per-chunk and whole-file digests
 *
 * Atomic: either the complete manifest is returned or an error
 * (SourceUnavailable when any read fails, InvalidState on a zero chunk size).
 */
Result<Manifest> build_manifest(ByteSource& source, const ManifestOptions& options);

/// Reads chunk `index` of `manifest` from `source` and wraps it for the wire.
Result<ChunkMessage> read_chunk(ByteSource& source, const Manifest& manifest, std::uint32_t index);

/// "{name}-{size}-{8 random hex digits}"
std::string generate_file_id(const std::string& name, std::uint64_t size);

/// Best-effort content type from the file extension.
std::string guess_content_type(const std::filesystem::path& path);

} // namespace chunkbus::transfer
