#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chunkbus::transfer {

/**
 * @brief Fixed-width set of chunk indices
 *
 * Tracks verified chunks on the subscriber side. set() is idempotent and
 * ignores out-of-range indices; clear() unsets every index.
 */
class ChunkBitmap {
public:
    ChunkBitmap() = default;
    explicit ChunkBitmap(std::uint32_t total) : bits_(total, false) {}

    [[nodiscard]] std::uint32_t total() const noexcept { return static_cast<std::uint32_t>(bits_.size()); }
    [[nodiscard]] std::uint32_t count() const noexcept { return count_; }
    [[nodiscard]] bool complete() const noexcept { return count_ == bits_.size(); }

    [[nodiscard]] bool test(std::uint32_t index) const noexcept {
        return index < bits_.size() && bits_[index];
    }

    /// Returns true if the index was newly set.
    bool set(std::uint32_t index);

    void clear();

    /// Indices not yet set, ascending.
    [[nodiscard]] std::vector<std::uint32_t> missing() const;

    /// Indices set, ascending.
    [[nodiscard]] std::vector<std::uint32_t> present() const;

    /// Highest set index, or -1 when empty.
    [[nodiscard]] std::int64_t highest() const noexcept;

    /// Packed little-endian bit string rendered as hex (persistence format).
    [[nodiscard]] std::string to_hex() const;

    /// Rebuilds a bitmap of `total` bits from to_hex() output; false on malformed input.
    static bool from_hex(const std::string& hex, std::uint32_t total, ChunkBitmap& out);

    friend bool operator==(const ChunkBitmap& a, const ChunkBitmap& b) { return a.bits_ == b.bits_; }

private:
    std::vector<bool> bits_;
    std::uint32_t count_ = 0;
};

} // namespace chunkbus::transfer
