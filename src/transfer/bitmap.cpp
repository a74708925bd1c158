#include "chunkbus/transfer/bitmap.hpp"
#include "chunkbus/transfer/digest.hpp"

#include <algorithm>

namespace chunkbus::transfer {

bool ChunkBitmap::set(std::uint32_t index) {
    if (index >= bits_.size() || bits_[index]) {
        return false;
    }
    bits_[index] = true;
    ++count_;
    return true;
}

void ChunkBitmap::clear() {
    std::fill(bits_.begin(), bits_.end(), false);
    count_ = 0;
}

std::vector<std::uint32_t> ChunkBitmap::missing() const {
    std::vector<std::uint32_t> result;
    result.reserve(bits_.size() - count_);
    for (std::uint32_t i = 0; i < bits_.size(); ++i) {
        if (!bits_[i]) {
            result.push_back(i);
        }
    }
    return result;
}

std::vector<std::uint32_t> ChunkBitmap::present() const {
    std::vector<std::uint32_t> result;
    result.reserve(count_);
    for (std::uint32_t i = 0; i < bits_.size(); ++i) {
        if (bits_[i]) {
            result.push_back(i);
        }
    }
    return result;
}

std::int64_t ChunkBitmap::highest() const noexcept {
    for (std::size_t i = bits_.size(); i > 0; --i) {
        if (bits_[i - 1]) {
            return static_cast<std::int64_t>(i - 1);
        }
    }
    return -1;
}

std::string ChunkBitmap::to_hex() const {
    Bytes packed((bits_.size() + 7) / 8, 0);
    for (std::size_t i = 0; i < bits_.size(); ++i) {
        if (bits_[i]) {
            packed[i / 8] |= static_cast<std::uint8_t>(1u << (i % 8));
        }
    }
    return hex_encode(packed);
}

bool ChunkBitmap::from_hex(const std::string& hex, std::uint32_t total, ChunkBitmap& out) {
    Bytes packed;
    if (!hex_decode(hex, packed) || packed.size() != (static_cast<std::size_t>(total) + 7) / 8) {
        return false;
    }

    ChunkBitmap bitmap(total);
    for (std::uint32_t i = 0; i < total; ++i) {
        if (packed[i / 8] & (1u << (i % 8))) {
            bitmap.set(i);
        }
    }
    out = std::move(bitmap);
    return true;
}

} // namespace chunkbus::transfer
