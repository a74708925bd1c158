#pragma once

#include "chunkbus/transfer/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

struct evp_md_ctx_st;

namespace chunkbus::transfer {

/**
 * @brief Incremental SHA-256 (OpenSSL EVP) producing lowercase hex
 *
 * Used for both per-chunk and whole-file digests so identical bytes always
 * yield identical digests on every machine.
 *
 * EXAMPLE:
 * Sha256 hasher;
 * hasher.update(part_a);
 * hasher.update(part_b);
 * std::string hex = hasher.finish();
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;
    Sha256(Sha256&&) noexcept;
    Sha256& operator=(Sha256&&) noexcept;

    void update(const std::uint8_t* data, std::size_t length);
    void update(const Bytes& data) { update(data.data(), data.size()); }

    /// Finalizes and returns the hex digest; the hasher is reset afterwards.
    std::string finish();

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    void reset();

    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
};

std::string digest_of(const std::uint8_t* data, std::size_t length);

inline std::string digest_of(const Bytes& data) {
    return digest_of(data.data(), data.size());
}

/// Digest of the empty byte string (the file digest of a zero-length file).
const std::string& empty_digest();

std::string hex_encode(const std::uint8_t* data, std::size_t length);

inline std::string hex_encode(const Bytes& data) {
    return hex_encode(data.data(), data.size());
}

/// Returns false (and leaves `out` empty) on odd length or non-hex characters.
bool hex_decode(const std::string& hex, Bytes& out);

} // namespace chunkbus::transfer
