#pragma once

#include "chunkbus/core/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace chunkbus {

/**
 * @brief Tunables shared by the sender and receiver services
 *
 * Precedence, lowest to highest: defaults, JSON file, CHUNKBUS_* environment
 * variables, command-line flags (applied by the program itself).
 *
 * EXAMPLE config file:
 * {
 *   "topic_namespace": "lab",
 *   "chunk_size": 65536,
 *   "status_interval_ms": 2000,
 *   "state_dir": "/var/lib/chunkbus"
 * }
 */
struct TransferConfig {
    std::string topic_namespace = "chunkbus";
    std::uint32_t chunk_size = 256 * 1024;
    std::chrono::milliseconds status_interval{5000};
    std::uint32_t stall_intervals = 5;
    std::uint32_t status_every_n_chunks = 50;    ///< 0 disables
    bool resend_on_chunk_channel = false;
    std::uint32_t checkpoint_interval = 16;
    std::uint32_t max_buffered_chunks = 64;
    std::chrono::milliseconds retention{std::chrono::hours(24)};
    std::filesystem::path state_dir = ".transfer";
    std::filesystem::path storage_dir = ".transfer";
    std::string log_level = "info";

    /// Rejects a zero chunk size, a zero status interval and an empty namespace.
    Result<void> validate() const;
};

/// Overlays the keys present in `j` onto `config`.
Result<void> apply_json(const nlohmann::json& j, TransferConfig& config);

/// Defaults overlaid with the JSON file at `path`.
Result<TransferConfig> load_config(const std::filesystem::path& path);

/// Overlays CHUNKBUS_* environment variables onto `config`.
Result<void> apply_env_overrides(TransferConfig& config);

/// Sets the spdlog level and the pattern used by every program.
Result<void> configure_logging(const std::string& level);

} // namespace chunkbus
