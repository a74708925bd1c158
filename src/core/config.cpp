#include "chunkbus/core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace chunkbus {

using json = nlohmann::json;

namespace {

Result<std::uint32_t> parse_u32(const std::string& name, const std::string& text) {
    try {
        std::size_t consumed = 0;
        const unsigned long long value = std::stoull(text, &consumed);
        if (consumed != text.size() || value > std::numeric_limits<std::uint32_t>::max()) {
            return Err<std::uint32_t>(ErrorCode::Config, name + " is not a valid 32-bit number: " + text);
        }
        return Ok(static_cast<std::uint32_t>(value));
    } catch (const std::logic_error&) {
        return Err<std::uint32_t>(ErrorCode::Config, name + " is not a number: " + text);
    }
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

} // namespace

Result<void> TransferConfig::validate() const {
    if (topic_namespace.empty()) {
        return Err<void>(ErrorCode::Config, "topic_namespace must not be empty");
    }
    if (chunk_size == 0) {
        return Err<void>(ErrorCode::Config, "chunk_size must be greater than zero");
    }
    if (status_interval.count() <= 0) {
        return Err<void>(ErrorCode::Config, "status_interval must be greater than zero");
    }
    return Ok();
}

Result<void> apply_json(const json& j, TransferConfig& config) {
    if (!j.is_object()) {
        return Err<void>(ErrorCode::Config, "Configuration root must be a JSON object");
    }
    try {
        config.topic_namespace = j.value("topic_namespace", config.topic_namespace);
        config.chunk_size = j.value("chunk_size", config.chunk_size);
        if (j.contains("status_interval_ms")) {
            config.status_interval = std::chrono::milliseconds(j.at("status_interval_ms").get<std::int64_t>());
        }
        config.stall_intervals = j.value("stall_intervals", config.stall_intervals);
        config.status_every_n_chunks = j.value("status_every_n_chunks", config.status_every_n_chunks);
        config.resend_on_chunk_channel = j.value("resend_on_chunk_channel", config.resend_on_chunk_channel);
        config.checkpoint_interval = j.value("checkpoint_interval", config.checkpoint_interval);
        config.max_buffered_chunks = j.value("max_buffered_chunks", config.max_buffered_chunks);
        if (j.contains("retention_hours")) {
            config.retention = std::chrono::hours(j.at("retention_hours").get<std::int64_t>());
        }
        if (j.contains("state_dir")) {
            config.state_dir = j.at("state_dir").get<std::string>();
        }
        if (j.contains("storage_dir")) {
            config.storage_dir = j.at("storage_dir").get<std::string>();
        }
        config.log_level = j.value("log_level", config.log_level);
    } catch (const json::exception& e) {
        return Err<void>(ErrorCode::Config, std::string("Invalid configuration value: ") + e.what());
    }
    return Ok();
}

Result<TransferConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<TransferConfig>(ErrorCode::Config, "Cannot open configuration file: " + path.string());
    }

    auto j = json::parse(input, nullptr, false);
    if (j.is_discarded()) {
        return Err<TransferConfig>(ErrorCode::Config, "Configuration file is not valid JSON: " + path.string());
    }

    TransferConfig config;
    if (auto res = apply_json(j, config); res.is_error()) {
        return Err<TransferConfig>(res.error());
    }
    spdlog::debug("Loaded configuration from {}", path.string());
    return Ok(std::move(config));
}

Result<void> apply_env_overrides(TransferConfig& config) {
    if (const char* value = env("CHUNKBUS_TOPIC_NAMESPACE")) {
        config.topic_namespace = value;
    }
    if (const char* value = env("CHUNKBUS_CHUNK_SIZE")) {
        auto parsed = parse_u32("CHUNKBUS_CHUNK_SIZE", value);
        if (parsed.is_error()) {
            return Err<void>(parsed.error());
        }
        config.chunk_size = parsed.value();
    }
    if (const char* value = env("CHUNKBUS_STATUS_INTERVAL_MS")) {
        auto parsed = parse_u32("CHUNKBUS_STATUS_INTERVAL_MS", value);
        if (parsed.is_error()) {
            return Err<void>(parsed.error());
        }
        config.status_interval = std::chrono::milliseconds(parsed.value());
    }
    if (const char* value = env("CHUNKBUS_STATE_DIR")) {
        config.state_dir = value;
    }
    if (const char* value = env("CHUNKBUS_STORAGE_DIR")) {
        config.storage_dir = value;
    }
    if (const char* value = env("CHUNKBUS_LOG_LEVEL")) {
        config.log_level = value;
    }
    return Ok();
}

Result<void> configure_logging(const std::string& level) {
    const auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        return Err<void>(ErrorCode::Config, "Unknown log level: " + level);
    }
    spdlog::set_level(parsed);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    return Ok();
}

} // namespace chunkbus
