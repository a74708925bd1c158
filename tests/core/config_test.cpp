#include "chunkbus/core/config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace chunkbus;
namespace fs = std::filesystem;

TEST(TransferConfigTest, DefaultsAreValid) {
    TransferConfig config;
    EXPECT_TRUE(config.validate().is_ok());
    EXPECT_EQ(config.chunk_size, 262144u);
    EXPECT_EQ(config.status_interval, std::chrono::milliseconds(5000));
}

TEST(TransferConfigTest, ValidateRejectsNonsense) {
    TransferConfig config;
    config.chunk_size = 0;
    EXPECT_EQ(config.validate().error().code, ErrorCode::Config);

    config = TransferConfig{};
    config.topic_namespace.clear();
    EXPECT_TRUE(config.validate().is_error());

    config = TransferConfig{};
    config.status_interval = std::chrono::milliseconds(0);
    EXPECT_TRUE(config.validate().is_error());
}

TEST(TransferConfigTest, ApplyJsonOverlaysPresentKeys) {
    TransferConfig config;
    auto j = nlohmann::json::parse(R"({
        "topic_namespace": "plant/line4",
        "chunk_size": 65536,
        "status_interval_ms": 250,
        "resend_on_chunk_channel": true,
        "retention_hours": 2,
        "state_dir": "/var/lib/chunkbus"
    })");

    ASSERT_TRUE(apply_json(j, config).is_ok());
    EXPECT_EQ(config.topic_namespace, "plant/line4");
    EXPECT_EQ(config.chunk_size, 65536u);
    EXPECT_EQ(config.status_interval, std::chrono::milliseconds(250));
    EXPECT_TRUE(config.resend_on_chunk_channel);
    EXPECT_EQ(config.retention, std::chrono::hours(2));
    EXPECT_EQ(config.state_dir, fs::path("/var/lib/chunkbus"));
    // Untouched keys keep their defaults
    EXPECT_EQ(config.max_buffered_chunks, 64u);
    EXPECT_EQ(config.log_level, "info");
}

TEST(TransferConfigTest, ApplyJsonRejectsWrongTypes) {
    TransferConfig config;
    auto res = apply_json(nlohmann::json::parse(R"({"chunk_size": "large"})"), config);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code, ErrorCode::Config);

    EXPECT_TRUE(apply_json(nlohmann::json::array(), config).is_error());
}

TEST(TransferConfigTest, LoadConfigFromFile) {
    const auto path = fs::temp_directory_path() / "chunkbus_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"chunk_size": 4096, "log_level": "debug"})";
    }

    auto loaded = load_config(path);
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().chunk_size, 4096u);
    EXPECT_EQ(loaded.value().log_level, "debug");
    fs::remove(path);
}

TEST(TransferConfigTest, LoadConfigErrors) {
    const auto missing = load_config("/nonexistent/chunkbus.json");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::Config);

    const auto path = fs::temp_directory_path() / "chunkbus_config_broken.json";
    {
        std::ofstream out(path);
        out << "{ chunk_size: ";
    }
    EXPECT_TRUE(load_config(path).is_error());
    fs::remove(path);
}

TEST(TransferConfigTest, EnvironmentOverrides) {
    setenv("CHUNKBUS_TOPIC_NAMESPACE", "envns", 1);
    setenv("CHUNKBUS_CHUNK_SIZE", "1024", 1);
    setenv("CHUNKBUS_STATUS_INTERVAL_MS", "100", 1);

    TransferConfig config;
    auto res = apply_env_overrides(config);

    unsetenv("CHUNKBUS_TOPIC_NAMESPACE");
    unsetenv("CHUNKBUS_CHUNK_SIZE");
    unsetenv("CHUNKBUS_STATUS_INTERVAL_MS");

    ASSERT_TRUE(res.is_ok());
    EXPECT_EQ(config.topic_namespace, "envns");
    EXPECT_EQ(config.chunk_size, 1024u);
    EXPECT_EQ(config.status_interval, std::chrono::milliseconds(100));
}

TEST(TransferConfigTest, EnvironmentRejectsBadNumber) {
    setenv("CHUNKBUS_CHUNK_SIZE", "12kb", 1);
    TransferConfig config;
    auto res = apply_env_overrides(config);
    unsetenv("CHUNKBUS_CHUNK_SIZE");

    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code, ErrorCode::Config);
    EXPECT_EQ(config.chunk_size, 262144u);
}

TEST(ConfigureLoggingTest, AcceptsKnownLevels) {
    EXPECT_TRUE(configure_logging("debug").is_ok());
    EXPECT_TRUE(configure_logging("off").is_ok());
    EXPECT_TRUE(configure_logging("info").is_ok());
}

TEST(ConfigureLoggingTest, RejectsUnknownLevel) {
    auto res = configure_logging("chatty");
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code, ErrorCode::Config);
}
