// Sends one file through the in-memory bus to a receiver in the same process,
// with optional loss, duplication and reordering on the link.
//
// Usage:
//   transfer_demo [-f FILE | -s SIZE] [-c CHUNK_SIZE] [--drop RATE] [--dup RATE]
//                 [--reorder N] [--seed N] [--interval-ms MS] [--timeout-s S]
//                 [--config FILE] [--namespace NS] [--state-dir DIR] [-o DIR]
//                 [--log-level LEVEL]

#include "chunkbus/core/config.hpp"
#include "chunkbus/events/components.hpp"
#include "chunkbus/events/event_bus.hpp"
#include "chunkbus/service/receiver.hpp"
#include "chunkbus/service/sender.hpp"
#include "chunkbus/state/record_store.hpp"
#include "chunkbus/state/state_store.hpp"
#include "chunkbus/storage/storage.hpp"
#include "chunkbus/transfer/chunker.hpp"
#include "chunkbus/transport/memory_transport.hpp"

#include <boost/asio/io_context.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
namespace asio = boost::asio;
using namespace chunkbus;

namespace {

transfer::Bytes random_bytes(std::size_t size, std::uint32_t seed) {
    std::mt19937 engine(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    transfer::Bytes data(size);
    for (auto& byte : data) {
        byte = static_cast<std::uint8_t>(dist(engine));
    }
    return data;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    TransferConfig config;
    fs::path input_file;
    std::size_t generated_size = 1000000;
    transport::LinkProfile link;
    int timeout_s = 60;

    // --config is applied first so the remaining flags override it.
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            auto loaded = load_config(argv[i + 1]);
            if (loaded.is_error()) {
                spdlog::error("{}", loaded.error().describe());
                return 1;
            }
            config = loaded.value();
        }
    }
    if (auto res = apply_env_overrides(config); res.is_error()) {
        spdlog::error("{}", res.error().describe());
        return 1;
    }

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-f" || arg == "--file") && i + 1 < argc) {
                input_file = fs::path(argv[++i]);
            } else if ((arg == "-s" || arg == "--size") && i + 1 < argc) {
                generated_size = static_cast<std::size_t>(std::stoull(argv[++i]));
            } else if ((arg == "-c" || arg == "--chunk-size") && i + 1 < argc) {
                config.chunk_size = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if ((arg == "-n" || arg == "--namespace") && i + 1 < argc) {
                config.topic_namespace = argv[++i];
            } else if ((arg == "-o" || arg == "--out") && i + 1 < argc) {
                config.storage_dir = fs::path(argv[++i]);
            } else if (arg == "--state-dir" && i + 1 < argc) {
                config.state_dir = fs::path(argv[++i]);
            } else if (arg == "--interval-ms" && i + 1 < argc) {
                config.status_interval = std::chrono::milliseconds(std::stol(argv[++i]));
            } else if (arg == "--log-level" && i + 1 < argc) {
                config.log_level = argv[++i];
            } else if (arg == "--drop" && i + 1 < argc) {
                link.drop_rate = std::stod(argv[++i]);
            } else if (arg == "--dup" && i + 1 < argc) {
                link.duplicate_rate = std::stod(argv[++i]);
            } else if (arg == "--reorder" && i + 1 < argc) {
                link.max_overtake = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--seed" && i + 1 < argc) {
                link.seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--timeout-s" && i + 1 < argc) {
                timeout_s = std::stoi(argv[++i]);
            } else if (arg == "--config" && i + 1 < argc) {
                ++i;
            }
        }
    } catch (const std::logic_error& e) {
        spdlog::error("Invalid command-line value: {}", e.what());
        return 1;
    }

    if (auto res = config.validate(); res.is_error()) {
        spdlog::error("{}", res.error().describe());
        return 1;
    }
    if (auto res = configure_logging(config.log_level); res.is_error()) {
        spdlog::error("{}", res.error().describe());
        return 1;
    }

    events::EventBus event_bus;
    events::TransferLogger logger(event_bus);
    events::TransferMetrics metrics(event_bus);

    state::DirectoryRecordStore records(config.state_dir / "state");
    state::TransferStateStore store(records);
    storage::FileStorageProvider storage(config.storage_dir / "received");

    transport::MemoryTransport bus;
    bus.set_link_profile(link);

    service::ReceiverService receiver(bus, store, event_bus, config, storage);
    service::SenderService sender(bus, store, event_bus, config);

    if (auto restored = receiver.recover(); restored.is_error()) {
        spdlog::error("{}", restored.error().describe());
        return 1;
    }
    receiver.listen_all();

    asio::io_context io_context;
    receiver.start_timer(io_context);
    bus.start();

    Result<std::string> sent = input_file.empty()
        ? sender.send(std::make_unique<transfer::MemoryByteSource>(random_bytes(generated_size, link.seed), "generated"),
                      transfer::ManifestOptions{transfer::generate_file_id("generated.bin", generated_size),
                                                "generated.bin", "application/octet-stream", config.chunk_size})
        : sender.send_file(input_file);
    if (sent.is_error()) {
        receiver.stop_timer();
        bus.stop();
        spdlog::error("{}", sent.error().describe());
        return 1;
    }
    spdlog::info("Sending {} (drop={} dup={} reorder={})", sent.value(), link.drop_rate,
                 link.duplicate_rate, link.max_overtake);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_s);
    auto next_poll = std::chrono::steady_clock::now() + config.status_interval;
    while (!sender.all_acknowledged() && std::chrono::steady_clock::now() < deadline) {
        if (io_context.stopped()) {
            io_context.restart();
        }
        io_context.run_for(std::chrono::milliseconds(100));
        if (std::chrono::steady_clock::now() >= next_poll) {
            sender.poll();
            next_poll += config.status_interval;
        }
    }

    receiver.stop_timer();
    bus.stop();
    metrics.print_stats();

    if (!sender.all_acknowledged()) {
        spdlog::error("Transfer {} not acknowledged within {}s", sent.value(), timeout_s);
        return 1;
    }
    if (auto manifest = sender.publisher(sent.value())->manifest()) {
        spdlog::info("Delivered {} bytes to {}", manifest->size,
                     storage.path_for(*manifest).string());
    }
    return 0;
}
