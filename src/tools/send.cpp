#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <numeric>
#include <optional>
#include <random>
#include <set>
#include <thread>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "stitch/config/config.hpp"
#include "stitch/router/wire.hpp"
#include "stitch/transport/udp_bridge.hpp"
#include "stitch/utils/logging.hpp"

using namespace stitch;

// Publishes one file as an image transfer through the UDP bridge:
// metadata, every chunk, then the end marker.
int main(int argc, char* argv[]) {
    CLI::App app{"stitch-send - publish a file as a chunked image transfer"};

    std::string path;
    std::string host = "127.0.0.1";
    uint16_t port = config::DEFAULT_BRIDGE_PORT;
    std::string prefix = config::DEFAULT_TOPIC_PREFIX;
    std::string transfer_id;
    size_t chunk_size = 1024;
    int delay_us = 200;
    bool shuffle = false;
    bool skip_metadata = false;
    std::vector<unsigned> drop;
    std::string log_level = "info";

    app.add_option("file", path, "File to send")->required()->check(CLI::ExistingFile);
    app.add_option("-H,--host", host, "Bridge host");
    app.add_option("-p,--port", port, "Bridge port");
    app.add_option("-t,--topic-prefix", prefix, "Topic prefix of the publishing device");
    app.add_option("-i,--id", transfer_id, "Transfer id (omit to let the receiver pick one)");
    app.add_option("-s,--chunk-size", chunk_size, "Chunk body size in bytes")
        ->check(CLI::Range(1, 65000));
    app.add_option("--delay-us", delay_us, "Pause between chunks in microseconds");
    app.add_flag("--shuffle", shuffle, "Send chunks in random order");
    app.add_flag("--skip-metadata", skip_metadata, "Do not publish the info message");
    app.add_option("--drop", drop, "Chunk indices to leave out");
    app.add_option("-l,--log-level", log_level, "Log level: trace,debug,info,warn,error");

    CLI11_PARSE(app, argc, argv);

    utils::LogConfig log_config;
    log_config.level = utils::string_to_log_level(log_level);
    utils::init_logging(log_config);

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        spdlog::error("Cannot open {}", path);
        return 1;
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    auto chunks = router::split_payload(data, chunk_size);
    if (chunks.empty()) {
        spdlog::error("{} ({} bytes) cannot be sent in chunks of {} bytes", path, data.size(), chunk_size);
        return 1;
    }

    transport::UdpBridgePublisher publisher({host, port});
    if (!publisher.open()) {
        spdlog::error("Failed to open publisher socket");
        return 1;
    }

    const std::string info_topic = prefix + "/image/info";
    const std::string chunk_topic = prefix + "/image/chunk";

    if (!skip_metadata) {
        std::optional<std::string> id;
        if (!transfer_id.empty()) {
            id = transfer_id;
        }
        std::string info = router::encode_metadata(static_cast<uint32_t>(chunks.size()), id);
        if (!publisher.publish(info_topic, {reinterpret_cast<const uint8_t*>(info.data()), info.size()})) {
            spdlog::error("Failed to publish metadata");
            return 1;
        }
    }

    std::vector<size_t> order(chunks.size());
    std::iota(order.begin(), order.end(), 0);
    if (shuffle) {
        std::mt19937 rng(std::random_device{}());
        std::shuffle(order.begin(), order.end(), rng);
    }
    std::set<unsigned> dropped(drop.begin(), drop.end());

    size_t sent = 0;
    for (size_t index : order) {
        if (dropped.count(static_cast<unsigned>(index))) {
            continue;
        }
        auto payload = router::encode_chunk(static_cast<reassembly::ChunkIndex>(index), chunks[index]);
        if (!publisher.publish(chunk_topic, payload)) {
            spdlog::error("Failed to publish chunk {}", index);
            return 1;
        }
        ++sent;
        if (delay_us > 0) {
            std::this_thread::sleep_for(std::chrono::microseconds(delay_us));
        }
    }

    if (!publisher.publish(chunk_topic, {})) {
        spdlog::error("Failed to publish end marker");
        return 1;
    }

    spdlog::info("Sent {} of {} chunks ({} bytes) to {}:{} on {}", sent, chunks.size(), data.size(),
                 host, port, prefix);
    return 0;
}
