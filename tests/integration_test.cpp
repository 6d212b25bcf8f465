#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "stitch/crypto/crypto.hpp"
#include "stitch/reassembly/reassembly_engine.hpp"
#include "stitch/reassembly/session_registry.hpp"
#include "stitch/router/message_router.hpp"
#include "stitch/router/wire.hpp"
#include "stitch/storage/filesystem_sink.hpp"
#include "stitch/transport/udp_bridge.hpp"
#include "stitch/utils/worker_pool.hpp"

namespace stitch {
namespace {

namespace fs = std::filesystem;

using reassembly::ErrorKind;

std::vector<uint8_t> random_image(size_t size, uint32_t seed) {
    std::mt19937 rng(seed);
    std::vector<uint8_t> data(size);
    for (auto& b : data) {
        b = static_cast<uint8_t>(rng() & 0xFF);
    }
    data[0] = 0xFF;
    data[1] = 0xD8;
    return data;
}

std::vector<uint8_t> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Full pipeline: router -> registry -> engine on a worker pool -> filesystem sink
class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::init());

        std::random_device rd;
        root = fs::temp_directory_path() / ("stitch-pipeline-" + std::to_string(rd()));
        fs::create_directories(root);

        sink = std::make_unique<storage::FilesystemSink>(root);
        pool = std::make_unique<utils::WorkerPool>(utils::WorkerPoolConfig{.workers = 2, .queue_capacity = 16});
        registry = std::make_unique<reassembly::SessionRegistry>(
            reassembly::RegistryConfig{.idle_timeout_ms = 1000, .max_sessions = 8, .max_transfer_bytes = 1 << 20});
        engine = std::make_unique<reassembly::ReassemblyEngine>(*sink, reassembly::EngineConfig{}, pool.get());
        engine->attach(*registry);
        dispatcher = std::make_unique<router::MessageRouter>(*registry);

        auto record = [this](const reassembly::TransferOutcome& outcome) {
            std::lock_guard<std::mutex> lock(mutex);
            outcomes.push_back(outcome);
        };
        registry->set_outcome_callback(record);
        engine->set_completion_callback(record);
    }

    void TearDown() override {
        pool->shutdown();
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void publish_info(const std::string& prefix, uint32_t total, const std::string& id) {
        auto info = router::encode_metadata(total, id);
        dispatcher->route(prefix + "/image/info", std::vector<uint8_t>(info.begin(), info.end()), 0);
    }

    void publish_chunk(const std::string& prefix, reassembly::ChunkIndex index,
                       const std::vector<uint8_t>& body) {
        dispatcher->route(prefix + "/image/chunk", router::encode_chunk(index, body), 0);
    }

    void publish_end(const std::string& prefix) {
        dispatcher->route(prefix + "/image/chunk", std::vector<uint8_t>{}, 0);
    }

    fs::path root;
    std::unique_ptr<storage::FilesystemSink> sink;
    std::unique_ptr<utils::WorkerPool> pool;
    std::unique_ptr<reassembly::SessionRegistry> registry;
    std::unique_ptr<reassembly::ReassemblyEngine> engine;
    std::unique_ptr<router::MessageRouter> dispatcher;

    std::mutex mutex;
    std::vector<reassembly::TransferOutcome> outcomes;
};

TEST_F(PipelineTest, ShuffledChunksWithDuplicatesStoreExactBytes) {
    auto image = random_image(10000, 7);
    auto chunks = router::split_payload(image, 512);
    ASSERT_EQ(chunks.size(), 20u);

    std::vector<size_t> order(chunks.size());
    for (size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    std::shuffle(order.begin(), order.end(), std::mt19937(42));

    publish_info("esp32cam", static_cast<uint32_t>(chunks.size()), "img-1");
    for (size_t i : order) {
        publish_chunk("esp32cam", static_cast<reassembly::ChunkIndex>(i), chunks[i]);
    }
    publish_chunk("esp32cam", 3, chunks[3]);  // Duplicate
    publish_end("esp32cam");

    pool->wait_idle();

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_TRUE(outcomes[0].ok()) << outcomes[0].detail;
    EXPECT_EQ(read_file(root / "petri-images" / "img-1.jpg"), image);

    std::ifstream records(root / "gxp_raw_observations.jsonl");
    std::string line;
    ASSERT_TRUE(std::getline(records, line));
    auto row = nlohmann::json::parse(line);
    EXPECT_EQ(row["image_id"], "img-1");
    EXPECT_EQ(row["chunk_status"], "complete");
    EXPECT_EQ(row["raw_payload"]["bytes"], 10000);
    EXPECT_EQ(row["raw_payload"]["sha256"], crypto::to_hex(crypto::sha256(image)));
    EXPECT_FALSE(std::getline(records, line));

    EXPECT_EQ(registry->stats().chunks_duplicate, 1u);
}

TEST_F(PipelineTest, MissingChunkStoresNothing) {
    auto image = random_image(3000, 11);
    auto chunks = router::split_payload(image, 1000);

    publish_info("esp32cam", 3, "img-2");
    publish_chunk("esp32cam", 0, chunks[0]);
    publish_chunk("esp32cam", 2, chunks[2]);
    publish_end("esp32cam");

    pool->wait_idle();

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].error, ErrorKind::MISSING_CHUNKS);
    EXPECT_THAT(outcomes[0].missing, ::testing::ElementsAre(1));
    EXPECT_FALSE(fs::exists(root / "petri-images" / "img-2.jpg"));
    EXPECT_FALSE(fs::exists(root / "gxp_raw_observations.jsonl"));
}

TEST_F(PipelineTest, SupersededTransferNeverStored) {
    auto first = random_image(200, 1);
    auto second = random_image(300, 2);

    publish_info("esp32cam", 2, "img-old");
    publish_chunk("esp32cam", 0, first);
    publish_info("esp32cam", 1, "img-new");
    publish_chunk("esp32cam", 0, second);
    publish_end("esp32cam");

    pool->wait_idle();

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].transfer_id, "img-old");
    EXPECT_EQ(outcomes[0].error, ErrorKind::SUPERSEDED);
    EXPECT_TRUE(outcomes[1].ok());
    EXPECT_FALSE(fs::exists(root / "petri-images" / "img-old.jpg"));
    EXPECT_EQ(read_file(root / "petri-images" / "img-new.jpg"), second);
}

TEST_F(PipelineTest, TwoDevicesInterleaved) {
    auto a = random_image(1500, 3);
    auto b = random_image(1700, 4);
    auto a_chunks = router::split_payload(a, 500);
    auto b_chunks = router::split_payload(b, 500);

    publish_info("cam-a", static_cast<uint32_t>(a_chunks.size()), "a-1");
    publish_info("cam-b", static_cast<uint32_t>(b_chunks.size()), "b-1");
    for (size_t i = 0; i < std::max(a_chunks.size(), b_chunks.size()); ++i) {
        if (i < b_chunks.size()) {
            publish_chunk("cam-b", static_cast<reassembly::ChunkIndex>(i), b_chunks[i]);
        }
        if (i < a_chunks.size()) {
            publish_chunk("cam-a", static_cast<reassembly::ChunkIndex>(i), a_chunks[i]);
        }
    }
    publish_end("cam-a");
    publish_end("cam-b");

    pool->wait_idle();

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_TRUE(outcomes[0].ok());
    EXPECT_TRUE(outcomes[1].ok());
    EXPECT_EQ(read_file(root / "petri-images" / "a-1.jpg"), a);
    EXPECT_EQ(read_file(root / "petri-images" / "b-1.jpg"), b);
}

TEST_F(PipelineTest, RepeatedTransferIdIsNotOverwritten) {
    auto first = random_image(100, 5);
    auto second = random_image(100, 6);

    publish_info("esp32cam", 1, "img-3");
    publish_chunk("esp32cam", 0, first);
    publish_end("esp32cam");
    pool->wait_idle();

    publish_info("esp32cam", 1, "img-3");
    publish_chunk("esp32cam", 0, second);
    publish_end("esp32cam");
    pool->wait_idle();

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_TRUE(outcomes[0].ok());
    EXPECT_EQ(outcomes[1].error, ErrorKind::STORAGE_ERROR);
    EXPECT_EQ(read_file(root / "petri-images" / "img-3.jpg"), first);
}

TEST_F(PipelineTest, StalledTransferTimesOut) {
    publish_info("esp32cam", 2, "img-4");
    publish_chunk("esp32cam", 0, random_image(10, 8));

    EXPECT_EQ(registry->sweep_expired(5000), 1u);

    publish_end("esp32cam");
    pool->wait_idle();

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].error, ErrorKind::TIMEOUT);
    EXPECT_FALSE(fs::exists(root / "petri-images" / "img-4.jpg"));
}

TEST_F(PipelineTest, OverUdpBridge) {
    transport::UdpBridgeConfig config;
    config.socket.bind_address = {"127.0.0.1", 0};
    transport::UdpBridgeSource source(config);
    if (!source.start([this](transport::Message message) { dispatcher->route(message, 0); })) {
        GTEST_SKIP() << "Socket creation not available";
    }

    transport::UdpBridgePublisher publisher({"127.0.0.1", source.local_address().port});
    ASSERT_TRUE(publisher.open());

    auto image = random_image(4000, 9);
    auto chunks = router::split_payload(image, 1000);
    auto info = router::encode_metadata(static_cast<uint32_t>(chunks.size()), std::string("img-udp"));

    ASSERT_TRUE(publisher.publish("esp32cam/image/info",
                                  std::vector<uint8_t>(info.begin(), info.end())));
    for (size_t i = 0; i < chunks.size(); ++i) {
        ASSERT_TRUE(publisher.publish("esp32cam/image/chunk",
                                      router::encode_chunk(static_cast<reassembly::ChunkIndex>(i), chunks[i])));
    }
    ASSERT_TRUE(publisher.publish("esp32cam/image/chunk", {}));

    for (int i = 0; i < 40 && dispatcher->stats().end_markers == 0; ++i) {
        source.poll(50);
    }
    if (dispatcher->stats().end_markers == 0) {
        GTEST_SKIP() << "Loopback delivery not available";
    }

    pool->wait_idle();
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_TRUE(outcomes[0].ok()) << outcomes[0].detail;
    EXPECT_EQ(read_file(root / "petri-images" / "img-udp.jpg"), image);
}

}  // namespace
}  // namespace stitch
