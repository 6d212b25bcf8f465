#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "stitch/crypto/crypto.hpp"
#include "stitch/reassembly/reassembly_engine.hpp"
#include "stitch/reassembly/session_registry.hpp"
#include "stitch/storage/storage_sink.hpp"
#include "stitch/utils/worker_pool.hpp"

namespace stitch::reassembly {
namespace {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;
using ::testing::Truly;

class MockStorageSink : public storage::StorageSink {
public:
    MOCK_METHOD(storage::StorageResult, upload,
                (const std::string& bucket, const std::string& key,
                 std::span<const uint8_t> bytes, const std::string& content_type),
                (override));
    MOCK_METHOD(storage::StorageResult, insert_record,
                (const std::string& table, const nlohmann::json& fields), (override));
    MOCK_METHOD(std::string, name, (), (const, override));
};

Bytes bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

// Session in FINALIZING with the given chunks
std::unique_ptr<TransferSession> make_session(const std::string& id, uint32_t expected,
                                              const std::vector<std::pair<ChunkIndex, std::string>>& chunks) {
    auto session = std::make_unique<TransferSession>("esp32cam", 0);
    session->begin(id, expected, 0);
    for (const auto& [index, body] : chunks) {
        session->add_chunk(index, bytes(body), 0);
    }
    session->request_finalize();
    return session;
}

class ReassemblyEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::init());
        engine.set_completion_callback([this](const TransferOutcome& outcome) {
            outcomes.push_back(outcome);
        });
    }

    StrictMock<MockStorageSink> sink;
    ReassemblyEngine engine{sink};
    std::vector<TransferOutcome> outcomes;
};

TEST_F(ReassemblyEngineTest, StoresCompleteTransferOnce) {
    std::string uploaded;
    EXPECT_CALL(sink, upload("petri-images", "img-1.jpg", _, "image/jpeg"))
        .WillOnce(Invoke([&uploaded](const std::string&, const std::string&,
                                     std::span<const uint8_t> data, const std::string&) {
            uploaded.assign(data.begin(), data.end());
            return storage::StorageResult::success("https://host/img-1.jpg");
        }));
    EXPECT_CALL(sink, insert_record("gxp_raw_observations", _))
        .WillOnce(Invoke([](const std::string&, const nlohmann::json& fields) {
            EXPECT_EQ(fields["gxp_id"], "dev-default");
            EXPECT_EQ(fields["image_id"], "img-1");
            EXPECT_EQ(fields["image_url"], "https://host/img-1.jpg");
            EXPECT_EQ(fields["chunk_status"], "complete");
            EXPECT_TRUE(fields["submitted_at"].is_string());
            EXPECT_EQ(fields["raw_payload"]["total_chunks"], 3);
            EXPECT_EQ(fields["raw_payload"]["bytes"], 6);
            EXPECT_EQ(fields["raw_payload"]["sha256"].get<std::string>().size(), 64u);
            return storage::StorageResult::success("42");
        }));

    auto session = make_session("img-1", 3, {{0, "AA"}, {2, "CC"}, {1, "BB"}});
    auto outcome = engine.finalize(*session);

    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.error, ErrorKind::NONE);
    EXPECT_EQ(outcome.artifact_url, "https://host/img-1.jpg");
    EXPECT_EQ(outcome.record_id, "42");
    EXPECT_EQ(outcome.bytes, 6u);
    EXPECT_EQ(uploaded, "AABBCC");
    EXPECT_EQ(session->state(), SessionState::COMPLETED);
}

TEST_F(ReassemblyEngineTest, MissingChunksNeverTouchStorage) {
    // StrictMock fails the test on any storage call
    auto session = make_session("img-2", 4, {{0, "a"}, {2, "c"}});
    auto outcome = engine.finalize(*session);

    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error, ErrorKind::MISSING_CHUNKS);
    EXPECT_THAT(outcome.missing, ElementsAre(1, 3));
    EXPECT_EQ(session->state(), SessionState::FAILED);
    EXPECT_EQ(session->failure(), ErrorKind::MISSING_CHUNKS);
}

TEST_F(ReassemblyEngineTest, UploadFailureSkipsInsert) {
    EXPECT_CALL(sink, upload(_, _, _, _))
        .WillOnce(Return(storage::StorageResult::failure("HTTP 500")));

    auto session = make_session("img-3", 1, {{0, "x"}});
    auto outcome = engine.finalize(*session);

    EXPECT_EQ(outcome.error, ErrorKind::STORAGE_ERROR);
    EXPECT_THAT(outcome.detail, ::testing::HasSubstr("upload failed: HTTP 500"));
    EXPECT_EQ(session->state(), SessionState::FAILED);
}

TEST_F(ReassemblyEngineTest, InsertFailureFailsTransfer) {
    EXPECT_CALL(sink, upload(_, _, _, _))
        .WillOnce(Return(storage::StorageResult::success("file:///tmp/img-4.jpg")));
    EXPECT_CALL(sink, insert_record(_, _))
        .WillOnce(Return(storage::StorageResult::failure("duplicate key")));

    auto session = make_session("img-4", 1, {{0, "x"}});
    auto outcome = engine.finalize(*session);

    EXPECT_EQ(outcome.error, ErrorKind::STORAGE_ERROR);
    EXPECT_THAT(outcome.detail, ::testing::HasSubstr("record insert failed"));
    EXPECT_EQ(outcome.artifact_url, "file:///tmp/img-4.jpg");
}

TEST_F(ReassemblyEngineTest, RefusesSessionNotFinalizing) {
    TransferSession session("esp32cam", 0);
    session.begin("img-5", 1, 0);

    auto outcome = engine.finalize(session);
    EXPECT_EQ(outcome.error, ErrorKind::NO_METADATA);
    EXPECT_EQ(session.state(), SessionState::RECEIVING);
}

TEST_F(ReassemblyEngineTest, SubmitWithoutPoolReportsInline) {
    auto session = make_session("img-6", 2, {{0, "a"}});
    EXPECT_TRUE(engine.submit(std::move(session)));

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].error, ErrorKind::MISSING_CHUNKS);
    EXPECT_EQ(engine.stats().transfers_incomplete, 1u);
}

TEST_F(ReassemblyEngineTest, CustomArtifactSettings) {
    EngineConfig config;
    config.bucket = "frames";
    config.table = "frames_log";
    config.content_type = "image/png";
    config.extension = ".png";
    config.device_id = "lab-3";
    ReassemblyEngine custom(sink, config);

    EXPECT_CALL(sink, upload("frames", "shot.png", _, "image/png"))
        .WillOnce(Return(storage::StorageResult::success("url")));
    EXPECT_CALL(sink, insert_record("frames_log",
                                    Truly([](const nlohmann::json& f) { return f["gxp_id"] == "lab-3"; })))
        .WillOnce(Return(storage::StorageResult::success("1")));

    auto session = make_session("shot", 1, {{0, "p"}});
    EXPECT_TRUE(custom.finalize(*session).ok());
}

TEST_F(ReassemblyEngineTest, ThrowingSinkFailsTransferOnly) {
    SessionRegistry registry;
    engine.attach(registry);

    EXPECT_CALL(sink, upload(_, "img-7.jpg", _, _))
        .WillOnce(Return(storage::StorageResult::success("url")));
    EXPECT_CALL(sink, insert_record(_, _))
        .WillOnce(Throw(std::runtime_error("invalid UTF-8 byte")));

    registry.on_metadata("esp32cam", {1, "img-7"}, 0);
    auto body = bytes("x");
    registry.on_chunk("esp32cam", 0, body, 0);
    EXPECT_EQ(registry.on_end_marker("esp32cam", 1), ErrorKind::NONE);

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].transfer_id, "img-7");
    EXPECT_EQ(outcomes[0].error, ErrorKind::STORAGE_ERROR);
    EXPECT_THAT(outcomes[0].detail, ::testing::HasSubstr("invalid UTF-8 byte"));
    EXPECT_FALSE(registry.is_finalizing("img-7"));
    EXPECT_EQ(engine.stats().storage_failures, 1u);

    // The id is usable again
    EXPECT_EQ(registry.on_metadata("esp32cam", {1, "img-7"}, 2), ErrorKind::NONE);
}

TEST(ReassemblyEngineKeyTest, ArtifactKey) {
    EXPECT_EQ(ReassemblyEngine::artifact_key("img-20240101120000", ".jpg"), "img-20240101120000.jpg");
}

class EnginePoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::init());
        ON_CALL(sink, upload(_, _, _, _))
            .WillByDefault(Return(storage::StorageResult::success("url")));
        ON_CALL(sink, insert_record(_, _))
            .WillByDefault(Return(storage::StorageResult::success("1")));
    }

    NiceMock<MockStorageSink> sink;
};

TEST_F(EnginePoolTest, RegistryHandOffRunsOnPool) {
    utils::WorkerPool pool({.workers = 2, .queue_capacity = 8});
    SessionRegistry registry;
    ReassemblyEngine engine(sink, {}, &pool);
    engine.attach(registry);

    std::atomic<int> completed{0};
    engine.set_completion_callback([&completed](const TransferOutcome& outcome) {
        if (outcome.ok()) {
            ++completed;
        }
    });

    EXPECT_CALL(sink, upload(_, _, _, _)).Times(3);
    EXPECT_CALL(sink, insert_record(_, _)).Times(3);

    for (int t = 0; t < 3; ++t) {
        std::string id = "img-" + std::to_string(t);
        registry.on_metadata("cam", {2, id}, 0);
        auto a = bytes("a");
        auto b = bytes("b");
        registry.on_chunk("cam", 1, b, 0);
        registry.on_chunk("cam", 0, a, 0);
        ASSERT_EQ(registry.on_end_marker("cam", 0), ErrorKind::NONE);
    }

    pool.wait_idle();
    EXPECT_EQ(completed.load(), 3);
    EXPECT_EQ(engine.stats().transfers_completed, 3u);
    EXPECT_EQ(engine.stats().bytes_stored, 6u);
    EXPECT_FALSE(registry.is_finalizing("img-0"));
}

TEST_F(EnginePoolTest, ThrowingSinkOnPoolStillReports) {
    utils::WorkerPool pool({.workers = 1, .queue_capacity = 4});
    SessionRegistry registry;
    ReassemblyEngine engine(sink, {}, &pool);
    engine.attach(registry);

    std::atomic<int> failed{0};
    engine.set_completion_callback([&failed](const TransferOutcome& outcome) {
        if (outcome.error == ErrorKind::STORAGE_ERROR) {
            ++failed;
        }
    });

    EXPECT_CALL(sink, upload(_, _, _, _)).WillOnce(Throw(std::runtime_error("disk gone")));

    registry.on_metadata("cam", {1, "img-8"}, 0);
    auto a = bytes("a");
    registry.on_chunk("cam", 0, a, 0);
    ASSERT_EQ(registry.on_end_marker("cam", 0), ErrorKind::NONE);

    pool.wait_idle();
    EXPECT_EQ(failed.load(), 1);
    EXPECT_FALSE(registry.is_finalizing("img-8"));
}

TEST_F(EnginePoolTest, SaturatedQueueFailsTransfer) {
    utils::WorkerPool pool({.workers = 1, .queue_capacity = 1});
    pool.shutdown();  // Refuses every task from now on

    ReassemblyEngine engine(sink, {}, &pool);
    std::vector<TransferOutcome> outcomes;
    engine.set_completion_callback([&outcomes](const TransferOutcome& o) { outcomes.push_back(o); });

    EXPECT_CALL(sink, upload(_, _, _, _)).Times(0);

    EXPECT_FALSE(engine.submit(make_session("img-9", 1, {{0, "a"}})));
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].error, ErrorKind::STORAGE_ERROR);
    EXPECT_EQ(outcomes[0].detail, "upload queue saturated");
    EXPECT_EQ(engine.stats().storage_failures, 1u);
}

}  // namespace
}  // namespace stitch::reassembly
