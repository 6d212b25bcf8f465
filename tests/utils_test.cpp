#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "stitch/crypto/crypto.hpp"
#include "stitch/utils/logging.hpp"
#include "stitch/utils/time.hpp"
#include "stitch/utils/worker_pool.hpp"

namespace stitch::utils {
namespace {

TEST(WorkerPoolTest, RunsAllTasks) {
    WorkerPool pool({.workers = 3, .queue_capacity = 100});
    std::atomic<int> counter{0};

    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(pool.submit([&counter] { ++counter; }));
    }
    pool.wait_idle();

    EXPECT_EQ(counter.load(), 50);
    EXPECT_EQ(pool.tasks_completed(), 50u);
    EXPECT_EQ(pool.worker_count(), 3u);
}

TEST(WorkerPoolTest, RefusesWhenQueueFull) {
    WorkerPool pool({.workers = 1, .queue_capacity = 1});

    std::mutex mutex;
    std::condition_variable cv;
    bool release = false;
    bool started = false;

    // Occupy the only worker
    ASSERT_TRUE(pool.submit([&] {
        std::unique_lock<std::mutex> lock(mutex);
        started = true;
        cv.notify_all();
        cv.wait(lock, [&] { return release; });
    }));
    {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&] { return started; });
    }

    EXPECT_TRUE(pool.submit([] {}));
    EXPECT_FALSE(pool.submit([] {}));
    EXPECT_EQ(pool.tasks_rejected(), 1u);

    {
        std::lock_guard<std::mutex> lock(mutex);
        release = true;
    }
    cv.notify_all();
    pool.wait_idle();
    EXPECT_EQ(pool.tasks_completed(), 2u);
}

TEST(WorkerPoolTest, ShutdownDrainsQueue) {
    std::atomic<int> counter{0};
    {
        WorkerPool pool({.workers = 1, .queue_capacity = 10});
        for (int i = 0; i < 5; ++i) {
            pool.submit([&counter] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                ++counter;
            });
        }
        pool.shutdown();
        EXPECT_FALSE(pool.submit([] {}));
    }
    EXPECT_EQ(counter.load(), 5);
}

TEST(WorkerPoolTest, ThrowingTaskDoesNotKillWorker) {
    WorkerPool pool({.workers = 1, .queue_capacity = 4});
    std::atomic<bool> ran{false};

    pool.submit([] { throw std::runtime_error("boom"); });
    pool.submit([&ran] { ran = true; });
    pool.wait_idle();

    EXPECT_TRUE(ran.load());
}

TEST(LoggingTest, LevelNames) {
    EXPECT_EQ(string_to_log_level("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(string_to_log_level("warning"), LogLevel::WARN);
    EXPECT_EQ(string_to_log_level("err"), LogLevel::ERROR);
    EXPECT_EQ(string_to_log_level("none"), LogLevel::OFF);
    EXPECT_EQ(string_to_log_level("bogus"), LogLevel::INFO);
    EXPECT_STREQ(log_level_to_string(LogLevel::CRITICAL), "critical");
}

TEST(LoggingTest, InitTwiceReplacesLogger) {
    LogConfig config;
    config.level = LogLevel::WARN;
    auto first = init_logging(config);
    config.level = LogLevel::DEBUG;
    auto second = init_logging(config);

    EXPECT_NE(first, second);
    EXPECT_EQ(spdlog::default_logger(), second);
    EXPECT_EQ(get_log_level(), LogLevel::DEBUG);

    set_log_level(LogLevel::INFO);
    EXPECT_EQ(get_log_level(), LogLevel::INFO);
}

TEST(TimeTest, UtcFormats) {
    // 2024-03-05 06:07:08.009 UTC
    auto tp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1709618828009LL));
    EXPECT_EQ(utc_compact(tp), "20240305060708");
    EXPECT_EQ(utc_iso8601(tp), "2024-03-05T06:07:08.009000");
}

TEST(TimeTest, TimerMeasures) {
    Timer timer;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_GE(timer.elapsed_ms(), 5u);
}

TEST(CryptoTest, Sha256KnownVector) {
    ASSERT_TRUE(crypto::init());
    std::string abc = "abc";
    auto digest = crypto::sha256({reinterpret_cast<const uint8_t*>(abc.data()), abc.size()});
    EXPECT_EQ(crypto::to_hex(digest),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

}  // namespace
}  // namespace stitch::utils
