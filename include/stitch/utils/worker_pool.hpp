#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace stitch::utils {

// Worker pool configuration
struct WorkerPoolConfig {
    size_t workers = 2;          // Worker threads
    size_t queue_capacity = 64;  // Max queued tasks before submit() refuses
};

// Fixed-size thread pool with a bounded FIFO queue
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(const WorkerPoolConfig& config = {});
    ~WorkerPool();

    // Disable copy
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Queue a task
    // Returns false if the queue is full or the pool is stopping
    bool submit(Task task);

    // Block until the queue is empty and no task is running
    void wait_idle();

    // Finish queued tasks and join the workers
    void shutdown();

    [[nodiscard]] size_t queued() const;
    [[nodiscard]] size_t worker_count() const { return threads_.size(); }
    [[nodiscard]] uint64_t tasks_completed() const;
    [[nodiscard]] uint64_t tasks_rejected() const;

private:
    WorkerPoolConfig config_;
    std::vector<std::thread> threads_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<Task> queue_;
    size_t running_{0};
    bool stopping_{false};

    // Statistics
    uint64_t tasks_completed_{0};
    uint64_t tasks_rejected_{0};

    void worker_loop();
};

}  // namespace stitch::utils
