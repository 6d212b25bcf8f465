#include "stitch/utils/worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace stitch::utils {

WorkerPool::WorkerPool(const WorkerPoolConfig& config)
    : config_(config) {
    size_t count = config_.workers == 0 ? 1 : config_.workers;
    threads_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        threads_.emplace_back([this] { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || queue_.size() >= config_.queue_capacity) {
            ++tasks_rejected_;
            return false;
        }
        queue_.push_back(std::move(task));
    }
    work_cv_.notify_one();
    return true;
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    work_cv_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

uint64_t WorkerPool::tasks_completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_completed_;
}

uint64_t WorkerPool::tasks_rejected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_rejected_;
}

void WorkerPool::worker_loop() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });

            // Drain the queue before exiting
            if (queue_.empty()) {
                return;
            }

            task = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Worker task failed: {}", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --running_;
            ++tasks_completed_;
            if (queue_.empty() && running_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}

}  // namespace stitch::utils
