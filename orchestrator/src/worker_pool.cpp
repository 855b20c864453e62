#include "worker_pool.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

WorkerPool::WorkerPool(std::string name, int threads) : name_(std::move(name)) {
    int count = std::max(1, threads);
    threads_.reserve(count);
    for (int i = 0; i < count; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
    spdlog::debug("{} pool started with {} workers", name_, count);
}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) return false;
        queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) return;
        running_ = false;
    }
    queue_cv_.notify_all();

    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    spdlog::debug("{} pool stopped", name_);
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
            if (queue_.empty()) break; // Stopped and drained
            task = std::move(queue_.front());
            queue_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("{} task failed: {}", name_, e.what());
        }
    }
}
