#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

// Fixed set of threads draining a FIFO task queue. Audit runs use it to bound
// concurrent device sessions, workflow executions to bound parallel steps.
class WorkerPool {
public:
    WorkerPool(std::string name, int threads);
    ~WorkerPool();

    // Returns false once the pool is stopping
    bool submit(std::function<void()> task);

    // Runs the queued tasks to completion, then joins the threads
    void stop();

    size_t size() const { return threads_.size(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

private:
    void worker_loop();

    std::string name_;
    std::vector<std::thread> threads_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::queue<std::function<void()>> queue_;
    std::atomic<bool> running_{true};
};
