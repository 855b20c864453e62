#pragma once

#include "config.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

struct Notification {
    std::string id;
    std::string execution_id;
    std::string workflow;
    std::string device_id;
    std::string subject;
    std::string message;
    std::string severity = "info";
    std::vector<std::string> channels;
    std::chrono::system_clock::time_point created_at;

    nlohmann::json to_json() const;
};

// Delivery transport. Channel fan-out happens downstream of the sink.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual bool deliver(const Notification& notification) = 0;
    virtual bool check_health() { return true; }
};

// Publishes {"data": <notification json>} entries to a Redis stream
class RedisNotificationSink : public NotificationSink {
public:
    explicit RedisNotificationSink(const Config& config);
    ~RedisNotificationSink() override;

    bool deliver(const Notification& notification) override;
    bool check_health() override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

// Writes notifications to the service log when no broker is configured
class LogNotificationSink : public NotificationSink {
public:
    bool deliver(const Notification& notification) override;
};

// Queues notifications and delivers them on its own thread so workflow
// steps never wait on the transport. At most max_queued wait for delivery.
class NotificationDispatcher {
public:
    explicit NotificationDispatcher(std::shared_ptr<NotificationSink> sink, size_t max_queued = 1000);
    ~NotificationDispatcher();

    void start();

    // Delivers what is queued, then stops the thread
    void stop();

    // Returns false when the dispatcher is not running or the queue is full
    bool enqueue(Notification notification);

    size_t delivered() const { return delivered_; }
    size_t failed() const { return failed_; }
    size_t dropped() const { return dropped_; }
    bool check_health() { return sink_->check_health(); }

private:
    void dispatch_loop();

    std::shared_ptr<NotificationSink> sink_;
    size_t max_queued_;
    std::atomic<bool> running_{false};
    std::thread dispatch_thread_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::queue<Notification> queue_;

    std::atomic<size_t> delivered_{0};
    std::atomic<size_t> failed_{0};
    std::atomic<size_t> dropped_{0};
};
