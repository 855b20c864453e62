#include "notification.hpp"
#include "util.hpp"
#include "tree.hpp"
#include <algorithm>
#include <unordered_map>
#include <spdlog/spdlog.h>
#include <sw/redis++/redis++.h>

nlohmann::json Notification::to_json() const {
    return {
        {"id", id},
        {"execution_id", execution_id},
        {"workflow", workflow},
        {"device_id", device_id},
        {"subject", subject},
        {"message", message},
        {"severity", severity},
        {"channels", channels},
        {"ts", util::format_timestamp(created_at)}
    };
}

class RedisNotificationSink::Impl {
public:
    explicit Impl(const Config& config) : config_(config) {
        try {
            redis_ = std::make_unique<sw::redis::Redis>(config_.redis_url);
            spdlog::info("Connected to Redis at {}", config_.redis_url);
        } catch (const std::exception& e) {
            spdlog::error("Failed to connect to Redis: {}", e.what());
            redis_ = nullptr;
        }
    }

    bool deliver(const Notification& notification) {
        if (!redis_) {
            spdlog::error("Redis client not initialized");
            return false;
        }

        try {
            std::unordered_map<std::string, std::string> fields;
            fields["data"] = tree::dump(notification.to_json());
            redis_->xadd(config_.notification_stream, "*", fields.begin(), fields.end());
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Failed to publish notification {} to Redis: {}", notification.id, e.what());
            return false;
        }
    }

    bool check_health() {
        if (!redis_) return false;
        try {
            redis_->ping();
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Redis health check failed: {}", e.what());
            return false;
        }
    }

private:
    const Config& config_;
    std::unique_ptr<sw::redis::Redis> redis_;
};

RedisNotificationSink::RedisNotificationSink(const Config& config)
    : pImpl_(std::make_unique<Impl>(config)) {}

RedisNotificationSink::~RedisNotificationSink() = default;

bool RedisNotificationSink::deliver(const Notification& notification) {
    return pImpl_->deliver(notification);
}

bool RedisNotificationSink::check_health() {
    return pImpl_->check_health();
}

bool LogNotificationSink::deliver(const Notification& notification) {
    spdlog::info("Notification [{}] to {}: {}", notification.severity,
                 util::join(notification.channels, ","), notification.message);
    return true;
}

NotificationDispatcher::NotificationDispatcher(std::shared_ptr<NotificationSink> sink, size_t max_queued)
    : sink_(std::move(sink)), max_queued_(std::max<size_t>(1, max_queued)) {}

NotificationDispatcher::~NotificationDispatcher() {
    stop();
}

void NotificationDispatcher::start() {
    if (running_) return;
    running_ = true;
    dispatch_thread_ = std::thread(&NotificationDispatcher::dispatch_loop, this);
}

void NotificationDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) return;
        running_ = false;
    }
    queue_cv_.notify_all();
    if (dispatch_thread_.joinable()) {
        dispatch_thread_.join();
    }
    spdlog::info("Notification dispatcher stopped ({} delivered, {} failed, {} dropped)",
                 delivered_.load(), failed_.load(), dropped_.load());
}

bool NotificationDispatcher::enqueue(Notification notification) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) return false;
        if (queue_.size() >= max_queued_) {
            ++dropped_;
            spdlog::warn("Notification queue full ({} waiting), dropping {} for execution {}",
                         queue_.size(), notification.id, notification.execution_id);
            return false;
        }
        queue_.push(std::move(notification));
    }
    queue_cv_.notify_one();
    return true;
}

void NotificationDispatcher::dispatch_loop() {
    while (true) {
        Notification notification;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
            if (queue_.empty()) break;
            notification = std::move(queue_.front());
            queue_.pop();
        }

        if (sink_->deliver(notification)) {
            ++delivered_;
        } else {
            ++failed_;
            spdlog::warn("Notification {} for execution {} was not delivered",
                         notification.id, notification.execution_id);
        }
    }
}
