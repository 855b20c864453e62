#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

// Per-device exponential backoff with jitter. Transient connector failures
// grow the delay; a successful call resets it.
class BackoffManager {
public:
    BackoffManager(double base_delay_seconds = 1.0, double max_delay_seconds = 60.0, double multiplier = 2.0);

    void record_failure(const std::string& device_id);
    void record_success(const std::string& device_id);

    // Delay to apply before the next attempt against this device
    std::chrono::milliseconds get_delay(const std::string& device_id);

    int failure_count(const std::string& device_id);

private:
    struct BackoffState {
        int failure_count = 0;
        std::chrono::steady_clock::time_point last_failure;
        std::chrono::milliseconds current_delay{0};

        BackoffState() : last_failure(std::chrono::steady_clock::now()) {}
    };

    std::chrono::milliseconds calculate_delay(int failure_count) const;

    std::mutex mutex_;
    std::unordered_map<std::string, BackoffState> states_;
    double base_delay_seconds_;
    double max_delay_seconds_;
    double multiplier_;
};
