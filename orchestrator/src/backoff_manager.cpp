#include "backoff_manager.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

BackoffManager::BackoffManager(double base_delay_seconds, double max_delay_seconds, double multiplier)
    : base_delay_seconds_(base_delay_seconds),
      max_delay_seconds_(max_delay_seconds),
      multiplier_(multiplier) {
}

void BackoffManager::record_failure(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& state = states_[device_id];
    state.failure_count++;
    state.last_failure = std::chrono::steady_clock::now();
    state.current_delay = calculate_delay(state.failure_count);
}

void BackoffManager::record_success(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_.erase(device_id);
}

std::chrono::milliseconds BackoffManager::get_delay(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(device_id);
    if (it == states_.end()) {
        return std::chrono::milliseconds(0);
    }
    return it->second.current_delay;
}

int BackoffManager::failure_count(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(device_id);
    return it == states_.end() ? 0 : it->second.failure_count;
}

std::chrono::milliseconds BackoffManager::calculate_delay(int failure_count) const {
    if (failure_count <= 0) {
        return std::chrono::milliseconds(0);
    }

    double delay_seconds = base_delay_seconds_ * std::pow(multiplier_, failure_count - 1);
    delay_seconds = std::min(delay_seconds, max_delay_seconds_);

    // ±10% jitter
    delay_seconds = util::random_jitter(delay_seconds, 0.1);

    return std::chrono::milliseconds(static_cast<long long>(delay_seconds * 1000));
}
