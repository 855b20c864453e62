#include "execution_log.hpp"
#include <spdlog/spdlog.h>

ExecutionLog::ExecutionLog(std::shared_ptr<ResultStore> store, std::string run_id, std::string kind)
    : store_(std::move(store)), run_id_(std::move(run_id)), kind_(std::move(kind)) {}

void ExecutionLog::open(const nlohmann::json& summary) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!store_->create_run(run_id_, kind_, summary)) {
        spdlog::warn("Failed to record {} run {}", kind_, run_id_);
    }
}

void ExecutionLog::append(const std::string& record_kind, const nlohmann::json& record) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_) {
        spdlog::warn("Dropping {} record for closed run {}", record_kind, run_id_);
        return;
    }
    if (!store_->append_record(run_id_, record_kind, record)) {
        ++failed_;
        spdlog::warn("Failed to store {} record for run {}", record_kind, run_id_);
    }
}

void ExecutionLog::close(const std::string& state, const nlohmann::json& summary) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_) return;
    closed_ = true;
    if (!store_->complete_run(run_id_, state, summary)) {
        spdlog::warn("Failed to finalize {} run {}", kind_, run_id_);
    }
    if (failed_ > 0) {
        spdlog::warn("Run {} finished with {} records not stored", run_id_, failed_.load());
    }
}
