#pragma once

#include "result_store.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

// Single writer for one run's records. Appends from concurrent workers are
// serialized and reach the store in production order.
class ExecutionLog {
public:
    ExecutionLog(std::shared_ptr<ResultStore> store, std::string run_id, std::string kind);

    void open(const nlohmann::json& summary);
    void append(const std::string& record_kind, const nlohmann::json& record);
    void close(const std::string& state, const nlohmann::json& summary);

private:
    std::shared_ptr<ResultStore> store_;
    std::string run_id_;
    std::string kind_;

    std::mutex write_mutex_;
    std::atomic<size_t> failed_{0};
    bool closed_ = false;
};
