#pragma once

#include "config.hpp"
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Durable record of audit runs and workflow executions. Failures are logged
// and reported through the return value; callers never abort on them.
class ResultStore {
public:
    virtual ~ResultStore() = default;

    // kind: "audit" or "workflow"
    virtual bool create_run(const std::string& run_id, const std::string& kind, const nlohmann::json& summary) = 0;

    // kind: "finding" or "step"
    virtual bool append_record(const std::string& run_id, const std::string& kind, const nlohmann::json& record) = 0;

    virtual bool complete_run(const std::string& run_id, const std::string& state, const nlohmann::json& summary) = 0;

    virtual bool check_health() = 0;
};

// Keeps at most max_completed_runs finished runs (0 keeps all); the oldest
// completed run is dropped first.
class MemoryResultStore : public ResultStore {
public:
    explicit MemoryResultStore(size_t max_completed_runs = 0);

    struct RunRecord {
        std::string kind;
        std::string state = "running";
        nlohmann::json summary;
        std::vector<std::pair<std::string, nlohmann::json>> records;
    };

    bool create_run(const std::string& run_id, const std::string& kind, const nlohmann::json& summary) override;
    bool append_record(const std::string& run_id, const std::string& kind, const nlohmann::json& record) override;
    bool complete_run(const std::string& run_id, const std::string& state, const nlohmann::json& summary) override;
    bool check_health() override { return true; }

    std::optional<RunRecord> run(const std::string& run_id) const;
    size_t size() const;

private:
    size_t max_completed_runs_;
    mutable std::mutex mutex_;
    std::map<std::string, RunRecord> runs_;
    std::deque<std::string> completed_;
};

// Tables compliance_runs and run_records, created on first use
class PgResultStore : public ResultStore {
public:
    explicit PgResultStore(const Config& config);
    ~PgResultStore() override;

    bool initialize_schema();

    bool create_run(const std::string& run_id, const std::string& kind, const nlohmann::json& summary) override;
    bool append_record(const std::string& run_id, const std::string& kind, const nlohmann::json& record) override;
    bool complete_run(const std::string& run_id, const std::string& state, const nlohmann::json& summary) override;
    bool check_health() override;

    PgResultStore(const PgResultStore&) = delete;
    PgResultStore& operator=(const PgResultStore&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};
