#pragma once

#include "backoff_manager.hpp"
#include "catalog.hpp"
#include "config.hpp"
#include "execution_log.hpp"
#include "result_store.hpp"
#include "rule_evaluator.hpp"
#include "session.hpp"
#include "types.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Fans audits out over devices on a bounded pool. Each device gets its own
// session lease and deadline; run state is the aggregate of device outcomes.
class AuditOrchestrator {
public:
    AuditOrchestrator(const Config& config,
                      std::shared_ptr<Catalog> catalog,
                      std::shared_ptr<ConnectorFactory> connectors,
                      std::shared_ptr<ResultStore> store,
                      SessionRegistry& sessions,
                      BackoffManager& backoff);
    ~AuditOrchestrator();

    // Validates the request and schedules the run. Throws DefinitionError
    // for empty sets, unknown ids or invalid rules; no run exists then.
    std::string submit(const std::vector<std::string>& device_ids, const std::vector<std::string>& rule_ids);

    // Synchronous form of submit + wait
    AuditRun run_audit(const std::vector<std::string>& device_ids, const std::vector<std::string>& rule_ids);

    std::optional<AuditRun> get(const std::string& run_id) const;

    // Stops scheduling devices that have not started
    bool cancel(const std::string& run_id);

    // Blocks until the run is terminal or the timeout elapses
    std::optional<AuditRun> wait(const std::string& run_id,
                                 std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Cancels every run and waits for in-flight devices
    void shutdown();

    size_t active_runs() const;

    // Runs still held in memory, finished ones included
    size_t run_count() const;

private:
    struct RunState {
        std::mutex mutex;
        std::condition_variable done_cv;
        AuditRun run;
        std::vector<Device> devices;
        std::vector<Rule> rules;
        std::atomic<bool> cancelled{false};
        size_t remaining = 0;
        std::unique_ptr<ExecutionLog> log;
    };

    void audit_device(const std::shared_ptr<RunState>& state, size_t device_index);
    void finish_device(const std::shared_ptr<RunState>& state, const std::string& device_id,
                       DeviceAuditState outcome, const std::string& message);
    std::shared_ptr<RunState> find(const std::string& run_id) const;

    // Evicts finished runs past retention; the caller holds runs_mutex_
    void prune_locked();

    const Config& config_;
    std::shared_ptr<Catalog> catalog_;
    std::shared_ptr<ConnectorFactory> connectors_;
    std::shared_ptr<ResultStore> store_;
    SessionRegistry& sessions_;
    BackoffManager& backoff_;
    RuleEvaluator evaluator_;
    WorkerPool pool_;

    mutable std::mutex runs_mutex_;
    std::unordered_map<std::string, std::shared_ptr<RunState>> runs_;
};
