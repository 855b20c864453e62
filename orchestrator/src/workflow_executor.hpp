#pragma once

#include "catalog.hpp"
#include "config.hpp"
#include "execution_log.hpp"
#include "result_store.hpp"
#include "session.hpp"
#include "step_handler.hpp"
#include "worker_pool.hpp"
#include "workflow.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

enum class StepStatus { Pending, Running, Completed, Failed, Skipped, SkippedDependencyFailed, Cancelled };
enum class ExecutionState { Pending, Running, Completed, Failed, Cancelled };

std::string to_string(StepStatus status);
std::string to_string(ExecutionState state);

bool is_terminal(StepStatus status);

struct StepLog {
    std::string step_name;
    StepType step_type = StepType::Query;
    StepStatus status = StepStatus::Pending;
    int attempts = 0;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;
    int64_t duration_ms = 0;
    nlohmann::json output;
    std::string message;

    nlohmann::json to_json() const;
};

struct WorkflowExecution {
    std::string id;
    std::string workflow_id;
    std::string workflow_name;
    ExecutionMode mode = ExecutionMode::Sequential;
    std::string device_id;
    ExecutionState state = ExecutionState::Pending;
    std::chrono::system_clock::time_point started_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;
    nlohmann::json scope = nlohmann::json::object();
    std::vector<StepLog> logs;                       // In completion order
    std::map<std::string, StepStatus> step_status;
    std::string message;

    bool terminal() const {
        return state != ExecutionState::Pending && state != ExecutionState::Running;
    }

    const StepLog* log_for(const std::string& step_name) const;
    nlohmann::json to_json() const;
};

// Runs workflows against one device each. Executions are coordinated on a
// bounded pool; dag and hybrid steps fan out on a per-execution pool of
// WORKFLOW_PARALLELISM threads.
class WorkflowExecutor {
public:
    WorkflowExecutor(const Config& config,
                     std::shared_ptr<Catalog> catalog,
                     std::shared_ptr<ConnectorFactory> connectors,
                     std::shared_ptr<ResultStore> store,
                     SessionRegistry& sessions,
                     HandlerRegistry& handlers);
    ~WorkflowExecutor();

    // Throws DefinitionError for an invalid graph, an unknown device or
    // non-mapping overrides. No execution exists then.
    std::string start(const Workflow& workflow, const std::string& device_id,
                      const nlohmann::json& overrides = nlohmann::json::object());

    WorkflowExecution execute(const Workflow& workflow, const std::string& device_id,
                              const nlohmann::json& overrides = nlohmann::json::object());

    std::optional<WorkflowExecution> get(const std::string& execution_id) const;

    // Stops launching steps; running steps finish their current attempt
    bool cancel(const std::string& execution_id);

    std::optional<WorkflowExecution> wait(const std::string& execution_id,
                                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    void shutdown();

    size_t active_executions() const;

    // Executions still held in memory, finished ones included
    size_t execution_count() const;

private:
    struct RunState {
        std::mutex mutex;
        std::condition_variable cv;
        WorkflowExecution execution;
        Workflow workflow;
        Device device;
        std::atomic<bool> cancelled{false};
        size_t in_flight = 0;
        std::unique_ptr<ExecutionLog> log;
    };

    void run_execution(const std::shared_ptr<RunState>& state);
    void run_sequential(const std::shared_ptr<RunState>& state, VendorConnector& session);
    void run_graph(const std::shared_ptr<RunState>& state, VendorConnector& session);

    // Runs one step with its condition, retries and deadline
    StepStatus run_step(const std::shared_ptr<RunState>& state, VendorConnector& session,
                        size_t index, const nlohmann::json& scope);
    StepOutcome attempt_step(const std::shared_ptr<RunState>& state, StepHandler& handler,
                             VendorConnector& session, size_t index, const nlohmann::json& scope,
                             int attempt);

    // Records a terminal status; the caller holds state->mutex
    void record_locked(RunState& state, StepLog log);
    void mark_locked(RunState& state, size_t index, StepStatus status, const std::string& message);
    void fail_unfinished_locked(RunState& state, size_t index, const std::string& message);

    void finish(const std::shared_ptr<RunState>& state);
    std::shared_ptr<RunState> find(const std::string& execution_id) const;

    // Evicts finished executions past retention; the caller holds runs_mutex_
    void prune_locked();

    const Config& config_;
    std::shared_ptr<Catalog> catalog_;
    std::shared_ptr<ConnectorFactory> connectors_;
    std::shared_ptr<ResultStore> store_;
    SessionRegistry& sessions_;
    HandlerRegistry& handlers_;
    WorkerPool coordinators_;

    mutable std::mutex runs_mutex_;
    std::unordered_map<std::string, std::shared_ptr<RunState>> runs_;
};
