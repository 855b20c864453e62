#include "workflow_executor.hpp"
#include "errors.hpp"
#include "run_retention.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

// Re-running these would repeat a change on the device or a remote system
bool has_side_effects(const Step& step) {
    switch (step.type) {
        case StepType::Remediate:
        case StepType::Notification:
            return true;
        case StepType::ApiCall:
            return std::get<ApiCallSpec>(step.payload).method != "GET";
        default:
            return false;
    }
}

} // namespace

std::string to_string(StepStatus status) {
    switch (status) {
        case StepStatus::Pending:                 return "pending";
        case StepStatus::Running:                 return "running";
        case StepStatus::Completed:               return "completed";
        case StepStatus::Failed:                  return "failed";
        case StepStatus::Skipped:                 return "skipped";
        case StepStatus::SkippedDependencyFailed: return "skipped_dependency_failed";
        case StepStatus::Cancelled:               return "cancelled";
    }
    return "unknown";
}

std::string to_string(ExecutionState state) {
    switch (state) {
        case ExecutionState::Pending:   return "pending";
        case ExecutionState::Running:   return "running";
        case ExecutionState::Completed: return "completed";
        case ExecutionState::Failed:    return "failed";
        case ExecutionState::Cancelled: return "cancelled";
    }
    return "unknown";
}

bool is_terminal(StepStatus status) {
    return status != StepStatus::Pending && status != StepStatus::Running;
}

nlohmann::json StepLog::to_json() const {
    return {
        {"step_name", step_name},
        {"step_type", ::to_string(step_type)},
        {"status", ::to_string(status)},
        {"attempts", attempts},
        {"started_at", util::format_timestamp(started_at)},
        {"finished_at", util::format_timestamp(finished_at)},
        {"duration_ms", duration_ms},
        {"output", output},
        {"message", message}
    };
}

const StepLog* WorkflowExecution::log_for(const std::string& step_name) const {
    for (const auto& log : logs) {
        if (log.step_name == step_name) return &log;
    }
    return nullptr;
}

nlohmann::json WorkflowExecution::to_json() const {
    nlohmann::json steps = nlohmann::json::object();
    for (const auto& [name, status] : step_status) {
        steps[name] = ::to_string(status);
    }
    nlohmann::json log_entries = nlohmann::json::array();
    for (const auto& log : logs) {
        log_entries.push_back(log.to_json());
    }
    return {
        {"id", id},
        {"workflow_id", workflow_id},
        {"workflow_name", workflow_name},
        {"execution_mode", ::to_string(mode)},
        {"device_id", device_id},
        {"state", ::to_string(state)},
        {"started_at", util::format_timestamp(started_at)},
        {"finished_at", finished_at ? nlohmann::json(util::format_timestamp(*finished_at))
                                    : nlohmann::json(nullptr)},
        {"steps", steps},
        {"logs", log_entries},
        {"message", message}
    };
}

WorkflowExecutor::WorkflowExecutor(const Config& config,
                                   std::shared_ptr<Catalog> catalog,
                                   std::shared_ptr<ConnectorFactory> connectors,
                                   std::shared_ptr<ResultStore> store,
                                   SessionRegistry& sessions,
                                   HandlerRegistry& handlers)
    : config_(config),
      catalog_(std::move(catalog)),
      connectors_(std::move(connectors)),
      store_(std::move(store)),
      sessions_(sessions),
      handlers_(handlers),
      coordinators_("workflow", config.max_concurrent_executions) {}

WorkflowExecutor::~WorkflowExecutor() {
    shutdown();
}

std::string WorkflowExecutor::start(const Workflow& workflow, const std::string& device_id,
                                    const nlohmann::json& overrides) {
    if (workflow.steps.empty()) {
        throw DefinitionError(fmt::format("Workflow '{}' has no steps", workflow.name));
    }
    check_graph(workflow);

    if (!overrides.is_null() && !overrides.is_object()) {
        throw DefinitionError("Variable overrides must be a mapping");
    }
    auto device = catalog_->find_device(device_id);
    if (!device) {
        throw DefinitionError(fmt::format("Unknown device '{}'", device_id));
    }

    auto state = std::make_shared<RunState>();
    state->workflow = workflow;
    state->device = *device;

    auto& execution = state->execution;
    execution.id = util::generate_uuid();
    execution.workflow_id = workflow.id;
    execution.workflow_name = workflow.name;
    execution.mode = workflow.mode;
    execution.device_id = device->id;
    execution.started_at = std::chrono::system_clock::now();
    for (const auto& step : workflow.steps) {
        execution.step_status[step.name] = StepStatus::Pending;
    }

    auto& scope = execution.scope;
    scope = workflow.variables.is_object() ? workflow.variables : nlohmann::json::object();
    if (overrides.is_object()) {
        for (auto it = overrides.begin(); it != overrides.end(); ++it) {
            scope[it.key()] = it.value();
        }
    }
    scope["device"] = device->to_json();
    scope["workflow"] = {{"id", workflow.id}, {"name", workflow.name}, {"execution_id", execution.id}};

    state->log = std::make_unique<ExecutionLog>(store_, execution.id, "workflow");
    state->log->open({{"workflow_id", workflow.id},
                      {"workflow_name", workflow.name},
                      {"device_id", device->id},
                      {"execution_mode", to_string(workflow.mode)}});

    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        runs_[execution.id] = state;
        prune_locked();
    }

    spdlog::info("Execution {} of workflow '{}' on {} submitted ({} steps, {})",
                 execution.id, workflow.name, device->id, workflow.steps.size(), to_string(workflow.mode));

    auto id = execution.id;
    if (!coordinators_.submit([this, state] { run_execution(state); })) {
        state->cancelled = true;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            for (size_t i = 0; i < state->workflow.steps.size(); ++i) {
                mark_locked(*state, i, StepStatus::Cancelled, "service shutting down");
            }
        }
        finish(state);
    }
    return id;
}

WorkflowExecution WorkflowExecutor::execute(const Workflow& workflow, const std::string& device_id,
                                            const nlohmann::json& overrides) {
    auto id = start(workflow, device_id, overrides);
    return *wait(id);
}

void WorkflowExecutor::run_execution(const std::shared_ptr<RunState>& state) {
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->execution.state = ExecutionState::Running;
    }

    try {
        // Opened by the first handler that needs the device
        SessionLease lease(sessions_, *connectors_, state->device);
        if (state->workflow.mode == ExecutionMode::Sequential) {
            run_sequential(state, lease);
        } else {
            run_graph(state, lease);
        }
    } catch (const std::exception& e) {
        spdlog::error("[{}] execution aborted: {}", state->execution.id, e.what());
        std::lock_guard<std::mutex> lock(state->mutex);
        for (size_t i = 0; i < state->workflow.steps.size(); ++i) {
            fail_unfinished_locked(*state, i, fmt::format("execution aborted: {}", e.what()));
        }
    }

    finish(state);
}

void WorkflowExecutor::run_sequential(const std::shared_ptr<RunState>& state, VendorConnector& session) {
    const auto& steps = state->workflow.steps;
    std::string failed_step;

    for (size_t i = 0; i < steps.size(); ++i) {
        nlohmann::json scope;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->cancelled) {
                mark_locked(*state, i, StepStatus::Cancelled, "execution cancelled");
                continue;
            }
            if (!failed_step.empty()) {
                mark_locked(*state, i, StepStatus::SkippedDependencyFailed,
                            fmt::format("earlier step '{}' failed", failed_step));
                continue;
            }
            scope = state->execution.scope;
        }

        StepStatus status = StepStatus::Failed;
        try {
            status = run_step(state, session, i, scope);
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(state->mutex);
            fail_unfinished_locked(*state, i, fmt::format("step aborted: {}", e.what()));
        }
        if (status == StepStatus::Failed && steps[i].on_error == OnError::Fail) {
            failed_step = steps[i].name;
        }
    }
}

void WorkflowExecutor::run_graph(const std::shared_ptr<RunState>& state, VendorConnector& session) {
    const auto& steps = state->workflow.steps;
    auto& status = state->execution.step_status;
    WorkerPool pool("steps", config_.workflow_parallelism);
    auto parallelism = static_cast<size_t>(config_.workflow_parallelism);

    std::unique_lock<std::mutex> lock(state->mutex);
    while (true) {
        bool changed = false;
        bool pending = false;

        for (size_t i = 0; i < steps.size(); ++i) {
            const auto& step = steps[i];
            if (status[step.name] != StepStatus::Pending) continue;

            if (state->cancelled) {
                mark_locked(*state, i, StepStatus::Cancelled, "execution cancelled");
                changed = true;
                continue;
            }

            std::string failed_dep;
            std::string cancelled_dep;
            bool ready = true;
            for (const auto& dep : step.depends_on) {
                auto dep_status = status[dep];
                if (dep_status == StepStatus::Failed || dep_status == StepStatus::SkippedDependencyFailed) {
                    failed_dep = dep;
                } else if (dep_status == StepStatus::Cancelled) {
                    cancelled_dep = dep;
                } else if (!is_terminal(dep_status)) {
                    ready = false;
                }
            }

            if (!failed_dep.empty()) {
                mark_locked(*state, i, StepStatus::SkippedDependencyFailed,
                            fmt::format("dependency '{}' did not complete", failed_dep));
                changed = true;
                continue;
            }
            if (!cancelled_dep.empty()) {
                mark_locked(*state, i, StepStatus::Cancelled,
                            fmt::format("dependency '{}' was cancelled", cancelled_dep));
                changed = true;
                continue;
            }
            if (!ready || state->in_flight >= parallelism) {
                pending = true;
                continue;
            }

            status[step.name] = StepStatus::Running;
            ++state->in_flight;
            auto scope = state->execution.scope;
            bool queued = pool.submit([this, state, &session, i, scope] {
                std::string error;
                try {
                    run_step(state, session, i, scope);
                } catch (const std::exception& e) {
                    error = e.what();
                }
                std::lock_guard<std::mutex> done_lock(state->mutex);
                --state->in_flight;
                if (!error.empty()) {
                    fail_unfinished_locked(*state, i, fmt::format("step aborted: {}", error));
                }
                state->cv.notify_all();
            });
            if (!queued) {
                --state->in_flight;
                mark_locked(*state, i, StepStatus::Cancelled, "step pool stopped");
            }
            changed = true;
        }

        if (changed) continue;
        if (!pending && state->in_flight == 0) break;
        state->cv.wait(lock);
    }
    lock.unlock();

    pool.stop();
}

StepStatus WorkflowExecutor::run_step(const std::shared_ptr<RunState>& state, VendorConnector& session,
                                      size_t index, const nlohmann::json& scope) {
    const auto& step = state->workflow.steps[index];

    StepLog log;
    log.step_name = step.name;
    log.step_type = step.type;
    log.started_at = std::chrono::system_clock::now();

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->execution.step_status[step.name] = StepStatus::Running;
    }

    auto conclude = [&](StepStatus status, nlohmann::json output, std::string message) {
        log.status = status;
        log.output = std::move(output);
        log.message = std::move(message);
        log.finished_at = std::chrono::system_clock::now();
        log.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            log.finished_at - log.started_at).count();

        std::lock_guard<std::mutex> lock(state->mutex);
        record_locked(*state, log);
        return status;
    };

    if (step.condition) {
        try {
            if (!step.condition->evaluate(scope)) {
                return conclude(StepStatus::Skipped, nullptr,
                                fmt::format("condition '{}' is false", step.condition->source()));
            }
        } catch (const std::exception& e) {
            return conclude(StepStatus::Failed, nullptr, fmt::format("condition error: {}", e.what()));
        }
    }

    auto* handler = handlers_.find(step.type);
    if (!handler) {
        return conclude(StepStatus::Failed, nullptr,
                        fmt::format("no handler registered for step type '{}'", to_string(step.type)));
    }

    const int attempts = step.retry_count + 1;
    StepOutcome outcome;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        log.attempts = attempt;
        outcome = attempt_step(state, *handler, session, index, scope, attempt);
        if (outcome.completed) break;

        spdlog::warn("[{}] step '{}' attempt {}/{} failed: {}", state->execution.id, step.name,
                     attempt, attempts, outcome.message);
        if (!outcome.retryable || attempt == attempts) break;

        std::unique_lock<std::mutex> lock(state->mutex);
        auto delay = std::chrono::duration<double>(step.retry_delay);
        state->cv.wait_for(lock, delay, [&] { return state->cancelled.load(); });
        if (state->cancelled) {
            lock.unlock();
            return conclude(StepStatus::Cancelled, outcome.output,
                            fmt::format("cancelled after attempt {}: {}", attempt, outcome.message));
        }
    }

    if (outcome.completed) {
        return conclude(StepStatus::Completed, std::move(outcome.output), std::move(outcome.message));
    }
    return conclude(StepStatus::Failed, std::move(outcome.output), std::move(outcome.message));
}

StepOutcome WorkflowExecutor::attempt_step(const std::shared_ptr<RunState>& state, StepHandler& handler,
                                           VendorConnector& session, size_t index,
                                           const nlohmann::json& scope, int attempt) {
    const auto& step = state->workflow.steps[index];
    int timeout = step.timeout > 0 ? step.timeout : config_.step_timeout_seconds;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout);

    StepContext context{step, state->workflow, state->execution.id, scope, state->device,
                        session, deadline, attempt, &state->cancelled};

    StepOutcome outcome;
    try {
        outcome = handler.execute(context);
    } catch (const StepFailure& e) {
        outcome = StepOutcome::failure(e.what(), e.retryable());
    } catch (const ConnectorError& e) {
        outcome = StepOutcome::failure(e.what(), e.transient());
    } catch (const DefinitionError& e) {
        outcome = StepOutcome::failure(e.what(), false);
    } catch (const std::exception& e) {
        outcome = StepOutcome::failure(fmt::format("unexpected error: {}", e.what()), false);
    }

    if (outcome.completed && std::chrono::steady_clock::now() > deadline) {
        if (has_side_effects(step)) {
            // The change already happened; a retry would apply it twice
            spdlog::warn("[{}] step '{}' completed after its {}s timeout", state->execution.id, step.name, timeout);
            outcome.message = fmt::format("completed after its {}s timeout{}", timeout,
                                          outcome.message.empty() ? "" : ": " + outcome.message);
            return outcome;
        }
        return StepOutcome::failure(fmt::format("step timed out after {}s", timeout), true, outcome.output);
    }
    return outcome;
}

void WorkflowExecutor::record_locked(RunState& state, StepLog log) {
    const auto& step = state.workflow.steps[*state.workflow.index_of(log.step_name)];
    auto& execution = state.execution;

    execution.step_status[log.step_name] = log.status;
    if (log.status == StepStatus::Completed) {
        execution.scope[step.binding()] = log.output;
    }

    spdlog::info("[{}] step '{}' {}{}", execution.id, log.step_name, to_string(log.status),
                 log.message.empty() ? "" : ": " + log.message);

    state.log->append("step", log.to_json());
    execution.logs.push_back(std::move(log));
    state.cv.notify_all();
}

void WorkflowExecutor::mark_locked(RunState& state, size_t index, StepStatus status, const std::string& message) {
    const auto& step = state.workflow.steps[index];
    StepLog log;
    log.step_name = step.name;
    log.step_type = step.type;
    log.status = status;
    log.started_at = log.finished_at = std::chrono::system_clock::now();
    log.message = message;
    record_locked(state, std::move(log));
}

void WorkflowExecutor::fail_unfinished_locked(RunState& state, size_t index, const std::string& message) {
    if (is_terminal(state.execution.step_status[state.workflow.steps[index].name])) return;
    mark_locked(state, index, StepStatus::Failed, message);
}

void WorkflowExecutor::finish(const std::shared_ptr<RunState>& state) {
    std::unique_lock<std::mutex> lock(state->mutex);
    auto& execution = state->execution;

    std::vector<std::string> failed;
    for (const auto& step : state->workflow.steps) {
        if (step.on_error == OnError::Fail && execution.step_status[step.name] == StepStatus::Failed) {
            failed.push_back(step.name);
        }
    }

    if (state->cancelled) {
        execution.state = ExecutionState::Cancelled;
        execution.message = "execution cancelled";
    } else if (!failed.empty()) {
        execution.state = ExecutionState::Failed;
        execution.message = fmt::format("failed steps: {}", util::join(failed, ", "));
    } else {
        execution.state = ExecutionState::Completed;
    }
    execution.finished_at = std::chrono::system_clock::now();

    spdlog::info("Execution {} of workflow '{}' {}{}", execution.id, execution.workflow_name,
                 to_string(execution.state), execution.message.empty() ? "" : ": " + execution.message);

    auto summary = execution.to_json();
    summary.erase("logs");
    // Closed before waiters wake so a finished execution is already stored
    state->log->close(to_string(execution.state), summary);
    lock.unlock();
    state->cv.notify_all();
}

void WorkflowExecutor::prune_locked() {
    auto dropped = prune_finished_runs(runs_, std::chrono::seconds(config_.run_retention_seconds),
                                       static_cast<size_t>(config_.max_retained_runs),
                                       [](RunState& state) {
                                           std::lock_guard<std::mutex> lock(state.mutex);
                                           return state.execution.finished_at;
                                       });
    if (dropped > 0) spdlog::debug("Dropped {} finished executions", dropped);
}

size_t WorkflowExecutor::execution_count() const {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    return runs_.size();
}

std::shared_ptr<WorkflowExecutor::RunState> WorkflowExecutor::find(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    auto it = runs_.find(execution_id);
    return it == runs_.end() ? nullptr : it->second;
}

std::optional<WorkflowExecution> WorkflowExecutor::get(const std::string& execution_id) const {
    auto state = find(execution_id);
    if (!state) return std::nullopt;
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->execution;
}

bool WorkflowExecutor::cancel(const std::string& execution_id) {
    auto state = find(execution_id);
    if (!state) return false;
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->execution.terminal()) return false;
    state->cancelled = true;
    state->cv.notify_all();
    spdlog::info("Execution {} cancellation requested", execution_id);
    return true;
}

std::optional<WorkflowExecution> WorkflowExecutor::wait(const std::string& execution_id,
                                                        std::optional<std::chrono::milliseconds> timeout) {
    auto state = find(execution_id);
    if (!state) return std::nullopt;

    std::unique_lock<std::mutex> lock(state->mutex);
    auto done = [&] { return state->execution.terminal(); };
    if (timeout) {
        state->cv.wait_for(lock, *timeout, done);
    } else {
        state->cv.wait(lock, done);
    }
    return state->execution;
}

void WorkflowExecutor::shutdown() {
    std::vector<std::shared_ptr<RunState>> active;
    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        for (auto& [id, state] : runs_) active.push_back(state);
    }
    for (auto& state : active) {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->execution.terminal()) continue;
        state->cancelled = true;
        state->cv.notify_all();
    }
    coordinators_.stop();
}

size_t WorkflowExecutor::active_executions() const {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    size_t count = 0;
    for (const auto& [id, state] : runs_) {
        std::lock_guard<std::mutex> run_lock(state->mutex);
        if (!state->execution.terminal()) ++count;
    }
    return count;
}
