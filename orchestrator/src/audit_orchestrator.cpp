#include "audit_orchestrator.hpp"
#include "errors.hpp"
#include "run_retention.hpp"
#include "util.hpp"
#include <set>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

AuditOrchestrator::AuditOrchestrator(const Config& config,
                                     std::shared_ptr<Catalog> catalog,
                                     std::shared_ptr<ConnectorFactory> connectors,
                                     std::shared_ptr<ResultStore> store,
                                     SessionRegistry& sessions,
                                     BackoffManager& backoff)
    : config_(config),
      catalog_(std::move(catalog)),
      connectors_(std::move(connectors)),
      store_(std::move(store)),
      sessions_(sessions),
      backoff_(backoff),
      evaluator_(config, backoff),
      pool_("audit", config.audit_concurrency) {}

AuditOrchestrator::~AuditOrchestrator() {
    shutdown();
}

std::string AuditOrchestrator::submit(const std::vector<std::string>& device_ids,
                                      const std::vector<std::string>& rule_ids) {
    if (device_ids.empty()) {
        throw DefinitionError("Audit needs at least one device");
    }
    if (rule_ids.empty()) {
        throw DefinitionError("Audit needs at least one rule");
    }

    auto state = std::make_shared<RunState>();

    std::set<std::string> seen;
    for (const auto& id : device_ids) {
        if (!seen.insert(id).second) continue;
        auto device = catalog_->find_device(id);
        if (!device) {
            throw DefinitionError(fmt::format("Unknown device '{}'", id));
        }
        state->devices.push_back(*device);
    }

    seen.clear();
    for (const auto& id : rule_ids) {
        if (!seen.insert(id).second) continue;
        auto rule = catalog_->find_rule(id);
        if (!rule) {
            throw DefinitionError(fmt::format("Unknown rule '{}'", id));
        }
        rule->validate();
        rule->compile_patterns();
        state->rules.push_back(std::move(*rule));
    }

    // Only checks of rules scoped to a selected device's vendor will run
    size_t check_count = 0;
    for (const auto& device : state->devices) {
        for (const auto& rule : state->rules) {
            if (rule.applies_to(device.vendor)) check_count += rule.checks.size();
        }
    }
    if (check_count == 0) {
        throw DefinitionError("Audit has no checks to run: no selected rule applies to the selected devices");
    }

    auto& run = state->run;
    run.id = util::generate_uuid();
    run.started_at = std::chrono::system_clock::now();
    run.state = AuditRunState::Running;
    for (const auto& d : state->devices) {
        run.device_ids.push_back(d.id);
        run.device_states[d.id] = DeviceAuditState::Pending;
    }
    for (const auto& r : state->rules) {
        run.rule_ids.push_back(r.id);
    }
    state->remaining = state->devices.size();

    state->log = std::make_unique<ExecutionLog>(store_, run.id, "audit");
    state->log->open({{"device_ids", run.device_ids}, {"rule_ids", run.rule_ids}});

    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        runs_[run.id] = state;
        prune_locked();
    }

    spdlog::info("Audit {} submitted: {} devices, {} rules", run.id, state->devices.size(), state->rules.size());

    for (size_t i = 0; i < state->devices.size(); ++i) {
        if (!pool_.submit([this, state, i] { audit_device(state, i); })) {
            finish_device(state, state->devices[i].id, DeviceAuditState::Cancelled, "service shutting down");
        }
    }
    return run.id;
}

AuditRun AuditOrchestrator::run_audit(const std::vector<std::string>& device_ids,
                                      const std::vector<std::string>& rule_ids) {
    auto id = submit(device_ids, rule_ids);
    auto run = wait(id);
    return *run;
}

void AuditOrchestrator::audit_device(const std::shared_ptr<RunState>& state, size_t device_index) {
    const auto& device = state->devices[device_index];

    if (state->cancelled) {
        finish_device(state, device.id, DeviceAuditState::Cancelled, "run cancelled before device started");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->run.device_states[device.id] = DeviceAuditState::Running;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config_.device_timeout_seconds);
    size_t rule_index = 0;
    size_t recorded = 0;    // Findings of rules[rule_index] recorded so far
    auto record = [&](const Finding& f) {
        ++recorded;
        state->log->append("finding", f.to_json());
        std::lock_guard<std::mutex> lock(state->mutex);
        state->run.findings.push_back(f);
    };

    DeviceAuditState outcome = DeviceAuditState::Completed;
    std::string message;
    try {
        // Opened by the first fetch, closed when this scope ends
        SessionLease lease(sessions_, *connectors_, device);

        for (; rule_index < state->rules.size(); ++rule_index) {
            const auto& rule = state->rules[rule_index];
            recorded = 0;
            if (!rule.applies_to(device.vendor)) {
                spdlog::debug("[{}] Rule '{}' does not apply to vendor '{}'", device.id, rule.name, device.vendor);
                continue;
            }

            auto result = evaluator_.evaluate(rule, lease, device, deadline, record);
            if (result.aborted) {
                outcome = result.timed_out ? DeviceAuditState::TimedOut : DeviceAuditState::Error;
                message = result.abort_reason;
                ++rule_index;
                break;
            }
        }
    } catch (const std::exception& e) {
        outcome = DeviceAuditState::Error;
        message = fmt::format("device audit failed: {}", e.what());
        spdlog::error("[{}] Audit {}: {}", device.id, state->run.id, message);
        if (rule_index < state->rules.size() && state->rules[rule_index].applies_to(device.vendor)) {
            for (const auto& f : RuleEvaluator::error_findings(state->rules[rule_index], device, recorded, message)) {
                record(f);
            }
        }
        ++rule_index;
    }

    // Remaining rules cannot run on this device any more
    if (outcome != DeviceAuditState::Completed) {
        for (; rule_index < state->rules.size(); ++rule_index) {
            const auto& rule = state->rules[rule_index];
            if (!rule.applies_to(device.vendor)) continue;
            for (const auto& f : RuleEvaluator::error_findings(rule, device, 0, message)) {
                record(f);
            }
        }
    }

    finish_device(state, device.id, outcome, message);
}

void AuditOrchestrator::finish_device(const std::shared_ptr<RunState>& state, const std::string& device_id,
                                      DeviceAuditState outcome, const std::string& message) {
    std::unique_lock<std::mutex> lock(state->mutex);
    auto& run = state->run;
    run.device_states[device_id] = outcome;
    if (!message.empty()) {
        run.device_messages[device_id] = message;
    }

    spdlog::info("Audit {} device {} {}{}", run.id, device_id, to_string(outcome),
                 message.empty() ? "" : ": " + message);

    if (--state->remaining > 0) return;

    run.state = state->cancelled ? AuditRunState::Cancelled : AuditRunState::Completed;
    run.finished_at = std::chrono::system_clock::now();
    auto score = run.score();
    spdlog::info("Audit {} {}: {}/{} checks passed{}", run.id, to_string(run.state),
                 run.passed_checks(), run.total_checks(),
                 score ? fmt::format(" (score {:.1f})", *score) : std::string());

    auto summary = run.to_json();
    summary.erase("findings");
    state->log->close(to_string(run.state), summary);
    lock.unlock();
    state->done_cv.notify_all();
}

void AuditOrchestrator::prune_locked() {
    auto dropped = prune_finished_runs(runs_, std::chrono::seconds(config_.run_retention_seconds),
                                       static_cast<size_t>(config_.max_retained_runs),
                                       [](RunState& state) {
                                           std::lock_guard<std::mutex> lock(state.mutex);
                                           return state.run.finished_at;
                                       });
    if (dropped > 0) spdlog::debug("Dropped {} finished audit runs", dropped);
}

size_t AuditOrchestrator::run_count() const {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    return runs_.size();
}

std::shared_ptr<AuditOrchestrator::RunState> AuditOrchestrator::find(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    auto it = runs_.find(run_id);
    return it == runs_.end() ? nullptr : it->second;
}

std::optional<AuditRun> AuditOrchestrator::get(const std::string& run_id) const {
    auto state = find(run_id);
    if (!state) return std::nullopt;
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->run;
}

bool AuditOrchestrator::cancel(const std::string& run_id) {
    auto state = find(run_id);
    if (!state) return false;
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->run.state != AuditRunState::Running) return false;
    state->cancelled = true;
    spdlog::info("Audit {} cancellation requested", run_id);
    return true;
}

std::optional<AuditRun> AuditOrchestrator::wait(const std::string& run_id,
                                                std::optional<std::chrono::milliseconds> timeout) {
    auto state = find(run_id);
    if (!state) return std::nullopt;

    std::unique_lock<std::mutex> lock(state->mutex);
    auto done = [&] { return state->run.state != AuditRunState::Running; };
    if (timeout) {
        state->done_cv.wait_for(lock, *timeout, done);
    } else {
        state->done_cv.wait(lock, done);
    }
    return state->run;
}

void AuditOrchestrator::shutdown() {
    std::vector<std::shared_ptr<RunState>> active;
    {
        std::lock_guard<std::mutex> lock(runs_mutex_);
        for (auto& [id, state] : runs_) active.push_back(state);
    }
    for (auto& state : active) {
        state->cancelled = true;
    }
    pool_.stop();
}

size_t AuditOrchestrator::active_runs() const {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    size_t count = 0;
    for (const auto& [id, state] : runs_) {
        std::lock_guard<std::mutex> run_lock(state->mutex);
        if (state->run.state == AuditRunState::Running) ++count;
    }
    return count;
}
