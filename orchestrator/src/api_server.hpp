#pragma once

#include "audit_orchestrator.hpp"
#include "catalog.hpp"
#include "config.hpp"
#include "workflow_executor.hpp"
#include <httplib.h>
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

// JSON API over the audit orchestrator and the workflow executor
class ApiServer {
public:
    using HealthProvider = std::function<nlohmann::json()>;

    ApiServer(const Config& config,
              AuditOrchestrator& audits,
              WorkflowExecutor& workflows,
              std::shared_ptr<Catalog> catalog,
              HealthProvider health);
    ~ApiServer();

    void start();
    void stop();
    bool is_running() const { return running_; }

    // Route bodies, callable without a listening socket
    void handle_submit_audit(const httplib::Request& req, httplib::Response& res);
    void handle_get_audit(const std::string& run_id, httplib::Response& res);
    void handle_cancel_audit(const std::string& run_id, httplib::Response& res);
    void handle_start_execution(const std::string& workflow_id, const httplib::Request& req, httplib::Response& res);
    void handle_validate_workflow(const httplib::Request& req, httplib::Response& res);
    void handle_get_execution(const std::string& execution_id, httplib::Response& res);
    void handle_cancel_execution(const std::string& execution_id, httplib::Response& res);
    void handle_health(httplib::Response& res);

private:
    void setup_routes();

    const Config& config_;
    AuditOrchestrator& audits_;
    WorkflowExecutor& workflows_;
    std::shared_ptr<Catalog> catalog_;
    HealthProvider health_;

    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};
};
