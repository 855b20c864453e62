#pragma once

#include "api_server.hpp"
#include "audit_orchestrator.hpp"
#include "backoff_manager.hpp"
#include "catalog.hpp"
#include "config.hpp"
#include "handlers.hpp"
#include "http_client.hpp"
#include "notification.hpp"
#include "result_store.hpp"
#include "session.hpp"
#include "workflow_executor.hpp"
#include <memory>
#include <nlohmann/json.hpp>

// Wires the collaborators picked by the configuration into the engine
class EngineService {
public:
    explicit EngineService(const Config& config);
    ~EngineService();

    void start();

    // Stops the API, cancels runs and drains the notification queue
    void stop();

    nlohmann::json health();

private:
    std::shared_ptr<Catalog> make_catalog();
    std::shared_ptr<ResultStore> make_store();
    std::shared_ptr<NotificationSink> make_sink();

    Config config_;
    std::shared_ptr<Catalog> catalog_;
    std::shared_ptr<ResultStore> store_;
    std::shared_ptr<NotificationSink> sink_;
    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<ConnectorFactory> connectors_;
    SessionRegistry sessions_;
    BackoffManager backoff_;
    std::unique_ptr<NotificationDispatcher> dispatcher_;
    std::unique_ptr<HandlerRegistry> handlers_;
    std::unique_ptr<AuditOrchestrator> audits_;
    std::unique_ptr<WorkflowExecutor> workflows_;
    std::unique_ptr<ApiServer> api_;
    bool started_ = false;
};
