#include "engine_service.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

EngineService::EngineService(const Config& config)
    : config_(config),
      backoff_(config.base_backoff_seconds, config.max_backoff_seconds) {
    catalog_ = make_catalog();
    store_ = make_store();
    sink_ = make_sink();
    http_ = std::make_shared<CprHttpClient>();
    connectors_ = std::make_shared<DeviceConnectorFactory>(
        config_, std::make_shared<EnvCredentialResolver>(), http_);

    dispatcher_ = std::make_unique<NotificationDispatcher>(sink_, static_cast<size_t>(config_.notification_queue_limit));
    handlers_ = make_default_handlers(config_, http_, *dispatcher_);
    audits_ = std::make_unique<AuditOrchestrator>(config_, catalog_, connectors_, store_, sessions_, backoff_);
    workflows_ = std::make_unique<WorkflowExecutor>(config_, catalog_, connectors_, store_, sessions_, *handlers_);
    api_ = std::make_unique<ApiServer>(config_, *audits_, *workflows_, catalog_, [this] { return health(); });
}

EngineService::~EngineService() {
    stop();
}

std::shared_ptr<Catalog> EngineService::make_catalog() {
    if (!config_.pg_dsn.empty()) {
        spdlog::info("Catalog: PostgreSQL");
        return std::make_shared<PgCatalog>(config_);
    }
    if (!config_.catalog_file.empty()) {
        auto catalog = std::make_shared<FileCatalog>(config_.catalog_file);
        if (!catalog->load()) {
            spdlog::warn("Catalog file {} could not be loaded; starting with an empty catalog", config_.catalog_file);
        }
        return catalog;
    }
    spdlog::warn("Neither PG_DSN nor CATALOG_FILE is set; starting with an empty catalog");
    return std::make_shared<MemoryCatalog>();
}

std::shared_ptr<ResultStore> EngineService::make_store() {
    if (config_.pg_dsn.empty()) {
        spdlog::info("Result store: in-memory");
        return std::make_shared<MemoryResultStore>(static_cast<size_t>(config_.max_retained_runs));
    }
    auto store = std::make_shared<PgResultStore>(config_);
    if (!store->initialize_schema()) {
        spdlog::warn("Result store schema could not be initialized; records may be dropped");
    }
    return store;
}

std::shared_ptr<NotificationSink> EngineService::make_sink() {
    if (config_.redis_url.empty()) {
        spdlog::info("Notification sink: log");
        return std::make_shared<LogNotificationSink>();
    }
    spdlog::info("Notification sink: Redis stream {}", config_.notification_stream);
    return std::make_shared<RedisNotificationSink>(config_);
}

void EngineService::start() {
    dispatcher_->start();
    api_->start();
    started_ = true;
    spdlog::info("{} started", config_.service_name);
}

void EngineService::stop() {
    if (!started_) return;
    started_ = false;

    spdlog::info("{} shutting down", config_.service_name);
    api_->stop();
    workflows_->shutdown();
    audits_->shutdown();
    dispatcher_->stop();
    spdlog::info("Notifications delivered: {}, failed: {}", dispatcher_->delivered(), dispatcher_->failed());
}

nlohmann::json EngineService::health() {
    bool catalog_ok = catalog_->check_health();
    bool store_ok = store_->check_health();
    bool sink_ok = dispatcher_->check_health();

    nlohmann::json status;
    status["service"] = config_.service_name;
    status["status"] = catalog_ok && store_ok ? "healthy" : "unhealthy";
    status["timestamp"] = util::format_timestamp(std::chrono::system_clock::now());
    status["components"] = {
        {"catalog", catalog_ok ? "healthy" : "unhealthy"},
        {"result_store", store_ok ? "healthy" : "unhealthy"},
        {"notification_sink", sink_ok ? "healthy" : "degraded"}
    };
    status["active_audits"] = audits_->active_runs();
    status["active_executions"] = workflows_->active_executions();
    status["open_sessions"] = sessions_.open_count();
    return status;
}
