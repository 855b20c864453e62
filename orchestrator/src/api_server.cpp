#include "api_server.hpp"
#include "errors.hpp"
#include "tree.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

void reply(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(tree::dump(body), "application/json");
}

void reply_error(httplib::Response& res, int status, const std::string& message) {
    reply(res, status, {{"error", message}});
}

std::vector<std::string> string_list(const nlohmann::json& body, const std::string& key) {
    std::vector<std::string> values;
    if (!body.contains(key)) return values;
    if (!body[key].is_array()) {
        throw DefinitionError(fmt::format("'{}' must be a list", key));
    }
    for (const auto& item : body[key]) {
        if (!item.is_string()) {
            throw DefinitionError(fmt::format("'{}' entries must be strings", key));
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

}

ApiServer::ApiServer(const Config& config,
                     AuditOrchestrator& audits,
                     WorkflowExecutor& workflows,
                     std::shared_ptr<Catalog> catalog,
                     HealthProvider health)
    : config_(config),
      audits_(audits),
      workflows_(workflows),
      catalog_(std::move(catalog)),
      health_(std::move(health)),
      server_(std::make_unique<httplib::Server>()) {}

ApiServer::~ApiServer() {
    stop();
}

void ApiServer::start() {
    setup_routes();
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("Starting API server on {}:{}", config_.listen_addr, config_.listen_port);
        if (!server_->listen(config_.listen_addr.c_str(), config_.listen_port)) {
            spdlog::error("API server failed to listen on {}:{}", config_.listen_addr, config_.listen_port);
        }
    });
}

void ApiServer::stop() {
    if (running_) {
        running_ = false;
        server_->stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
        spdlog::info("API server stopped");
    }
}

void ApiServer::handle_submit_audit(const httplib::Request& req, httplib::Response& res) {
    try {
        auto body = nlohmann::json::parse(req.body);
        if (!body.is_object()) {
            reply_error(res, 400, "Request body must be an object");
            return;
        }
        auto run_id = audits_.submit(string_list(body, "device_ids"), string_list(body, "rule_ids"));
        reply(res, 202, {{"run_id", run_id}, {"state", "running"}});
    } catch (const nlohmann::json::parse_error& e) {
        reply_error(res, 400, fmt::format("Invalid JSON: {}", e.what()));
    } catch (const DefinitionError& e) {
        reply_error(res, 400, e.what());
    }
}

void ApiServer::handle_get_audit(const std::string& run_id, httplib::Response& res) {
    auto run = audits_.get(run_id);
    if (!run) {
        reply_error(res, 404, fmt::format("Unknown audit run '{}'", run_id));
        return;
    }
    reply(res, 200, run->to_json());
}

void ApiServer::handle_cancel_audit(const std::string& run_id, httplib::Response& res) {
    if (!audits_.get(run_id)) {
        reply_error(res, 404, fmt::format("Unknown audit run '{}'", run_id));
        return;
    }
    if (!audits_.cancel(run_id)) {
        reply_error(res, 409, "Audit run is no longer running");
        return;
    }
    reply(res, 200, {{"run_id", run_id}, {"cancelled", true}});
}

void ApiServer::handle_start_execution(const std::string& workflow_id, const httplib::Request& req,
                                       httplib::Response& res) {
    try {
        auto body = req.body.empty() ? nlohmann::json::object() : nlohmann::json::parse(req.body);
        if (!body.is_object() || !body.contains("device_id") || !body["device_id"].is_string()) {
            reply_error(res, 400, "Request body needs a device_id");
            return;
        }

        auto workflow = catalog_->find_workflow(workflow_id);
        if (!workflow) {
            reply_error(res, 404, fmt::format("Unknown workflow '{}'", workflow_id));
            return;
        }

        auto overrides = body.value("variables", nlohmann::json::object());
        auto execution_id = workflows_.start(*workflow, body["device_id"].get<std::string>(), overrides);
        reply(res, 202, {{"execution_id", execution_id}, {"state", "running"}});
    } catch (const nlohmann::json::parse_error& e) {
        reply_error(res, 400, fmt::format("Invalid JSON: {}", e.what()));
    } catch (const DefinitionError& e) {
        reply_error(res, 400, e.what());
    }
}

void ApiServer::handle_validate_workflow(const httplib::Request& req, httplib::Response& res) {
    try {
        auto workflow = Workflow::parse(req.body);
        nlohmann::json steps = nlohmann::json::array();
        for (const auto& step : workflow.steps) {
            steps.push_back({{"name", step.name}, {"type", to_string(step.type)}, {"depends_on", step.depends_on}});
        }
        reply(res, 200, {{"valid", true},
                         {"name", workflow.name},
                         {"execution_mode", to_string(workflow.mode)},
                         {"steps", steps}});
    } catch (const DefinitionError& e) {
        reply(res, 400, {{"valid", false}, {"error", e.what()}});
    }
}

void ApiServer::handle_get_execution(const std::string& execution_id, httplib::Response& res) {
    auto execution = workflows_.get(execution_id);
    if (!execution) {
        reply_error(res, 404, fmt::format("Unknown execution '{}'", execution_id));
        return;
    }
    reply(res, 200, execution->to_json());
}

void ApiServer::handle_cancel_execution(const std::string& execution_id, httplib::Response& res) {
    if (!workflows_.get(execution_id)) {
        reply_error(res, 404, fmt::format("Unknown execution '{}'", execution_id));
        return;
    }
    if (!workflows_.cancel(execution_id)) {
        reply_error(res, 409, "Execution is no longer running");
        return;
    }
    reply(res, 200, {{"execution_id", execution_id}, {"cancelled", true}});
}

void ApiServer::handle_health(httplib::Response& res) {
    auto health = health_();
    reply(res, health.value("status", "unhealthy") == "healthy" ? 200 : 503, health);
}

void ApiServer::setup_routes() {
    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        handle_health(res);
    });

    server_->Post("/audits", [this](const httplib::Request& req, httplib::Response& res) {
        handle_submit_audit(req, res);
    });
    server_->Get(R"(/audits/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handle_get_audit(req.matches[1], res);
    });
    server_->Post(R"(/audits/([^/]+)/cancel)", [this](const httplib::Request& req, httplib::Response& res) {
        handle_cancel_audit(req.matches[1], res);
    });

    server_->Post("/workflows/validate", [this](const httplib::Request& req, httplib::Response& res) {
        handle_validate_workflow(req, res);
    });
    server_->Post(R"(/workflows/([^/]+)/executions)", [this](const httplib::Request& req, httplib::Response& res) {
        handle_start_execution(req.matches[1], req, res);
    });

    server_->Get(R"(/executions/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handle_get_execution(req.matches[1], res);
    });
    server_->Post(R"(/executions/([^/]+)/cancel)", [this](const httplib::Request& req, httplib::Response& res) {
        handle_cancel_execution(req.matches[1], res);
    });

    server_->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            spdlog::error("{} {} failed: {}", req.method, req.path, e.what());
        }
        reply_error(res, 500, "Internal server error");
    });
}
