#include "api_server.hpp"
#include "handlers.hpp"
#include "test_fakes.hpp"
#include <gtest/gtest.h>

class ApiServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog_ = std::make_shared<MemoryCatalog>();
        catalog_->add_device(make_device("r1"));
        catalog_->add_rule(make_rule("ssh-v2", {
            make_check("ssh version", "/ssh/version", CheckOperator::Equals, std::string("2"))
        }));
        catalog_->add_workflow("ntp-check",
                               "name: ntp-check\n"
                               "steps:\n"
                               "  - {name: current, type: query, path: /ntp}\n");
        connectors_->connector_for("r1")->set_value("/ssh/version", "2");

        handlers_.add(std::make_unique<QueryHandler>());
        audits_ = std::make_unique<AuditOrchestrator>(config_, catalog_, connectors_, store_, sessions_, backoff_);
        workflows_ = std::make_unique<WorkflowExecutor>(config_, catalog_, connectors_, store_, sessions_, handlers_);
        server_ = std::make_unique<ApiServer>(config_, *audits_, *workflows_, catalog_, [this] { return health_; });
    }

    void TearDown() override {
        workflows_->shutdown();
        audits_->shutdown();
    }

    static httplib::Request request(const std::string& body) {
        httplib::Request req;
        req.body = body;
        return req;
    }

    static nlohmann::json body_of(const httplib::Response& res) {
        return nlohmann::json::parse(res.body);
    }

    Config config_;
    std::shared_ptr<MemoryCatalog> catalog_;
    std::shared_ptr<MemoryResultStore> store_ = std::make_shared<MemoryResultStore>();
    std::shared_ptr<FakeConnectorFactory> connectors_ = std::make_shared<FakeConnectorFactory>();
    SessionRegistry sessions_;
    BackoffManager backoff_{0.001, 0.005};
    HandlerRegistry handlers_;
    std::unique_ptr<AuditOrchestrator> audits_;
    std::unique_ptr<WorkflowExecutor> workflows_;
    std::unique_ptr<ApiServer> server_;
    nlohmann::json health_ = {{"service", "netcomply"}, {"status", "healthy"}};
};

TEST_F(ApiServerTest, SubmitAuditReturnsRunId) {
    httplib::Response res;
    server_->handle_submit_audit(request(R"({"device_ids": ["r1"], "rule_ids": ["ssh-v2"]})"), res);

    EXPECT_EQ(res.status, 202);
    auto run_id = body_of(res)["run_id"].get<std::string>();
    ASSERT_TRUE(audits_->wait(run_id, std::chrono::milliseconds(5000)).has_value());

    httplib::Response got;
    server_->handle_get_audit(run_id, got);
    EXPECT_EQ(got.status, 200);
    auto run = body_of(got);
    EXPECT_EQ(run["state"], "completed");
    EXPECT_EQ(run["passed"], 1);
    EXPECT_EQ(run["findings"].size(), 1u);

    httplib::Response cancel;
    server_->handle_cancel_audit(run_id, cancel);
    EXPECT_EQ(cancel.status, 409);
}

TEST_F(ApiServerTest, BadAuditRequestsAreClientErrors) {
    httplib::Response malformed;
    server_->handle_submit_audit(request("{not json"), malformed);
    EXPECT_EQ(malformed.status, 400);

    httplib::Response empty;
    server_->handle_submit_audit(request(R"({"device_ids": [], "rule_ids": ["ssh-v2"]})"), empty);
    EXPECT_EQ(empty.status, 400);

    httplib::Response unknown;
    server_->handle_submit_audit(request(R"({"device_ids": ["r9"], "rule_ids": ["ssh-v2"]})"), unknown);
    EXPECT_EQ(unknown.status, 400);
    EXPECT_NE(body_of(unknown)["error"].get<std::string>().find("r9"), std::string::npos);

    httplib::Response wrong_type;
    server_->handle_submit_audit(request(R"({"device_ids": "r1", "rule_ids": ["ssh-v2"]})"), wrong_type);
    EXPECT_EQ(wrong_type.status, 400);

    httplib::Response missing;
    server_->handle_get_audit("nope", missing);
    EXPECT_EQ(missing.status, 404);
    httplib::Response missing_cancel;
    server_->handle_cancel_audit("nope", missing_cancel);
    EXPECT_EQ(missing_cancel.status, 404);
}

TEST_F(ApiServerTest, StartExecutionRunsCatalogWorkflow) {
    connectors_->connector_for("r1")->set_value("/ntp", {{"server", "10.1.1.1"}});

    httplib::Response res;
    server_->handle_start_execution("ntp-check", request(R"({"device_id": "r1"})"), res);

    ASSERT_EQ(res.status, 202);
    auto execution_id = body_of(res)["execution_id"].get<std::string>();
    ASSERT_TRUE(workflows_->wait(execution_id, std::chrono::milliseconds(5000)).has_value());

    httplib::Response got;
    server_->handle_get_execution(execution_id, got);
    EXPECT_EQ(got.status, 200);
    auto execution = body_of(got);
    EXPECT_EQ(execution["state"], "completed");
    EXPECT_EQ(execution["steps"]["current"], "completed");
    EXPECT_EQ(execution["logs"][0]["output"]["data"]["server"], "10.1.1.1");
}

TEST_F(ApiServerTest, StartExecutionValidatesInput) {
    httplib::Response no_device;
    server_->handle_start_execution("ntp-check", request("{}"), no_device);
    EXPECT_EQ(no_device.status, 400);

    httplib::Response unknown_workflow;
    server_->handle_start_execution("bgp", request(R"({"device_id": "r1"})"), unknown_workflow);
    EXPECT_EQ(unknown_workflow.status, 404);

    httplib::Response unknown_device;
    server_->handle_start_execution("ntp-check", request(R"({"device_id": "r9"})"), unknown_device);
    EXPECT_EQ(unknown_device.status, 400);

    httplib::Response bad_overrides;
    server_->handle_start_execution("ntp-check", request(R"({"device_id": "r1", "variables": [1]})"), bad_overrides);
    EXPECT_EQ(bad_overrides.status, 400);

    httplib::Response missing;
    server_->handle_get_execution("nope", missing);
    EXPECT_EQ(missing.status, 404);
    httplib::Response missing_cancel;
    server_->handle_cancel_execution("nope", missing_cancel);
    EXPECT_EQ(missing_cancel.status, 404);
}

TEST_F(ApiServerTest, ValidateWorkflowReportsStepsOrError) {
    httplib::Response ok;
    server_->handle_validate_workflow(request(
        "name: audit-and-fix\n"
        "execution_mode: dag\n"
        "steps:\n"
        "  - {name: q, type: query, path: /ntp}\n"
        "  - {name: n, type: notification, message: done, channels: [ops], depends_on: q}\n"), ok);

    EXPECT_EQ(ok.status, 200);
    auto report = body_of(ok);
    EXPECT_EQ(report["valid"], true);
    EXPECT_EQ(report["execution_mode"], "dag");
    ASSERT_EQ(report["steps"].size(), 2u);
    EXPECT_EQ(report["steps"][1]["depends_on"], nlohmann::json::array({"q"}));

    httplib::Response cyclic;
    server_->handle_validate_workflow(request(
        "name: loop\n"
        "execution_mode: dag\n"
        "steps:\n"
        "  - {name: a, type: query, path: /a, depends_on: b}\n"
        "  - {name: b, type: query, path: /b, depends_on: a}\n"), cyclic);

    EXPECT_EQ(cyclic.status, 400);
    EXPECT_EQ(body_of(cyclic)["valid"], false);
}

TEST_F(ApiServerTest, HealthStatusMapsToHttpCode) {
    httplib::Response healthy;
    server_->handle_health(healthy);
    EXPECT_EQ(healthy.status, 200);

    health_["status"] = "degraded";
    httplib::Response degraded;
    server_->handle_health(degraded);
    EXPECT_EQ(degraded.status, 503);
    EXPECT_EQ(body_of(degraded)["service"], "netcomply");
}
