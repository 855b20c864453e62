#include "audit_orchestrator.hpp"
#include "errors.hpp"
#include "test_fakes.hpp"
#include "tree.hpp"
#include <gtest/gtest.h>

class AuditOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.audit_concurrency = 2;
        config_.fetch_retry_count = 1;
        catalog_ = std::make_shared<MemoryCatalog>();
        store_ = std::make_shared<MemoryResultStore>();
        connectors_ = std::make_shared<FakeConnectorFactory>();

        catalog_->add_device(make_device("r1"));
        catalog_->add_device(make_device("r2"));
        catalog_->add_device(make_device("sr1", "nokia_sros"));

        catalog_->add_rule(make_rule("ssh-v2", {
            make_check("ssh version", "/ssh/version", CheckOperator::Equals, std::string("2")),
            make_check("telnet off", "/line/vty/telnet", CheckOperator::NotExists)
        }));
        catalog_->add_rule(make_rule("ios-ntp", {
            make_check("ntp server", "/ntp/server", CheckOperator::Exists)
        }, {"cisco_iosxe"}));

        for (const auto& id : {"r1", "r2", "sr1"}) {
            connectors_->connector_for(id)->set_value("/ssh/version", "2");
            connectors_->connector_for(id)->set_value("/ntp/server", "10.1.1.1");
        }
    }

    void TearDown() override {
        if (orchestrator_) orchestrator_->shutdown();
    }

    AuditOrchestrator& orchestrator() {
        if (!orchestrator_) {
            orchestrator_ = std::make_unique<AuditOrchestrator>(config_, catalog_, connectors_, store_,
                                                                sessions_, backoff_);
        }
        return *orchestrator_;
    }

    Config config_;
    std::shared_ptr<MemoryCatalog> catalog_;
    std::shared_ptr<MemoryResultStore> store_;
    std::shared_ptr<FakeConnectorFactory> connectors_;
    SessionRegistry sessions_;
    BackoffManager backoff_{0.001, 0.005};
    std::unique_ptr<AuditOrchestrator> orchestrator_;
};

TEST_F(AuditOrchestratorTest, RejectsEmptyAndUnknownSelections) {
    EXPECT_THROW(orchestrator().submit({}, {"ssh-v2"}), DefinitionError);
    EXPECT_THROW(orchestrator().submit({"r1"}, {}), DefinitionError);
    EXPECT_THROW(orchestrator().submit({"r9"}, {"ssh-v2"}), DefinitionError);
    EXPECT_THROW(orchestrator().submit({"r1"}, {"no-such-rule"}), DefinitionError);
    EXPECT_EQ(orchestrator().active_runs(), 0u);
    EXPECT_EQ(connectors_->created.load(), 0);
}

TEST_F(AuditOrchestratorTest, ScoresEveryCheckOnEveryDevice) {
    auto run = orchestrator().run_audit({"r1", "r2"}, {"ssh-v2"});

    EXPECT_EQ(run.state, AuditRunState::Completed);
    EXPECT_EQ(run.total_checks(), 4);
    EXPECT_EQ(run.passed_checks(), 4);
    ASSERT_TRUE(run.score().has_value());
    EXPECT_DOUBLE_EQ(*run.score(), 100.0);
    EXPECT_EQ(run.device_states.at("r1"), DeviceAuditState::Completed);
    EXPECT_EQ(run.device_states.at("r2"), DeviceAuditState::Completed);
}

TEST_F(AuditOrchestratorTest, FailingCheckLowersScore) {
    connectors_->connector_for("r2")->set_value("/ssh/version", "1.99");

    auto run = orchestrator().run_audit({"r1", "r2"}, {"ssh-v2"});

    EXPECT_EQ(run.passed_checks(), 3);
    EXPECT_DOUBLE_EQ(*run.score(), 75.0);
    int failed = 0;
    for (const auto& f : run.findings) {
        if (f.status == FindingStatus::Fail) {
            ++failed;
            EXPECT_EQ(f.device_id, "r2");
            EXPECT_EQ(f.check_name, "ssh version");
        }
    }
    EXPECT_EQ(failed, 1);
}

TEST_F(AuditOrchestratorTest, VendorScopedRulesOnlyRunOnMatchingDevices) {
    auto run = orchestrator().run_audit({"r1", "sr1"}, {"ssh-v2", "ios-ntp"});

    EXPECT_EQ(run.total_checks(), 5);
    for (const auto& f : run.findings) {
        if (f.rule_id == "ios-ntp") {
            EXPECT_EQ(f.device_id, "r1");
        }
    }
}

TEST_F(AuditOrchestratorTest, UnreachableDeviceYieldsErrorFindings) {
    connectors_->connector_for("r2")->fail_next("/ssh/version", {false});

    auto run = orchestrator().run_audit({"r1", "r2"}, {"ssh-v2", "ios-ntp"});

    EXPECT_EQ(run.state, AuditRunState::Completed);
    EXPECT_EQ(run.device_states.at("r1"), DeviceAuditState::Completed);
    EXPECT_EQ(run.device_states.at("r2"), DeviceAuditState::Error);
    EXPECT_EQ(run.total_checks(), 6);

    int errors = 0;
    for (const auto& f : run.findings) {
        if (f.device_id == "r2") {
            EXPECT_EQ(f.status, FindingStatus::Error);
            ++errors;
        }
    }
    EXPECT_EQ(errors, 3);
}

TEST_F(AuditOrchestratorTest, DeviceDeadlineMarksTimedOut) {
    config_.device_timeout_seconds = 1;
    connectors_->connector_for("r1")->fetch_delay = std::chrono::milliseconds(700);

    auto run = orchestrator().run_audit({"r1"}, {"ssh-v2", "ios-ntp"});

    EXPECT_EQ(run.device_states.at("r1"), DeviceAuditState::TimedOut);
    EXPECT_EQ(run.total_checks(), 3);
    EXPECT_NE(run.findings.back().message.find("timed out"), std::string::npos);
    EXPECT_EQ(run.findings.back().status, FindingStatus::Error);
}

TEST_F(AuditOrchestratorTest, ConcurrencyIsBoundedByPoolSize) {
    for (int i = 0; i < 6; ++i) {
        auto id = "edge" + std::to_string(i);
        catalog_->add_device(make_device(id));
        auto device = connectors_->connector_for(id);
        device->set_value("/ssh/version", "2");
        device->fetch_delay = std::chrono::milliseconds(40);
    }

    auto run = orchestrator().run_audit({"edge0", "edge1", "edge2", "edge3", "edge4", "edge5"}, {"ssh-v2"});

    EXPECT_EQ(run.total_checks(), 12);
    EXPECT_LE(sessions_.peak_count(), 2u);
    EXPECT_GE(sessions_.peak_count(), 1u);
    EXPECT_EQ(sessions_.open_count(), 0u);
}

TEST_F(AuditOrchestratorTest, CancelStopsPendingDevices) {
    config_.audit_concurrency = 1;
    for (const auto& id : {"r1", "r2", "sr1"}) {
        connectors_->connector_for(id)->fetch_delay = std::chrono::milliseconds(150);
    }

    auto id = orchestrator().submit({"r1", "r2", "sr1"}, {"ssh-v2"});
    EXPECT_TRUE(orchestrator().cancel(id));
    auto run = orchestrator().wait(id, std::chrono::milliseconds(5000));

    ASSERT_TRUE(run.has_value());
    EXPECT_EQ(run->state, AuditRunState::Cancelled);
    EXPECT_EQ(run->device_states.at("sr1"), DeviceAuditState::Cancelled);
    EXPECT_FALSE(orchestrator().cancel(id));
}

TEST_F(AuditOrchestratorTest, RunIsRecordedInStore) {
    auto run = orchestrator().run_audit({"r1"}, {"ssh-v2"});

    auto record = store_->run(run.id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->kind, "audit");
    EXPECT_EQ(record->state, "completed");
    EXPECT_EQ(record->records.size(), 2u);
    EXPECT_EQ(record->records[0].first, "finding");
    EXPECT_EQ(record->summary["total"], 2);
    EXPECT_FALSE(record->summary.contains("findings"));

    auto fetched = orchestrator().get(run.id);
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->id, run.id);
    EXPECT_FALSE(orchestrator().get("missing").has_value());
}

TEST_F(AuditOrchestratorTest, RejectsRulesScopedAwayFromEveryDevice) {
    EXPECT_THROW(orchestrator().submit({"sr1"}, {"ios-ntp"}), DefinitionError);
    EXPECT_EQ(orchestrator().run_count(), 0u);
    EXPECT_EQ(connectors_->created.load(), 0);
}

TEST_F(AuditOrchestratorTest, NonUtf8DeviceDataStillCompletesRun) {
    catalog_->add_rule(make_rule("banner", {
        make_check("motd", "/banner", CheckOperator::Contains, std::string("authorized")),
        make_check("ssh version", "/ssh/version", CheckOperator::Equals, std::string("2"))
    }));
    connectors_->connector_for("r1")->set_value("/banner", nlohmann::json{{"motd", "caf\xe9 authorized only"}});

    auto id = orchestrator().submit({"r1"}, {"banner"});
    auto run = orchestrator().wait(id, std::chrono::milliseconds(5000));

    ASSERT_TRUE(run.has_value());
    EXPECT_EQ(run->state, AuditRunState::Completed);
    EXPECT_EQ(run->device_states.at("r1"), DeviceAuditState::Completed);
    EXPECT_EQ(run->passed_checks(), 2);
    EXPECT_NO_THROW(tree::dump(run->to_json()));
    EXPECT_EQ(store_->run(id)->records.size(), 2u);
}

TEST_F(AuditOrchestratorTest, FinishedRunsBeyondRetentionAreDropped) {
    config_.max_retained_runs = 2;

    auto first = orchestrator().run_audit({"r1"}, {"ssh-v2"});
    orchestrator().run_audit({"r1"}, {"ssh-v2"});
    auto last = orchestrator().run_audit({"r1"}, {"ssh-v2"});

    EXPECT_EQ(orchestrator().run_count(), 2u);
    EXPECT_FALSE(orchestrator().get(first.id).has_value());
    EXPECT_TRUE(orchestrator().get(last.id).has_value());
}

TEST(MemoryResultStoreTest, KeepsOnlyNewestCompletedRuns) {
    MemoryResultStore store(2);
    for (const auto& id : {"a", "b", "c"}) {
        store.create_run(id, "audit", nlohmann::json::object());
        store.complete_run(id, "completed", nlohmann::json::object());
    }
    store.create_run("running", "audit", nlohmann::json::object());

    EXPECT_EQ(store.size(), 3u);
    EXPECT_FALSE(store.run("a").has_value());
    EXPECT_TRUE(store.run("c").has_value());
    EXPECT_TRUE(store.run("running").has_value());
}
