#include "rule_evaluator.hpp"
#include "test_fakes.hpp"
#include "tree.hpp"
#include <gtest/gtest.h>

class RuleEvaluatorTest : public ::testing::Test {
protected:
    RuleEvaluatorTest() : backoff_(0.001, 0.005), evaluator_(config_, backoff_) {}

    Config config_;
    BackoffManager backoff_;
    RuleEvaluator evaluator_;
    FakeConnector connector_;
    Device device_ = make_device("r1");
};

TEST_F(RuleEvaluatorTest, ContainsMatchesSubstringOfMultilineValue) {
    connector_.set_value("/ssh/server", "ssh server v2\nssh server vrf default");
    auto rule = make_rule("ssh-v2", {make_check("v2", "/ssh/server", CheckOperator::Contains, "v2")});

    auto outcome = evaluator_.evaluate(rule, connector_, device_, std::nullopt);

    ASSERT_EQ(outcome.findings.size(), 1u);
    EXPECT_EQ(outcome.findings[0].status, FindingStatus::Pass);
    EXPECT_TRUE(outcome.passed());
}

TEST_F(RuleEvaluatorTest, MissingPathIsFailureNotError) {
    auto rule = make_rule("ssh-v2", {make_check("v2", "/ssh/server", CheckOperator::Contains, "v2")});

    auto outcome = evaluator_.evaluate(rule, connector_, device_, std::nullopt);

    ASSERT_EQ(outcome.findings.size(), 1u);
    EXPECT_EQ(outcome.findings[0].status, FindingStatus::Fail);
    EXPECT_EQ(outcome.findings[0].message, "path not found: /ssh/server");
    EXPECT_FALSE(outcome.aborted);
}

TEST_F(RuleEvaluatorTest, NotExistsPassesWhenPathIsAbsent) {
    auto rule = make_rule("no-telnet", {make_check("telnet", "/line/vty/telnet", CheckOperator::NotExists)});

    auto outcome = evaluator_.evaluate(rule, connector_, device_, std::nullopt);

    ASSERT_EQ(outcome.findings.size(), 1u);
    EXPECT_EQ(outcome.findings[0].status, FindingStatus::Pass);
}

TEST_F(RuleEvaluatorTest, RulePassIsConjunctionOfChecks) {
    connector_.set_value("/ntp/server", "10.1.1.1");
    connector_.set_value("/logging/host", "10.2.2.2");
    auto rule = make_rule("baseline", {
        make_check("ntp", "/ntp/server", CheckOperator::Equals, "10.1.1.1"),
        make_check("syslog", "/logging/host", CheckOperator::Regex, "^10\\.9\\."),
    });

    auto outcome = evaluator_.evaluate(rule, connector_, device_, std::nullopt);

    ASSERT_EQ(outcome.findings.size(), 2u);
    EXPECT_EQ(outcome.findings[0].status, FindingStatus::Pass);
    EXPECT_EQ(outcome.findings[1].status, FindingStatus::Fail);
    EXPECT_EQ(outcome.findings[1].actual, "10.2.2.2");
    EXPECT_FALSE(outcome.passed());
}

TEST_F(RuleEvaluatorTest, TransientFailureIsRetried) {
    connector_.set_value("/ssh/server", "ssh server v2");
    connector_.fail_next("/ssh/server", {true, true});
    auto rule = make_rule("ssh-v2", {make_check("v2", "/ssh/server", CheckOperator::Contains, "v2")});

    auto outcome = evaluator_.evaluate(rule, connector_, device_, std::nullopt);

    EXPECT_EQ(connector_.fetches, 3);
    ASSERT_EQ(outcome.findings.size(), 1u);
    EXPECT_EQ(outcome.findings[0].status, FindingStatus::Pass);
    EXPECT_EQ(backoff_.failure_count("r1"), 0);
}

TEST_F(RuleEvaluatorTest, ExhaustedRetriesAbortWithErrorFindings) {
    connector_.fail_next("/a", {true, true, true});
    auto rule = make_rule("two", {
        make_check("a", "/a", CheckOperator::Exists),
        make_check("b", "/b", CheckOperator::Exists),
    });

    auto outcome = evaluator_.evaluate(rule, connector_, device_, std::nullopt);

    EXPECT_TRUE(outcome.aborted);
    EXPECT_FALSE(outcome.timed_out);
    ASSERT_EQ(outcome.findings.size(), 2u);
    for (const auto& f : outcome.findings) {
        EXPECT_EQ(f.status, FindingStatus::Error);
        EXPECT_EQ(f.message, "connection reset");
    }
}

TEST_F(RuleEvaluatorTest, PermanentFailureIsNotRetried) {
    connector_.fail_next("/a", {false});
    auto rule = make_rule("one", {make_check("a", "/a", CheckOperator::Exists)});

    auto outcome = evaluator_.evaluate(rule, connector_, device_, std::nullopt);

    EXPECT_EQ(connector_.fetches, 1);
    EXPECT_TRUE(outcome.aborted);
    ASSERT_EQ(outcome.findings.size(), 1u);
    EXPECT_EQ(outcome.findings[0].status, FindingStatus::Error);
}

TEST_F(RuleEvaluatorTest, ExpiredDeadlineRecordsTimeout) {
    auto rule = make_rule("one", {make_check("a", "/a", CheckOperator::Exists)});
    auto deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1);

    auto outcome = evaluator_.evaluate(rule, connector_, device_, deadline);

    EXPECT_TRUE(outcome.timed_out);
    EXPECT_EQ(connector_.fetches, 0);
    ASSERT_EQ(outcome.findings.size(), 1u);
    EXPECT_EQ(outcome.findings[0].message, "device audit timed out");
}

TEST_F(RuleEvaluatorTest, FindingCallbackSeesEveryFinding) {
    connector_.set_value("/a", "x");
    auto rule = make_rule("two", {
        make_check("a", "/a", CheckOperator::Exists),
        make_check("b", "/b", CheckOperator::Exists),
    });
    std::vector<std::string> seen;

    evaluator_.evaluate(rule, connector_, device_, std::nullopt,
                        [&](const Finding& f) { seen.push_back(f.check_name); });

    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b"}));
}

TEST(RuleCompareTest, OperatorsOnStructuredValues) {
    nlohmann::json list = {"alpha", "beta"};
    EXPECT_TRUE(RuleEvaluator::compare(CheckOperator::Exists, list, std::nullopt));
    EXPECT_TRUE(RuleEvaluator::compare(CheckOperator::NotExists, "", std::nullopt));
    EXPECT_TRUE(RuleEvaluator::compare(CheckOperator::NotContains, "ssh v1", std::string("v2")));
    EXPECT_FALSE(RuleEvaluator::compare(CheckOperator::Contains, "SSH V2", std::string("v2")));
    EXPECT_TRUE(RuleEvaluator::compare(CheckOperator::Equals, 22, std::string("22")));
}

TEST_F(RuleEvaluatorTest, Latin1ValueIsComparedAndSerializable) {
    connector_.set_value("/banner", nlohmann::json{{"motd", "caf\xe9 lab"}});
    auto rule = make_rule("banner", {make_check("motd", "/banner", CheckOperator::Contains, "lab")});

    auto outcome = evaluator_.evaluate(rule, connector_, device_, std::nullopt);

    ASSERT_EQ(outcome.findings.size(), 1u);
    EXPECT_EQ(outcome.findings[0].status, FindingStatus::Pass);
    std::string text;
    EXPECT_NO_THROW(text = tree::dump(outcome.findings[0].to_json()));
    EXPECT_NE(text.find("\xEF\xBF\xBD"), std::string::npos);
}

TEST_F(RuleEvaluatorTest, LongActualIsCutOnCodePointBoundary) {
    connector_.set_value("/description", std::string(4095, 'a') + "\xC3\xA9.");
    auto rule = make_rule("desc", {make_check("desc", "/description", CheckOperator::Equals, "x")});

    auto outcome = evaluator_.evaluate(rule, connector_, device_, std::nullopt);

    ASSERT_EQ(outcome.findings.size(), 1u);
    EXPECT_EQ(outcome.findings[0].status, FindingStatus::Fail);
    EXPECT_EQ(outcome.findings[0].actual, std::string(4095, 'a') + "...");
    EXPECT_NO_THROW(outcome.findings[0].to_json().dump());
}

TEST_F(RuleEvaluatorTest, CountOperatorComparesEntriesAtPath) {
    connector_.set_value("/ntp/server", nlohmann::json::array({"10.1.1.1", "10.1.1.2"}));
    auto rule = make_rule("ntp", {
        make_check("two servers", "/ntp/server", CheckOperator::Count, "2"),
        make_check("three servers", "/ntp/server", CheckOperator::Count, "3"),
        make_check("no tacacs needed", "/tacacs/server", CheckOperator::Count, "0"),
    });

    auto outcome = evaluator_.evaluate(rule, connector_, device_, std::nullopt);

    ASSERT_EQ(outcome.findings.size(), 3u);
    EXPECT_EQ(outcome.findings[0].status, FindingStatus::Pass);
    EXPECT_EQ(outcome.findings[1].status, FindingStatus::Fail);
    EXPECT_EQ(outcome.findings[1].message, "found 2 entries, expected at least 3");
    EXPECT_EQ(outcome.findings[2].status, FindingStatus::Pass);
}

TEST(RuleCompareTest, RegexIgnoresCaseAndScalesToLargeConfigs) {
    std::string config;
    for (int i = 0; i < 25000; ++i) {
        config += "interface Gi0/" + std::to_string(i) + "\n";
    }
    config += "ntp server 10.1.1.1\n";

    EXPECT_TRUE(RuleEvaluator::compare(CheckOperator::Regex, config, std::string("(.|\\n)*ntp server")));
    EXPECT_TRUE(RuleEvaluator::compare(CheckOperator::Regex, "NTP Server 10.1.1.1", std::string("ntp server")));
    EXPECT_FALSE(RuleEvaluator::compare(CheckOperator::Regex, config, std::string("^logging host")));
    EXPECT_THROW(RuleEvaluator::compare(CheckOperator::Regex, "x", std::string("(")), DefinitionError);
}

TEST(RuleCompareTest, CountOperatorOnShapes) {
    EXPECT_TRUE(RuleEvaluator::compare(CheckOperator::Count, nlohmann::json::array({1, 2, 3}), std::string("3")));
    EXPECT_FALSE(RuleEvaluator::compare(CheckOperator::Count, nlohmann::json::array({1}), std::string("2")));
    EXPECT_TRUE(RuleEvaluator::compare(CheckOperator::Count, nlohmann::json{{"name", "eth0"}}, std::string("1")));
    EXPECT_TRUE(RuleEvaluator::compare(CheckOperator::Count, nullptr, std::string("0")));
    EXPECT_FALSE(RuleEvaluator::compare(CheckOperator::Count, "x", std::string("many")));
}

TEST(RuleDefinitionTest, RegexIsCompiledOnceAndCountValidated) {
    auto rule = Rule::from_json(R"({
        "id": "r", "name": "r",
        "checks": [
            {"path": "/logging/host", "operator": "regex", "expected": "^10\\."},
            {"path": "/ntp/server", "operator": "count", "expected": 2}
        ]
    })"_json);

    ASSERT_EQ(rule.checks.size(), 2u);
    ASSERT_NE(rule.checks[0].pattern, nullptr);
    EXPECT_TRUE(rule.checks[0].pattern->search("10.2.2.2"));
    EXPECT_EQ(rule.checks[1].op, CheckOperator::Count);

    EXPECT_THROW(Rule::from_json(R"({"id": "r", "name": "r",
        "checks": [{"path": "/a", "operator": "count", "expected": "-1"}]})"_json), DefinitionError);
    EXPECT_THROW(Rule::from_json(R"({"id": "r", "name": "r",
        "checks": [{"path": "/a", "operator": "regex", "expected": "(a)\\1"}]})"_json), DefinitionError);
}
