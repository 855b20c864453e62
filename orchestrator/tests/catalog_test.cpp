#include "catalog.hpp"
#include "errors.hpp"
#include "test_fakes.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

TEST(MemoryCatalogTest, FindsWhatWasAdded) {
    MemoryCatalog catalog;
    catalog.add_device(make_device("r1"));
    catalog.add_rule(make_rule("ssh-v2", {make_check("ssh", "/ssh/version", CheckOperator::Exists)}));
    catalog.add_workflow("ntp", "name: ntp\nsteps:\n  - {name: q, type: query, path: /ntp}\n");

    ASSERT_TRUE(catalog.find_device("r1").has_value());
    EXPECT_EQ(catalog.find_device("r1")->vendor, "cisco_iosxe");
    EXPECT_FALSE(catalog.find_device("r2").has_value());
    EXPECT_EQ(catalog.find_rule("ssh-v2")->checks.size(), 1u);

    auto wf = catalog.find_workflow("ntp");
    ASSERT_TRUE(wf.has_value());
    EXPECT_EQ(wf->id, "ntp");
    EXPECT_EQ(wf->steps.size(), 1u);
    EXPECT_FALSE(catalog.find_workflow("bgp").has_value());
}

TEST(MemoryCatalogTest, InvalidStoredWorkflowThrowsOnLookup) {
    MemoryCatalog catalog;
    catalog.add_workflow("broken", "name: broken\nsteps:\n  - {name: q, type: teleport}\n");
    EXPECT_THROW(catalog.find_workflow("broken"), DefinitionError);
}

class FileCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("netcomply-catalog-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".yaml");
    }

    void TearDown() override {
        std::filesystem::remove(path_);
    }

    void write(const std::string& text) {
        std::ofstream out(path_);
        out << text;
    }

    std::filesystem::path path_;
};

TEST_F(FileCatalogTest, LoadsDevicesRulesAndWorkflows) {
    write(R"(devices:
  - id: core-1
    hostname: core-1.dc1
    ip_address: 192.0.2.10
    port: 830
    vendor: Cisco_IOSXE
    credential_ref: core-routers
  - id: edge-1
    address: 192.0.2.20
    port: 443
    vendor: nokia_sros
  - hostname: no-id
rules:
  - id: ssh-v2
    name: SSH version 2
    severity: High
    vendors: [cisco_iosxe]
    checks:
      - name: version
        xpath: /ip/ssh/version
        comparison: exact
        reference_value: 2
  - id: broken
    name: Broken
    checks:
      - {name: needs-expected, path: /a, operator: equals}
workflows:
  ntp-baseline:
    name: NTP baseline
    steps:
      - {name: current, type: query, path: /ntp}
)");

    FileCatalog catalog(path_.string());
    ASSERT_TRUE(catalog.load());

    EXPECT_EQ(catalog.device_count(), 2u);
    auto core = catalog.find_device("core-1");
    ASSERT_TRUE(core.has_value());
    EXPECT_EQ(core->address, "192.0.2.10");
    EXPECT_EQ(core->vendor, "cisco_iosxe");
    EXPECT_EQ(core->credential_ref, "core-routers");

    EXPECT_EQ(catalog.rule_count(), 1u);
    auto rule = catalog.find_rule("ssh-v2");
    ASSERT_TRUE(rule.has_value());
    EXPECT_EQ(rule->severity, "high");
    ASSERT_EQ(rule->checks.size(), 1u);
    EXPECT_EQ(rule->checks[0].selector.path, "/ip/ssh/version");
    EXPECT_EQ(rule->checks[0].op, CheckOperator::Equals);
    EXPECT_EQ(rule->checks[0].expected, std::optional<std::string>("2"));

    auto wf = catalog.find_workflow("ntp-baseline");
    ASSERT_TRUE(wf.has_value());
    EXPECT_EQ(wf->name, "NTP baseline");
}

TEST_F(FileCatalogTest, UnreadableFileFailsToLoad) {
    FileCatalog catalog((path_.parent_path() / "netcomply-missing-catalog.yaml").string());
    EXPECT_FALSE(catalog.load());
    EXPECT_EQ(catalog.device_count(), 0u);
}

TEST(EnvCredentialResolverTest, PrefixIsUppercasedReference) {
    EXPECT_EQ(EnvCredentialResolver::variable_prefix("core-routers"), "CRED_CORE_ROUTERS");
    EXPECT_EQ(EnvCredentialResolver::variable_prefix("lab.v2"), "CRED_LAB_V2");
}

TEST(EnvCredentialResolverTest, ResolvesFromEnvironment) {
    ::setenv("CRED_CORE_ROUTERS_USERNAME", "netops", 1);
    ::setenv("CRED_CORE_ROUTERS_PASSWORD", "pw", 1);

    auto device = make_device("core-1");
    device.credential_ref = "core-routers";
    EnvCredentialResolver resolver;
    auto credentials = resolver.resolve(device);

    EXPECT_EQ(credentials.username, "netops");
    EXPECT_EQ(credentials.password, "pw");
    EXPECT_TRUE(credentials.token.empty());

    ::unsetenv("CRED_CORE_ROUTERS_USERNAME");
    ::unsetenv("CRED_CORE_ROUTERS_PASSWORD");
}

TEST(EnvCredentialResolverTest, MissingCredentialsArePermanent) {
    auto device = make_device("r1");
    device.credential_ref = "nobody-configured-this";
    EnvCredentialResolver resolver;
    EXPECT_THROW(resolver.resolve(device), PermanentConnectorError);
}
