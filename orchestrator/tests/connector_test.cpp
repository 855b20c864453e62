#include "errors.hpp"
#include "netconf_connector.hpp"
#include "restconf_connector.hpp"
#include "test_fakes.hpp"
#include <gtest/gtest.h>

namespace {

const char* kHello =
    R"(<hello xmlns="urn:ietf:params:xml:ns:netconf:base:1.0"><session-id>4711</session-id></hello>)";

std::string reply_with(const std::string& inner) {
    return R"(<rpc-reply message-id="1" xmlns="urn:ietf:params:xml:ns:netconf:base:1.0">)" + inner + "</rpc-reply>";
}

const char* kRpcError =
    R"(<rpc-reply xmlns="urn:ietf:params:xml:ns:netconf:base:1.0"><rpc-error>)"
    "<error-type>application</error-type><error-tag>invalid-value</error-tag>"
    "<error-message>unknown element ntpx</error-message></rpc-error></rpc-reply>";

}

class NetconfConnectorTest : public ::testing::Test {
protected:
    NetconfConnectorTest()
        : http_(std::make_shared<FakeHttpClient>()),
          connector_(make_device("r1"), Credentials{"admin", "secret", ""}, config_, http_) {}

    void open() {
        http_->reply(200, kHello);
        connector_.open_session();
    }

    Config config_;
    std::shared_ptr<FakeHttpClient> http_;
    NetconfConnector connector_;
};

TEST_F(NetconfConnectorTest, HelloCarriesSessionIdToLaterRpcs) {
    open();
    http_->reply(200, reply_with("<data/>"));
    connector_.fetch(Selector{"/native/hostname", ""});

    ASSERT_EQ(http_->requests.size(), 2u);
    EXPECT_EQ(http_->requests[0].url, "https://10.0.0.1:443/netconf");
    EXPECT_EQ(http_->requests[0].username, "admin");
    EXPECT_NE(http_->requests[0].body.find("<hello"), std::string::npos);
    EXPECT_EQ(http_->requests[1].headers.at("X-Netconf-Session"), "4711");
    EXPECT_NE(http_->requests[1].body.find(R"(select="/native/hostname")"), std::string::npos);
}

TEST_F(NetconfConnectorTest, GetConfigDataBecomesTree) {
    open();
    http_->reply(200, reply_with("<data><ntp><server>10.1.1.1</server><server>10.1.1.2</server>"
                                 "<source>Loopback0</source></ntp></data>"));

    auto result = connector_.fetch(Selector{"/ntp", ""});

    ASSERT_TRUE(result.found);
    EXPECT_EQ(result.value["server"], nlohmann::json::array({"10.1.1.1", "10.1.1.2"}));
    EXPECT_EQ(result.value["source"], "Loopback0");
    EXPECT_NE(result.raw.find("<source>Loopback0</source>"), std::string::npos);
}

TEST_F(NetconfConnectorTest, EmptyDataIsNotFound) {
    open();
    http_->reply(200, reply_with("<data/>"));
    EXPECT_FALSE(connector_.fetch(Selector{"/ssh/server", ""}).found);
}

TEST_F(NetconfConnectorTest, RpcErrorIsPermanent) {
    open();
    http_->reply(200, kRpcError);
    try {
        connector_.fetch(Selector{"/ntpx", ""});
        FAIL() << "expected PermanentConnectorError";
    } catch (const ConnectorError& e) {
        EXPECT_FALSE(e.transient());
        EXPECT_NE(std::string(e.what()).find("unknown element ntpx"), std::string::npos);
    }
}

TEST_F(NetconfConnectorTest, UnavailableDeviceIsTransient) {
    open();
    http_->reply(503, "");
    EXPECT_THROW(connector_.fetch(Selector{"/ntp", ""}), TransientConnectorError);

    http_->fail_transport("connection refused");
    EXPECT_THROW(connector_.fetch(Selector{"/ntp", ""}), TransientConnectorError);
}

TEST_F(NetconfConnectorTest, RejectedHelloIsPermanent) {
    http_->reply(401, "");
    EXPECT_THROW(connector_.open_session(), PermanentConnectorError);
}

TEST_F(NetconfConnectorTest, ExpiredDeadlineFailsBeforeSending) {
    open();
    connector_.set_deadline(std::chrono::steady_clock::now() - std::chrono::seconds(1));
    EXPECT_THROW(connector_.fetch(Selector{"/ntp", ""}), TransientConnectorError);
    EXPECT_EQ(http_->requests.size(), 1u);
}

TEST_F(NetconfConnectorTest, EditThenCommit) {
    open();
    http_->reply(200, reply_with("<ok/>"));
    http_->reply(200, reply_with("<ok/>"));

    ConfigEdit edit;
    edit.xml_config = "<ntp><server>10.1.1.1</server></ntp>";
    auto result = connector_.push(edit);

    EXPECT_TRUE(result.applied);
    EXPECT_TRUE(result.committed);
    ASSERT_EQ(http_->requests.size(), 3u);
    const auto& body = http_->requests[1].body;
    EXPECT_NE(body.find("<target><candidate/></target>"), std::string::npos);
    EXPECT_NE(body.find("<default-operation>merge</default-operation>"), std::string::npos);
    EXPECT_NE(body.find("<config><ntp><server>10.1.1.1</server></ntp></config>"), std::string::npos);
    EXPECT_NE(http_->requests[2].body.find("<commit/>"), std::string::npos);
}

TEST_F(NetconfConnectorTest, FailedCommitDiscardsCandidate) {
    open();
    http_->reply(200, reply_with("<ok/>"));
    http_->reply(200, kRpcError);
    http_->reply(200, reply_with("<ok/>"));

    ConfigEdit edit;
    edit.xml_config = "<ntp/>";
    auto result = connector_.push(edit);

    EXPECT_TRUE(result.applied);
    EXPECT_FALSE(result.committed);
    EXPECT_NE(result.message.find("commit failed"), std::string::npos);
    ASSERT_EQ(http_->requests.size(), 4u);
    EXPECT_NE(http_->requests[3].body.find("<discard-changes/>"), std::string::npos);
}

TEST_F(NetconfConnectorTest, RunningTargetSkipsCommit) {
    open();
    http_->reply(200, reply_with("<ok/>"));

    ConfigEdit edit;
    edit.xml_config = "<ntp/>";
    edit.target = "running";
    auto result = connector_.push(edit);

    EXPECT_TRUE(result.committed);
    EXPECT_EQ(http_->requests.size(), 2u);
}

TEST_F(NetconfConnectorTest, UnknownTargetOrOperationIsNotSent) {
    open();

    ConfigEdit edit;
    edit.xml_config = "<ntp/>";
    edit.target = "running/></target><x";
    EXPECT_THROW(connector_.push(edit), PermanentConnectorError);

    edit.target = "candidate";
    edit.default_operation = "delete";
    EXPECT_THROW(connector_.push(edit), PermanentConnectorError);
    EXPECT_EQ(http_->requests.size(), 1u);
}

TEST(RestconfPathTest, KeysBecomeEncodedListInstances) {
    EXPECT_EQ(RestconfConnector::resource_path("/configure/port[port-id='1/1/1']/admin-state"),
              "configure/port=1%2F1%2F1/admin-state");
    EXPECT_EQ(RestconfConnector::resource_path("/configure/router[router-name='Base']/bgp/neighbor[ip-address=\"10.0.0.2\"]"),
              "configure/router=Base/bgp/neighbor=10.0.0.2");
    EXPECT_EQ(RestconfConnector::resource_path("/a/b[x='1'][y='2']"), "a/b=1,2");
    EXPECT_EQ(RestconfConnector::resource_path("/"), "");
}

class RestconfConnectorTest : public ::testing::Test {
protected:
    RestconfConnectorTest()
        : http_(std::make_shared<FakeHttpClient>()),
          connector_(make_device("sr1", "nokia_sros"), Credentials{"", "", "tok"}, config_, http_) {}

    Config config_;
    std::shared_ptr<FakeHttpClient> http_;
    RestconfConnector connector_;
};

TEST_F(RestconfConnectorTest, FetchUnwrapsModuleQualifiedNode) {
    http_->reply(200, "{}");
    connector_.open_session();
    http_->reply(200, R"({"nokia-conf:ntp": {"admin-state": "enable", "server": [{"ip-address": "10.1.1.1"}]}})");

    auto result = connector_.fetch(Selector{"/configure/system/time/ntp", ""});

    ASSERT_TRUE(result.found);
    EXPECT_EQ(result.value["admin-state"], "enable");
    ASSERT_EQ(http_->requests.size(), 2u);
    EXPECT_EQ(http_->requests[1].url, "https://10.0.0.1:443/restconf/data/configure/system/time/ntp");
    EXPECT_EQ(http_->requests[1].bearer_token, "tok");
    EXPECT_EQ(http_->requests[1].headers.at("Accept"), "application/yang-data+json");
}

TEST_F(RestconfConnectorTest, MissingResourceIsNotFound) {
    http_->reply(404, "");
    EXPECT_FALSE(connector_.fetch(Selector{"/configure/system/time/sntp", ""}).found);
}

TEST_F(RestconfConnectorTest, UnauthorizedIsPermanent) {
    http_->reply(401, "");
    EXPECT_THROW(connector_.fetch(Selector{"/configure", ""}), PermanentConnectorError);
}

TEST_F(RestconfConnectorTest, PushMapsOperationsAndCommits) {
    http_->reply(204, "");
    http_->reply(204, "");
    http_->reply(204, "");

    ConfigEdit edit;
    edit.operations = {
        {"update", "/configure/system/time/ntp", {{"admin-state", "enable"}}},
        {"delete", "/configure/system/time/sntp", nullptr}
    };
    edit.commit_comment = "ntp baseline";
    auto result = connector_.push(edit);

    EXPECT_TRUE(result.applied);
    EXPECT_TRUE(result.committed);
    ASSERT_EQ(http_->requests.size(), 3u);
    EXPECT_EQ(http_->requests[0].method, "PATCH");
    EXPECT_EQ(nlohmann::json::parse(http_->requests[0].body),
              nlohmann::json({{"ntp", {{"admin-state", "enable"}}}}));
    EXPECT_EQ(http_->requests[1].method, "DELETE");
    EXPECT_TRUE(http_->requests[1].body.empty());
    EXPECT_EQ(http_->requests[2].url, "https://10.0.0.1:443/restconf/operations/ietf-netconf:commit");
    EXPECT_EQ(nlohmann::json::parse(http_->requests[2].body)["input"]["comment"], "ntp baseline");
}

TEST_F(RestconfConnectorTest, RejectedOperationStopsBeforeCommit) {
    http_->reply(400, R"({"ietf-restconf:errors": {"error": [{"error-message": "invalid admin-state"}]}})");

    ConfigEdit edit;
    edit.operations = {{"replace", "/configure/system/time/ntp", {{"admin-state", "up"}}}};
    auto result = connector_.push(edit);

    EXPECT_FALSE(result.applied);
    EXPECT_NE(result.message.find("invalid admin-state"), std::string::npos);
    EXPECT_EQ(http_->requests.size(), 1u);
    EXPECT_EQ(http_->requests[0].method, "PUT");
}
