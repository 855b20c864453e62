#pragma once

#include "connector.hpp"
#include <pugixml.hpp>

// NETCONF 1.0 RPCs posted to the device's HTTP RPC endpoint.
class NetconfConnector : public HttpDeviceConnector {
public:
    NetconfConnector(Device device, Credentials credentials, const Config& config,
                     std::shared_ptr<HttpClient> http);

    std::string protocol() const override { return "netconf"; }

    void open_session() override;
    FetchResult fetch(const Selector& selector) override;
    PushResult push(const ConfigEdit& edit) override;
    void close_session() override;

private:
    struct Reply {
        int status_code = 0;
        pugi::xml_document doc;
        std::string error; // rpc-error text, empty when the reply was <ok/> or data
    };

    std::string rpc_url() const;
    std::string frame(const std::string& operation);

    // Sends one RPC. Raises for transport failures and unparsable replies.
    void rpc(const std::string& operation, const std::string& what, Reply& reply);

    std::string session_id_;
    int message_id_ = 0;
    bool open_ = false;
};
