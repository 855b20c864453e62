#pragma once

#include "connector.hpp"

// Model-path variant: RESTCONF resources addressed by path, JSON encoded.
class RestconfConnector : public HttpDeviceConnector {
public:
    RestconfConnector(Device device, Credentials credentials, const Config& config,
                      std::shared_ptr<HttpClient> http);

    std::string protocol() const override { return "restconf"; }

    void open_session() override;
    FetchResult fetch(const Selector& selector) override;
    PushResult push(const ConfigEdit& edit) override;
    void close_session() override;

    // "/configure/port[port-id='1/1/1']/admin-state" -> "configure/port=1%2F1%2F1/admin-state"
    static std::string resource_path(const std::string& path);

private:
    std::string data_url(const std::string& path) const;
    HttpRequest json_request(const std::string& method, const std::string& url) const;

    bool open_ = false;
};
