#pragma once

#include "config.hpp"
#include "http_client.hpp"
#include "types.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct FetchResult {
    bool found = false;
    nlohmann::json value;   // Normalized tree at the selector
    std::string raw;        // Payload as received from the device
};

struct EditOperation {
    std::string op;         // update | replace | delete
    std::string path;
    nlohmann::json value;
};

struct ConfigEdit {
    std::string xml_config;                  // XML variant payload
    std::vector<EditOperation> operations;   // Model-path variant payload
    std::string target = "candidate";
    std::string default_operation = "merge";
    bool commit = true;
    std::string commit_comment;
};

struct PushResult {
    bool applied = false;
    bool committed = false;
    std::string message;
};

using Deadline = std::optional<std::chrono::steady_clock::time_point>;

// Values an XML edit may carry into <target> and <default-operation>
bool is_edit_target(const std::string& target);          // candidate | running
bool is_default_operation(const std::string& operation); // merge | replace | none

// Uniform capability set over the device management protocols. Transport
// failures raise ConnectorError; "not found" is reported in FetchResult.
class VendorConnector {
public:
    virtual ~VendorConnector() = default;

    virtual std::string protocol() const = 0;

    virtual void open_session() = 0;
    virtual FetchResult fetch(const Selector& selector) = 0;
    virtual PushResult push(const ConfigEdit& edit) = 0;
    virtual void close_session() = 0;

    // Transport calls made after this are clamped to the deadline
    virtual void set_deadline(Deadline deadline) = 0;

    // Deadline and call as one operation, for sessions shared by concurrent steps
    virtual FetchResult fetch_within(const Selector& selector, Deadline deadline) {
        set_deadline(deadline);
        return fetch(selector);
    }
    virtual PushResult push_within(const ConfigEdit& edit, Deadline deadline) {
        set_deadline(deadline);
        return push(edit);
    }
};

// Shared plumbing for connectors that reach the device over HTTP
class HttpDeviceConnector : public VendorConnector {
public:
    HttpDeviceConnector(Device device, Credentials credentials, const Config& config,
                        std::shared_ptr<HttpClient> http);

    void set_deadline(Deadline deadline) override { deadline_ = deadline; }

protected:
    // scheme://host:port
    std::string base_url() const;

    // Request carrying credentials, TLS policy and the clamped timeout.
    // Throws TransientConnectorError when the deadline already passed.
    HttpRequest make_request(const std::string& method, const std::string& url) const;

    HttpResponse send(const HttpRequest& request, const std::string& what);

    // Raises for transport failures, 408/429/5xx (transient) and 401/403
    // (permanent). Leaves every other status to the caller.
    void raise_for_transport(const HttpResponse& response, const std::string& what) const;

    Device device_;
    Credentials credentials_;
    const Config& config_;
    std::shared_ptr<HttpClient> http_;
    Deadline deadline_;
};
