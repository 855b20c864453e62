#pragma once

#include "connector.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "session.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

// Device double keyed by selector path. Pushes are recorded and answered by
// push_handler; fetch failures can be queued per path.
class FakeConnector : public VendorConnector {
public:
    std::string protocol() const override { return "fake"; }

    void open_session() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (open_error) throw PermanentConnectorError("authentication failed");
        ++opens;
    }

    FetchResult fetch(const Selector& selector) override {
        if (fetch_delay.count() > 0) std::this_thread::sleep_for(fetch_delay);

        std::lock_guard<std::mutex> lock(mutex_);
        ++fetches;
        fetched_paths.push_back(selector.path);
        fetch_deadlines[selector.path] = last_deadline;
        auto failure = failures.find(selector.path);
        if (failure != failures.end() && !failure->second.empty()) {
            bool transient = failure->second.front();
            failure->second.pop_front();
            if (transient) throw TransientConnectorError("connection reset");
            throw PermanentConnectorError("malformed path");
        }
        auto it = values.find(selector.path);
        if (it == values.end()) return FetchResult{};
        return it->second;
    }

    PushResult push(const ConfigEdit& edit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        pushes.push_back(edit);
        if (push_handler) return push_handler(edit, pushes.size());
        return PushResult{true, edit.commit, "committed"};
    }

    void close_session() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++closes;
    }

    void set_deadline(Deadline deadline) override {
        std::lock_guard<std::mutex> lock(mutex_);
        last_deadline = deadline;
    }

    void set_value(const std::string& path, const nlohmann::json& value, const std::string& raw = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        values[path] = FetchResult{true, value, raw};
    }

    // Queue failures for the next fetches of path; true means transient
    void fail_next(const std::string& path, std::vector<bool> transient) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (bool t : transient) failures[path].push_back(t);
    }

    std::map<std::string, FetchResult> values;
    std::map<std::string, std::deque<bool>> failures;
    std::vector<ConfigEdit> pushes;
    std::vector<std::string> fetched_paths;
    std::map<std::string, Deadline> fetch_deadlines;   // Deadline in force when each path was last fetched
    std::function<PushResult(const ConfigEdit&, size_t)> push_handler;
    std::chrono::milliseconds fetch_delay{0};
    bool open_error = false;
    Deadline last_deadline;

    int opens = 0;
    int closes = 0;
    int fetches = 0;

private:
    std::mutex mutex_;
};

// Hands out connectors that forward to one shared FakeConnector per device
class FakeConnectorFactory : public ConnectorFactory {
public:
    std::unique_ptr<VendorConnector> create(const Device& device) override {
        ++created;
        return std::make_unique<Forwarder>(connector_for(device.id));
    }

    std::shared_ptr<FakeConnector> connector_for(const std::string& device_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = connectors_[device_id];
        if (!slot) slot = std::make_shared<FakeConnector>();
        return slot;
    }

    std::atomic<int> created{0};

private:
    class Forwarder : public VendorConnector {
    public:
        explicit Forwarder(std::shared_ptr<FakeConnector> target) : target_(std::move(target)) {}
        std::string protocol() const override { return target_->protocol(); }
        void open_session() override { target_->open_session(); }
        FetchResult fetch(const Selector& selector) override { return target_->fetch(selector); }
        PushResult push(const ConfigEdit& edit) override { return target_->push(edit); }
        void close_session() override { target_->close_session(); }
        void set_deadline(Deadline deadline) override { target_->set_deadline(deadline); }

    private:
        std::shared_ptr<FakeConnector> target_;
    };

    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<FakeConnector>> connectors_;
};

// Answers requests from a queue of canned responses and records them
class FakeHttpClient : public HttpClient {
public:
    HttpResponse send(const HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests.push_back(request);
        if (responder) return responder(request);
        if (responses.empty()) {
            HttpResponse missing;
            missing.status_code = 404;
            return missing;
        }
        auto response = responses.front();
        responses.pop_front();
        return response;
    }

    void reply(int status, const std::string& body,
               std::map<std::string, std::string> headers = {}) {
        HttpResponse response;
        response.status_code = status;
        response.body = body;
        response.headers = std::move(headers);
        responses.push_back(response);
    }

    void fail_transport(const std::string& error) {
        HttpResponse response;
        response.error = error;
        responses.push_back(response);
    }

    std::deque<HttpResponse> responses;
    std::vector<HttpRequest> requests;
    std::function<HttpResponse(const HttpRequest&)> responder;

private:
    std::mutex mutex_;
};

inline Device make_device(const std::string& id, const std::string& vendor = "cisco_iosxe") {
    Device device;
    device.id = id;
    device.hostname = id + ".lab";
    device.address = "10.0.0.1";
    device.port = 443;
    device.vendor = vendor;
    device.credential_ref = "lab";
    return device;
}

inline Check make_check(const std::string& name, const std::string& path, CheckOperator op,
                        std::optional<std::string> expected = std::nullopt) {
    Check check;
    check.name = name;
    check.selector.path = path;
    check.op = op;
    check.expected = std::move(expected);
    return check;
}

inline Rule make_rule(const std::string& id, std::vector<Check> checks,
                      std::vector<std::string> vendors = {}) {
    Rule rule;
    rule.id = id;
    rule.name = id;
    rule.severity = "high";
    rule.vendors = std::move(vendors);
    rule.checks = std::move(checks);
    return rule;
}
