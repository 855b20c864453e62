#include "connector.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

bool is_edit_target(const std::string& target) {
    return target == "candidate" || target == "running";
}

bool is_default_operation(const std::string& operation) {
    return operation == "merge" || operation == "replace" || operation == "none";
}

HttpDeviceConnector::HttpDeviceConnector(Device device, Credentials credentials, const Config& config,
                                         std::shared_ptr<HttpClient> http)
    : device_(std::move(device)),
      credentials_(std::move(credentials)),
      config_(config),
      http_(std::move(http)) {}

std::string HttpDeviceConnector::base_url() const {
    return fmt::format("{}://{}:{}", config_.device_scheme, device_.host(), device_.port);
}

HttpRequest HttpDeviceConnector::make_request(const std::string& method, const std::string& url) const {
    HttpRequest request;
    request.method = method;
    request.url = url;
    request.verify_tls = config_.verify_tls;
    if (!credentials_.token.empty()) {
        request.bearer_token = credentials_.token;
    } else if (!credentials_.username.empty()) {
        request.username = credentials_.username;
        request.password = credentials_.password;
    }

    auto timeout = std::chrono::milliseconds(config_.request_timeout_ms);
    if (deadline_) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            *deadline_ - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            throw TransientConnectorError(fmt::format("deadline exceeded before contacting {}", device_.id));
        }
        timeout = std::min(timeout, remaining);
    }
    request.timeout = timeout;
    return request;
}

HttpResponse HttpDeviceConnector::send(const HttpRequest& request, const std::string& what) {
    auto start = std::chrono::steady_clock::now();
    auto response = http_->send(request);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    spdlog::debug("[{}] {} {} -> {} ({}ms)", device_.id, protocol(), what,
                  response.transport_failed() ? response.error : std::to_string(response.status_code),
                  elapsed);
    return response;
}

void HttpDeviceConnector::raise_for_transport(const HttpResponse& response, const std::string& what) const {
    if (response.transport_failed()) {
        throw TransientConnectorError(fmt::format("{} on {} failed: {}", what, device_.id,
                                                  response.error.empty() ? "no response" : response.error));
    }
    int status = response.status_code;
    if (status == 401 || status == 403) {
        throw PermanentConnectorError(fmt::format("{} on {} rejected: authentication failed (HTTP {})",
                                                  what, device_.id, status));
    }
    if (util::is_network_error(status) || (status >= 500 && status < 600)) {
        throw TransientConnectorError(fmt::format("{} on {} failed: HTTP {}", what, device_.id, status));
    }
}
