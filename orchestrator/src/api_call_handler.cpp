#include "handlers.hpp"
#include "errors.hpp"
#include "expression.hpp"
#include "util.hpp"
#include "tree.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

std::map<std::string, std::string> string_map(const nlohmann::json& value) {
    std::map<std::string, std::string> result;
    if (!value.is_object()) return result;
    for (auto it = value.begin(); it != value.end(); ++it) {
        result[it.key()] = it.value().is_string() ? it.value().get<std::string>() : tree::dump(it.value());
    }
    return result;
}

bool retryable_status(int status) {
    return status == 408 || status == 429 || (status >= 500 && status < 600);
}

}

ApiCallHandler::ApiCallHandler(std::shared_ptr<HttpClient> http) : http_(std::move(http)) {}

StepOutcome ApiCallHandler::execute(const StepContext& context) {
    const auto& spec = payload_of<ApiCallSpec>(context.step);
    const auto& scope = context.scope;

    HttpRequest request;
    request.method = util::to_upper(spec.method);
    request.url = Template::parse(spec.url).render(scope);
    request.headers = string_map(render_value(spec.headers, scope));
    request.params = string_map(render_value(spec.params, scope));

    auto body = render_value(spec.body, scope);
    if (body.is_string()) {
        request.body = body.get<std::string>();
    } else if (!body.is_null()) {
        request.body = tree::dump(body);
        if (!request.headers.count("Content-Type")) {
            request.headers["Content-Type"] = "application/json";
        }
    }

    auto auth = render_value(spec.auth, scope);
    if (auth.is_object()) {
        auto type = auth.value("type", std::string());
        if (type == "basic") {
            request.username = auth.value("username", std::string());
            request.password = auth.value("password", std::string());
        } else if (type == "bearer") {
            request.bearer_token = auth.value("token", std::string());
        }
    }

    if (context.deadline) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            *context.deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            throw StepFailure("api call deadline exceeded before request", true);
        }
        request.timeout = std::min(request.timeout, remaining);
    }

    spdlog::debug("[{}] api_call {} {}", context.execution_id, request.method, request.url);
    auto response = http_->send(request);

    if (response.transport_failed()) {
        return StepOutcome::failure(
            fmt::format("{} {} failed: {}", request.method, request.url, response.error), true);
    }

    auto data = nlohmann::json::parse(response.body, nullptr, false);
    if (data.is_discarded()) data = response.body;

    nlohmann::json output = {
        {"status_code", response.status_code},
        {"success", response.ok()},
        {"data", data},
        {"headers", response.headers}
    };

    if (retryable_status(response.status_code)) {
        return StepOutcome::failure(
            fmt::format("{} {} returned {}", request.method, request.url, response.status_code), true, output);
    }
    return StepOutcome::success(std::move(output), fmt::format("HTTP {}", response.status_code));
}
