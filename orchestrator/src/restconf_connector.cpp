#include "restconf_connector.hpp"
#include "errors.hpp"
#include "tree.hpp"
#include "util.hpp"
#include "xml_tree.hpp"
#include <cctype>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

const char* kCommitOperation = "ietf-netconf:commit";

std::string percent_encode(const std::string& value) {
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == ':') {
            out += static_cast<char>(c);
        } else {
            out += fmt::format("%{:02X}", c);
        }
    }
    return out;
}

// Key values out of "[a='x'][b='y']"
std::vector<std::string> predicate_values(const std::string& predicates) {
    std::vector<std::string> values;
    size_t pos = 0;
    while ((pos = predicates.find('=', pos)) != std::string::npos) {
        ++pos;
        while (pos < predicates.size() && std::isspace(static_cast<unsigned char>(predicates[pos]))) ++pos;
        if (pos >= predicates.size()) break;
        char quote = predicates[pos];
        std::string value;
        if (quote == '\'' || quote == '"') {
            auto end = predicates.find(quote, pos + 1);
            if (end == std::string::npos) break;
            value = predicates.substr(pos + 1, end - pos - 1);
            pos = end + 1;
        } else {
            auto end = predicates.find(']', pos);
            value = util::trim(predicates.substr(pos, end - pos));
            pos = end;
        }
        values.push_back(value);
    }
    return values;
}

bool is_success(int status) {
    return status >= 200 && status < 300;
}

std::string error_detail(const HttpResponse& response) {
    try {
        auto body = nlohmann::json::parse(response.body);
        const auto* message = tree::lookup(body, "ietf-restconf:errors.error[0].error-message");
        if (message && message->is_string()) return message->get<std::string>();
    } catch (const nlohmann::json::exception&) {
    }
    return fmt::format("HTTP {}", response.status_code);
}

} // namespace

RestconfConnector::RestconfConnector(Device device, Credentials credentials, const Config& config,
                                     std::shared_ptr<HttpClient> http)
    : HttpDeviceConnector(std::move(device), std::move(credentials), config, std::move(http)) {}

std::string RestconfConnector::resource_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;
    int depth = 0;
    char quote = 0;
    for (char c : path) {
        if (quote) {
            if (c == quote) quote = 0;
            current += c;
            continue;
        }
        if (depth > 0 && (c == '\'' || c == '"')) {
            quote = c;
        } else if (c == '[') {
            ++depth;
        } else if (c == ']') {
            --depth;
        } else if (c == '/' && depth == 0) {
            if (!current.empty()) segments.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    if (!current.empty()) segments.push_back(current);

    std::vector<std::string> encoded;
    for (const auto& segment : segments) {
        auto bracket = segment.find('[');
        if (bracket == std::string::npos) {
            encoded.push_back(segment);
            continue;
        }
        std::vector<std::string> keys;
        for (const auto& v : predicate_values(segment.substr(bracket))) {
            keys.push_back(percent_encode(v));
        }
        encoded.push_back(segment.substr(0, bracket) + "=" + util::join(keys, ","));
    }
    return util::join(encoded, "/");
}

std::string RestconfConnector::data_url(const std::string& path) const {
    auto resource = resource_path(path);
    auto url = base_url() + config_.restconf_root + "/data";
    return resource.empty() ? url : url + "/" + resource;
}

HttpRequest RestconfConnector::json_request(const std::string& method, const std::string& url) const {
    auto request = make_request(method, url);
    request.headers["Accept"] = "application/yang-data+json";
    if (method != "GET" && method != "DELETE") {
        request.headers["Content-Type"] = "application/yang-data+json";
    }
    return request;
}

void RestconfConnector::open_session() {
    if (open_) return;

    auto request = json_request("GET", base_url() + config_.restconf_root);
    auto response = send(request, "discover");
    raise_for_transport(response, "discover");
    if (!is_success(response.status_code) && response.status_code != 404) {
        throw PermanentConnectorError(fmt::format("RESTCONF root on {} rejected: {}",
                                                  device_.id, error_detail(response)));
    }
    open_ = true;
    spdlog::info("[{}] RESTCONF session open", device_.id);
}

FetchResult RestconfConnector::fetch(const Selector& selector) {
    auto response = send(json_request("GET", data_url(selector.path)), "get " + selector.describe());
    raise_for_transport(response, "get");

    FetchResult result;
    if (response.status_code == 404 || response.status_code == 204) {
        return result;
    }
    if (!is_success(response.status_code)) {
        throw PermanentConnectorError(fmt::format("get {} on {} failed: {}",
                                                  selector.describe(), device_.id, error_detail(response)));
    }
    if (util::trim(response.body).empty()) {
        return result;
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::exception& e) {
        throw PermanentConnectorError(fmt::format("get {} on {}: malformed JSON: {}",
                                                  selector.describe(), device_.id, e.what()));
    }
    result.raw = response.body;

    // Replies wrap the target node: {"module:leaf": value}
    auto value = body;
    if (!selector.path.empty() && body.is_object() && body.size() == 1) {
        value = body.begin().value();
        // List entries come back as one-element arrays
        if (value.is_array() && value.size() == 1 && selector.path.find('[') != std::string::npos) {
            value = value[0];
        }
    }

    nlohmann::json filter = selector.filter;
    if (!selector.xml_filter.empty()) {
        try {
            filter = xml_tree::fragment_to_filter(selector.xml_filter);
        } catch (const std::invalid_argument& e) {
            throw PermanentConnectorError(fmt::format("{} on {}", e.what(), device_.id));
        }
    }

    auto narrowed = tree::narrow(value, filter);
    if (!narrowed) {
        return result;
    }
    result.found = true;
    result.value = *narrowed;
    return result;
}

PushResult RestconfConnector::push(const ConfigEdit& edit) {
    PushResult result;
    if (edit.operations.empty()) {
        throw PermanentConnectorError(fmt::format("push to {}: no path operations given", device_.id));
    }

    for (const auto& operation : edit.operations) {
        auto op = util::to_lower(operation.op);
        std::string method;
        if (op == "update" || op == "merge") {
            method = "PATCH";
        } else if (op == "replace") {
            method = "PUT";
        } else if (op == "delete" || op == "remove") {
            method = "DELETE";
        } else if (op == "create") {
            method = "POST";
        } else {
            throw PermanentConnectorError(fmt::format("push to {}: unknown operation '{}'", device_.id, operation.op));
        }

        auto request = json_request(method, data_url(operation.path));
        if (method != "DELETE") {
            auto steps = tree::path_steps(operation.path);
            auto node = steps.empty() ? std::string() : steps.back();
            const auto& v = operation.value;
            bool wrapped = v.is_object() && v.size() == 1 &&
                           tree::local_name(v.begin().key()) == node;
            request.body = (wrapped || node.empty()) ? tree::dump(v) : tree::dump(nlohmann::json{{node, v}});
        }

        auto what = fmt::format("{} {}", op, operation.path);
        auto response = send(request, what);
        raise_for_transport(response, what);
        if (!is_success(response.status_code)) {
            result.message = fmt::format("{} rejected: {}", what, error_detail(response));
            return result;
        }
    }
    result.applied = true;

    if (!edit.commit) {
        result.message = "applied, commit skipped";
        return result;
    }

    auto request = json_request("POST", base_url() + config_.restconf_root + "/operations/" + kCommitOperation);
    if (!edit.commit_comment.empty()) {
        request.body = tree::dump(nlohmann::json{{"input", {{"comment", edit.commit_comment}}}});
    }
    auto response = send(request, "commit");
    raise_for_transport(response, "commit");
    if (!is_success(response.status_code)) {
        result.message = "commit failed: " + error_detail(response);
        spdlog::warn("[{}] {}", device_.id, result.message);
        return result;
    }

    result.committed = true;
    result.message = "committed";
    return result;
}

void RestconfConnector::close_session() {
    open_ = false;
}
