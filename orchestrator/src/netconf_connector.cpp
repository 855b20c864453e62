#include "netconf_connector.hpp"
#include "errors.hpp"
#include "tree.hpp"
#include "util.hpp"
#include "xml_tree.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

const char* kBaseNamespace = "urn:ietf:params:xml:ns:netconf:base:1.0";

pugi::xml_node find_descendant(const pugi::xml_node& node, const std::string& local) {
    for (auto child : node.children()) {
        if (child.type() != pugi::node_element) continue;
        if (tree::local_name(child.name()) == local) return child;
        auto found = find_descendant(child, local);
        if (found) return found;
    }
    return pugi::xml_node();
}

std::string rpc_error_text(const pugi::xml_node& root) {
    auto error = find_descendant(root, "rpc-error");
    if (!error) return "";
    auto message = find_descendant(error, "error-message");
    if (message && !util::trim(message.text().get()).empty()) {
        return util::trim(message.text().get());
    }
    auto tag = find_descendant(error, "error-tag");
    return tag ? util::trim(tag.text().get()) : std::string("rpc-error");
}

} // namespace

NetconfConnector::NetconfConnector(Device device, Credentials credentials, const Config& config,
                                   std::shared_ptr<HttpClient> http)
    : HttpDeviceConnector(std::move(device), std::move(credentials), config, std::move(http)) {}

std::string NetconfConnector::rpc_url() const {
    return base_url() + config_.netconf_endpoint;
}

std::string NetconfConnector::frame(const std::string& operation) {
    return fmt::format(R"(<?xml version="1.0" encoding="UTF-8"?><rpc message-id="{}" xmlns="{}">{}</rpc>)",
                       ++message_id_, kBaseNamespace, operation);
}

void NetconfConnector::rpc(const std::string& operation, const std::string& what, Reply& reply) {
    auto request = make_request("POST", rpc_url());
    request.headers["Content-Type"] = "application/xml";
    request.headers["Accept"] = "application/xml";
    if (!session_id_.empty()) {
        request.headers["X-Netconf-Session"] = session_id_;
    }
    request.body = frame(operation);

    auto response = send(request, what);
    raise_for_transport(response, what);
    reply.status_code = response.status_code;
    if (response.status_code == 404) {
        return;
    }

    std::string parse_error;
    if (!response.body.empty() && !xml_tree::parse(response.body, reply.doc, parse_error)) {
        throw PermanentConnectorError(fmt::format("{} on {}: malformed reply: {}", what, device_.id, parse_error));
    }
    reply.error = rpc_error_text(reply.doc);
    if (reply.error.empty() && (response.status_code < 200 || response.status_code >= 300)) {
        reply.error = fmt::format("HTTP {}", response.status_code);
    }
}

void NetconfConnector::open_session() {
    if (open_) return;

    std::string hello = fmt::format(
        R"(<?xml version="1.0" encoding="UTF-8"?><hello xmlns="{}"><capabilities>)"
        "<capability>urn:ietf:params:netconf:base:1.0</capability>"
        "<capability>urn:ietf:params:netconf:capability:candidate:1.0</capability>"
        "<capability>urn:ietf:params:netconf:capability:xpath:1.0</capability>"
        "</capabilities></hello>",
        kBaseNamespace);

    auto request = make_request("POST", rpc_url());
    request.headers["Content-Type"] = "application/xml";
    request.body = hello;
    auto response = send(request, "hello");
    raise_for_transport(response, "hello");
    if (response.status_code < 200 || response.status_code >= 300) {
        throw PermanentConnectorError(fmt::format("hello on {} rejected: HTTP {}", device_.id, response.status_code));
    }

    pugi::xml_document doc;
    std::string parse_error;
    if (!response.body.empty() && xml_tree::parse(response.body, doc, parse_error)) {
        auto id = find_descendant(doc, "session-id");
        if (id) session_id_ = util::trim(id.text().get());
    }

    open_ = true;
    spdlog::info("[{}] NETCONF session open{}", device_.id,
                 session_id_.empty() ? "" : fmt::format(" (session-id {})", session_id_));
}

FetchResult NetconfConnector::fetch(const Selector& selector) {
    std::string filter;
    if (!selector.path.empty()) {
        filter = fmt::format(R"(<filter type="xpath" select="{}"/>)", xml_tree::escape(selector.path));
    } else if (!selector.xml_filter.empty()) {
        filter = fmt::format(R"(<filter type="subtree">{}</filter>)", selector.xml_filter);
    }

    Reply reply;
    rpc(fmt::format("<get-config><source><running/></source>{}</get-config>", filter), "get-config", reply);

    FetchResult result;
    if (reply.status_code == 404) {
        return result;
    }
    if (!reply.error.empty()) {
        throw PermanentConnectorError(fmt::format("get-config on {} failed for {}: {}",
                                                  device_.id, selector.describe(), reply.error));
    }

    auto data = find_descendant(reply.doc, "data");
    if (!data || !data.first_child()) {
        return result;
    }

    auto tree_value = xml_tree::children_to_tree(data);
    if (tree_value.empty()) {
        return result;
    }
    result.raw = xml_tree::inner_xml(data);

    nlohmann::json filter_tree;
    if (!selector.xml_filter.empty()) {
        try {
            filter_tree = xml_tree::fragment_to_filter(selector.xml_filter);
        } catch (const std::invalid_argument& e) {
            throw PermanentConnectorError(fmt::format("{} on {}", e.what(), device_.id));
        }
    }

    if (selector.path.empty()) {
        auto narrowed = tree::narrow(tree_value, filter_tree);
        if (!narrowed) return result;
        result.found = true;
        result.value = *narrowed;
        return result;
    }

    // The device already applied the xpath; filter_xml narrows locally
    auto scoped = tree_value;
    if (!filter_tree.is_null()) {
        auto narrowed = tree::narrow(tree_value, filter_tree);
        if (!narrowed) {
            auto at_path = tree::descend(tree_value, tree::path_steps(selector.path));
            if (!at_path) return result;
            auto narrowed_at_path = tree::narrow(*at_path, filter_tree);
            if (!narrowed_at_path) return result;
            result.found = true;
            result.value = *narrowed_at_path;
            return result;
        }
        scoped = *narrowed;
    }

    auto at_path = tree::descend(scoped, tree::path_steps(selector.path));
    if (!at_path) return result;
    result.found = true;
    result.value = *at_path;
    return result;
}

PushResult NetconfConnector::push(const ConfigEdit& edit) {
    PushResult result;
    if (util::trim(edit.xml_config).empty()) {
        throw PermanentConnectorError(fmt::format("edit-config on {}: empty configuration payload", device_.id));
    }
    if (!is_edit_target(edit.target) || !is_default_operation(edit.default_operation)) {
        throw PermanentConnectorError(fmt::format("edit-config on {}: unsupported target '{}' or operation '{}'",
                                                  device_.id, edit.target, edit.default_operation));
    }

    Reply edit_reply;
    rpc(fmt::format("<edit-config><target><{}/></target><default-operation>{}</default-operation>"
                    "<config>{}</config></edit-config>",
                    edit.target, edit.default_operation, edit.xml_config),
        "edit-config", edit_reply);

    if (!edit_reply.error.empty() || edit_reply.status_code == 404) {
        result.message = "edit-config rejected: " +
                         (edit_reply.error.empty() ? std::string("HTTP 404") : edit_reply.error);
        if (edit.target == "candidate") {
            Reply discard;
            rpc("<discard-changes/>", "discard-changes", discard);
        }
        return result;
    }
    result.applied = true;

    if (edit.target != "candidate") {
        result.committed = true;
        result.message = "applied to " + edit.target;
        return result;
    }
    if (!edit.commit) {
        result.message = "applied to candidate, commit skipped";
        return result;
    }

    Reply commit_reply;
    rpc("<commit/>", "commit", commit_reply);
    if (!commit_reply.error.empty() || commit_reply.status_code == 404) {
        result.message = "commit failed: " +
                         (commit_reply.error.empty() ? std::string("HTTP 404") : commit_reply.error);
        Reply discard;
        rpc("<discard-changes/>", "discard-changes", discard);
        spdlog::warn("[{}] {}", device_.id, result.message);
        return result;
    }

    result.committed = true;
    result.message = "committed";
    return result;
}

void NetconfConnector::close_session() {
    if (!open_) return;
    open_ = false;

    Reply reply;
    rpc("<close-session/>", "close-session", reply);
    if (!reply.error.empty()) {
        spdlog::warn("[{}] close-session returned: {}", device_.id, reply.error);
    }
    session_id_.clear();
}
