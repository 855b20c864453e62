#include "types.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "tree.hpp"

namespace {

std::string string_field(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return "";
    const auto& v = j.at(key);
    if (v.is_string()) return v.get<std::string>();
    return tree::dump(v);
}

} // namespace

nlohmann::json Device::to_json() const {
    return {
        {"id", id},
        {"hostname", hostname},
        {"address", address},
        {"port", port},
        {"vendor", vendor}
    };
}

Device Device::from_json(const nlohmann::json& j) {
    Device device;
    device.id = string_field(j, "id");
    device.hostname = j.value("hostname", "");
    device.address = j.value("address", j.value("ip_address", ""));
    device.port = j.value("port", 830);
    device.vendor = util::to_lower(j.value("vendor", ""));
    device.credential_ref = j.value("credential_ref", "");
    if (device.id.empty()) {
        throw DefinitionError("Device entry without an id");
    }
    return device;
}

std::string Selector::describe() const {
    if (!path.empty()) return path;
    if (!xml_filter.empty()) return "subtree filter";
    return "<empty>";
}

std::string to_string(CheckOperator op) {
    switch (op) {
        case CheckOperator::Exists:      return "exists";
        case CheckOperator::NotExists:   return "not_exists";
        case CheckOperator::Contains:    return "contains";
        case CheckOperator::NotContains: return "not_contains";
        case CheckOperator::Equals:      return "equals";
        case CheckOperator::Regex:       return "regex";
        case CheckOperator::Count:       return "count";
    }
    return "unknown";
}

CheckOperator parse_check_operator(const std::string& name) {
    auto n = util::to_lower(util::trim(name));
    if (n == "exists") return CheckOperator::Exists;
    if (n == "not_exists") return CheckOperator::NotExists;
    if (n == "contains") return CheckOperator::Contains;
    if (n == "not_contains") return CheckOperator::NotContains;
    if (n == "equals" || n == "exact") return CheckOperator::Equals;
    if (n == "regex") return CheckOperator::Regex;
    if (n == "count") return CheckOperator::Count;
    throw DefinitionError("Unknown comparison operator: " + name);
}

std::optional<long long> parse_count(const std::string& text) {
    double value = 0;
    if (!util::parse_number(text, value) || value < 0 || value != static_cast<double>(static_cast<long long>(value))) {
        return std::nullopt;
    }
    return static_cast<long long>(value);
}

bool operator_needs_expected(CheckOperator op) {
    return op == CheckOperator::Contains || op == CheckOperator::NotContains ||
           op == CheckOperator::Equals || op == CheckOperator::Regex || op == CheckOperator::Count;
}

bool Rule::applies_to(const std::string& vendor) const {
    if (vendors.empty()) return true;
    auto tag = util::to_lower(vendor);
    for (const auto& v : vendors) {
        if (util::to_lower(v) == tag) return true;
    }
    return false;
}

void Rule::validate() const {
    if (name.empty()) {
        throw DefinitionError("Rule '" + id + "' has no name");
    }
    if (checks.empty()) {
        throw DefinitionError("Rule '" + name + "' has no checks");
    }
    for (size_t i = 0; i < checks.size(); ++i) {
        const auto& check = checks[i];
        std::string label = "Rule '" + name + "' check " + std::to_string(i + 1);
        if (check.selector.empty()) {
            throw DefinitionError(label + " has neither a path nor a filter");
        }
        if (operator_needs_expected(check.op) && !check.expected) {
            throw DefinitionError(label + " uses '" + to_string(check.op) +
                                  "' without an expected value");
        }
        if (check.op == CheckOperator::Regex && !check.pattern) {
            try {
                Pattern re(*check.expected);
            } catch (const DefinitionError& e) {
                throw DefinitionError(label + " has an " + e.what());
            }
        }
        if (check.op == CheckOperator::Count && !parse_count(*check.expected)) {
            throw DefinitionError(label + " needs a non-negative integer count, got '" + *check.expected + "'");
        }
    }
}

void Rule::compile_patterns() {
    for (auto& check : checks) {
        if (check.op == CheckOperator::Regex && check.expected && !check.pattern) {
            check.pattern = std::make_shared<const Pattern>(*check.expected);
        }
    }
}

Rule Rule::from_json(const nlohmann::json& j) {
    Rule rule;
    rule.id = string_field(j, "id");
    rule.name = j.value("name", "");
    rule.severity = util::to_lower(j.value("severity", "medium"));
    if (j.contains("vendors") && j["vendors"].is_array()) {
        rule.vendors = j["vendors"].get<std::vector<std::string>>();
    }

    if (j.contains("checks") && j["checks"].is_array()) {
        int index = 0;
        for (const auto& item : j["checks"]) {
            ++index;
            Check check;
            check.name = item.value("name", "check-" + std::to_string(index));
            check.selector.path = item.value("path", item.value("xpath", ""));
            check.selector.xml_filter = item.value("filter_xml", "");
            if (item.contains("filter") && item["filter"].is_object()) {
                check.selector.filter = item["filter"];
            }
            check.op = parse_check_operator(
                item.value("operator", item.value("comparison", "exists")));
            for (const char* key : {"expected", "reference_value"}) {
                if (item.contains(key) && !item[key].is_null()) {
                    check.expected = string_field(item, key);
                    break;
                }
            }
            check.success_message = item.value("success_message", "");
            check.error_message = item.value("error_message", "");
            rule.checks.push_back(std::move(check));
        }
    }

    rule.validate();
    rule.compile_patterns();
    return rule;
}

std::string to_string(FindingStatus status) {
    switch (status) {
        case FindingStatus::Pass:  return "pass";
        case FindingStatus::Fail:  return "fail";
        case FindingStatus::Error: return "error";
    }
    return "unknown";
}

nlohmann::json Finding::to_json() const {
    return {
        {"device_id", device_id},
        {"rule_id", rule_id},
        {"rule", rule_name},
        {"check", check_name},
        {"check_index", check_index},
        {"status", to_string(status)},
        {"actual", actual},
        {"message", message},
        {"severity", severity},
        {"ts", util::format_timestamp(timestamp)}
    };
}

std::string to_string(DeviceAuditState state) {
    switch (state) {
        case DeviceAuditState::Pending:   return "pending";
        case DeviceAuditState::Running:   return "running";
        case DeviceAuditState::Completed: return "completed";
        case DeviceAuditState::TimedOut:  return "timed_out";
        case DeviceAuditState::Error:     return "error";
        case DeviceAuditState::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string to_string(AuditRunState state) {
    switch (state) {
        case AuditRunState::Running:   return "running";
        case AuditRunState::Completed: return "completed";
        case AuditRunState::Failed:    return "failed";
        case AuditRunState::Cancelled: return "cancelled";
    }
    return "unknown";
}

int AuditRun::passed_checks() const {
    int passed = 0;
    for (const auto& f : findings) {
        if (f.status == FindingStatus::Pass) ++passed;
    }
    return passed;
}

int AuditRun::total_checks() const {
    return static_cast<int>(findings.size());
}

std::optional<double> AuditRun::score() const {
    int total = total_checks();
    if (total == 0) return std::nullopt;
    return 100.0 * passed_checks() / total;
}

nlohmann::json AuditRun::to_json() const {
    nlohmann::json devices = nlohmann::json::object();
    for (const auto& [device_id, state] : device_states) {
        nlohmann::json entry = {{"state", to_string(state)}};
        auto msg = device_messages.find(device_id);
        if (msg != device_messages.end()) {
            entry["message"] = msg->second;
        }
        devices[device_id] = entry;
    }

    nlohmann::json findings_json = nlohmann::json::array();
    for (const auto& f : findings) {
        findings_json.push_back(f.to_json());
    }

    auto s = score();
    return {
        {"id", id},
        {"state", to_string(state)},
        {"device_ids", device_ids},
        {"rule_ids", rule_ids},
        {"started_at", util::format_timestamp(started_at)},
        {"finished_at", finished_at ? nlohmann::json(util::format_timestamp(*finished_at))
                                    : nlohmann::json(nullptr)},
        {"devices", devices},
        {"passed", passed_checks()},
        {"total", total_checks()},
        {"score", s ? nlohmann::json(*s) : nlohmann::json(nullptr)},
        {"findings", findings_json}
    };
}
