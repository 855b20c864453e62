#include "workflow.hpp"
#include "connector.hpp"
#include "errors.hpp"
#include "transform.hpp"
#include "util.hpp"
#include "yaml_convert.hpp"
#include "tree.hpp"
#include <algorithm>
#include <functional>
#include <set>
#include <fmt/format.h>

namespace {

std::string string_value(const nlohmann::json& j, const char* key, const std::string& fallback = "") {
    if (!j.contains(key) || j.at(key).is_null()) return fallback;
    const auto& v = j.at(key);
    return v.is_string() ? v.get<std::string>() : tree::dump(v);
}

[[noreturn]] void step_error(const std::string& step, const std::string& what) {
    throw DefinitionError(fmt::format("Step '{}': {}", step, what));
}

void check_template(const std::string& step, const nlohmann::json& value, const std::string& field) {
    try {
        validate_templates(value);
    } catch (const DefinitionError& e) {
        step_error(step, fmt::format("invalid template in {}: {}", field, e.what()));
    }
}

void check_reference(const std::string& step, const std::string& reference, const std::string& field) {
    try {
        validate_reference(reference);
    } catch (const DefinitionError& e) {
        step_error(step, fmt::format("invalid {}: {}", field, e.what()));
    }
}

bool has_selector(const nlohmann::json& j) {
    if (!j.is_object()) return false;
    for (const char* key : {"path", "xpath", "filter_xml"}) {
        if (!string_value(j, key).empty()) return true;
    }
    return false;
}

nlohmann::json selector_fields(const nlohmann::json& j) {
    nlohmann::json selector = nlohmann::json::object();
    auto path = string_value(j, "path", string_value(j, "xpath"));
    if (!path.empty()) selector["path"] = path;
    auto xml = string_value(j, "filter_xml");
    if (!xml.empty()) selector["filter_xml"] = xml;
    if (j.contains("filter") && !j["filter"].is_null()) {
        if (j["filter"].is_string()) {
            selector["filter_xml"] = j["filter"];
        } else {
            selector["filter"] = j["filter"];
        }
    }
    return selector;
}

QuerySpec parse_query(const std::string& step, const nlohmann::json& j) {
    QuerySpec spec;
    spec.selector = selector_fields(j);
    if (j.contains("vendor_specific") && j["vendor_specific"].is_object()) {
        for (auto it = j["vendor_specific"].begin(); it != j["vendor_specific"].end(); ++it) {
            auto selector = selector_fields(it.value());
            if (!has_selector(selector)) {
                step_error(step, fmt::format("vendor_specific.{} has no path or filter", it.key()));
            }
            spec.vendor_selectors[util::to_lower(it.key())] = selector;
        }
    }
    if (!has_selector(spec.selector) && spec.vendor_selectors.empty()) {
        step_error(step, "query needs a path, filter_xml or vendor_specific selector");
    }
    check_template(step, spec.selector, "selector");
    for (const auto& [vendor, selector] : spec.vendor_selectors) {
        check_template(step, selector, "vendor_specific." + vendor);
    }
    return spec;
}

TemplateSpec parse_template(const std::string& step, const nlohmann::json& j) {
    TemplateSpec spec;
    spec.inline_template = string_value(j, "template");
    spec.template_file = string_value(j, "template_file");
    spec.format = util::to_lower(string_value(j, "format", "text"));
    if (j.contains("template_vars") && j["template_vars"].is_object()) {
        spec.template_vars = j["template_vars"];
    }
    if (j.contains("vendor_specific") && j["vendor_specific"].is_object()) {
        for (auto it = j["vendor_specific"].begin(); it != j["vendor_specific"].end(); ++it) {
            const auto& v = it.value();
            auto text = v.is_string() ? v.get<std::string>() : string_value(v, "template");
            if (!text.empty()) spec.vendor_templates[util::to_lower(it.key())] = text;
        }
    }
    if (spec.inline_template.empty() && spec.template_file.empty() && spec.vendor_templates.empty()) {
        step_error(step, "template needs template, template_file or vendor_specific templates");
    }
    check_template(step, spec.inline_template, "template");
    check_template(step, spec.template_vars, "template_vars");
    for (const auto& [vendor, text] : spec.vendor_templates) {
        check_template(step, text, "vendor_specific." + vendor);
    }
    return spec;
}

AuditSpec parse_audit(const std::string& step, const nlohmann::json& j) {
    AuditSpec spec;
    const auto compare = j.contains("compare") ? j["compare"] : nlohmann::json::object();
    spec.expected = string_value(compare, "expected");
    spec.actual = string_value(compare, "actual");
    if (spec.expected.empty() || spec.actual.empty()) {
        step_error(step, "audit needs compare.expected and compare.actual");
    }
    check_reference(step, spec.expected, "compare.expected");
    check_reference(step, spec.actual, "compare.actual");

    auto op = string_value(compare, "operator", string_value(j, "operator", "equals"));
    try {
        spec.op = parse_check_operator(op);
    } catch (const DefinitionError& e) {
        step_error(step, e.what());
    }
    if (compare.contains("fields") && compare["fields"].is_array()) {
        for (const auto& f : compare["fields"]) {
            if (f.is_string()) spec.fields.push_back(f.get<std::string>());
        }
    }
    spec.pass_threshold = j.value("pass_threshold", 100.0);
    if (spec.pass_threshold < 0.0 || spec.pass_threshold > 100.0) {
        step_error(step, "pass_threshold must be between 0 and 100");
    }
    spec.fail_on_mismatch = j.value("fail_on_mismatch", false);
    return spec;
}

RemediateSpec parse_remediate(const std::string& step, const nlohmann::json& j) {
    RemediateSpec spec;
    spec.config_source = string_value(j, "config_source");
    if (spec.config_source.empty()) {
        step_error(step, "remediate needs config_source");
    }
    check_reference(step, spec.config_source, "config_source");

    if (j.contains("vendor_specific") && j["vendor_specific"].is_object()) {
        for (auto it = j["vendor_specific"].begin(); it != j["vendor_specific"].end(); ++it) {
            const auto& v = it.value();
            if (!v.is_object()) {
                step_error(step, fmt::format("vendor_specific.{} must be a mapping", it.key()));
            }
            if (v.contains("operations")) {
                if (!v["operations"].is_array()) {
                    step_error(step, fmt::format("vendor_specific.{}.operations must be a list", it.key()));
                }
                for (const auto& op : v["operations"]) {
                    if (!op.is_object() || string_value(op, "path").empty()) {
                        step_error(step, fmt::format("vendor_specific.{}: every operation needs a path", it.key()));
                    }
                }
            }
            if (v.contains("target") && !(v["target"].is_string() && is_edit_target(v["target"].get<std::string>()))) {
                step_error(step, fmt::format("vendor_specific.{}.target must be candidate or running", it.key()));
            }
            if (v.contains("operation") &&
                !(v["operation"].is_string() && is_default_operation(v["operation"].get<std::string>()))) {
                step_error(step, fmt::format("vendor_specific.{}.operation must be merge, replace or none", it.key()));
            }
            check_template(step, v, "vendor_specific." + it.key());
            spec.vendor_specific[util::to_lower(it.key())] = v;
        }
    }

    spec.capture_path = string_value(j, "capture_path");
    spec.capture_filter_xml = string_value(j, "capture_filter_xml");
    spec.commit = j.value("commit", true);
    spec.commit_comment = string_value(j, "commit_comment");
    spec.rollback_on_error = j.value("rollback_on_error", false);
    if (spec.rollback_on_error && spec.capture_path.empty() && spec.capture_filter_xml.empty()) {
        step_error(step, "rollback_on_error needs capture_path or capture_filter_xml");
    }
    check_template(step, spec.capture_path, "capture_path");
    check_template(step, spec.commit_comment, "commit_comment");
    return spec;
}

TransformSpec parse_transform(const std::string& step, const nlohmann::json& j) {
    TransformSpec spec;
    spec.input = string_value(j, "input");
    if (spec.input.empty()) {
        step_error(step, "transform needs input");
    }
    check_reference(step, spec.input, "input");
    if (!j.contains("operations") || !j["operations"].is_array()) {
        step_error(step, "transform needs an operations list");
    }
    spec.operations = j["operations"];
    try {
        validate_transform(spec.operations);
    } catch (const DefinitionError& e) {
        step_error(step, e.what());
    }
    return spec;
}

ApiCallSpec parse_api_call(const std::string& step, const nlohmann::json& j) {
    static const std::set<std::string> kMethods = {"GET", "POST", "PUT", "PATCH", "DELETE"};

    ApiCallSpec spec;
    spec.url = string_value(j, "url");
    if (spec.url.empty()) {
        step_error(step, "api_call needs url");
    }
    spec.method = util::to_upper(string_value(j, "method", "GET"));
    if (kMethods.count(spec.method) == 0) {
        step_error(step, fmt::format("unsupported HTTP method '{}'", spec.method));
    }
    if (j.contains("headers") && j["headers"].is_object()) spec.headers = j["headers"];
    if (j.contains("params") && j["params"].is_object()) spec.params = j["params"];
    if (j.contains("body")) spec.body = j["body"];
    if (j.contains("auth") && !j["auth"].is_null()) {
        spec.auth = j["auth"];
        auto type = util::to_lower(string_value(spec.auth, "type"));
        if (type != "basic" && type != "bearer") {
            step_error(step, fmt::format("unsupported auth type '{}'", type));
        }
    }
    check_template(step, spec.url, "url");
    check_template(step, spec.headers, "headers");
    check_template(step, spec.params, "params");
    check_template(step, spec.body, "body");
    check_template(step, spec.auth, "auth");
    return spec;
}

NotificationSpec parse_notification(const std::string& step, const nlohmann::json& j) {
    NotificationSpec spec;
    spec.message = string_value(j, "message");
    spec.subject = string_value(j, "subject");
    spec.severity = util::to_lower(string_value(j, "severity", "info"));
    if (j.contains("channels") && j["channels"].is_array()) {
        for (const auto& c : j["channels"]) {
            if (c.is_string() && !c.get<std::string>().empty()) spec.channels.push_back(c.get<std::string>());
        }
    }
    if (spec.message.empty()) {
        step_error(step, "notification needs message");
    }
    if (spec.channels.empty()) {
        step_error(step, "notification needs at least one channel");
    }
    check_template(step, spec.message, "message");
    check_template(step, spec.subject, "subject");
    return spec;
}

Step parse_step(const nlohmann::json& j, size_t index) {
    if (!j.is_object()) {
        throw DefinitionError(fmt::format("Step #{} is not a mapping", index + 1));
    }

    Step step;
    step.name = string_value(j, "name");
    if (step.name.empty()) {
        throw DefinitionError(fmt::format("Step #{} has no name", index + 1));
    }

    auto type = string_value(j, "type");
    try {
        step.type = parse_step_type(type);
    } catch (const DefinitionError& e) {
        step_error(step.name, e.what());
    }

    step.output_var = string_value(j, "output_var");
    if (j.contains("depends_on")) {
        const auto& deps = j["depends_on"];
        if (deps.is_string()) {
            step.depends_on.push_back(deps.get<std::string>());
        } else if (deps.is_array()) {
            for (const auto& d : deps) step.depends_on.push_back(d.is_string() ? d.get<std::string>() : tree::dump(d));
        } else if (!deps.is_null()) {
            step_error(step.name, "depends_on must be a name or a list of names");
        }
    }

    auto condition = string_value(j, "condition");
    if (!util::trim(condition).empty()) {
        try {
            step.condition = Condition::parse(condition);
        } catch (const DefinitionError& e) {
            step_error(step.name, fmt::format("invalid condition: {}", e.what()));
        }
    }

    step.retry_count = j.value("retry_count", 0);
    step.retry_delay = j.value("retry_delay", 0.0);
    step.timeout = j.value("timeout", 0);
    if (step.retry_count < 0) step_error(step.name, "retry_count must not be negative");
    if (step.retry_delay < 0.0) step_error(step.name, "retry_delay must not be negative");
    if (step.timeout < 0) step_error(step.name, "timeout must not be negative");

    auto on_error = util::to_lower(string_value(j, "on_error", "fail"));
    if (on_error == "fail") {
        step.on_error = OnError::Fail;
    } else if (on_error == "continue") {
        step.on_error = OnError::Continue;
    } else {
        step_error(step.name, fmt::format("unknown on_error '{}'", on_error));
    }

    switch (step.type) {
        case StepType::Query:        step.payload = parse_query(step.name, j); break;
        case StepType::Template:     step.payload = parse_template(step.name, j); break;
        case StepType::Audit:        step.payload = parse_audit(step.name, j); break;
        case StepType::Remediate:    step.payload = parse_remediate(step.name, j); break;
        case StepType::Transform:    step.payload = parse_transform(step.name, j); break;
        case StepType::ApiCall:      step.payload = parse_api_call(step.name, j); break;
        case StepType::Notification: step.payload = parse_notification(step.name, j); break;
    }
    return step;
}

} // namespace

void check_graph(const Workflow& wf) {
    std::map<std::string, size_t> index;
    for (size_t i = 0; i < wf.steps.size(); ++i) {
        if (!index.emplace(wf.steps[i].name, i).second) {
            throw DefinitionError(fmt::format("Duplicate step name '{}'", wf.steps[i].name));
        }
    }

    for (const auto& step : wf.steps) {
        for (const auto& dep : step.depends_on) {
            if (dep == step.name) {
                throw DefinitionError(fmt::format("Step '{}' depends on itself", step.name));
            }
            if (index.count(dep) == 0) {
                throw DefinitionError(fmt::format("Step '{}' depends on unknown step '{}'", step.name, dep));
            }
        }
    }

    enum class Mark { None, Visiting, Done };
    std::vector<Mark> marks(wf.steps.size(), Mark::None);
    std::vector<std::string> trail;

    std::function<void(size_t)> visit = [&](size_t i) {
        if (marks[i] == Mark::Done) return;
        if (marks[i] == Mark::Visiting) {
            auto start = std::find(trail.begin(), trail.end(), wf.steps[i].name);
            std::vector<std::string> cycle(start, trail.end());
            cycle.push_back(wf.steps[i].name);
            throw DefinitionError("Dependency cycle: " + util::join(cycle, " -> "));
        }
        marks[i] = Mark::Visiting;
        trail.push_back(wf.steps[i].name);
        for (const auto& dep : wf.steps[i].depends_on) {
            visit(index.at(dep));
        }
        trail.pop_back();
        marks[i] = Mark::Done;
    };

    for (size_t i = 0; i < wf.steps.size(); ++i) {
        visit(i);
    }
}

std::string to_string(StepType type) {
    switch (type) {
        case StepType::Query:        return "query";
        case StepType::Template:     return "template";
        case StepType::Audit:        return "audit";
        case StepType::Remediate:    return "remediate";
        case StepType::Transform:    return "transform";
        case StepType::ApiCall:      return "api_call";
        case StepType::Notification: return "notification";
    }
    return "unknown";
}

std::string to_string(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::Sequential: return "sequential";
        case ExecutionMode::Dag:        return "dag";
        case ExecutionMode::Hybrid:     return "hybrid";
    }
    return "unknown";
}

StepType parse_step_type(const std::string& name) {
    auto n = util::to_lower(util::trim(name));
    if (n == "query") return StepType::Query;
    if (n == "template") return StepType::Template;
    if (n == "audit") return StepType::Audit;
    if (n == "remediate") return StepType::Remediate;
    if (n == "transform") return StepType::Transform;
    if (n == "api_call") return StepType::ApiCall;
    if (n == "notification") return StepType::Notification;
    throw DefinitionError("Unknown step type '" + name + "'");
}

ExecutionMode parse_execution_mode(const std::string& name) {
    auto n = util::to_lower(util::trim(name));
    if (n == "sequential") return ExecutionMode::Sequential;
    if (n == "dag" || n == "parallel") return ExecutionMode::Dag;
    if (n == "hybrid") return ExecutionMode::Hybrid;
    throw DefinitionError("Unknown execution_mode '" + name + "'");
}

Workflow Workflow::parse(const std::string& document, const std::string& id) {
    return from_json(load_yaml_document(document), id);
}

Workflow Workflow::from_json(const nlohmann::json& j, const std::string& id) {
    if (!j.is_object()) {
        throw DefinitionError("Workflow document must be a mapping");
    }

    Workflow wf;
    wf.name = string_value(j, "name");
    wf.id = id.empty() ? string_value(j, "id", wf.name) : id;
    wf.description = string_value(j, "description");
    if (wf.name.empty()) {
        throw DefinitionError("Workflow has no name");
    }
    wf.mode = parse_execution_mode(string_value(j, "execution_mode", "sequential"));

    if (j.contains("variables") && !j["variables"].is_null()) {
        if (!j["variables"].is_object()) {
            throw DefinitionError("Workflow variables must be a mapping");
        }
        wf.variables = j["variables"];
    }

    if (!j.contains("steps") || !j["steps"].is_array() || j["steps"].empty()) {
        throw DefinitionError(fmt::format("Workflow '{}' has no steps", wf.name));
    }
    size_t index = 0;
    for (const auto& item : j["steps"]) {
        wf.steps.push_back(parse_step(item, index++));
    }

    check_graph(wf);
    return wf;
}

std::optional<size_t> Workflow::index_of(const std::string& step_name) const {
    for (size_t i = 0; i < steps.size(); ++i) {
        if (steps[i].name == step_name) return i;
    }
    return std::nullopt;
}

nlohmann::json resolve_reference(const std::string& reference, const nlohmann::json& scope) {
    if (Template::has_markup(reference)) {
        return render_value(reference, scope);
    }
    return Expression::parse(reference).evaluate(scope);
}

void validate_reference(const std::string& reference) {
    if (Template::has_markup(reference)) {
        validate_templates(reference);
    } else {
        Expression::parse(reference);
    }
}
