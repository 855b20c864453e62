#pragma once

#include "expression.hpp"
#include "types.hpp"
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

enum class StepType { Query, Template, Audit, Remediate, Transform, ApiCall, Notification };
enum class ExecutionMode { Sequential, Dag, Hybrid };
enum class OnError { Fail, Continue };

std::string to_string(StepType type);
std::string to_string(ExecutionMode mode);
StepType parse_step_type(const std::string& name);
ExecutionMode parse_execution_mode(const std::string& name);

// Selector fields ("path", "filter", "filter_xml") are kept as JSON and
// rendered against the scope when the step runs.
struct QuerySpec {
    nlohmann::json selector;
    std::map<std::string, nlohmann::json> vendor_selectors;
};

struct TemplateSpec {
    std::string inline_template;
    std::string template_file;
    std::map<std::string, std::string> vendor_templates;
    nlohmann::json template_vars = nlohmann::json::object();
    std::string format = "text";
};

struct AuditSpec {
    std::string expected;   // Reference: "{{ expr }}" or bare expression
    std::string actual;
    CheckOperator op = CheckOperator::Equals;
    std::vector<std::string> fields;
    double pass_threshold = 100.0;
    bool fail_on_mismatch = false;
};

struct RemediateSpec {
    std::string config_source;
    std::map<std::string, nlohmann::json> vendor_specific;
    std::string capture_path;
    std::string capture_filter_xml;
    bool commit = true;
    std::string commit_comment;
    bool rollback_on_error = false;
};

struct TransformSpec {
    std::string input;
    nlohmann::json operations = nlohmann::json::array();
};

struct ApiCallSpec {
    std::string method = "GET";
    std::string url;
    nlohmann::json headers = nlohmann::json::object();
    nlohmann::json params = nlohmann::json::object();
    nlohmann::json body;
    nlohmann::json auth;    // {type: basic|bearer, username, password, token}
};

struct NotificationSpec {
    std::string message;
    std::string subject;
    std::vector<std::string> channels;
    std::string severity = "info";
};

using StepPayload = std::variant<QuerySpec, TemplateSpec, AuditSpec, RemediateSpec,
                                 TransformSpec, ApiCallSpec, NotificationSpec>;

struct Step {
    std::string name;
    StepType type = StepType::Query;
    std::string output_var;
    std::vector<std::string> depends_on;
    std::optional<Condition> condition;
    int retry_count = 0;
    double retry_delay = 0.0;
    int timeout = 0;        // Seconds per attempt; 0 takes the service default
    OnError on_error = OnError::Fail;
    StepPayload payload;

    // Variable the output is bound to
    const std::string& binding() const { return output_var.empty() ? name : output_var; }
};

struct Workflow {
    std::string id;
    std::string name;
    std::string description;
    ExecutionMode mode = ExecutionMode::Sequential;
    nlohmann::json variables = nlohmann::json::object();
    std::vector<Step> steps;

    // Both throw DefinitionError; nothing is returned for an invalid graph
    static Workflow parse(const std::string& document, const std::string& id = "");
    static Workflow from_json(const nlohmann::json& j, const std::string& id = "");

    std::optional<size_t> index_of(const std::string& step_name) const;
};

// Duplicate names, unknown or self dependencies and cycles raise DefinitionError
void check_graph(const Workflow& wf);

// A reference used by audit/remediate/transform: "{{ expr }}" renders with
// types preserved, anything else is read as an expression.
nlohmann::json resolve_reference(const std::string& reference, const nlohmann::json& scope);

// Throws DefinitionError when a reference cannot be parsed
void validate_reference(const std::string& reference);
