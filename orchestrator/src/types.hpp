#pragma once

#include "pattern.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct Device {
    std::string id;
    std::string hostname;
    std::string address;
    int port = 830;
    std::string vendor;
    std::string credential_ref;

    // Management address, falling back to the hostname
    const std::string& host() const { return address.empty() ? hostname : address; }

    nlohmann::json to_json() const;
    static Device from_json(const nlohmann::json& j);
};

struct Credentials {
    std::string username;
    std::string password;
    std::string token;
};

// Addresses a subtree on a device. The XML variant understands path (xpath)
// and xml_filter; the model-path variant understands path and filter.
struct Selector {
    std::string path;
    std::string xml_filter;
    nlohmann::json filter;

    bool empty() const { return path.empty() && xml_filter.empty(); }
    std::string describe() const;
};

enum class CheckOperator {
    Exists,
    NotExists,
    Contains,
    NotContains,
    Equals,
    Regex,
    Count       // At least `expected` entries at the path
};

std::string to_string(CheckOperator op);
CheckOperator parse_check_operator(const std::string& name);
bool operator_needs_expected(CheckOperator op);

// Operand of the count operator: a non-negative integer
std::optional<long long> parse_count(const std::string& text);

struct Check {
    std::string name;
    Selector selector;
    CheckOperator op = CheckOperator::Exists;
    std::optional<std::string> expected;
    std::string success_message;
    std::string error_message;
    std::shared_ptr<const Pattern> pattern;     // Compiled regex operand
};

struct Rule {
    std::string id;
    std::string name;
    std::string severity = "medium";
    std::vector<std::string> vendors;
    std::vector<Check> checks;

    bool applies_to(const std::string& vendor) const;

    // Throws DefinitionError when the rule cannot be evaluated
    void validate() const;

    // Compiles regex operands once; rules built by hand compile lazily
    void compile_patterns();
    static Rule from_json(const nlohmann::json& j);
};

enum class FindingStatus { Pass, Fail, Error };

std::string to_string(FindingStatus status);

struct Finding {
    std::string device_id;
    std::string rule_id;
    std::string rule_name;
    std::string check_name;
    int check_index = 0;
    FindingStatus status = FindingStatus::Error;
    std::string actual;
    std::string message;
    std::string severity;
    std::chrono::system_clock::time_point timestamp;

    nlohmann::json to_json() const;
};

enum class DeviceAuditState { Pending, Running, Completed, TimedOut, Error, Cancelled };
enum class AuditRunState { Running, Completed, Failed, Cancelled };

std::string to_string(DeviceAuditState state);
std::string to_string(AuditRunState state);

struct AuditRun {
    std::string id;
    std::vector<std::string> device_ids;
    std::vector<std::string> rule_ids;
    std::chrono::system_clock::time_point started_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;
    AuditRunState state = AuditRunState::Running;
    std::map<std::string, DeviceAuditState> device_states;
    std::map<std::string, std::string> device_messages;
    std::vector<Finding> findings;

    int passed_checks() const;
    int total_checks() const;

    // 100 * passed / total; empty when no checks were recorded
    std::optional<double> score() const;

    nlohmann::json to_json() const;
};
