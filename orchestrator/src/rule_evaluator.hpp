#pragma once

#include "backoff_manager.hpp"
#include "config.hpp"
#include "connector.hpp"
#include "types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct RuleOutcome {
    std::vector<Finding> findings;
    bool aborted = false;       // Connector failure or deadline cut the rule short
    bool timed_out = false;
    std::string abort_reason;

    bool passed() const;
};

class RuleEvaluator {
public:
    using FindingCallback = std::function<void(const Finding&)>;

    RuleEvaluator(const Config& config, BackoffManager& backoff);

    // Applies one operator to a fetched value. Values are compared in
    // canonical string form. Regex matches ignore case; without a compiled
    // pattern the expected text is compiled here and a bad one throws
    // DefinitionError.
    static bool compare(CheckOperator op, const nlohmann::json& actual,
                        const std::optional<std::string>& expected, const Pattern* pattern = nullptr);

    // Runs the rule's checks in order against one device. Transient fetch
    // failures are retried within the deadline; a failure that persists
    // turns the current and remaining checks into error findings.
    RuleOutcome evaluate(const Rule& rule, VendorConnector& connector, const Device& device,
                         Deadline deadline, const FindingCallback& on_finding = nullptr);

    // Error findings for checks [from, end) of a rule
    static std::vector<Finding> error_findings(const Rule& rule, const Device& device,
                                               size_t from, const std::string& message);

private:
    FetchResult fetch_with_retry(VendorConnector& connector, const Device& device,
                                 const Selector& selector, Deadline deadline);

    const Config& config_;
    BackoffManager& backoff_;
};
