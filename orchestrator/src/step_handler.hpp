#pragma once

#include "connector.hpp"
#include "types.hpp"
#include "util.hpp"
#include "workflow.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

struct StepContext {
    const Step& step;
    const Workflow& workflow;
    const std::string& execution_id;
    const nlohmann::json& scope;    // Snapshot taken when the step was launched
    const Device& device;
    VendorConnector& session;       // Execution-wide lease, opened on first use
    Deadline deadline;              // End of the current attempt
    int attempt = 1;
    const std::atomic<bool>* cancelled = nullptr;
};

struct StepOutcome {
    bool completed = false;
    nlohmann::json output;
    std::string message;
    bool retryable = false;

    static StepOutcome success(nlohmann::json output, std::string message = "");
    static StepOutcome failure(std::string message, bool retryable, nlohmann::json output = nullptr);
};

// One implementation per step type. Handlers report ordinary failures through
// StepOutcome and may throw StepFailure or ConnectorError.
class StepHandler {
public:
    virtual ~StepHandler() = default;
    virtual StepType type() const = 0;
    virtual StepOutcome execute(const StepContext& context) = 0;
};

class HandlerRegistry {
public:
    void add(std::unique_ptr<StepHandler> handler);
    StepHandler* find(StepType type) const;

private:
    std::map<StepType, std::unique_ptr<StepHandler>> handlers_;
};

// Selector from rendered fields: path, filter_xml, filter
Selector make_selector(const nlohmann::json& fields);

// Payload of the step, which the parser guarantees matches its type
template <typename Spec>
const Spec& payload_of(const Step& step) {
    return std::get<Spec>(step.payload);
}

// Entry of a vendor-keyed map matching the device's vendor tag
template <typename Value>
const Value* for_vendor(const std::map<std::string, Value>& entries, const std::string& vendor) {
    auto it = entries.find(util::to_lower(vendor));
    return it == entries.end() ? nullptr : &it->second;
}
