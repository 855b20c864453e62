#include "handlers.hpp"
#include "rule_evaluator.hpp"
#include "tree.hpp"
#include <fmt/format.h>

StepOutcome AuditHandler::execute(const StepContext& context) {
    const auto& spec = payload_of<AuditSpec>(context.step);

    auto expected = resolve_reference(spec.expected, context.scope);
    auto actual = resolve_reference(spec.actual, context.scope);

    nlohmann::json mismatched = nlohmann::json::array();
    double compliance = 0.0;

    if (!spec.fields.empty()) {
        size_t matched = 0;
        for (const auto& field : spec.fields) {
            const auto* e = tree::lookup(expected, field);
            const auto* a = tree::lookup(actual, field);
            auto want = e ? nlohmann::json(*e) : nlohmann::json(nullptr);
            auto got = a ? nlohmann::json(*a) : nlohmann::json(nullptr);
            if (RuleEvaluator::compare(spec.op, got, tree::canonical_string(want))) {
                ++matched;
            } else {
                mismatched.push_back({{"field", field}, {"expected", want}, {"actual", got}});
            }
        }
        compliance = 100.0 * matched / spec.fields.size();
    } else {
        bool ok = RuleEvaluator::compare(spec.op, actual, tree::canonical_string(expected));
        compliance = ok ? 100.0 : 0.0;
    }

    bool passed = compliance >= spec.pass_threshold;
    nlohmann::json output = {
        {"passed", passed},
        {"compliance", compliance},
        {"operator", to_string(spec.op)},
        {"expected", expected},
        {"actual", actual},
        {"mismatched_fields", mismatched}
    };

    auto message = fmt::format("compliance {:.1f}% (threshold {:.1f}%)", compliance, spec.pass_threshold);
    if (!passed && spec.fail_on_mismatch) {
        return StepOutcome::failure("audit failed: " + message, false, output);
    }
    return StepOutcome::success(std::move(output), message);
}
