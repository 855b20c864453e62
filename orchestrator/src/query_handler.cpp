#include "handlers.hpp"
#include "expression.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

StepOutcome QueryHandler::execute(const StepContext& context) {
    const auto& spec = payload_of<QuerySpec>(context.step);

    const auto* vendor_fields = for_vendor(spec.vendor_selectors, context.device.vendor);
    auto fields = render_value(vendor_fields ? *vendor_fields : spec.selector, context.scope);
    auto selector = make_selector(fields);
    if (selector.empty()) {
        return StepOutcome::failure(
            fmt::format("no selector for vendor '{}'", context.device.vendor), false);
    }

    auto result = context.session.fetch_within(selector, context.deadline);

    spdlog::debug("[{}] query {} -> {}", context.device.id, selector.describe(),
                  result.found ? "found" : "not found");

    nlohmann::json output = {
        {"found", result.found},
        {"data", result.found ? result.value : nlohmann::json(nullptr)},
        {"raw", result.raw},
        {"selector", selector.describe()}
    };
    return StepOutcome::success(std::move(output),
                                result.found ? "" : "path not found: " + selector.describe());
}
