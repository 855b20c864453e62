#include "handlers.hpp"
#include "transform.hpp"

StepOutcome TransformHandler::execute(const StepContext& context) {
    const auto& spec = payload_of<TransformSpec>(context.step);
    auto input = resolve_reference(spec.input, context.scope);
    return StepOutcome::success(apply_transform(input, spec.operations, context.scope));
}
