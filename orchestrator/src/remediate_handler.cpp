#include "handlers.hpp"
#include "errors.hpp"
#include "expression.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

std::string render_text(const std::string& text, const nlohmann::json& scope) {
    if (text.empty()) return text;
    return Template::parse(text).render(scope);
}

// Rendered configuration from a template step output, or the raw value
nlohmann::json config_payload(const nlohmann::json& source) {
    if (source.is_object() && source.contains("rendered_config")) {
        return source["rendered_config"];
    }
    return source;
}

nlohmann::json as_structured(const nlohmann::json& payload) {
    if (!payload.is_string()) return payload;
    auto parsed = nlohmann::json::parse(payload.get<std::string>(), nullptr, false);
    return parsed.is_discarded() ? payload : parsed;
}

struct RollbackResult {
    bool attempted = false;
    bool restored = false;
    std::string message;

    nlohmann::json to_json() const {
        return {{"attempted", attempted}, {"restored", restored}, {"message", message}};
    }
};

}

RemediateHandler::RemediateHandler(const Config& config) : config_(config) {}

StepOutcome RemediateHandler::execute(const StepContext& context) {
    const auto& spec = payload_of<RemediateSpec>(context.step);
    const auto& device = context.device;
    bool model_path = config_.uses_model_path(device.vendor);

    auto payload = config_payload(resolve_reference(spec.config_source, context.scope));

    nlohmann::json vendor_fields = nlohmann::json::object();
    if (const auto* fields = for_vendor(spec.vendor_specific, device.vendor)) {
        vendor_fields = render_value(*fields, context.scope);
    }

    ConfigEdit edit;
    edit.commit = spec.commit;
    edit.commit_comment = render_text(spec.commit_comment, context.scope);

    if (model_path) {
        if (!vendor_fields.contains("operations") || !vendor_fields["operations"].is_array()) {
            return StepOutcome::failure(
                fmt::format("no operations configured for vendor '{}'", device.vendor), false);
        }
        for (const auto& entry : vendor_fields["operations"]) {
            if (!entry.is_object() || !entry.contains("path")) {
                return StepOutcome::failure("model-path operation requires a path", false);
            }
            EditOperation op;
            op.op = entry.value("op", "update");
            op.path = entry["path"].get<std::string>();
            op.value = entry.contains("value") ? entry["value"] : as_structured(payload);
            edit.operations.push_back(std::move(op));
        }
    } else {
        if (vendor_fields.contains("config") && vendor_fields["config"].is_string()) {
            edit.xml_config = vendor_fields["config"].get<std::string>();
        } else if (payload.is_string()) {
            edit.xml_config = payload.get<std::string>();
        } else {
            return StepOutcome::failure(
                fmt::format("config_source '{}' did not resolve to configuration text", spec.config_source), false);
        }
        edit.target = vendor_fields.value("target", std::string("candidate"));
        edit.default_operation = vendor_fields.value("operation", std::string("merge"));
    }

    Selector capture;
    capture.path = render_text(spec.capture_path, context.scope);
    capture.xml_filter = render_text(spec.capture_filter_xml, context.scope);
    std::optional<FetchResult> captured;
    if (!capture.empty()) {
        captured = context.session.fetch_within(capture, context.deadline);
    }

    auto rollback = [&]() {
        RollbackResult result;
        if (!spec.rollback_on_error || !captured) return result;
        result.attempted = true;

        ConfigEdit restore;
        restore.target = edit.target;
        restore.commit = true;
        restore.commit_comment = fmt::format("rollback of {}", context.step.name);
        if (model_path) {
            EditOperation op;
            op.path = capture.path;
            if (captured->found) {
                op.op = "replace";
                op.value = captured->value;
            } else {
                op.op = "delete";
            }
            restore.operations.push_back(std::move(op));
        } else if (captured->found && !captured->raw.empty()) {
            restore.xml_config = captured->raw;
            restore.default_operation = "replace";
        } else {
            result.message = "nothing captured to restore";
            return result;
        }

        try {
            auto pushed = context.session.push_within(restore, context.deadline);
            result.restored = pushed.applied && pushed.committed;
            result.message = pushed.message;
        } catch (const ConnectorError& e) {
            result.message = e.what();
        }
        spdlog::warn("[{}] rollback of step {}: {}", device.id, context.step.name,
                     result.restored ? "restored" : "failed: " + result.message);
        return result;
    };

    PushResult pushed;
    try {
        pushed = context.session.push_within(edit, context.deadline);
    } catch (const ConnectorError& e) {
        auto rolled = rollback();
        if (!rolled.attempted) throw;
        return StepOutcome::failure(std::string("push failed: ") + e.what(), e.transient(),
                                    {{"applied", false}, {"committed", false}, {"rollback", rolled.to_json()}});
    }

    nlohmann::json output = {
        {"applied", pushed.applied},
        {"committed", pushed.committed},
        {"message", pushed.message},
        {"captured", captured ? captured->found : false}
    };

    if (!pushed.applied) {
        return StepOutcome::failure("configuration rejected: " + pushed.message, false, output);
    }
    if (edit.commit && !pushed.committed) {
        auto rolled = rollback();
        output["rollback"] = rolled.to_json();
        return StepOutcome::failure("commit failed: " + pushed.message, false, output);
    }
    return StepOutcome::success(std::move(output), pushed.message);
}
