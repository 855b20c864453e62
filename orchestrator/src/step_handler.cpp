#include "step_handler.hpp"
#include "handlers.hpp"

StepOutcome StepOutcome::success(nlohmann::json output, std::string message) {
    StepOutcome outcome;
    outcome.completed = true;
    outcome.output = std::move(output);
    outcome.message = std::move(message);
    return outcome;
}

StepOutcome StepOutcome::failure(std::string message, bool retryable, nlohmann::json output) {
    StepOutcome outcome;
    outcome.completed = false;
    outcome.message = std::move(message);
    outcome.retryable = retryable;
    outcome.output = std::move(output);
    return outcome;
}

Selector make_selector(const nlohmann::json& fields) {
    Selector selector;
    if (!fields.is_object()) return selector;
    if (fields.contains("path") && fields["path"].is_string()) {
        selector.path = fields["path"].get<std::string>();
    }
    if (fields.contains("filter_xml") && fields["filter_xml"].is_string()) {
        selector.xml_filter = fields["filter_xml"].get<std::string>();
    }
    if (fields.contains("filter") && fields["filter"].is_object()) {
        selector.filter = fields["filter"];
    }
    return selector;
}

void HandlerRegistry::add(std::unique_ptr<StepHandler> handler) {
    auto type = handler->type();
    handlers_[type] = std::move(handler);
}

StepHandler* HandlerRegistry::find(StepType type) const {
    auto it = handlers_.find(type);
    return it == handlers_.end() ? nullptr : it->second.get();
}

std::unique_ptr<HandlerRegistry> make_default_handlers(const Config& config,
                                                       std::shared_ptr<HttpClient> http,
                                                       NotificationDispatcher& dispatcher) {
    auto registry = std::make_unique<HandlerRegistry>();
    registry->add(std::make_unique<QueryHandler>());
    registry->add(std::make_unique<TemplateHandler>(config.template_dir));
    registry->add(std::make_unique<AuditHandler>());
    registry->add(std::make_unique<RemediateHandler>(config));
    registry->add(std::make_unique<TransformHandler>());
    registry->add(std::make_unique<ApiCallHandler>(std::move(http)));
    registry->add(std::make_unique<NotificationHandler>(dispatcher));
    return registry;
}
