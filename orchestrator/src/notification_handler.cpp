#include "handlers.hpp"
#include "expression.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

NotificationHandler::NotificationHandler(NotificationDispatcher& dispatcher) : dispatcher_(dispatcher) {}

StepOutcome NotificationHandler::execute(const StepContext& context) {
    const auto& spec = payload_of<NotificationSpec>(context.step);

    Notification notification;
    notification.id = util::generate_uuid();
    notification.execution_id = context.execution_id;
    notification.workflow = context.workflow.id;
    notification.device_id = context.device.id;
    notification.message = Template::parse(spec.message).render(context.scope);
    notification.subject = spec.subject.empty() ? "" : Template::parse(spec.subject).render(context.scope);
    notification.severity = spec.severity;
    notification.channels = spec.channels;
    notification.created_at = std::chrono::system_clock::now();

    bool queued = dispatcher_.enqueue(notification);
    if (!queued) {
        spdlog::warn("[{}] notification for step {} was not queued", context.execution_id, context.step.name);
    }

    return StepOutcome::success({
        {"queued", queued},
        {"channels", notification.channels},
        {"message", notification.message}
    });
}
