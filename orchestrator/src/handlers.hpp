#pragma once

#include "config.hpp"
#include "http_client.hpp"
#include "notification.hpp"
#include "step_handler.hpp"
#include <memory>
#include <string>

class QueryHandler : public StepHandler {
public:
    StepType type() const override { return StepType::Query; }
    StepOutcome execute(const StepContext& context) override;
};

class TemplateHandler : public StepHandler {
public:
    explicit TemplateHandler(std::string template_dir);
    StepType type() const override { return StepType::Template; }
    StepOutcome execute(const StepContext& context) override;

private:
    std::string load_file(const std::string& name) const;

    std::string template_dir_;
};

class AuditHandler : public StepHandler {
public:
    StepType type() const override { return StepType::Audit; }
    StepOutcome execute(const StepContext& context) override;
};

class RemediateHandler : public StepHandler {
public:
    explicit RemediateHandler(const Config& config);
    StepType type() const override { return StepType::Remediate; }
    StepOutcome execute(const StepContext& context) override;

private:
    const Config& config_;
};

class TransformHandler : public StepHandler {
public:
    StepType type() const override { return StepType::Transform; }
    StepOutcome execute(const StepContext& context) override;
};

class ApiCallHandler : public StepHandler {
public:
    explicit ApiCallHandler(std::shared_ptr<HttpClient> http);
    StepType type() const override { return StepType::ApiCall; }
    StepOutcome execute(const StepContext& context) override;

private:
    std::shared_ptr<HttpClient> http_;
};

class NotificationHandler : public StepHandler {
public:
    explicit NotificationHandler(NotificationDispatcher& dispatcher);
    StepType type() const override { return StepType::Notification; }
    StepOutcome execute(const StepContext& context) override;

private:
    NotificationDispatcher& dispatcher_;
};

// Registry with every step type wired to its production handler
std::unique_ptr<HandlerRegistry> make_default_handlers(const Config& config,
                                                       std::shared_ptr<HttpClient> http,
                                                       NotificationDispatcher& dispatcher);
