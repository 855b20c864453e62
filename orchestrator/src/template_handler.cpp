#include "handlers.hpp"
#include "errors.hpp"
#include "expression.hpp"
#include <fstream>
#include <sstream>
#include <fmt/format.h>

TemplateHandler::TemplateHandler(std::string template_dir) : template_dir_(std::move(template_dir)) {}

std::string TemplateHandler::load_file(const std::string& name) const {
    if (name.find("..") != std::string::npos || (!name.empty() && name.front() == '/')) {
        throw StepFailure(fmt::format("template_file '{}' is outside the template directory", name), false);
    }
    auto path = template_dir_ + "/" + name;
    std::ifstream in(path);
    if (!in) {
        throw StepFailure(fmt::format("template_file '{}' not found in {}", name, template_dir_), false);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

StepOutcome TemplateHandler::execute(const StepContext& context) {
    const auto& spec = payload_of<TemplateSpec>(context.step);

    std::string text;
    if (const auto* vendor_text = for_vendor(spec.vendor_templates, context.device.vendor)) {
        text = *vendor_text;
    } else if (!spec.inline_template.empty()) {
        text = spec.inline_template;
    } else if (!spec.template_file.empty()) {
        text = load_file(spec.template_file);
    } else {
        return StepOutcome::failure(fmt::format("no template for vendor '{}'", context.device.vendor), false);
    }

    nlohmann::json scope = context.scope;
    auto vars = render_value(spec.template_vars, context.scope);
    for (auto it = vars.begin(); it != vars.end(); ++it) {
        scope[it.key()] = it.value();
    }

    std::string rendered;
    try {
        rendered = Template::parse(text).render(scope);
    } catch (const DefinitionError& e) {
        return StepOutcome::failure(std::string("template error: ") + e.what(), false);
    }

    nlohmann::json output = {{"rendered_config", rendered}, {"format", spec.format}};
    if (spec.format == "json") {
        try {
            output["data"] = nlohmann::json::parse(rendered);
        } catch (const nlohmann::json::parse_error& e) {
            return StepOutcome::failure(std::string("rendered template is not valid JSON: ") + e.what(), false, output);
        }
    }
    return StepOutcome::success(std::move(output));
}
