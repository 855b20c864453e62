#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Restricted expression language used by step conditions, templates and
// transforms: literals, dotted variable lookup, comparisons (== != < <= > >=),
// membership (in, not in, contains), boolean ops (and or not) and a fixed
// set of filters (lower upper trim length default join tojson string
// number int first last keys replace split).
class Expression {
public:
    Expression();

    // Throws DefinitionError on malformed input
    static Expression parse(const std::string& source);

    nlohmann::json evaluate(const nlohmann::json& scope) const;
    bool test(const nlohmann::json& scope) const;

    const std::string& source() const { return source_; }

    struct Node;

private:
    std::string source_;
    std::shared_ptr<const Node> root_;
};

// Text template with {{ expr }}, {% if %}/{% elif %}/{% else %}/{% endif %},
// {% for x in expr %}/{% endfor %} and {# comments #}. A '-' inside a tag
// delimiter trims the adjacent whitespace.
class Template {
public:
    Template();

    // Throws DefinitionError on malformed input
    static Template parse(const std::string& text);

    static bool has_markup(const std::string& text);

    std::string render(const nlohmann::json& scope) const;

    struct Node;

private:
    std::shared_ptr<const std::vector<Node>> nodes_;
};

// A step condition. Either a bare expression ("result.passed == false") or a
// template whose rendering is read as a boolean ("{{ result.passed }}").
class Condition {
public:
    static Condition parse(const std::string& source);

    bool evaluate(const nlohmann::json& scope) const;

    const std::string& source() const { return source_; }

private:
    std::string source_;
    bool templated_ = false;
    Expression expression_;
    Template template_;
};

// Renders every string inside a JSON value as a template. A string that is
// exactly one "{{ expr }}" keeps the expression's JSON type.
nlohmann::json render_value(const nlohmann::json& value, const nlohmann::json& scope);

// Throws DefinitionError if any string inside the value is a malformed template
void validate_templates(const nlohmann::json& value);
