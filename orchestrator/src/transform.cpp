#include "transform.hpp"
#include "errors.hpp"
#include "expression.hpp"
#include "pattern.hpp"
#include "tree.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <set>
#include <fmt/format.h>

namespace {

const std::set<std::string> kOperations = {
    "get", "keys", "values", "count", "filter", "map", "object", "pluck", "sort", "unique",
    "join", "split", "lines", "sum", "min", "max", "first", "last", "default",
    "trim", "lower", "upper", "to_number", "regex_extract"
};

struct Operation {
    std::string name;
    nlohmann::json args = nlohmann::json::object();
};

Operation read_operation(const nlohmann::json& item) {
    Operation op;
    if (item.is_string()) {
        op.name = item.get<std::string>();
    } else if (item.is_object() && item.contains("op") && item["op"].is_string()) {
        op.name = item["op"].get<std::string>();
        op.args = item;
    } else {
        throw DefinitionError("transform operation must be a name or a mapping with 'op'");
    }
    op.name = util::to_lower(op.name);
    return op;
}

std::string arg_string(const Operation& op, const char* key, const std::string& fallback = "") {
    if (!op.args.contains(key) || op.args[key].is_null()) return fallback;
    return tree::canonical_string(op.args[key]);
}

[[noreturn]] void not_applicable(const Operation& op, const nlohmann::json& value) {
    throw StepFailure(fmt::format("transform '{}' does not apply to {}", op.name, value.type_name()), false);
}

bool to_number(const nlohmann::json& v, double& out) {
    if (v.is_number()) {
        out = v.get<double>();
        return true;
    }
    return v.is_string() && util::parse_number(util::trim(v.get<std::string>()), out);
}

nlohmann::json number_json(double n) {
    if (std::floor(n) == n && std::abs(n) < 9.0e15) {
        return static_cast<long long>(n);
    }
    return n;
}

nlohmann::json item_scope(const nlohmann::json& scope, const nlohmann::json& item, size_t index) {
    nlohmann::json local = scope.is_object() ? scope : nlohmann::json::object();
    local["item"] = item;
    local["index"] = index;
    return local;
}

nlohmann::json as_list(const Operation& op, const nlohmann::json& value) {
    if (value.is_array()) return value;
    if (value.is_object()) {
        nlohmann::json list = nlohmann::json::array();
        for (auto it = value.begin(); it != value.end(); ++it) list.push_back(it.value());
        return list;
    }
    not_applicable(op, value);
}

nlohmann::json map_strings(const nlohmann::json& value, const std::function<std::string(const std::string&)>& fn) {
    if (value.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : value) out.push_back(map_strings(item, fn));
        return out;
    }
    if (value.is_null()) return value;
    return fn(tree::canonical_string(value));
}

nlohmann::json extract(const Pattern& re, int group, const nlohmann::json& value) {
    auto match = re.extract(tree::canonical_string(value), group);
    if (!match) return nullptr;
    return *match;
}

nlohmann::json apply_one(const Operation& op, const nlohmann::json& value, const nlohmann::json& scope) {
    const auto& name = op.name;

    if (name == "get") {
        const auto* found = tree::lookup(value, arg_string(op, "path"));
        return found ? *found : nlohmann::json(nullptr);
    }
    if (name == "keys") {
        if (!value.is_object()) not_applicable(op, value);
        nlohmann::json keys = nlohmann::json::array();
        for (auto it = value.begin(); it != value.end(); ++it) keys.push_back(it.key());
        return keys;
    }
    if (name == "values") {
        return as_list(op, value);
    }
    if (name == "count") {
        if (value.is_array() || value.is_object()) return value.size();
        if (value.is_null()) return 0;
        return tree::canonical_string(value).size();
    }
    if (name == "filter" || name == "map") {
        auto expr = Expression::parse(arg_string(op, "expr"));
        auto list = as_list(op, value);
        nlohmann::json out = nlohmann::json::array();
        for (size_t i = 0; i < list.size(); ++i) {
            auto local = item_scope(scope, list[i], i);
            if (name == "filter") {
                if (expr.test(local)) out.push_back(list[i]);
            } else {
                out.push_back(expr.evaluate(local));
            }
        }
        return out;
    }
    if (name == "object") {
        auto build = [&](const nlohmann::json& item, size_t index) {
            auto local = item_scope(scope, item, index);
            nlohmann::json obj = nlohmann::json::object();
            for (auto it = op.args["fields"].begin(); it != op.args["fields"].end(); ++it) {
                obj[it.key()] = Expression::parse(tree::canonical_string(it.value())).evaluate(local);
            }
            return obj;
        };
        if (value.is_array()) {
            nlohmann::json out = nlohmann::json::array();
            for (size_t i = 0; i < value.size(); ++i) out.push_back(build(value[i], i));
            return out;
        }
        return build(value, 0);
    }
    if (name == "pluck") {
        auto field = arg_string(op, "field");
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : as_list(op, value)) {
            const auto* found = tree::lookup(item, field);
            out.push_back(found ? *found : nlohmann::json(nullptr));
        }
        return out;
    }
    if (name == "sort") {
        if (!value.is_array()) not_applicable(op, value);
        auto by = arg_string(op, "by");
        bool reverse = op.args.value("reverse", false);
        std::vector<nlohmann::json> items(value.begin(), value.end());
        auto key = [&](const nlohmann::json& item) -> nlohmann::json {
            if (by.empty()) return item;
            const auto* found = tree::lookup(item, by);
            return found ? *found : nlohmann::json(nullptr);
        };
        std::stable_sort(items.begin(), items.end(), [&](const nlohmann::json& a, const nlohmann::json& b) {
            auto ka = key(a);
            auto kb = key(b);
            double x = 0, y = 0;
            if (to_number(ka, x) && to_number(kb, y)) return x < y;
            return tree::canonical_string(ka) < tree::canonical_string(kb);
        });
        if (reverse) std::reverse(items.begin(), items.end());
        return nlohmann::json(items);
    }
    if (name == "unique") {
        if (!value.is_array()) not_applicable(op, value);
        nlohmann::json out = nlohmann::json::array();
        std::set<std::string> seen;
        for (const auto& item : value) {
            if (seen.insert(tree::dump(item)).second) out.push_back(item);
        }
        return out;
    }
    if (name == "join") {
        if (!value.is_array()) not_applicable(op, value);
        std::vector<std::string> parts;
        for (const auto& item : value) parts.push_back(tree::canonical_string(item));
        return util::join(parts, arg_string(op, "separator", ","));
    }
    if (name == "split" || name == "lines") {
        if (value.is_array() || value.is_object()) not_applicable(op, value);
        auto text = tree::canonical_string(value);
        nlohmann::json out = nlohmann::json::array();
        if (name == "lines") {
            for (auto& line : util::split_string(text, '\n')) {
                auto trimmed = util::trim(line);
                if (!trimmed.empty()) out.push_back(trimmed);
            }
            return out;
        }
        auto sep = arg_string(op, "separator", ",");
        size_t start = 0;
        size_t pos = 0;
        while (!sep.empty() && (pos = text.find(sep, start)) != std::string::npos) {
            out.push_back(text.substr(start, pos - start));
            start = pos + sep.size();
        }
        out.push_back(text.substr(start));
        return out;
    }
    if (name == "sum" || name == "min" || name == "max") {
        auto list = as_list(op, value);
        std::vector<double> numbers;
        for (const auto& item : list) {
            double n = 0;
            if (to_number(item, n)) numbers.push_back(n);
        }
        if (name == "sum") {
            double total = 0;
            for (double n : numbers) total += n;
            return number_json(total);
        }
        if (numbers.empty()) return nullptr;
        return number_json(name == "min" ? *std::min_element(numbers.begin(), numbers.end())
                                         : *std::max_element(numbers.begin(), numbers.end()));
    }
    if (name == "first" || name == "last") {
        if (!value.is_array()) not_applicable(op, value);
        if (value.empty()) return nullptr;
        return name == "first" ? value.front() : value.back();
    }
    if (name == "default") {
        return tree::is_empty_value(value) ? op.args.value("value", nlohmann::json()) : value;
    }
    if (name == "trim") return map_strings(value, [](const std::string& s) { return util::trim(s); });
    if (name == "lower") return map_strings(value, [](const std::string& s) { return util::to_lower(s); });
    if (name == "upper") return map_strings(value, [](const std::string& s) { return util::to_upper(s); });
    if (name == "to_number") {
        if (value.is_array()) {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& item : value) {
                double n = 0;
                out.push_back(to_number(item, n) ? number_json(n) : nlohmann::json(nullptr));
            }
            return out;
        }
        double n = 0;
        if (!to_number(value, n)) {
            throw StepFailure(fmt::format("transform 'to_number': '{}' is not numeric",
                                          tree::canonical_string(value)), false);
        }
        return number_json(n);
    }
    if (name == "regex_extract") {
        Pattern re(arg_string(op, "pattern"), false);
        int group = op.args.value("group", 0);
        if (value.is_array()) {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& item : value) {
                auto m = extract(re, group, item);
                if (!m.is_null()) out.push_back(m);
            }
            return out;
        }
        return extract(re, group, value);
    }

    throw StepFailure("unknown transform operation '" + name + "'", false);
}

} // namespace

void validate_transform(const nlohmann::json& operations) {
    if (!operations.is_array()) {
        throw DefinitionError("transform operations must be a list");
    }
    for (const auto& item : operations) {
        auto op = read_operation(item);
        if (kOperations.count(op.name) == 0) {
            throw DefinitionError("unknown transform operation '" + op.name + "'");
        }
        if (op.name == "filter" || op.name == "map") {
            if (arg_string(op, "expr").empty()) {
                throw DefinitionError(fmt::format("transform '{}' needs expr", op.name));
            }
            Expression::parse(arg_string(op, "expr"));
        } else if (op.name == "object") {
            if (!op.args.contains("fields") || !op.args["fields"].is_object() || op.args["fields"].empty()) {
                throw DefinitionError("transform 'object' needs a fields mapping");
            }
            for (const auto& expr : op.args["fields"]) {
                Expression::parse(tree::canonical_string(expr));
            }
        } else if (op.name == "pluck" && arg_string(op, "field").empty()) {
            throw DefinitionError("transform 'pluck' needs field");
        } else if (op.name == "get" && arg_string(op, "path").empty()) {
            throw DefinitionError("transform 'get' needs path");
        } else if (op.name == "regex_extract") {
            try {
                Pattern re(arg_string(op, "pattern"), false);
            } catch (const DefinitionError& e) {
                throw DefinitionError(std::string("transform 'regex_extract' has an ") + e.what());
            }
        }
    }
}

nlohmann::json apply_transform(const nlohmann::json& input, const nlohmann::json& operations,
                               const nlohmann::json& scope) {
    nlohmann::json value = input;
    for (const auto& item : operations) {
        value = apply_one(read_operation(item), value, scope);
    }
    return value;
}
