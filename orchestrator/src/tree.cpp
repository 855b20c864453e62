#include "tree.hpp"
#include "util.hpp"

namespace tree {

std::string dump(const nlohmann::json& value, int indent) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string canonical_string(const nlohmann::json& value) {
    if (value.is_null()) return "";
    if (value.is_string()) return value.get<std::string>();
    return dump(value);
}

bool is_empty_value(const nlohmann::json& value) {
    if (value.is_null()) return true;
    if (value.is_string()) return util::trim(value.get<std::string>()).empty();
    if (value.is_object() || value.is_array()) return value.empty();
    return false;
}

bool is_truthy(const nlohmann::json& value) {
    if (value.is_null()) return false;
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) return value.get<double>() != 0.0;
    if (value.is_string()) {
        auto s = util::to_lower(util::trim(value.get<std::string>()));
        return !(s.empty() || s == "false" || s == "0" || s == "no" || s == "none");
    }
    return !value.empty();
}

const nlohmann::json* lookup(const nlohmann::json& root, const std::string& dotted) {
    const nlohmann::json* current = &root;
    std::string token;
    size_t i = 0;

    auto step_into = [&](const std::string& key) -> bool {
        if (key.empty()) return true;
        if (current->is_object()) {
            auto it = current->find(key);
            if (it == current->end()) return false;
            current = &(*it);
            return true;
        }
        if (current->is_array()) {
            double index = 0;
            if (!util::parse_number(key, index) || index < 0 ||
                static_cast<size_t>(index) >= current->size()) {
                return false;
            }
            current = &(*current)[static_cast<size_t>(index)];
            return true;
        }
        return false;
    };

    while (i <= dotted.size()) {
        char c = i < dotted.size() ? dotted[i] : '.';
        if (c == '.') {
            if (!step_into(token)) return nullptr;
            token.clear();
        } else if (c == '[') {
            if (!step_into(token)) return nullptr;
            token.clear();
            auto close = dotted.find(']', i);
            if (close == std::string::npos) return nullptr;
            auto index = dotted.substr(i + 1, close - i - 1);
            if (index.size() >= 2 && (index.front() == '\'' || index.front() == '"')) {
                index = index.substr(1, index.size() - 2);
            }
            if (!step_into(index)) return nullptr;
            i = close;
        } else {
            token += c;
        }
        ++i;
    }
    return current;
}

std::string local_name(const std::string& name) {
    auto colon = name.rfind(':');
    return colon == std::string::npos ? name : name.substr(colon + 1);
}

std::vector<std::string> path_steps(const std::string& path) {
    std::vector<std::string> steps;
    std::string current;
    int bracket_depth = 0;
    char quote = 0;

    auto flush = [&]() {
        auto step = util::trim(current);
        current.clear();
        // RESTCONF list keys: "interface=eth0"
        auto eq = step.find('=');
        if (eq != std::string::npos) step = step.substr(0, eq);
        step = local_name(step);
        if (!step.empty() && step != "." && step != "*") {
            steps.push_back(step);
        }
    };

    for (char c : path) {
        if (quote) {
            if (c == quote) quote = 0;
            continue;
        }
        if (bracket_depth > 0) {
            if (c == '\'' || c == '"') quote = c;
            else if (c == '[') ++bracket_depth;
            else if (c == ']') --bracket_depth;
            continue;
        }
        if (c == '[') {
            ++bracket_depth;
        } else if (c == '/') {
            flush();
        } else {
            current += c;
        }
    }
    flush();
    return steps;
}

std::optional<nlohmann::json> descend(const nlohmann::json& root, const std::vector<std::string>& steps) {
    const nlohmann::json* current = &root;
    for (const auto& step : steps) {
        if (!current->is_object()) return std::nullopt;
        auto it = current->find(step);
        if (it == current->end()) {
            // Module-qualified keys: "openconfig-system:ssh-server"
            bool found = false;
            for (auto jt = current->begin(); jt != current->end(); ++jt) {
                if (local_name(jt.key()) == step) {
                    current = &jt.value();
                    found = true;
                    break;
                }
            }
            if (!found) return std::nullopt;
        } else {
            current = &(*it);
        }
    }
    return *current;
}

namespace {

bool is_presence(const nlohmann::json& f) {
    return f.is_null() || (f.is_string() && f.get<std::string>().empty()) ||
           (f.is_object() && f.empty());
}

const nlohmann::json* find_key(const nlohmann::json& obj, const std::string& key) {
    auto it = obj.find(key);
    if (it != obj.end()) return &(*it);
    for (auto jt = obj.begin(); jt != obj.end(); ++jt) {
        if (local_name(jt.key()) == local_name(key)) return &jt.value();
    }
    return nullptr;
}

std::optional<nlohmann::json> narrow_object(const nlohmann::json& value, const nlohmann::json& filter) {
    nlohmann::json result = nlohmann::json::object();

    // Content matches select the entry as a whole; evaluate them first
    for (auto it = filter.begin(); it != filter.end(); ++it) {
        const auto& f = it.value();
        if (is_presence(f) || f.is_object()) continue;
        const auto* v = find_key(value, it.key());
        if (!v || canonical_string(*v) != canonical_string(f)) {
            return std::nullopt;
        }
        result[it.key()] = *v;
    }

    bool selected_any = !result.empty();
    for (auto it = filter.begin(); it != filter.end(); ++it) {
        const auto& f = it.value();
        const auto* v = find_key(value, it.key());
        if (!v) continue;
        if (is_presence(f)) {
            result[it.key()] = *v;
            selected_any = true;
        } else if (f.is_object()) {
            auto sub = narrow(*v, f);
            if (sub) {
                result[it.key()] = *sub;
                selected_any = true;
            }
        }
    }

    if (!selected_any) return std::nullopt;
    return result;
}

} // namespace

std::optional<nlohmann::json> narrow(const nlohmann::json& value, const nlohmann::json& filter) {
    if (is_presence(filter)) return value;
    if (!filter.is_object()) {
        if (canonical_string(value) == canonical_string(filter)) return value;
        return std::nullopt;
    }

    if (value.is_array()) {
        nlohmann::json kept = nlohmann::json::array();
        for (const auto& item : value) {
            auto sub = narrow(item, filter);
            if (sub) kept.push_back(*sub);
        }
        if (kept.empty()) return std::nullopt;
        return kept;
    }

    if (value.is_object()) {
        return narrow_object(value, filter);
    }

    return std::nullopt;
}

} // namespace tree
