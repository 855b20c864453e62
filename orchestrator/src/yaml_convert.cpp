#include "yaml_convert.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <charconv>

namespace {

nlohmann::json typed_scalar(const YAML::Node& node) {
    const auto& text = node.Scalar();
    if (node.Tag() == "!") {
        return text; // Quoted
    }

    if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return nullptr;
    }
    auto lower = util::to_lower(text);
    if (lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "no" || lower == "off") return false;

    long long integer = 0;
    auto [iptr, iec] = std::from_chars(text.data(), text.data() + text.size(), integer);
    if (iec == std::errc() && iptr == text.data() + text.size()) {
        return integer;
    }

    double number = 0.0;
    if (text.find_first_of(".eE") != std::string::npos && util::parse_number(text, number)) {
        return number;
    }
    return text;
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar:
            return typed_scalar(node);
        case YAML::NodeType::Sequence: {
            nlohmann::json list = nlohmann::json::array();
            for (const auto& item : node) {
                list.push_back(yaml_to_json(item));
            }
            return list;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& entry : node) {
                obj[entry.first.as<std::string>()] = yaml_to_json(entry.second);
            }
            return obj;
        }
    }
    return nullptr;
}

nlohmann::json load_yaml_document(const std::string& text) {
    try {
        return yaml_to_json(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw DefinitionError(std::string("Invalid YAML: ") + e.what());
    }
}
