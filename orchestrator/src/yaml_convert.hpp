#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

// Plain scalars are typed (null, bool, int, float); quoted scalars stay strings
nlohmann::json yaml_to_json(const YAML::Node& node);

// Parses a YAML (or JSON) document. Throws DefinitionError on syntax errors.
nlohmann::json load_yaml_document(const std::string& text);
