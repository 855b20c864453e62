#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Helpers over the vendor-neutral tree every connector returns.
namespace tree {

// Serialized JSON. Device data is not always valid UTF-8; bad bytes become U+FFFD.
std::string dump(const nlohmann::json& value, int indent = -1);

// Strings as-is, null as "", numbers/bools as JSON text, containers as compact JSON
std::string canonical_string(const nlohmann::json& value);

// Null, blank strings and empty containers
bool is_empty_value(const nlohmann::json& value);

// Truthiness used by conditions and transform filters
bool is_truthy(const nlohmann::json& value);

// Dotted lookup with optional indices: "bgp.neighbors[0].state"
const nlohmann::json* lookup(const nlohmann::json& root, const std::string& dotted);

// Splits an xpath or structured path into element names, dropping
// namespace prefixes, predicates and list keys
std::vector<std::string> path_steps(const std::string& path);

// Removes a "prefix:" from a name
std::string local_name(const std::string& name);

// Follows the steps from the root when every step is present
std::optional<nlohmann::json> descend(const nlohmann::json& root, const std::vector<std::string>& steps);

// Keeps only what the filter selects. An empty filter keeps everything;
// "" or {} is a presence match; a scalar is a content match that selects
// list entries; a nested object recurses. Returns nullopt when nothing
// remains.
std::optional<nlohmann::json> narrow(const nlohmann::json& value, const nlohmann::json& filter);

} // namespace tree
