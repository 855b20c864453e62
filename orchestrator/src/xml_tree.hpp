#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include <pugixml.hpp>

// Conversion between NETCONF XML payloads and the vendor-neutral tree.
namespace xml_tree {

// Parses a document; returns false with a description on malformed input
bool parse(const std::string& xml, pugi::xml_document& out, std::string& error);

// Child elements of a node as an object. Namespace prefixes are stripped,
// repeated siblings become arrays, text-only elements become strings and
// empty elements become "".
nlohmann::json children_to_tree(const pugi::xml_node& node);

// Value of a single element under the same rules
nlohmann::json element_to_tree(const pugi::xml_node& node);

// Serialized children of a node, without the node itself
std::string inner_xml(const pugi::xml_node& node);

// A subtree-filter fragment (one or more sibling elements) as a filter
// suitable for tree::narrow. Throws std::invalid_argument on malformed XML.
nlohmann::json fragment_to_filter(const std::string& fragment);

std::string escape(const std::string& text);

} // namespace xml_tree
