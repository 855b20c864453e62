#include "xml_tree.hpp"
#include "tree.hpp"
#include "util.hpp"
#include <stdexcept>

namespace xml_tree {

namespace {

struct StringWriter : pugi::xml_writer {
    std::string s;

    void write(const void* data, size_t size) override {
        if (data && size > 0) {
            s.append(static_cast<const char*>(data), size);
        }
    }
};

bool has_element_children(const pugi::xml_node& node) {
    for (auto child : node.children()) {
        if (child.type() == pugi::node_element) return true;
    }
    return false;
}

} // namespace

bool parse(const std::string& xml, pugi::xml_document& out, std::string& error) {
    unsigned int flags = pugi::parse_default & ~pugi::parse_doctype & ~pugi::parse_comments;
    auto res = out.load_buffer(xml.data(), xml.size(), flags, pugi::encoding_utf8);
    if (!res) {
        error = std::string(res.description()) + " at offset " + std::to_string(res.offset);
        return false;
    }
    return true;
}

nlohmann::json element_to_tree(const pugi::xml_node& node) {
    if (!has_element_children(node)) {
        return util::trim(node.text().get());
    }
    return children_to_tree(node);
}

nlohmann::json children_to_tree(const pugi::xml_node& node) {
    nlohmann::json obj = nlohmann::json::object();
    for (auto child : node.children()) {
        if (child.type() != pugi::node_element) continue;

        auto key = tree::local_name(child.name());
        auto value = element_to_tree(child);
        auto it = obj.find(key);
        if (it == obj.end()) {
            obj[key] = std::move(value);
        } else if (it->is_array()) {
            it->push_back(std::move(value));
        } else {
            nlohmann::json list = nlohmann::json::array();
            list.push_back(std::move(*it));
            list.push_back(std::move(value));
            *it = std::move(list);
        }
    }
    return obj;
}

std::string inner_xml(const pugi::xml_node& node) {
    StringWriter writer;
    for (auto child : node.children()) {
        child.print(writer, "", pugi::format_raw | pugi::format_no_declaration, pugi::encoding_utf8);
    }
    return writer.s;
}

nlohmann::json fragment_to_filter(const std::string& fragment) {
    pugi::xml_document doc;
    std::string error;
    if (!parse("<filter-root>" + fragment + "</filter-root>", doc, error)) {
        throw std::invalid_argument("malformed filter_xml: " + error);
    }
    return children_to_tree(doc.child("filter-root"));
}

std::string escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += c;        break;
        }
    }
    return out;
}

} // namespace xml_tree
