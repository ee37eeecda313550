#include "clippy/parsers/html_tree.hpp"
#include "clippy/core/text_utils.hpp"
#include <libxml/parser.h>

namespace clippy::html {

namespace {

constexpr int PARSE_OPTIONS = HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING |
                              HTML_PARSE_NONET | HTML_PARSE_COMPACT;

auto ensure_parser_initialized() -> void {
    static const bool initialized = [] {
        xmlInitParser();
        return true;
    }();
    (void)initialized;
}

auto to_string(xmlChar* value) -> std::string {
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

auto find_element(xmlNode* node, std::string_view tag) -> xmlNode* {
    for (auto* current = node; current != nullptr; current = current->next) {
        if (is_element(current) && tag_name(current) == tag) {
            return current;
        }
        if (auto* found = find_element(current->children, tag)) {
            return found;
        }
    }
    return nullptr;
}

} // namespace

HtmlDocument::HtmlDocument(xmlDoc* doc) : doc_(doc) {}

auto HtmlDocument::parse(std::string_view markup) -> std::optional<HtmlDocument> {
    ensure_parser_initialized();

    std::string page = "<html><body>";
    page.append(markup);
    page.append("</body></html>");

    auto* doc = htmlReadMemory(page.data(), static_cast<int>(page.size()), nullptr, "UTF-8",
                               PARSE_OPTIONS);
    if (doc == nullptr) {
        return std::nullopt;
    }
    return HtmlDocument(doc);
}

auto HtmlDocument::body() const -> xmlNode* {
    return find_element(xmlDocGetRootElement(doc_.get()), "body");
}

auto is_element(const xmlNode* node) -> bool {
    return node != nullptr && node->type == XML_ELEMENT_NODE;
}

auto is_text(const xmlNode* node) -> bool {
    return node != nullptr &&
           (node->type == XML_TEXT_NODE || node->type == XML_CDATA_SECTION_NODE);
}

auto tag_name(const xmlNode* node) -> std::string {
    if (!is_element(node) || node->name == nullptr) {
        return "";
    }
    return text::to_lowercase(reinterpret_cast<const char*>(node->name));
}

auto attribute(const xmlNode* node, const char* name) -> std::optional<std::string> {
    if (!is_element(node)) {
        return std::nullopt;
    }
    auto* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (value == nullptr) {
        return std::nullopt;
    }
    return to_string(value);
}

auto text_content(const xmlNode* node) -> std::string {
    if (node == nullptr) {
        return "";
    }
    auto* content = xmlNodeGetContent(node);
    if (content == nullptr) {
        return "";
    }
    return to_string(content);
}

auto node_text(const xmlNode* node) -> std::string {
    if (!is_text(node) || node->content == nullptr) {
        return "";
    }
    return reinterpret_cast<const char*>(node->content);
}

auto child_nodes(const xmlNode* node) -> std::vector<xmlNode*> {
    std::vector<xmlNode*> children;
    if (node == nullptr) {
        return children;
    }
    for (auto* child = node->children; child != nullptr; child = child->next) {
        children.push_back(child);
    }
    return children;
}

auto first_child_element(const xmlNode* node, std::string_view tag) -> xmlNode* {
    for (auto* child : child_nodes(node)) {
        if (is_element(child) && tag_name(child) == tag) {
            return child;
        }
    }
    return nullptr;
}

} // namespace clippy::html