#pragma once

#include <libxml/HTMLparser.h>
#include <libxml/tree.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clippy::html {

// Owns a libxml2 HTML document built from a markup fragment.
// The fragment is parsed as the body of an otherwise empty page with the
// recovering parser, so malformed markup never fails the parse.
class HtmlDocument {
public:
    static auto parse(std::string_view markup) -> std::optional<HtmlDocument>;

    // The <body> element holding the fragment's top-level nodes
    auto body() const -> xmlNode*;

private:
    struct DocumentDeleter {
        auto operator()(xmlDoc* doc) const -> void { xmlFreeDoc(doc); }
    };

    explicit HtmlDocument(xmlDoc* doc);

    std::unique_ptr<xmlDoc, DocumentDeleter> doc_;
};

auto is_element(const xmlNode* node) -> bool;

// Text or CDATA
auto is_text(const xmlNode* node) -> bool;

// Lower-cased element name; empty for non-elements
auto tag_name(const xmlNode* node) -> std::string;

auto attribute(const xmlNode* node, const char* name) -> std::optional<std::string>;

// Concatenated text of the node and all its descendants
auto text_content(const xmlNode* node) -> std::string;

// Raw text of a text node
auto node_text(const xmlNode* node) -> std::string;

auto child_nodes(const xmlNode* node) -> std::vector<xmlNode*>;

// First direct child element with the given (lower-case) tag
auto first_child_element(const xmlNode* node, std::string_view tag) -> xmlNode*;

} // namespace clippy::html