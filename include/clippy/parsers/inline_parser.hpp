#pragma once

#include "clippy/core/content.hpp"
#include "clippy/core/limits.hpp"
#include "clippy/interfaces.hpp"
#include <libxml/tree.h>
#include <span>
#include <string_view>

namespace clippy {

struct InlineParseOptions {
    bool preserve_whitespace = false;
    bool merge_adjacent_text = true;
    bool validate_urls = true;
    size_t max_url_length = ContentLimits{}.max_url_length;
    size_t max_text_length = ContentLimits{}.max_text_length;
    ILogger* logger = nullptr;  // nullptr logs to default_logger()
};

// Turns inline markup into a sequence of text spans, links and line breaks.
// Formatting elements (b, em, code, ...) and style declarations push their
// flags for the subtree; every emitted span carries the formatting that was
// active for its text.
class InlineParser {
public:
    explicit InlineParser(InlineParseOptions options = {});

    auto parse(std::string_view fragment) const -> InlineSequence;

    // Inline content of an element's children
    auto parse_children(const xmlNode* element) const -> InlineSequence;

    // Inline content of a run of sibling nodes
    auto parse_nodes(std::span<xmlNode* const> nodes) const -> InlineSequence;

    auto options() const -> const InlineParseOptions& { return options_; }

private:
    InlineParseOptions options_;
};

auto parse_inline(std::string_view fragment, const InlineParseOptions& options = {})
    -> InlineSequence;

// Formatting expressed by a CSS declaration list such as
// "font-weight: 700; text-decoration: underline"
auto formatting_from_style(std::string_view style) -> Formatting;

// Formatting implied by an element name (b, strong, em, code, ...)
auto formatting_from_tag(std::string_view tag) -> Formatting;

} // namespace clippy