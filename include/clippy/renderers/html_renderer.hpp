#pragma once

#include "clippy/core/content.hpp"
#include <string>
#include <string_view>

namespace clippy {

struct HtmlRenderConfig {
    bool include_ids = false;            // id="..." on blocks and list items
    bool clean_output = true;            // trim surrounding whitespace
    bool use_semantic_elements = true;   // strong/em/del instead of b/i/s
};

auto render_html(const ClippyContent& content, const HtmlRenderConfig& config = {}) -> std::string;

auto render_block_html(const ContentBlock& block, const HtmlRenderConfig& config = {})
    -> std::string;

auto render_inline_html(const InlineSequence& content, const HtmlRenderConfig& config = {})
    -> std::string;

// Escapes & < > " '
auto escape_html(std::string_view text) -> std::string;

// Tag-free single-line preview of one block
auto render_block_preview(const ContentBlock& block, size_t max_length = 100) -> std::string;

} // namespace clippy
