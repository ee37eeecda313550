#pragma once

#include "clippy/core/content.hpp"
#include <string>

namespace clippy {

// Visible text of the document: blocks separated by a blank line, list items
// as "• " lines, links as their text, code verbatim
auto render_plain_text(const ClippyContent& content) -> std::string;

auto render_block_text(const ContentBlock& block) -> std::string;

// Single-line preview cut to max_length bytes, with "..." when cut
auto render_preview(const ClippyContent& content, size_t max_length = 100) -> std::string;

// Collapses whitespace and cuts to max_length bytes, appending "..." when cut
auto preview_line(std::string_view text, size_t max_length) -> std::string;

} // namespace clippy
