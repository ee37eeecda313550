#pragma once

#include "clippy/core/content.hpp"
#include "clippy/interfaces.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace clippy {

enum class MarkdownFlavor {
    STANDARD,
    GITHUB,
    DISCORD,
    SLACK
};

enum class LineBreakStyle {
    SOFT,  // "  \n"
    HARD   // "\n"
};

struct MarkdownRenderConfig {
    MarkdownFlavor flavor = MarkdownFlavor::STANDARD;
    bool preserve_formatting = true;
    bool use_code_fences = true;
    size_t max_nesting_level = 5;
    LineBreakStyle line_break_style = LineBreakStyle::SOFT;
    ILogger* logger = nullptr;  // nullptr logs to default_logger()
};

// Preset for a destination dialect
auto markdown_config_for(MarkdownFlavor flavor) -> MarkdownRenderConfig;

auto to_string(MarkdownFlavor flavor) -> std::string;
auto markdown_flavor_from_string(std::string_view name) -> std::optional<MarkdownFlavor>;

auto render_markdown(const ClippyContent& content, const MarkdownRenderConfig& config = {})
    -> std::string;

auto render_inline_markdown(const InlineSequence& content, const MarkdownRenderConfig& config = {})
    -> std::string;

// Backslash-escapes Markdown syntax; Slack gets HTML entities for & < > instead
auto escape_markdown(std::string_view text, MarkdownFlavor flavor = MarkdownFlavor::STANDARD)
    -> std::string;

// Single-line preview without Markdown syntax
auto markdown_preview(const ClippyContent& content, size_t max_length = 100) -> std::string;

} // namespace clippy