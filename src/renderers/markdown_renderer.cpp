#include "clippy/renderers/markdown_renderer.hpp"
#include "clippy/core/content_ops.hpp"
#include "clippy/core/text_utils.hpp"
#include "clippy/core/url_policy.hpp"
#include "clippy/logging/logger.hpp"
#include "clippy/renderers/plain_text_renderer.hpp"
#include <algorithm>
#include <array>
#include <vector>

namespace clippy {

namespace {

constexpr std::string_view MARKDOWN_SPECIAL_CHARS = "\\`*_{}[]()#+-.!";
constexpr std::string_view DISCORD_EXTRA_CHARS = "~|";
constexpr std::array<std::string_view, 3> BULLETS = {"*", "-", "+"};
constexpr size_t DISCORD_DIVIDER_WIDTH = 30;
constexpr const char* WHITESPACE = " \t\n\r";

auto is_fence_line(std::string_view line) -> bool {
    auto trimmed = text::trim(line);
    return trimmed.starts_with("```") || trimmed.starts_with("~~~");
}

// Wraps the non-whitespace core of text in a marker, keeping edge whitespace outside
auto surround(const std::string& text, std::string_view marker) -> std::string {
    auto start = text.find_first_not_of(' ');
    if (start == std::string::npos) {
        return text;
    }
    auto end = text.find_last_not_of(' ');
    return text.substr(0, start) + std::string(marker) + text.substr(start, end - start + 1) +
           std::string(marker) + text.substr(end + 1);
}

auto code_span(const std::string& text) -> std::string {
    std::string fence(text::longest_run(text, '`') + 1, '`');
    bool pad = !text.empty() && (text.front() == '`' || text.back() == '`');
    auto padding = pad ? std::string(" ") : std::string();
    return fence + padding + text + padding + fence;
}

auto encode_link_url(std::string_view url) -> std::string {
    std::string encoded;
    encoded.reserve(url.size());
    for (char c : url) {
        switch (c) {
        case '(':
            encoded += "%28";
            break;
        case ')':
            encoded += "%29";
            break;
        case ' ':
            encoded += "%20";
            break;
        default:
            encoded += c;
        }
    }
    return encoded;
}

// Prefixes every line after the first
auto indent_continuation(const std::string& text, const std::string& indent) -> std::string {
    return text::replace_all(text, "\n", "\n" + indent);
}

// Collapses runs of blank lines outside code fences into one blank line
auto collapse_blank_lines(const std::string& markdown) -> std::string {
    std::vector<std::string> lines;
    bool in_fence = false;
    bool previous_blank = false;
    for (const auto& line : text::split_lines(markdown)) {
        if (is_fence_line(line)) {
            in_fence = !in_fence;
        }
        bool blank = line.empty();
        if (!in_fence && blank && previous_blank) {
            continue;
        }
        previous_blank = blank && !in_fence;
        lines.push_back(line);
    }

    std::string result;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            result += '\n';
        }
        result += lines[i];
    }
    return result;
}

auto trim_document(const std::string& markdown) -> std::string {
    auto start = markdown.find_first_not_of('\n');
    if (start == std::string::npos) {
        return "";
    }
    return text::trim_right(std::string_view(markdown).substr(start));
}

class MarkdownWriter {
public:
    explicit MarkdownWriter(const MarkdownRenderConfig& config)
        : config_(config), logger_(resolve_logger(config.logger)) {}

    auto inline_content(const InlineSequence& content) const -> std::string {
        std::string markdown;
        for (const auto& item : content) {
            markdown += std::visit(
                overloaded{
                    [&](const TextSpan& span) { return text_span(span); },
                    [&](const LinkSpan& link) { return link_span(link); },
                    [&](const LineBreak&) {
                        return std::string(
                            config_.line_break_style == LineBreakStyle::HARD ? "\n" : "  \n");
                    },
                },
                item);
        }
        return markdown;
    }

    auto block(const ContentBlock& content_block) -> std::string {
        return std::visit(overloaded{
                              [&](const ParagraphBlock& paragraph) {
                                  return inline_content(paragraph.content);
                              },
                              [&](const HeadingBlock& heading) {
                                  if (flavor() == MarkdownFlavor::DISCORD ||
                                      flavor() == MarkdownFlavor::SLACK) {
                                      return bold_heading(heading);
                                  }
                                  auto level = static_cast<size_t>(std::clamp(heading.level, 1, 6));
                                  return std::string(level, '#') + " " +
                                         inline_content(heading.content);
                              },
                              [&](const ListBlock& list) {
                                  std::vector<std::string> lines;
                                  list_lines(list, 0, lines);
                                  return join_lines(lines);
                              },
                              [&](const QuoteBlock& quote) { return quote_block(quote); },
                              [&](const CodeBlock& code) { return code_block(code); },
                              [&](const DividerBlock&) { return divider(); },
                          },
                          content_block);
    }

private:
    auto flavor() const -> MarkdownFlavor { return config_.flavor; }

    auto formatted(std::string text, const Formatting& formatting) const -> std::string {
        if (!config_.preserve_formatting) {
            return text;
        }
        bool slack = flavor() == MarkdownFlavor::SLACK;
        if (formatting.bold) {
            text = surround(text, slack ? "*" : "**");
        }
        if (formatting.italic) {
            text = surround(text, slack ? "_" : "*");
        }
        if (formatting.underline) {
            if (flavor() == MarkdownFlavor::DISCORD) {
                text = surround(text, "__");
            } else if (!formatting.italic) {
                text = surround(text, slack ? "_" : "*");
            }
        }
        if (formatting.strikethrough) {
            text = surround(text, slack ? "~" : "~~");
        }
        return text;
    }

    auto text_span(const TextSpan& span) const -> std::string {
        if (span.formatting.code && config_.preserve_formatting) {
            auto start = span.text.find_first_not_of(WHITESPACE);
            if (start == std::string::npos) {
                return span.text;
            }
            auto end = span.text.find_last_not_of(WHITESPACE) + 1;
            return span.text.substr(0, start) +
                   formatted(code_span(span.text.substr(start, end - start)), span.formatting) +
                   span.text.substr(end);
        }
        return formatted(escape_markdown(span.text, flavor()), span.formatting);
    }

    // Discord and Slack have no headings; every line of the heading is set in bold once
    auto bold_heading(const HeadingBlock& heading) const -> std::string {
        InlineSequence content = heading.content;
        for (auto& item : content) {
            std::visit(overloaded{
                           [](TextSpan& span) { span.formatting.bold = false; },
                           [](LinkSpan& link) { link.formatting.bold = false; },
                           [](LineBreak&) {},
                       },
                       item);
        }

        std::string_view marker = flavor() == MarkdownFlavor::DISCORD ? "**" : "*";
        std::vector<std::string> lines;
        for (const auto& line : text::split_lines(inline_content(content))) {
            lines.push_back(surround(line, marker));
        }
        return join_lines(lines);
    }

    auto link_span(const LinkSpan& link) const -> std::string {
        const auto& label = link.text.empty() ? link.url : link.text;
        if (!is_allowed_url(link.url)) {
            return formatted(escape_markdown(label, flavor()), link.formatting);
        }
        if (flavor() == MarkdownFlavor::SLACK) {
            auto target = escape_markdown(link.url, flavor());
            if (label == link.url) {
                return formatted("<" + target + ">", link.formatting);
            }
            return formatted("<" + target + "|" + escape_markdown(label, flavor()) + ">",
                             link.formatting);
        }
        return formatted("[" + escape_markdown(label, flavor()) + "](" + encode_link_url(link.url) +
                             ")",
                         link.formatting);
    }

    auto list_lines(const ListBlock& list, size_t depth, std::vector<std::string>& lines) const
        -> void {
        std::string indent(depth * 2, ' ');
        size_t number = 1;
        for (const auto& item : list.items) {
            std::string marker = list.list_type == ListType::NUMBERED
                                     ? std::to_string(number++) + "."
                                     : std::string(BULLETS[depth % BULLETS.size()]);
            auto continuation = indent + std::string(marker.size() + 1, ' ');
            lines.push_back(indent + marker + " " +
                            indent_continuation(inline_content(item.content), continuation));

            if (!item.nested || item.nested->items.empty()) {
                continue;
            }
            if (depth + 1 < config_.max_nesting_level) {
                list_lines(*item.nested, depth + 1, lines);
            } else {
                logger_.warn("Markdown list nesting exceeds " +
                             std::to_string(config_.max_nesting_level) +
                             " levels, flattening deeper items");
                flat_lines(*item.nested, lines);
            }
        }
    }

    auto flat_lines(const ListBlock& list, std::vector<std::string>& lines) const -> void {
        std::string indent(config_.max_nesting_level * 2, ' ');
        for (const auto& item : list.items) {
            lines.push_back(indent + "• " +
                            indent_continuation(inline_content(item.content), indent + "  "));
            if (item.nested) {
                flat_lines(*item.nested, lines);
            }
        }
    }

    auto quote_block(const QuoteBlock& quote) const -> std::string {
        std::vector<std::string> lines;
        for (const auto& line : text::split_lines(inline_content(quote.content))) {
            lines.push_back(line.empty() ? ">" : "> " + line);
        }
        if (quote.citation && !quote.citation->empty()) {
            lines.emplace_back(">");
            lines.push_back("> — " + escape_markdown(*quote.citation, flavor()));
        }
        return join_lines(lines);
    }

    auto code_block(const CodeBlock& code) const -> std::string {
        std::string body = code.content;
        while (!body.empty() && body.back() == '\n') {
            body.pop_back();
        }

        if (!config_.use_code_fences) {
            std::vector<std::string> lines;
            for (const auto& line : text::split_lines(body)) {
                lines.push_back("    " + line);
            }
            return join_lines(lines);
        }

        std::string fence(std::max<size_t>(3, text::longest_run(body, '`') + 1), '`');
        return fence + code.language.value_or("") + "\n" + body + "\n" + fence;
    }

    auto divider() const -> std::string {
        if (flavor() == MarkdownFlavor::DISCORD) {
            std::string line;
            for (size_t i = 0; i < DISCORD_DIVIDER_WIDTH; ++i) {
                line += "━";
            }
            return line;
        }
        return "---";
    }

    static auto join_lines(const std::vector<std::string>& lines) -> std::string {
        std::string joined;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) {
                joined += '\n';
            }
            joined += lines[i];
        }
        return joined;
    }

    const MarkdownRenderConfig& config_;
    ILogger& logger_;
};

} // namespace

auto markdown_config_for(MarkdownFlavor flavor) -> MarkdownRenderConfig {
    MarkdownRenderConfig config;
    config.flavor = flavor;
    switch (flavor) {
    case MarkdownFlavor::GITHUB:
    case MarkdownFlavor::DISCORD:
        config.use_code_fences = true;
        config.line_break_style = LineBreakStyle::SOFT;
        break;
    case MarkdownFlavor::SLACK:
        config.use_code_fences = false;
        config.line_break_style = LineBreakStyle::HARD;
        break;
    case MarkdownFlavor::STANDARD:
        break;
    }
    return config;
}

auto to_string(MarkdownFlavor flavor) -> std::string {
    switch (flavor) {
    case MarkdownFlavor::STANDARD:
        return "standard";
    case MarkdownFlavor::GITHUB:
        return "github";
    case MarkdownFlavor::DISCORD:
        return "discord";
    case MarkdownFlavor::SLACK:
        return "slack";
    }
    return "standard";
}

auto markdown_flavor_from_string(std::string_view name) -> std::optional<MarkdownFlavor> {
    auto lowered = text::to_lowercase(name);
    if (lowered == "standard") {
        return MarkdownFlavor::STANDARD;
    }
    if (lowered == "github") {
        return MarkdownFlavor::GITHUB;
    }
    if (lowered == "discord") {
        return MarkdownFlavor::DISCORD;
    }
    if (lowered == "slack") {
        return MarkdownFlavor::SLACK;
    }
    return std::nullopt;
}

auto escape_markdown(std::string_view text, MarkdownFlavor flavor) -> std::string {
    std::string escaped;
    escaped.reserve(text.size());

    if (flavor == MarkdownFlavor::SLACK) {
        for (char c : text) {
            switch (c) {
            case '&':
                escaped += "&amp;";
                break;
            case '<':
                escaped += "&lt;";
                break;
            case '>':
                escaped += "&gt;";
                break;
            default:
                escaped += c;
            }
        }
        return escaped;
    }

    for (char c : text) {
        bool special = MARKDOWN_SPECIAL_CHARS.find(c) != std::string_view::npos ||
                       (flavor == MarkdownFlavor::DISCORD &&
                        DISCORD_EXTRA_CHARS.find(c) != std::string_view::npos);
        if (special) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

auto render_inline_markdown(const InlineSequence& content, const MarkdownRenderConfig& config)
    -> std::string {
    return MarkdownWriter(config).inline_content(content);
}

auto render_markdown(const ClippyContent& content, const MarkdownRenderConfig& config) -> std::string {
    MarkdownWriter writer(config);

    std::string markdown;
    for (const auto& content_block : content.blocks) {
        auto rendered = writer.block(content_block);
        if (rendered.empty()) {
            continue;
        }
        if (!markdown.empty()) {
            markdown += "\n\n";
        }
        markdown += rendered;
    }

    return trim_document(collapse_blank_lines(markdown));
}

auto markdown_preview(const ClippyContent& content, size_t max_length) -> std::string {
    MarkdownRenderConfig config;
    config.preserve_formatting = false;
    config.use_code_fences = false;
    config.line_break_style = LineBreakStyle::HARD;
    auto markdown = render_markdown(content, config);

    std::string stripped;
    for (const auto& line : text::split_lines(markdown)) {
        std::string_view view = line;
        auto hashes = view.find_first_not_of('#');
        if (hashes != std::string_view::npos && hashes > 0 && view[hashes] == ' ') {
            view.remove_prefix(hashes + 1);
        } else if (view.starts_with("> ")) {
            view.remove_prefix(2);
        }
        for (size_t i = 0; i < view.size(); ++i) {
            if (view[i] == '\\' && i + 1 < view.size() &&
                MARKDOWN_SPECIAL_CHARS.find(view[i + 1]) != std::string_view::npos) {
                continue;
            }
            stripped += view[i];
        }
        stripped += ' ';
    }
    return preview_line(stripped, max_length);
}

} // namespace clippy