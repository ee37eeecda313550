#include "clippy/parsers/inline_parser.hpp"
#include "clippy/core/content_ops.hpp"
#include "clippy/core/text_utils.hpp"
#include "clippy/core/url_policy.hpp"
#include "clippy/logging/logger.hpp"
#include "clippy/parsers/html_tree.hpp"
#include <algorithm>
#include <array>
#include <sstream>
#include <utility>
#include <vector>

namespace clippy {

namespace {

constexpr std::array<std::string_view, 8> SKIPPED_TAGS = {
    "script", "style", "template", "noscript", "img", "head", "svg", "iframe"};

// Elements that start a new line when they appear inside inline content
constexpr std::array<std::string_view, 24> LINE_BOUNDARY_TAGS = {
    "p",     "div",     "h1",     "h2",      "h3",     "h4",     "h5",     "h6",
    "li",    "ul",      "ol",     "blockquote", "pre", "section", "article", "header",
    "footer", "address", "figure", "figcaption", "tr", "table",   "dt",     "dd"};

auto contains(std::span<const std::string_view> names, std::string_view name) -> bool {
    return std::find(names.begin(), names.end(), name) != names.end();
}

auto parse_font_weight(const std::string& value) -> bool {
    if (value == "bold" || value == "bolder") {
        return true;
    }
    try {
        size_t consumed = 0;
        int weight = std::stoi(value, &consumed);
        return consumed == value.size() && weight >= 600 && weight <= 900;
    } catch (const std::exception&) {
        // Not numeric (normal, lighter, inherit, ...)
        return false;
    }
}

auto strip_important(std::string value) -> std::string {
    auto bang = value.find('!');
    if (bang != std::string::npos) {
        value = text::trim(value.substr(0, bang));
    }
    return value;
}

// Walks a node range once, accumulating inline content
class InlineWalk {
public:
    InlineWalk(const InlineParseOptions& options, ILogger& logger)
        : options_(options), logger_(logger) {}

    auto walk(const xmlNode* node) -> void {
        if (html::is_text(node)) {
            append_text(html::node_text(node));
            return;
        }
        if (!html::is_element(node)) {
            return;  // Comments, processing instructions
        }

        auto tag = html::tag_name(node);
        if (contains(SKIPPED_TAGS, tag)) {
            return;
        }
        if (tag == "br") {
            line_break();
            return;
        }
        if (tag == "a" && try_link(node)) {
            return;
        }

        bool boundary = contains(LINE_BOUNDARY_TAGS, tag);
        if (boundary) {
            request_line_boundary();
        }

        auto formatting = formatting_from_tag(tag);
        if (auto style = html::attribute(node, "style")) {
            formatting = formatting | formatting_from_style(*style);
        }

        FormattingScope scope(*this, formatting);
        for (auto* child : html::child_nodes(node)) {
            walk(child);
        }

        if (boundary) {
            request_line_boundary();
        }
    }

    auto finish() -> InlineSequence {
        flush();
        if (!options_.preserve_whitespace) {
            trim_trailing_spaces();
        }

        InlineSequence result;
        for (auto& item : output_) {
            if (auto* span = std::get_if<TextSpan>(&item)) {
                if (span->text.empty()) {
                    continue;
                }
                if (span->text.size() > options_.max_text_length) {
                    logger_.warn("Text span truncated from " + std::to_string(span->text.size()) +
                                 " to " + std::to_string(options_.max_text_length) + " bytes");
                    span->text = text::truncate_utf8(span->text, options_.max_text_length);
                }
            }
            result.push_back(std::move(item));
        }

        if (options_.merge_adjacent_text) {
            return merge_adjacent_text_spans(std::move(result));
        }
        return result;
    }

private:
    // Pushes formatting for the lifetime of an element's subtree
    class FormattingScope {
    public:
        FormattingScope(InlineWalk& walk, const Formatting& added) : walk_(walk) {
            auto next = walk_.current_formatting() | added;
            pushed_ = next != walk_.current_formatting();
            if (pushed_) {
                walk_.flush();
                walk_.stack_.push_back(next);
            }
        }
        ~FormattingScope() {
            if (pushed_) {
                walk_.flush();
                walk_.stack_.pop_back();
            }
        }
        FormattingScope(const FormattingScope&) = delete;
        auto operator=(const FormattingScope&) -> FormattingScope& = delete;

    private:
        InlineWalk& walk_;
        bool pushed_ = false;
    };

    auto current_formatting() const -> Formatting {
        return stack_.empty() ? Formatting{} : stack_.back();
    }

    auto has_content() const -> bool { return !output_.empty() || !buffer_.empty(); }

    auto request_line_boundary() -> void {
        if (has_content() && !at_line_start_) {
            pending_break_ = true;
        }
    }

    auto emit_pending_break() -> void {
        if (pending_break_) {
            pending_break_ = false;
            line_break();
        }
    }

    auto flush() -> void {
        if (buffer_.empty()) {
            return;
        }
        output_.emplace_back(TextSpan{.text = std::move(buffer_), .formatting = current_formatting()});
        buffer_.clear();
    }

    auto append_text(const std::string& raw) -> void {
        if (options_.preserve_whitespace) {
            if (!raw.empty()) {
                emit_pending_break();
                buffer_ += raw;
                at_line_start_ = false;
            }
            return;
        }

        for (char c : raw) {
            if (text::is_space(c)) {
                if (!at_line_start_ && !last_was_space_ && !pending_break_) {
                    buffer_ += ' ';
                    last_was_space_ = true;
                }
                continue;
            }
            emit_pending_break();
            buffer_ += c;
            at_line_start_ = false;
            last_was_space_ = false;
        }
    }

    auto line_break() -> void {
        pending_break_ = false;
        flush();
        if (!options_.preserve_whitespace) {
            trim_trailing_spaces();
        }
        output_.emplace_back(LineBreak{});
        at_line_start_ = true;
        last_was_space_ = false;
    }

    // Removes spaces ending the flushed output; spans left empty are dropped later
    auto trim_trailing_spaces() -> void {
        for (auto it = output_.rbegin(); it != output_.rend(); ++it) {
            auto* span = std::get_if<TextSpan>(&*it);
            if (span == nullptr) {
                return;
            }
            while (!span->text.empty() && span->text.back() == ' ') {
                span->text.pop_back();
            }
            if (!span->text.empty()) {
                return;
            }
        }
    }

    auto try_link(const xmlNode* node) -> bool {
        auto href = html::attribute(node, "href");
        if (!href) {
            return false;
        }
        auto url = text::trim(*href);
        if (url.empty()) {
            return false;
        }

        if (url.size() > options_.max_url_length) {
            logger_.warn("Link URL exceeds " + std::to_string(options_.max_url_length) +
                         " characters, keeping its text only");
            return false;
        }
        if (options_.validate_urls && !is_allowed_url(url, options_.max_url_length)) {
            logger_.warn("Link URL not allowed, keeping its text only: " + url);
            return false;
        }

        auto link_text = text::trim(text::collapse_whitespace(html::text_content(node)));
        if (link_text.empty()) {
            link_text = url;
        }

        emit_pending_break();
        flush();
        output_.emplace_back(LinkSpan{.url = std::move(url),
                                      .text = std::move(link_text),
                                      .formatting = current_formatting()});
        at_line_start_ = false;
        last_was_space_ = false;
        return true;
    }

    const InlineParseOptions& options_;
    ILogger& logger_;
    std::vector<Formatting> stack_;
    std::string buffer_;
    InlineSequence output_;
    bool at_line_start_ = true;
    bool last_was_space_ = false;
    bool pending_break_ = false;
};

} // namespace

InlineParser::InlineParser(InlineParseOptions options) : options_(options) {}

auto InlineParser::parse(std::string_view fragment) const -> InlineSequence {
    if (text::is_blank(fragment)) {
        return {};
    }
    auto document = html::HtmlDocument::parse(fragment);
    if (!document) {
        resolve_logger(options_.logger).warn("Failed to parse inline markup");
        return {};
    }
    return parse_children(document->body());
}

auto InlineParser::parse_children(const xmlNode* element) const -> InlineSequence {
    auto children = html::child_nodes(element);
    return parse_nodes(children);
}

auto InlineParser::parse_nodes(std::span<xmlNode* const> nodes) const -> InlineSequence {
    InlineWalk walk(options_, resolve_logger(options_.logger));
    for (const auto* node : nodes) {
        walk.walk(node);
    }
    return walk.finish();
}

auto parse_inline(std::string_view fragment, const InlineParseOptions& options) -> InlineSequence {
    return InlineParser(options).parse(fragment);
}

auto formatting_from_tag(std::string_view tag) -> Formatting {
    Formatting formatting;
    if (tag == "b" || tag == "strong") {
        formatting.bold = true;
    } else if (tag == "i" || tag == "em" || tag == "cite" || tag == "dfn" || tag == "var") {
        formatting.italic = true;
    } else if (tag == "u" || tag == "ins") {
        formatting.underline = true;
    } else if (tag == "s" || tag == "strike" || tag == "del") {
        formatting.strikethrough = true;
    } else if (tag == "code" || tag == "kbd" || tag == "samp" || tag == "tt") {
        formatting.code = true;
    }
    return formatting;
}

auto formatting_from_style(std::string_view style) -> Formatting {
    Formatting formatting;
    std::istringstream declarations{std::string(style)};
    std::string declaration;

    while (std::getline(declarations, declaration, ';')) {
        auto colon = declaration.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        auto property = text::to_lowercase(text::trim(declaration.substr(0, colon)));
        auto value = strip_important(text::to_lowercase(text::trim(declaration.substr(colon + 1))));

        if (property == "font-weight") {
            formatting.bold = formatting.bold || parse_font_weight(value);
        } else if (property == "font-style") {
            formatting.italic = formatting.italic || value == "italic" || value == "oblique" ||
                                value.starts_with("oblique ");
        } else if (property == "text-decoration" || property == "text-decoration-line") {
            for (const auto& token : text::split_by_whitespace(value)) {
                formatting.underline = formatting.underline || token == "underline";
                formatting.strikethrough = formatting.strikethrough || token == "line-through";
            }
        }
    }
    return formatting;
}

} // namespace clippy