#include "clippy/renderers/html_renderer.hpp"
#include "clippy/core/text_utils.hpp"
#include "clippy/core/url_policy.hpp"
#include "clippy/renderers/plain_text_renderer.hpp"
#include <algorithm>

namespace clippy {

namespace {

auto wrap(const std::string& tag, const std::string& inner) -> std::string {
    return "<" + tag + ">" + inner + "</" + tag + ">";
}

// Code innermost, strikethrough outermost
auto apply_formatting(std::string html, const Formatting& formatting, const HtmlRenderConfig& config)
    -> std::string {
    bool semantic = config.use_semantic_elements;
    if (formatting.code) {
        html = wrap("code", html);
    }
    if (formatting.bold) {
        html = wrap(semantic ? "strong" : "b", html);
    }
    if (formatting.italic) {
        html = wrap(semantic ? "em" : "i", html);
    }
    if (formatting.underline) {
        html = wrap("u", html);
    }
    if (formatting.strikethrough) {
        html = wrap(semantic ? "del" : "s", html);
    }
    return html;
}

auto id_attribute(const std::string& id, const HtmlRenderConfig& config) -> std::string {
    if (!config.include_ids || id.empty()) {
        return "";
    }
    return " id=\"" + escape_html(id) + "\"";
}

auto render_list(const ListBlock& list, const HtmlRenderConfig& config) -> std::string {
    if (list.items.empty()) {
        return "";
    }
    std::string tag = list.list_type == ListType::NUMBERED ? "ol" : "ul";

    std::string html = "<" + tag + id_attribute(list.id, config) + ">\n";
    for (const auto& item : list.items) {
        html += "<li" + id_attribute(item.id, config) + ">" + render_inline_html(item.content, config);
        if (item.nested) {
            auto nested = render_list(*item.nested, config);
            if (!nested.empty()) {
                html += "\n" + nested + "\n";
            }
        }
        html += "</li>\n";
    }
    html += "</" + tag + ">";
    return html;
}

} // namespace

auto escape_html(std::string_view text) -> std::string {
    std::string escaped;
    escaped.reserve(text.size());
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
        case '"':
            escaped += "&quot;";
            break;
        case '\'':
            escaped += "&#39;";
            break;
        default:
            escaped += c;
        }
    }
    return escaped;
}

auto render_inline_html(const InlineSequence& content, const HtmlRenderConfig& config) -> std::string {
    std::string html;
    for (const auto& item : content) {
        html += std::visit(
            overloaded{
                [&](const TextSpan& span) {
                    return apply_formatting(escape_html(span.text), span.formatting, config);
                },
                [&](const LinkSpan& link) {
                    auto text = escape_html(link.text.empty() ? link.url : link.text);
                    if (!is_allowed_url(link.url)) {
                        return apply_formatting(text, link.formatting, config);
                    }
                    auto anchor = "<a href=\"" + escape_html(link.url) + "\">" + text + "</a>";
                    return apply_formatting(anchor, link.formatting, config);
                },
                [](const LineBreak&) { return std::string("<br>"); },
            },
            item);
    }
    return html;
}

auto render_block_html(const ContentBlock& block, const HtmlRenderConfig& config) -> std::string {
    return std::visit(
        overloaded{
            [&](const ParagraphBlock& paragraph) {
                return "<p" + id_attribute(paragraph.id, config) + ">" +
                       render_inline_html(paragraph.content, config) + "</p>";
            },
            [&](const HeadingBlock& heading) {
                auto tag = "h" + std::to_string(std::clamp(heading.level, 1, 6));
                return "<" + tag + id_attribute(heading.id, config) + ">" +
                       render_inline_html(heading.content, config) + "</" + tag + ">";
            },
            [&](const ListBlock& list) { return render_list(list, config); },
            [&](const QuoteBlock& quote) {
                std::string cite;
                if (quote.citation) {
                    cite = " cite=\"" + escape_html(*quote.citation) + "\"";
                }
                return "<blockquote" + id_attribute(quote.id, config) + cite + ">" +
                       render_inline_html(quote.content, config) + "</blockquote>";
            },
            [&](const CodeBlock& code) {
                std::string language;
                if (code.language && !code.language->empty()) {
                    language = " class=\"language-" + escape_html(*code.language) + "\"";
                }
                return "<pre" + id_attribute(code.id, config) + "><code" + language + ">" +
                       escape_html(code.content) + "</code></pre>";
            },
            [&](const DividerBlock& divider) { return "<hr" + id_attribute(divider.id, config) + ">"; },
        },
        block);
}

auto render_html(const ClippyContent& content, const HtmlRenderConfig& config) -> std::string {
    std::string html;
    for (const auto& block : content.blocks) {
        auto rendered = render_block_html(block, config);
        if (rendered.empty()) {
            continue;
        }
        if (!html.empty()) {
            html += "\n";
        }
        html += rendered;
    }
    return config.clean_output ? text::trim(html) : html;
}

auto render_block_preview(const ContentBlock& block, size_t max_length) -> std::string {
    return preview_line(render_block_text(block), max_length);
}

} // namespace clippy
