#include "clippy/renderers/plain_text_renderer.hpp"
#include "clippy/core/content_ops.hpp"
#include "clippy/core/text_utils.hpp"
#include <sstream>

namespace clippy {

namespace {

auto render_list_lines(const ListBlock& list, size_t depth, std::ostringstream& out) -> void {
    size_t number = 1;
    for (const auto& item : list.items) {
        if (out.tellp() > 0) {
            out << '\n';
        }
        out << std::string(depth * 2, ' ');
        if (list.list_type == ListType::NUMBERED) {
            out << number++ << ". ";
        } else {
            out << "• ";
        }
        out << inline_text(item.content);
        if (item.nested) {
            render_list_lines(*item.nested, depth + 1, out);
        }
    }
}

} // namespace

auto render_block_text(const ContentBlock& block) -> std::string {
    return std::visit(overloaded{
                          [](const ParagraphBlock& paragraph) { return inline_text(paragraph.content); },
                          [](const HeadingBlock& heading) { return inline_text(heading.content); },
                          [](const ListBlock& list) {
                              std::ostringstream out;
                              render_list_lines(list, 0, out);
                              return out.str();
                          },
                          [](const QuoteBlock& quote) {
                              auto text = inline_text(quote.content);
                              if (quote.citation) {
                                  text += "\n— " + *quote.citation;
                              }
                              return text;
                          },
                          [](const CodeBlock& code) { return code.content; },
                          [](const DividerBlock&) { return std::string("---"); },
                      },
                      block);
}

auto render_plain_text(const ClippyContent& content) -> std::string {
    std::string result;
    for (const auto& block : content.blocks) {
        auto text = render_block_text(block);
        if (text.empty()) {
            continue;
        }
        if (!result.empty()) {
            result += "\n\n";
        }
        result += text;
    }
    return result;
}

auto preview_line(std::string_view text, size_t max_length) -> std::string {
    auto line = text::trim(text::collapse_whitespace(text));
    if (line.size() <= max_length) {
        return line;
    }
    return text::trim_right(text::truncate_utf8(line, max_length)) + "...";
}

auto render_preview(const ClippyContent& content, size_t max_length) -> std::string {
    return preview_line(render_plain_text(content), max_length);
}

} // namespace clippy
