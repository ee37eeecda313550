#include "clippy/renderers/quill_delta_renderer.hpp"
#include "clippy/core/text_utils.hpp"
#include "clippy/core/url_policy.hpp"
#include <algorithm>

namespace clippy {

namespace {

class DeltaBuilder {
public:
    explicit DeltaBuilder(const QuillRenderConfig& config) : config_(config) {}

    auto block(const ContentBlock& content_block) -> void {
        std::visit(overloaded{
                       [&](const ParagraphBlock& paragraph) { line(paragraph.content, {}); },
                       [&](const HeadingBlock& heading) {
                           line(heading.content, {{"header", std::clamp(heading.level, 1, 6)}});
                       },
                       [&](const ListBlock& list) { list_items(list, 0); },
                       [&](const QuoteBlock& quote) { line(quote.content, {{"blockquote", true}}); },
                       [&](const CodeBlock& code) { code_block(code); },
                       [&](const DividerBlock&) {
                           push("---", {});
                           push("\n", {});
                       },
                   },
                   content_block);
    }

    auto separator() -> void { push("\n", {}); }

    auto take() -> QuillDelta { return std::move(delta_); }

private:
    auto push(std::string insert, DeltaAttributes attributes) -> void {
        delta_.ops.push_back(DeltaOp{.insert = std::move(insert), .attributes = std::move(attributes)});
    }

    auto text_attributes(const Formatting& formatting) const -> DeltaAttributes {
        DeltaAttributes attributes;
        if (!config_.preserve_formatting) {
            return attributes;
        }
        if (formatting.bold) {
            attributes["bold"] = true;
        }
        if (formatting.italic) {
            attributes["italic"] = true;
        }
        if (formatting.underline) {
            attributes["underline"] = true;
        }
        if (formatting.strikethrough) {
            attributes["strike"] = true;
        }
        if (formatting.code) {
            attributes["code"] = true;
        }
        return attributes;
    }

    // Inline ops of one logical line; each line end carries the line attributes
    auto line(const InlineSequence& content, const DeltaAttributes& line_attributes) -> void {
        for (const auto& item : content) {
            std::visit(overloaded{
                           [&](const TextSpan& span) {
                               push(span.text, text_attributes(span.formatting));
                           },
                           [&](const LinkSpan& link) {
                               auto attributes = text_attributes(link.formatting);
                               if (is_allowed_url(link.url)) {
                                   attributes["link"] = link.url;
                               }
                               push(link.text.empty() ? link.url : link.text, std::move(attributes));
                           },
                           [&](const LineBreak&) { push("\n", line_attributes); },
                       },
                       item);
        }
        push("\n", line_attributes);
    }

    auto list_items(const ListBlock& list, size_t depth) -> void {
        size_t max_depth = config_.support_nested_lists ? config_.max_list_depth : 1;
        for (const auto& item : list.items) {
            if (depth < max_depth) {
                DeltaAttributes attributes;
                attributes["list"] =
                    std::string(list.list_type == ListType::NUMBERED ? "ordered" : "bullet");
                if (depth > 0) {
                    attributes["indent"] = static_cast<int>(depth);
                }
                line(item.content, attributes);
            } else {
                push("• ", {});
                line(item.content, {});
            }
            if (item.nested) {
                list_items(*item.nested, depth + 1);
            }
        }
    }

    auto code_block(const CodeBlock& code) -> void {
        std::string body = code.content;
        while (!body.empty() && body.back() == '\n') {
            body.pop_back();
        }

        if (!config_.use_code_blocks) {
            push(body, {{"code", true}});
            push("\n", {});
            return;
        }

        DeltaAttributeValue language_value = code.language && !code.language->empty()
                                                   ? DeltaAttributeValue(*code.language)
                                                   : DeltaAttributeValue(true);
        for (const auto& code_line : text::split_lines(body)) {
            push(code_line, {});
            push("\n", {{"code-block", language_value}});
        }
    }

    const QuillRenderConfig& config_;
    QuillDelta delta_;
};

} // namespace

auto render_quill_delta(const ClippyContent& content, const QuillRenderConfig& config) -> QuillDelta {
    DeltaBuilder builder(config);
    for (size_t i = 0; i < content.blocks.size(); ++i) {
        if (i > 0) {
            builder.separator();
        }
        builder.block(content.blocks[i]);
    }
    return optimize_delta(builder.take());
}

auto optimize_delta(const QuillDelta& delta) -> QuillDelta {
    QuillDelta optimized;
    for (const auto& op : delta.ops) {
        if (op.insert.empty()) {
            continue;
        }
        if (!optimized.ops.empty() && optimized.ops.back().attributes == op.attributes) {
            optimized.ops.back().insert += op.insert;
        } else {
            optimized.ops.push_back(op);
        }
    }
    return optimized;
}

auto delta_plain_text(const QuillDelta& delta) -> std::string {
    std::string text;
    for (const auto& op : delta.ops) {
        text += op.insert;
    }
    return text;
}

auto text_to_delta(std::string_view text) -> QuillDelta {
    std::string insert(text);
    if (insert.empty() || insert.back() != '\n') {
        insert += '\n';
    }
    return QuillDelta{.ops = {DeltaOp{.insert = std::move(insert), .attributes = {}}}};
}

} // namespace clippy
