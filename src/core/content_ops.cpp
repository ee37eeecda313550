#include "clippy/core/content_ops.hpp"
#include "clippy/core/text_utils.hpp"
#include <algorithm>

namespace clippy {

auto block_kind(const ContentBlock& block) -> BlockKind {
    return std::visit(overloaded{
                          [](const ParagraphBlock&) { return BlockKind::PARAGRAPH; },
                          [](const HeadingBlock&) { return BlockKind::HEADING; },
                          [](const ListBlock&) { return BlockKind::LIST; },
                          [](const QuoteBlock&) { return BlockKind::QUOTE; },
                          [](const CodeBlock&) { return BlockKind::CODE; },
                          [](const DividerBlock&) { return BlockKind::DIVIDER; },
                      },
                      block);
}

auto block_id(const ContentBlock& block) -> const std::string& {
    return std::visit([](const auto& b) -> const std::string& { return b.id; }, block);
}

auto with_block_id(ContentBlock block, std::string id) -> ContentBlock {
    std::visit([&id](auto& b) { b.id = std::move(id); }, block);
    return block;
}

auto block_inline_content(const ContentBlock& block) -> const InlineSequence* {
    return std::visit(overloaded{
                          [](const ParagraphBlock& b) -> const InlineSequence* { return &b.content; },
                          [](const HeadingBlock& b) -> const InlineSequence* { return &b.content; },
                          [](const QuoteBlock& b) -> const InlineSequence* { return &b.content; },
                          [](const ListBlock&) -> const InlineSequence* { return nullptr; },
                          [](const CodeBlock&) -> const InlineSequence* { return nullptr; },
                          [](const DividerBlock&) -> const InlineSequence* { return nullptr; },
                      },
                      block);
}

auto formatting_of(const InlineContent& inline_content) -> std::optional<Formatting> {
    return std::visit(overloaded{
                          [](const TextSpan& span) -> std::optional<Formatting> { return span.formatting; },
                          [](const LinkSpan& span) -> std::optional<Formatting> { return span.formatting; },
                          [](const LineBreak&) -> std::optional<Formatting> { return std::nullopt; },
                      },
                      inline_content);
}

auto has_formatting(const Formatting& formatting, FormattingKind kind) -> bool {
    switch (kind) {
    case FormattingKind::BOLD:
        return formatting.bold;
    case FormattingKind::ITALIC:
        return formatting.italic;
    case FormattingKind::UNDERLINE:
        return formatting.underline;
    case FormattingKind::STRIKETHROUGH:
        return formatting.strikethrough;
    case FormattingKind::CODE:
        return formatting.code;
    }
    return false;
}

auto with_formatting(Formatting formatting, FormattingKind kind) -> Formatting {
    switch (kind) {
    case FormattingKind::BOLD:
        formatting.bold = true;
        break;
    case FormattingKind::ITALIC:
        formatting.italic = true;
        break;
    case FormattingKind::UNDERLINE:
        formatting.underline = true;
        break;
    case FormattingKind::STRIKETHROUGH:
        formatting.strikethrough = true;
        break;
    case FormattingKind::CODE:
        formatting.code = true;
        break;
    }
    return formatting;
}

auto active_formatting_kinds(const Formatting& formatting) -> std::vector<FormattingKind> {
    std::vector<FormattingKind> kinds;
    for (auto kind : ALL_FORMATTING_KINDS) {
        if (has_formatting(formatting, kind)) {
            kinds.push_back(kind);
        }
    }
    return kinds;
}

auto merge_adjacent_text_spans(InlineSequence content) -> InlineSequence {
    InlineSequence merged;
    merged.reserve(content.size());

    for (auto& item : content) {
        auto* span = std::get_if<TextSpan>(&item);
        if (span && !merged.empty()) {
            auto* last = std::get_if<TextSpan>(&merged.back());
            if (last && last->formatting == span->formatting) {
                last->text += span->text;
                continue;
            }
        }
        merged.push_back(std::move(item));
    }

    return merged;
}

auto has_unmerged_text_spans(const InlineSequence& content) -> bool {
    for (size_t i = 1; i < content.size(); ++i) {
        const auto* previous = std::get_if<TextSpan>(&content[i - 1]);
        const auto* current = std::get_if<TextSpan>(&content[i]);
        if (previous && current && previous->formatting == current->formatting) {
            return true;
        }
    }
    return false;
}

auto is_empty_inline(const InlineSequence& content) -> bool {
    if (content.empty()) {
        return true;
    }
    if (content.size() == 1) {
        const auto* span = std::get_if<TextSpan>(&content.front());
        return span && text::is_blank(span->text);
    }
    return false;
}

auto is_empty_block(const ContentBlock& block) -> bool {
    return std::visit(overloaded{
                          [](const ParagraphBlock& b) { return is_empty_inline(b.content); },
                          [](const HeadingBlock& b) { return is_empty_inline(b.content); },
                          [](const QuoteBlock& b) { return is_empty_inline(b.content); },
                          [](const ListBlock& b) { return b.items.empty(); },
                          [](const CodeBlock& b) { return text::is_blank(b.content); },
                          [](const DividerBlock&) { return false; },
                      },
                      block);
}

namespace {

auto without_empty_items(const ListBlock& list) -> ListBlock {
    ListBlock result{.id = list.id, .list_type = list.list_type, .items = {}};

    for (const auto& item : list.items) {
        ListItem copy{item.id, item.content};
        if (item.nested) {
            auto nested = without_empty_items(*item.nested);
            if (!nested.items.empty()) {
                copy.nested = std::make_unique<ListBlock>(std::move(nested));
            }
        }
        if (is_empty_inline(copy.content) && !copy.nested) {
            continue;
        }
        result.items.push_back(std::move(copy));
    }

    return result;
}

} // namespace

auto remove_empty_blocks(const std::vector<ContentBlock>& blocks) -> std::vector<ContentBlock> {
    std::vector<ContentBlock> result;

    for (const auto& block : blocks) {
        if (const auto* list = std::get_if<ListBlock>(&block)) {
            auto pruned = without_empty_items(*list);
            if (!pruned.items.empty()) {
                result.emplace_back(std::move(pruned));
            }
            continue;
        }
        if (!is_empty_block(block)) {
            result.push_back(block);
        }
    }

    return result;
}

auto list_depth(const ListBlock& list) -> size_t {
    size_t deepest_child = 0;
    for (const auto& item : list.items) {
        if (item.nested) {
            deepest_child = std::max(deepest_child, list_depth(*item.nested));
        }
    }
    return 1 + deepest_child;
}

auto inline_text(const InlineSequence& content) -> std::string {
    std::string result;
    for (const auto& item : content) {
        std::visit(overloaded{
                       [&result](const TextSpan& span) { result += span.text; },
                       [&result](const LinkSpan& span) { result += span.text; },
                       [&result](const LineBreak&) { result += '\n'; },
                   },
                   item);
    }
    return result;
}

} // namespace clippy