#pragma once

#include "clippy/core/content.hpp"
#include <optional>
#include <string>
#include <vector>

namespace clippy {

// Block identity and classification (pure)
auto block_kind(const ContentBlock& block) -> BlockKind;
auto block_id(const ContentBlock& block) -> const std::string&;
auto with_block_id(ContentBlock block, std::string id) -> ContentBlock;

// Inline sequence of paragraph, heading and quote blocks; nullptr for the others
auto block_inline_content(const ContentBlock& block) -> const InlineSequence*;

// Formatting helpers
auto formatting_of(const InlineContent& inline_content) -> std::optional<Formatting>;
auto has_formatting(const Formatting& formatting, FormattingKind kind) -> bool;
auto with_formatting(Formatting formatting, FormattingKind kind) -> Formatting;
auto active_formatting_kinds(const Formatting& formatting) -> std::vector<FormattingKind>;

// Merge consecutive text spans with identical formatting. Idempotent.
auto merge_adjacent_text_spans(InlineSequence content) -> InlineSequence;

// True if two adjacent text spans share identical formatting
auto has_unmerged_text_spans(const InlineSequence& content) -> bool;

// Empty means no content, or a single whitespace-only text span
auto is_empty_inline(const InlineSequence& content) -> bool;
auto is_empty_block(const ContentBlock& block) -> bool;

// Returns new blocks with empty blocks and empty list items removed
auto remove_empty_blocks(const std::vector<ContentBlock>& blocks) -> std::vector<ContentBlock>;

// Depth of a list including its nested lists (a flat list has depth 1)
auto list_depth(const ListBlock& list) -> size_t;

// Visible text of an inline sequence; line breaks become '\n'
auto inline_text(const InlineSequence& content) -> std::string;

} // namespace clippy