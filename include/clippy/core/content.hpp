#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace clippy {

inline constexpr std::string_view CONTENT_VERSION = "1.0";

// Helper for exhaustive std::visit dispatch
template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// Formatting flags carried by text and link spans. All false means "no formatting".
struct Formatting {
    bool bold = false;
    bool italic = false;
    bool underline = false;
    bool strikethrough = false;
    bool code = false;

    auto any() const -> bool { return bold || italic || underline || strikethrough || code; }

    auto operator==(const Formatting& other) const -> bool = default;
};

// Union of two formatting sets (a flag is set if set in either)
auto operator|(const Formatting& lhs, const Formatting& rhs) -> Formatting;

// --- Inline content ---

struct TextSpan {
    std::string text;
    Formatting formatting;

    auto operator==(const TextSpan& other) const -> bool = default;
};

struct LinkSpan {
    std::string url;
    std::string text;
    Formatting formatting;

    auto operator==(const LinkSpan& other) const -> bool = default;
};

struct LineBreak {
    auto operator==(const LineBreak& other) const -> bool = default;
};

using InlineContent = std::variant<TextSpan, LinkSpan, LineBreak>;
using InlineSequence = std::vector<InlineContent>;

// --- Blocks ---

enum class ListType {
    BULLETED,
    NUMBERED
};

struct ListBlock;

// A list item owns at most one nested list. Copies are deep.
struct ListItem {
    std::string id;
    InlineSequence content;
    std::unique_ptr<ListBlock> nested;

    ListItem();
    ListItem(std::string item_id, InlineSequence item_content);
    ListItem(std::string item_id, InlineSequence item_content, ListBlock nested_list);
    ListItem(const ListItem& other);
    ListItem(ListItem&& other) noexcept;
    auto operator=(const ListItem& other) -> ListItem&;
    auto operator=(ListItem&& other) noexcept -> ListItem&;
    ~ListItem();

    auto operator==(const ListItem& other) const -> bool;
};

struct ListBlock {
    std::string id;
    ListType list_type = ListType::BULLETED;
    std::vector<ListItem> items;

    auto operator==(const ListBlock& other) const -> bool = default;
};

struct ParagraphBlock {
    std::string id;
    InlineSequence content;

    auto operator==(const ParagraphBlock& other) const -> bool = default;
};

struct HeadingBlock {
    std::string id;
    int level = 1;  // 1-6
    InlineSequence content;

    auto operator==(const HeadingBlock& other) const -> bool = default;
};

struct QuoteBlock {
    std::string id;
    InlineSequence content;
    std::optional<std::string> citation;

    auto operator==(const QuoteBlock& other) const -> bool = default;
};

struct CodeBlock {
    std::string id;
    std::string content;  // Raw text, never formatted
    std::optional<std::string> language;

    auto operator==(const CodeBlock& other) const -> bool = default;
};

struct DividerBlock {
    std::string id;

    auto operator==(const DividerBlock& other) const -> bool = default;
};

using ContentBlock =
    std::variant<ParagraphBlock, HeadingBlock, ListBlock, QuoteBlock, CodeBlock, DividerBlock>;

// --- Document ---

enum class OriginalFormat {
    HTML,
    TEXT
};

struct ContentMetadata {
    std::optional<std::string> source_url;
    std::optional<std::string> source_domain;
    std::optional<std::string> captured_at;  // ISO 8601
    std::optional<OriginalFormat> original_format;

    auto operator==(const ContentMetadata& other) const -> bool = default;
};

struct ClippyContent {
    std::string version{CONTENT_VERSION};
    std::vector<ContentBlock> blocks;
    std::optional<ContentMetadata> metadata;

    auto operator==(const ClippyContent& other) const -> bool = default;
};

// --- Kind enumerations used by capability records and the wire format ---

enum class BlockKind {
    PARAGRAPH,
    HEADING,
    LIST,
    QUOTE,
    CODE,
    DIVIDER
};

enum class FormattingKind {
    BOLD,
    ITALIC,
    UNDERLINE,
    STRIKETHROUGH,
    CODE
};

inline constexpr FormattingKind ALL_FORMATTING_KINDS[] = {
    FormattingKind::BOLD, FormattingKind::ITALIC, FormattingKind::UNDERLINE,
    FormattingKind::STRIKETHROUGH, FormattingKind::CODE};

auto to_string(BlockKind kind) -> std::string;
auto to_string(FormattingKind kind) -> std::string;
auto to_string(ListType type) -> std::string;
auto to_string(OriginalFormat format) -> std::string;

auto block_kind_from_string(std::string_view name) -> std::optional<BlockKind>;
auto formatting_kind_from_string(std::string_view name) -> std::optional<FormattingKind>;
auto list_type_from_string(std::string_view name) -> std::optional<ListType>;
auto original_format_from_string(std::string_view name) -> std::optional<OriginalFormat>;

} // namespace clippy