#include "clippy/core/content.hpp"

namespace clippy {

auto operator|(const Formatting& lhs, const Formatting& rhs) -> Formatting {
    return Formatting{.bold = lhs.bold || rhs.bold,
                      .italic = lhs.italic || rhs.italic,
                      .underline = lhs.underline || rhs.underline,
                      .strikethrough = lhs.strikethrough || rhs.strikethrough,
                      .code = lhs.code || rhs.code};
}

ListItem::ListItem() = default;

ListItem::ListItem(std::string item_id, InlineSequence item_content)
    : id(std::move(item_id)), content(std::move(item_content)) {}

ListItem::ListItem(std::string item_id, InlineSequence item_content, ListBlock nested_list)
    : id(std::move(item_id)), content(std::move(item_content)),
      nested(std::make_unique<ListBlock>(std::move(nested_list))) {}

ListItem::ListItem(const ListItem& other)
    : id(other.id), content(other.content),
      nested(other.nested ? std::make_unique<ListBlock>(*other.nested) : nullptr) {}

ListItem::ListItem(ListItem&& other) noexcept = default;

auto ListItem::operator=(const ListItem& other) -> ListItem& {
    if (this != &other) {
        id = other.id;
        content = other.content;
        nested = other.nested ? std::make_unique<ListBlock>(*other.nested) : nullptr;
    }
    return *this;
}

auto ListItem::operator=(ListItem&& other) noexcept -> ListItem& = default;

ListItem::~ListItem() = default;

auto ListItem::operator==(const ListItem& other) const -> bool {
    if (id != other.id || content != other.content) {
        return false;
    }
    if (!nested || !other.nested) {
        return !nested && !other.nested;
    }
    return *nested == *other.nested;
}

auto to_string(BlockKind kind) -> std::string {
    switch (kind) {
    case BlockKind::PARAGRAPH:
        return "paragraph";
    case BlockKind::HEADING:
        return "heading";
    case BlockKind::LIST:
        return "list";
    case BlockKind::QUOTE:
        return "quote";
    case BlockKind::CODE:
        return "code";
    case BlockKind::DIVIDER:
        return "divider";
    }
    return "unknown";
}

auto to_string(FormattingKind kind) -> std::string {
    switch (kind) {
    case FormattingKind::BOLD:
        return "bold";
    case FormattingKind::ITALIC:
        return "italic";
    case FormattingKind::UNDERLINE:
        return "underline";
    case FormattingKind::STRIKETHROUGH:
        return "strikethrough";
    case FormattingKind::CODE:
        return "code";
    }
    return "unknown";
}

auto to_string(ListType type) -> std::string {
    switch (type) {
    case ListType::BULLETED:
        return "bulleted";
    case ListType::NUMBERED:
        return "numbered";
    }
    return "unknown";
}

auto to_string(OriginalFormat format) -> std::string {
    switch (format) {
    case OriginalFormat::HTML:
        return "html";
    case OriginalFormat::TEXT:
        return "text";
    }
    return "unknown";
}

auto block_kind_from_string(std::string_view name) -> std::optional<BlockKind> {
    if (name == "paragraph") return BlockKind::PARAGRAPH;
    if (name == "heading") return BlockKind::HEADING;
    if (name == "list") return BlockKind::LIST;
    if (name == "quote") return BlockKind::QUOTE;
    if (name == "code") return BlockKind::CODE;
    if (name == "divider") return BlockKind::DIVIDER;
    return std::nullopt;
}

auto formatting_kind_from_string(std::string_view name) -> std::optional<FormattingKind> {
    if (name == "bold") return FormattingKind::BOLD;
    if (name == "italic") return FormattingKind::ITALIC;
    if (name == "underline") return FormattingKind::UNDERLINE;
    if (name == "strikethrough") return FormattingKind::STRIKETHROUGH;
    if (name == "code") return FormattingKind::CODE;
    return std::nullopt;
}

auto list_type_from_string(std::string_view name) -> std::optional<ListType> {
    if (name == "bulleted") return ListType::BULLETED;
    if (name == "numbered") return ListType::NUMBERED;
    return std::nullopt;
}

auto original_format_from_string(std::string_view name) -> std::optional<OriginalFormat> {
    if (name == "html") return OriginalFormat::HTML;
    if (name == "text") return OriginalFormat::TEXT;
    return std::nullopt;
}

} // namespace clippy