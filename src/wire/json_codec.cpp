#include "clippy/wire/json_codec.hpp"
#include <cstdint>
#include <limits>
#include <string>

namespace clippy::wire {

namespace {

// --- Encoding ---

auto formatting_to_json(const Formatting& formatting) -> Json {
    auto flags = Json::object();
    for (auto kind : ALL_FORMATTING_KINDS) {
        bool set = false;
        switch (kind) {
        case FormattingKind::BOLD:
            set = formatting.bold;
            break;
        case FormattingKind::ITALIC:
            set = formatting.italic;
            break;
        case FormattingKind::UNDERLINE:
            set = formatting.underline;
            break;
        case FormattingKind::STRIKETHROUGH:
            set = formatting.strikethrough;
            break;
        case FormattingKind::CODE:
            set = formatting.code;
            break;
        }
        if (set) {
            flags[to_string(kind)] = true;
        }
    }
    return flags;
}

auto inline_to_json(const InlineSequence& content) -> Json {
    auto items = Json::array();
    for (const auto& item : content) {
        items.push_back(std::visit(overloaded{
                                       [](const TextSpan& span) {
                                           Json json{{"type", "text"}, {"text", span.text}};
                                           if (span.formatting.any()) {
                                               json["formatting"] = formatting_to_json(span.formatting);
                                           }
                                           return json;
                                       },
                                       [](const LinkSpan& link) {
                                           Json json{{"type", "link"}, {"url", link.url}, {"text", link.text}};
                                           if (link.formatting.any()) {
                                               json["formatting"] = formatting_to_json(link.formatting);
                                           }
                                           return json;
                                       },
                                       [](const LineBreak&) { return Json{{"type", "linebreak"}}; },
                                   },
                                   item));
    }
    return items;
}

auto list_to_json(const ListBlock& list) -> Json {
    auto items = Json::array();
    for (const auto& item : list.items) {
        Json json{{"id", item.id}, {"content", inline_to_json(item.content)}};
        if (item.nested) {
            json["nested"] = list_to_json(*item.nested);
        }
        items.push_back(std::move(json));
    }
    return Json{{"id", list.id},
                {"type", "list"},
                {"listType", to_string(list.list_type)},
                {"items", std::move(items)}};
}

auto block_to_json(const ContentBlock& block) -> Json {
    return std::visit(
        overloaded{
            [](const ParagraphBlock& paragraph) {
                return Json{{"id", paragraph.id},
                            {"type", "paragraph"},
                            {"content", inline_to_json(paragraph.content)}};
            },
            [](const HeadingBlock& heading) {
                return Json{{"id", heading.id},
                            {"type", "heading"},
                            {"level", heading.level},
                            {"content", inline_to_json(heading.content)}};
            },
            [](const ListBlock& list) { return list_to_json(list); },
            [](const QuoteBlock& quote) {
                Json json{{"id", quote.id}, {"type", "quote"}, {"content", inline_to_json(quote.content)}};
                if (quote.citation) {
                    json["citation"] = *quote.citation;
                }
                return json;
            },
            [](const CodeBlock& code) {
                Json json{{"id", code.id}, {"type", "code"}, {"content", code.content}};
                if (code.language) {
                    json["language"] = *code.language;
                }
                return json;
            },
            [](const DividerBlock& divider) { return Json{{"id", divider.id}, {"type", "divider"}}; },
        },
        block);
}

// --- Lenient decoding ---

auto string_field(const Json& object, const char* key) -> std::optional<std::string> {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// Heading level when it is an integer that fits an int
auto heading_level_field(const Json& object) -> std::optional<int> {
    auto it = object.find("level");
    if (it == object.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        auto level = it->get<uint64_t>();
        if (level > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            return std::nullopt;
        }
        return static_cast<int>(level);
    }
    auto level = it->get<int64_t>();
    if (level < std::numeric_limits<int>::min() || level > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(level);
}

auto formatting_from_json(const Json& object) -> Formatting {
    Formatting formatting;
    auto it = object.find("formatting");
    if (it == object.end() || !it->is_object()) {
        return formatting;
    }
    for (const auto& entry : it->items()) {
        auto kind = formatting_kind_from_string(entry.key());
        if (!kind || !entry.value().is_boolean()) {
            continue;
        }
        bool set = entry.value().get<bool>();
        switch (*kind) {
        case FormattingKind::BOLD:
            formatting.bold = set;
            break;
        case FormattingKind::ITALIC:
            formatting.italic = set;
            break;
        case FormattingKind::UNDERLINE:
            formatting.underline = set;
            break;
        case FormattingKind::STRIKETHROUGH:
            formatting.strikethrough = set;
            break;
        case FormattingKind::CODE:
            formatting.code = set;
            break;
        }
    }
    return formatting;
}

auto inline_from_json(const Json& object) -> InlineSequence {
    InlineSequence content;
    auto it = object.find("content");
    if (it == object.end() || !it->is_array()) {
        return content;
    }
    for (const auto& item : *it) {
        if (!item.is_object()) {
            continue;
        }
        auto type = string_field(item, "type").value_or("");
        if (type == "text") {
            content.emplace_back(TextSpan{.text = string_field(item, "text").value_or(""),
                                          .formatting = formatting_from_json(item)});
        } else if (type == "link") {
            content.emplace_back(LinkSpan{.url = string_field(item, "url").value_or(""),
                                          .text = string_field(item, "text").value_or(""),
                                          .formatting = formatting_from_json(item)});
        } else if (type == "linebreak") {
            content.emplace_back(LineBreak{});
        }
    }
    return content;
}

auto list_from_json(const Json& object) -> ListBlock {
    ListBlock list{.id = string_field(object, "id").value_or(""),
                   .list_type = list_type_from_string(string_field(object, "listType").value_or(""))
                                    .value_or(ListType::BULLETED),
                   .items = {}};

    auto it = object.find("items");
    if (it == object.end() || !it->is_array()) {
        return list;
    }
    for (const auto& item_json : *it) {
        if (!item_json.is_object()) {
            continue;
        }
        ListItem item(string_field(item_json, "id").value_or(""), inline_from_json(item_json));
        auto nested = item_json.find("nested");
        if (nested != item_json.end() && nested->is_object()) {
            item.nested = std::make_unique<ListBlock>(list_from_json(*nested));
        }
        list.items.push_back(std::move(item));
    }
    return list;
}

auto block_from_json(const Json& object) -> std::optional<ContentBlock> {
    auto type = block_kind_from_string(string_field(object, "type").value_or(""));
    if (!type) {
        return std::nullopt;
    }
    auto id = string_field(object, "id").value_or("");

    switch (*type) {
    case BlockKind::PARAGRAPH:
        return ParagraphBlock{.id = std::move(id), .content = inline_from_json(object)};
    case BlockKind::HEADING:
        return HeadingBlock{.id = std::move(id),
                            .level = heading_level_field(object).value_or(0),
                            .content = inline_from_json(object)};
    case BlockKind::LIST:
        return list_from_json(object);
    case BlockKind::QUOTE:
        return QuoteBlock{.id = std::move(id),
                          .content = inline_from_json(object),
                          .citation = string_field(object, "citation")};
    case BlockKind::CODE:
        return CodeBlock{.id = std::move(id),
                         .content = string_field(object, "content").value_or(""),
                         .language = string_field(object, "language")};
    case BlockKind::DIVIDER:
        return DividerBlock{.id = std::move(id)};
    }
    return std::nullopt;
}

auto metadata_from_json(const Json& object) -> ContentMetadata {
    ContentMetadata metadata;
    metadata.source_url = string_field(object, "sourceUrl");
    metadata.source_domain = string_field(object, "sourceDomain");
    metadata.captured_at = string_field(object, "capturedAt");
    if (auto format = string_field(object, "originalFormat")) {
        metadata.original_format = original_format_from_string(*format);
    }
    return metadata;
}

// --- Shape checks ---

class ShapeCheck {
public:
    explicit ShapeCheck(ValidationResult& result) : result_(result) {}

    auto content(const Json& value) -> void {
        if (!value.is_object()) {
            result_.add_error("Content must be a JSON object");
            return;
        }
        auto version = value.find("version");
        if (version == value.end() || !version->is_string()) {
            result_.add_error("Content version must be a string");
        }

        auto blocks = value.find("blocks");
        if (blocks == value.end() || !blocks->is_array()) {
            result_.add_error("Content blocks must be an array");
        } else {
            for (size_t i = 0; i < blocks->size(); ++i) {
                block((*blocks)[i], "Block " + std::to_string(i) + ": ");
            }
        }

        auto metadata = value.find("metadata");
        if (metadata != value.end()) {
            metadata_shape(*metadata);
        }
    }

private:
    auto expect_string(const Json& object, const char* key, const std::string& location,
                       bool required) -> void {
        auto it = object.find(key);
        if (it == object.end()) {
            if (required) {
                result_.add_error(location + "Missing \"" + std::string(key) + "\"");
            }
            return;
        }
        if (!it->is_string()) {
            result_.add_error(location + "\"" + std::string(key) + "\" must be a string");
        }
    }

    auto block(const Json& value, const std::string& location) -> void {
        if (!value.is_object()) {
            result_.add_error(location + "Block must be an object");
            return;
        }
        expect_string(value, "id", location, true);

        auto type_name = string_field(value, "type");
        if (!type_name) {
            result_.add_error(location + "Block type must be a string");
            return;
        }
        auto type = block_kind_from_string(*type_name);
        if (!type) {
            result_.add_error(location + "Unknown block type: " + *type_name);
            return;
        }

        switch (*type) {
        case BlockKind::PARAGRAPH:
            inline_array(value, location);
            break;
        case BlockKind::HEADING: {
            auto level = value.find("level");
            if (level == value.end() || !level->is_number_integer()) {
                result_.add_error(location + "Heading level must be an integer");
            } else if (!heading_level_field(value)) {
                result_.add_error(location + "Heading level " + level->dump() + " outside 1-6");
            }
            inline_array(value, location);
            break;
        }
        case BlockKind::LIST:
            list(value, location);
            break;
        case BlockKind::QUOTE:
            inline_array(value, location);
            expect_string(value, "citation", location, false);
            break;
        case BlockKind::CODE:
            expect_string(value, "content", location, true);
            expect_string(value, "language", location, false);
            break;
        case BlockKind::DIVIDER:
            break;
        }
    }

    auto list(const Json& value, const std::string& location) -> void {
        auto list_type = string_field(value, "listType");
        if (!list_type || !list_type_from_string(*list_type)) {
            result_.add_error(location + "List type must be \"bulleted\" or \"numbered\"");
        }
        auto items = value.find("items");
        if (items == value.end() || !items->is_array()) {
            result_.add_error(location + "List items must be an array");
            return;
        }
        for (size_t i = 0; i < items->size(); ++i) {
            const auto& item = (*items)[i];
            auto item_location = location + "Item " + std::to_string(i) + ": ";
            if (!item.is_object()) {
                result_.add_error(item_location + "List item must be an object");
                continue;
            }
            expect_string(item, "id", item_location, true);
            inline_array(item, item_location);
            auto nested = item.find("nested");
            if (nested != item.end()) {
                if (nested->is_object()) {
                    list(*nested, item_location);
                } else {
                    result_.add_error(item_location + "Nested list must be an object");
                }
            }
        }
    }

    auto inline_array(const Json& value, const std::string& location) -> void {
        auto content = value.find("content");
        if (content == value.end() || !content->is_array()) {
            result_.add_error(location + "Content must be an array");
            return;
        }
        for (size_t i = 0; i < content->size(); ++i) {
            inline_item((*content)[i], location + "Inline " + std::to_string(i) + ": ");
        }
    }

    auto inline_item(const Json& value, const std::string& location) -> void {
        if (!value.is_object()) {
            result_.add_error(location + "Inline content must be an object");
            return;
        }
        auto type = string_field(value, "type");
        if (!type) {
            result_.add_error(location + "Inline type must be a string");
            return;
        }
        if (*type == "text") {
            expect_string(value, "text", location, true);
        } else if (*type == "link") {
            expect_string(value, "url", location, true);
            expect_string(value, "text", location, true);
        } else if (*type != "linebreak") {
            result_.add_error(location + "Unknown inline type: " + *type);
            return;
        }

        auto formatting = value.find("formatting");
        if (formatting == value.end()) {
            return;
        }
        if (!formatting->is_object()) {
            result_.add_error(location + "Formatting must be an object");
            return;
        }
        for (const auto& entry : formatting->items()) {
            const auto& key = entry.key();
            if (!formatting_kind_from_string(key)) {
                result_.add_warning(location + "Unknown formatting key: " + key);
            } else if (!entry.value().is_boolean()) {
                result_.add_error(location + "Formatting flag \"" + key + "\" must be a boolean");
            }
        }
    }

    auto metadata_shape(const Json& value) -> void {
        std::string location = "Metadata: ";
        if (!value.is_object()) {
            result_.add_error(location + "Metadata must be an object");
            return;
        }
        for (const char* key : {"sourceUrl", "sourceDomain", "capturedAt", "originalFormat"}) {
            expect_string(value, key, location, false);
        }
        if (auto format = string_field(value, "originalFormat")) {
            if (!original_format_from_string(*format)) {
                result_.add_error(location + "Unknown original format: " + *format);
            }
        }
    }

    ValidationResult& result_;
};

} // namespace

auto content_to_json(const ClippyContent& content) -> Json {
    auto blocks = Json::array();
    for (const auto& block : content.blocks) {
        blocks.push_back(block_to_json(block));
    }

    Json json{{"version", content.version}, {"blocks", std::move(blocks)}};

    if (content.metadata) {
        const auto& metadata = *content.metadata;
        auto meta = Json::object();
        if (metadata.source_url) {
            meta["sourceUrl"] = *metadata.source_url;
        }
        if (metadata.source_domain) {
            meta["sourceDomain"] = *metadata.source_domain;
        }
        if (metadata.captured_at) {
            meta["capturedAt"] = *metadata.captured_at;
        }
        if (metadata.original_format) {
            meta["originalFormat"] = to_string(*metadata.original_format);
        }
        json["metadata"] = std::move(meta);
    }
    return json;
}

auto content_from_json(const Json& value) -> std::optional<ClippyContent> {
    if (!value.is_object()) {
        return std::nullopt;
    }

    ClippyContent content;
    content.version = string_field(value, "version").value_or("");

    auto blocks = value.find("blocks");
    if (blocks != value.end() && blocks->is_array()) {
        for (const auto& block_json : *blocks) {
            if (!block_json.is_object()) {
                continue;
            }
            if (auto block = block_from_json(block_json)) {
                content.blocks.push_back(std::move(*block));
            }
        }
    }

    auto metadata = value.find("metadata");
    if (metadata != value.end() && metadata->is_object()) {
        content.metadata = metadata_from_json(*metadata);
    }
    return content;
}

auto content_from_json_text(std::string_view text) -> std::optional<ClippyContent> {
    auto value = Json::parse(text.begin(), text.end(), nullptr, false);
    if (value.is_discarded()) {
        return std::nullopt;
    }
    return content_from_json(value);
}

auto validate_wire(const Json& value, const ContentLimits& limits) -> ValidationResult {
    ValidationResult result;
    ShapeCheck(result).content(value);
    if (!result.is_valid) {
        return result;
    }
    if (auto content = content_from_json(value)) {
        result.merge(validate(*content, limits));
    }
    return result;
}

auto delta_to_json(const QuillDelta& delta) -> Json {
    auto ops = Json::array();
    for (const auto& op : delta.ops) {
        Json json{{"insert", op.insert}};
        if (!op.attributes.empty()) {
            auto attributes = Json::object();
            for (const auto& [name, value] : op.attributes) {
                attributes[name] = std::visit([](const auto& v) { return Json(v); }, value);
            }
            json["attributes"] = std::move(attributes);
        }
        ops.push_back(std::move(json));
    }
    return Json{{"ops", std::move(ops)}};
}

} // namespace clippy::wire
