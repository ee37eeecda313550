#include "clippy/parsers/block_parser.hpp"
#include "clippy/core/content_ops.hpp"
#include "clippy/core/text_utils.hpp"
#include "clippy/core/timestamps.hpp"
#include "clippy/logging/logger.hpp"
#include "clippy/parsers/html_tree.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <span>
#include <vector>

namespace clippy {

namespace {

constexpr std::array<std::string_view, 9> SKIPPED_TAGS = {
    "script", "style", "template", "noscript", "head", "title", "meta", "link", "base"};

constexpr std::array<std::string_view, 33> INLINE_TAGS = {
    "a",    "abbr", "acronym", "b",     "bdi",  "bdo",  "big",  "cite",   "data",
    "dfn",  "del",  "em",      "font",  "i",    "img",  "ins",  "kbd",    "label",
    "mark", "s",    "samp",    "small", "span", "strike", "strong", "sub", "sup",
    "time", "tt",   "u",       "var",   "wbr",  "nobr"};

constexpr std::array<std::string_view, 15> GENERIC_CONTAINERS = {
    "div",    "section", "article", "main",   "header", "footer",  "aside",     "nav",
    "figure", "body",    "center",  "form",   "details", "summary", "figcaption"};

constexpr std::array<std::string_view, 35> KNOWN_LANGUAGES = {
    "javascript", "js",   "typescript", "ts",   "python", "py",   "java",  "c",
    "cpp",        "csharp", "cs",       "php",  "ruby",   "go",   "rust",  "swift",
    "kotlin",     "scala", "html",      "css",  "scss",   "sass", "less",  "xml",
    "json",       "yaml", "yml",        "markdown", "md", "bash", "sh",    "sql",
    "r",          "matlab", "julia"};

constexpr std::array<std::string_view, 3> LANGUAGE_PREFIXES = {"language-", "lang-", "highlight-"};

constexpr std::string_view LANGUAGE_SUFFIX = "-code";

auto contains(std::span<const std::string_view> names, std::string_view name) -> bool {
    return std::find(names.begin(), names.end(), name) != names.end();
}

auto is_list_tag(std::string_view tag) -> bool {
    return tag == "ul" || tag == "ol" || tag == "menu";
}

auto is_heading_tag(std::string_view tag) -> bool {
    return tag.size() == 2 && tag[0] == 'h' && tag[1] >= '1' && tag[1] <= '6';
}

auto is_inline_tag(std::string_view tag) -> bool {
    return contains(INLINE_TAGS, tag);
}

// Elements that start their own block when found among a container's children
auto is_block_tag(std::string_view tag) -> bool {
    return !tag.empty() && !is_inline_tag(tag) && !contains(SKIPPED_TAGS, tag) && tag != "br" &&
           tag != "code";
}

auto has_block_children(const xmlNode* node) -> bool {
    auto children = html::child_nodes(node);
    return std::any_of(children.begin(), children.end(), [](const xmlNode* child) {
        return html::is_element(child) && is_block_tag(html::tag_name(child));
    });
}

auto is_visible_run(std::span<xmlNode* const> run) -> bool {
    return std::any_of(run.begin(), run.end(), [](const xmlNode* node) {
        return html::is_element(node) || !text::is_blank(html::node_text(node));
    });
}

auto with_inherited_logger(InlineParseOptions options, ILogger* logger) -> InlineParseOptions {
    if (options.logger == nullptr) {
        options.logger = logger;
    }
    return options;
}

// Mutable state of a single parse: id counter, logger and collected blocks
class ParseSession {
public:
    explicit ParseSession(const BlockParseOptions& options)
        : options_(options),
          logger_(resolve_logger(options.logger)),
          inline_parser_(with_inherited_logger(options.inline_options, options.logger)),
          timestamp_(options.id_timestamp.value_or(current_epoch_millis())),
          max_nesting_(std::max<size_t>(options.max_nesting_level, 1)) {}

    auto parse_container(const xmlNode* container) -> void {
        std::vector<xmlNode*> run;

        for (auto* child : html::child_nodes(container)) {
            if (html::is_text(child)) {
                run.push_back(child);
                continue;
            }
            if (!html::is_element(child)) {
                continue;  // Comments
            }

            auto tag = html::tag_name(child);
            if (contains(SKIPPED_TAGS, tag)) {
                continue;
            }
            if (tag == "br") {
                // Only meaningful inside a run of inline content
                if (is_visible_run(run)) {
                    run.push_back(child);
                }
                continue;
            }
            if (is_inline_tag(tag) || (tag == "code" && is_visible_run(run))) {
                run.push_back(child);
                continue;
            }

            flush_run(run);
            parse_block(child, tag);
        }

        flush_run(run);
    }

    auto add_text_chunks(std::string_view input) -> void {
        std::vector<std::string> chunk;
        auto emit_chunk = [this, &chunk]() {
            if (chunk.empty()) {
                return;
            }
            std::string joined;
            for (const auto& line : chunk) {
                if (!joined.empty()) {
                    joined += '\n';
                }
                joined += line;
            }
            chunk.clear();

            auto paragraph_text = limit_text(text::trim(joined));
            InlineSequence content;
            content.emplace_back(TextSpan{.text = std::move(paragraph_text), .formatting = {}});
            add_block(ParagraphBlock{.id = next_id(), .content = std::move(content)});
        };

        for (auto& line : text::split_lines(input)) {
            if (text::is_blank(line)) {
                emit_chunk();
            } else {
                chunk.push_back(std::move(line));
            }
        }
        emit_chunk();
    }

    auto finish(OriginalFormat format) -> ClippyContent {
        ClippyContent content;

        if (options_.empty_block_policy == EmptyBlockPolicy::DROP) {
            blocks_ = remove_empty_blocks(blocks_);
        }

        if (blocks_.size() > options_.max_blocks) {
            logger_.warn("Content has " + std::to_string(blocks_.size()) +
                         " blocks, keeping the first " + std::to_string(options_.max_blocks));
            blocks_.erase(blocks_.begin() + static_cast<std::ptrdiff_t>(options_.max_blocks),
                          blocks_.end());
        }
        content.blocks = std::move(blocks_);

        if (options_.preserve_source_info) {
            content.metadata = ContentMetadata{
                .source_url = options_.source_url,
                .source_domain = options_.source_domain,
                .captured_at = options_.captured_at.value_or(current_iso8601()),
                .original_format = format};
        }
        return content;
    }

private:
    auto next_id() -> std::string {
        if (options_.id_policy == IdPolicy::NONE) {
            return "";
        }
        return "block-" + std::to_string(timestamp_) + "-" + std::to_string(counter_++);
    }

    auto add_block(ContentBlock block) -> void { blocks_.push_back(std::move(block)); }

    auto limit_text(std::string value) -> std::string {
        auto limit = options_.inline_options.max_text_length;
        if (value.size() <= limit) {
            return value;
        }
        logger_.warn("Text truncated from " + std::to_string(value.size()) + " to " +
                     std::to_string(limit) + " bytes");
        return text::truncate_utf8(value, limit);
    }

    auto flush_run(std::vector<xmlNode*>& run) -> void {
        if (run.empty()) {
            return;
        }
        auto content = inline_parser_.parse_nodes(run);
        run.clear();
        if (!is_empty_inline(content)) {
            add_block(ParagraphBlock{.id = next_id(), .content = std::move(content)});
        }
    }

    auto parse_block(const xmlNode* node, const std::string& tag) -> void {
        if (tag == "p" || tag == "address") {
            add_paragraph(node);
        } else if (is_heading_tag(tag)) {
            auto id = next_id();
            add_block(HeadingBlock{.id = std::move(id),
                                   .level = tag[1] - '0',
                                   .content = inline_parser_.parse_children(node)});
        } else if (is_list_tag(tag)) {
            add_block(parse_list(node, 1));
        } else if (tag == "blockquote" || tag == "q") {
            add_quote(node);
        } else if (tag == "pre" || tag == "code") {
            add_block(parse_code(node, tag));
        } else if (tag == "hr") {
            add_block(DividerBlock{.id = next_id()});
        } else if (contains(GENERIC_CONTAINERS, tag)) {
            if (has_block_children(node)) {
                parse_container(node);
            } else {
                add_paragraph(node);
            }
        } else {
            logger_.warn("Unsupported element <" + tag + "> converted to paragraph");
            add_paragraph(node);
        }
    }

    auto add_paragraph(const xmlNode* node) -> void {
        auto id = next_id();
        add_block(ParagraphBlock{.id = std::move(id), .content = inline_parser_.parse_children(node)});
    }

    auto add_quote(const xmlNode* node) -> void {
        auto id = next_id();
        QuoteBlock quote{.id = std::move(id),
                         .content = inline_parser_.parse_children(node),
                         .citation = std::nullopt};
        if (auto cite = html::attribute(node, "cite")) {
            auto citation = text::trim(*cite);
            if (!citation.empty()) {
                quote.citation = std::move(citation);
            }
        }
        add_block(std::move(quote));
    }

    auto parse_code(const xmlNode* node, const std::string& tag) -> CodeBlock {
        const xmlNode* inner = tag == "pre" ? html::first_child_element(node, "code") : nullptr;
        const xmlNode* source = inner != nullptr ? inner : node;

        std::optional<std::string> language;
        for (const auto* candidate : {inner, node}) {
            if (candidate == nullptr) {
                continue;
            }
            if (auto class_attribute = html::attribute(candidate, "class")) {
                language = extract_language_from_class(*class_attribute);
                if (language) {
                    break;
                }
            }
        }

        return CodeBlock{.id = next_id(),
                         .content = limit_text(html::text_content(source)),
                         .language = std::move(language)};
    }

    auto parse_list(const xmlNode* node, size_t depth) -> ListBlock {
        ListBlock list{.id = next_id(),
                       .list_type = html::tag_name(node) == "ol" ? ListType::NUMBERED
                                                                 : ListType::BULLETED,
                       .items = {}};

        for (auto* child : html::child_nodes(node)) {
            if (html::is_element(child) && html::tag_name(child) == "li") {
                append_item(list, child, depth);
            }
        }
        return list;
    }

    // Splits an <li> into its inline nodes and its direct child lists
    auto split_item(const xmlNode* item, std::vector<xmlNode*>& inline_nodes,
                    std::vector<xmlNode*>& nested_lists) -> void {
        for (auto* child : html::child_nodes(item)) {
            if (html::is_element(child) && is_list_tag(html::tag_name(child))) {
                nested_lists.push_back(child);
            } else {
                inline_nodes.push_back(child);
            }
        }
        if (nested_lists.size() > 1) {
            logger_.debug("List item has " + std::to_string(nested_lists.size()) +
                          " nested lists, keeping the first");
        }
    }

    auto append_item(ListBlock& list, const xmlNode* item_node, size_t depth) -> void {
        std::vector<xmlNode*> inline_nodes;
        std::vector<xmlNode*> nested_lists;
        split_item(item_node, inline_nodes, nested_lists);

        auto id = next_id();
        ListItem item(std::move(id), inline_parser_.parse_nodes(inline_nodes));

        if (nested_lists.empty()) {
            list.items.push_back(std::move(item));
            return;
        }

        if (depth < max_nesting_) {
            item.nested = std::make_unique<ListBlock>(parse_list(nested_lists.front(), depth + 1));
            list.items.push_back(std::move(item));
            return;
        }

        logger_.warn("List nesting exceeds " + std::to_string(max_nesting_) +
                     " levels, flattening deeper items");
        list.items.push_back(std::move(item));
        flatten_into(list, nested_lists.front());
    }

    // Appends every item of the subtree to `list` in document order, without nesting
    auto flatten_into(ListBlock& list, const xmlNode* nested_node) -> void {
        for (auto* child : html::child_nodes(nested_node)) {
            if (!html::is_element(child) || html::tag_name(child) != "li") {
                continue;
            }
            std::vector<xmlNode*> inline_nodes;
            std::vector<xmlNode*> nested_lists;
            split_item(child, inline_nodes, nested_lists);

            auto id = next_id();
            list.items.emplace_back(std::move(id), inline_parser_.parse_nodes(inline_nodes));
            if (!nested_lists.empty()) {
                flatten_into(list, nested_lists.front());
            }
        }
    }

    const BlockParseOptions& options_;
    ILogger& logger_;
    InlineParser inline_parser_;
    int64_t timestamp_;
    size_t max_nesting_;
    uint64_t counter_ = 0;
    std::vector<ContentBlock> blocks_;
};

} // namespace

BlockParser::BlockParser(BlockParseOptions options) : options_(std::move(options)) {}

auto BlockParser::parse(std::string_view markup) const -> ClippyContent {
    ParseSession session(options_);
    if (!text::is_blank(markup)) {
        auto document = html::HtmlDocument::parse(markup);
        if (document) {
            session.parse_container(document->body());
        } else {
            resolve_logger(options_.logger).error("Failed to parse markup");
        }
    }
    return session.finish(OriginalFormat::HTML);
}

auto BlockParser::parse_text(std::string_view text) const -> ClippyContent {
    ParseSession session(options_);
    session.add_text_chunks(text);
    return session.finish(OriginalFormat::TEXT);
}

auto parse_document(std::string_view markup, const BlockParseOptions& options) -> ClippyContent {
    return BlockParser(options).parse(markup);
}

auto parse_text(std::string_view text, const BlockParseOptions& options) -> ClippyContent {
    return BlockParser(options).parse_text(text);
}

auto extract_language_from_class(std::string_view class_attribute) -> std::optional<std::string> {
    auto tokens = text::split_by_whitespace(text::to_lowercase(class_attribute));

    for (auto prefix : LANGUAGE_PREFIXES) {
        for (const auto& token : tokens) {
            if (token.size() > prefix.size() && token.starts_with(prefix)) {
                return token.substr(prefix.size());
            }
        }
    }

    for (const auto& token : tokens) {
        if (token.size() > LANGUAGE_SUFFIX.size() && token.ends_with(LANGUAGE_SUFFIX)) {
            return token.substr(0, token.size() - LANGUAGE_SUFFIX.size());
        }
    }

    for (const auto& token : tokens) {
        if (contains(KNOWN_LANGUAGES, token)) {
            return token;
        }
    }
    return std::nullopt;
}

} // namespace clippy