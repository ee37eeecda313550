#include "clippy/validation/content_validator.hpp"
#include "clippy/core/content_ops.hpp"
#include "clippy/core/timestamps.hpp"
#include "clippy/core/url_policy.hpp"
#include <cstddef>
#include <unordered_set>

namespace clippy {

namespace {

auto located(const std::string& location, const std::string& message) -> std::string {
    return location + message;
}

// One validation pass over a document; owns the id set shared by blocks and items
class ValidationWalk {
public:
    ValidationWalk(const ContentLimits& limits, ValidationResult& result)
        : limits_(limits), result_(result) {}

    auto check_block(const ContentBlock& block, const std::string& location) -> void {
        if (block.valueless_by_exception()) {
            result_.add_error(located(location, "Malformed block"));
            return;
        }

        check_id(block_id(block), location, "Block");

        std::visit(overloaded{
                       [&](const ParagraphBlock& paragraph) {
                           check_inline(paragraph.content, location);
                       },
                       [&](const HeadingBlock& heading) {
                           if (heading.level < 1 || heading.level > 6) {
                               result_.add_error(located(
                                   location, "Heading level " + std::to_string(heading.level) +
                                                 " outside 1-6"));
                           }
                           check_inline(heading.content, location);
                       },
                       [&](const ListBlock& list) { check_list(list, location, 1); },
                       [&](const QuoteBlock& quote) {
                           check_inline(quote.content, location);
                           if (quote.citation &&
                               quote.citation->size() > limits_.max_citation_length) {
                               result_.add_warning(located(
                                   location, "Citation exceeds " +
                                                 std::to_string(limits_.max_citation_length) +
                                                 " characters"));
                           }
                       },
                       [&](const CodeBlock& code) {
                           if (code.content.size() > limits_.max_text_length) {
                               result_.add_warning(located(
                                   location, "Code exceeds " +
                                                 std::to_string(limits_.max_text_length) +
                                                 " characters"));
                           }
                       },
                       [](const DividerBlock&) {},
                   },
                   block);
    }

private:
    auto check_id(const std::string& id, const std::string& location, const std::string& what)
        -> void {
        if (id.empty()) {
            result_.add_error(located(location, what + " id must not be empty"));
            return;
        }
        if (!ids_.insert(id).second) {
            result_.add_error(located(location, "Duplicate id: " + id));
        }
    }

    auto check_list(const ListBlock& list, const std::string& location, size_t depth) -> void {
        if (list.list_type != ListType::BULLETED && list.list_type != ListType::NUMBERED) {
            result_.add_error(located(location, "Invalid list type"));
        }
        if (depth > limits_.max_nesting_level) {
            result_.add_warning(located(location, "List nesting depth " + std::to_string(depth) +
                                                      " exceeds " +
                                                      std::to_string(limits_.max_nesting_level)));
        }
        if (list.items.size() > limits_.max_list_items) {
            result_.add_warning(located(location, "List has " + std::to_string(list.items.size()) +
                                                      " items, more than " +
                                                      std::to_string(limits_.max_list_items)));
        }

        for (size_t i = 0; i < list.items.size(); ++i) {
            const auto& item = list.items[i];
            auto item_location = location + "Item " + std::to_string(i) + ": ";
            check_id(item.id, item_location, "List item");
            check_inline(item.content, item_location);
            if (item.nested) {
                check_list(*item.nested, item_location, depth + 1);
            }
        }
    }

    auto check_inline(const InlineSequence& content, const std::string& location) -> void {
        for (size_t i = 0; i < content.size(); ++i) {
            const auto& inline_content = content[i];
            auto inline_location = location + "Inline " + std::to_string(i) + ": ";
            if (inline_content.valueless_by_exception()) {
                result_.add_error(located(inline_location, "Malformed inline content"));
                continue;
            }

            std::visit(overloaded{
                           [&](const TextSpan& span) { check_text_length(span.text, inline_location); },
                           [&](const LinkSpan& link) { check_link(link, inline_location); },
                           [](const LineBreak&) {},
                       },
                       inline_content);
        }

        if (has_unmerged_text_spans(content)) {
            result_.add_warning(
                located(location, "Adjacent text spans with identical formatting are not merged"));
        }
    }

    auto check_text_length(const std::string& text, const std::string& location) -> void {
        if (text.size() > limits_.max_text_length) {
            result_.add_warning(located(
                location, "Text exceeds " + std::to_string(limits_.max_text_length) + " characters"));
        }
    }

    auto check_link(const LinkSpan& link, const std::string& location) -> void {
        check_text_length(link.text, location);
        if (link.url.empty()) {
            result_.add_error(located(location, "Link URL must not be empty"));
            return;
        }
        if (link.url.size() > limits_.max_url_length) {
            result_.add_warning(located(
                location, "Link URL exceeds " + std::to_string(limits_.max_url_length) + " characters"));
        } else if (!is_allowed_url(link.url, limits_.max_url_length)) {
            result_.add_warning(located(location, "Link URL not allowed: " + link.url));
        }
    }

    const ContentLimits& limits_;
    ValidationResult& result_;
    std::unordered_set<std::string> ids_;
};

auto collect_ids(const ListBlock& list, std::unordered_set<std::string>& ids) -> void {
    for (const auto& item : list.items) {
        if (!item.id.empty()) {
            ids.insert(item.id);
        }
        if (item.nested) {
            collect_ids(*item.nested, ids);
        }
    }
}

// Hands out "block-sanitized-<n>" ids that do not collide with existing ones
class SanitizedIds {
public:
    explicit SanitizedIds(std::unordered_set<std::string> used) : used_(std::move(used)) {}

    auto next() -> std::string {
        std::string id;
        do {
            id = "block-sanitized-" + std::to_string(counter_++);
        } while (used_.contains(id));
        used_.insert(id);
        return id;
    }

    auto fill(ListBlock& list) -> void {
        for (auto& item : list.items) {
            if (item.id.empty()) {
                item.id = next();
            }
            if (item.nested) {
                fill(*item.nested);
            }
        }
    }

private:
    std::unordered_set<std::string> used_;
    size_t counter_ = 0;
};

} // namespace

auto ValidationResult::add_error(std::string message) -> void {
    errors.push_back(std::move(message));
    is_valid = false;
}

auto ValidationResult::add_warning(std::string message) -> void {
    warnings.push_back(std::move(message));
}

auto ValidationResult::merge(const ValidationResult& other) -> void {
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    is_valid = is_valid && other.is_valid;
}

ContentValidator::ContentValidator(ContentLimits limits) : limits_(limits) {}

auto ContentValidator::validate(const ClippyContent& content) const -> ValidationResult {
    ValidationResult result;

    if (content.version != CONTENT_VERSION) {
        result.add_error("Unsupported content version: \"" + content.version + "\"");
    }
    if (content.blocks.size() > limits_.max_blocks) {
        result.add_warning("Content has " + std::to_string(content.blocks.size()) +
                           " blocks, more than " + std::to_string(limits_.max_blocks));
    }

    ValidationWalk walk(limits_, result);
    for (size_t i = 0; i < content.blocks.size(); ++i) {
        walk.check_block(content.blocks[i], "Block " + std::to_string(i) + ": ");
    }

    if (content.metadata) {
        const auto& metadata = *content.metadata;
        if (metadata.source_url && metadata.source_url->size() > limits_.max_url_length) {
            result.add_warning("Metadata: Source URL exceeds " +
                               std::to_string(limits_.max_url_length) + " characters");
        }
        if (metadata.captured_at && !is_iso8601(*metadata.captured_at)) {
            result.add_warning("Metadata: capturedAt is not an ISO 8601 timestamp: " +
                               *metadata.captured_at);
        }
    }

    return result;
}

auto ContentValidator::sanitize(const ClippyContent& content) const -> ClippyContent {
    ClippyContent sanitized = content;
    sanitized.version = std::string(CONTENT_VERSION);

    if (sanitized.blocks.size() > limits_.max_blocks) {
        sanitized.blocks.erase(
            sanitized.blocks.begin() + static_cast<std::ptrdiff_t>(limits_.max_blocks),
            sanitized.blocks.end());
    }

    std::unordered_set<std::string> used;
    for (const auto& block : sanitized.blocks) {
        if (block.valueless_by_exception()) {
            continue;
        }
        if (!block_id(block).empty()) {
            used.insert(block_id(block));
        }
        if (const auto* list = std::get_if<ListBlock>(&block)) {
            collect_ids(*list, used);
        }
    }

    SanitizedIds ids(std::move(used));
    for (auto& block : sanitized.blocks) {
        if (block.valueless_by_exception()) {
            continue;
        }
        if (block_id(block).empty()) {
            block = with_block_id(std::move(block), ids.next());
        }
        if (auto* list = std::get_if<ListBlock>(&block)) {
            ids.fill(*list);
        }
    }

    return sanitized;
}

auto validate(const ClippyContent& content, const ContentLimits& limits) -> ValidationResult {
    return ContentValidator(limits).validate(content);
}

auto sanitize(const ClippyContent& content, const ContentLimits& limits) -> ClippyContent {
    return ContentValidator(limits).sanitize(content);
}

} // namespace clippy
