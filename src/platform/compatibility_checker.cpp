#include "clippy/platform/compatibility_checker.hpp"
#include "clippy/core/content_ops.hpp"
#include <algorithm>

namespace clippy {

namespace {

class CompatibilityWalk {
public:
    explicit CompatibilityWalk(const PlatformCapabilities& capabilities)
        : capabilities_(capabilities) {}

    auto check_block(const ContentBlock& block) -> void {
        auto kind = block_kind(block);
        if (!capabilities_.supported_blocks.contains(kind)) {
            add_unique(report_.issues, "Block type: " + to_string(kind));
        }

        std::visit(overloaded{
                       [&](const ListBlock& list) { check_list(list, 1); },
                       [&](const CodeBlock& code) {
                           if (code.language && !capabilities_.has_code_syntax_highlighting) {
                               add_unique(report_.warnings,
                                          "Syntax highlighting not supported for language: " +
                                              *code.language);
                           }
                       },
                       [](const DividerBlock&) {},
                       [&](const auto& text_block) { check_inline(text_block.content); },
                   },
                   block);
    }

    auto take() -> CompatibilityReport {
        report_.compatible = report_.issues.empty();
        return std::move(report_);
    }

private:
    static auto add_unique(std::vector<std::string>& messages, std::string message) -> void {
        if (std::find(messages.begin(), messages.end(), message) == messages.end()) {
            messages.push_back(std::move(message));
        }
    }

    auto check_list(const ListBlock& list, size_t depth) -> void {
        if (depth > capabilities_.max_nesting_level) {
            add_unique(report_.warnings, "List nesting deeper than " +
                                             std::to_string(capabilities_.max_nesting_level) +
                                             " levels will be flattened");
        }
        for (const auto& item : list.items) {
            check_inline(item.content);
            if (item.nested) {
                check_list(*item.nested, depth + 1);
            }
        }
    }

    auto check_formatting(const Formatting& formatting) -> void {
        for (auto kind : active_formatting_kinds(formatting)) {
            if (!capabilities_.supported_formatting.contains(kind)) {
                add_unique(report_.issues, "Text formatting: " + to_string(kind));
            }
        }
    }

    auto check_inline(const InlineSequence& content) -> void {
        for (const auto& item : content) {
            std::visit(overloaded{
                           [&](const TextSpan& span) { check_formatting(span.formatting); },
                           [&](const LinkSpan& link) {
                               check_formatting(link.formatting);
                               if (!capabilities_.has_link_support) {
                                   add_unique(report_.issues, "Links");
                               }
                           },
                           [](const LineBreak&) {},
                       },
                       item);
        }
    }

    const PlatformCapabilities& capabilities_;
    CompatibilityReport report_;
};

} // namespace

auto check_compatibility(const ClippyContent& content, const PlatformCapabilities& capabilities)
    -> CompatibilityReport {
    CompatibilityWalk walk(capabilities);
    for (const auto& block : content.blocks) {
        if (!block.valueless_by_exception()) {
            walk.check_block(block);
        }
    }
    return walk.take();
}

auto validate_for_platform(const ClippyContent& content, const std::string& platform_id,
                           const IPlatformRegistry& registry) -> CompatibilityReport {
    return check_compatibility(content, resolve_capabilities(registry, platform_id));
}

} // namespace clippy
