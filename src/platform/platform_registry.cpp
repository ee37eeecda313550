#include "clippy/platform/platform_registry.hpp"

namespace clippy {

namespace {

auto builtin_platforms() -> std::vector<PlatformCapabilities> {
    using B = BlockKind;
    using F = FormattingKind;

    return {
        {.id = "linkedin-quill",
         .name = "LinkedIn (Quill Editor)",
         .supported_blocks = {B::PARAGRAPH, B::HEADING, B::LIST},
         .supported_formatting = {F::BOLD, F::ITALIC},
         .max_nesting_level = 2,
         .has_link_support = true,
         .has_code_syntax_highlighting = false,
         .preferred_format = PreferredFormat::DELTA},
        {.id = "linkedin-article",
         .name = "LinkedIn Article Editor",
         .supported_blocks = {B::PARAGRAPH, B::HEADING, B::LIST, B::QUOTE, B::CODE, B::DIVIDER},
         .supported_formatting = {F::BOLD, F::ITALIC, F::UNDERLINE, F::CODE},
         .max_nesting_level = 3,
         .has_link_support = true,
         .has_code_syntax_highlighting = true,
         .preferred_format = PreferredFormat::HTML},
        {.id = "gmail",
         .name = "Gmail Compose",
         .supported_blocks = {B::PARAGRAPH, B::LIST},
         .supported_formatting = {F::BOLD, F::ITALIC, F::UNDERLINE},
         .max_nesting_level = 2,
         .has_link_support = true,
         .has_code_syntax_highlighting = false,
         .preferred_format = PreferredFormat::HTML},
        {.id = "discord",
         .name = "Discord Message",
         .supported_blocks = {B::PARAGRAPH, B::CODE},
         .supported_formatting = {F::BOLD, F::ITALIC, F::STRIKETHROUGH, F::CODE},
         .max_nesting_level = 1,
         .has_link_support = true,
         .has_code_syntax_highlighting = true,
         .preferred_format = PreferredFormat::MARKDOWN},
        {.id = "slack",
         .name = "Slack Message",
         .supported_blocks = {B::PARAGRAPH, B::LIST, B::QUOTE, B::CODE},
         .supported_formatting = {F::BOLD, F::ITALIC, F::STRIKETHROUGH, F::CODE},
         .max_nesting_level = 2,
         .has_link_support = true,
         .has_code_syntax_highlighting = true,
         .preferred_format = PreferredFormat::MARKDOWN},
        {.id = "github",
         .name = "GitHub (Markdown)",
         .supported_blocks = {B::PARAGRAPH, B::HEADING, B::LIST, B::QUOTE, B::CODE, B::DIVIDER},
         .supported_formatting = {F::BOLD, F::ITALIC, F::STRIKETHROUGH, F::CODE},
         .max_nesting_level = 5,
         .has_link_support = true,
         .has_code_syntax_highlighting = true,
         .preferred_format = PreferredFormat::MARKDOWN},
        {.id = "notion",
         .name = "Notion",
         .supported_blocks = {B::PARAGRAPH, B::HEADING, B::LIST, B::QUOTE, B::CODE, B::DIVIDER},
         .supported_formatting = {F::BOLD, F::ITALIC, F::UNDERLINE, F::STRIKETHROUGH, F::CODE},
         .max_nesting_level = 10,
         .has_link_support = true,
         .has_code_syntax_highlighting = true,
         .preferred_format = PreferredFormat::HTML},
        {.id = "contenteditable-generic",
         .name = "Generic ContentEditable",
         .supported_blocks = {B::PARAGRAPH, B::HEADING, B::LIST},
         .supported_formatting = {F::BOLD, F::ITALIC, F::UNDERLINE},
         .max_nesting_level = 3,
         .has_link_support = true,
         .has_code_syntax_highlighting = false,
         .preferred_format = PreferredFormat::HTML},
        {.id = "textarea",
         .name = "Plain Text Area",
         .supported_blocks = {B::PARAGRAPH},
         .supported_formatting = {},
         .max_nesting_level = 1,
         .has_link_support = false,
         .has_code_syntax_highlighting = false,
         .preferred_format = PreferredFormat::PLAINTEXT},
    };
}

} // namespace

BuiltinPlatformRegistry::BuiltinPlatformRegistry() {
    for (auto& platform : builtin_platforms()) {
        auto id = platform.id;
        platforms_.emplace(std::move(id), std::move(platform));
    }
}

auto BuiltinPlatformRegistry::find(const std::string& platform_id) const
    -> std::optional<PlatformCapabilities> {
    auto it = platforms_.find(platform_id);
    if (it == platforms_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto BuiltinPlatformRegistry::platform_ids() const -> std::vector<std::string> {
    std::vector<std::string> ids;
    for (const auto& [id, platform] : platforms_) {
        ids.push_back(id);
    }
    return ids;
}

auto resolve_capabilities(const IPlatformRegistry& registry, const std::string& platform_id)
    -> PlatformCapabilities {
    if (auto capabilities = registry.find(platform_id)) {
        return *capabilities;
    }
    if (auto fallback = registry.find(std::string(FALLBACK_PLATFORM_ID))) {
        return *fallback;
    }
    return PlatformCapabilities{.id = std::string(FALLBACK_PLATFORM_ID),
                                .name = "Plain Text Area",
                                .supported_blocks = {BlockKind::PARAGRAPH},
                                .supported_formatting = {},
                                .max_nesting_level = 1,
                                .has_link_support = false,
                                .has_code_syntax_highlighting = false,
                                .preferred_format = PreferredFormat::PLAINTEXT};
}

auto to_string(PreferredFormat format) -> std::string {
    switch (format) {
    case PreferredFormat::HTML:
        return "html";
    case PreferredFormat::MARKDOWN:
        return "markdown";
    case PreferredFormat::DELTA:
        return "delta";
    case PreferredFormat::PLAINTEXT:
        return "plaintext";
    }
    return "plaintext";
}

} // namespace clippy
