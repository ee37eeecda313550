#include "clippy/platform/content_renderer.hpp"
#include "clippy/core/text_utils.hpp"
#include "clippy/renderers/html_renderer.hpp"
#include "clippy/renderers/plain_text_renderer.hpp"
#include <algorithm>

namespace clippy {

namespace {

constexpr std::string_view ELLIPSIS = "...";

auto format_for(PreferredFormat preferred) -> OutputFormat {
    switch (preferred) {
    case PreferredFormat::HTML:
        return OutputFormat::HTML;
    case PreferredFormat::MARKDOWN:
        return OutputFormat::MARKDOWN;
    case PreferredFormat::DELTA:
        return OutputFormat::DELTA;
    case PreferredFormat::PLAINTEXT:
        return OutputFormat::PLAINTEXT;
    }
    return OutputFormat::PLAINTEXT;
}

auto strip_inline_formatting(InlineSequence& content) -> void {
    for (auto& item : content) {
        std::visit(overloaded{
                       [](TextSpan& span) { span.formatting = {}; },
                       [](LinkSpan& link) { link.formatting = {}; },
                       [](LineBreak&) {},
                   },
                   item);
    }
}

auto strip_list_formatting(ListBlock& list) -> void {
    for (auto& item : list.items) {
        strip_inline_formatting(item.content);
        if (item.nested) {
            strip_list_formatting(*item.nested);
        }
    }
}

// Copy of the content with every formatting flag cleared
auto without_formatting(const ClippyContent& content) -> ClippyContent {
    auto plain = content;
    for (auto& block : plain.blocks) {
        std::visit(overloaded{
                       [](ListBlock& list) { strip_list_formatting(list); },
                       [](CodeBlock&) {},
                       [](DividerBlock&) {},
                       [](auto& text_block) { strip_inline_formatting(text_block.content); },
                   },
                   block);
    }
    return plain;
}

auto output_length(const std::variant<std::string, QuillDelta>& output) -> size_t {
    return std::visit(overloaded{
                          [](const std::string& text) { return text.size(); },
                          [](const QuillDelta& delta) { return delta_plain_text(delta).size(); },
                      },
                      output);
}

auto truncate_with_ellipsis(const std::string& text, size_t max_length) -> std::string {
    if (text.size() <= max_length) {
        return text;
    }
    if (max_length <= ELLIPSIS.size()) {
        return text::truncate_utf8(text, max_length);
    }
    return text::truncate_utf8(text, max_length - ELLIPSIS.size()) + std::string(ELLIPSIS);
}

} // namespace

ContentRenderer::ContentRenderer(const IPlatformRegistry& registry) : registry_(registry) {}

auto ContentRenderer::render(const ClippyContent& content, const RenderOptions& options) const
    -> RenderResult {
    RenderResult result;

    if (!registry_.find(options.platform_id)) {
        auto message = "Unknown platform \"" + options.platform_id + "\", rendering as " +
                       std::string(FALLBACK_PLATFORM_ID);
        result.warnings.push_back(message);
    }
    auto capabilities = resolve_capabilities(registry_, options.platform_id);
    result.platform_id = capabilities.id;

    result.compatibility = check_compatibility(content, capabilities);
    for (const auto& issue : result.compatibility.issues) {
        result.warnings.push_back("Unsupported on " + capabilities.name + ": " + issue);
    }
    result.warnings.insert(result.warnings.end(), result.compatibility.warnings.begin(),
                           result.compatibility.warnings.end());

    std::optional<ClippyContent> unformatted;
    if (!options.preserve_formatting) {
        unformatted = without_formatting(content);
    }
    const auto& source = unformatted ? *unformatted : content;
    result.format =
        options.format == OutputFormat::AUTO ? format_for(capabilities.preferred_format) : options.format;
    auto nesting = std::max<size_t>(capabilities.max_nesting_level, 1);

    switch (result.format) {
    case OutputFormat::HTML:
        result.output = render_html(source);
        break;
    case OutputFormat::MARKDOWN: {
        auto config = markdown_config_for(markdown_flavor_for_platform(capabilities.id));
        config.preserve_formatting = options.preserve_formatting;
        config.max_nesting_level = nesting;
        config.logger = options.logger;
        result.output = render_markdown(source, config);
        break;
    }
    case OutputFormat::DELTA:
        result.output = render_quill_delta(
            source, QuillRenderConfig{.support_nested_lists = nesting > 1,
                                      .max_list_depth = nesting,
                                      .preserve_formatting = options.preserve_formatting,
                                      .use_code_blocks = true});
        break;
    case OutputFormat::AUTO:
    case OutputFormat::PLAINTEXT:
        result.format = OutputFormat::PLAINTEXT;
        result.output = render_plain_text(source);
        break;
    }

    if (options.max_length && output_length(result.output) > *options.max_length) {
        auto message = "Output exceeds " + std::to_string(*options.max_length) + " characters";
        if (options.fallback_to_plain_text) {
            result.output = truncate_with_ellipsis(render_plain_text(content), *options.max_length);
            result.format = OutputFormat::PLAINTEXT;
            message += ", falling back to plain text";
        } else {
            result.success = false;
        }
        result.warnings.push_back(message);
    }

    return result;
}

auto render_for_platform(const ClippyContent& content, const RenderOptions& options,
                         const IPlatformRegistry& registry) -> RenderResult {
    return ContentRenderer(registry).render(content, options);
}

auto markdown_flavor_for_platform(const std::string& platform_id) -> MarkdownFlavor {
    if (platform_id == "github") {
        return MarkdownFlavor::GITHUB;
    }
    if (platform_id == "discord") {
        return MarkdownFlavor::DISCORD;
    }
    if (platform_id == "slack") {
        return MarkdownFlavor::SLACK;
    }
    return MarkdownFlavor::STANDARD;
}

auto to_string(OutputFormat format) -> std::string {
    switch (format) {
    case OutputFormat::AUTO:
        return "auto";
    case OutputFormat::HTML:
        return "html";
    case OutputFormat::MARKDOWN:
        return "markdown";
    case OutputFormat::DELTA:
        return "delta";
    case OutputFormat::PLAINTEXT:
        return "text";
    }
    return "text";
}

auto output_format_from_string(std::string_view name) -> std::optional<OutputFormat> {
    auto lowered = text::to_lowercase(name);
    if (lowered == "auto") {
        return OutputFormat::AUTO;
    }
    if (lowered == "html") {
        return OutputFormat::HTML;
    }
    if (lowered == "markdown" || lowered == "md") {
        return OutputFormat::MARKDOWN;
    }
    if (lowered == "delta" || lowered == "quill") {
        return OutputFormat::DELTA;
    }
    if (lowered == "text" || lowered == "plaintext") {
        return OutputFormat::PLAINTEXT;
    }
    return std::nullopt;
}

auto output_text(const RenderResult& result) -> std::string {
    return std::visit(overloaded{
                          [](const std::string& text) { return text; },
                          [](const QuillDelta& delta) { return delta_plain_text(delta); },
                      },
                      result.output);
}

} // namespace clippy
