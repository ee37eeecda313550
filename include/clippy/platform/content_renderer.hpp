#pragma once

#include "clippy/core/content.hpp"
#include "clippy/interfaces.hpp"
#include "clippy/platform/compatibility_checker.hpp"
#include "clippy/renderers/markdown_renderer.hpp"
#include "clippy/renderers/quill_delta_renderer.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace clippy {

enum class OutputFormat {
    AUTO,  // the platform's preferred format
    HTML,
    MARKDOWN,
    DELTA,
    PLAINTEXT
};

struct RenderOptions {
    std::string platform_id{FALLBACK_PLATFORM_ID};
    OutputFormat format = OutputFormat::AUTO;
    bool preserve_formatting = true;
    std::optional<size_t> max_length;
    bool fallback_to_plain_text = true;
    ILogger* logger = nullptr;  // nullptr logs to default_logger()
};

struct RenderResult {
    std::variant<std::string, QuillDelta> output;
    OutputFormat format = OutputFormat::PLAINTEXT;
    std::string platform_id;
    bool success = true;
    std::vector<std::string> warnings;
    CompatibilityReport compatibility;
};

// Chooses the output format and dialect for a destination platform
class ContentRenderer {
public:
    explicit ContentRenderer(const IPlatformRegistry& registry);

    auto render(const ClippyContent& content, const RenderOptions& options) const -> RenderResult;

private:
    const IPlatformRegistry& registry_;
};

auto render_for_platform(const ClippyContent& content, const RenderOptions& options,
                         const IPlatformRegistry& registry) -> RenderResult;

// Markdown dialect spoken by a platform (github, discord, slack; standard otherwise)
auto markdown_flavor_for_platform(const std::string& platform_id) -> MarkdownFlavor;

auto to_string(OutputFormat format) -> std::string;
auto output_format_from_string(std::string_view name) -> std::optional<OutputFormat>;

// Output as text; deltas become their plain text
auto output_text(const RenderResult& result) -> std::string;

} // namespace clippy
