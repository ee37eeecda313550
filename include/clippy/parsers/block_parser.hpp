#pragma once

#include "clippy/core/content.hpp"
#include "clippy/core/limits.hpp"
#include "clippy/interfaces.hpp"
#include "clippy/parsers/inline_parser.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace clippy {

enum class IdPolicy {
    GENERATE,  // block-<timestamp_ms>-<counter>
    NONE       // empty ids
};

enum class EmptyBlockPolicy {
    KEEP,
    DROP
};

struct BlockParseOptions {
    std::optional<std::string> source_url;
    std::optional<std::string> source_domain;
    size_t max_nesting_level = ContentLimits{}.max_nesting_level;
    size_t max_blocks = ContentLimits{}.max_blocks;
    IdPolicy id_policy = IdPolicy::GENERATE;
    EmptyBlockPolicy empty_block_policy = EmptyBlockPolicy::KEEP;
    bool preserve_source_info = true;
    std::optional<std::string> captured_at;  // defaults to the current UTC time
    std::optional<int64_t> id_timestamp;     // defaults to the current epoch millis
    InlineParseOptions inline_options;
    ILogger* logger = nullptr;  // nullptr logs to default_logger()
};

// Builds ClippyContent from captured markup or plain text.
// Parsing never fails: unknown constructs degrade to paragraphs and limit
// overflows are truncated or flattened, with a warning on the logger.
class BlockParser {
public:
    explicit BlockParser(BlockParseOptions options = {});

    auto parse(std::string_view markup) const -> ClippyContent;
    auto parse_text(std::string_view text) const -> ClippyContent;

private:
    BlockParseOptions options_;
};

auto parse_document(std::string_view markup, const BlockParseOptions& options = {})
    -> ClippyContent;

// One unformatted paragraph per blank-line separated chunk
auto parse_text(std::string_view text, const BlockParseOptions& options = {}) -> ClippyContent;

// Language tag from a code element's class attribute ("language-js", "lang-py",
// "highlight-go", "rust-code", or a bare known language name)
auto extract_language_from_class(std::string_view class_attribute) -> std::optional<std::string>;

} // namespace clippy