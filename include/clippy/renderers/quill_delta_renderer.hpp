#pragma once

#include "clippy/core/content.hpp"
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace clippy {

using DeltaAttributeValue = std::variant<bool, int, std::string>;
using DeltaAttributes = std::map<std::string, DeltaAttributeValue>;

// One Quill "insert" operation; line formats ride on the "\n" that ends the line
struct DeltaOp {
    std::string insert;
    DeltaAttributes attributes;

    auto operator==(const DeltaOp& other) const -> bool = default;
};

struct QuillDelta {
    std::vector<DeltaOp> ops;

    auto operator==(const QuillDelta& other) const -> bool = default;
};

struct QuillRenderConfig {
    bool support_nested_lists = true;
    size_t max_list_depth = 3;   // deeper items become "• " lines
    bool preserve_formatting = true;
    bool use_code_blocks = true;  // code-block lines instead of inline code
};

auto render_quill_delta(const ClippyContent& content, const QuillRenderConfig& config = {})
    -> QuillDelta;

// Drops empty inserts and merges neighbours with equal attributes
auto optimize_delta(const QuillDelta& delta) -> QuillDelta;

// Concatenated inserts
auto delta_plain_text(const QuillDelta& delta) -> std::string;

// Unformatted delta for plain text, terminated by a newline
auto text_to_delta(std::string_view text) -> QuillDelta;

} // namespace clippy
