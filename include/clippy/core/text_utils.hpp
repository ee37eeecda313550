#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace clippy::text {

// ASCII whitespace as understood by HTML (space, tab, CR, LF, FF)
auto is_space(char c) -> bool;

// True if text is empty or whitespace only
auto is_blank(std::string_view text) -> bool;

// Collapse every whitespace run into a single space (no trimming)
auto collapse_whitespace(std::string_view text) -> std::string;

auto trim(std::string_view text) -> std::string;
auto trim_right(std::string_view text) -> std::string;
auto to_lowercase(std::string_view text) -> std::string;
auto split_by_whitespace(std::string_view text) -> std::vector<std::string>;
auto split_lines(std::string_view text) -> std::vector<std::string>;
auto starts_with_ignore_case(std::string_view text, std::string_view prefix) -> bool;
auto replace_all(std::string text, std::string_view from, std::string_view to) -> std::string;

// Truncate to at most max_bytes without splitting a UTF-8 sequence
auto truncate_utf8(std::string_view text, size_t max_bytes) -> std::string;

// Length of the longest run of `c` in text
auto longest_run(std::string_view text, char c) -> size_t;

} // namespace clippy::text