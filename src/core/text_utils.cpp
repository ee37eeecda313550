#include "clippy/core/text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace clippy::text {

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

auto is_blank(std::string_view text) -> bool {
    return std::all_of(text.begin(), text.end(), is_space);
}

auto collapse_whitespace(std::string_view text) -> std::string {
    std::string result;
    result.reserve(text.size());
    bool in_space = false;

    for (char c : text) {
        if (is_space(c)) {
            if (!in_space) {
                result += ' ';
                in_space = true;
            }
        } else {
            result += c;
            in_space = false;
        }
    }

    return result;
}

auto trim(std::string_view text) -> std::string {
    auto start = text.find_first_not_of(" \t\r\n\f");
    if (start == std::string_view::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n\f");
    return std::string(text.substr(start, end - start + 1));
}

auto trim_right(std::string_view text) -> std::string {
    auto end = text.find_last_not_of(" \t\r\n\f");
    if (end == std::string_view::npos) {
        return "";
    }
    return std::string(text.substr(0, end + 1));
}

auto to_lowercase(std::string_view text) -> std::string {
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto split_by_whitespace(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    std::istringstream iss{std::string(text)};
    std::string token;

    while (iss >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

auto split_lines(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    std::istringstream iss{std::string(text)};
    std::string line;

    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }

    return lines;
}

auto starts_with_ignore_case(std::string_view text, std::string_view prefix) -> bool {
    if (text.size() < prefix.size()) {
        return false;
    }
    return to_lowercase(text.substr(0, prefix.size())) == to_lowercase(prefix);
}

auto replace_all(std::string text, std::string_view from, std::string_view to) -> std::string {
    if (from.empty()) {
        return text;
    }
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

auto truncate_utf8(std::string_view text, size_t max_bytes) -> std::string {
    if (text.size() <= max_bytes) {
        return std::string(text);
    }
    size_t cut = max_bytes;
    // Step back over continuation bytes (10xxxxxx) so the cut lands on a lead byte
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return std::string(text.substr(0, cut));
}

auto longest_run(std::string_view text, char c) -> size_t {
    size_t longest = 0;
    size_t current = 0;
    for (char ch : text) {
        current = (ch == c) ? current + 1 : 0;
        longest = std::max(longest, current);
    }
    return longest;
}

} // namespace clippy::text