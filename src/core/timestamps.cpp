#include "clippy/core/timestamps.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace clippy {

namespace {

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

// Consumes exactly `count` digits at `pos`
auto take_digits(std::string_view value, size_t& pos, size_t count) -> bool {
    if (pos + count > value.size()) {
        return false;
    }
    for (size_t i = 0; i < count; ++i) {
        if (!is_digit(value[pos + i])) {
            return false;
        }
    }
    pos += count;
    return true;
}

auto take_char(std::string_view value, size_t& pos, char expected) -> bool {
    if (pos < value.size() && value[pos] == expected) {
        ++pos;
        return true;
    }
    return false;
}

} // namespace

auto format_iso8601(std::chrono::system_clock::time_point time) -> std::string {
    auto seconds = std::chrono::system_clock::to_time_t(time);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()) %
                  1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

auto current_iso8601() -> std::string {
    return format_iso8601(std::chrono::system_clock::now());
}

auto current_epoch_millis() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

auto is_iso8601(std::string_view value) -> bool {
    size_t pos = 0;
    if (!take_digits(value, pos, 4) || !take_char(value, pos, '-') || !take_digits(value, pos, 2) ||
        !take_char(value, pos, '-') || !take_digits(value, pos, 2)) {
        return false;
    }
    if (pos == value.size()) {
        return true;
    }

    if (!take_char(value, pos, 'T') || !take_digits(value, pos, 2) || !take_char(value, pos, ':') ||
        !take_digits(value, pos, 2)) {
        return false;
    }
    if (take_char(value, pos, ':')) {
        if (!take_digits(value, pos, 2)) {
            return false;
        }
        if (take_char(value, pos, '.')) {
            size_t start = pos;
            while (pos < value.size() && is_digit(value[pos])) {
                ++pos;
            }
            if (pos == start) {
                return false;
            }
        }
    }

    if (pos == value.size() || take_char(value, pos, 'Z')) {
        return pos == value.size();
    }
    if (value[pos] == '+' || value[pos] == '-') {
        ++pos;
        return take_digits(value, pos, 2) && take_char(value, pos, ':') &&
               take_digits(value, pos, 2) && pos == value.size();
    }
    return false;
}

} // namespace clippy
