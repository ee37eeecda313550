#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace clippy {

// "2024-05-01T12:30:00.123Z"
auto format_iso8601(std::chrono::system_clock::time_point time) -> std::string;

auto current_iso8601() -> std::string;

auto current_epoch_millis() -> int64_t;

// Accepts YYYY-MM-DD, optionally followed by THH:MM[:SS[.fff]] and Z or +HH:MM
auto is_iso8601(std::string_view value) -> bool;

} // namespace clippy
