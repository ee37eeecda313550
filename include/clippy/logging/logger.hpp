#pragma once

#include "clippy/interfaces.hpp"
#include <mutex>
#include <ostream>
#include <string>

namespace clippy {

// Writes "Warning: ..." / "Error: ..." lines to a stream
class StreamLogger : public ILogger {
public:
    explicit StreamLogger(std::ostream& out, LogLevel min_level = LogLevel::WARNING);

    auto log(LogLevel level, const std::string& message) -> void override;

private:
    std::ostream& out_;
    LogLevel min_level_;
    std::mutex mutex_;
};

class NullLogger : public ILogger {
public:
    auto log(LogLevel level, const std::string& message) -> void override;
};

auto log_level_prefix(LogLevel level) -> std::string;

// Shared stderr logger at warning level
auto default_logger() -> ILogger&;

// The given logger, or default_logger() when null
auto resolve_logger(ILogger* logger) -> ILogger&;

} // namespace clippy