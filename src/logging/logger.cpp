#include "clippy/logging/logger.hpp"
#include <iostream>

namespace clippy {

StreamLogger::StreamLogger(std::ostream& out, LogLevel min_level)
    : out_(out), min_level_(min_level) {}

auto StreamLogger::log(LogLevel level, const std::string& message) -> void {
    if (static_cast<int>(level) < static_cast<int>(min_level_)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << log_level_prefix(level) << message << '\n';
}

auto NullLogger::log([[maybe_unused]] LogLevel level, [[maybe_unused]] const std::string& message)
    -> void {}

auto log_level_prefix(LogLevel level) -> std::string {
    switch (level) {
    case LogLevel::DEBUG:
        return "Debug: ";
    case LogLevel::INFO:
        return "";
    case LogLevel::WARNING:
        return "Warning: ";
    case LogLevel::ERROR:
        return "Error: ";
    }
    return "";
}

auto default_logger() -> ILogger& {
    static StreamLogger logger(std::cerr, LogLevel::WARNING);
    return logger;
}

auto resolve_logger(ILogger* logger) -> ILogger& {
    return logger ? *logger : default_logger();
}

} // namespace clippy