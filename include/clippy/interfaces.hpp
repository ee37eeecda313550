#pragma once

#include <optional>
#include <string>

namespace clippy {

// Forward declarations
struct PlatformCapabilities;

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// Abstract interfaces for dependency injection
class ILogger {
public:
    virtual ~ILogger() = default;
    virtual auto log(LogLevel level, const std::string& message) -> void = 0;

    auto debug(const std::string& message) -> void { log(LogLevel::DEBUG, message); }
    auto info(const std::string& message) -> void { log(LogLevel::INFO, message); }
    auto warn(const std::string& message) -> void { log(LogLevel::WARNING, message); }
    auto error(const std::string& message) -> void { log(LogLevel::ERROR, message); }
};

// Capability lookup for destination editors
class IPlatformRegistry {
public:
    virtual ~IPlatformRegistry() = default;
    virtual auto find(const std::string& platform_id) const -> std::optional<PlatformCapabilities> = 0;
};

class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    // "-" reads standard input
    virtual auto read_file(const std::string& path) -> std::optional<std::string> = 0;
    virtual auto file_exists(const std::string& path) -> bool = 0;
};

} // namespace clippy