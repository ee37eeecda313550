#pragma once

#include "clippy/core/content.hpp"
#include "clippy/interfaces.hpp"
#include "clippy/platform/platform_registry.hpp"
#include <string>
#include <vector>

namespace clippy {

struct CompatibilityReport {
    bool compatible = true;
    std::vector<std::string> issues;    // Content the platform cannot display
    std::vector<std::string> warnings;  // Content that will be degraded
};

// Reports each distinct unsupported block kind, formatting flag and links.
// Never modifies the content.
auto check_compatibility(const ClippyContent& content, const PlatformCapabilities& capabilities)
    -> CompatibilityReport;

// Unknown platform ids are checked against the plain textarea record
auto validate_for_platform(const ClippyContent& content, const std::string& platform_id,
                           const IPlatformRegistry& registry) -> CompatibilityReport;

} // namespace clippy
