#pragma once

#include "clippy/core/content.hpp"
#include "clippy/core/limits.hpp"
#include <string>
#include <vector>

namespace clippy {

struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;    // Structural problems; any error makes content invalid
    std::vector<std::string> warnings;  // Soft limit overruns and style issues

    auto add_error(std::string message) -> void;
    auto add_warning(std::string message) -> void;
    auto merge(const ValidationResult& other) -> void;
};

// Checks untrusted content against the structural invariants and size limits
class ContentValidator {
public:
    explicit ContentValidator(ContentLimits limits = {});

    auto validate(const ClippyContent& content) const -> ValidationResult;

    // Pins the version, truncates to max_blocks and fills empty block and list
    // item ids with unused "block-sanitized-<n>" ids. Never fails.
    auto sanitize(const ClippyContent& content) const -> ClippyContent;

    auto limits() const -> const ContentLimits& { return limits_; }

private:
    ContentLimits limits_;
};

auto validate(const ClippyContent& content, const ContentLimits& limits = {}) -> ValidationResult;
auto sanitize(const ClippyContent& content, const ContentLimits& limits = {}) -> ClippyContent;

} // namespace clippy
