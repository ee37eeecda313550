#pragma once

#include "clippy/core/limits.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace clippy {

// Link target policy shared by the parsers and every renderer.
// Allowed: http(s) URLs with a host, relative paths ("/", "./", "../"),
// "#" anchors, "mailto:" and "tel:". Control characters and targets longer
// than max_length are rejected.
auto is_allowed_url(std::string_view url, size_t max_length = ContentLimits{}.max_url_length) -> bool;

// Returns the URL if allowed, otherwise an empty string
auto sanitize_url(std::string_view url, size_t max_length = ContentLimits{}.max_url_length)
    -> std::string;

// Lower-cased host of an absolute http(s) URL, without port or userinfo
auto url_host(std::string_view url) -> std::optional<std::string>;

} // namespace clippy