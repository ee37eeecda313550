#include "clippy/core/url_policy.hpp"
#include "clippy/core/text_utils.hpp"
#include <algorithm>

namespace clippy {

namespace {

auto has_control_characters(std::string_view url) -> bool {
    return std::any_of(url.begin(), url.end(), [](char c) {
        auto byte = static_cast<unsigned char>(c);
        return byte < 0x20 || byte == 0x7F;
    });
}

// Host and port of "scheme://host...", empty when the "//" is missing
auto authority_after_scheme(std::string_view url, size_t scheme_length) -> std::string_view {
    auto rest = url.substr(scheme_length);
    if (rest.substr(0, 2) != "//") {
        return {};
    }
    auto host = rest.substr(2);
    auto authority = host.substr(0, host.find_first_of("/?#"));
    // Drop any userinfo before '@'
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }
    return authority;
}

auto has_host_after_scheme(std::string_view url, size_t scheme_length) -> bool {
    auto authority = authority_after_scheme(url, scheme_length);
    return !authority.empty() && authority.front() != ':';
}

} // namespace

auto is_allowed_url(std::string_view url, size_t max_length) -> bool {
    if (url.empty() || url.size() > max_length || has_control_characters(url)) {
        return false;
    }

    if (url.starts_with("/") || url.starts_with("./") || url.starts_with("../")) {
        return true;
    }

    if (url.starts_with("#")) {
        return true;
    }

    if (text::starts_with_ignore_case(url, "mailto:") || text::starts_with_ignore_case(url, "tel:")) {
        return true;
    }

    if (text::starts_with_ignore_case(url, "https:")) {
        return has_host_after_scheme(url, 6);
    }
    if (text::starts_with_ignore_case(url, "http:")) {
        return has_host_after_scheme(url, 5);
    }

    return false;
}

auto url_host(std::string_view url) -> std::optional<std::string> {
    std::string_view authority;
    if (text::starts_with_ignore_case(url, "https:")) {
        authority = authority_after_scheme(url, 6);
    } else if (text::starts_with_ignore_case(url, "http:")) {
        authority = authority_after_scheme(url, 5);
    }
    auto host = authority.substr(0, authority.find(':'));
    if (host.empty()) {
        return std::nullopt;
    }
    return text::to_lowercase(host);
}

auto sanitize_url(std::string_view url, size_t max_length) -> std::string {
    return is_allowed_url(url, max_length) ? std::string(url) : std::string();
}

} // namespace clippy