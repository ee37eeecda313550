#pragma once

#include "clippy/core/content.hpp"
#include "clippy/interfaces.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace clippy {

enum class PreferredFormat {
    HTML,
    MARKDOWN,
    DELTA,
    PLAINTEXT
};

// What a destination editor can display
struct PlatformCapabilities {
    std::string id;
    std::string name;
    std::set<BlockKind> supported_blocks;
    std::set<FormattingKind> supported_formatting;
    size_t max_nesting_level = 1;
    bool has_link_support = false;
    bool has_code_syntax_highlighting = false;
    PreferredFormat preferred_format = PreferredFormat::PLAINTEXT;

    auto operator==(const PlatformCapabilities& other) const -> bool = default;
};

inline constexpr std::string_view FALLBACK_PLATFORM_ID = "textarea";

// Capability records for the editors Clippy knows about
class BuiltinPlatformRegistry : public IPlatformRegistry {
public:
    BuiltinPlatformRegistry();

    auto find(const std::string& platform_id) const -> std::optional<PlatformCapabilities> override;

    auto platform_ids() const -> std::vector<std::string>;

private:
    std::map<std::string, PlatformCapabilities> platforms_;
};

// Capabilities for platform_id, or the plain textarea record when unknown
auto resolve_capabilities(const IPlatformRegistry& registry, const std::string& platform_id)
    -> PlatformCapabilities;

auto to_string(PreferredFormat format) -> std::string;

} // namespace clippy
