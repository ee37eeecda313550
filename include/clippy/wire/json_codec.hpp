#pragma once

#include "clippy/core/content.hpp"
#include "clippy/core/limits.hpp"
#include "clippy/renderers/quill_delta_renderer.hpp"
#include "clippy/validation/content_validator.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>

namespace clippy::wire {

using Json = nlohmann::json;

// {"version", "blocks": [{"id", "type", ...}], "metadata"?}
auto content_to_json(const ClippyContent& content) -> Json;

// Lenient decode: unknown blocks are skipped, unknown inline elements dropped and
// non-boolean formatting flags ignored. nullopt when the value is not an object.
auto content_from_json(const Json& value) -> std::optional<ClippyContent>;

// Parses JSON text; nullopt on syntax errors
auto content_from_json_text(std::string_view text) -> std::optional<ClippyContent>;

// Shape errors of the wire value followed by the typed validation of its decoding
auto validate_wire(const Json& value, const ContentLimits& limits = {}) -> ValidationResult;

// {"ops": [{"insert", "attributes"?}]}
auto delta_to_json(const QuillDelta& delta) -> Json;

} // namespace clippy::wire
