#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace kvcache {

// ── Value ────────────────────────────────────────────────────────────────────
//
// Anything a cache table can hold: numbers, strings, booleans, null and
// nested arrays/objects.  ordered_json keeps object members in the order
// they were written, so nested documents survive a round trip unchanged.
//
// A stored JSON null is a real value; a missing key is std::nullopt.

using Value = nlohmann::ordered_json;

// Single-line JSON text for `value`.  Invalid UTF-8 inside strings is
// replaced with U+FFFD instead of throwing.
[[nodiscard]] std::string encode_value(const Value& value);

// Parses `text` as exactly one JSON document.
// Returns std::nullopt if the text is not valid JSON.
[[nodiscard]] std::optional<Value> decode_value(std::string_view text);

} // namespace kvcache
