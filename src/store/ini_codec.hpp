#pragma once

#include "store/store.hpp"

namespace kvcache::store {

// ── IniCodec ─────────────────────────────────────────────────────────────────
//
// Section-based text format, one block per table:
//
//   [default]
//   a = 1
//   b = "x"
//
// Every value is written as single-line JSON.  Blocks are separated by a
// blank line.
//
// Reading is tolerant:
//   - lines before the first section header are ignored;
//   - a repeated key inside a section: the later line wins;
//   - a repeated section header merges into the earlier section;
//   - an empty header "[]" opens the table named "" (older readers dropped
//     its entries), so a table with an empty name round-trips;
//   - a value that is not valid JSON is kept as a raw string (older files
//     stored plain strings).
//
// Keys are trimmed and cut at the first '=', so keys with surrounding
// whitespace, '=' or line breaks do not survive a round trip.

class IniCodec final : public StoreCodec {
public:
    [[nodiscard]] std::string encode(const Store& store) const override;
    [[nodiscard]] Store decode(std::string_view text,
                               spdlog::logger& log) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "ini"; }
};

} // namespace kvcache::store
