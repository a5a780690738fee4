#pragma once

#include "store/store.hpp"

namespace kvcache::store {

// ── RecordLogCodec ───────────────────────────────────────────────────────────
//
// One JSON record per line:
//
//   ["default","k",42]
//
// decode() applies records in file order, so a key that appears on several
// lines ends up with the value of the last one.  A line that is not a
// [string, string, value] array is skipped with a warning.  This is stricter
// than older writers of the format: records with a numeric table or key, or
// with extra trailing elements, are dropped rather than coerced.
//
// encode() writes a compacted snapshot (one line per live key, tables in
// insertion order).  Empty tables produce no lines and therefore do not
// reappear after a reload.

class RecordLogCodec final : public StoreCodec {
public:
    [[nodiscard]] std::string encode(const Store& store) const override;
    [[nodiscard]] Store decode(std::string_view text,
                               spdlog::logger& log) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "txt"; }
};

} // namespace kvcache::store
