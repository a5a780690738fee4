#pragma once

#include "common/ordered_map.hpp"
#include "common/value.hpp"

#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace kvcache::store {

// A table maps keys to values; a store maps table names to tables.
// Both iterate in insertion order.  An absent table and an empty table are
// equivalent "no entries" states.
using Table = OrderedMap<Value>;
using Store = OrderedMap<Table>;

// ── StoreCodec ───────────────────────────────────────────────────────────────
//
// Converts a whole Store to and from the text written to a persistence file.
// decode() never fails as a whole: malformed pieces are dropped or degraded
// (each codec documents how) and reported through `log`.

class StoreCodec {
public:
    virtual ~StoreCodec() = default;

    [[nodiscard]] virtual std::string encode(const Store& store) const = 0;

    [[nodiscard]] virtual Store decode(std::string_view text,
                                       spdlog::logger& log) const = 0;

    // Short format name for log messages ("ini", "txt").
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

} // namespace kvcache::store
