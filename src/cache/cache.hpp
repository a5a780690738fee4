#pragma once

#include "common/value.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

namespace kvcache {

// ── CacheError ───────────────────────────────────────────────────────────────
//
// Raised when a backend cannot honour an operation (engine failure, engine
// not open).  A missing key is never an error.

class CacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A (key, value) pair produced by Cache::entries().
using Entry = std::pair<std::string, Value>;

// ── Cursor ───────────────────────────────────────────────────────────────────
//
// Lazy, finite traversal over one table.  next() yields elements in the
// backend's order and std::nullopt once exhausted (and on every call after
// that).  Each keys()/values()/entries() call creates an independent cursor.

template <typename T>
class Cursor {
public:
    virtual ~Cursor() = default;

    virtual boost::asio::awaitable<std::optional<T>> next() = 0;
};

// Cursor over elements captured when it was created.
template <typename T>
class VectorCursor final : public Cursor<T> {
public:
    explicit VectorCursor(std::vector<T> items)
        : items_(std::move(items))
    {}

    boost::asio::awaitable<std::optional<T>> next() override {
        if (pos_ >= items_.size()) {
            co_return std::nullopt;
        }
        co_return std::move(items_[pos_++]);
    }

private:
    std::vector<T> items_;
    std::size_t pos_ = 0;
};

// Collect everything `cursor` still has to offer.
template <typename T>
boost::asio::awaitable<std::vector<T>> drain(Cursor<T>& cursor) {
    std::vector<T> result;
    while (auto item = co_await cursor.next()) {
        result.push_back(std::move(*item));
    }
    co_return result;
}

// Callback for Cache::for_each(): receives (value, key).
using ForEachCallback =
    std::function<boost::asio::awaitable<void>(Value value, std::string key)>;

// ── Cache ────────────────────────────────────────────────────────────────────
//
// Uniform table/key/value cache contract.  Backends differ only in how (and
// whether) they persist; callers never need to know which one they hold.
//
// Tables spring into existence on first use; there is no "create table".
// All operations are coroutines for a single-threaded io_context.  Arguments
// are taken by value so they stay valid across suspension points.

class Cache {
public:
    virtual ~Cache() = default;

    // Lifecycle hooks driven by the host: start() once it is ready to serve,
    // stop() when it disposes the cache.
    virtual boost::asio::awaitable<void> start() = 0;
    virtual boost::asio::awaitable<void> stop() = 0;

    // Removes every entry of `table`; other tables are untouched.
    virtual boost::asio::awaitable<void> clear(std::string table) = 0;

    // Returns the stored value, or std::nullopt if `key` is not present.
    virtual boost::asio::awaitable<std::optional<Value>>
    get(std::string table, std::string key) = 0;

    // Inserts or overwrites.  `max_age` is accepted for interface
    // compatibility; no backend expires entries.
    virtual boost::asio::awaitable<void>
    set(std::string table, std::string key, Value value,
        std::optional<std::chrono::milliseconds> max_age = std::nullopt) = 0;

    // Removes `key` if present.
    virtual boost::asio::awaitable<void> del(std::string table, std::string key) = 0;

    [[nodiscard]] virtual std::unique_ptr<Cursor<std::string>>
    keys(const std::string& table) = 0;

    [[nodiscard]] virtual std::unique_ptr<Cursor<Value>>
    values(const std::string& table) = 0;

    [[nodiscard]] virtual std::unique_ptr<Cursor<Entry>>
    entries(const std::string& table) = 0;

    // Calls `callback(value, key)` for every entry of `table`.
    //
    // Each invocation is spawned on the current executor as soon as its entry
    // is read, without waiting for earlier ones.  Once the traversal is done,
    // completes when all invocations have finished, or rethrows the first
    // failure as soon as one is seen.  Invocations already running are not
    // cancelled; the callback object is kept alive until the last one ends.
    // There is no limit on how many invocations run at once.
    boost::asio::awaitable<void> for_each(std::string table, ForEachCallback callback);
};

} // namespace kvcache
