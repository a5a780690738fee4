#pragma once

#include "cache/cache.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace rocksdb {
class DB;
} // namespace rocksdb

namespace kvcache {

// Key prefix isolating `table` inside the shared keyspace:
// "<byte length of table>:<table>:".  The length makes the prefix unique for
// any table name, so (tableA, k) and (tableB, k) never collide and a scan of
// one table never sees another.
[[nodiscard]] std::string table_key_prefix(std::string_view table);

// ── RocksDBCache ─────────────────────────────────────────────────────────────
//
// Cache stored directly in a RocksDB database; there is no in-memory mirror
// and no debounce; the engine is the durable state.  Values are stored as
// JSON text under table_key_prefix(table) + key, so traversals follow
// RocksDB's bytewise key order.
//
// The database is opened by start(), not by the constructor.  Until then (or
// if opening failed, or after stop()) every operation throws CacheError.
// Engine failures other than "not found" are thrown as CacheError as well.
//
// Cursors read through a RocksDB iterator, which pins an implicit snapshot:
// they see the table as it was when created.  A live cursor keeps the
// database object alive even after stop().

class RocksDBCache final : public Cache {
public:
    explicit RocksDBCache(std::filesystem::path db_path,
                          std::shared_ptr<spdlog::logger> logger = {});

    ~RocksDBCache() override;

    // Not copyable or movable: RocksDB owns internal state.
    RocksDBCache(const RocksDBCache&)            = delete;
    RocksDBCache& operator=(const RocksDBCache&) = delete;
    RocksDBCache(RocksDBCache&&)                 = delete;
    RocksDBCache& operator=(RocksDBCache&&)      = delete;

    // Opens (or creates) the database.  Failure is logged, not thrown; the
    // cache then stays closed.
    boost::asio::awaitable<void> start() override;

    // Closes the database if open.  Safe to call repeatedly.
    boost::asio::awaitable<void> stop() override;

    boost::asio::awaitable<void> clear(std::string table) override;
    boost::asio::awaitable<std::optional<Value>>
    get(std::string table, std::string key) override;
    boost::asio::awaitable<void>
    set(std::string table, std::string key, Value value,
        std::optional<std::chrono::milliseconds> max_age = std::nullopt) override;
    boost::asio::awaitable<void> del(std::string table, std::string key) override;

    [[nodiscard]] std::unique_ptr<Cursor<std::string>> keys(const std::string& table) override;
    [[nodiscard]] std::unique_ptr<Cursor<Value>> values(const std::string& table) override;
    [[nodiscard]] std::unique_ptr<Cursor<Entry>> entries(const std::string& table) override;

    [[nodiscard]] bool is_open() const noexcept { return db_ != nullptr; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    // Throws CacheError unless the database is open.
    void ensure_open() const;

    // The open database, or CacheError.
    [[nodiscard]] rocksdb::DB& db() const;

    std::filesystem::path path_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<rocksdb::DB> db_;
};

} // namespace kvcache
