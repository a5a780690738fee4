#include "cache/rocksdb_cache.hpp"

#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>

#include <system_error>
#include <type_traits>

namespace kvcache {

namespace {

[[nodiscard]] Value decode_stored(const rocksdb::Slice& key,
                                  const rocksdb::Slice& data) {
    auto value = decode_value(std::string_view{data.data(), data.size()});
    if (!value) {
        throw CacheError("RocksDB value for '" + key.ToString() +
                         "' is not valid JSON");
    }
    return std::move(*value);
}

// ── PrefixCursor ────────────────────────────────────────────────────────────
//
// Walks the keys that start with one table prefix.  T selects what is
// produced: the key, the value, or both.

template <typename T>
class PrefixCursor final : public Cursor<T> {
public:
    PrefixCursor(std::shared_ptr<rocksdb::DB> db, std::string prefix)
        : db_(std::move(db))
        , prefix_(std::move(prefix))
        , it_(db_->NewIterator(rocksdb::ReadOptions{}))
    {
        it_->Seek(prefix_);
    }

    boost::asio::awaitable<std::optional<T>> next() override {
        if (!it_->Valid() || !it_->key().starts_with(prefix_)) {
            if (auto status = it_->status(); !status.ok()) {
                throw CacheError("RocksDB iteration failed: " + status.ToString());
            }
            co_return std::nullopt;
        }

        rocksdb::Slice raw_key = it_->key();
        std::string key{raw_key.data() + prefix_.size(),
                        raw_key.size() - prefix_.size()};

        std::optional<T> result;
        if constexpr (std::is_same_v<T, std::string>) {
            result.emplace(std::move(key));
        } else if constexpr (std::is_same_v<T, Value>) {
            result.emplace(decode_stored(raw_key, it_->value()));
        } else {
            result.emplace(std::move(key), decode_stored(raw_key, it_->value()));
        }

        it_->Next();
        co_return result;
    }

private:
    // Declaration order matters: the iterator must go before the database.
    std::shared_ptr<rocksdb::DB> db_;
    std::string prefix_;
    std::unique_ptr<rocksdb::Iterator> it_;
};

} // anonymous namespace

std::string table_key_prefix(std::string_view table) {
    std::string prefix = std::to_string(table.size());
    prefix += ':';
    prefix += table;
    prefix += ':';
    return prefix;
}

RocksDBCache::RocksDBCache(std::filesystem::path db_path,
                           std::shared_ptr<spdlog::logger> logger)
    : path_(std::move(db_path))
    , logger_(logger ? std::move(logger) : spdlog::default_logger())
{}

RocksDBCache::~RocksDBCache() {
    if (db_) {
        logger_->info("Closing RocksDB cache at {}", path_.string());
    }
    // shared_ptr<rocksdb::DB> deletes the DB once the last cursor is gone,
    // which closes it.
}

void RocksDBCache::ensure_open() const {
    if (!db_) {
        throw CacheError("RocksDB cache at " + path_.string() + " is not open");
    }
}

rocksdb::DB& RocksDBCache::db() const {
    ensure_open();
    return *db_;
}

boost::asio::awaitable<void> RocksDBCache::start() {
    if (db_) {
        co_return;
    }

    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            logger_->error("failed to open rocksdb cache: cannot create {}: {}",
                           path_.parent_path().string(), ec.message());
            co_return;
        }
    }

    rocksdb::Options options;
    options.create_if_missing = true;

    // Optimise for small-to-medium working sets typical of a cache.
    options.IncreaseParallelism();
    options.OptimizeLevelStyleCompaction();

    rocksdb::DB* raw_db = nullptr;
    auto status = rocksdb::DB::Open(options, path_.string(), &raw_db);
    if (!status.ok()) {
        logger_->error("failed to open rocksdb cache at {}: {}",
                       path_.string(), status.ToString());
        co_return;
    }
    db_.reset(raw_db);
    logger_->info("rocksdb cache service started at {}", path_.string());
}

boost::asio::awaitable<void> RocksDBCache::stop() {
    if (!db_) {
        co_return;
    }

    // Close explicitly only when no cursor still reads from the database;
    // otherwise the last cursor's release closes it.
    if (db_.use_count() == 1) {
        if (auto status = db_->Close(); !status.ok()) {
            logger_->warn("RocksDB close reported: {}", status.ToString());
        }
    }
    db_.reset();
    logger_->info("rocksdb cache service stopped");
}

boost::asio::awaitable<void> RocksDBCache::clear(std::string table) {
    auto& db = this->db();
    const auto prefix = table_key_prefix(table);

    // Delete all keys of the table via a WriteBatch.
    rocksdb::WriteBatch batch;
    std::unique_ptr<rocksdb::Iterator> it(db.NewIterator(rocksdb::ReadOptions{}));
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        batch.Delete(it->key());
    }
    if (auto status = it->status(); !status.ok()) {
        throw CacheError("RocksDB clear failed: " + status.ToString());
    }

    auto status = db.Write(rocksdb::WriteOptions{}, &batch);
    if (!status.ok()) {
        throw CacheError("RocksDB clear failed: " + status.ToString());
    }
    co_return;
}

boost::asio::awaitable<std::optional<Value>>
RocksDBCache::get(std::string table, std::string key) {
    auto& db = this->db();
    const auto full_key = table_key_prefix(table) + key;

    std::string data;
    auto status = db.Get(rocksdb::ReadOptions{}, full_key, &data);
    if (status.IsNotFound()) {
        co_return std::nullopt;
    }
    if (!status.ok()) {
        throw CacheError("RocksDB Get failed: " + status.ToString());
    }
    co_return decode_stored(full_key, data);
}

boost::asio::awaitable<void>
RocksDBCache::set(std::string table, std::string key, Value value,
                  std::optional<std::chrono::milliseconds> /*max_age*/) {
    // No expiration support: max_age is ignored.
    auto& db = this->db();
    auto status = db.Put(rocksdb::WriteOptions{},
                         table_key_prefix(table) + key, encode_value(value));
    if (!status.ok()) {
        throw CacheError("RocksDB Put failed: " + status.ToString());
    }
    co_return;
}

boost::asio::awaitable<void> RocksDBCache::del(std::string table, std::string key) {
    // RocksDB Delete succeeds even if the key is missing.
    auto& db = this->db();
    auto status = db.Delete(rocksdb::WriteOptions{}, table_key_prefix(table) + key);
    if (!status.ok()) {
        throw CacheError("RocksDB Delete failed: " + status.ToString());
    }
    co_return;
}

std::unique_ptr<Cursor<std::string>> RocksDBCache::keys(const std::string& table) {
    ensure_open();
    return std::make_unique<PrefixCursor<std::string>>(db_, table_key_prefix(table));
}

std::unique_ptr<Cursor<Value>> RocksDBCache::values(const std::string& table) {
    ensure_open();
    return std::make_unique<PrefixCursor<Value>>(db_, table_key_prefix(table));
}

std::unique_ptr<Cursor<Entry>> RocksDBCache::entries(const std::string& table) {
    ensure_open();
    return std::make_unique<PrefixCursor<Entry>>(db_, table_key_prefix(table));
}

} // namespace kvcache
