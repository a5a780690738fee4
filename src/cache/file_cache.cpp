#include "cache/file_cache.hpp"

#include "store/ini_codec.hpp"
#include "store/record_log_codec.hpp"
#include "store/scheduler.hpp"

#include <stdexcept>
#include <vector>

namespace kvcache {

FileCache::FileCache(std::unique_ptr<store::DebouncedFileStore> file_store,
                     std::shared_ptr<spdlog::logger> logger)
    : store_(std::move(file_store))
    , logger_(logger ? std::move(logger) : spdlog::default_logger())
{
    if (!store_) {
        throw std::invalid_argument("FileCache needs a file store");
    }
}

boost::asio::awaitable<void> FileCache::start() {
    store_->load();
    logger_->info("{} cache service started at {}",
                  store_->codec().name(), store_->path().string());
    co_return;
}

boost::asio::awaitable<void> FileCache::stop() {
    store_->shutdown();
    logger_->info("{} cache service stopped", store_->codec().name());
    co_return;
}

boost::asio::awaitable<void> FileCache::clear(std::string table) {
    store_->erase_table(table);
    store_->mark_dirty();
    co_return;
}

boost::asio::awaitable<std::optional<Value>>
FileCache::get(std::string table, std::string key) {
    if (const auto* value = store_->table(table).find(key)) {
        co_return *value;
    }
    co_return std::nullopt;
}

boost::asio::awaitable<void>
FileCache::set(std::string table, std::string key, Value value,
               std::optional<std::chrono::milliseconds> /*max_age*/) {
    // No expiration support: max_age is ignored.
    store_->table(table).insert_or_assign(std::move(key), std::move(value));
    store_->mark_dirty();
    co_return;
}

boost::asio::awaitable<void> FileCache::del(std::string table, std::string key) {
    store_->table(table).erase(key);
    store_->mark_dirty();
    co_return;
}

std::unique_ptr<Cursor<std::string>> FileCache::keys(const std::string& table) {
    const auto& t = store_->table(table);
    std::vector<std::string> items;
    items.reserve(t.size());
    for (const auto& [key, value] : t) {
        items.push_back(key);
    }
    return std::make_unique<VectorCursor<std::string>>(std::move(items));
}

std::unique_ptr<Cursor<Value>> FileCache::values(const std::string& table) {
    const auto& t = store_->table(table);
    std::vector<Value> items;
    items.reserve(t.size());
    for (const auto& [key, value] : t) {
        items.push_back(value);
    }
    return std::make_unique<VectorCursor<Value>>(std::move(items));
}

std::unique_ptr<Cursor<Entry>> FileCache::entries(const std::string& table) {
    const auto& t = store_->table(table);
    return std::make_unique<VectorCursor<Entry>>(std::vector<Entry>(t.begin(), t.end()));
}

namespace {

std::unique_ptr<FileCache> make_file_cache(
    const std::filesystem::path& path,
    std::unique_ptr<store::StoreCodec> codec,
    boost::asio::any_io_executor executor,
    std::shared_ptr<spdlog::logger> logger)
{
    auto file_store = std::make_unique<store::DebouncedFileStore>(
        path, std::move(codec),
        std::make_unique<store::AsioScheduler>(std::move(executor)),
        logger);
    return std::make_unique<FileCache>(std::move(file_store), std::move(logger));
}

} // anonymous namespace

std::unique_ptr<FileCache> make_ini_cache(
    const std::filesystem::path& path,
    boost::asio::any_io_executor executor,
    std::shared_ptr<spdlog::logger> logger)
{
    return make_file_cache(path, std::make_unique<store::IniCodec>(),
                           std::move(executor), std::move(logger));
}

std::unique_ptr<FileCache> make_text_cache(
    const std::filesystem::path& path,
    boost::asio::any_io_executor executor,
    std::shared_ptr<spdlog::logger> logger)
{
    return make_file_cache(path, std::make_unique<store::RecordLogCodec>(),
                           std::move(executor), std::move(logger));
}

} // namespace kvcache
