#pragma once

#include "cache/cache.hpp"
#include "store/debounced_file_store.hpp"

#include <filesystem>
#include <memory>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <spdlog/spdlog.h>

namespace kvcache {

// ── FileCache ────────────────────────────────────────────────────────────────
//
// Cache served from memory and mirrored to one file by a DebouncedFileStore.
// Reads never touch the disk; clear/set/del schedule a debounced flush.
// Persistence trouble is logged, never thrown to the caller.
//
// Traversals iterate a copy of the table taken when the cursor is created,
// in insertion order.  Reading from an absent table creates it empty.
//
// NOT thread-safe: all access must happen on the io_context thread.

class FileCache final : public Cache {
public:
    FileCache(std::unique_ptr<store::DebouncedFileStore> file_store,
              std::shared_ptr<spdlog::logger> logger);

    boost::asio::awaitable<void> start() override;
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

    // Direct access to the engine (flush state, path, codec).
    [[nodiscard]] store::DebouncedFileStore& file_store() noexcept { return *store_; }
    [[nodiscard]] const store::DebouncedFileStore& file_store() const noexcept { return *store_; }

private:
    std::unique_ptr<store::DebouncedFileStore> store_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Section-per-table INI file (IniCodec), flushed via an AsioScheduler.
[[nodiscard]] std::unique_ptr<FileCache> make_ini_cache(
    const std::filesystem::path& path,
    boost::asio::any_io_executor executor,
    std::shared_ptr<spdlog::logger> logger = {});

// One-JSON-record-per-line file (RecordLogCodec), flushed via an AsioScheduler.
[[nodiscard]] std::unique_ptr<FileCache> make_text_cache(
    const std::filesystem::path& path,
    boost::asio::any_io_executor executor,
    std::shared_ptr<spdlog::logger> logger = {});

} // namespace kvcache
