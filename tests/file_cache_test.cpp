#include "cache/file_cache.hpp"

#include "common/file_io.hpp"
#include "store/ini_codec.hpp"
#include "store/record_log_codec.hpp"
#include "store/scheduler.hpp"
#include "test_util.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include <gtest/gtest.h>

namespace kvcache {

namespace asio = boost::asio;
using namespace std::chrono_literals;
using test::run_sync;

// ── Fixture ───────────────────────────────────────────────────────────────────
// A FileCache whose flush timer is a ManualScheduler: io_context::run() never
// waits on it, and tests advance time explicitly.

class FileCacheTest : public test::TempDirTest {
protected:
    std::unique_ptr<FileCache> make_cache(
        const std::filesystem::path& path,
        std::unique_ptr<store::StoreCodec> codec = std::make_unique<store::IniCodec>()) {
        auto scheduler = std::make_unique<store::ManualScheduler>();
        scheduler_ = scheduler.get();
        auto file_store = std::make_unique<store::DebouncedFileStore>(
            path, std::move(codec), std::move(scheduler), log_.logger());
        return std::make_unique<FileCache>(std::move(file_store), log_.logger());
    }

    void SetUp() override {
        TempDirTest::SetUp();
        path_ = test_dir_ / "data" / "cache" / "cache.ini";
        cache_ = make_cache(path_);
        run_sync(ioc_, cache_->start());
    }

    std::optional<Value> get(const std::string& table, const std::string& key) {
        return run_sync(ioc_, cache_->get(table, key));
    }

    void set(const std::string& table, const std::string& key, Value value) {
        run_sync(ioc_, cache_->set(table, key, std::move(value)));
    }

    std::vector<std::string> keys(const std::string& table) {
        auto cursor = cache_->keys(table);
        return run_sync(ioc_, drain(*cursor));
    }

    asio::io_context ioc_;
    test::CapturingLogger log_;
    std::filesystem::path path_;
    store::ManualScheduler* scheduler_ = nullptr;
    std::unique_ptr<FileCache> cache_;
};

// ── Lifecycle ─────────────────────────────────────────────────────────────────

TEST_F(FileCacheTest, StartLogsBackendAndPath) {
    EXPECT_TRUE(log_.contains("info ini cache service started at " + path_.string()));
}

TEST_F(FileCacheTest, StopLogsAndForcesPendingFlush) {
    set("default", "k", 1);
    run_sync(ioc_, cache_->stop());

    EXPECT_TRUE(log_.contains("info ini cache service stopped"));
    EXPECT_EQ(cache_->file_store().flush_count(), 1u);
    EXPECT_TRUE(std::filesystem::exists(path_));
}

// ── get / set / del ──────────────────────────────────────────────────────────

TEST_F(FileCacheTest, GetMissingKeyReturnsNullopt) {
    EXPECT_FALSE(get("default", "missing").has_value());
    EXPECT_FALSE(get("never-used", "missing").has_value());
}

TEST_F(FileCacheTest, SetThenGetReturnsValue) {
    set("default", "user", Value{{"name", "Ada"}, {"age", 36}});
    auto value = get("default", "user");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ((*value)["name"], "Ada");
    EXPECT_EQ((*value)["age"], 36);
}

TEST_F(FileCacheTest, StoredNullIsDistinctFromMissing) {
    set("default", "nothing", nullptr);
    auto value = get("default", "nothing");
    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(value->is_null());
}

TEST_F(FileCacheTest, OverwriteKeepsLatestValue) {
    set("default", "k", 1);
    set("default", "k", 2);
    EXPECT_EQ(*get("default", "k"), 2);
}

TEST_F(FileCacheTest, DelRemovesKey) {
    set("default", "k", 1);
    run_sync(ioc_, cache_->del("default", "k"));
    EXPECT_FALSE(get("default", "k").has_value());
}

TEST_F(FileCacheTest, DelMissingKeyIsNoOp) {
    EXPECT_NO_THROW(run_sync(ioc_, cache_->del("default", "absent")));
}

TEST_F(FileCacheTest, SameKeyInDifferentTablesIsIndependent) {
    set("a", "k", "from a");
    set("b", "k", "from b");
    EXPECT_EQ(*get("a", "k"), "from a");
    EXPECT_EQ(*get("b", "k"), "from b");
}

TEST_F(FileCacheTest, MaxAgeIsAcceptedButNothingExpires) {
    run_sync(ioc_, cache_->set("default", "k", 1, 1ms));
    scheduler_->advance(10'000ms);
    EXPECT_EQ(*get("default", "k"), 1);
}

// ── clear ─────────────────────────────────────────────────────────────────────

TEST_F(FileCacheTest, ClearEmptiesOnlyThatTable) {
    set("a", "x", 1);
    set("a", "y", 2);
    set("b", "x", 3);

    run_sync(ioc_, cache_->clear("a"));

    EXPECT_TRUE(keys("a").empty());
    EXPECT_FALSE(get("a", "x").has_value());
    EXPECT_EQ(*get("b", "x"), 3);
}

// ── Traversal ────────────────────────────────────────────────────────────────

TEST_F(FileCacheTest, TraversalFollowsInsertionOrder) {
    set("t", "zebra", 1);
    set("t", "apple", 2);
    set("t", "mango", 3);
    set("t", "zebra", 4);  // overwrite keeps position

    EXPECT_EQ(keys("t"), (std::vector<std::string>{"zebra", "apple", "mango"}));

    auto values_cursor = cache_->values("t");
    auto values = run_sync(ioc_, drain(*values_cursor));
    EXPECT_EQ(values, (std::vector<Value>{4, 2, 3}));

    auto entries_cursor = cache_->entries("t");
    auto entries = run_sync(ioc_, drain(*entries_cursor));
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[1], (Entry{"apple", 2}));
}

TEST_F(FileCacheTest, CursorsAreIndependent) {
    set("t", "a", 1);
    set("t", "b", 2);

    auto first  = cache_->keys("t");
    auto second = cache_->keys("t");

    EXPECT_EQ(*run_sync(ioc_, first->next()), "a");
    EXPECT_EQ(*run_sync(ioc_, first->next()), "b");
    EXPECT_FALSE(run_sync(ioc_, first->next()).has_value());
    EXPECT_FALSE(run_sync(ioc_, first->next()).has_value());

    EXPECT_EQ(*run_sync(ioc_, second->next()), "a");
}

TEST_F(FileCacheTest, CursorSeesTableAsOfCreation) {
    set("t", "a", 1);
    auto cursor = cache_->keys("t");
    set("t", "b", 2);
    run_sync(ioc_, cache_->del("t", "a"));

    EXPECT_EQ(run_sync(ioc_, drain(*cursor)), (std::vector<std::string>{"a"}));
}

TEST_F(FileCacheTest, EmptyTableTraversalEndsImmediately) {
    EXPECT_TRUE(keys("nothing-here").empty());
}

// ── Persistence ───────────────────────────────────────────────────────────────

TEST_F(FileCacheTest, MutationsAreDebounced) {
    set("default", "k", 1);
    set("default", "k", 2);
    set("default", "k", 3);
    EXPECT_EQ(cache_->file_store().flush_count(), 0u);

    scheduler_->advance(1000ms);
    EXPECT_EQ(cache_->file_store().flush_count(), 1u);

    std::string data;
    ASSERT_FALSE(read_file(path_, data));
    EXPECT_EQ(data, "[default]\nk = 3\n\n");
}

TEST_F(FileCacheTest, IniContentsSurviveRestart) {
    set("default", "user", Value{{"name", "Ada"}});
    set("other", "n", 7);
    run_sync(ioc_, cache_->stop());

    cache_ = make_cache(path_);
    run_sync(ioc_, cache_->start());

    EXPECT_EQ((*get("default", "user"))["name"], "Ada");
    EXPECT_EQ(*get("other", "n"), 7);
}

TEST_F(FileCacheTest, TextContentsSurviveRestart) {
    const auto path = test_dir_ / "data" / "cache" / "cache.txt";
    cache_ = make_cache(path, std::make_unique<store::RecordLogCodec>());
    run_sync(ioc_, cache_->start());

    set("default", "k", Value::array({1, 2, 3}));
    set("default", "s", "text");
    run_sync(ioc_, cache_->del("default", "s"));
    run_sync(ioc_, cache_->stop());

    std::string data;
    ASSERT_FALSE(read_file(path, data));
    EXPECT_EQ(data, "[\"default\",\"k\",[1,2,3]]\n");

    cache_ = make_cache(path, std::make_unique<store::RecordLogCodec>());
    run_sync(ioc_, cache_->start());
    EXPECT_EQ(*get("default", "k"), Value::array({1, 2, 3}));
    EXPECT_FALSE(get("default", "s").has_value());
}

// ── Factories with the real timer ────────────────────────────────────────────

static asio::awaitable<void> set_and_stop(Cache& cache) {
    co_await cache.start();
    co_await cache.set("default", "k", 1);
    co_await cache.stop();
}

TEST(FileCacheFactoryTest, IniCacheFlushesAfterQuietPeriod) {
    const auto dir = std::filesystem::temp_directory_path() / "kvcache_factory_ini";
    std::filesystem::remove_all(dir);
    const auto path = dir / "cache.ini";

    asio::io_context ioc;
    auto cache = make_ini_cache(path, ioc.get_executor());
    run_sync(ioc, cache->start());

    // run_sync() returns only once the debounce timer has fired.
    run_sync(ioc, cache->set("default", "k", "v"));
    EXPECT_EQ(cache->file_store().flush_count(), 1u);

    std::string data;
    ASSERT_FALSE(read_file(path, data));
    EXPECT_EQ(data, "[default]\nk = \"v\"\n\n");

    run_sync(ioc, cache->stop());
    EXPECT_EQ(cache->file_store().flush_count(), 1u);
    std::filesystem::remove_all(dir);
}

TEST(FileCacheFactoryTest, TextCacheStopFlushesImmediately) {
    const auto dir = std::filesystem::temp_directory_path() / "kvcache_factory_txt";
    std::filesystem::remove_all(dir);
    const auto path = dir / "cache.txt";

    asio::io_context ioc;
    auto cache = make_text_cache(path, ioc.get_executor());
    run_sync(ioc, set_and_stop(*cache));
    EXPECT_EQ(cache->file_store().flush_count(), 1u);
    EXPECT_EQ(cache->file_store().codec().name(), "txt");

    std::string data;
    ASSERT_FALSE(read_file(path, data));
    EXPECT_EQ(data, "[\"default\",\"k\",1]\n");
    std::filesystem::remove_all(dir);
}

} // namespace kvcache
