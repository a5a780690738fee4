#pragma once

#include "store/scheduler.hpp"
#include "store/store.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace kvcache::store {

// ── DebouncedFileStore ───────────────────────────────────────────────────────
//
// In-memory Store mirrored to a single file through a StoreCodec.
//
// Lifecycle:
//   load()       – once, before use: creates the parent directory and reads
//                  the file.  A missing file leaves the store empty; any other
//                  failure is logged as a warning and also leaves it empty.
//   mark_dirty() – after every mutation: cancels the outstanding flush and
//                  schedules a new one `flush_delay` from now, so a burst of
//                  mutations produces exactly one write of the final state.
//   shutdown()   – if a flush is pending, cancels it and flushes right away.
//
// Flushes rewrite the whole file.  Write failures are logged and swallowed;
// memory stays authoritative and the next mutation triggers another attempt.
//
// NOT thread-safe: all access must happen on the scheduler's executor.

class DebouncedFileStore {
public:
    static constexpr auto kFlushDelay = std::chrono::milliseconds{1000};

    DebouncedFileStore(std::filesystem::path path,
                       std::unique_ptr<StoreCodec> codec,
                       std::unique_ptr<Scheduler> scheduler,
                       std::shared_ptr<spdlog::logger> logger,
                       std::chrono::milliseconds flush_delay = kFlushDelay);

    // Not copyable: scheduled flushes refer back to this instance.
    DebouncedFileStore(const DebouncedFileStore&)            = delete;
    DebouncedFileStore& operator=(const DebouncedFileStore&) = delete;

    // Populate the store from the persistence file (replaces current contents).
    void load();

    // The table called `name`, created empty if absent.
    Table& table(const std::string& name);

    // Drop the table called `name`. Returns true if it existed.
    bool erase_table(const std::string& name);

    // Schedule a debounced flush, replacing any outstanding one.
    void mark_dirty();

    // Serialize the whole store and overwrite the file now.
    // Returns false if the write failed (already logged).
    bool flush();

    // Force out a pending flush. No-op when nothing is pending.
    void shutdown();

    [[nodiscard]] bool flush_pending() const { return scheduler_->pending(); }

    // Number of flush attempts so far (successful or not).
    [[nodiscard]] std::uint64_t flush_count() const noexcept { return flush_count_; }

    [[nodiscard]] const Store& store() const noexcept { return store_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] const StoreCodec& codec() const noexcept { return *codec_; }

private:
    std::filesystem::path path_;
    std::unique_ptr<StoreCodec> codec_;
    std::unique_ptr<Scheduler> scheduler_;
    std::shared_ptr<spdlog::logger> logger_;
    std::chrono::milliseconds flush_delay_;
    Store store_;
    std::uint64_t flush_count_ = 0;
};

} // namespace kvcache::store
