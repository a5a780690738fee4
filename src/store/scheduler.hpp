#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include <boost/asio/any_io_executor.hpp>

namespace kvcache::store {

// ── Scheduler abstraction ────────────────────────────────────────────────────
//
// Holds at most one delayed task.  DebouncedFileStore uses it to coalesce
// bursts of mutations into a single flush; tests swap in ManualScheduler so
// that time only moves when they say so.

class Scheduler {
public:
    virtual ~Scheduler() = default;

    // Run `task` once after `delay`.  Any task that is still outstanding is
    // cancelled and replaced in the same step, so tasks never stack.
    virtual void schedule(std::chrono::milliseconds delay,
                          std::function<void()> task) = 0;

    // Cancel the outstanding task.  Returns true if one was pending.
    virtual bool cancel() = 0;

    // True while a task is scheduled and has not run yet.
    [[nodiscard]] virtual bool pending() const = 0;
};

// ── AsioScheduler ────────────────────────────────────────────────────────────
//
// Production Scheduler backed by a boost::asio::steady_timer.  The task runs
// on the timer's executor.  A generation counter guarantees that a replaced
// or cancelled task never runs, even when its wait had already completed and
// the handler was queued.
//
// NOT thread-safe: use from the executor's thread only.

class AsioScheduler final : public Scheduler {
public:
    explicit AsioScheduler(boost::asio::any_io_executor executor);
    ~AsioScheduler() override;

    AsioScheduler(const AsioScheduler&)            = delete;
    AsioScheduler& operator=(const AsioScheduler&) = delete;

    void schedule(std::chrono::milliseconds delay,
                  std::function<void()> task) override;
    bool cancel() override;
    [[nodiscard]] bool pending() const override;

private:
    struct State;
    // Shared with in-flight timer handlers so they never touch a destroyed
    // scheduler.
    std::shared_ptr<State> state_;
};

// ── ManualScheduler ──────────────────────────────────────────────────────────
//
// Test implementation: time only advances via explicit advance() calls.

class ManualScheduler final : public Scheduler {
public:
    void schedule(std::chrono::milliseconds delay,
                  std::function<void()> task) override {
        task_ = std::move(task);
        due_  = now_ + delay;
        ++scheduled_;
    }

    bool cancel() override {
        bool was_pending = static_cast<bool>(task_);
        task_ = nullptr;
        return was_pending;
    }

    [[nodiscard]] bool pending() const override {
        return static_cast<bool>(task_);
    }

    // Move time forward by `delta`, running the task if it falls due.
    void advance(std::chrono::milliseconds delta) {
        now_ += delta;
        if (task_ && due_ <= now_) {
            auto task = std::move(task_);
            task_ = nullptr;
            task();
        }
    }

    // Number of schedule() calls so far.
    [[nodiscard]] std::uint64_t scheduled_count() const noexcept { return scheduled_; }

private:
    std::function<void()> task_;
    std::chrono::milliseconds now_{0};
    std::chrono::milliseconds due_{0};
    std::uint64_t scheduled_ = 0;
};

} // namespace kvcache::store
