#include "store/scheduler.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

namespace kvcache::store {

// ── AsioScheduler ────────────────────────────────────────────────────────────

struct AsioScheduler::State {
    explicit State(boost::asio::any_io_executor executor)
        : timer{std::move(executor)}
    {}

    boost::asio::steady_timer timer;
    std::uint64_t generation = 0;
    bool pending = false;
};

AsioScheduler::AsioScheduler(boost::asio::any_io_executor executor)
    : state_{std::make_shared<State>(std::move(executor))}
{}

AsioScheduler::~AsioScheduler()
{
    cancel();
}

void AsioScheduler::schedule(std::chrono::milliseconds delay,
                             std::function<void()> task)
{
    const auto generation = ++state_->generation;
    state_->pending = true;

    // expires_after() aborts the previous wait (operation_aborted).
    state_->timer.expires_after(delay);
    state_->timer.async_wait(
        [state = state_, generation, task = std::move(task)](
            const boost::system::error_code& ec) {
            if (ec || generation != state->generation) {
                return;
            }
            state->pending = false;
            task();
        });
}

bool AsioScheduler::cancel()
{
    const bool was_pending = state_->pending;
    state_->pending = false;
    ++state_->generation;
    state_->timer.cancel();
    return was_pending;
}

bool AsioScheduler::pending() const
{
    return state_->pending;
}

} // namespace kvcache::store
