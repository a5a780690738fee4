#include "cache/cache.hpp"

#include <cstddef>
#include <exception>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace kvcache {

namespace {

// Shared between for_each() and the invocations it spawns.  The timer never
// expires on its own; it is cancelled to wake the waiting for_each().
struct ForEachState {
    ForEachState(boost::asio::any_io_executor executor, ForEachCallback cb)
        : signal(std::move(executor), boost::asio::steady_timer::time_point::max())
        , callback(std::move(cb))
    {}

    boost::asio::steady_timer signal;
    ForEachCallback callback;
    std::size_t outstanding = 0;
    std::exception_ptr error;
};

} // anonymous namespace

boost::asio::awaitable<void>
Cache::for_each(std::string table, ForEachCallback callback)
{
    auto executor = co_await boost::asio::this_coro::executor;
    auto state = std::make_shared<ForEachState>(executor, std::move(callback));

    auto cursor = entries(table);
    while (auto entry = co_await cursor->next()) {
        ++state->outstanding;
        boost::asio::co_spawn(
            executor,
            state->callback(std::move(entry->second), std::move(entry->first)),
            [state](std::exception_ptr error) {
                --state->outstanding;
                if (error && !state->error) {
                    state->error = error;
                    state->signal.cancel();
                } else if (state->outstanding == 0) {
                    state->signal.cancel();
                }
            });
    }

    if (state->outstanding > 0 && !state->error) {
        // operation_aborted is the wake-up signal; the state says why.
        boost::system::error_code ec;
        co_await state->signal.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    if (state->error) {
        std::rethrow_exception(state->error);
    }
}

} // namespace kvcache
