#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/cobalt.hpp>
#include <boost/variant2/variant.hpp>

#include <chrono>
#include <expected>
#include <system_error>

namespace bridgelink::cobalt_utils {

namespace cobalt = boost::cobalt;
namespace asio = boost::asio;

// Spawn helper: start a cobalt::task on an asio executor, fire-and-forget
template<typename T>
void spawn_task(asio::any_io_executor ex, cobalt::task<T>&& t) {
    cobalt::spawn(ex, std::move(t), asio::detached);
}

// Suspend the current coroutine. Returns false if the wait was cancelled.
inline cobalt::task<bool> sleep_for(std::chrono::milliseconds duration) {
    auto ex = co_await cobalt::this_coro::executor;
    asio::steady_timer timer(ex, duration);
    auto [ec] = co_await timer.async_wait(asio::as_tuple(cobalt::use_op));
    co_return !ec;
}

// Race a task against a timer. The losing task is cancelled.
template<typename T>
cobalt::task<std::expected<T, std::error_code>>
with_timeout(cobalt::task<T> t, std::chrono::milliseconds timeout) {
    auto ex = co_await cobalt::this_coro::executor;
    asio::steady_timer timer(ex, timeout);

    auto result = co_await cobalt::race(
        std::move(t),
        timer.async_wait(cobalt::use_op)
    );

    // race returns boost::variant2::variant, use boost::variant2::get
    if (result.index() == 0) {
        co_return boost::variant2::get<0>(std::move(result));
    } else {
        co_return std::unexpected(std::make_error_code(std::errc::timed_out));
    }
}

} // namespace bridgelink::cobalt_utils
