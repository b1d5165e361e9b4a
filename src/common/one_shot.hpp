#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/cobalt.hpp>
#include <boost/system/system_error.hpp>

#include <chrono>
#include <exception>
#include <optional>
#include <variant>

namespace bridgelink {

namespace cobalt = boost::cobalt;
namespace asio = boost::asio;

// ============================================================================
// OneShot - a signal that settles exactly once, observed by any number of
// waiters. Every waiter sees the same value (or the same exception).
//
// Waiters park on a timer that never expires; settling cancels the timer,
// which wakes all of them. Must be used from the executor it was created on.
// ============================================================================
template<typename T>
class OneShot {
public:
    explicit OneShot(asio::any_io_executor ex) : wake_(ex) {
        wake_.expires_at(std::chrono::steady_clock::time_point::max());
    }

    OneShot(const OneShot&) = delete;
    OneShot& operator=(const OneShot&) = delete;

    // Returns false if the signal had already settled.
    bool resolve(T value) {
        if (settled()) return false;
        value_.emplace(std::move(value));
        wake_.cancel();
        return true;
    }

    bool reject(std::exception_ptr error) {
        if (settled()) return false;
        error_ = error;
        wake_.cancel();
        return true;
    }

    bool settled() const { return value_.has_value() || error_ != nullptr; }
    bool resolved() const { return value_.has_value(); }
    bool rejected() const { return error_ != nullptr; }

    // Value if resolved, nullptr otherwise
    const T* peek() const { return value_ ? &*value_ : nullptr; }

    // Wait for settlement. Throws the rejection cause, or operation_aborted
    // if the waiting coroutine itself was cancelled before settlement.
    cobalt::task<T> wait() {
        if (!settled()) {
            co_await wake_.async_wait(asio::as_tuple(cobalt::use_op));
            if (!settled()) {
                throw boost::system::system_error(asio::error::operation_aborted);
            }
        }
        if (error_) {
            std::rethrow_exception(error_);
        }
        co_return *value_;
    }

private:
    asio::steady_timer wake_;
    std::optional<T> value_;
    std::exception_ptr error_;
};

// Value-less one-shot
using Latch = OneShot<std::monostate>;

} // namespace bridgelink
