#include "common/byte_channel.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include <chrono>

namespace bridgelink {

ByteChannel::ByteChannel(asio::any_io_executor ex) : wake_(ex) {
    wake_.expires_at(std::chrono::steady_clock::time_point::max());
}

void ByteChannel::push(Bytes chunk) {
    if (!is_open()) return;
    queue_.push_back(std::move(chunk));
    wake_.cancel();
}

void ByteChannel::end() {
    if (!is_open()) return;
    ended_ = true;
    wake_.cancel();
}

void ByteChannel::fail(std::exception_ptr error) {
    if (!is_open()) return;
    error_ = error;
    queue_.clear();
    wake_.cancel();
}

cobalt::task<std::optional<Bytes>> ByteChannel::read() {
    for (;;) {
        if (error_) {
            std::rethrow_exception(error_);
        }
        if (!queue_.empty()) {
            auto chunk = std::move(queue_.front());
            queue_.pop_front();
            co_return chunk;
        }
        if (ended_) {
            co_return std::nullopt;
        }

        co_await wake_.async_wait(asio::as_tuple(cobalt::use_op));

        // Woken without any state change: the reader was cancelled
        if (queue_.empty() && is_open()) {
            throw boost::system::system_error(asio::error::operation_aborted);
        }
    }
}

} // namespace bridgelink
