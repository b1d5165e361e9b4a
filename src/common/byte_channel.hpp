#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/cobalt.hpp>

#include <cstdint>
#include <deque>
#include <exception>
#include <optional>
#include <vector>

namespace bridgelink {

namespace cobalt = boost::cobalt;
namespace asio = boost::asio;

using Bytes = std::vector<uint8_t>;

// ============================================================================
// ByteChannel - unbounded, ordered stream of byte chunks with one consumer.
//
// Terminal states:
//   ended  - read() drains the remaining chunks, then yields std::nullopt
//   failed - read() rethrows the failure; queued chunks are discarded
// ============================================================================
class ByteChannel {
public:
    explicit ByteChannel(asio::any_io_executor ex);

    ByteChannel(const ByteChannel&) = delete;
    ByteChannel& operator=(const ByteChannel&) = delete;

    // Ignored once the channel has ended or failed
    void push(Bytes chunk);
    void end();
    void fail(std::exception_ptr error);

    cobalt::task<std::optional<Bytes>> read();

    bool is_open() const { return !ended_ && !error_; }
    bool failed() const { return error_ != nullptr; }
    size_t buffered_chunks() const { return queue_.size(); }

private:
    asio::steady_timer wake_;
    std::deque<Bytes> queue_;
    bool ended_ = false;
    std::exception_ptr error_;
};

} // namespace bridgelink
