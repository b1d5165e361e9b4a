#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/cobalt.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace bridgelink::client {

namespace cobalt = boost::cobalt;
namespace asio = boost::asio;

// ============================================================================
// KeepalivePinger - pings the relay every interval while a device is
// connected through it, so the relay does not idle the session out.
//
// The first ping goes out one interval after start(). A failed ping is
// logged and the loop carries on.
// ============================================================================
class KeepalivePinger : public std::enable_shared_from_this<KeepalivePinger> {
public:
    using Ping = std::function<cobalt::task<bool>()>;

    KeepalivePinger(asio::any_io_executor ex, std::chrono::milliseconds interval, Ping ping);

    void start();
    void stop();

    bool active() const { return active_; }
    uint64_t pings_sent() const { return pings_sent_; }
    uint64_t pings_failed() const { return pings_failed_; }

private:
    cobalt::task<void> run();

    asio::any_io_executor executor_;
    std::chrono::milliseconds interval_;
    Ping ping_;
    asio::steady_timer timer_;

    bool active_ = false;
    bool running_ = false;
    uint64_t pings_sent_ = 0;
    uint64_t pings_failed_ = 0;
};

} // namespace bridgelink::client
