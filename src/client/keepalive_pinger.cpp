#include "client/keepalive_pinger.hpp"
#include "common/cobalt_utils.hpp"
#include "common/logger.hpp"

#include <boost/asio/as_tuple.hpp>

namespace bridgelink::client {

namespace {
auto& log() { return Logger::get("client.keepalive"); }
} // anonymous namespace

KeepalivePinger::KeepalivePinger(asio::any_io_executor ex,
                                 std::chrono::milliseconds interval,
                                 Ping ping)
    : executor_(ex)
    , interval_(interval)
    , ping_(std::move(ping))
    , timer_(ex) {}

void KeepalivePinger::start() {
    active_ = true;
    if (running_) {
        return;
    }
    running_ = true;
    log().debug("Keepalive started ({}ms)", interval_.count());

    cobalt_utils::spawn_task(executor_, [](std::shared_ptr<KeepalivePinger> self) -> cobalt::task<void> {
        co_await self->run();
    }(shared_from_this()));
}

void KeepalivePinger::stop() {
    if (!active_) {
        return;
    }
    active_ = false;
    timer_.cancel();
    log().debug("Keepalive stopped after {} ping(s)", pings_sent_);
}

cobalt::task<void> KeepalivePinger::run() {
    while (active_) {
        timer_.expires_after(interval_);
        // Cancelled by stop(); a start() right after begins a fresh interval
        auto [ec] = co_await timer_.async_wait(asio::as_tuple(cobalt::use_op));
        if (!active_) {
            break;
        }
        if (ec) {
            continue;
        }

        ++pings_sent_;
        if (!co_await ping_()) {
            ++pings_failed_;
            log().warn("Keepalive ping failed ({} of {})", pings_failed_, pings_sent_);
        }
    }
    running_ = false;
}

} // namespace bridgelink::client
