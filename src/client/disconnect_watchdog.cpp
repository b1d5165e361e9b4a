#include "client/disconnect_watchdog.hpp"
#include "common/logger.hpp"

namespace bridgelink::client {

namespace {
auto& log() { return Logger::get("client.watchdog"); }
} // anonymous namespace

const char* disconnect_phase_name(DisconnectPhase phase) {
    switch (phase) {
        case DisconnectPhase::AWAITING_TRANSPORT: return "AWAITING_TRANSPORT";
        case DisconnectPhase::CONFIRMING: return "CONFIRMING";
        case DisconnectPhase::DISCONNECTED: return "DISCONNECTED";
        default: return "UNKNOWN";
    }
}

DisconnectWatchdog::DisconnectWatchdog(std::chrono::milliseconds suspicion_window)
    : suspicion_window_(suspicion_window) {}

cobalt::task<void> DisconnectWatchdog::await_disconnect(std::shared_ptr<DeviceSession> session) {
    auto ex = co_await cobalt::this_coro::executor;
    const auto& serial = session->serial();

    std::shared_ptr<Wait> wait;
    bool owner = false;
    {
        std::lock_guard lock(mutex_);
        auto it = waits_.find(serial);
        if (it != waits_.end()) {
            wait = it->second;
        } else {
            wait = std::make_shared<Wait>(ex);
            waits_.emplace(serial, wait);
            owner = true;
        }
    }

    if (!owner) {
        log().debug("{}: joining in-flight disconnect wait", serial);
        co_await wait->done.wait();
        co_return;
    }

    co_await watch(std::move(session), std::move(wait));
}

cobalt::task<void> DisconnectWatchdog::watch(std::shared_ptr<DeviceSession> session,
                                             std::shared_ptr<Wait> wait) {
    const std::string serial = session->serial();

    // Whatever ends this coroutine, attached waiters are released and the
    // entry goes away
    struct Release {
        DisconnectWatchdog& self;
        const std::string& serial;
        std::shared_ptr<Wait> wait;

        ~Release() {
            {
                std::lock_guard lock(self.mutex_);
                auto it = self.waits_.find(serial);
                if (it != self.waits_.end() && it->second == wait) {
                    self.waits_.erase(it);
                }
            }
            wait->done.resolve({});
        }
    } release{*this, serial, wait};

    log().debug("{}: waiting for transport disconnect", serial);
    auto started = std::chrono::steady_clock::now();

    try {
        co_await session->transport_disconnected();
    } catch (const std::exception& e) {
        log().debug("{}: transport disconnect wait ended with error: {}", serial, e.what());
    }

    auto elapsed = std::chrono::steady_clock::now() - started;
    if (is_suspicious(elapsed)) {
        set_phase(serial, *wait, DisconnectPhase::CONFIRMING);
        log().info("{}: transport reported disconnect after {}ms, confirming with '{}'",
                   serial,
                   std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(),
                   kBlockingCommand);
        try {
            co_await session->spawn_and_wait(kBlockingCommand);
        } catch (const std::exception& e) {
            log().debug("{}: blocking command ended with error: {}", serial, e.what());
        }
    }

    set_phase(serial, *wait, DisconnectPhase::DISCONNECTED);
    log().info("{}: device disconnected", serial);
}

void DisconnectWatchdog::set_phase(const std::string& serial, Wait& wait, DisconnectPhase phase) {
    std::lock_guard lock(mutex_);
    log().debug("{}: {} -> {}", serial, disconnect_phase_name(wait.phase), disconnect_phase_name(phase));
    wait.phase = phase;
}

std::optional<DisconnectPhase> DisconnectWatchdog::phase(const std::string& serial) const {
    std::lock_guard lock(mutex_);
    auto it = waits_.find(serial);
    if (it == waits_.end()) {
        return std::nullopt;
    }
    return it->second->phase;
}

size_t DisconnectWatchdog::pending() const {
    std::lock_guard lock(mutex_);
    return waits_.size();
}

} // namespace bridgelink::client
