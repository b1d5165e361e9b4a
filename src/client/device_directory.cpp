#include "client/device_directory.hpp"
#include "common/cobalt_utils.hpp"
#include "common/logger.hpp"

namespace bridgelink::client {

namespace {
auto& log() { return Logger::get("client.directory"); }
} // anonymous namespace

DeviceDirectory::DeviceDirectory(asio::any_io_executor ex,
                                 const ClientConfig& config,
                                 BridgeProbe probe,
                                 BridgeClientFactory factory)
    : executor_(ex)
    , config_(config)
    , probe_(std::move(probe))
    , factory_(std::move(factory))
    , timer_(ex) {}

void DeviceDirectory::start() {
    scanning_ = true;
    if (running_) {
        return;
    }
    running_ = true;
    log().debug("Scanning started");

    // Coroutine parameters live in the frame, lambda captures do not
    cobalt_utils::spawn_task(executor_, [](std::shared_ptr<DeviceDirectory> self) -> cobalt::task<void> {
        co_await self->run();
    }(shared_from_this()));
}

void DeviceDirectory::stop() {
    if (!scanning_) {
        return;
    }
    scanning_ = false;
    timer_.cancel();
    log().debug("Scanning stopped");
}

cobalt::task<void> DeviceDirectory::run() {
    while (scanning_) {
        if (!bridge_client_) {
            co_await check_for_bridge();
            if (!bridge_client_) {
                co_await pause(config_.probe_interval);
                continue;
            }
        }

        co_await poll_once();
        if (scanning_ && bridge_client_) {
            co_await pause(config_.poll_interval);
        }
    }
    running_ = false;
}

cobalt::task<void> DeviceDirectory::pause(std::chrono::milliseconds duration) {
    if (!scanning_) {
        co_return;
    }
    timer_.expires_after(duration);
    // Cancelled by stop(); the loop re-checks scanning_
    co_await timer_.async_wait(asio::as_tuple(cobalt::use_op));
}

cobalt::task<bool> DeviceDirectory::check_for_bridge() {
    bool alive = co_await probe_();
    checked_for_bridge_ = true;

    if (!alive) {
        log().trace("Bridge not reachable");
        co_return false;
    }

    if (!bridge_client_) {
        bridge_client_ = factory_();
        log().info("Bridge is available");
        if (callbacks_.on_bridge_changed) {
            callbacks_.on_bridge_changed(true);
        }
    }
    co_return true;
}

cobalt::task<void> DeviceDirectory::poll_once() {
    std::optional<std::string> failure;
    try {
        auto client = factory_();
        auto listed = co_await client->get_devices();
        auto ready = filter_ready_devices(std::move(listed));

        if (!snapshots_equal(ready, devices_)) {
            log().debug("Device list changed: {} -> {} device(s)", devices_.size(), ready.size());
            devices_ = std::move(ready);
            if (callbacks_.on_devices_changed) {
                callbacks_.on_devices_changed(devices_);
            }
        }
        bridge_error_.reset();
    } catch (const std::exception& e) {
        failure = e.what();
    }

    if (!failure) {
        co_return;
    }

    log().error("Failed to list bridge devices: {}", *failure);

    bool had_devices = !devices_.empty();
    bool had_client = bridge_client_ != nullptr;
    bridge_client_.reset();
    devices_.clear();
    checked_for_bridge_ = false;
    bridge_error_ = *failure;

    if (had_devices && callbacks_.on_devices_changed) {
        callbacks_.on_devices_changed(devices_);
    }
    if (had_client && callbacks_.on_bridge_changed) {
        callbacks_.on_bridge_changed(false);
    }
    if (callbacks_.on_error) {
        callbacks_.on_error(*failure);
    }
}

} // namespace bridgelink::client
