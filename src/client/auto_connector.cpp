#include "client/auto_connector.hpp"
#include "common/cobalt_utils.hpp"
#include "common/logger.hpp"

namespace bridgelink::client {

namespace {
auto& log() { return Logger::get("client.autoconnect"); }
} // anonymous namespace

bool should_auto_connect(const ConnectorState& state,
                         bool device_chosen,
                         bool bridge_available,
                         const DeviceSnapshot& devices) {
    return !state.connecting && !device_chosen && bridge_available && devices.size() == 1;
}

AutoConnector::AutoConnector(asio::any_io_executor ex,
                             std::shared_ptr<DeviceDirectory> directory,
                             DeviceConnector& connector)
    : executor_(ex)
    , directory_(std::move(directory))
    , connector_(connector) {}

void AutoConnector::attach(DirectoryCallbacks forward) {
    // The directory owns these callbacks; a strong reference would be a cycle
    std::weak_ptr<AutoConnector> weak = shared_from_this();

    DirectoryCallbacks callbacks;
    callbacks.on_devices_changed = [weak, next = std::move(forward.on_devices_changed)](
                                       const DeviceSnapshot& devices) {
        if (next) next(devices);
        if (auto self = weak.lock()) self->evaluate();
    };
    callbacks.on_bridge_changed = std::move(forward.on_bridge_changed);
    callbacks.on_error = std::move(forward.on_error);
    directory_->set_callbacks(std::move(callbacks));
}

bool AutoConnector::evaluate() {
    if (pending_) {
        return false;
    }

    auto client = directory_->bridge_client();
    const auto& devices = directory_->devices();
    if (!should_auto_connect(connector_.state(), connector_.chosen_device() != nullptr,
                             client != nullptr, devices)) {
        return false;
    }

    pending_ = true;
    auto device = devices.front();
    log().info("Only one device on the bridge, connecting to {}", device.serial);
    connector_.set_bridge_client(std::move(client));

    cobalt_utils::spawn_task(executor_, [](std::shared_ptr<AutoConnector> self,
                                           DeviceRecord device) -> cobalt::task<void> {
        co_await self->connect(std::move(device));
    }(shared_from_this(), std::move(device)));
    return true;
}

cobalt::task<void> AutoConnector::connect(DeviceRecord device) {
    auto outcome = co_await connector_.connect_device(device);
    pending_ = false;
    log().debug("Automatic connect to {} ended: {}", device.serial, connect_outcome_name(outcome));
    if (on_outcome_) {
        on_outcome_(device, outcome);
    }
}

} // namespace bridgelink::client
