#pragma once

#include "client/adb_protocol.hpp"
#include "client/bridge_client.hpp"
#include "client/client_config.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/cobalt.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace bridgelink::client {

namespace cobalt = boost::cobalt;

struct DirectoryCallbacks {
    std::function<void(const DeviceSnapshot&)> on_devices_changed;
    std::function<void(bool available)> on_bridge_changed;
    std::function<void(const std::string& message)> on_error;
};

// Liveness check for the relay
using BridgeProbe = std::function<cobalt::task<bool>()>;

// A new client per call; a relay socket serves exactly one request
using BridgeClientFactory = std::function<std::shared_ptr<BridgeClient>()>;

// ============================================================================
// DeviceDirectory - keeps the list of ready relay devices current.
//
// While scanning: probe the relay until it answers, then poll its device
// list immediately and every poll_interval. A failed poll forgets the relay
// and the devices, and probing starts over.
// ============================================================================
class DeviceDirectory : public std::enable_shared_from_this<DeviceDirectory> {
public:
    DeviceDirectory(asio::any_io_executor ex,
                    const ClientConfig& config,
                    BridgeProbe probe,
                    BridgeClientFactory factory);

    void set_callbacks(DirectoryCallbacks callbacks) { callbacks_ = std::move(callbacks); }

    void start();
    void stop();

    // One probe; creates the relay client if the relay is alive
    cobalt::task<bool> check_for_bridge();

    // One device list refresh
    cobalt::task<void> poll_once();

    bool checked_for_bridge() const { return checked_for_bridge_; }
    std::shared_ptr<BridgeClient> bridge_client() const { return bridge_client_; }
    const DeviceSnapshot& devices() const { return devices_; }
    const std::optional<std::string>& bridge_error() const { return bridge_error_; }
    bool scanning() const { return scanning_; }

private:
    cobalt::task<void> run();
    cobalt::task<void> pause(std::chrono::milliseconds duration);

    asio::any_io_executor executor_;
    const ClientConfig& config_;
    BridgeProbe probe_;
    BridgeClientFactory factory_;
    DirectoryCallbacks callbacks_;

    asio::steady_timer timer_;
    bool scanning_ = false;
    bool running_ = false;

    bool checked_for_bridge_ = false;
    std::shared_ptr<BridgeClient> bridge_client_;
    DeviceSnapshot devices_;
    std::optional<std::string> bridge_error_;
};

} // namespace bridgelink::client
