#pragma once

#include "client/device_connector.hpp"
#include "client/device_directory.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/cobalt.hpp>

#include <functional>
#include <memory>

namespace bridgelink::client {

namespace cobalt = boost::cobalt;

// True when the relay lists exactly one ready device and no connect is in
// progress or established
bool should_auto_connect(const ConnectorState& state,
                         bool device_chosen,
                         bool bridge_available,
                         const DeviceSnapshot& devices);

// ============================================================================
// AutoConnector - connects to the relay's only device as soon as the
// directory reports it.
//
// The guard is evaluated on every device list change. The connect runs
// through the DeviceConnector with the directory's current relay client.
// ============================================================================
class AutoConnector : public std::enable_shared_from_this<AutoConnector> {
public:
    using OutcomeCallback = std::function<void(const DeviceRecord& device, ConnectOutcome outcome)>;

    AutoConnector(asio::any_io_executor ex,
                  std::shared_ptr<DeviceDirectory> directory,
                  DeviceConnector& connector);

    // Installs directory callbacks that evaluate the guard first and then
    // forward to the given ones
    void attach(DirectoryCallbacks forward = {});

    void set_outcome_callback(OutcomeCallback callback) { on_outcome_ = std::move(callback); }

    // Starts a connect when the guard holds. Returns whether one was started.
    bool evaluate();

    bool pending() const { return pending_; }

private:
    cobalt::task<void> connect(DeviceRecord device);

    asio::any_io_executor executor_;
    std::shared_ptr<DeviceDirectory> directory_;
    DeviceConnector& connector_;
    OutcomeCallback on_outcome_;
    bool pending_ = false;
};

} // namespace bridgelink::client
