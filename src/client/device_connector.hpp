#pragma once

#include "client/adb_protocol.hpp"
#include "client/bridge_client.hpp"
#include "client/client_config.hpp"
#include "client/device_session.hpp"
#include "client/disconnect_watchdog.hpp"
#include "client/keepalive_pinger.hpp"

#include <boost/cobalt.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace bridgelink::client {

namespace cobalt = boost::cobalt;

// Devices below this Android major version are legacy
inline constexpr int kNonLegacyAndroidVersion = 11;

inline constexpr const char* kOsVersionCommand = "getprop ro.build.version.release";

enum class ConnectionPhase : uint8_t {
    IDLE,
    CONNECTING,
    AUTHENTICATING,
    CONNECTED,
    ERROR,
};

const char* connection_phase_name(ConnectionPhase phase);

// Result of one connect_device() call
enum class ConnectOutcome : uint8_t {
    DISCONNECTED,           // was connected, device is gone now
    NO_DEVICE_SELECTED,     // direct path: nothing chosen
    DEVICE_IN_USE,          // direct path: interface owned by another process
    ALREADY_CONNECTED,      // a connect is in progress or a device is connected
    FAILED,                 // see ConnectorState::connect_error
};

const char* connect_outcome_name(ConnectOutcome outcome);

struct ConnectorState {
    ConnectionPhase phase = ConnectionPhase::IDLE;
    bool connecting = false;
    bool authing = false;
    bool device_pre_v51 = false;
    bool device_in_use = false;
    bool using_bridge = false;
    std::optional<int> os_version;
    std::optional<std::string> chosen_serial;
    std::optional<std::string> connect_error;
};

// Leading integer of ro.build.version.release ("12", "8.1.0", "14 ")
std::optional<int> parse_os_major_version(std::string_view text);

struct DirectPathCollaborators {
    std::shared_ptr<DevicePicker> picker;
    std::shared_ptr<DeviceAuthenticator> authenticator;
    std::shared_ptr<CredentialStore> credentials;
};

// ============================================================================
// DeviceConnector - drives one device session from connect to disconnect.
//
//   IDLE -> CONNECTING -> AUTHENTICATING -> CONNECTED -> IDLE
//                      \-> ERROR (connect_error set)
//
// At most one session exists at a time. Every exit path resets the whole
// state in one step, which also stops the relay keepalive.
// ============================================================================
class DeviceConnector {
public:
    using StateCallback = std::function<void(const ConnectorState&)>;

    DeviceConnector(const ClientConfig& config,
                    DirectPathCollaborators direct,
                    DisconnectWatchdog& watchdog);

    void set_bridge_client(std::shared_ptr<BridgeClient> client) { bridge_client_ = std::move(client); }
    void set_state_callback(StateCallback callback) { on_state_ = std::move(callback); }

    // Runs while a device is connected through the relay
    void set_keepalive(std::shared_ptr<KeepalivePinger> keepalive) { keepalive_ = std::move(keepalive); }

    // Connects through the relay when a device record is given, directly
    // otherwise. Completes when the session ends or the attempt failed.
    cobalt::task<ConnectOutcome> connect_device(std::optional<DeviceRecord> device = std::nullopt);

    // Closes the active session and returns to IDLE
    void disconnect_device();

    const ConnectorState& state() const { return state_; }
    std::shared_ptr<DeviceSession> chosen_device() const { return chosen_; }

private:
    // Direct path ended without a session; detail is shown to the user
    struct DirectOutcome {
        ConnectOutcome outcome;
        std::string detail;
    };
    using DirectResult = std::variant<std::shared_ptr<DeviceSession>, DirectOutcome>;

    cobalt::task<DirectResult> connect_direct();
    cobalt::task<std::shared_ptr<DeviceSession>> connect_bridge(const DeviceRecord& device);
    cobalt::task<void> initialize_device(std::shared_ptr<DeviceSession> session, uint64_t generation);
    cobalt::task<void> release_conflicting_server();

    void clear_device();
    void publish();

    const ClientConfig& config_;
    DirectPathCollaborators direct_;
    DisconnectWatchdog& watchdog_;
    std::shared_ptr<BridgeClient> bridge_client_;
    StateCallback on_state_;
    std::shared_ptr<KeepalivePinger> keepalive_;

    ConnectorState state_;
    std::shared_ptr<DeviceSession> chosen_;
    uint64_t generation_ = 0;
};

} // namespace bridgelink::client
