#pragma once

#include "client/adb_protocol.hpp"
#include "client/device_session.hpp"
#include "client/session_connector.hpp"

#include <boost/cobalt.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace bridgelink::client {

namespace cobalt = boost::cobalt;

// ============================================================================
// AdbSocket - one relay session speaking the smart-socket protocol.
// Buffers inbound chunks so replies can be read by exact length.
// ============================================================================
class AdbSocket {
public:
    explicit AdbSocket(SessionHandle handle);

    AdbSocket(AdbSocket&&) = default;
    AdbSocket& operator=(AdbSocket&&) = default;

    // Opens a fresh session, sends the service request and checks the OKAY.
    // Throws TransportFailure if the session cannot be opened and
    // AdbServerError if the relay refuses the service.
    static cobalt::task<AdbSocket> open(SessionConnector& connector, std::string service);

    void send_request(std::string_view service);

    // Throws AdbServerError carrying the relay's message on FAIL
    cobalt::task<void> read_okay();

    cobalt::task<Bytes> read_exact(size_t size);
    cobalt::task<std::string> read_hex_prefixed_string();

    // Everything until the relay closes the session
    cobalt::task<std::string> read_to_end();

    void close() { handle_.close(); }

    SessionHandle& handle() { return handle_; }

private:
    SessionHandle handle_;
    Bytes buffer_;
};

// ============================================================================
// BridgeClient - device queries against a relay. Every call uses a fresh
// session; nothing is pooled.
// ============================================================================
class BridgeClient {
public:
    virtual ~BridgeClient() = default;

    virtual cobalt::task<DeviceSnapshot> get_devices() = 0;
    virtual cobalt::task<std::shared_ptr<DeviceSession>> create_device_session(DeviceRecord device) = 0;
};

class AdbBridgeClient : public BridgeClient {
public:
    explicit AdbBridgeClient(std::shared_ptr<SessionConnector> connector);

    cobalt::task<DeviceSnapshot> get_devices() override;
    cobalt::task<std::shared_ptr<DeviceSession>> create_device_session(DeviceRecord device) override;

    // Relay protocol version (host:version)
    cobalt::task<uint32_t> get_version();

    SessionConnector& connector() { return *connector_; }

private:
    std::shared_ptr<SessionConnector> connector_;
};

// ============================================================================
// AdbServerDeviceSession - DeviceSession for a device reached through the
// relay, addressed by its transport id.
// ============================================================================
class AdbServerDeviceSession : public DeviceSession {
public:
    AdbServerDeviceSession(std::shared_ptr<SessionConnector> connector,
                           std::string serial,
                           uint64_t transport_id);

    const std::string& serial() const override { return serial_; }
    uint64_t transport_id() const { return transport_id_; }

    cobalt::task<void> transport_disconnected() override;
    cobalt::task<std::string> spawn_wait_text(std::string command) override;
    cobalt::task<void> spawn_and_wait(std::string command) override;
    void close() override;

private:
    cobalt::task<AdbSocket> open_service(std::string service);
    cobalt::task<AdbSocket> open_shell(std::string command);
    void track(AdbSocket& socket);

    std::shared_ptr<SessionConnector> connector_;
    std::string serial_;
    uint64_t transport_id_;

    std::mutex mutex_;
    bool closed_ = false;
    std::vector<std::weak_ptr<DuplexStream>> sockets_;
};

} // namespace bridgelink::client
