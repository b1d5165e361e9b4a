#pragma once

#include <boost/cobalt.hpp>

#include <memory>
#include <string>

namespace bridgelink::client {

namespace cobalt = boost::cobalt;

// ============================================================================
// DeviceSession - an authenticated session with one device, produced by
// either connect path.
// ============================================================================
class DeviceSession {
public:
    virtual ~DeviceSession() = default;

    virtual const std::string& serial() const = 0;

    // Completes when the transport reports the device gone. Some relays
    // complete this immediately; see DisconnectWatchdog.
    virtual cobalt::task<void> transport_disconnected() = 0;

    // Run a shell command and collect its whole output
    virtual cobalt::task<std::string> spawn_wait_text(std::string command) = 0;

    // Run a shell command and wait for it to exit, discarding output
    virtual cobalt::task<void> spawn_and_wait(std::string command) = 0;

    // Tear down every socket of the session. Pending operations finish.
    virtual void close() = 0;
};

// ============================================================================
// Direct path collaborators (platform specific, supplied by the embedder)
// ============================================================================

// Named key store; the authenticator reads and persists keys through it
class CredentialStore {
public:
    explicit CredentialStore(std::string name) : name_(std::move(name)) {}
    virtual ~CredentialStore() = default;

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// Claimed interface of a directly attached device
class DeviceConnection {
public:
    virtual ~DeviceConnection() = default;
};

class UsbDevice {
public:
    virtual ~UsbDevice() = default;

    virtual const std::string& serial() const = 0;

    // Throws DeviceInUseError if another process owns the interface
    virtual cobalt::task<std::shared_ptr<DeviceConnection>> connect() = 0;
};

class DevicePicker {
public:
    virtual ~DevicePicker() = default;

    // nullptr when the user chose nothing
    virtual cobalt::task<std::shared_ptr<UsbDevice>> request_device() = 0;
};

class DeviceAuthenticator {
public:
    virtual ~DeviceAuthenticator() = default;

    virtual cobalt::task<std::shared_ptr<DeviceSession>> authenticate(
        std::string serial,
        std::shared_ptr<DeviceConnection> connection,
        std::shared_ptr<CredentialStore> credentials) = 0;
};

} // namespace bridgelink::client
