#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace bridgelink::client {

// ============================================================================
// Transport errors - returned (not thrown) by the session connector
// ============================================================================
enum class TransportErrorKind : uint8_t {
    TIMEOUT,            // ready signal did not fire before the deadline
    CONNECTION_ERROR,   // socket failed before (or after) becoming ready
};

const char* transport_error_kind_name(TransportErrorKind kind);

struct TransportError {
    TransportErrorKind kind;
    std::string message;
};

// Thrown from inside coroutines that cannot return a TransportError
class TransportFailure : public std::runtime_error {
public:
    explicit TransportFailure(TransportError error)
        : std::runtime_error(error.message), error_(std::move(error)) {}

    const TransportError& error() const { return error_; }

private:
    TransportError error_;
};

// Relay answered FAIL or sent a malformed reply
class AdbServerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Reverse tunnels are not supported over the bridge
class NotImplementedError : public std::logic_error {
public:
    NotImplementedError() : std::logic_error("Method not implemented.") {}
};

// Direct path: another process has claimed the device interface
class DeviceInUseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace bridgelink::client
