#pragma once

#include "client/bridge_endpoint.hpp"
#include "client/duplex_stream.hpp"
#include "client/errors.hpp"
#include "common/http_client.hpp"

#include <boost/cobalt.hpp>

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace bridgelink::client {

namespace cobalt = boost::cobalt;

// ============================================================================
// SessionHandle - an open relay socket handed out by SessionConnector.
//
// Move-only. Destroying a handle that was not closed closes the socket with
// a normal closure.
// ============================================================================
class SessionHandle {
public:
    SessionHandle() = default;
    SessionHandle(std::shared_ptr<DuplexStream> stream, ReadyInfo info);
    ~SessionHandle();

    SessionHandle(SessionHandle&& other) noexcept;
    SessionHandle& operator=(SessionHandle&& other) noexcept;
    SessionHandle(const SessionHandle&) = delete;
    SessionHandle& operator=(const SessionHandle&) = delete;

    bool valid() const { return stream_ != nullptr; }
    const ReadyInfo& info() const { return info_; }

    // Next inbound chunk; nullopt once the peer closed. Throws TransportFailure
    // if the socket errored.
    cobalt::task<std::optional<Bytes>> read();

    // Queued for the single writer; throws TransportFailure once closed
    void write(Bytes chunk);

    // Only the first call has an effect
    void close(std::optional<uint16_t> code = std::nullopt, std::string reason = {});

    // Completes when the socket has closed, whatever the cause
    cobalt::task<void> closed();

    std::weak_ptr<DuplexStream> stream() const { return stream_; }

private:
    std::shared_ptr<DuplexStream> stream_;
    ReadyInfo info_;
    bool close_called_ = false;
};

using StreamFactory = std::function<std::shared_ptr<DuplexStream>(
    asio::any_io_executor ex, const std::string& url)>;

// Opens real WebSocket connections
StreamFactory websocket_stream_factory(TlsOptions tls = {});

// ============================================================================
// SessionConnector - opens one relay socket per connect() call.
//
// connect() never throws for transport problems: it returns TIMEOUT when the
// socket is not ready within the timeout, CONNECTION_ERROR when it failed
// first. A timed-out attempt is not aborted; it is closed as soon as it
// opens, if it ever does.
// ============================================================================
class SessionConnector {
public:
    SessionConnector(RelayEndpoint endpoint,
                     std::chrono::milliseconds timeout,
                     StreamFactory factory);

    cobalt::task<std::expected<SessionHandle, TransportError>> connect();

    // Reverse tunnels are not available through the relay
    cobalt::task<std::string> add_reverse_tunnel(std::string device_address);
    void remove_reverse_tunnel(const std::string& device_address);
    void clear_reverse_tunnels();

    const RelayEndpoint& endpoint() const { return endpoint_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    RelayEndpoint endpoint_;
    std::chrono::milliseconds timeout_;
    StreamFactory factory_;
};

} // namespace bridgelink::client
