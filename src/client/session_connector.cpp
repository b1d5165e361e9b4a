#include "client/session_connector.hpp"
#include "client/ws_duplex_stream.hpp"
#include "common/cobalt_utils.hpp"
#include "common/logger.hpp"

namespace bridgelink::client {

namespace {

auto& log() { return Logger::get("client.connector"); }

cobalt::task<ReadyInfo> wait_ready(std::shared_ptr<DuplexStream> stream) {
    co_return co_await stream->ready().wait();
}

cobalt::task<std::optional<Bytes>> read_from(std::shared_ptr<DuplexStream> stream) {
    co_return co_await stream->inbound().read();
}

cobalt::task<void> wait_closed(std::shared_ptr<DuplexStream> stream) {
    co_await stream->closed().wait();
}

} // anonymous namespace

const char* transport_error_kind_name(TransportErrorKind kind) {
    switch (kind) {
        case TransportErrorKind::TIMEOUT: return "TIMEOUT";
        case TransportErrorKind::CONNECTION_ERROR: return "CONNECTION_ERROR";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// SessionHandle
// ============================================================================

SessionHandle::SessionHandle(std::shared_ptr<DuplexStream> stream, ReadyInfo info)
    : stream_(std::move(stream)), info_(std::move(info)) {}

SessionHandle::~SessionHandle() {
    close();
}

SessionHandle::SessionHandle(SessionHandle&& other) noexcept
    : stream_(std::move(other.stream_))
    , info_(std::move(other.info_))
    , close_called_(other.close_called_) {
    other.close_called_ = true;
}

SessionHandle& SessionHandle::operator=(SessionHandle&& other) noexcept {
    if (this != &other) {
        close();
        stream_ = std::move(other.stream_);
        info_ = std::move(other.info_);
        close_called_ = other.close_called_;
        other.close_called_ = true;
    }
    return *this;
}

cobalt::task<std::optional<Bytes>> SessionHandle::read() {
    if (!stream_) {
        throw TransportFailure({TransportErrorKind::CONNECTION_ERROR, "session is not open"});
    }
    return read_from(stream_);
}

void SessionHandle::write(Bytes chunk) {
    if (!stream_) {
        throw TransportFailure({TransportErrorKind::CONNECTION_ERROR, "session is not open"});
    }
    stream_->write(std::move(chunk));
}

void SessionHandle::close(std::optional<uint16_t> code, std::string reason) {
    if (close_called_ || !stream_) {
        return;
    }
    close_called_ = true;
    stream_->close(code, std::move(reason));
}

cobalt::task<void> SessionHandle::closed() {
    if (!stream_) {
        throw TransportFailure({TransportErrorKind::CONNECTION_ERROR, "session is not open"});
    }
    return wait_closed(stream_);
}

// ============================================================================
// SessionConnector
// ============================================================================

StreamFactory websocket_stream_factory(TlsOptions tls) {
    return [tls = std::move(tls)](asio::any_io_executor ex,
                                  const std::string& url) -> std::shared_ptr<DuplexStream> {
        return WsDuplexStream::open(ex, url, tls);
    };
}

SessionConnector::SessionConnector(RelayEndpoint endpoint,
                                   std::chrono::milliseconds timeout,
                                   StreamFactory factory)
    : endpoint_(std::move(endpoint))
    , timeout_(timeout)
    , factory_(std::move(factory)) {}

cobalt::task<std::expected<SessionHandle, TransportError>> SessionConnector::connect() {
    auto ex = co_await cobalt::this_coro::executor;
    std::shared_ptr<DuplexStream> stream;
    std::optional<TransportError> failure;
    std::expected<ReadyInfo, std::error_code> ready = std::unexpected(std::error_code{});
    try {
        stream = factory_(ex, endpoint_.data_url);
        ready = co_await cobalt_utils::with_timeout(wait_ready(stream), timeout_);
    } catch (const TransportFailure& e) {
        failure = e.error();
    } catch (const std::exception& e) {
        failure = TransportError{TransportErrorKind::CONNECTION_ERROR, e.what()};
    }

    if (failure) {
        log().error("WebSocket connection to {} failed: {}", endpoint_.data_url, failure->message);
        co_return std::unexpected(std::move(*failure));
    }

    if (!ready) {
        log().error("WebSocket connection to {} timed out after {}ms",
                    endpoint_.data_url, timeout_.count());
        // Nobody will own this socket; close it if it ever opens
        stream->close();
        co_return std::unexpected(TransportError{
            TransportErrorKind::TIMEOUT, "WebSocket connection timed out"});
    }

    log().debug("Session opened to {}", endpoint_.data_url);
    co_return SessionHandle(std::move(stream), std::move(*ready));
}

cobalt::task<std::string> SessionConnector::add_reverse_tunnel(std::string device_address) {
    log().debug("Reverse tunnel to {} requested", device_address);
    throw NotImplementedError();
    co_return std::string{};
}

void SessionConnector::remove_reverse_tunnel(const std::string&) {
    throw NotImplementedError();
}

void SessionConnector::clear_reverse_tunnels() {
    throw NotImplementedError();
}

} // namespace bridgelink::client
