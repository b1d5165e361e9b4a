#include "client/duplex_stream.hpp"
#include "client/errors.hpp"
#include "common/logger.hpp"

namespace bridgelink::client {

namespace {
auto& log() { return Logger::get("client.stream"); }
} // anonymous namespace

DuplexStream::DuplexStream(asio::any_io_executor ex, std::string url)
    : url_(std::move(url))
    , ready_(ex)
    , closed_(ex)
    , inbound_(ex)
    , outbound_(ex) {}

void DuplexStream::write(Bytes chunk) {
    if (close_requested_ || closed_.settled()) {
        throw TransportFailure({TransportErrorKind::CONNECTION_ERROR, "WebSocket is closed"});
    }
    outbound_.push(std::move(chunk));
}

void DuplexStream::close(std::optional<uint16_t> code, std::string reason) {
    if (close_requested_ || closed_.settled()) {
        return;
    }
    close_requested_ = true;
    close_code_ = code;
    close_reason_ = std::move(reason);

    // Lets the writer flush what is queued, then close the socket
    outbound_.end();
}

void DuplexStream::notify_open(ReadyInfo info) {
    log().debug("{}: open (protocol='{}', extensions='{}')", url_, info.protocol, info.extensions);
    ready_.resolve(std::move(info));
}

void DuplexStream::notify_message(Bytes data) {
    inbound_.push(std::move(data));
}

void DuplexStream::notify_error(const std::string& message) {
    TransportFailure failure({TransportErrorKind::CONNECTION_ERROR, message});
    if (!ready_.settled()) {
        log().error("{}: connection error: {}", url_, message);
        ready_.reject(std::make_exception_ptr(failure));
    } else {
        log().warn("{}: error: {}", url_, message);
    }
    inbound_.fail(std::make_exception_ptr(failure));
}

void DuplexStream::notify_closed(CloseInfo info) {
    // A socket that never opened still settles ready
    if (!ready_.settled()) {
        ready_.reject(std::make_exception_ptr(TransportFailure(
            {TransportErrorKind::CONNECTION_ERROR, "WebSocket closed before opening"})));
    }
    inbound_.end();
    outbound_.end();
    if (closed_.resolve(info)) {
        log().debug("{}: closed (code={}, reason='{}')", url_, info.code, info.reason);
    }
}

} // namespace bridgelink::client
