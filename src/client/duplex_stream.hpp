#pragma once

#include "common/byte_channel.hpp"
#include "common/one_shot.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace bridgelink::client {

// Negotiated at handshake time
struct ReadyInfo {
    std::string protocol;
    std::string extensions;
};

struct CloseInfo {
    uint16_t code = 0;
    std::string reason;
};

// Reported when the peer's close frame carried no status code
inline constexpr uint16_t kNoStatusReceived = 1005;

// WebSocket close code reported when the connection died without a close frame
inline constexpr uint16_t kAbnormalClosure = 1006;

// ============================================================================
// DuplexStream - one relay socket seen as a pair of ordered byte channels.
//
//   ready()   resolves once with the handshake metadata, or is rejected with
//             a TransportFailure if the socket fails before opening
//   closed()  resolves exactly once with the close code and reason, on every
//             path (graceful, abnormal, transport error)
//   inbound() incoming frames in order; text frames arrive as their UTF-8
//             bytes. A failure after ready() errors this channel.
//   write()   queues one outbound frame; a single writer drains the queue
//
// The signals exist from construction, so they can be awaited before the
// socket has done anything.
// ============================================================================
class DuplexStream : public std::enable_shared_from_this<DuplexStream> {
public:
    virtual ~DuplexStream() = default;

    DuplexStream(const DuplexStream&) = delete;
    DuplexStream& operator=(const DuplexStream&) = delete;

    OneShot<ReadyInfo>& ready() { return ready_; }
    OneShot<CloseInfo>& closed() { return closed_; }
    ByteChannel& inbound() { return inbound_; }

    // Throws TransportFailure once close() was called or the socket closed
    void write(Bytes chunk);

    // Idempotent. Before the socket opened, the attempt is left to finish
    // and the socket is closed as soon as it does.
    void close(std::optional<uint16_t> code = std::nullopt, std::string reason = {});

    bool close_requested() const { return close_requested_; }
    const std::string& url() const { return url_; }

protected:
    DuplexStream(asio::any_io_executor ex, std::string url);

    // Transport-side notifications, called by implementations
    void notify_open(ReadyInfo info);
    void notify_message(Bytes data);
    void notify_error(const std::string& message);
    void notify_closed(CloseInfo info);

    // Frames queued by write(); ends when close() is requested
    ByteChannel& outbound() { return outbound_; }

    uint16_t requested_close_code() const { return close_code_.value_or(1000); }
    const std::string& requested_close_reason() const { return close_reason_; }

private:
    std::string url_;
    OneShot<ReadyInfo> ready_;
    OneShot<CloseInfo> closed_;
    ByteChannel inbound_;
    ByteChannel outbound_;

    bool close_requested_ = false;
    std::optional<uint16_t> close_code_;
    std::string close_reason_;
};

} // namespace bridgelink::client
