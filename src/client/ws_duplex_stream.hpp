#pragma once

#include "client/duplex_stream.hpp"
#include "common/http_client.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/cobalt.hpp>

#include <atomic>
#include <memory>
#include <string>

namespace bridgelink::client {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

using TlsWsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;
using PlainWsStream = websocket::stream<beast::tcp_stream>;

// DuplexStream over a Beast WebSocket (ws:// or wss://).
// The connection attempt starts in open(); the returned stream keeps itself
// alive until its closed() signal has settled.
class WsDuplexStream : public DuplexStream {
public:
    static std::shared_ptr<WsDuplexStream> open(asio::any_io_executor ex,
                                                std::string url,
                                                TlsOptions tls = {});

    uint64_t bytes_received() const { return bytes_received_.load(); }
    uint64_t bytes_sent() const { return bytes_sent_.load(); }

private:
    WsDuplexStream(asio::any_io_executor ex, std::string url, TlsOptions tls);

    cobalt::task<void> run();
    cobalt::task<ReadyInfo> handshake();

    template<typename WsStream>
    cobalt::task<ReadyInfo> upgrade(WsStream& ws, const std::string& host, const std::string& target);

    template<typename WsStream>
    cobalt::task<void> read_loop(WsStream& ws);

    template<typename WsStream>
    cobalt::task<void> write_loop(WsStream& ws);

    asio::any_io_executor executor_;
    TlsOptions tls_;
    ssl::context ssl_ctx_{ssl::context::tlsv12_client};
    bool use_tls_ = false;

    std::unique_ptr<TlsWsStream> tls_ws_;
    std::unique_ptr<PlainWsStream> plain_ws_;

    std::atomic<uint64_t> bytes_received_{0};
    std::atomic<uint64_t> bytes_sent_{0};
};

} // namespace bridgelink::client
