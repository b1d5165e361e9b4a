#include "client/ws_duplex_stream.hpp"
#include "common/cobalt_utils.hpp"
#include "common/logger.hpp"

#include <boost/url.hpp>

#include <stdexcept>

namespace bridgelink::client {

namespace {

auto& log() { return Logger::get("client.stream"); }

constexpr const char* kUserAgent = "bridgelink/1.0";

// Bounds TCP connect plus TLS handshake of an attempt nobody waits for any more
constexpr auto kConnectDeadline = std::chrono::seconds(30);

} // anonymous namespace

std::shared_ptr<WsDuplexStream> WsDuplexStream::open(asio::any_io_executor ex,
                                                     std::string url,
                                                     TlsOptions tls) {
    std::shared_ptr<WsDuplexStream> stream(
        new WsDuplexStream(ex, std::move(url), std::move(tls)));

    // Coroutine parameters live in the frame, lambda captures do not
    cobalt_utils::spawn_task(ex, [](std::shared_ptr<WsDuplexStream> self) -> cobalt::task<void> {
        co_await self->run();
    }(stream));
    return stream;
}

WsDuplexStream::WsDuplexStream(asio::any_io_executor ex, std::string url, TlsOptions tls)
    : DuplexStream(ex, std::move(url))
    , executor_(ex)
    , tls_(std::move(tls)) {
    if (tls_.verify) {
        if (tls_.ca_file.empty()) {
            ssl_ctx_.set_default_verify_paths();
        } else {
            ssl_ctx_.load_verify_file(tls_.ca_file);
        }
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
    } else {
        ssl_ctx_.set_verify_mode(ssl::verify_none);
    }
}

cobalt::task<void> WsDuplexStream::run() {
    ReadyInfo info;
    try {
        info = co_await handshake();
    } catch (const std::exception& e) {
        notify_error(e.what());
        notify_closed({kAbnormalClosure, {}});
        co_return;
    }

    // The caller gave up while we were connecting
    if (close_requested()) {
        log().debug("{}: opened after close was requested, closing", url());
        notify_closed({requested_close_code(), requested_close_reason()});
        try {
            if (use_tls_) {
                co_await tls_ws_->async_close(websocket::close_code::normal, cobalt::use_op);
            } else {
                co_await plain_ws_->async_close(websocket::close_code::normal, cobalt::use_op);
            }
        } catch (const std::exception& e) {
            log().debug("{}: close after abandoned open failed: {}", url(), e.what());
        }
        co_return;
    }

    notify_open(std::move(info));

    auto self = std::static_pointer_cast<WsDuplexStream>(shared_from_this());
    if (use_tls_) {
        cobalt_utils::spawn_task(executor_, [](std::shared_ptr<WsDuplexStream> self) -> cobalt::task<void> {
            co_await self->write_loop(*self->tls_ws_);
        }(self));
        co_await read_loop(*tls_ws_);
    } else {
        cobalt_utils::spawn_task(executor_, [](std::shared_ptr<WsDuplexStream> self) -> cobalt::task<void> {
            co_await self->write_loop(*self->plain_ws_);
        }(self));
        co_await read_loop(*plain_ws_);
    }
}

cobalt::task<ReadyInfo> WsDuplexStream::handshake() {
    auto parsed = boost::urls::parse_uri(url());
    if (!parsed) {
        throw std::invalid_argument("invalid WebSocket URL: " + url());
    }
    if (parsed->scheme() == "wss") {
        use_tls_ = true;
    } else if (parsed->scheme() != "ws") {
        throw std::invalid_argument("unsupported WebSocket scheme: " + std::string(parsed->scheme()));
    }

    std::string host(parsed->encoded_host_address());
    std::string port = parsed->has_port() && !parsed->port().empty()
        ? std::string(parsed->port())
        : (use_tls_ ? "443" : "80");
    std::string target(parsed->encoded_target());
    if (target.empty()) target = "/";

    log().debug("Connecting to {}:{}{} (TLS: {})", host, port, target, use_tls_ ? "yes" : "no");

    tcp::resolver resolver(executor_);
    auto endpoints = co_await resolver.async_resolve(host, port, cobalt::use_op);

    std::string host_header = parsed->has_port() ? host + ":" + port : host;

    if (use_tls_) {
        tls_ws_ = std::make_unique<TlsWsStream>(executor_, ssl_ctx_);

        if (!SSL_set_tlsext_host_name(tls_ws_->next_layer().native_handle(), host.c_str())) {
            throw boost::system::system_error(
                boost::system::error_code(static_cast<int>(::ERR_get_error()),
                                          asio::error::get_ssl_category()));
        }

        auto& tcp_stream = beast::get_lowest_layer(*tls_ws_);
        tcp_stream.expires_after(kConnectDeadline);
        co_await tcp_stream.async_connect(endpoints, cobalt::use_op);
        co_await tls_ws_->next_layer().async_handshake(ssl::stream_base::client, cobalt::use_op);

        co_return co_await upgrade(*tls_ws_, host_header, target);
    }

    plain_ws_ = std::make_unique<PlainWsStream>(executor_);

    auto& tcp_stream = beast::get_lowest_layer(*plain_ws_);
    tcp_stream.expires_after(kConnectDeadline);
    co_await tcp_stream.async_connect(endpoints, cobalt::use_op);

    co_return co_await upgrade(*plain_ws_, host_header, target);
}

template<typename WsStream>
cobalt::task<ReadyInfo> WsDuplexStream::upgrade(WsStream& ws, const std::string& host,
                                                const std::string& target) {
    // WebSocket handshake
    beast::get_lowest_layer(ws).expires_never();
    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws.set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, kUserAgent);
        }));

    websocket::response_type res;
    co_await ws.async_handshake(res, host, target, cobalt::use_op);
    ws.binary(true);

    ReadyInfo info;
    info.protocol = std::string(res[beast::http::field::sec_websocket_protocol]);
    info.extensions = std::string(res[beast::http::field::sec_websocket_extensions]);
    co_return info;
}

template<typename WsStream>
cobalt::task<void> WsDuplexStream::read_loop(WsStream& ws) {
    CloseInfo close_info{kAbnormalClosure, {}};
    try {
        beast::flat_buffer buffer;

        for (;;) {
            buffer.clear();
            co_await ws.async_read(buffer, cobalt::use_op);

            auto data = buffer.data();
            auto begin = static_cast<const uint8_t*>(data.data());
            bytes_received_ += data.size();
            if (ws.got_text()) {
                log().trace("{}: text frame ({} bytes)", url(), data.size());
            }
            notify_message(Bytes(begin, begin + data.size()));
        }
    } catch (const boost::system::system_error& e) {
        if (e.code() == websocket::error::closed) {
            const auto& reason = ws.reason();
            close_info.code = reason.code == websocket::close_code::none
                ? kNoStatusReceived
                : static_cast<uint16_t>(reason.code);
            close_info.reason = std::string(reason.reason.data(), reason.reason.size());
        } else {
            notify_error(e.what());
        }
    }

    log().debug("{}: read loop ended ({} bytes in, {} bytes out)",
                url(), bytes_received_.load(), bytes_sent_.load());
    notify_closed(std::move(close_info));
}

template<typename WsStream>
cobalt::task<void> WsDuplexStream::write_loop(WsStream& ws) {
    try {
        while (auto chunk = co_await outbound().read()) {
            co_await ws.async_write(asio::buffer(*chunk), cobalt::use_op);
            bytes_sent_ += chunk->size();
        }

        // Outbound ended: either close() was requested or the socket is gone
        if (close_requested() && ws.is_open()) {
            websocket::close_reason reason(static_cast<websocket::close_code>(requested_close_code()),
                                           requested_close_reason());
            co_await ws.async_close(reason, cobalt::use_op);
        }
    } catch (const boost::system::system_error& e) {
        if (e.code() != asio::error::operation_aborted && e.code() != websocket::error::closed) {
            log().debug("{}: write error: {}", url(), e.what());
            // Make the reader observe the failure
            boost::system::error_code ec;
            beast::get_lowest_layer(ws).socket().close(ec);
        }
    }
}

} // namespace bridgelink::client
