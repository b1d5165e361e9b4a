#include "common/http_client.hpp"
#include "common/logger.hpp"
#include "common/one_shot.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/url.hpp>

#include <stdexcept>

namespace bridgelink {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace {

auto& log() { return Logger::get("common.http"); }

constexpr const char* kUserAgent = "bridgelink/1.0";

struct Target {
    std::string host;
    std::string port;
    std::string host_header;    // host[:port], port only when the URL names one
    std::string path;
    bool use_tls = false;
};

Target parse_target(const std::string& url) {
    auto parsed = boost::urls::parse_uri(url);
    if (!parsed) {
        throw std::invalid_argument("invalid URL: " + url);
    }

    Target t;
    if (parsed->scheme_id() == boost::urls::scheme::https) {
        t.use_tls = true;
    } else if (parsed->scheme_id() != boost::urls::scheme::http) {
        throw std::invalid_argument("unsupported scheme in URL: " + url);
    }

    t.host = std::string(parsed->encoded_host_address());
    t.port = parsed->has_port() && !parsed->port().empty()
        ? std::string(parsed->port())
        : (t.use_tls ? "443" : "80");
    t.host_header = parsed->has_port() && !parsed->port().empty()
        ? t.host + ":" + t.port
        : t.host;
    t.path = std::string(parsed->encoded_target());
    if (t.path.empty()) t.path = "/";
    return t;
}

template<typename Stream>
cobalt::task<HttpResult> exchange(Stream& stream, const Target& t,
                                  std::chrono::steady_clock::time_point deadline) {
    http::request<http::empty_body> req{http::verb::get, t.path, 11};
    req.set(http::field::host, t.host_header);
    req.set(http::field::user_agent, kUserAgent);

    beast::get_lowest_layer(stream).expires_at(deadline);
    co_await http::async_write(stream, req, cobalt::use_op);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    co_await http::async_read(stream, buffer, res, cobalt::use_op);

    co_return HttpResult{res.result_int(), std::move(res.body())};
}

// getaddrinfo cannot be interrupted, so a lookup still running at the
// deadline is abandoned. Its completion only touches the shared state.
cobalt::task<tcp::resolver::results_type> resolve(asio::any_io_executor ex, const Target& t,
                                                  std::chrono::steady_clock::time_point deadline) {
    auto result = std::make_shared<OneShot<tcp::resolver::results_type>>(ex);
    auto resolver = std::make_shared<tcp::resolver>(ex);

    resolver->async_resolve(t.host, t.port,
        [result, resolver](const boost::system::error_code& ec, tcp::resolver::results_type r) {
            if (ec) {
                result->reject(std::make_exception_ptr(boost::system::system_error(ec)));
            } else {
                result->resolve(std::move(r));
            }
        });

    asio::steady_timer timer(ex, deadline);
    timer.async_wait([result](const boost::system::error_code& ec) {
        if (!ec) {
            result->reject(std::make_exception_ptr(
                boost::system::system_error(asio::error::timed_out, "name resolution")));
        }
    });

    auto endpoints = co_await result->wait();
    timer.cancel();
    co_return endpoints;
}

} // anonymous namespace

cobalt::task<HttpResult> http_get(std::string url,
                                  std::chrono::milliseconds timeout,
                                  TlsOptions tls) {
    auto target = parse_target(url);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto ex = co_await cobalt::this_coro::executor;

    auto endpoints = co_await resolve(ex, target, deadline);

    log().trace("GET {} ({} endpoint(s))", url, endpoints.size());

    if (!target.use_tls) {
        beast::tcp_stream stream(ex);
        stream.expires_at(deadline);
        co_await stream.async_connect(endpoints, cobalt::use_op);

        auto result = co_await exchange(stream, target, deadline);

        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return result;
    }

    ssl::context ctx{ssl::context::tlsv12_client};
    if (tls.verify) {
        if (tls.ca_file.empty()) {
            ctx.set_default_verify_paths();
        } else {
            ctx.load_verify_file(tls.ca_file);
        }
        ctx.set_verify_mode(ssl::verify_peer);
    } else {
        ctx.set_verify_mode(ssl::verify_none);
    }

    beast::ssl_stream<beast::tcp_stream> stream(ex, ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), target.host.c_str())) {
        throw boost::system::system_error(
            boost::system::error_code(static_cast<int>(::ERR_get_error()),
                                      asio::error::get_ssl_category()));
    }

    beast::get_lowest_layer(stream).expires_at(deadline);
    co_await beast::get_lowest_layer(stream).async_connect(endpoints, cobalt::use_op);
    co_await stream.async_handshake(ssl::stream_base::client, cobalt::use_op);

    auto result = co_await exchange(stream, target, deadline);

    // Servers commonly skip close_notify; a truncated shutdown is harmless here
    auto [ec] = co_await stream.async_shutdown(asio::as_tuple(cobalt::use_op));
    if (ec && ec != ssl::error::stream_truncated) {
        log().trace("TLS shutdown for {}: {}", url, ec.message());
    }
    co_return result;
}

} // namespace bridgelink
