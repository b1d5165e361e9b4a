#include "client/bridge_endpoint.hpp"
#include "common/logger.hpp"

#include <boost/url.hpp>

#include <algorithm>
#include <cctype>

namespace bridgelink::client {

namespace {

auto& log() { return Logger::get("client.endpoint"); }

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool starts_with_http_scheme(std::string_view s) {
    auto lower = to_lower(s.substr(0, 8));
    return lower.starts_with("http://") || lower.starts_with("https://");
}

RelayEndpoint make_endpoint(bool secure, std::string host, std::string_view hostname) {
    RelayEndpoint ep;
    ep.data_url = std::string(secure ? "wss://" : "ws://") + host + "/bridge";
    ep.health_url = std::string(secure ? "https://" : "http://") + host + "/bridge/ping";
    auto lower = to_lower(hostname);
    ep.is_local = lower == "127.0.0.1" || lower == "localhost";
    ep.host = std::move(host);
    return ep;
}

RelayEndpoint default_endpoint() {
    return make_endpoint(false, std::string(kDefaultBridgeHost), "127.0.0.1");
}

} // anonymous namespace

RelayEndpoint resolve_relay_endpoint(std::string_view config) {
    if (config.empty()) {
        return default_endpoint();
    }

    std::string text = starts_with_http_scheme(config)
        ? std::string(config)
        : "http://" + std::string(config);

    auto parsed = boost::urls::parse_uri(text);
    if (!parsed || parsed->encoded_host().empty()) {
        log().warn("Cannot parse bridge address '{}', using {}", config, kDefaultBridgeHost);
        return default_endpoint();
    }

    auto scheme = to_lower(parsed->scheme());
    bool secure = scheme == "https";
    if (!secure && scheme != "http") {
        log().warn("Unsupported bridge scheme '{}', using {}", scheme, kDefaultBridgeHost);
        return default_endpoint();
    }

    // Lowercased host; the port is kept only when it is not the scheme default
    std::string hostname = to_lower(parsed->encoded_host());
    std::string host = hostname;
    if (parsed->has_port() && !parsed->port().empty()) {
        std::string_view port = parsed->port();
        bool default_port = (secure && port == "443") || (!secure && port == "80");
        if (!default_port) {
            host += ":";
            host += port;
        }
    }

    // is_local compares the bare address, without IPv6 brackets
    std::string_view bare = hostname;
    if (bare.size() >= 2 && bare.front() == '[' && bare.back() == ']') {
        bare = bare.substr(1, bare.size() - 2);
    }

    return make_endpoint(secure, std::move(host), bare);
}

RelayEndpoint resolve_from_page_url(std::string_view page_url) {
    auto parsed = boost::urls::parse_uri(page_url);
    if (!parsed) {
        return default_endpoint();
    }

    auto params = parsed->params();
    auto it = params.find("bridge");
    if (it == params.end()) {
        return default_endpoint();
    }

    auto param = *it;
    if (param.value.empty()) {
        return resolve_relay_endpoint(page_url);
    }
    return resolve_relay_endpoint(param.value);
}

} // namespace bridgelink::client
