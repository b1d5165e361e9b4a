#pragma once

#include <string>
#include <string_view>

namespace bridgelink::client {

// Relay used when nothing is configured
inline constexpr std::string_view kDefaultBridgeHost = "127.0.0.1:25037";

// ============================================================================
// RelayEndpoint - how to reach the bridge. Computed once, never mutated.
// ============================================================================
struct RelayEndpoint {
    std::string host;           // "host[:port]", default port omitted
    std::string data_url;       // ws(s)://<host>/bridge
    std::string health_url;     // http(s)://<host>/bridge/ping
    bool is_local = false;      // host is 127.0.0.1 or localhost
};

// Resolve a configuration string: "host:port", "http(s)://host[:port]/...", or
// empty. Never fails: unparseable input yields the default endpoint.
RelayEndpoint resolve_relay_endpoint(std::string_view config);

// Resolve from a page URL's "bridge" query parameter. An empty parameter
// means the page's own origin is the relay; no parameter means the default.
RelayEndpoint resolve_from_page_url(std::string_view page_url);

} // namespace bridgelink::client
