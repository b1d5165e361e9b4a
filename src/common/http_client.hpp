#pragma once

#include <boost/cobalt.hpp>

#include <chrono>
#include <string>

namespace bridgelink {

namespace cobalt = boost::cobalt;

struct HttpResult {
    unsigned status = 0;
    std::string body;
};

struct TlsOptions {
    bool verify = true;
    std::string ca_file;    // empty = system default verify paths
};

// Single HTTP/1.1 GET for http:// and https:// URLs. The whole exchange
// (connect, TLS handshake, request, response) shares one deadline.
// Throws boost::system::system_error on network failure or timeout and
// std::invalid_argument for a URL it cannot handle.
cobalt::task<HttpResult> http_get(std::string url,
                                  std::chrono::milliseconds timeout,
                                  TlsOptions tls = {});

} // namespace bridgelink
