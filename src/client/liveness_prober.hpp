#pragma once

#include "client/bridge_endpoint.hpp"
#include "common/http_client.hpp"

#include <boost/cobalt.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace bridgelink::client {

namespace cobalt = boost::cobalt;

// Alive iff 2xx and the body is exactly "OK"
bool is_probe_success(unsigned status, std::string_view body);

// Asks the relay's /bridge/ping endpoint whether it is alive. One request,
// no retries; every failure is reported as "not alive".
class LivenessProber {
public:
    explicit LivenessProber(std::chrono::milliseconds timeout, TlsOptions tls = {});

    cobalt::task<bool> probe(const RelayEndpoint& endpoint);
    cobalt::task<bool> probe_url(std::string health_url);

private:
    std::chrono::milliseconds timeout_;
    TlsOptions tls_;
};

} // namespace bridgelink::client
