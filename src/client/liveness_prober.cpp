#include "client/liveness_prober.hpp"
#include "common/logger.hpp"

namespace bridgelink::client {

namespace {
auto& log() { return Logger::get("client.probe"); }
} // anonymous namespace

bool is_probe_success(unsigned status, std::string_view body) {
    return status >= 200 && status < 300 && body == "OK";
}

LivenessProber::LivenessProber(std::chrono::milliseconds timeout, TlsOptions tls)
    : timeout_(timeout), tls_(std::move(tls)) {}

cobalt::task<bool> LivenessProber::probe(const RelayEndpoint& endpoint) {
    co_return co_await probe_url(endpoint.health_url);
}

cobalt::task<bool> LivenessProber::probe_url(std::string health_url) {
    try {
        auto result = co_await http_get(health_url, timeout_, tls_);
        bool alive = is_probe_success(result.status, result.body);
        if (!alive) {
            log().debug("Bridge ping {} answered {} ({} byte body)",
                        health_url, result.status, result.body.size());
        }
        co_return alive;
    } catch (const std::exception& e) {
        log().debug("Bridge ping {} failed: {}", health_url, e.what());
        co_return false;
    }
}

} // namespace bridgelink::client
