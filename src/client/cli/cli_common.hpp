#pragma once

#include "client/bridge_client.hpp"
#include "client/bridge_endpoint.hpp"
#include "client/client_config.hpp"
#include "client/keepalive_pinger.hpp"
#include "client/liveness_prober.hpp"
#include "client/session_connector.hpp"
#include "client/version.hpp"
#include "common/logger.hpp"

#include <boost/asio.hpp>
#include <boost/cobalt.hpp>

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace bridgelink::client::cli {

namespace cobalt = boost::cobalt;
namespace asio = boost::asio;

// Exit code when a command was interrupted by SIGINT/SIGTERM
inline constexpr int kInterruptedExitCode = 130;

// Everything a command needs to talk to the relay
struct BridgeContext {
    RelayEndpoint endpoint;
    std::shared_ptr<SessionConnector> connector;
    std::shared_ptr<AdbBridgeClient> client;
};

inline TlsOptions tls_options(const ClientConfig& config) {
    return TlsOptions{config.ssl_verify, config.ssl_ca_file};
}

inline BridgeContext make_bridge_context(const ClientConfig& config) {
    BridgeContext ctx;
    ctx.endpoint = resolve_relay_endpoint(config.bridge);
    ctx.connector = std::make_shared<SessionConnector>(
        ctx.endpoint, config.connect_timeout, websocket_stream_factory(tls_options(config)));
    ctx.client = std::make_shared<AdbBridgeClient>(ctx.connector);
    return ctx;
}

// Relay keepalive for a connected device; null when disabled
inline std::shared_ptr<KeepalivePinger> make_keepalive(asio::any_io_executor ex,
                                                       const ClientConfig& config,
                                                       const RelayEndpoint& endpoint) {
    if (config.keepalive_interval.count() == 0) {
        return nullptr;
    }
    auto prober = std::make_shared<LivenessProber>(config.probe_timeout, tls_options(config));
    return std::make_shared<KeepalivePinger>(
        ex, config.keepalive_interval,
        [prober, url = endpoint.health_url]() { return prober->probe_url(url); });
}

// Stop the io_context on SIGINT/SIGTERM
inline void stop_on_signal(asio::io_context& ioc, asio::signal_set& signals) {
    signals.async_wait([&ioc](const boost::system::error_code& ec, int sig) {
        if (ec) return;
        Logger::get("client.cli").info("Received signal {}, shutting down...", sig);
        ioc.stop();
    });
}

// Run a command coroutine to completion and stop the io_context with it.
// Returns kInterruptedExitCode if a signal stopped the io_context first.
inline int run_command(asio::io_context& ioc, cobalt::task<int> command) {
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    stop_on_signal(ioc, signals);

    std::optional<int> exit_code;
    cobalt::spawn(ioc, std::move(command), [&](std::exception_ptr error, int code) {
        signals.cancel();
        ioc.stop();
        if (!error) {
            exit_code = code;
            return;
        }
        exit_code = 1;
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
        }
    });
    ioc.run();

    return exit_code.value_or(kInterruptedExitCode);
}

} // namespace bridgelink::client::cli

// Command declarations (global scope, called from main)
int cmd_version();
int cmd_ping(const bridgelink::client::ClientConfig& config, int argc, char* argv[]);
int cmd_devices(const bridgelink::client::ClientConfig& config, int argc, char* argv[]);
int cmd_connect(const bridgelink::client::ClientConfig& config, int argc, char* argv[]);
