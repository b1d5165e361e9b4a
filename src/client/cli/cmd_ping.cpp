#include "cli_common.hpp"
#include "client/liveness_prober.hpp"

using namespace bridgelink;
using namespace bridgelink::client;

static void print_ping_help() {
    std::cout << "bridgelink - Check whether the bridge is alive\n\n"
              << "Usage: bridgelink [options] ping\n\n"
              << "Probes <bridge>/bridge/ping and, when the bridge answers, asks the\n"
              << "ADB server behind it for its protocol version.\n";
}

static cobalt::task<int> ping(const ClientConfig& config) {
    auto ctx = cli::make_bridge_context(config);
    LivenessProber prober(config.probe_timeout, cli::tls_options(config));

    std::cout << "Bridge:  " << ctx.endpoint.host
              << (ctx.endpoint.is_local ? " (local)" : "") << "\n";

    bool alive = co_await prober.probe(ctx.endpoint);
    if (!alive) {
        std::cout << "Status:  not reachable (" << ctx.endpoint.health_url << ")\n";
        co_return 1;
    }
    std::cout << "Status:  alive\n";

    try {
        auto version = co_await ctx.client->get_version();
        std::cout << "ADB:     protocol version " << version << "\n";
    } catch (const std::exception& e) {
        std::cout << "ADB:     " << e.what() << "\n";
        co_return 1;
    }
    co_return 0;
}

int cmd_ping(const ClientConfig& config, int argc, char* argv[]) {
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") { print_ping_help(); return 0; }
    }

    asio::io_context ioc;
    return cli::run_command(ioc, ping(config));
}
