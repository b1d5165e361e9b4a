#include "cli_common.hpp"
#include "client/device_directory.hpp"
#include "client/liveness_prober.hpp"

#include <iomanip>

using namespace bridgelink;
using namespace bridgelink::client;

static void print_devices_help() {
    std::cout << "bridgelink - List devices attached to the bridge\n\n"
              << "Usage: bridgelink [options] devices [--watch]\n\n"
              << "Options:\n"
              << "  -w, --watch   Keep polling and print every change (Ctrl+C to stop)\n"
              << "  -h, --help    Show this help\n";
}

static void print_device(const DeviceRecord& d) {
    std::cout << "  " << std::left << std::setw(24) << d.serial
              << std::setw(16) << device_state_name(d.state);
    if (d.model) std::cout << " model:" << *d.model;
    if (d.product) std::cout << " product:" << *d.product;
    if (d.transport_id) std::cout << " transport_id:" << *d.transport_id;
    std::cout << "\n";
}

static cobalt::task<int> list_devices(const ClientConfig& config) {
    auto ctx = cli::make_bridge_context(config);
    auto devices = co_await ctx.client->get_devices();

    std::cout << "Devices on " << ctx.endpoint.host << ":\n";
    if (devices.empty()) {
        std::cout << "  (none)\n";
    }
    for (const auto& d : devices) {
        print_device(d);
    }
    co_return 0;
}

static int watch_devices(const ClientConfig& config) {
    asio::io_context ioc;
    auto ctx = cli::make_bridge_context(config);
    auto prober = std::make_shared<LivenessProber>(config.probe_timeout, cli::tls_options(config));

    auto directory = std::make_shared<DeviceDirectory>(
        ioc.get_executor(), config,
        [prober, endpoint = ctx.endpoint]() { return prober->probe(endpoint); },
        [connector = ctx.connector]() -> std::shared_ptr<BridgeClient> {
            return std::make_shared<AdbBridgeClient>(connector);
        });

    DirectoryCallbacks callbacks;
    callbacks.on_devices_changed = [](const DeviceSnapshot& devices) {
        std::cout << "Ready devices (" << devices.size() << "):\n";
        for (const auto& d : devices) {
            print_device(d);
        }
    };
    callbacks.on_bridge_changed = [host = ctx.endpoint.host](bool available) {
        std::cout << "Bridge " << host << (available ? " is available\n" : " went away\n");
    };
    callbacks.on_error = [](const std::string& message) {
        std::cout << "Error: " << message << "\n";
    };
    directory->set_callbacks(std::move(callbacks));

    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    cli::stop_on_signal(ioc, signals);

    std::cout << "Watching " << ctx.endpoint.host << " (Ctrl+C to stop)\n";
    directory->start();
    ioc.run();
    directory->stop();
    return 0;
}

int cmd_devices(const ClientConfig& config, int argc, char* argv[]) {
    bool watch = false;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") { print_devices_help(); return 0; }
        else if (arg == "-w" || arg == "--watch") { watch = true; }
        else {
            std::cerr << "Unknown option: " << arg << "\n\n";
            print_devices_help();
            return 1;
        }
    }

    if (watch) {
        return watch_devices(config);
    }

    asio::io_context ioc;
    return cli::run_command(ioc, list_devices(config));
}
