#include "cli_common.hpp"
#include "client/auto_connector.hpp"
#include "client/device_connector.hpp"
#include "client/device_directory.hpp"
#include "client/disconnect_watchdog.hpp"

using namespace bridgelink;
using namespace bridgelink::client;

static void print_connect_help() {
    std::cout << "bridgelink - Connect to a device through the bridge\n\n"
              << "Usage: bridgelink [options] connect [serial]\n\n"
              << "Connects, reports the Android version, then waits until the\n"
              << "device disconnects (Ctrl+C to stop).\n\n"
              << "Without a serial, waits until the bridge lists exactly one\n"
              << "device and connects to it.\n";
}

static void print_connected(const ConnectorState& state) {
    if (state.phase != ConnectionPhase::CONNECTED) return;
    std::cout << "Connected to " << state.chosen_serial.value_or("?") << "\n"
              << "  Android:  "
              << (state.os_version ? std::to_string(*state.os_version) : "unknown") << "\n"
              << "  Legacy:   " << (state.device_pre_v51 ? "yes" : "no") << "\n"
              << "Waiting for the device to disconnect...\n";
}

static int report_outcome(const DeviceConnector& connector, ConnectOutcome outcome) {
    switch (outcome) {
        case ConnectOutcome::DISCONNECTED:
            std::cout << "Device disconnected\n";
            return 0;
        case ConnectOutcome::FAILED:
            std::cerr << "Connection failed: "
                      << connector.state().connect_error.value_or("unknown error") << "\n";
            return 1;
        default:
            std::cerr << "Connection ended: " << connect_outcome_name(outcome) << "\n";
            return 1;
    }
}

static cobalt::task<int> connect_and_wait(const ClientConfig& config, std::string serial) {
    auto ctx = cli::make_bridge_context(config);
    DisconnectWatchdog watchdog(config.disconnect_suspicion);

    // Relay path only; direct collaborators are platform specific
    DeviceConnector connector(config, DirectPathCollaborators{}, watchdog);
    connector.set_bridge_client(ctx.client);
    connector.set_keepalive(cli::make_keepalive(co_await cobalt::this_coro::executor, config, ctx.endpoint));
    connector.set_state_callback(print_connected);

    DeviceRecord device;
    device.serial = std::move(serial);
    device.state = DeviceState::DEVICE;

    auto outcome = co_await connector.connect_device(device);
    co_return report_outcome(connector, outcome);
}

static int connect_single_device(const ClientConfig& config) {
    asio::io_context ioc;
    auto ctx = cli::make_bridge_context(config);
    auto prober = std::make_shared<LivenessProber>(config.probe_timeout, cli::tls_options(config));

    DisconnectWatchdog watchdog(config.disconnect_suspicion);
    DeviceConnector connector(config, DirectPathCollaborators{}, watchdog);
    connector.set_keepalive(cli::make_keepalive(ioc.get_executor(), config, ctx.endpoint));
    connector.set_state_callback(print_connected);

    auto directory = std::make_shared<DeviceDirectory>(
        ioc.get_executor(), config,
        [prober, endpoint = ctx.endpoint]() { return prober->probe(endpoint); },
        [connector = ctx.connector]() -> std::shared_ptr<BridgeClient> {
            return std::make_shared<AdbBridgeClient>(connector);
        });

    auto auto_connector = std::make_shared<AutoConnector>(ioc.get_executor(), directory, connector);

    DirectoryCallbacks forward;
    forward.on_devices_changed = [](const DeviceSnapshot& devices) {
        if (devices.size() > 1) {
            std::cout << devices.size() << " devices on the bridge, pass a serial to pick one\n";
        }
    };
    forward.on_error = [](const std::string& message) {
        std::cout << "Error: " << message << "\n";
    };
    auto_connector->attach(std::move(forward));

    std::optional<int> exit_code;
    auto_connector->set_outcome_callback([&](const DeviceRecord&, ConnectOutcome outcome) {
        exit_code = report_outcome(connector, outcome);
        directory->stop();
        ioc.stop();
    });

    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    cli::stop_on_signal(ioc, signals);

    std::cout << "Waiting for a single device on " << ctx.endpoint.host << " (Ctrl+C to stop)\n";
    directory->start();
    ioc.run();
    directory->stop();
    return exit_code.value_or(cli::kInterruptedExitCode);
}

int cmd_connect(const ClientConfig& config, int argc, char* argv[]) {
    std::string serial;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") { print_connect_help(); return 0; }
        else if (serial.empty() && arg[0] != '-') { serial = arg; }
    }

    if (serial.empty()) {
        return connect_single_device(config);
    }

    asio::io_context ioc;
    return cli::run_command(ioc, connect_and_wait(config, std::move(serial)));
}
