#include "cli/cli_common.hpp"
#include "client/client_config.hpp"
#include "common/logger.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace bridgelink::client;
using namespace bridgelink;

void print_usage(const char* program) {
    std::cout << "bridgelink - ADB bridge client\n\n"
              << "Usage: " << program << " [options] <command> [args]\n\n"
              << "Commands:\n"
              << "  ping                  Check whether the bridge is alive\n"
              << "  devices [--watch]     List devices, or keep printing changes\n"
              << "  connect [serial]      Connect to a device (or the only one) and wait for disconnect\n"
              << "  version               Show version information\n\n"
              << "Options:\n"
              << "  -c, --config <file>   Config file (JSON)\n"
              << "  -b, --bridge <addr>   Bridge address, host:port or URL (overrides config)\n"
              << "  -l, --log-level <l>   Log level: trace/debug/info/warn/error/off\n"
              << "  -h, --help            Show help\n\n"
              << "Examples:\n"
              << "  " << program << " ping\n"
              << "  " << program << " -b 192.168.1.20:25037 devices --watch\n"
              << "  " << program << " connect 1WMHH815K91234\n"
              << "  " << program << " connect\n"
              << std::endl;
}

void setup_logging(const ClientConfig& config) {
    LogConfig log_config;
    log_config.global_level = log_level_from_string(config.log_level);
    log_config.file_path = config.log_file;
    for (const auto& [module, level] : config.module_log_levels) {
        log_config.module_levels[module] = log_level_from_string(level);
    }
    LogManager::instance().init(log_config);
}

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string bridge;
    std::string log_level;
    std::string command;
    std::vector<char*> command_args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!command.empty()) {
            command_args.push_back(argv[i]);
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        } else if ((arg == "-b" || arg == "--bridge") && i + 1 < argc) {
            bridge = argv[++i];
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            log_level = argv[++i];
        } else if (arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n\n";
            print_usage(argv[0]);
            return 1;
        } else {
            command = arg;
        }
    }

    if (command.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    if (command == "version") {
        return cmd_version();
    }

    ClientConfig config;
    if (!config_file.empty()) {
        auto loaded = ClientConfig::load(config_file);
        if (!loaded) {
            std::cerr << "Error: " << config_error_message(loaded.error())
                      << ": " << config_file << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }

    // Command line overrides the file
    if (!bridge.empty()) config.bridge = bridge;
    if (!log_level.empty()) config.log_level = log_level;

    setup_logging(config);

    int args_count = static_cast<int>(command_args.size());
    int rc = 1;
    if (command == "ping") {
        rc = cmd_ping(config, args_count, command_args.data());
    } else if (command == "devices") {
        rc = cmd_devices(config, args_count, command_args.data());
    } else if (command == "connect") {
        rc = cmd_connect(config, args_count, command_args.data());
    } else {
        std::cerr << "Unknown command: " << command << "\n\n";
        print_usage(argv[0]);
    }

    LogManager::instance().shutdown();
    return rc;
}
