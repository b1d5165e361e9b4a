#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <unordered_map>

namespace bridgelink {

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    FILE_NOT_FOUND,
    PARSE_ERROR,
    INVALID_VALUE,
};

std::string config_error_message(ConfigError error);

namespace client {

// ============================================================================
// Client Configuration
// ============================================================================

struct ClientConfig {
    // Relay address: "host:port", "http(s)://host[:port]", or empty for the
    // default 127.0.0.1:25037
    std::string bridge;

    // Timeouts and cadences
    std::chrono::milliseconds connect_timeout{5000};         // WebSocket ready race
    std::chrono::milliseconds probe_timeout{3000};           // /bridge/ping deadline
    std::chrono::milliseconds poll_interval{1000};           // device list refresh
    std::chrono::milliseconds probe_interval{1000};          // re-probe while no relay
    std::chrono::milliseconds disconnect_suspicion{1000};    // early-disconnect window
    std::chrono::milliseconds keepalive_interval{5000};      // relay ping while connected, 0 = off

    // TLS (wss:// and https:// relays)
    bool ssl_verify = true;
    std::string ssl_ca_file;    // empty = system default

    // Local helper that releases a conflicting ADB server (developer mode)
    bool companion_enabled = false;
    std::string companion_url = "http://localhost:25898";

    // Key store handed to the authenticator on the direct path
    std::string credential_store = "ModsBeforeFriday";

    // Logging
    std::string log_level = "info";
    std::string log_file;
    std::unordered_map<std::string, std::string> module_log_levels;

    // Load from JSON file
    static std::expected<ClientConfig, ConfigError> load(const std::string& path);

    // Load from JSON string (for testing)
    static std::expected<ClientConfig, ConfigError> parse(const std::string& json_content);
};

} // namespace client
} // namespace bridgelink
