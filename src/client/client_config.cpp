#include "client/client_config.hpp"
#include "common/logger.hpp"

#include <boost/json.hpp>

#include <fstream>
#include <sstream>

namespace json = boost::json;

// Safe JSON field accessors with defaults
namespace {

std::string jstr(const json::object& obj, std::string_view key, const std::string& def = {}) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string())
        return std::string(it->value().as_string());
    return def;
}

bool jbool(const json::object& obj, std::string_view key, bool def = false) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_bool())
        return it->value().as_bool();
    return def;
}

// Longest accepted timing value
constexpr int64_t kMaxMillis = 24 * 60 * 60 * 1000;

// Reads a millisecond value in [0, kMaxMillis]. Integers above INT64_MAX
// parse as uint64 and are out of range as well.
bool jmillis(const json::object& obj, std::string_view key, std::chrono::milliseconds& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->value().is_int64()) return false;
    auto value = it->value().as_int64();
    if (value < 0 || value > kMaxMillis) return false;
    out = std::chrono::milliseconds(value);
    return true;
}

const json::object* jsection(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_object())
        return &it->value().as_object();
    return nullptr;
}

}  // anonymous namespace

namespace bridgelink {

namespace {
auto& log() { return Logger::get("client.config"); }
}  // anonymous namespace

std::string config_error_message(ConfigError error) {
    switch (error) {
        case ConfigError::FILE_NOT_FOUND: return "Configuration file not found";
        case ConfigError::PARSE_ERROR: return "Failed to parse configuration file";
        case ConfigError::INVALID_VALUE: return "Invalid configuration value";
        default: return "Unknown configuration error";
    }
}

namespace client {

std::expected<ClientConfig, ConfigError> ClientConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError::FILE_NOT_FOUND);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::expected<ClientConfig, ConfigError> ClientConfig::parse(const std::string& json_content) {
    json::value jv;
    try {
        jv = json::parse(json_content);
    } catch (const std::exception& e) {
        log().error("Config parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    }

    if (!jv.is_object()) {
        return std::unexpected(ConfigError::PARSE_ERROR);
    }
    auto& root = jv.as_object();

    ClientConfig config;
    config.bridge = jstr(root, "bridge", config.bridge);
    config.credential_store = jstr(root, "credential_store", config.credential_store);

    if (!jmillis(root, "connect_timeout_ms", config.connect_timeout) ||
        !jmillis(root, "probe_timeout_ms", config.probe_timeout) ||
        !jmillis(root, "poll_interval_ms", config.poll_interval) ||
        !jmillis(root, "probe_interval_ms", config.probe_interval) ||
        !jmillis(root, "disconnect_suspicion_ms", config.disconnect_suspicion) ||
        !jmillis(root, "keepalive_interval_ms", config.keepalive_interval)) {
        log().error("Config: timing values must be integers between 0 and {} (milliseconds)", kMaxMillis);
        return std::unexpected(ConfigError::INVALID_VALUE);
    }

    if (config.connect_timeout.count() == 0 || config.poll_interval.count() == 0) {
        log().error("Config: connect_timeout_ms and poll_interval_ms must be positive");
        return std::unexpected(ConfigError::INVALID_VALUE);
    }

    if (auto* tls = jsection(root, "tls")) {
        config.ssl_verify = jbool(*tls, "verify", config.ssl_verify);
        config.ssl_ca_file = jstr(*tls, "ca_file", config.ssl_ca_file);
    }

    if (auto* companion = jsection(root, "companion")) {
        config.companion_enabled = jbool(*companion, "enabled", config.companion_enabled);
        config.companion_url = jstr(*companion, "url", config.companion_url);
    }

    if (auto* logsec = jsection(root, "log")) {
        config.log_level = jstr(*logsec, "level", config.log_level);
        config.log_file = jstr(*logsec, "file", config.log_file);
        if (auto* modules = jsection(*logsec, "modules")) {
            for (const auto& [key, value] : *modules) {
                if (value.is_string()) {
                    config.module_log_levels[std::string(key)] = std::string(value.as_string());
                }
            }
        }
    }

    return config;
}

} // namespace client
} // namespace bridgelink
