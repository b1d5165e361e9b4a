#include "client/device_connector.hpp"
#include "client/errors.hpp"
#include "common/http_client.hpp"
#include "common/logger.hpp"

#include <charconv>
#include <stdexcept>

namespace bridgelink::client {

namespace {
auto& log() { return Logger::get("client.connector"); }
} // anonymous namespace

const char* connection_phase_name(ConnectionPhase phase) {
    switch (phase) {
        case ConnectionPhase::IDLE: return "IDLE";
        case ConnectionPhase::CONNECTING: return "CONNECTING";
        case ConnectionPhase::AUTHENTICATING: return "AUTHENTICATING";
        case ConnectionPhase::CONNECTED: return "CONNECTED";
        case ConnectionPhase::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

const char* connect_outcome_name(ConnectOutcome outcome) {
    switch (outcome) {
        case ConnectOutcome::DISCONNECTED: return "DISCONNECTED";
        case ConnectOutcome::NO_DEVICE_SELECTED: return "NO_DEVICE_SELECTED";
        case ConnectOutcome::DEVICE_IN_USE: return "DEVICE_IN_USE";
        case ConnectOutcome::ALREADY_CONNECTED: return "ALREADY_CONNECTED";
        case ConnectOutcome::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

std::optional<int> parse_os_major_version(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t' ||
                             text.front() == '\r' || text.front() == '\n')) {
        text.remove_prefix(1);
    }
    int major = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), major);
    if (ec != std::errc{} || ptr == text.data()) {
        return std::nullopt;
    }
    return major;
}

DeviceConnector::DeviceConnector(const ClientConfig& config,
                                 DirectPathCollaborators direct,
                                 DisconnectWatchdog& watchdog)
    : config_(config)
    , direct_(std::move(direct))
    , watchdog_(watchdog) {}

cobalt::task<ConnectOutcome> DeviceConnector::connect_device(std::optional<DeviceRecord> device) {
    if (state_.connecting || chosen_) {
        log().warn("Connect requested while {}", connection_phase_name(state_.phase));
        co_return ConnectOutcome::ALREADY_CONNECTED;
    }

    const uint64_t generation = ++generation_;
    clear_device();
    state_.connect_error.reset();
    state_.connecting = true;
    state_.phase = ConnectionPhase::CONNECTING;
    publish();

    std::shared_ptr<DeviceSession> session;
    std::optional<ConnectOutcome> outcome;
    std::string outcome_detail;
    std::optional<std::string> failure;
    try {
        if (device) {
            session = co_await connect_bridge(*device);
        } else {
            auto result = co_await connect_direct();
            if (auto* early = std::get_if<DirectOutcome>(&result)) {
                outcome = early->outcome;
                outcome_detail = std::move(early->detail);
            } else {
                session = std::get<std::shared_ptr<DeviceSession>>(std::move(result));
            }
        }
        if (session && generation == generation_) {
            co_await initialize_device(session, generation);
        }
    } catch (const std::exception& e) {
        failure = e.what();
    }

    if (session) {
        session->close();
    }

    // disconnect_device() ran meanwhile and already reset everything
    if (generation != generation_) {
        log().debug("Connect attempt superseded");
        co_return failure ? ConnectOutcome::FAILED : outcome.value_or(ConnectOutcome::DISCONNECTED);
    }

    if (failure) {
        log().error("Failed to connect to device: {}", *failure);
        clear_device();
        state_.connect_error = *failure;
        state_.phase = ConnectionPhase::ERROR;
        publish();
        co_return ConnectOutcome::FAILED;
    }

    clear_device();
    if (outcome == ConnectOutcome::DEVICE_IN_USE) {
        state_.device_in_use = true;
        state_.connect_error = std::move(outcome_detail);
    }
    publish();
    co_return outcome.value_or(ConnectOutcome::DISCONNECTED);
}

cobalt::task<std::shared_ptr<DeviceSession>> DeviceConnector::connect_bridge(const DeviceRecord& device) {
    if (!bridge_client_) {
        throw std::runtime_error("Bridge client is null, cannot connect to device");
    }

    log().info("Connecting to {} through the bridge", device.serial);
    state_.using_bridge = true;
    publish();

    co_return co_await bridge_client_->create_device_session(device);
}

cobalt::task<DeviceConnector::DirectResult> DeviceConnector::connect_direct() {
    if (!direct_.picker || !direct_.authenticator) {
        throw std::runtime_error("Direct device connections are not available");
    }

    auto usb = co_await direct_.picker->request_device();
    if (!usb) {
        log().info("No device selected");
        co_return DirectOutcome{ConnectOutcome::NO_DEVICE_SELECTED, {}};
    }

    if (config_.companion_enabled) {
        co_await release_conflicting_server();
    }

    std::shared_ptr<DeviceConnection> connection;
    try {
        connection = co_await usb->connect();
    } catch (const DeviceInUseError& e) {
        log().warn("Device {} is in use by another process: {}", usb->serial(), e.what());
        co_return DirectOutcome{ConnectOutcome::DEVICE_IN_USE, e.what()};
    }

    state_.authing = true;
    state_.phase = ConnectionPhase::AUTHENTICATING;
    publish();

    auto credentials = direct_.credentials
        ? direct_.credentials
        : std::make_shared<CredentialStore>(config_.credential_store);
    auto session = co_await direct_.authenticator->authenticate(usb->serial(), connection, credentials);
    if (!session) {
        throw std::runtime_error("Authentication of " + usb->serial() + " produced no session");
    }

    state_.authing = false;
    publish();
    co_return session;
}

cobalt::task<void> DeviceConnector::initialize_device(std::shared_ptr<DeviceSession> session,
                                                      uint64_t generation) {
    auto release = co_await session->spawn_wait_text(kOsVersionCommand);
    if (generation != generation_) {
        co_return;
    }

    auto version = parse_os_major_version(release);
    if (!version) {
        log().warn("{}: unrecognised OS version '{}'", session->serial(), release);
    }

    state_.os_version = version;
    state_.device_pre_v51 = version && *version < kNonLegacyAndroidVersion;
    state_.authing = false;
    state_.connecting = false;
    state_.chosen_serial = session->serial();
    state_.phase = ConnectionPhase::CONNECTED;
    chosen_ = session;

    log().info("Connected to {} (Android {}, legacy: {})",
               session->serial(), version ? std::to_string(*version) : "?",
               state_.device_pre_v51 ? "yes" : "no");
    publish();

    if (state_.using_bridge && keepalive_) {
        keepalive_->start();
    }

    co_await watchdog_.await_disconnect(session);
    log().info("{}: session ended", session->serial());
}

cobalt::task<void> DeviceConnector::release_conflicting_server() {
    try {
        auto result = co_await http_get(config_.companion_url, config_.probe_timeout,
                                        TlsOptions{config_.ssl_verify, config_.ssl_ca_file});
        log().info("Companion at {} answered {}", config_.companion_url, result.status);
    } catch (const std::exception& e) {
        log().warn("Companion at {} is not running, stop any other ADB server by hand ({})",
                   config_.companion_url, e.what());
    }
}

void DeviceConnector::disconnect_device() {
    ++generation_;
    auto session = std::move(chosen_);
    if (session) {
        log().info("Disconnecting {}", session->serial());
        session->close();
    }
    clear_device();
    state_.connect_error.reset();
    publish();
}

void DeviceConnector::clear_device() {
    if (keepalive_) {
        keepalive_->stop();
    }
    auto error = std::move(state_.connect_error);
    chosen_.reset();
    state_ = ConnectorState{};
    state_.connect_error = std::move(error);
}

void DeviceConnector::publish() {
    log().trace("State: {} (connecting={}, authing={}, bridge={})",
                connection_phase_name(state_.phase), state_.connecting,
                state_.authing, state_.using_bridge);
    if (on_state_) {
        on_state_(state_);
    }
}

} // namespace bridgelink::client
