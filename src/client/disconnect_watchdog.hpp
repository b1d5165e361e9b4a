#pragma once

#include "client/device_session.hpp"
#include "common/one_shot.hpp"

#include <boost/cobalt.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace bridgelink::client {

namespace cobalt = boost::cobalt;

enum class DisconnectPhase : uint8_t {
    AWAITING_TRANSPORT,     // waiting for the transport's own disconnect signal
    CONFIRMING,             // signal came early; waiting on a blocking command
    DISCONNECTED,
};

const char* disconnect_phase_name(DisconnectPhase phase);

// ============================================================================
// DisconnectWatchdog - decides when a device session has really ended.
//
// Older relays report a transport disconnect right away. A disconnect seen
// within the suspicion window is therefore confirmed by running a command
// that only returns once the device is gone. Later disconnects are trusted.
//
// Concurrent waits for the same serial share one in-flight wait.
// ============================================================================
class DisconnectWatchdog {
public:
    static constexpr const char* kBlockingCommand = "read";

    explicit DisconnectWatchdog(std::chrono::milliseconds suspicion_window = std::chrono::milliseconds(1000));

    // Completes once the device behind the session is gone
    cobalt::task<void> await_disconnect(std::shared_ptr<DeviceSession> session);

    // A disconnect reported this soon after the wait started needs confirming
    bool is_suspicious(std::chrono::steady_clock::duration elapsed) const {
        return elapsed < suspicion_window_;
    }

    std::optional<DisconnectPhase> phase(const std::string& serial) const;
    size_t pending() const;

private:
    struct Wait {
        explicit Wait(asio::any_io_executor ex) : done(ex) {}

        Latch done;
        DisconnectPhase phase = DisconnectPhase::AWAITING_TRANSPORT;
    };

    cobalt::task<void> watch(std::shared_ptr<DeviceSession> session, std::shared_ptr<Wait> wait);
    void set_phase(const std::string& serial, Wait& wait, DisconnectPhase phase);

    std::chrono::milliseconds suspicion_window_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Wait>> waits_;
};

} // namespace bridgelink::client
