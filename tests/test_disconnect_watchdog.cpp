#include <gtest/gtest.h>
#include "client/disconnect_watchdog.hpp"
#include "test_support.hpp"

#include <stdexcept>

using namespace bridgelink;
using namespace bridgelink::client;
using namespace bridgelink::test;

namespace {

// transport_disconnected() completes after a fixed delay; spawn_and_wait()
// after another one
class TimedSession : public DeviceSession {
public:
    TimedSession(std::string serial,
                 std::chrono::milliseconds disconnect_after,
                 std::chrono::milliseconds command_runs_for = 0ms)
        : serial_(std::move(serial))
        , disconnect_after_(disconnect_after)
        , command_runs_for_(command_runs_for) {}

    const std::string& serial() const override { return serial_; }

    cobalt::task<void> transport_disconnected() override {
        ++disconnect_waits;
        co_await cobalt_utils::sleep_for(disconnect_after_);
        if (fail_disconnect) {
            throw std::runtime_error("unknown host service");
        }
    }

    cobalt::task<std::string> spawn_wait_text(std::string) override {
        co_return std::string{};
    }

    cobalt::task<void> spawn_and_wait(std::string command) override {
        commands.push_back(command);
        co_await cobalt_utils::sleep_for(command_runs_for_);
    }

    void close() override {}

    int disconnect_waits = 0;
    bool fail_disconnect = false;
    std::vector<std::string> commands;

private:
    std::string serial_;
    std::chrono::milliseconds disconnect_after_;
    std::chrono::milliseconds command_runs_for_;
};

} // namespace

TEST(DisconnectWatchdogTest, SuspicionWindowBoundary) {
    DisconnectWatchdog watchdog(1000ms);
    EXPECT_TRUE(watchdog.is_suspicious(300ms));
    EXPECT_TRUE(watchdog.is_suspicious(999ms));
    EXPECT_FALSE(watchdog.is_suspicious(1000ms));
    EXPECT_FALSE(watchdog.is_suspicious(1500ms));
}

TEST(DisconnectWatchdogTest, EarlyDisconnectIsConfirmedWithBlockingCommand) {
    asio::io_context io;
    DisconnectWatchdog watchdog(200ms);
    auto session = std::make_shared<TimedSession>("A", 60ms, 50ms);

    run_task(io, watchdog.await_disconnect(session));

    EXPECT_EQ(session->disconnect_waits, 1);
    EXPECT_EQ(session->commands, std::vector<std::string>{"read"});
    EXPECT_EQ(watchdog.pending(), 0u);
}

TEST(DisconnectWatchdogTest, LateDisconnectIsTrusted) {
    asio::io_context io;
    DisconnectWatchdog watchdog(100ms);
    auto session = std::make_shared<TimedSession>("A", 250ms);

    run_task(io, watchdog.await_disconnect(session));

    EXPECT_TRUE(session->commands.empty());
    EXPECT_EQ(watchdog.pending(), 0u);
}

TEST(DisconnectWatchdogTest, FailedDisconnectWaitCountsAsEarlySignal) {
    asio::io_context io;
    DisconnectWatchdog watchdog(200ms);
    auto session = std::make_shared<TimedSession>("A", 0ms);
    session->fail_disconnect = true;

    EXPECT_NO_THROW(run_task(io, watchdog.await_disconnect(session)));
    EXPECT_EQ(session->commands, std::vector<std::string>{"read"});
}

TEST(DisconnectWatchdogTest, ConcurrentWaitsShareOneProbe) {
    asio::io_context io;
    DisconnectWatchdog watchdog(200ms);
    auto session = std::make_shared<TimedSession>("A", 40ms, 150ms);
    auto same_device = std::make_shared<TimedSession>("A", 40ms, 150ms);

    auto scenario = [&]() -> cobalt::task<void> {
        auto observe = [&]() -> cobalt::task<void> {
            co_await cobalt_utils::sleep_for(10ms);
            EXPECT_EQ(watchdog.pending(), 1u);
            EXPECT_EQ(watchdog.phase("A"), DisconnectPhase::AWAITING_TRANSPORT);
            co_await cobalt_utils::sleep_for(80ms);
            EXPECT_EQ(watchdog.phase("A"), DisconnectPhase::CONFIRMING);
        };
        co_await cobalt::join(watchdog.await_disconnect(session),
                              watchdog.await_disconnect(same_device),
                              observe());
    };
    run_task(io, scenario());

    EXPECT_EQ(session->disconnect_waits + same_device->disconnect_waits, 1);
    EXPECT_EQ(session->commands.size() + same_device->commands.size(), 1u);
    EXPECT_EQ(watchdog.pending(), 0u);
    EXPECT_FALSE(watchdog.phase("A").has_value());
}

TEST(DisconnectWatchdogTest, DifferentSerialsAreIndependent) {
    asio::io_context io;
    DisconnectWatchdog watchdog(100ms);
    auto a = std::make_shared<TimedSession>("A", 150ms);
    auto b = std::make_shared<TimedSession>("B", 150ms);

    auto scenario = [&]() -> cobalt::task<void> {
        co_await cobalt::join(watchdog.await_disconnect(a), watchdog.await_disconnect(b));
    };
    run_task(io, scenario());

    EXPECT_EQ(a->disconnect_waits, 1);
    EXPECT_EQ(b->disconnect_waits, 1);
}

TEST(DisconnectWatchdogTest, PhaseNames) {
    EXPECT_STREQ(disconnect_phase_name(DisconnectPhase::CONFIRMING), "CONFIRMING");
}
