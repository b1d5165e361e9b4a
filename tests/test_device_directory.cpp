#include <gtest/gtest.h>
#include "client/device_directory.hpp"
#include "test_support.hpp"

#include <deque>
#include <stdexcept>
#include <variant>

using namespace bridgelink;
using namespace bridgelink::client;
using namespace bridgelink::test;

namespace {

DeviceRecord record(std::string serial, DeviceState state = DeviceState::DEVICE) {
    DeviceRecord r;
    r.serial = std::move(serial);
    r.state = state;
    return r;
}

// Answers get_devices() from a script shared by every client instance
struct DeviceScript {
    std::deque<std::variant<DeviceSnapshot, std::string>> results;
    int calls = 0;
};

class ScriptedBridgeClient : public BridgeClient {
public:
    explicit ScriptedBridgeClient(std::shared_ptr<DeviceScript> script) : script_(std::move(script)) {}

    cobalt::task<DeviceSnapshot> get_devices() override {
        ++script_->calls;
        if (script_->results.empty()) {
            co_return DeviceSnapshot{};
        }
        auto next = std::move(script_->results.front());
        script_->results.pop_front();
        if (auto* error = std::get_if<std::string>(&next)) {
            throw std::runtime_error(*error);
        }
        co_return std::get<DeviceSnapshot>(std::move(next));
    }

    cobalt::task<std::shared_ptr<DeviceSession>> create_device_session(DeviceRecord) override {
        throw std::logic_error("not used");
        co_return nullptr;
    }

private:
    std::shared_ptr<DeviceScript> script_;
};

} // namespace

class DeviceDirectoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.poll_interval = 20ms;
        config.probe_interval = 20ms;
        script = std::make_shared<DeviceScript>();

        directory = std::make_shared<DeviceDirectory>(
            io.get_executor(), config,
            [this]() -> cobalt::task<bool> {
                ++probes;
                co_return bridge_alive;
            },
            [this]() -> std::shared_ptr<BridgeClient> {
                return std::make_shared<ScriptedBridgeClient>(script);
            });

        DirectoryCallbacks callbacks;
        callbacks.on_devices_changed = [this](const DeviceSnapshot& d) { changes.push_back(d); };
        callbacks.on_bridge_changed = [this](bool up) { bridge_events.push_back(up); };
        callbacks.on_error = [this](const std::string& m) { errors.push_back(m); };
        directory->set_callbacks(std::move(callbacks));
    }

    asio::io_context io;
    ClientConfig config;
    std::shared_ptr<DeviceScript> script;
    std::shared_ptr<DeviceDirectory> directory;

    bool bridge_alive = true;
    int probes = 0;
    std::vector<DeviceSnapshot> changes;
    std::vector<bool> bridge_events;
    std::vector<std::string> errors;
};

TEST_F(DeviceDirectoryTest, ProbeCreatesClientWhenBridgeAlive) {
    EXPECT_TRUE(run_task(io, directory->check_for_bridge()));
    EXPECT_TRUE(directory->checked_for_bridge());
    EXPECT_NE(directory->bridge_client(), nullptr);
    EXPECT_EQ(bridge_events, std::vector<bool>{true});
}

TEST_F(DeviceDirectoryTest, ProbeLeavesClientUnsetWhenBridgeDead) {
    bridge_alive = false;
    EXPECT_FALSE(run_task(io, directory->check_for_bridge()));
    EXPECT_TRUE(directory->checked_for_bridge());
    EXPECT_EQ(directory->bridge_client(), nullptr);
    EXPECT_TRUE(bridge_events.empty());
}

TEST_F(DeviceDirectoryTest, EmitsOnlyWhenFilteredListChanges) {
    script->results.push_back(DeviceSnapshot{record("A"), record("B", DeviceState::AUTHORIZING)});
    script->results.push_back(DeviceSnapshot{record("A"), record("B", DeviceState::UNAUTHORIZED)});
    script->results.push_back(DeviceSnapshot{record("A"), record("B")});

    run_task(io, directory->poll_once());
    run_task(io, directory->poll_once());
    run_task(io, directory->poll_once());

    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].size(), 1u);
    EXPECT_EQ(changes[1].size(), 2u);
    EXPECT_EQ(directory->devices().size(), 2u);
}

TEST_F(DeviceDirectoryTest, ReorderedListIsReportedAsChange) {
    script->results.push_back(DeviceSnapshot{record("A"), record("B")});
    script->results.push_back(DeviceSnapshot{record("B"), record("A")});

    run_task(io, directory->poll_once());
    run_task(io, directory->poll_once());

    EXPECT_EQ(changes.size(), 2u);
}

TEST_F(DeviceDirectoryTest, FailureResetsRelayState) {
    run_task(io, directory->check_for_bridge());
    script->results.push_back(DeviceSnapshot{record("A")});
    script->results.push_back(std::string("relay went away"));

    run_task(io, directory->poll_once());
    ASSERT_EQ(directory->devices().size(), 1u);

    run_task(io, directory->poll_once());
    EXPECT_TRUE(directory->devices().empty());
    EXPECT_EQ(directory->bridge_client(), nullptr);
    EXPECT_FALSE(directory->checked_for_bridge());
    EXPECT_EQ(directory->bridge_error(), "relay went away");

    // The only change event on failure is the list becoming empty
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_TRUE(changes[1].empty());
    EXPECT_EQ(bridge_events, (std::vector<bool>{true, false}));
    EXPECT_EQ(errors, std::vector<std::string>{"relay went away"});
}

TEST_F(DeviceDirectoryTest, FailureWithNoDevicesEmitsNoChange) {
    script->results.push_back(std::string("refused"));
    run_task(io, directory->poll_once());

    EXPECT_TRUE(changes.empty());
    EXPECT_EQ(errors.size(), 1u);
}

TEST_F(DeviceDirectoryTest, SuccessfulPollClearsError) {
    script->results.push_back(std::string("refused"));
    script->results.push_back(DeviceSnapshot{});

    run_task(io, directory->poll_once());
    EXPECT_TRUE(directory->bridge_error().has_value());

    run_task(io, directory->poll_once());
    EXPECT_FALSE(directory->bridge_error().has_value());
}

TEST_F(DeviceDirectoryTest, ScanningReprobesAfterFailure) {
    script->results.push_back(DeviceSnapshot{record("A")});
    script->results.push_back(std::string("relay went away"));

    directory->start();
    EXPECT_TRUE(directory->scanning());

    auto wait = [&]() -> cobalt::task<void> {
        // probe, poll, poll (fails), probe again
        for (int i = 0; i < 50 && probes < 2; ++i) {
            co_await cobalt_utils::sleep_for(10ms);
        }
        directory->stop();
    };
    run_task(io, wait());

    EXPECT_GE(probes, 2);
    EXPECT_GE(script->calls, 2);
    EXPECT_EQ(errors.size(), 1u);
    EXPECT_FALSE(directory->scanning());
}

TEST_F(DeviceDirectoryTest, StopHaltsPolling) {
    directory->start();

    auto scenario = [&]() -> cobalt::task<int> {
        co_await cobalt_utils::sleep_for(50ms);
        directory->stop();
        int calls = script->calls;
        co_await cobalt_utils::sleep_for(80ms);
        co_return script->calls - calls;
    };

    EXPECT_EQ(run_task(io, scenario()), 0);
    EXPECT_GE(script->calls, 1);
}
