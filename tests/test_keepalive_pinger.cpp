#include <gtest/gtest.h>
#include "client/keepalive_pinger.hpp"
#include "common/cobalt_utils.hpp"
#include "test_support.hpp"

using namespace bridgelink;
using namespace bridgelink::client;
using namespace bridgelink::test;

class KeepalivePingerTest : public ::testing::Test {
protected:
    std::shared_ptr<KeepalivePinger> make_pinger(std::chrono::milliseconds interval) {
        return std::make_shared<KeepalivePinger>(io.get_executor(), interval,
            [this]() -> cobalt::task<bool> {
                ++pings;
                co_return ping_result;
            });
    }

    asio::io_context io;
    int pings = 0;
    bool ping_result = true;
};

TEST_F(KeepalivePingerTest, PingsOncePerInterval) {
    auto pinger = make_pinger(20ms);

    auto scenario = [&]() -> cobalt::task<void> {
        pinger->start();
        EXPECT_TRUE(pinger->active());
        co_await cobalt_utils::sleep_for(110ms);
        pinger->stop();
    };
    run_task(io, scenario());

    EXPECT_GE(pings, 3);
    EXPECT_LE(pings, 6);
    EXPECT_EQ(pinger->pings_sent(), static_cast<uint64_t>(pings));
    EXPECT_EQ(pinger->pings_failed(), 0u);
    EXPECT_FALSE(pinger->active());
}

TEST_F(KeepalivePingerTest, FirstPingWaitsOneInterval) {
    auto pinger = make_pinger(200ms);

    auto scenario = [&]() -> cobalt::task<void> {
        pinger->start();
        co_await cobalt_utils::sleep_for(50ms);
        pinger->stop();
    };
    run_task(io, scenario());

    EXPECT_EQ(pings, 0);
}

TEST_F(KeepalivePingerTest, StopHaltsPinging) {
    auto pinger = make_pinger(20ms);

    int pings_at_stop = 0;
    auto scenario = [&]() -> cobalt::task<void> {
        pinger->start();
        co_await cobalt_utils::sleep_for(50ms);
        pinger->stop();
        pings_at_stop = pings;
        co_await cobalt_utils::sleep_for(80ms);
    };
    run_task(io, scenario());

    EXPECT_GE(pings_at_stop, 1);
    EXPECT_EQ(pings, pings_at_stop);
}

TEST_F(KeepalivePingerTest, FailedPingsAreCountedAndPingingGoesOn) {
    ping_result = false;
    auto pinger = make_pinger(20ms);

    auto scenario = [&]() -> cobalt::task<void> {
        pinger->start();
        co_await cobalt_utils::sleep_for(90ms);
        EXPECT_TRUE(pinger->active());
        pinger->stop();
    };
    run_task(io, scenario());

    EXPECT_GE(pinger->pings_sent(), 2u);
    EXPECT_EQ(pinger->pings_failed(), pinger->pings_sent());
}

TEST_F(KeepalivePingerTest, RestartRunsASingleLoop) {
    auto pinger = make_pinger(20ms);

    auto scenario = [&]() -> cobalt::task<void> {
        pinger->start();
        co_await cobalt_utils::sleep_for(10ms);
        pinger->stop();
        pinger->start();
        pinger->start();
        co_await cobalt_utils::sleep_for(110ms);
        pinger->stop();
    };
    run_task(io, scenario());

    // Two loops would ping about twice as often
    EXPECT_GE(pings, 3);
    EXPECT_LE(pings, 6);
}
