#include <gtest/gtest.h>
#include "common/byte_channel.hpp"
#include "common/cobalt_utils.hpp"
#include "common/one_shot.hpp"
#include "test_support.hpp"

#include <stdexcept>

using namespace bridgelink;
using namespace bridgelink::test;

// ============================================================================
// OneShot
// ============================================================================

TEST(OneShotTest, ResolvesOnceForAllWaiters) {
    asio::io_context io;
    OneShot<int> signal(io.get_executor());

    auto waiters = [&]() -> cobalt::task<int> {
        auto delayed = [&]() -> cobalt::task<void> {
            co_await cobalt_utils::sleep_for(20ms);
            EXPECT_TRUE(signal.resolve(7));
            EXPECT_FALSE(signal.resolve(8));
        };
        auto [a, b, _] = co_await cobalt::join(signal.wait(), signal.wait(), delayed());
        co_return a + b;
    };

    EXPECT_EQ(run_task(io, waiters()), 14);
    EXPECT_TRUE(signal.resolved());
    ASSERT_NE(signal.peek(), nullptr);
    EXPECT_EQ(*signal.peek(), 7);
}

TEST(OneShotTest, WaitAfterSettlementReturnsImmediately) {
    asio::io_context io;
    OneShot<std::string> signal(io.get_executor());
    signal.resolve("ready");

    EXPECT_EQ(run_task(io, signal.wait()), "ready");
}

TEST(OneShotTest, RejectionIsRethrownToEveryWaiter) {
    asio::io_context io;
    OneShot<int> signal(io.get_executor());
    EXPECT_TRUE(signal.reject(std::make_exception_ptr(std::runtime_error("boom"))));
    EXPECT_FALSE(signal.resolve(1));

    EXPECT_THROW(run_task(io, signal.wait()), std::runtime_error);
    EXPECT_THROW(run_task(io, signal.wait()), std::runtime_error);
    EXPECT_TRUE(signal.rejected());
    EXPECT_EQ(signal.peek(), nullptr);
}

// ============================================================================
// ByteChannel
// ============================================================================

TEST(ByteChannelTest, DeliversChunksInOrderThenEnds) {
    asio::io_context io;
    ByteChannel channel(io.get_executor());
    channel.push(to_bytes("one"));
    channel.push(to_bytes("two"));
    channel.end();
    channel.push(to_bytes("ignored"));

    auto drain = [&]() -> cobalt::task<std::string> {
        std::string out;
        while (auto chunk = co_await channel.read()) {
            out += to_string(*chunk) + ";";
        }
        co_return out;
    };

    EXPECT_EQ(run_task(io, drain()), "one;two;");
    EXPECT_FALSE(channel.is_open());
}

TEST(ByteChannelTest, ReaderWakesOnPush) {
    asio::io_context io;
    ByteChannel channel(io.get_executor());

    auto scenario = [&]() -> cobalt::task<std::string> {
        auto writer = [&]() -> cobalt::task<void> {
            co_await cobalt_utils::sleep_for(10ms);
            channel.push(to_bytes("late"));
        };
        auto [chunk, _] = co_await cobalt::join(channel.read(), writer());
        co_return chunk ? to_string(*chunk) : std::string("<end>");
    };

    EXPECT_EQ(run_task(io, scenario()), "late");
}

TEST(ByteChannelTest, FailureDiscardsQueuedChunks) {
    asio::io_context io;
    ByteChannel channel(io.get_executor());
    channel.push(to_bytes("lost"));
    channel.fail(std::make_exception_ptr(std::runtime_error("reset")));

    EXPECT_TRUE(channel.failed());
    EXPECT_EQ(channel.buffered_chunks(), 0u);
    EXPECT_THROW(run_task(io, channel.read()), std::runtime_error);
}

// ============================================================================
// cobalt_utils
// ============================================================================

TEST(CobaltUtilsTest, WithTimeoutReturnsValueWhenTaskWins) {
    asio::io_context io;
    auto quick = []() -> cobalt::task<int> { co_return 42; };

    auto result = run_task(io, cobalt_utils::with_timeout(quick(), 1000ms));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
}

TEST(CobaltUtilsTest, WithTimeoutReportsTimeout) {
    asio::io_context io;
    auto slow = []() -> cobalt::task<int> {
        co_await cobalt_utils::sleep_for(500ms);
        co_return 1;
    };

    auto result = run_task(io, cobalt_utils::with_timeout(slow(), 20ms));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), std::make_error_code(std::errc::timed_out));
}
