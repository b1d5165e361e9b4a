#include <gtest/gtest.h>
#include "client/errors.hpp"
#include "client/session_connector.hpp"
#include "test_support.hpp"

using namespace bridgelink;
using namespace bridgelink::client;
using namespace bridgelink::test;

namespace {

RelayEndpoint test_endpoint() {
    return resolve_relay_endpoint("127.0.0.1:25037");
}

} // namespace

class SessionConnectorTest : public ::testing::Test {
protected:
    asio::io_context io;
    FakeStreamFactory factory;
};

TEST_F(SessionConnectorTest, ConnectsWhenReadyBeforeTimeout) {
    factory.on_create = [](FakeStream& s) { s.open_after(40ms); };
    SessionConnector connector(test_endpoint(), 200ms, factory.make());

    auto session = run_task(io, connector.connect());
    ASSERT_TRUE(session.has_value());
    EXPECT_TRUE(session->valid());
    EXPECT_EQ(session->info().protocol, "adb");

    ASSERT_EQ(factory.streams.size(), 1u);
    EXPECT_EQ(factory.streams[0]->url(), "ws://127.0.0.1:25037/bridge");
}

TEST_F(SessionConnectorTest, TimesOutWhenReadyComesLate) {
    factory.on_create = [](FakeStream& s) { s.open_after(300ms); };
    SessionConnector connector(test_endpoint(), 100ms, factory.make());

    auto session = run_task(io, connector.connect());
    ASSERT_FALSE(session.has_value());
    EXPECT_EQ(session.error().kind, TransportErrorKind::TIMEOUT);
    EXPECT_EQ(session.error().message, "WebSocket connection timed out");

    // Abandoned stream is asked to close once it opens
    ASSERT_EQ(factory.streams.size(), 1u);
    EXPECT_TRUE(factory.streams[0]->close_requested());
}

TEST_F(SessionConnectorTest, ReadyJustInsideAndOutsideTheWindow) {
    factory.on_create = [](FakeStream& s) { s.open_after(150ms); };
    SessionConnector tight(test_endpoint(), 100ms, factory.make());
    SessionConnector loose(test_endpoint(), 250ms, factory.make());

    auto late = run_task(io, tight.connect());
    EXPECT_FALSE(late.has_value());

    auto in_time = run_task(io, loose.connect());
    EXPECT_TRUE(in_time.has_value());
}

TEST_F(SessionConnectorTest, ConnectionErrorBeforeReady) {
    factory.on_create = [](FakeStream& s) { s.error("connection refused"); };
    SessionConnector connector(test_endpoint(), 200ms, factory.make());

    auto session = run_task(io, connector.connect());
    ASSERT_FALSE(session.has_value());
    EXPECT_EQ(session.error().kind, TransportErrorKind::CONNECTION_ERROR);
    EXPECT_EQ(session.error().message, "connection refused");
    EXPECT_STREQ(transport_error_kind_name(session.error().kind), "CONNECTION_ERROR");
}

TEST_F(SessionConnectorTest, HandleReadsInboundAndQueuesWritesInOrder) {
    factory.on_create = [](FakeStream& s) { s.open(); };
    SessionConnector connector(test_endpoint(), 200ms, factory.make());

    auto scenario = [&]() -> cobalt::task<std::string> {
        auto session = co_await connector.connect();
        EXPECT_TRUE(session.has_value());
        auto& stream = *factory.streams.at(0);

        session->write(to_bytes("a"));
        session->write(to_bytes("b"));
        stream.receive("hello");

        auto first = co_await stream.sent().read();
        auto second = co_await stream.sent().read();
        auto inbound = co_await session->read();

        co_return to_string(*first) + to_string(*second) + ":" + to_string(*inbound);
    };

    EXPECT_EQ(run_task(io, scenario()), "ab:hello");
}

TEST_F(SessionConnectorTest, ErrorAfterReadyFailsInboundAndStillCloses) {
    factory.on_create = [](FakeStream& s) { s.open(); };
    SessionConnector connector(test_endpoint(), 200ms, factory.make());

    auto scenario = [&]() -> cobalt::task<bool> {
        auto session = co_await connector.connect();
        auto& stream = *factory.streams.at(0);
        stream.error("connection reset");
        stream.finish({kAbnormalClosure, ""});

        bool failed = false;
        try {
            co_await session->read();
        } catch (const TransportFailure& e) {
            failed = e.error().kind == TransportErrorKind::CONNECTION_ERROR;
        }
        co_await session->closed();
        co_return failed;
    };

    EXPECT_TRUE(run_task(io, scenario()));
    auto* info = factory.streams[0]->closed().peek();
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->code, kAbnormalClosure);
}

TEST_F(SessionConnectorTest, CloseIsForwardedOnlyOnce) {
    factory.on_create = [](FakeStream& s) { s.open(); };
    SessionConnector connector(test_endpoint(), 200ms, factory.make());

    auto session = run_task(io, connector.connect());
    ASSERT_TRUE(session.has_value());
    auto& stream = *factory.streams.at(0);

    session->close(4000, "done");
    session->close(4001, "again");
    EXPECT_TRUE(stream.close_requested());
    EXPECT_THROW(session->write(to_bytes("x")), TransportFailure);
}

TEST_F(SessionConnectorTest, DestroyingHandleClosesStream) {
    factory.on_create = [](FakeStream& s) { s.open(); };
    SessionConnector connector(test_endpoint(), 200ms, factory.make());

    {
        auto session = run_task(io, connector.connect());
        ASSERT_TRUE(session.has_value());
        SessionHandle moved = std::move(*session);
        EXPECT_FALSE(factory.streams.at(0)->close_requested());
    }
    EXPECT_TRUE(factory.streams.at(0)->close_requested());
}

TEST_F(SessionConnectorTest, ReverseTunnelsAreNotImplemented) {
    SessionConnector connector(test_endpoint(), 200ms, factory.make());

    EXPECT_THROW(run_task(io, connector.add_reverse_tunnel("tcp:8080")), NotImplementedError);
    EXPECT_THROW(connector.remove_reverse_tunnel("tcp:8080"), NotImplementedError);
    EXPECT_THROW(connector.clear_reverse_tunnels(), NotImplementedError);
}
