// ============================================================================
// ALGOSTREAM - Connection Unit Tests
// ============================================================================

#include "mocks/session_harness.hpp"

#include <gtest/gtest.h>

#include <future>
#include <thread>

using namespace algostream;
using namespace algostream::testing;
using namespace std::chrono_literals;

// ============================================================================
// Endpoint Parsing
// ============================================================================

TEST(WebSocketEndpointTest, PlainWithPort) {
    auto endpoint = network::WebSocketEndpoint::parse("ws://127.0.0.1:8765");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->host, "127.0.0.1");
    EXPECT_EQ(endpoint->port, "8765");
    EXPECT_EQ(endpoint->target, "/");
    EXPECT_FALSE(endpoint->tls);
}

TEST(WebSocketEndpointTest, SecureDefaultsPortAndKeepsTarget) {
    auto endpoint = network::WebSocketEndpoint::parse("wss://feed.example.com/ws/v1");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->host, "feed.example.com");
    EXPECT_EQ(endpoint->port, "443");
    EXPECT_EQ(endpoint->target, "/ws/v1");
    EXPECT_TRUE(endpoint->tls);
    EXPECT_EQ(endpoint->to_string(), "wss://feed.example.com:443/ws/v1");
}

TEST(WebSocketEndpointTest, Rejects) {
    EXPECT_FALSE(network::WebSocketEndpoint::parse("http://example.com").has_value());
    EXPECT_FALSE(network::WebSocketEndpoint::parse("example.com:80").has_value());
    EXPECT_FALSE(network::WebSocketEndpoint::parse("ws://:80").has_value());
    EXPECT_FALSE(network::WebSocketEndpoint::parse("ws://host:abc").has_value());
}

// ============================================================================
// Connect & Authenticate
// ============================================================================

TEST(ConnectionTest, ConnectAuthenticates) {
    SessionHarness h;
    EXPECT_EQ(h.connection().state(), ConnectionState::Disconnected);

    Status status = h.connection().connect();

    EXPECT_TRUE(status.ok()) << status.message();
    EXPECT_EQ(status.message(), "Connected and authenticated");
    EXPECT_EQ(h.connection().state(), ConnectionState::Open);
    EXPECT_TRUE(h.connection().is_authenticated());

    auto sent = h.transport->sent();
    ASSERT_FALSE(sent.empty());
    EXPECT_EQ(sent.front(), R"({"action":"authenticate","api_key":"test-api-key"})");
}

TEST(ConnectionTest, SecondConnectIsAlreadyConnected) {
    SessionHarness h;
    ASSERT_TRUE(h.connection().connect().ok());

    Status again = h.connection().connect();
    EXPECT_TRUE(again.ok());
    EXPECT_EQ(again.message(), "Already connected");
    EXPECT_EQ(h.transport->connect_calls(), 1);
}

TEST(ConnectionTest, MissingApiKey) {
    auto config = fast_config();
    config.api_key.clear();
    SessionHarness h(config);

    Status status = h.connection().connect();
    EXPECT_EQ(status.code(), ErrorCode::MissingCredentials);
    EXPECT_EQ(h.connection().state(), ConnectionState::Disconnected);
    EXPECT_EQ(h.transport->connect_calls(), 0);
}

TEST(ConnectionTest, InvalidUrl) {
    SessionHarness h;
    Status status = h.connection().connect(std::string("http://localhost:8765"));
    EXPECT_EQ(status.code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(h.connection().state(), ConnectionState::Disconnected);
}

TEST(ConnectionTest, UrlOverrideIsUsed) {
    SessionHarness h;
    ASSERT_TRUE(h.connection().connect(std::string("wss://stream.example.com/ws")).ok());

    auto endpoint = h.transport->last_endpoint();
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->host, "stream.example.com");
    EXPECT_TRUE(endpoint->tls);
    EXPECT_EQ(h.connection().url(), "wss://stream.example.com/ws");
}

TEST(ConnectionTest, TransportFailure) {
    SessionHarness h;
    h.transport->set_connect_behavior(MockWebSocketClient::ConnectBehavior::Fail, "Connect failed: refused");

    Status status = h.connection().connect();
    EXPECT_EQ(status.code(), ErrorCode::ConnectFailed);
    EXPECT_NE(status.message().find("refused"), std::string::npos);
    EXPECT_EQ(h.connection().state(), ConnectionState::Disconnected);
}

TEST(ConnectionTest, OpenTimeout) {
    SessionHarness h;
    h.transport->set_connect_behavior(MockWebSocketClient::ConnectBehavior::Manual);

    Status status = h.connection().connect();
    EXPECT_EQ(status.code(), ErrorCode::ConnectFailed);
    EXPECT_EQ(h.connection().state(), ConnectionState::Disconnected);
}

TEST(ConnectionTest, ConcurrentConnectIsRejected) {
    auto config = fast_config();
    config.connect_timeout = std::chrono::milliseconds(5000);
    SessionHarness h(config);
    h.transport->set_connect_behavior(MockWebSocketClient::ConnectBehavior::Manual);

    auto first = std::async(std::launch::async, [&]() { return h.connection().connect(); });
    ASSERT_TRUE(wait_until([&]() { return h.transport->connect_calls() == 1; }));

    Status second = h.connection().connect();
    EXPECT_EQ(second.code(), ErrorCode::ConnectInProgress);

    h.transport->complete_connect();
    Status result = first.get();
    EXPECT_TRUE(result.ok()) << result.message();
    EXPECT_EQ(h.transport->connect_calls(), 1);
}

TEST(ConnectionTest, AuthTimeoutLeavesSocketOpenButUnauthenticated) {
    SessionHarness h;
    h.server.auth = ServerStub::Reply::Silent;

    Status status = h.connection().connect();
    EXPECT_EQ(status.code(), ErrorCode::AuthenticationTimeout);
    EXPECT_EQ(h.connection().state(), ConnectionState::Open);
    EXPECT_FALSE(h.connection().is_authenticated());
}

TEST(ConnectionTest, AuthRejected) {
    SessionHarness h;
    h.server.auth = ServerStub::Reply::Reject;

    Status status = h.connection().connect();
    EXPECT_EQ(status.code(), ErrorCode::AuthenticationRejected);
    EXPECT_NE(status.message().find("Invalid API key"), std::string::npos);
    EXPECT_FALSE(h.connection().is_authenticated());
}

TEST(ConnectionTest, ReauthenticateAfterRejection) {
    SessionHarness h;
    h.server.auth = ServerStub::Reply::Reject;
    ASSERT_FALSE(h.connection().connect().ok());

    h.server.auth = ServerStub::Reply::Accept;
    Status status = h.connection().authenticate();
    EXPECT_TRUE(status.ok()) << status.message();
    EXPECT_TRUE(h.connection().is_authenticated());
}

TEST(ConnectionTest, AssumedModeTreatsSilenceAsSuccess) {
    auto config = fast_config();
    config.auth_mode = AuthMode::Assumed;
    SessionHarness h(config);
    h.server.auth = ServerStub::Reply::Silent;

    Status status = h.connection().connect();
    EXPECT_TRUE(status.ok()) << status.message();
    EXPECT_TRUE(h.connection().is_authenticated());
    EXPECT_EQ(h.connection().auth_mode(), AuthMode::Assumed);
}

TEST(ConnectionTest, AssumedModeLateRejectionClearsFlag) {
    auto config = fast_config();
    config.auth_mode = AuthMode::Assumed;
    SessionHarness h(config);
    h.server.auth = ServerStub::Reply::Silent;
    ASSERT_TRUE(h.connection().connect().ok());

    h.transport->deliver(R"({"type":"authentication","status":"error","message":"Invalid API key"})");
    EXPECT_FALSE(h.connection().is_authenticated());
    EXPECT_EQ(h.connection().state(), ConnectionState::Open);
}

// ============================================================================
// Send & Close
// ============================================================================

TEST(ConnectionTest, SendRequiresOpen) {
    SessionHarness h;
    Status status = h.connection().send("hello");
    EXPECT_EQ(status.code(), ErrorCode::NotConnected);
}

TEST(ConnectionTest, ServerCloseMovesToDisconnected) {
    SessionHarness h;
    ASSERT_TRUE(h.connection().connect().ok());

    h.transport->server_close();
    EXPECT_EQ(h.connection().state(), ConnectionState::Disconnected);
    EXPECT_FALSE(h.connection().is_authenticated());
    EXPECT_EQ(h.connection().state_name(), "Disconnected");
}

TEST(ConnectionTest, CloseKeepsSubscriptionsAndCache) {
    SessionHarness h;
    ASSERT_EQ(h.session->subscribe("RELIANCE", "NSE", 1), "Subscribed: RELIANCE (NSE) - Mode 1");
    h.transport->deliver(market_data_message("RELIANCE", "NSE", 1, 2500.5));

    h.connection().close();

    EXPECT_EQ(h.connection().state(), ConnectionState::Disconnected);
    EXPECT_EQ(h.transport->disconnect_calls(), 1);
    EXPECT_EQ(h.session->list_active_subscriptions(), std::vector<std::string>{"RELIANCE|NSE|1"});
    EXPECT_NE(h.cache().get({"RELIANCE", "NSE", DataMode::LTP}), nullptr);
}

TEST(ConnectionTest, ConnectDuringCloseKeepsReopenedSocket) {
    SessionHarness h;
    ASSERT_TRUE(h.connection().connect().ok());

    // A poller reconnects between the close event and the end of close()
    Status racing;
    h.transport->set_after_close([&]() {
        std::thread poller([&]() { racing = h.connection().connect(); });
        poller.join();
    });

    h.connection().close();

    EXPECT_TRUE(racing.ok()) << racing.message();
    EXPECT_EQ(h.connection().state(), ConnectionState::Open);
    EXPECT_TRUE(h.connection().is_authenticated());
    EXPECT_TRUE(h.transport->is_open());

    EXPECT_EQ(h.connection().connect().message(), "Already connected");
    EXPECT_EQ(h.transport->connect_calls(), 2);
}

TEST(ConnectionTest, ReconnectResubscribesActiveKeys) {
    SessionHarness h;
    ASSERT_TRUE(h.session->subscribe("RELIANCE", "NSE", 1).rfind("Subscribed", 0) == 0);
    ASSERT_TRUE(h.session->subscribe("INFY", "NSE", 3).rfind("Subscribed", 0) == 0);

    h.transport->server_close();
    h.transport->clear_sent();

    EXPECT_EQ(h.session->connect(), "Connected and authenticated");
    EXPECT_EQ(h.transport->count_sent(R"("action":"subscribe")"), 2u);
    EXPECT_EQ(h.transport->count_sent(R"("depth_level":5)"), 1u);
    EXPECT_EQ(h.registry().active_count(), 2u);
}

TEST(ConnectionTest, ResubscribeCanBeDisabled) {
    auto config = fast_config();
    config.resubscribe_on_reconnect = false;
    SessionHarness h(config);
    ASSERT_TRUE(h.session->subscribe("RELIANCE", "NSE", 1).rfind("Subscribed", 0) == 0);

    h.transport->server_close();
    h.transport->clear_sent();

    ASSERT_TRUE(h.connection().connect().ok());
    EXPECT_EQ(h.transport->count_sent(R"("action":"subscribe")"), 0u);
}
