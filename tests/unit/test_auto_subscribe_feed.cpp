// ============================================================================
// ALGOSTREAM - Auto-Subscribe Feed Unit Tests
// ============================================================================

#include "mocks/session_harness.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace algostream;
using namespace algostream::testing;
using namespace algostream::stream;
using namespace std::chrono_literals;

namespace {

const SubscriptionKey kReliance{"RELIANCE", "NSE", DataMode::LTP};

std::string text_of(const CellValue& cell) {
    const auto* text = std::get_if<std::string>(&cell);
    return text ? *text : std::string("<number>");
}

double number_of(const CellValue& cell) {
    const auto* number = std::get_if<double>(&cell);
    return number ? *number : -1.0;
}

const std::string kInfyDepth =
    R"({"type":"market_data","mode":3,"topic":"INFY.NSE","data":{"symbol":"INFY","exchange":"NSE","ltp":1500.25,)"
    R"("depth":{"buy":[{"price":1500.0,"quantity":120,"orders":4},{"price":1499.5,"quantity":80,"orders":2}],)"
    R"("sell":[{"price":1500.5,"quantity":60,"orders":3}]}}})";

}  // namespace

// ============================================================================
// Read Sentinels
// ============================================================================

TEST(AutoSubscribeFeedTest, SubscribingThenWaitingThenData) {
    SessionHarness h;

    ReadResult first = h.feed().read(kReliance);
    EXPECT_EQ(first.status, ReadStatus::Subscribing);
    EXPECT_EQ(first.to_display_string(), "Subscribing...");
    EXPECT_EQ(h.transport->connect_calls(), 1);

    ReadResult second = h.feed().read(kReliance);
    EXPECT_EQ(second.status, ReadStatus::WaitingForData);
    EXPECT_EQ(second.to_display_string(), "Waiting for data...");

    const std::string message = market_data_message("RELIANCE", "NSE", 1, 2500.5);
    h.transport->deliver(message);

    ReadResult third = h.feed().read(kReliance);
    ASSERT_TRUE(third.has_data());
    EXPECT_DOUBLE_EQ(*third.snapshot->ltp, 2500.5);
    EXPECT_EQ(third.to_display_string(), message);
    EXPECT_EQ(h.transport->count_sent(R"("action":"subscribe")"), 1u);
}

TEST(AutoSubscribeFeedTest, RepeatedReadsSendOneSubscribe) {
    SessionHarness h;
    h.server.subscribe = ServerStub::Reply::Silent;

    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(h.feed().read(kReliance).status, ReadStatus::Subscribing);
    }
    EXPECT_EQ(h.transport->count_sent(R"("action":"subscribe")"), 1u);
}

TEST(AutoSubscribeFeedTest, ExpiredPendingIsRetried) {
    auto config = fast_config();
    config.subscribe_timeout = 30ms;
    SessionHarness h(config);
    h.server.subscribe = ServerStub::Reply::Silent;

    EXPECT_EQ(h.feed().read(kReliance).status, ReadStatus::Subscribing);
    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(h.feed().read(kReliance).status, ReadStatus::Subscribing);

    EXPECT_EQ(h.transport->count_sent(R"("action":"subscribe")"), 2u);
}

TEST(AutoSubscribeFeedTest, ManualUnsubscribeSuppressesAutoSubscribe) {
    SessionHarness h;
    ASSERT_TRUE(h.registry().subscribe(kReliance).ok());
    ASSERT_TRUE(h.registry().unsubscribe(kReliance).ok());
    h.transport->clear_sent();

    ReadResult result = h.feed().read(kReliance);
    EXPECT_EQ(result.status, ReadStatus::Unsubscribed);
    EXPECT_EQ(result.to_display_string(), "Unsubscribed");
    EXPECT_EQ(h.transport->count_sent(R"("action":"subscribe")"), 0u);

    // Full reset forgets the marker
    ASSERT_TRUE(h.registry().unsubscribe_all().ok());
    EXPECT_EQ(h.feed().read(kReliance).status, ReadStatus::Subscribing);
    EXPECT_EQ(h.transport->count_sent(R"("action":"subscribe")"), 1u);
}

TEST(AutoSubscribeFeedTest, InvalidKey) {
    SessionHarness h;
    ReadResult result = h.feed().read(SubscriptionKey{"", "NSE", DataMode::LTP});

    EXPECT_EQ(result.status, ReadStatus::Error);
    EXPECT_EQ(result.to_display_string(), "Error: Symbol and Exchange are required");
    EXPECT_EQ(h.transport->connect_calls(), 0);
}

TEST(AutoSubscribeFeedTest, AuthenticationFailureSurfacesAsError) {
    SessionHarness h;
    h.server.auth = ServerStub::Reply::Reject;

    ReadResult first = h.feed().read(kReliance);
    EXPECT_EQ(first.status, ReadStatus::Error);
    EXPECT_EQ(first.to_display_string(), "Error: Authentication failed: Invalid API key");

    // Socket stays open; later reads report the missing authentication
    ReadResult second = h.feed().read(kReliance);
    EXPECT_EQ(second.to_display_string(), "Error: Not authenticated");
    EXPECT_EQ(h.transport->connect_calls(), 1);
}

// ============================================================================
// Typed Readers
// ============================================================================

TEST(AutoSubscribeFeedTest, ReadLtp) {
    SessionHarness h;

    EXPECT_EQ(text_of(h.feed().read_ltp("RELIANCE", "NSE")), "Subscribing...");
    EXPECT_EQ(text_of(h.feed().read_ltp("RELIANCE", "NSE")), "Waiting for data...");

    h.transport->deliver(market_data_message("RELIANCE", "NSE", 1, 2500.5));
    EXPECT_DOUBLE_EQ(number_of(h.feed().read_ltp("RELIANCE", "NSE")), 2500.5);
}

TEST(AutoSubscribeFeedTest, ReadLtpWithoutPrice) {
    SessionHarness h;
    ASSERT_TRUE(h.registry().subscribe(kReliance).ok());
    h.transport->deliver(
        R"({"type":"market_data","mode":1,"data":{"symbol":"RELIANCE","exchange":"NSE"}})");

    EXPECT_EQ(text_of(h.feed().read_ltp("RELIANCE", "NSE")), "N/A");
}

TEST(AutoSubscribeFeedTest, ReadField) {
    SessionHarness h;
    const SubscriptionKey infy{"INFY", "NSE", DataMode::Quote};
    ASSERT_TRUE(h.registry().subscribe(infy).ok());
    h.transport->deliver(market_data_message("INFY", "NSE", 2, 1500.25, R"(,"open":1490.0,"volume":"12345")"));

    EXPECT_DOUBLE_EQ(number_of(h.feed().read_field("INFY", "NSE", "open")), 1490.0);
    EXPECT_DOUBLE_EQ(number_of(h.feed().read_field("INFY", "NSE", "volume")), 12345.0);
    EXPECT_EQ(text_of(h.feed().read_field("INFY", "NSE", "symbol")), "INFY");
    EXPECT_EQ(text_of(h.feed().read_field("INFY", "NSE", "close")), "Field not found");
}

TEST(AutoSubscribeFeedTest, ReadQuote) {
    SessionHarness h;

    Table pending = h.feed().read_quote("INFY", "NSE");
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(text_of(pending[0][0]), "Subscribing...");

    h.transport->deliver(market_data_message("INFY", "NSE", 2, 1500.25, R"(,"open":1490.0)"));

    Table table = h.feed().read_quote("INFY", "NSE");
    ASSERT_EQ(table.size(), 5u);
    EXPECT_EQ(text_of(table[0][0]), "INFY (NSE)");
    EXPECT_EQ(text_of(table[0][1]), "Value");
    EXPECT_EQ(text_of(table[1][0]), "symbol");
    EXPECT_EQ(text_of(table[1][1]), "INFY");
    EXPECT_EQ(text_of(table[4][0]), "open");
}

TEST(AutoSubscribeFeedTest, ReadDepthLadder) {
    SessionHarness h;

    Table pending = h.feed().read_depth("INFY", "NSE");
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(h.transport->count_sent(R"("mode":3,"depth_level":5)"), 1u);

    h.transport->deliver(kInfyDepth);

    Table table = h.feed().read_depth("INFY", "NSE");
    ASSERT_EQ(table.size(), 4u);

    EXPECT_EQ(text_of(table[0][0]), "INFY (NSE)");
    EXPECT_EQ(text_of(table[0][3]), "LTP");
    EXPECT_DOUBLE_EQ(number_of(table[0][4]), 1500.25);

    EXPECT_EQ(text_of(table[1][0]), "Bid Orders");
    EXPECT_EQ(text_of(table[1][6]), "Ask Orders");

    EXPECT_DOUBLE_EQ(number_of(table[2][0]), 4.0);
    EXPECT_DOUBLE_EQ(number_of(table[2][1]), 120.0);
    EXPECT_DOUBLE_EQ(number_of(table[2][2]), 1500.0);
    EXPECT_DOUBLE_EQ(number_of(table[2][4]), 1500.5);
    EXPECT_DOUBLE_EQ(number_of(table[2][5]), 60.0);
    EXPECT_DOUBLE_EQ(number_of(table[2][6]), 3.0);

    // Ask side is shorter: zero-filled
    EXPECT_DOUBLE_EQ(number_of(table[3][2]), 1499.5);
    EXPECT_DOUBLE_EQ(number_of(table[3][4]), 0.0);
    EXPECT_DOUBLE_EQ(number_of(table[3][6]), 0.0);
}

TEST(AutoSubscribeFeedTest, ReadDepthWithoutBook) {
    SessionHarness h;
    ASSERT_TRUE(h.registry().subscribe({"INFY", "NSE", DataMode::Depth}).ok());
    h.transport->deliver(market_data_message("INFY", "NSE", 3, 1500.25));

    Table table = h.feed().read_depth("INFY", "NSE");
    ASSERT_EQ(table.size(), 1u);
    EXPECT_EQ(text_of(table[0][0]), "No depth data available");
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST(AutoSubscribeFeedTest, DebugInfo) {
    SessionHarness h;
    ASSERT_TRUE(h.registry().subscribe(kReliance).ok());
    h.transport->deliver(market_data_message("RELIANCE", "NSE", 1, 2500.5));

    Table table = h.feed().debug_info(kReliance);

    EXPECT_EQ(text_of(table[1][1]), "RELIANCE");
    EXPECT_DOUBLE_EQ(number_of(table[3][1]), 1.0);
    EXPECT_EQ(text_of(table[4][1]), "RELIANCE|NSE|1");
    EXPECT_EQ(text_of(table[5][0]), "Is Subscribed");
    EXPECT_EQ(text_of(table[5][1]), "true");
    EXPECT_EQ(text_of(table[6][1]), "false");
    EXPECT_EQ(text_of(table[7][1]), "false");
    EXPECT_EQ(text_of(table[8][1]), "true");
    EXPECT_EQ(text_of(table[10][1]), "RELIANCE.NSE");
    EXPECT_EQ(text_of(table.back()[0]), "RELIANCE|NSE|1");
}

TEST(AutoSubscribeFeedTest, DebugInfoForUnknownKey) {
    SessionHarness h;
    Table table = h.feed().debug_info(kReliance);

    EXPECT_EQ(text_of(table[5][1]), "false");
    EXPECT_EQ(text_of(table[8][0]), "Has Data");
    EXPECT_EQ(text_of(table[8][1]), "false");
    EXPECT_EQ(text_of(table.back()[0]), "Active Subscriptions:");
    EXPECT_EQ(h.transport->connect_calls(), 0);
}
