// ============================================================================
// ALGOSTREAM - Core Types Unit Tests
// ============================================================================

#include "algostream/core/error.hpp"
#include "algostream/core/types.hpp"

#include <gtest/gtest.h>

#include <unordered_set>

using namespace algostream;

// ============================================================================
// DataMode Tests
// ============================================================================

TEST(DataModeTest, WireValues) {
    EXPECT_EQ(to_int(DataMode::LTP), 1);
    EXPECT_EQ(to_int(DataMode::Quote), 2);
    EXPECT_EQ(to_int(DataMode::Depth), 3);
}

TEST(DataModeTest, FromInt) {
    EXPECT_EQ(mode_from_int(1), DataMode::LTP);
    EXPECT_EQ(mode_from_int(2), DataMode::Quote);
    EXPECT_EQ(mode_from_int(3), DataMode::Depth);
    EXPECT_FALSE(mode_from_int(0).has_value());
    EXPECT_FALSE(mode_from_int(4).has_value());
    EXPECT_FALSE(mode_from_int(-1).has_value());
}

TEST(DataModeTest, ToString) {
    EXPECT_EQ(to_string(DataMode::LTP), "LTP");
    EXPECT_EQ(to_string(DataMode::Quote), "Quote");
    EXPECT_EQ(to_string(DataMode::Depth), "Depth");
}

// ============================================================================
// SubscriptionKey Tests
// ============================================================================

TEST(SubscriptionKeyTest, CanonicalString) {
    SubscriptionKey key{"RELIANCE", "NSE", DataMode::LTP};
    EXPECT_EQ(key.to_string(), "RELIANCE|NSE|1");
    EXPECT_EQ(key.describe(), "RELIANCE (NSE) - Mode 1");
}

TEST(SubscriptionKeyTest, EqualityIsExact) {
    SubscriptionKey a{"INFY", "NSE", DataMode::Quote};
    SubscriptionKey b{"INFY", "NSE", DataMode::Quote};
    SubscriptionKey lower{"infy", "NSE", DataMode::Quote};
    SubscriptionKey other_mode{"INFY", "NSE", DataMode::Depth};

    EXPECT_EQ(a, b);
    EXPECT_NE(a, lower);
    EXPECT_NE(a, other_mode);
}

TEST(SubscriptionKeyTest, Validity) {
    EXPECT_TRUE((SubscriptionKey{"TCS", "NSE", DataMode::LTP}).is_valid());
    EXPECT_FALSE((SubscriptionKey{"", "NSE", DataMode::LTP}).is_valid());
    EXPECT_FALSE((SubscriptionKey{"TCS", "", DataMode::LTP}).is_valid());
}

TEST(SubscriptionKeyTest, HashDistinguishesModes) {
    std::unordered_set<SubscriptionKey> keys;
    keys.insert({"SBIN", "NSE", DataMode::LTP});
    keys.insert({"SBIN", "NSE", DataMode::Quote});
    keys.insert({"SBIN", "NSE", DataMode::LTP});

    EXPECT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys.count({"SBIN", "NSE", DataMode::Quote}), 1u);
}

// ============================================================================
// Status Tests
// ============================================================================

TEST(StatusTest, SuccessIsVerbatim) {
    Status status = Status::success("Connected and authenticated");
    EXPECT_TRUE(status.ok());
    EXPECT_EQ(status.code(), ErrorCode::Ok);
    EXPECT_EQ(status.to_string(), "Connected and authenticated");
}

TEST(StatusTest, ErrorIsPrefixed) {
    Status status = Status::error(ErrorCode::NotAuthenticated, "Not authenticated");
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(status.code(), ErrorCode::NotAuthenticated);
    EXPECT_EQ(status.message(), "Not authenticated");
    EXPECT_EQ(status.to_string(), "Error: Not authenticated");
}

TEST(StatusTest, ErrorCodeNames) {
    EXPECT_EQ(to_string(ErrorCode::AuthenticationTimeout), "AuthenticationTimeout");
    EXPECT_EQ(to_string(ErrorCode::SubscriptionRejected), "SubscriptionRejected");
    EXPECT_EQ(to_string(ConnectionState::Open), "Open");
    EXPECT_EQ(to_string(AuthMode::Assumed), "assumed");
}

// ============================================================================
// Timestamp Tests
// ============================================================================

TEST(TimestampTest, Now) {
    auto t1 = now();
    auto t2 = now();
    EXPECT_LE(t1, t2);
}

TEST(TimestampTest, EpochMs) {
    Timestamp ts{std::chrono::milliseconds{1700000000123}};
    EXPECT_EQ(to_epoch_ms(ts), 1700000000123);
}
