// AGORA - Core Types Tests
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <gtest/gtest.h>
#include "agora/core/types.h"
#include "agora/core/clock.h"

#include <array>
#include <map>
#include <stdexcept>

namespace agora {
namespace test {

// ============================================================================
// Handle Tests
// ============================================================================

TEST(TypesTest, DefaultHandleIsNull) {
    AccountId account;
    EXPECT_TRUE(account.IsNull());
    EXPECT_EQ(account.size(), 20u);
    
    Hash256 digest;
    EXPECT_TRUE(digest.IsNull());
    EXPECT_EQ(digest.size(), 32u);
}

TEST(TypesTest, HexRoundTripKeepsByteOrder) {
    std::array<Byte, 20> raw{};
    raw[0] = 0xab;
    raw[19] = 0x01;
    AccountId account(raw);
    
    std::string hex = account.ToHex();
    EXPECT_EQ(hex.substr(0, 2), "ab");
    EXPECT_EQ(hex.substr(38, 2), "01");
    EXPECT_EQ(AccountId(AccountId::FromHex(hex)), account);
    EXPECT_EQ(account.ToShortHex(), hex.substr(0, 12));
}

TEST(TypesTest, FromHexRejectsMalformedInput) {
    EXPECT_THROW(AccountId::FromHex("abcd"), std::invalid_argument);
    EXPECT_THROW(AccountId::FromHex(std::string(40, 'z')), std::invalid_argument);
}

TEST(TypesTest, HandlesOrderForMapKeys) {
    std::array<Byte, 20> a{};
    std::array<Byte, 20> b{};
    b[0] = 1;
    ProposalId low(Hash160(a.data(), a.size()));
    ProposalId high(Hash160(b.data(), b.size()));
    
    EXPECT_TRUE(low < high);
    EXPECT_NE(low, high);
    
    std::map<ProposalId, int> byId;
    byId[high] = 2;
    byId[low] = 1;
    EXPECT_EQ(byId.begin()->second, 1);
}

TEST(TypesTest, AmountRange) {
    EXPECT_TRUE(AmountRange(0));
    EXPECT_TRUE(AmountRange(MAX_AMOUNT));
    EXPECT_FALSE(AmountRange(-1));
    EXPECT_FALSE(AmountRange(MAX_AMOUNT + 1));
}

TEST(TypesTest, DaoErrorNames) {
    EXPECT_STREQ(DaoErrorToString(DaoError::OK), "OK");
    EXPECT_STREQ(DaoErrorToString(DaoError::Unauthorized), "Unauthorized");
    EXPECT_STREQ(DaoErrorToString(DaoError::GoalNotReached), "GoalNotReached");
    EXPECT_STREQ(DaoErrorToString(DaoError::TransferFailed), "TransferFailed");
}

// ============================================================================
// Clock Tests
// ============================================================================

TEST(ClockTest, SetIsMonotonic) {
    LogicalClock clock(10);
    EXPECT_EQ(clock.Now(), 10u);
    
    EXPECT_EQ(clock.Set(10), DaoError::OK);
    EXPECT_EQ(clock.Set(15), DaoError::OK);
    EXPECT_EQ(clock.Set(14), DaoError::InvalidInput);
    EXPECT_EQ(clock.Now(), 15u);
}

TEST(ClockTest, WindowIsHalfOpen) {
    EpochWindow window(10, 20);
    EXPECT_TRUE(window.IsValid());
    EXPECT_FALSE(window.Contains(9));
    EXPECT_TRUE(window.Contains(10));
    EXPECT_TRUE(window.Contains(19));
    EXPECT_FALSE(window.Contains(20));
    EXPECT_FALSE(window.HasClosed(19));
    EXPECT_TRUE(window.HasClosed(20));
    
    EXPECT_FALSE(EpochWindow(5, 4).IsValid());
    EXPECT_TRUE(EpochWindow(5, 5).IsValid());
    EXPECT_FALSE(EpochWindow(5, 5).Contains(5));
}

} // namespace test
} // namespace agora
