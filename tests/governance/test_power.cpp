// AGORA - Voting Power and Delegation Tests
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <gtest/gtest.h>

#include "agora/governance/power.h"
#include "agora/crypto/hash.h"

namespace agora {
namespace governance {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class PowerLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        org_ = AccountIdFromName("org");
        alice_ = AccountIdFromName("alice");
        bob_ = AccountIdFromName("bob");
        carol_ = AccountIdFromName("carol");
    }
    
    ActionContext As(const AccountId& who, Epoch now = 10) const {
        return ActionContext(who, now);
    }
    
    void ExpectConservation() const {
        EXPECT_EQ(ledger_.GetTotalReceived(org_), ledger_.GetTotalDelegated(org_));
    }
    
    MemoryAssetLedger assets_;
    PowerLedger ledger_{assets_};
    OrgId org_;
    AccountId alice_;
    AccountId bob_;
    AccountId carol_;
};

// ============================================================================
// Power Tests
// ============================================================================

TEST_F(PowerLedgerTest, UnknownAccountHasNoPower) {
    EXPECT_EQ(ledger_.ComputeEffectivePower(org_, alice_), 0u);
    EXPECT_FALSE(ledger_.GetRecord(org_, alice_).has_value());
}

TEST_F(PowerLedgerTest, ComponentsAddUp) {
    EXPECT_EQ(ledger_.UpdateTokenPower(org_, alice_, 30, 1), DaoError::OK);
    EXPECT_EQ(ledger_.UpdateCurrencyPower(org_, alice_, 12, 2), DaoError::OK);
    EXPECT_EQ(ledger_.ComputeEffectivePower(org_, alice_), 42u);
    
    auto rec = ledger_.GetRecord(org_, alice_);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->lastUpdated, 2u);
    EXPECT_EQ(rec->OwnPower(), 42);
    
    // Updates overwrite rather than accumulate
    EXPECT_EQ(ledger_.UpdateTokenPower(org_, alice_, 5, 3), DaoError::OK);
    EXPECT_EQ(ledger_.ComputeEffectivePower(org_, alice_), 17u);
}

TEST_F(PowerLedgerTest, PowerIsScopedPerOrganization) {
    OrgId other = AccountIdFromName("other-org");
    ledger_.UpdateTokenPower(org_, alice_, 30, 1);
    EXPECT_EQ(ledger_.ComputeEffectivePower(other, alice_), 0u);
}

TEST_F(PowerLedgerTest, RejectsOutOfRangePower) {
    EXPECT_EQ(ledger_.UpdateTokenPower(org_, alice_, -1, 1), DaoError::InvalidInput);
    EXPECT_EQ(ledger_.UpdateCurrencyPower(org_, alice_, MAX_AMOUNT + 1, 1),
              DaoError::InvalidInput);
    EXPECT_FALSE(ledger_.GetRecord(org_, alice_).has_value());
}

TEST_F(PowerLedgerTest, RefreshCurrencyPowerReadsNativeBalance) {
    assets_.Mint(std::nullopt, alice_, 250);
    assets_.Mint(AssetIdFromSymbol("GOLD"), alice_, 999);
    EXPECT_EQ(ledger_.RefreshCurrencyPower(org_, alice_, 4), DaoError::OK);
    EXPECT_EQ(ledger_.GetRecord(org_, alice_)->currencyPower, 250);
}

// ============================================================================
// Delegation Tests
// ============================================================================

TEST_F(PowerLedgerTest, DelegateMovesPower) {
    ledger_.UpdateTokenPower(org_, alice_, 50, 1);
    ledger_.UpdateTokenPower(org_, bob_, 20, 1);
    
    EXPECT_EQ(ledger_.Delegate(As(alice_), org_, bob_, std::nullopt), DaoError::OK);
    EXPECT_EQ(ledger_.ComputeEffectivePower(org_, alice_), 0u);
    EXPECT_EQ(ledger_.ComputeEffectivePower(org_, bob_), 70u);
    
    auto d = ledger_.GetDelegation(org_, alice_);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->delegate, bob_);
    EXPECT_EQ(d->amount, 50);
    EXPECT_EQ(d->createdAt, 10u);
    EXPECT_EQ(ledger_.GetDelegators(org_, bob_), std::vector<AccountId>{alice_});
    ExpectConservation();
}

TEST_F(PowerLedgerTest, DelegatedAmountIsFrozen) {
    ledger_.UpdateTokenPower(org_, alice_, 50, 1);
    ASSERT_EQ(ledger_.Delegate(As(alice_), org_, bob_, std::nullopt), DaoError::OK);
    
    ledger_.UpdateTokenPower(org_, alice_, 80, 11);
    
    EXPECT_EQ(ledger_.ComputeEffectivePower(org_, alice_), 0u);
    EXPECT_EQ(ledger_.GetDelegation(org_, alice_)->amount, 50);
    EXPECT_EQ(ledger_.ComputeEffectivePower(org_, bob_), 50u);
    ExpectConservation();
    
    // Revoking hands back the current balance, not the snapshot
    EXPECT_EQ(ledger_.Revoke(As(alice_, 12), org_), DaoError::OK);
    EXPECT_EQ(ledger_.ComputeEffectivePower(org_, alice_), 80u);
    EXPECT_EQ(ledger_.ComputeEffectivePower(org_, bob_), 0u);
}

TEST_F(PowerLedgerTest, DelegateValidation) {
    ledger_.UpdateTokenPower(org_, alice_, 50, 1);
    
    EXPECT_EQ(ledger_.Delegate(As(alice_), org_, alice_, std::nullopt),
              DaoError::InvalidInput);
    EXPECT_EQ(ledger_.Delegate(As(alice_, 10), org_, bob_, Epoch(10)),
              DaoError::InvalidInput);
    EXPECT_EQ(ledger_.Delegate(As(carol_), org_, bob_, std::nullopt),
              DaoError::InvalidInput);
    
    ledger_.UpdateTokenPower(org_, carol_, 0, 1);
    EXPECT_EQ(ledger_.Delegate(As(carol_), org_, bob_, std::nullopt),
              DaoError::InvalidInput);
    
    EXPECT_EQ(ledger_.GetDelegationCount(org_), 0u);
}

TEST_F(PowerLedgerTest, OnlyOneActiveDelegation) {
    ledger_.UpdateTokenPower(org_, alice_, 50, 1);
    ASSERT_EQ(ledger_.Delegate(As(alice_), org_, bob_, std::nullopt), DaoError::OK);
    EXPECT_EQ(ledger_.Delegate(As(alice_), org_, carol_, std::nullopt),
              DaoError::AlreadyExists);
    EXPECT_EQ(ledger_.GetDelegation(org_, alice_)->delegate, bob_);
}

TEST_F(PowerLedgerTest, DelegateWithOnlyReceivedPowerFails) {
    ledger_.UpdateTokenPower(org_, alice_, 50, 1);
    ledger_.UpdateTokenPower(org_, bob_, 0, 1);
    ASSERT_EQ(ledger_.Delegate(As(alice_), org_, bob_, std::nullopt), DaoError::OK);
    
    EXPECT_EQ(ledger_.Delegate(As(bob_), org_, carol_, std::nullopt),
              DaoError::InvalidInput);
}

TEST_F(PowerLedgerTest, RevokeWithoutDelegation) {
    EXPECT_EQ(ledger_.Revoke(As(alice_), org_), DaoError::NotFound);
}

TEST_F(PowerLedgerTest, MultipleDelegatorsConserve) {
    ledger_.UpdateTokenPower(org_, alice_, 10, 1);
    ledger_.UpdateTokenPower(org_, carol_, 15, 1);
    ASSERT_EQ(ledger_.Delegate(As(alice_), org_, bob_, std::nullopt), DaoError::OK);
    ASSERT_EQ(ledger_.Delegate(As(carol_), org_, bob_, std::nullopt), DaoError::OK);
    
    EXPECT_EQ(ledger_.ComputeEffectivePower(org_, bob_), 25u);
    EXPECT_EQ(ledger_.GetDelegators(org_, bob_).size(), 2u);
    ExpectConservation();
    
    ASSERT_EQ(ledger_.Revoke(As(alice_), org_), DaoError::OK);
    EXPECT_EQ(ledger_.ComputeEffectivePower(org_, bob_), 15u);
    ExpectConservation();
}

// ============================================================================
// Expiry Tests
// ============================================================================

TEST_F(PowerLedgerTest, ExpiryIsLazy) {
    ledger_.UpdateTokenPower(org_, alice_, 50, 1);
    ASSERT_EQ(ledger_.Delegate(As(alice_, 10), org_, bob_, Epoch(20)), DaoError::OK);
    
    EXPECT_EQ(ledger_.CheckExpiry(org_, alice_, bob_, 19), 0);
    EXPECT_EQ(ledger_.CheckExpiry(org_, alice_, carol_, 25), 0);
    
    // Still counted until checked
    EXPECT_EQ(ledger_.ComputeEffectivePower(org_, bob_), 50u);
    EXPECT_EQ(ledger_.PreviewEffectivePower(org_, bob_, 20), 0u);
    EXPECT_EQ(ledger_.PreviewEffectivePower(org_, alice_, 20), 50u);
    EXPECT_EQ(ledger_.PreviewEffectivePower(org_, alice_, 19), 0u);
    
    EXPECT_EQ(ledger_.CheckExpiry(org_, alice_, bob_, 20), 50);
    EXPECT_EQ(ledger_.ComputeEffectivePower(org_, alice_), 50u);
    EXPECT_EQ(ledger_.ComputeEffectivePower(org_, bob_), 0u);
    EXPECT_FALSE(ledger_.GetDelegation(org_, alice_).has_value());
    ExpectConservation();
}

TEST_F(PowerLedgerTest, ExpireForCoversBothDirections) {
    ledger_.UpdateTokenPower(org_, alice_, 10, 1);
    ledger_.UpdateTokenPower(org_, bob_, 20, 1);
    ledger_.UpdateTokenPower(org_, carol_, 30, 1);
    ASSERT_EQ(ledger_.Delegate(As(alice_, 10), org_, bob_, Epoch(15)), DaoError::OK);
    ASSERT_EQ(ledger_.Delegate(As(bob_, 10), org_, carol_, Epoch(15)), DaoError::OK);
    
    auto removed = ledger_.ExpireFor(org_, bob_, 16);
    EXPECT_EQ(removed.size(), 2u);
    EXPECT_EQ(ledger_.GetDelegationCount(org_), 0u);
    EXPECT_EQ(ledger_.ComputeEffectivePower(org_, bob_), 20u);
    EXPECT_EQ(ledger_.ComputeEffectivePower(org_, carol_), 30u);
    ExpectConservation();
    
    EXPECT_TRUE(ledger_.ExpireFor(org_, bob_, 17).empty());
}

TEST_F(PowerLedgerTest, ExpiredDelegationIsReclaimedOnRedelegate) {
    ledger_.UpdateTokenPower(org_, alice_, 50, 1);
    ASSERT_EQ(ledger_.Delegate(As(alice_, 10), org_, bob_, Epoch(20)), DaoError::OK);
    
    EXPECT_EQ(ledger_.Delegate(As(alice_, 20), org_, carol_, std::nullopt), DaoError::OK);
    EXPECT_EQ(ledger_.GetDelegation(org_, alice_)->delegate, carol_);
    EXPECT_EQ(ledger_.ComputeEffectivePower(org_, bob_), 0u);
    EXPECT_EQ(ledger_.ComputeEffectivePower(org_, carol_), 50u);
    ExpectConservation();
}

TEST(DelegationTest, ExpiryBoundary) {
    Delegation d;
    EXPECT_FALSE(d.IsExpiredAt(UINT64_MAX));
    d.expiry = 5;
    EXPECT_FALSE(d.IsExpiredAt(4));
    EXPECT_TRUE(d.IsExpiredAt(5));
}

} // namespace test
} // namespace governance
} // namespace agora
