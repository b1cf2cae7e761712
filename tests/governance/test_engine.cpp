// AGORA - Governance Engine Tests
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <gtest/gtest.h>

#include "agora/governance/engine.h"
#include "agora/crypto/hash.h"
#include "agora/util/config.h"

#include <stdexcept>

namespace agora {
namespace governance {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class GovernanceEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        org_ = AccountIdFromName("org");
        proposer_ = AccountIdFromName("proposer");
        alice_ = AccountIdFromName("alice");
        bob_ = AccountIdFromName("bob");
        carol_ = AccountIdFromName("carol");
    }
    
    static AccountId Voter(int n) {
        return AccountIdFromName("voter" + std::to_string(n));
    }
    
    /// Register and activate a proposal voting in [10, 20)
    ProposalId CreateActive(uint32_t minApproval = 51, Amount fundingGoal = 0) {
        Proposal p;
        p.org = org_;
        p.proposer = proposer_;
        p.title = "Upgrade treasury";
        p.votingWindow = EpochWindow(10, 20);
        p.minApprovalPercent = minApproval;
        p.fundingGoal = fundingGoal;
        EXPECT_EQ(engine_.RegisterProposal(proposer_, p), DaoError::OK);
        EXPECT_EQ(engine_.ActivateProposal(proposer_, p.id), DaoError::OK);
        return p.id;
    }
    
    ProposalStatus StatusOf(const ProposalId& id) const {
        return engine_.GetProposals().GetProposal(id)->status;
    }
    
    size_t EventCount() const { return engine_.GetAuditLog().Size(); }
    
    audit::AuditEvent LastEvent() const {
        return *engine_.GetAuditLog().Get(EventCount() - 1);
    }
    
    MemoryAssetLedger assets_;
    GovernanceEngine engine_{assets_};
    OrgId org_;
    AccountId proposer_;
    AccountId alice_;
    AccountId bob_;
    AccountId carol_;
};

// ============================================================================
// Clock
// ============================================================================

TEST_F(GovernanceEngineTest, ClockNeverMovesBackwards) {
    EXPECT_EQ(engine_.GetEpoch(), 0u);
    EXPECT_EQ(engine_.SetEpoch(10), DaoError::OK);
    EXPECT_EQ(engine_.SetEpoch(5), DaoError::InvalidInput);
    EXPECT_EQ(engine_.GetEpoch(), 10u);
}

TEST_F(GovernanceEngineTest, StartEpochOption) {
    EngineOptions options;
    options.startEpoch = 42;
    GovernanceEngine engine(assets_, options);
    EXPECT_EQ(engine.GetEpoch(), 42u);
}

// ============================================================================
// Proposal Lifecycle
// ============================================================================

TEST_F(GovernanceEngineTest, MajorityVotePasses) {
    ProposalId id = CreateActive(51);
    for (int i = 0; i < 5; ++i) {
        ASSERT_EQ(engine_.UpdateTokenPower(org_, Voter(i), 10), DaoError::OK);
    }
    
    engine_.SetEpoch(12);
    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(engine_.CastVote(Voter(i), id, VoteKind::Yes), DaoError::OK);
    }
    for (int i = 3; i < 5; ++i) {
        ASSERT_EQ(engine_.CastVote(Voter(i), id, VoteKind::No), DaoError::OK);
    }
    
    EXPECT_EQ(engine_.FinalizeProposal(proposer_, id), DaoError::InvalidState);
    engine_.SetEpoch(20);
    ASSERT_EQ(engine_.FinalizeProposal(proposer_, id), DaoError::OK);
    EXPECT_EQ(StatusOf(id), ProposalStatus::Passed);
    
    audit::AuditEvent finalized = LastEvent();
    EXPECT_EQ(finalized.kind, audit::EventKind::ProposalFinalized);
    EXPECT_EQ(finalized.fields.at("approval"), "60");
    EXPECT_EQ(finalized.fields.at("status"), "PASSED");
    
    EXPECT_EQ(engine_.FinalizeProposal(proposer_, id), DaoError::InvalidState);
}

TEST_F(GovernanceEngineTest, VoteUsesEffectivePower) {
    ProposalId id = CreateActive();
    engine_.UpdateTokenPower(org_, alice_, 50);
    engine_.UpdateCurrencyPower(org_, alice_, 5);
    
    engine_.SetEpoch(11);
    ASSERT_EQ(engine_.CastVote(alice_, id, VoteKind::Yes), DaoError::OK);
    EXPECT_EQ(engine_.GetProposals().GetVote(id, alice_)->power, 55u);
    EXPECT_EQ(LastEvent().fields.at("power"), "55");
    EXPECT_EQ(engine_.CastVote(alice_, id, VoteKind::No), DaoError::AlreadyExists);
}

TEST_F(GovernanceEngineTest, VoteRejections) {
    ProposalId id = CreateActive();
    engine_.UpdateTokenPower(org_, alice_, 50);
    
    EXPECT_EQ(engine_.CastVote(alice_, ProposalId(), VoteKind::Yes), DaoError::NotFound);
    EXPECT_EQ(engine_.CastVote(alice_, id, VoteKind::Yes), DaoError::InvalidState);
    
    engine_.SetEpoch(12);
    EXPECT_EQ(engine_.CastVote(bob_, id, VoteKind::Yes), DaoError::InvalidInput);
}

TEST_F(GovernanceEngineTest, DelegatorCannotVoteDelegateCarriesPower) {
    ProposalId id = CreateActive();
    engine_.UpdateTokenPower(org_, alice_, 50);
    engine_.UpdateTokenPower(org_, bob_, 10);
    ASSERT_EQ(engine_.Delegate(alice_, org_, bob_), DaoError::OK);
    
    engine_.SetEpoch(12);
    EXPECT_EQ(engine_.CastVote(alice_, id, VoteKind::Yes), DaoError::InvalidInput);
    ASSERT_EQ(engine_.CastVote(bob_, id, VoteKind::Yes), DaoError::OK);
    EXPECT_EQ(engine_.GetProposals().GetTally(id)->yes, 60u);
}

TEST_F(GovernanceEngineTest, VoteReclaimsLapsedDelegation) {
    ProposalId id = CreateActive();
    engine_.UpdateTokenPower(org_, alice_, 50);
    ASSERT_EQ(engine_.Delegate(alice_, org_, bob_, Epoch(11)), DaoError::OK);
    
    engine_.SetEpoch(12);
    size_t before = EventCount();
    ASSERT_EQ(engine_.CastVote(alice_, id, VoteKind::Yes), DaoError::OK);
    EXPECT_EQ(EventCount(), before + 1);
    
    audit::AuditEvent vote = LastEvent();
    EXPECT_EQ(vote.kind, audit::EventKind::VoteCast);
    EXPECT_EQ(vote.fields.at("power"), "50");
    EXPECT_EQ(vote.fields.at("expired_delegations"), "1");
    EXPECT_EQ(vote.fields.at("expired_amount"), "50");
    EXPECT_FALSE(engine_.GetPowerLedger().GetDelegation(org_, alice_).has_value());
    EXPECT_EQ(engine_.GetEffectivePower(org_, bob_), 0u);
}

TEST_F(GovernanceEngineTest, ExecuteRunsCallback) {
    ProposalId id = CreateActive(50);
    engine_.UpdateTokenPower(org_, alice_, 10);
    engine_.SetEpoch(12);
    engine_.CastVote(alice_, id, VoteKind::Yes);
    
    std::vector<ProposalId> executed;
    engine_.SetExecutionCallback([&executed](const Proposal& p) {
        EXPECT_EQ(p.status, ProposalStatus::Executed);
        executed.push_back(p.id);
    });
    
    EXPECT_EQ(engine_.ExecuteProposal(alice_, id), DaoError::InvalidState);
    engine_.SetEpoch(20);
    ASSERT_EQ(engine_.FinalizeProposal(alice_, id), DaoError::OK);
    ASSERT_EQ(engine_.ExecuteProposal(alice_, id), DaoError::OK);
    
    EXPECT_EQ(StatusOf(id), ProposalStatus::Executed);
    ASSERT_EQ(executed.size(), 1u);
    EXPECT_EQ(executed[0], id);
    EXPECT_EQ(engine_.ExecuteProposal(alice_, id), DaoError::InvalidState);
}

TEST_F(GovernanceEngineTest, ThrowingCallbackDoesNotUndoExecution) {
    ProposalId id = CreateActive(0);
    engine_.SetExecutionCallback([](const Proposal&) {
        throw std::runtime_error("host failure");
    });
    engine_.SetEpoch(20);
    ASSERT_EQ(engine_.FinalizeProposal(alice_, id), DaoError::OK);
    EXPECT_EQ(engine_.ExecuteProposal(alice_, id), DaoError::OK);
    EXPECT_EQ(StatusOf(id), ProposalStatus::Executed);
}

TEST_F(GovernanceEngineTest, FundedProposalNeedsMinimumGoal) {
    ProposalId id = CreateActive(0, 100);
    assets_.Mint(std::nullopt, alice_, 500);
    ASSERT_EQ(engine_.InitializeFunding(proposer_, id, true, EpochWindow(0, 15),
                                        100, 200, proposer_),
              DaoError::OK);
    
    engine_.SetEpoch(5);
    ASSERT_EQ(engine_.Contribute(alice_, id, 60), DaoError::OK);
    
    engine_.SetEpoch(20);
    ASSERT_EQ(engine_.FinalizeProposal(alice_, id), DaoError::OK);
    EXPECT_EQ(engine_.ExecuteProposal(alice_, id), DaoError::GoalNotReached);
    EXPECT_EQ(StatusOf(id), ProposalStatus::Passed);
}

TEST_F(GovernanceEngineTest, EscrowMinimumMustCoverFundingGoal) {
    ProposalId id = CreateActive(0, 500);
    EXPECT_EQ(engine_.InitializeFunding(proposer_, id, true, EpochWindow(0, 15),
                                        1, 1000, proposer_),
              DaoError::InvalidInput);
    EXPECT_FALSE(engine_.GetEscrow().GetFunding(id).has_value());
    EXPECT_EQ(engine_.InitializeFunding(proposer_, id, true, EpochWindow(0, 15),
                                        500, 1000, proposer_),
              DaoError::OK);
}

TEST_F(GovernanceEngineTest, CancelEmitsEvent) {
    ProposalId id = CreateActive();
    EXPECT_EQ(engine_.CancelProposal(alice_, id), DaoError::Unauthorized);
    ASSERT_EQ(engine_.CancelProposal(org_, id), DaoError::OK);
    EXPECT_EQ(LastEvent().kind, audit::EventKind::ProposalCanceled);
    EXPECT_EQ(engine_.CancelProposal(org_, id), DaoError::InvalidState);
}

// ============================================================================
// Delegation
// ============================================================================

TEST_F(GovernanceEngineTest, DelegatedAmountStaysFrozen) {
    engine_.UpdateTokenPower(org_, alice_, 50);
    ASSERT_EQ(engine_.Delegate(alice_, org_, bob_), DaoError::OK);
    ASSERT_EQ(engine_.UpdateTokenPower(org_, alice_, 80), DaoError::OK);
    
    EXPECT_EQ(engine_.GetEffectivePower(org_, alice_), 0u);
    EXPECT_EQ(engine_.GetPowerLedger().GetDelegation(org_, alice_)->amount, 50);
    EXPECT_EQ(engine_.GetEffectivePower(org_, bob_), 50u);
}

TEST_F(GovernanceEngineTest, RevokeEmitsEvent) {
    engine_.UpdateTokenPower(org_, alice_, 50);
    ASSERT_EQ(engine_.Delegate(alice_, org_, bob_), DaoError::OK);
    ASSERT_EQ(engine_.RevokeDelegation(alice_, org_), DaoError::OK);
    
    audit::AuditEvent revoked = LastEvent();
    EXPECT_EQ(revoked.kind, audit::EventKind::DelegationRevoked);
    EXPECT_EQ(revoked.fields.at("amount"), "50");
    EXPECT_EQ(engine_.RevokeDelegation(alice_, org_), DaoError::NotFound);
}

TEST_F(GovernanceEngineTest, CheckDelegationExpiryEmitsOnlyWhenReclaimed) {
    engine_.UpdateTokenPower(org_, alice_, 50);
    ASSERT_EQ(engine_.Delegate(alice_, org_, bob_, Epoch(10)), DaoError::OK);
    
    size_t before = EventCount();
    EXPECT_EQ(engine_.CheckDelegationExpiry(org_, alice_, bob_), 0);
    EXPECT_EQ(EventCount(), before);
    
    engine_.SetEpoch(10);
    EXPECT_EQ(engine_.CheckDelegationExpiry(org_, alice_, bob_), 50);
    EXPECT_EQ(LastEvent().kind, audit::EventKind::DelegationExpired);
    EXPECT_EQ(engine_.GetEffectivePower(org_, alice_), 50u);
}

TEST_F(GovernanceEngineTest, RedelegateRecordsReclaim) {
    engine_.UpdateTokenPower(org_, alice_, 50);
    ASSERT_EQ(engine_.Delegate(alice_, org_, bob_, Epoch(10)), DaoError::OK);
    engine_.SetEpoch(10);
    ASSERT_EQ(engine_.Delegate(alice_, org_, carol_), DaoError::OK);
    
    audit::AuditEvent created = LastEvent();
    EXPECT_EQ(created.kind, audit::EventKind::DelegationCreated);
    EXPECT_EQ(created.fields.at("reclaimed_from"), bob_.ToHex());
    EXPECT_EQ(created.fields.at("reclaimed_amount"), "50");
    EXPECT_EQ(created.fields.at("expiry"), "none");
    EXPECT_EQ(engine_.GetEffectivePower(org_, carol_), 50u);
}

TEST_F(GovernanceEngineTest, RefreshCurrencyPowerFromLedger) {
    assets_.Mint(std::nullopt, alice_, 75);
    ASSERT_EQ(engine_.RefreshCurrencyPower(org_, alice_), DaoError::OK);
    EXPECT_EQ(engine_.GetEffectivePower(org_, alice_), 75u);
    EXPECT_EQ(LastEvent().fields.at("source"), "ledger");
}

// ============================================================================
// Funding
// ============================================================================

TEST_F(GovernanceEngineTest, FundingRequiresManager) {
    ProposalId id = CreateActive();
    EXPECT_EQ(engine_.InitializeFunding(alice_, id, true, EpochWindow(0, 15), 1, 1, alice_),
              DaoError::Unauthorized);
    EXPECT_EQ(engine_.InitializeFunding(proposer_, ProposalId(), true, EpochWindow(0, 15),
                                        1, 1, alice_),
              DaoError::NotFound);
}

TEST_F(GovernanceEngineTest, FundingRequiresOpenProposal) {
    ProposalId canceled = CreateActive();
    ASSERT_EQ(engine_.CancelProposal(proposer_, canceled), DaoError::OK);
    size_t before = EventCount();
    EXPECT_EQ(engine_.InitializeFunding(proposer_, canceled, true, EpochWindow(0, 30),
                                        10, 20, proposer_),
              DaoError::InvalidState);
    EXPECT_EQ(EventCount(), before);
    
    ProposalId rejected = CreateActive(100);
    engine_.SetEpoch(20);
    ASSERT_EQ(engine_.FinalizeProposal(alice_, rejected), DaoError::OK);
    ASSERT_EQ(StatusOf(rejected), ProposalStatus::Rejected);
    EXPECT_EQ(engine_.InitializeFunding(proposer_, rejected, true, EpochWindow(20, 30),
                                        10, 20, proposer_),
              DaoError::InvalidState);
    EXPECT_FALSE(engine_.GetEscrow().GetFunding(rejected).has_value());
}

TEST_F(GovernanceEngineTest, MissedMinimumAllowsRefund) {
    ProposalId id = CreateActive();
    assets_.Mint(std::nullopt, alice_, 100);
    assets_.Mint(std::nullopt, bob_, 100);
    ASSERT_EQ(engine_.InitializeFunding(proposer_, id, true, EpochWindow(0, 15),
                                        100, 200, proposer_),
              DaoError::OK);
    
    engine_.SetEpoch(5);
    ASSERT_EQ(engine_.Contribute(alice_, id, 40), DaoError::OK);
    ASSERT_EQ(engine_.Contribute(bob_, id, 40), DaoError::OK);
    EXPECT_EQ(LastEvent().fields.at("total_raised"), "80");
    
    engine_.SetEpoch(15);
    EXPECT_EQ(engine_.Withdraw(proposer_, id, 10), DaoError::InvalidState);
    ASSERT_EQ(engine_.Refund(alice_, id), DaoError::OK);
    EXPECT_EQ(LastEvent().kind, audit::EventKind::NativeRefunded);
    EXPECT_EQ(LastEvent().fields.at("amount"), "40");
    EXPECT_EQ(assets_.BalanceOf(std::nullopt, alice_), 100);
}

TEST_F(GovernanceEngineTest, TokenWithdrawAndRefundEvents) {
    AssetId gold = AssetIdFromSymbol("GOLD");
    ProposalId id = CreateActive();
    assets_.Mint(gold, alice_, 300);
    ASSERT_EQ(engine_.InitializeFunding(proposer_, id, true, EpochWindow(0, 15),
                                        100, 200, carol_),
              DaoError::OK);
    
    engine_.SetEpoch(5);
    ASSERT_EQ(engine_.Contribute(alice_, id, 150, gold), DaoError::OK);
    EXPECT_EQ(LastEvent().fields.at("asset"), gold.ToHex());
    
    engine_.SetEpoch(15);
    EXPECT_EQ(engine_.RefundToken(alice_, id), DaoError::GoalReached);
    ASSERT_EQ(engine_.WithdrawToken(carol_, id, 150), DaoError::OK);
    EXPECT_EQ(LastEvent().kind, audit::EventKind::TokenWithdrawn);
    EXPECT_EQ(assets_.BalanceOf(gold, carol_), 150);
}

// ============================================================================
// Audit Trail
// ============================================================================

TEST_F(GovernanceEngineTest, FailedActionsAppendNothing) {
    ProposalId id = CreateActive();
    assets_.Mint(std::nullopt, alice_, 100);
    ASSERT_EQ(engine_.InitializeFunding(proposer_, id, true, EpochWindow(0, 15),
                                        50, 100, proposer_),
              DaoError::OK);
    size_t before = EventCount();
    audit::AuditEvent head = LastEvent();
    
    EXPECT_NE(engine_.ActivateProposal(proposer_, id), DaoError::OK);
    EXPECT_NE(engine_.CastVote(alice_, id, VoteKind::Yes), DaoError::OK);
    EXPECT_NE(engine_.UpdateTokenPower(org_, alice_, -1), DaoError::OK);
    EXPECT_NE(engine_.Delegate(alice_, org_, alice_), DaoError::OK);
    EXPECT_NE(engine_.RevokeDelegation(alice_, org_), DaoError::OK);
    EXPECT_NE(engine_.Withdraw(proposer_, id, 1), DaoError::OK);
    EXPECT_NE(engine_.Refund(alice_, id), DaoError::OK);
    
    assets_.FailNextTransfers(1);
    EXPECT_EQ(engine_.Contribute(alice_, id, 10), DaoError::TransferFailed);
    EXPECT_EQ(engine_.GetEscrow().GetFunding(id)->totalRaised, 0);
    EXPECT_EQ(assets_.BalanceOf(std::nullopt, alice_), 100);
    
    EXPECT_EQ(EventCount(), before);
    EXPECT_EQ(engine_.GetAuditLog().GetHeadDigest(), head.digest);
}

TEST_F(GovernanceEngineTest, EverySuccessAppendsOneChainedEvent) {
    size_t before = EventCount();
    ProposalId id = CreateActive(50);
    engine_.UpdateTokenPower(org_, alice_, 10);
    engine_.SetEpoch(12);
    engine_.CastVote(alice_, id, VoteKind::Yes);
    engine_.SetEpoch(20);
    engine_.FinalizeProposal(alice_, id);
    engine_.ExecuteProposal(alice_, id);
    
    auto events = engine_.GetAuditLog().GetEvents();
    ASSERT_EQ(events.size(), before + 6);
    EXPECT_EQ(events[0].kind, audit::EventKind::ProposalRegistered);
    EXPECT_EQ(events[1].kind, audit::EventKind::ProposalActivated);
    EXPECT_EQ(events[2].kind, audit::EventKind::TokenPowerUpdated);
    EXPECT_EQ(events[3].kind, audit::EventKind::VoteCast);
    EXPECT_EQ(events[4].kind, audit::EventKind::ProposalFinalized);
    EXPECT_EQ(events[5].kind, audit::EventKind::ProposalExecuted);
    EXPECT_EQ(events[3].epoch, 12u);
    EXPECT_EQ(events[3].actor, alice_);
    EXPECT_TRUE(engine_.GetAuditLog().Verify());
}

// ============================================================================
// Options
// ============================================================================

TEST(EngineOptionsTest, FromConfig) {
    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString(
        "[governance]\nmaxtitlelength=8\n[escrow]\naccount=treasury\n").success);
    
    EngineOptions options = EngineOptions::FromConfig(config);
    EXPECT_EQ(options.limits.maxTitleLength, 8u);
    EXPECT_EQ(options.limits.maxDescriptionLength, DEFAULT_MAX_DESCRIPTION_LENGTH);
    EXPECT_EQ(options.escrowAccount, AccountIdFromName("treasury"));
    
    MemoryAssetLedger assets;
    GovernanceEngine engine(assets, options);
    EXPECT_EQ(engine.GetEscrow().GetEscrowAccount(), AccountIdFromName("treasury"));
    
    Proposal p;
    p.org = AccountIdFromName("org");
    p.proposer = p.org;
    p.title = "too long title";
    EXPECT_EQ(engine.RegisterProposal(p.org, p), DaoError::InvalidInput);
}

TEST(EngineOptionsTest, DefaultEscrowAccount) {
    EngineOptions options;
    EXPECT_EQ(options.escrowAccount, AccountIdFromName(DEFAULT_ESCROW_ACCOUNT));
    EXPECT_EQ(options.limits.maxTitleLength, DEFAULT_MAX_TITLE_LENGTH);
}

} // namespace test
} // namespace governance
} // namespace agora
