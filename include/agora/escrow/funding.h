// AGORA - Proposal Funding Escrow
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Crowdfunding for proposal execution. Contributions are moved into a
// dedicated escrow account and tracked per (proposal, funder). When the
// funding window closes:
// - minimum goal reached: the beneficiary may withdraw
// - minimum goal missed: every funder may take their contribution back
//
// Native currency and one alternate asset (fixed by the first alternate
// contribution) are tracked separately; both count toward the goals.
// Every external transfer happens before any record is touched, so a
// rejected transfer leaves no trace.

#ifndef AGORA_ESCROW_FUNDING_H
#define AGORA_ESCROW_FUNDING_H

#include "agora/core/asset.h"
#include "agora/core/clock.h"
#include "agora/core/types.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agora {
namespace escrow {

// ============================================================================
// Records
// ============================================================================

/**
 * Funding state of one proposal.
 */
struct FundingRecord {
    ProposalId proposal;
    
    /// Contributions are accepted only when set
    bool fundable{false};
    
    /// Contribution window [start, end)
    EpochWindow window;
    
    /// Threshold that unlocks withdrawal
    Amount minGoal{0};
    
    /// Threshold that closes contributions early
    Amount targetGoal{0};
    
    /// Account allowed to withdraw
    AccountId beneficiary;
    
    /// nativeRaised + tokenRaised
    Amount totalRaised{0};
    
    Amount nativeRaised{0};
    
    /// Alternate asset, fixed by the first alternate contribution
    std::optional<AssetId> tokenAsset;
    
    Amount tokenRaised{0};
    
    /// Distinct accounts that ever contributed
    uint32_t funderCount{0};
    
    Epoch createdAt{0};
    
    bool IsMinGoalReached() const { return totalRaised >= minGoal; }
    bool IsTargetReached() const { return totalRaised >= targetGoal; }
    
    std::string ToString() const;
};

/**
 * What one funder has put into one proposal.
 */
struct Contribution {
    Amount nativeAmount{0};
    Amount tokenAmount{0};
    Epoch firstAt{0};
    Epoch lastAt{0};
    uint32_t count{0};
    
    Amount Total() const { return nativeAmount + tokenAmount; }
};

/**
 * Amounts already paid out to the beneficiary.
 */
struct WithdrawalRecord {
    Amount nativeWithdrawn{0};
    Amount tokenWithdrawn{0};
    Epoch lastAt{0};
    uint32_t count{0};
};

// ============================================================================
// Funding Escrow
// ============================================================================

class FundingEscrow {
public:
    /// Funds are held by escrowAccount on ledger
    FundingEscrow(IAssetLedger& ledger, const AccountId& escrowAccount);
    ~FundingEscrow();
    
    /// One-time setup; requires target >= min > 0 and a valid window
    DaoError Initialize(const ActionContext& ctx, const ProposalId& proposal,
                        bool fundable, const EpochWindow& window,
                        Amount minGoal, Amount targetGoal,
                        const AccountId& beneficiary);
    
    /// Move amount of asset (nullopt = native) from ctx.caller into escrow
    DaoError Contribute(const ActionContext& ctx, const ProposalId& proposal,
                        Amount amount, const AssetRef& asset = std::nullopt);
    
    /// Beneficiary takes native currency out after a successful campaign
    DaoError Withdraw(const ActionContext& ctx, const ProposalId& proposal,
                      Amount amount);
    
    /// Beneficiary takes the alternate asset out after a successful campaign
    DaoError WithdrawToken(const ActionContext& ctx, const ProposalId& proposal,
                           Amount amount);
    
    /// Return ctx.caller's native contribution after a failed campaign
    DaoError Refund(const ActionContext& ctx, const ProposalId& proposal);
    
    /// Return ctx.caller's alternate-asset contribution after a failed campaign
    DaoError RefundToken(const ActionContext& ctx, const ProposalId& proposal);
    
    // === Queries ===
    
    std::optional<FundingRecord> GetFunding(const ProposalId& proposal) const;
    
    std::optional<Contribution> GetContribution(const ProposalId& proposal,
                                                const AccountId& funder) const;
    
    std::optional<WithdrawalRecord> GetWithdrawal(const ProposalId& proposal) const;
    
    /// Funders that still hold a contribution record
    std::vector<AccountId> GetFunders(const ProposalId& proposal) const;
    
    /// nativeRaised - nativeWithdrawn
    Amount GetAvailableNative(const ProposalId& proposal) const;
    
    /// tokenRaised - tokenWithdrawn
    Amount GetAvailableToken(const ProposalId& proposal) const;
    
    bool IsMinGoalReached(const ProposalId& proposal) const;
    
    const AccountId& GetEscrowAccount() const { return escrowAccount_; }

private:
    using ContributionKey = std::pair<ProposalId, AccountId>;
    
    DaoError WithdrawLocked(const ActionContext& ctx, const ProposalId& proposal,
                            Amount amount, bool token);
    
    DaoError RefundLocked(const ActionContext& ctx, const ProposalId& proposal,
                          bool token);
    
    IAssetLedger& ledger_;
    AccountId escrowAccount_;
    
    mutable std::mutex mutex_;
    std::map<ProposalId, FundingRecord> funding_;
    std::map<ContributionKey, Contribution> contributions_;
    std::map<ProposalId, WithdrawalRecord> withdrawals_;
};

} // namespace escrow
} // namespace agora

#endif // AGORA_ESCROW_FUNDING_H
