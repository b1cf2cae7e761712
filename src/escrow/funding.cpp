// AGORA - Proposal Funding Escrow Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/escrow/funding.h"
#include "agora/util/logging.h"

#include <sstream>

namespace agora {
namespace escrow {

std::string FundingRecord::ToString() const {
    std::ostringstream oss;
    oss << "Funding(" << proposal.ToShortHex()
        << ", raised=" << totalRaised << "/" << minGoal << "/" << targetGoal
        << ", funders=" << funderCount
        << ", window=[" << window.start << "," << window.end << "))";
    return oss.str();
}

FundingEscrow::FundingEscrow(IAssetLedger& ledger, const AccountId& escrowAccount)
    : ledger_(ledger), escrowAccount_(escrowAccount) {}

FundingEscrow::~FundingEscrow() = default;

// ============================================================================
// Setup and Contributions
// ============================================================================

DaoError FundingEscrow::Initialize(const ActionContext& ctx, const ProposalId& proposal,
                                   bool fundable, const EpochWindow& window,
                                   Amount minGoal, Amount targetGoal,
                                   const AccountId& beneficiary) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (funding_.count(proposal) > 0) {
        return DaoError::AlreadyExists;
    }
    if (minGoal <= 0 || targetGoal < minGoal || !AmountRange(targetGoal)) {
        return DaoError::InvalidInput;
    }
    if (!window.IsValid() || beneficiary.IsNull()) {
        return DaoError::InvalidInput;
    }
    
    FundingRecord rec;
    rec.proposal = proposal;
    rec.fundable = fundable;
    rec.window = window;
    rec.minGoal = minGoal;
    rec.targetGoal = targetGoal;
    rec.beneficiary = beneficiary;
    rec.createdAt = ctx.now;
    funding_[proposal] = rec;
    
    LOG_INFO(util::LogCategory::ESCROW) << "Initialized " << rec.ToString();
    return DaoError::OK;
}

DaoError FundingEscrow::Contribute(const ActionContext& ctx, const ProposalId& proposal,
                                   Amount amount, const AssetRef& asset) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = funding_.find(proposal);
    if (it == funding_.end()) {
        return DaoError::NotFound;
    }
    FundingRecord& rec = it->second;
    
    if (!rec.fundable || !rec.window.Contains(ctx.now)) {
        return DaoError::InvalidState;
    }
    if (amount <= 0 || (asset && asset->IsNull())) {
        return DaoError::InvalidInput;
    }
    if (rec.IsTargetReached()) {
        return DaoError::GoalReached;
    }
    if (asset && rec.tokenAsset && *rec.tokenAsset != *asset) {
        return DaoError::InvalidInput;
    }
    if (rec.totalRaised > MAX_AMOUNT - amount) {
        return DaoError::InvalidInput;
    }
    
    if (!ledger_.Transfer(asset, amount, ctx.caller, escrowAccount_)) {
        LOG_WARN(util::LogCategory::ESCROW) << "Contribution transfer rejected for "
                                            << proposal.ToShortHex();
        return DaoError::TransferFailed;
    }
    
    if (asset) {
        rec.tokenAsset = *asset;
        rec.tokenRaised += amount;
    } else {
        rec.nativeRaised += amount;
    }
    rec.totalRaised += amount;
    
    auto [cit, inserted] = contributions_.try_emplace(ContributionKey(proposal, ctx.caller));
    Contribution& c = cit->second;
    if (inserted) {
        c.firstAt = ctx.now;
        ++rec.funderCount;
    }
    if (asset) {
        c.tokenAmount += amount;
    } else {
        c.nativeAmount += amount;
    }
    c.lastAt = ctx.now;
    ++c.count;
    
    return DaoError::OK;
}

// ============================================================================
// Withdrawal
// ============================================================================

DaoError FundingEscrow::WithdrawLocked(const ActionContext& ctx, const ProposalId& proposal,
                                       Amount amount, bool token) {
    auto it = funding_.find(proposal);
    if (it == funding_.end()) {
        return DaoError::NotFound;
    }
    FundingRecord& rec = it->second;
    
    if (ctx.caller != rec.beneficiary) {
        return DaoError::Unauthorized;
    }
    if (amount <= 0) {
        return DaoError::InvalidInput;
    }
    if (!rec.window.HasClosed(ctx.now) || !rec.IsMinGoalReached()) {
        return DaoError::InvalidState;
    }
    
    WithdrawalRecord current;
    auto wit = withdrawals_.find(proposal);
    if (wit != withdrawals_.end()) {
        current = wit->second;
    }
    
    Amount available = token ? rec.tokenRaised - current.tokenWithdrawn
                             : rec.nativeRaised - current.nativeWithdrawn;
    if (amount > available) {
        return DaoError::InsufficientFunds;
    }
    
    AssetRef asset = token ? rec.tokenAsset : AssetRef();
    if (!ledger_.Transfer(asset, amount, escrowAccount_, rec.beneficiary)) {
        LOG_WARN(util::LogCategory::ESCROW) << "Withdrawal transfer rejected for "
                                            << proposal.ToShortHex();
        return DaoError::TransferFailed;
    }
    
    WithdrawalRecord& w = withdrawals_[proposal];
    if (token) {
        w.tokenWithdrawn += amount;
    } else {
        w.nativeWithdrawn += amount;
    }
    w.lastAt = ctx.now;
    ++w.count;
    
    return DaoError::OK;
}

DaoError FundingEscrow::Withdraw(const ActionContext& ctx, const ProposalId& proposal,
                                 Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    return WithdrawLocked(ctx, proposal, amount, false);
}

DaoError FundingEscrow::WithdrawToken(const ActionContext& ctx, const ProposalId& proposal,
                                      Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    return WithdrawLocked(ctx, proposal, amount, true);
}

// ============================================================================
// Refund
// ============================================================================

DaoError FundingEscrow::RefundLocked(const ActionContext& ctx, const ProposalId& proposal,
                                     bool token) {
    auto it = funding_.find(proposal);
    if (it == funding_.end()) {
        return DaoError::NotFound;
    }
    FundingRecord& rec = it->second;
    
    if (!rec.window.HasClosed(ctx.now)) {
        return DaoError::InvalidState;
    }
    if (rec.IsMinGoalReached()) {
        return DaoError::GoalReached;
    }
    
    auto cit = contributions_.find({proposal, ctx.caller});
    if (cit == contributions_.end()) {
        return DaoError::NotFound;
    }
    Contribution& c = cit->second;
    
    Amount amount = token ? c.tokenAmount : c.nativeAmount;
    if (amount <= 0) {
        return DaoError::InsufficientFunds;
    }
    
    AssetRef asset = token ? rec.tokenAsset : AssetRef();
    if (!ledger_.Transfer(asset, amount, escrowAccount_, ctx.caller)) {
        LOG_WARN(util::LogCategory::ESCROW) << "Refund transfer rejected for "
                                            << proposal.ToShortHex();
        return DaoError::TransferFailed;
    }
    
    if (token) {
        rec.tokenRaised -= amount;
        c.tokenAmount = 0;
    } else {
        rec.nativeRaised -= amount;
        c.nativeAmount = 0;
    }
    rec.totalRaised -= amount;
    
    if (c.Total() == 0) {
        contributions_.erase(cit);
    }
    
    return DaoError::OK;
}

DaoError FundingEscrow::Refund(const ActionContext& ctx, const ProposalId& proposal) {
    std::lock_guard<std::mutex> lock(mutex_);
    return RefundLocked(ctx, proposal, false);
}

DaoError FundingEscrow::RefundToken(const ActionContext& ctx, const ProposalId& proposal) {
    std::lock_guard<std::mutex> lock(mutex_);
    return RefundLocked(ctx, proposal, true);
}

// ============================================================================
// Queries
// ============================================================================

std::optional<FundingRecord> FundingEscrow::GetFunding(const ProposalId& proposal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = funding_.find(proposal);
    if (it == funding_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Contribution> FundingEscrow::GetContribution(const ProposalId& proposal,
                                                           const AccountId& funder) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contributions_.find({proposal, funder});
    if (it == contributions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<WithdrawalRecord> FundingEscrow::GetWithdrawal(const ProposalId& proposal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = withdrawals_.find(proposal);
    if (it == withdrawals_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AccountId> FundingEscrow::GetFunders(const ProposalId& proposal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AccountId> funders;
    for (auto it = contributions_.lower_bound(ContributionKey(proposal, AccountId()));
         it != contributions_.end() && it->first.first == proposal; ++it) {
        funders.push_back(it->first.second);
    }
    return funders;
}

Amount FundingEscrow::GetAvailableNative(const ProposalId& proposal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = funding_.find(proposal);
    if (it == funding_.end()) {
        return 0;
    }
    auto wit = withdrawals_.find(proposal);
    Amount withdrawn = wit == withdrawals_.end() ? 0 : wit->second.nativeWithdrawn;
    return it->second.nativeRaised - withdrawn;
}

Amount FundingEscrow::GetAvailableToken(const ProposalId& proposal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = funding_.find(proposal);
    if (it == funding_.end()) {
        return 0;
    }
    auto wit = withdrawals_.find(proposal);
    Amount withdrawn = wit == withdrawals_.end() ? 0 : wit->second.tokenWithdrawn;
    return it->second.tokenRaised - withdrawn;
}

bool FundingEscrow::IsMinGoalReached(const ProposalId& proposal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = funding_.find(proposal);
    return it != funding_.end() && it->second.IsMinGoalReached();
}

} // namespace escrow
} // namespace agora
