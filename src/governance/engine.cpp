// AGORA - Governance Engine Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/governance/engine.h"
#include "agora/crypto/hash.h"
#include "agora/util/config.h"
#include "agora/util/logging.h"

#include <string>

namespace agora {
namespace governance {

namespace {

std::string Str(uint64_t value) { return std::to_string(value); }
std::string Str(int64_t value) { return std::to_string(value); }

} // anonymous namespace

// ============================================================================
// EngineOptions
// ============================================================================

EngineOptions::EngineOptions()
    : escrowAccount(AccountIdFromName(DEFAULT_ESCROW_ACCOUNT)) {}

EngineOptions EngineOptions::FromConfig(const util::ConfigManager& config) {
    using namespace util::ConfigKeys;
    
    EngineOptions options;
    options.limits.maxTitleLength = static_cast<size_t>(config.GetUInt(
        MAX_TITLE_LENGTH, DEFAULT_MAX_TITLE_LENGTH, SECTION_GOVERNANCE));
    options.limits.maxDescriptionLength = static_cast<size_t>(config.GetUInt(
        MAX_DESCRIPTION_LENGTH, DEFAULT_MAX_DESCRIPTION_LENGTH, SECTION_GOVERNANCE));
    
    auto escrowName = config.TryGetString(ESCROW_ACCOUNT, SECTION_ESCROW);
    if (escrowName && !escrowName->empty()) {
        options.escrowAccount = AccountIdFromName(*escrowName);
    }
    
    LOG_DEBUG(util::LogCategory::CONFIG) << "Engine options: maxtitlelength="
                                         << options.limits.maxTitleLength
                                         << " maxdescriptionlength="
                                         << options.limits.maxDescriptionLength
                                         << " escrow=" << options.escrowAccount.ToShortHex();
    return options;
}

// ============================================================================
// GovernanceEngine
// ============================================================================

GovernanceEngine::GovernanceEngine(IAssetLedger& ledger, const EngineOptions& options)
    : clock_(options.startEpoch)
    , proposals_(options.limits)
    , power_(ledger)
    , escrow_(ledger, options.escrowAccount) {}

GovernanceEngine::~GovernanceEngine() = default;

DaoError GovernanceEngine::Reject(const char* category, const char* action, DaoError err) {
    LOG_DEBUG(category) << action << " rejected: " << DaoErrorToString(err);
    return err;
}

void GovernanceEngine::SetExecutionCallback(ExecutionCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    executionCallback_ = std::move(callback);
}

// === Clock ===

DaoError GovernanceEngine::SetEpoch(Epoch epoch) {
    std::lock_guard<std::mutex> lock(mutex_);
    DaoError err = clock_.Set(epoch);
    if (err != DaoError::OK) {
        LOG_WARN(util::LogCategory::GOVERNANCE) << "Refusing to move clock back from "
                                                << clock_.Now() << " to " << epoch;
    }
    return err;
}

Epoch GovernanceEngine::GetEpoch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clock_.Now();
}

// ============================================================================
// Proposal Lifecycle
// ============================================================================

DaoError GovernanceEngine::RegisterProposal(const AccountId& caller, Proposal& proposal) {
    std::lock_guard<std::mutex> lock(mutex_);
    ActionContext ctx = MakeContext(caller);
    
    DaoError err = proposals_.Register(ctx, proposal);
    if (err != DaoError::OK) {
        return Reject(util::LogCategory::GOVERNANCE, "register", err);
    }
    
    audit_.Append(audit::EventKind::ProposalRegistered, ctx.now, caller,
                  {proposal.id.ToHex(), proposal.org.ToHex()},
                  {{"title", proposal.title},
                   {"status", ProposalStatusToString(proposal.status)},
                   {"start", Str(proposal.votingWindow.start)},
                   {"end", Str(proposal.votingWindow.end)},
                   {"min_approval", Str(static_cast<uint64_t>(proposal.minApprovalPercent))},
                   {"funding_goal", Str(proposal.fundingGoal)}});
    return DaoError::OK;
}

DaoError GovernanceEngine::ActivateProposal(const AccountId& caller, const ProposalId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ActionContext ctx = MakeContext(caller);
    
    DaoError err = proposals_.Activate(ctx, id);
    if (err != DaoError::OK) {
        return Reject(util::LogCategory::GOVERNANCE, "activate", err);
    }
    
    audit_.Append(audit::EventKind::ProposalActivated, ctx.now, caller,
                  {id.ToHex()}, {{"status", "ACTIVE"}});
    LOG_INFO(util::LogCategory::GOVERNANCE) << "Activated " << id.ToShortHex();
    return DaoError::OK;
}

DaoError GovernanceEngine::CastVote(const AccountId& voter, const ProposalId& id,
                                    VoteKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    ActionContext ctx = MakeContext(voter);
    
    auto proposal = proposals_.GetProposal(id);
    if (!proposal) {
        return Reject(util::LogCategory::GOVERNANCE, "vote", DaoError::NotFound);
    }
    
    DaoError err = proposals_.CheckCanVote(ctx, id);
    if (err != DaoError::OK) {
        return Reject(util::LogCategory::GOVERNANCE, "vote", err);
    }
    
    // Weight as it will stand once lapsed delegations are reclaimed
    Power preview = power_.PreviewEffectivePower(proposal->org, voter, ctx.now);
    if (preview == 0) {
        return Reject(util::LogCategory::GOVERNANCE, "vote", DaoError::InvalidInput);
    }
    auto tally = proposals_.GetTally(id);
    if (!tally || tally->totalVoted > UINT64_MAX - preview) {
        return Reject(util::LogCategory::GOVERNANCE, "vote", DaoError::InvalidInput);
    }
    
    std::vector<Delegation> reclaimed = power_.ExpireFor(proposal->org, voter, ctx.now);
    Power power = power_.ComputeEffectivePower(proposal->org, voter);
    
    err = proposals_.CastVote(ctx, id, kind, power);
    if (err != DaoError::OK) {
        LOG_ERROR(util::LogCategory::GOVERNANCE) << "Vote failed after validation: "
                                                 << DaoErrorToString(err);
        return err;
    }
    
    Amount reclaimedAmount = 0;
    for (const auto& d : reclaimed) {
        reclaimedAmount += d.amount;
    }
    
    audit_.Append(audit::EventKind::VoteCast, ctx.now, voter,
                  {id.ToHex(), voter.ToHex()},
                  {{"kind", VoteKindToString(kind)},
                   {"power", Str(power)},
                   {"expired_delegations", Str(static_cast<uint64_t>(reclaimed.size()))},
                   {"expired_amount", Str(reclaimedAmount)}});
    LOG_INFO(util::LogCategory::GOVERNANCE) << "Vote " << VoteKindToString(kind)
                                            << " on " << id.ToShortHex()
                                            << " by " << voter.ToShortHex()
                                            << " power=" << power;
    return DaoError::OK;
}

DaoError GovernanceEngine::FinalizeProposal(const AccountId& caller, const ProposalId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ActionContext ctx = MakeContext(caller);
    
    DaoError err = proposals_.Finalize(ctx, id);
    if (err != DaoError::OK) {
        return Reject(util::LogCategory::GOVERNANCE, "finalize", err);
    }
    
    auto proposal = proposals_.GetProposal(id);
    auto tally = proposals_.GetTally(id);
    audit_.Append(audit::EventKind::ProposalFinalized, ctx.now, caller,
                  {id.ToHex()},
                  {{"status", ProposalStatusToString(proposal->status)},
                   {"approval", Str(static_cast<uint64_t>(tally->ApprovalPercent()))},
                   {"yes", Str(tally->yes)},
                   {"no", Str(tally->no)},
                   {"abstain", Str(tally->abstain)}});
    return DaoError::OK;
}

DaoError GovernanceEngine::ExecuteProposal(const AccountId& caller, const ProposalId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ActionContext ctx = MakeContext(caller);
    
    auto proposal = proposals_.GetProposal(id);
    if (!proposal) {
        return Reject(util::LogCategory::GOVERNANCE, "execute", DaoError::NotFound);
    }
    if (proposal->status != ProposalStatus::Passed) {
        return Reject(util::LogCategory::GOVERNANCE, "execute", DaoError::InvalidState);
    }
    if (proposal->fundingGoal > 0 && !escrow_.IsMinGoalReached(id)) {
        return Reject(util::LogCategory::GOVERNANCE, "execute", DaoError::GoalNotReached);
    }
    
    DaoError err = proposals_.Execute(ctx, id);
    if (err != DaoError::OK) {
        return Reject(util::LogCategory::GOVERNANCE, "execute", err);
    }
    proposal->status = ProposalStatus::Executed;
    
    audit_.Append(audit::EventKind::ProposalExecuted, ctx.now, caller,
                  {id.ToHex()},
                  {{"status", "EXECUTED"},
                   {"payload_size", Str(static_cast<uint64_t>(proposal->payload.size()))}});
    LOG_INFO(util::LogCategory::GOVERNANCE) << "Executed " << proposal->ToString();
    
    if (executionCallback_) {
        try {
            executionCallback_(*proposal);
        } catch (const std::exception& e) {
            LOG_ERROR(util::LogCategory::GOVERNANCE) << "Execution handler failed for "
                                                     << id.ToShortHex() << ": " << e.what();
        }
    }
    return DaoError::OK;
}

DaoError GovernanceEngine::CancelProposal(const AccountId& caller, const ProposalId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ActionContext ctx = MakeContext(caller);
    
    DaoError err = proposals_.Cancel(ctx, id);
    if (err != DaoError::OK) {
        return Reject(util::LogCategory::GOVERNANCE, "cancel", err);
    }
    
    audit_.Append(audit::EventKind::ProposalCanceled, ctx.now, caller,
                  {id.ToHex()}, {{"status", "CANCELED"}});
    LOG_INFO(util::LogCategory::GOVERNANCE) << "Canceled " << id.ToShortHex();
    return DaoError::OK;
}

// ============================================================================
// Power and Delegation
// ============================================================================

DaoError GovernanceEngine::UpdateTokenPower(const OrgId& org, const AccountId& account,
                                            Amount power) {
    std::lock_guard<std::mutex> lock(mutex_);
    Epoch now = clock_.Now();
    
    DaoError err = power_.UpdateTokenPower(org, account, power, now);
    if (err != DaoError::OK) {
        return Reject(util::LogCategory::POWER, "token power", err);
    }
    
    audit_.Append(audit::EventKind::TokenPowerUpdated, now, account,
                  {org.ToHex(), account.ToHex()}, {{"token_power", Str(power)}});
    return DaoError::OK;
}

DaoError GovernanceEngine::UpdateCurrencyPower(const OrgId& org, const AccountId& account,
                                               Amount power) {
    std::lock_guard<std::mutex> lock(mutex_);
    Epoch now = clock_.Now();
    
    DaoError err = power_.UpdateCurrencyPower(org, account, power, now);
    if (err != DaoError::OK) {
        return Reject(util::LogCategory::POWER, "currency power", err);
    }
    
    audit_.Append(audit::EventKind::CurrencyPowerUpdated, now, account,
                  {org.ToHex(), account.ToHex()}, {{"currency_power", Str(power)}});
    return DaoError::OK;
}

DaoError GovernanceEngine::RefreshCurrencyPower(const OrgId& org, const AccountId& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    Epoch now = clock_.Now();
    
    DaoError err = power_.RefreshCurrencyPower(org, account, now);
    if (err != DaoError::OK) {
        return Reject(util::LogCategory::POWER, "refresh", err);
    }
    
    auto rec = power_.GetRecord(org, account);
    audit_.Append(audit::EventKind::CurrencyPowerUpdated, now, account,
                  {org.ToHex(), account.ToHex()},
                  {{"currency_power", Str(rec ? rec->currencyPower : 0)},
                   {"source", "ledger"}});
    return DaoError::OK;
}

DaoError GovernanceEngine::Delegate(const AccountId& delegator, const OrgId& org,
                                    const AccountId& delegate, std::optional<Epoch> expiry) {
    std::lock_guard<std::mutex> lock(mutex_);
    ActionContext ctx = MakeContext(delegator);
    
    auto previous = power_.GetDelegation(org, delegator);
    
    DaoError err = power_.Delegate(ctx, org, delegate, expiry);
    if (err != DaoError::OK) {
        return Reject(util::LogCategory::POWER, "delegate", err);
    }
    
    auto created = power_.GetDelegation(org, delegator);
    audit::FieldMap fields{{"amount", Str(created->amount)},
                           {"expiry", expiry ? Str(*expiry) : std::string("none")}};
    if (previous) {
        fields["reclaimed_from"] = previous->delegate.ToHex();
        fields["reclaimed_amount"] = Str(previous->amount);
    }
    audit_.Append(audit::EventKind::DelegationCreated, ctx.now, delegator,
                  {org.ToHex(), delegator.ToHex(), delegate.ToHex()}, std::move(fields));
    LOG_INFO(util::LogCategory::POWER) << "Created " << created->ToString();
    return DaoError::OK;
}

DaoError GovernanceEngine::RevokeDelegation(const AccountId& delegator, const OrgId& org) {
    std::lock_guard<std::mutex> lock(mutex_);
    ActionContext ctx = MakeContext(delegator);
    
    auto existing = power_.GetDelegation(org, delegator);
    
    DaoError err = power_.Revoke(ctx, org);
    if (err != DaoError::OK) {
        return Reject(util::LogCategory::POWER, "revoke", err);
    }
    
    audit_.Append(audit::EventKind::DelegationRevoked, ctx.now, delegator,
                  {org.ToHex(), delegator.ToHex(), existing->delegate.ToHex()},
                  {{"amount", Str(existing->amount)}});
    LOG_INFO(util::LogCategory::POWER) << "Revoked " << existing->ToString();
    return DaoError::OK;
}

Amount GovernanceEngine::CheckDelegationExpiry(const OrgId& org, const AccountId& delegator,
                                               const AccountId& delegate) {
    std::lock_guard<std::mutex> lock(mutex_);
    Epoch now = clock_.Now();
    
    Amount reclaimed = power_.CheckExpiry(org, delegator, delegate, now);
    if (reclaimed > 0) {
        audit_.Append(audit::EventKind::DelegationExpired, now, delegator,
                      {org.ToHex(), delegator.ToHex(), delegate.ToHex()},
                      {{"amount", Str(reclaimed)}});
        LOG_INFO(util::LogCategory::POWER) << "Expired delegation "
                                           << delegator.ToShortHex() << " -> "
                                           << delegate.ToShortHex() << " (" << reclaimed << ")";
    }
    return reclaimed;
}

Power GovernanceEngine::GetEffectivePower(const OrgId& org, const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return power_.ComputeEffectivePower(org, account);
}

// ============================================================================
// Funding
// ============================================================================

DaoError GovernanceEngine::InitializeFunding(const AccountId& caller, const ProposalId& id,
                                             bool fundable, const EpochWindow& window,
                                             Amount minGoal, Amount targetGoal,
                                             const AccountId& beneficiary) {
    std::lock_guard<std::mutex> lock(mutex_);
    ActionContext ctx = MakeContext(caller);
    
    auto proposal = proposals_.GetProposal(id);
    if (!proposal) {
        return Reject(util::LogCategory::ESCROW, "fund", DaoError::NotFound);
    }
    if (!proposal->IsManagedBy(caller)) {
        return Reject(util::LogCategory::ESCROW, "fund", DaoError::Unauthorized);
    }
    if (proposal->status != ProposalStatus::Draft &&
        proposal->status != ProposalStatus::Active) {
        return Reject(util::LogCategory::ESCROW, "fund", DaoError::InvalidState);
    }
    // Reaching the escrow minimum must mean the proposal's goal is covered
    if (minGoal < proposal->fundingGoal) {
        return Reject(util::LogCategory::ESCROW, "fund", DaoError::InvalidInput);
    }
    
    DaoError err = escrow_.Initialize(ctx, id, fundable, window, minGoal, targetGoal,
                                      beneficiary);
    if (err != DaoError::OK) {
        return Reject(util::LogCategory::ESCROW, "fund", err);
    }
    
    audit_.Append(audit::EventKind::FundingInitialized, ctx.now, caller,
                  {id.ToHex(), beneficiary.ToHex()},
                  {{"fundable", fundable ? "true" : "false"},
                   {"start", Str(window.start)},
                   {"end", Str(window.end)},
                   {"min_goal", Str(minGoal)},
                   {"target_goal", Str(targetGoal)}});
    return DaoError::OK;
}

DaoError GovernanceEngine::Contribute(const AccountId& funder, const ProposalId& id,
                                      Amount amount, const AssetRef& asset) {
    std::lock_guard<std::mutex> lock(mutex_);
    ActionContext ctx = MakeContext(funder);
    
    DaoError err = escrow_.Contribute(ctx, id, amount, asset);
    if (err != DaoError::OK) {
        return Reject(util::LogCategory::ESCROW, "contribute", err);
    }
    
    auto rec = escrow_.GetFunding(id);
    audit_.Append(audit::EventKind::ContributionReceived, ctx.now, funder,
                  {id.ToHex(), funder.ToHex()},
                  {{"amount", Str(amount)},
                   {"asset", asset ? asset->ToHex() : std::string("native")},
                   {"total_raised", Str(rec->totalRaised)},
                   {"funder_count", Str(static_cast<uint64_t>(rec->funderCount))}});
    LOG_INFO(util::LogCategory::ESCROW) << "Contribution of " << amount << " to "
                                        << id.ToShortHex() << " by " << funder.ToShortHex();
    return DaoError::OK;
}

DaoError GovernanceEngine::Withdraw(const AccountId& caller, const ProposalId& id,
                                    Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    ActionContext ctx = MakeContext(caller);
    
    DaoError err = escrow_.Withdraw(ctx, id, amount);
    if (err != DaoError::OK) {
        return Reject(util::LogCategory::ESCROW, "withdraw", err);
    }
    
    auto w = escrow_.GetWithdrawal(id);
    audit_.Append(audit::EventKind::NativeWithdrawn, ctx.now, caller,
                  {id.ToHex(), caller.ToHex()},
                  {{"amount", Str(amount)},
                   {"withdrawn", Str(w->nativeWithdrawn)}});
    LOG_INFO(util::LogCategory::ESCROW) << "Withdrew " << amount << " from " << id.ToShortHex();
    return DaoError::OK;
}

DaoError GovernanceEngine::WithdrawToken(const AccountId& caller, const ProposalId& id,
                                         Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    ActionContext ctx = MakeContext(caller);
    
    DaoError err = escrow_.WithdrawToken(ctx, id, amount);
    if (err != DaoError::OK) {
        return Reject(util::LogCategory::ESCROW, "withdraw token", err);
    }
    
    auto w = escrow_.GetWithdrawal(id);
    audit_.Append(audit::EventKind::TokenWithdrawn, ctx.now, caller,
                  {id.ToHex(), caller.ToHex()},
                  {{"amount", Str(amount)},
                   {"withdrawn", Str(w->tokenWithdrawn)}});
    LOG_INFO(util::LogCategory::ESCROW) << "Withdrew " << amount << " tokens from "
                                        << id.ToShortHex();
    return DaoError::OK;
}

DaoError GovernanceEngine::Refund(const AccountId& caller, const ProposalId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ActionContext ctx = MakeContext(caller);
    
    auto before = escrow_.GetContribution(id, caller);
    
    DaoError err = escrow_.Refund(ctx, id);
    if (err != DaoError::OK) {
        return Reject(util::LogCategory::ESCROW, "refund", err);
    }
    
    audit_.Append(audit::EventKind::NativeRefunded, ctx.now, caller,
                  {id.ToHex(), caller.ToHex()},
                  {{"amount", Str(before->nativeAmount)}});
    LOG_INFO(util::LogCategory::ESCROW) << "Refunded " << before->nativeAmount << " to "
                                        << caller.ToShortHex();
    return DaoError::OK;
}

DaoError GovernanceEngine::RefundToken(const AccountId& caller, const ProposalId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ActionContext ctx = MakeContext(caller);
    
    auto before = escrow_.GetContribution(id, caller);
    
    DaoError err = escrow_.RefundToken(ctx, id);
    if (err != DaoError::OK) {
        return Reject(util::LogCategory::ESCROW, "refund token", err);
    }
    
    audit_.Append(audit::EventKind::TokenRefunded, ctx.now, caller,
                  {id.ToHex(), caller.ToHex()},
                  {{"amount", Str(before->tokenAmount)}});
    LOG_INFO(util::LogCategory::ESCROW) << "Refunded " << before->tokenAmount
                                        << " tokens to " << caller.ToShortHex();
    return DaoError::OK;
}

} // namespace governance
} // namespace agora
