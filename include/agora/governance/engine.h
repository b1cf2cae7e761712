// AGORA - Governance Engine
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Facade over the proposal book, the power ledger and the funding escrow.
// The engine owns the logical clock, builds an ActionContext for every
// call, serializes actions, orders validation ahead of every write and
// appends one audit event per successful mutation.

#ifndef AGORA_GOVERNANCE_ENGINE_H
#define AGORA_GOVERNANCE_ENGINE_H

#include "agora/audit/events.h"
#include "agora/core/asset.h"
#include "agora/core/clock.h"
#include "agora/core/types.h"
#include "agora/escrow/funding.h"
#include "agora/governance/power.h"
#include "agora/governance/proposal.h"

#include <functional>
#include <mutex>
#include <optional>

namespace agora {

namespace util {
class ConfigManager;
}

namespace governance {

/// Default escrow account name (hashed into an AccountId)
constexpr const char* DEFAULT_ESCROW_ACCOUNT = "agora.escrow";

/**
 * Engine construction options.
 */
struct EngineOptions {
    /// Limits on proposal text fields
    ProposalLimits limits;
    
    /// Account that holds escrowed funds
    AccountId escrowAccount;
    
    /// Initial clock value
    Epoch startEpoch{0};
    
    EngineOptions();
    
    /// Read [governance] and [escrow] sections; missing keys keep defaults
    static EngineOptions FromConfig(const util::ConfigManager& config);
};

class GovernanceEngine {
public:
    /// Called after a proposal transitions to Executed
    using ExecutionCallback = std::function<void(const Proposal&)>;
    
    explicit GovernanceEngine(IAssetLedger& ledger,
                              const EngineOptions& options = EngineOptions());
    ~GovernanceEngine();
    
    GovernanceEngine(const GovernanceEngine&) = delete;
    GovernanceEngine& operator=(const GovernanceEngine&) = delete;
    
    // === Clock (host only) ===
    
    /// Move the logical clock; going backwards returns InvalidInput
    DaoError SetEpoch(Epoch epoch);
    
    Epoch GetEpoch() const;
    
    // === Proposal Lifecycle ===
    
    /// Register a proposal; on success proposal.id is filled in
    DaoError RegisterProposal(const AccountId& caller, Proposal& proposal);
    
    DaoError ActivateProposal(const AccountId& caller, const ProposalId& id);
    
    /// Vote with the voter's effective power, after lazy delegation expiry
    DaoError CastVote(const AccountId& voter, const ProposalId& id, VoteKind kind);
    
    DaoError FinalizeProposal(const AccountId& caller, const ProposalId& id);
    
    /// Requires Passed and, for funded proposals, a reached minimum goal
    DaoError ExecuteProposal(const AccountId& caller, const ProposalId& id);
    
    DaoError CancelProposal(const AccountId& caller, const ProposalId& id);
    
    // === Power and Delegation ===
    
    DaoError UpdateTokenPower(const OrgId& org, const AccountId& account, Amount power);
    
    DaoError UpdateCurrencyPower(const OrgId& org, const AccountId& account, Amount power);
    
    /// Set currency power from the account's native balance on the ledger
    DaoError RefreshCurrencyPower(const OrgId& org, const AccountId& account);
    
    DaoError Delegate(const AccountId& delegator, const OrgId& org,
                      const AccountId& delegate, std::optional<Epoch> expiry = std::nullopt);
    
    DaoError RevokeDelegation(const AccountId& delegator, const OrgId& org);
    
    /// Reclaim an expired delegation; returns the amount reclaimed
    Amount CheckDelegationExpiry(const OrgId& org, const AccountId& delegator,
                                 const AccountId& delegate);
    
    Power GetEffectivePower(const OrgId& org, const AccountId& account) const;
    
    // === Funding ===
    
    DaoError InitializeFunding(const AccountId& caller, const ProposalId& id,
                               bool fundable, const EpochWindow& window,
                               Amount minGoal, Amount targetGoal,
                               const AccountId& beneficiary);
    
    DaoError Contribute(const AccountId& funder, const ProposalId& id,
                        Amount amount, const AssetRef& asset = std::nullopt);
    
    DaoError Withdraw(const AccountId& caller, const ProposalId& id, Amount amount);
    
    DaoError WithdrawToken(const AccountId& caller, const ProposalId& id, Amount amount);
    
    DaoError Refund(const AccountId& caller, const ProposalId& id);
    
    DaoError RefundToken(const AccountId& caller, const ProposalId& id);
    
    // === Components ===
    
    const ProposalBook& GetProposals() const { return proposals_; }
    const PowerLedger& GetPowerLedger() const { return power_; }
    const escrow::FundingEscrow& GetEscrow() const { return escrow_; }
    audit::AuditLog& GetAuditLog() { return audit_; }
    const audit::AuditLog& GetAuditLog() const { return audit_; }
    
    void SetExecutionCallback(ExecutionCallback callback);

private:
    ActionContext MakeContext(const AccountId& caller) const {
        return ActionContext(caller, clock_.Now());
    }
    
    /// Log a rejected action at debug level and pass the error through
    static DaoError Reject(const char* category, const char* action, DaoError err);
    
    mutable std::mutex mutex_;
    
    LogicalClock clock_;
    
    ProposalBook proposals_;
    PowerLedger power_;
    escrow::FundingEscrow escrow_;
    audit::AuditLog audit_;
    
    ExecutionCallback executionCallback_;
};

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_ENGINE_H
