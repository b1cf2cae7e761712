// AGORA - Voting Power and Delegation Ledger
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Per-(organization, account) voting power plus delegation relationships.
//
// Key rules:
// - Effective power is token + currency + received, or zero while the
//   account has delegated its power away
// - One active delegation per delegator per organization
// - A delegation carries the amount snapshotted when it was granted;
//   later balance changes never alter it
// - Expiry is lazy: an expired delegation keeps counting until something
//   calls CheckExpiry / ExpireFor

#ifndef AGORA_GOVERNANCE_POWER_H
#define AGORA_GOVERNANCE_POWER_H

#include "agora/core/asset.h"
#include "agora/core/clock.h"
#include "agora/core/types.h"

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace agora {
namespace governance {

// ============================================================================
// Records
// ============================================================================

/**
 * Voting power held by one account within one organization.
 */
struct PowerRecord {
    /// Power derived from the account's governance token balance
    Amount tokenPower{0};
    
    /// Power derived from the account's native currency balance
    Amount currencyPower{0};
    
    /// Sum of active delegations pointing at this account
    Amount receivedPower{0};
    
    /// Set while this account has delegated its power away
    std::optional<AccountId> delegateTarget;
    
    /// Epoch of the last balance update
    Epoch lastUpdated{0};
    
    /// Power this account could hand to a delegate
    Amount OwnPower() const { return tokenPower + currencyPower; }
    
    bool HasDelegated() const { return delegateTarget.has_value(); }
};

/**
 * Delegation of one account's own power to another.
 */
struct Delegation {
    OrgId org;
    AccountId delegator;
    AccountId delegate;
    
    /// Own power snapshotted at grant time
    Amount amount{0};
    
    /// Epoch at which the delegation lapses (nullopt = never)
    std::optional<Epoch> expiry;
    
    /// Epoch the delegation was created
    Epoch createdAt{0};
    
    bool IsExpiredAt(Epoch now) const {
        return expiry.has_value() && now >= *expiry;
    }
    
    std::string ToString() const;
};

// ============================================================================
// Power Ledger
// ============================================================================

class PowerLedger {
public:
    /// The oracle supplies native balances for RefreshCurrencyPower
    explicit PowerLedger(const IBalanceOracle& oracle);
    ~PowerLedger();
    
    // === Power ===
    
    /// Vote weight as of now: zero while delegated away
    Power ComputeEffectivePower(const OrgId& org, const AccountId& account) const;
    
    /// Effective power the account would have once ExpireFor(now) ran
    Power PreviewEffectivePower(const OrgId& org, const AccountId& account,
                                Epoch now) const;
    
    /// Overwrite the token component (negative -> InvalidInput)
    DaoError UpdateTokenPower(const OrgId& org, const AccountId& account,
                              Amount power, Epoch now);
    
    /// Overwrite the currency component (negative -> InvalidInput)
    DaoError UpdateCurrencyPower(const OrgId& org, const AccountId& account,
                                 Amount power, Epoch now);
    
    /// Read the account's native balance from the oracle into currency power
    DaoError RefreshCurrencyPower(const OrgId& org, const AccountId& account,
                                  Epoch now);
    
    // === Delegation ===
    
    /**
     * Delegate ctx.caller's own power to delegate.
     *
     * An expired delegation already held by the caller is reclaimed first.
     * Fails with AlreadyExists while another delegation is active, and with
     * InvalidInput for self-delegation, an expiry not after ctx.now, or a
     * caller with nothing to delegate.
     */
    DaoError Delegate(const ActionContext& ctx, const OrgId& org,
                      const AccountId& delegate, std::optional<Epoch> expiry);
    
    /// Remove ctx.caller's delegation and return the power to them
    DaoError Revoke(const ActionContext& ctx, const OrgId& org);
    
    /// Revoke delegator -> delegate if it has expired; returns the amount
    /// reclaimed (0 when nothing changed)
    Amount CheckExpiry(const OrgId& org, const AccountId& delegator,
                       const AccountId& delegate, Epoch now);
    
    /// Apply CheckExpiry to the account's own delegation and to every
    /// delegation it receives; returns the delegations removed
    std::vector<Delegation> ExpireFor(const OrgId& org, const AccountId& account,
                                      Epoch now);
    
    // === Queries ===
    
    std::optional<PowerRecord> GetRecord(const OrgId& org, const AccountId& account) const;
    
    std::optional<Delegation> GetDelegation(const OrgId& org,
                                            const AccountId& delegator) const;
    
    /// Accounts currently delegating to delegate
    std::vector<AccountId> GetDelegators(const OrgId& org,
                                         const AccountId& delegate) const;
    
    /// Sum of received power over every account in the organization
    Amount GetTotalReceived(const OrgId& org) const;
    
    /// Sum of amounts over every active delegation in the organization
    Amount GetTotalDelegated(const OrgId& org) const;
    
    size_t GetDelegationCount(const OrgId& org) const;

private:
    using AccountKey = std::pair<OrgId, AccountId>;
    
    /// Remove a delegation and undo its effects. Caller holds mutex_.
    void RemoveDelegationLocked(std::map<AccountKey, Delegation>::iterator it);
    
    DaoError SetComponentLocked(const OrgId& org, const AccountId& account,
                                Amount power, Epoch now, bool token);
    
    const IBalanceOracle& oracle_;
    
    mutable std::mutex mutex_;
    std::map<AccountKey, PowerRecord> records_;
    std::map<AccountKey, Delegation> delegations_;     // (org, delegator) -> delegation
    std::map<AccountKey, std::set<AccountId>> reverse_; // (org, delegate) -> delegators
};

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_POWER_H
