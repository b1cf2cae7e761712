// AGORA - Voting Power and Delegation Ledger Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/governance/power.h"
#include "agora/util/logging.h"

#include <sstream>

namespace agora {
namespace governance {

std::string Delegation::ToString() const {
    std::ostringstream oss;
    oss << "Delegation(" << delegator.ToShortHex() << " -> " << delegate.ToShortHex()
        << ", amount=" << amount;
    if (expiry) {
        oss << ", expiry=" << *expiry;
    }
    oss << ")";
    return oss.str();
}

PowerLedger::PowerLedger(const IBalanceOracle& oracle) : oracle_(oracle) {}

PowerLedger::~PowerLedger() = default;

// ============================================================================
// Power
// ============================================================================

Power PowerLedger::ComputeEffectivePower(const OrgId& org,
                                         const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = records_.find({org, account});
    if (it == records_.end() || it->second.HasDelegated()) {
        return 0;
    }
    const PowerRecord& rec = it->second;
    return static_cast<Power>(rec.tokenPower) +
           static_cast<Power>(rec.currencyPower) +
           static_cast<Power>(rec.receivedPower);
}

Power PowerLedger::PreviewEffectivePower(const OrgId& org, const AccountId& account,
                                         Epoch now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = records_.find({org, account});
    if (it == records_.end()) {
        return 0;
    }
    const PowerRecord& rec = it->second;
    
    if (rec.HasDelegated()) {
        auto delIt = delegations_.find({org, account});
        if (delIt == delegations_.end() || !delIt->second.IsExpiredAt(now)) {
            return 0;
        }
    }
    
    Amount received = rec.receivedPower;
    auto revIt = reverse_.find({org, account});
    if (revIt != reverse_.end()) {
        for (const AccountId& delegator : revIt->second) {
            auto delIt = delegations_.find({org, delegator});
            if (delIt != delegations_.end() && delIt->second.IsExpiredAt(now)) {
                received -= delIt->second.amount;
            }
        }
    }
    
    return static_cast<Power>(rec.tokenPower) +
           static_cast<Power>(rec.currencyPower) +
           static_cast<Power>(received);
}

DaoError PowerLedger::SetComponentLocked(const OrgId& org, const AccountId& account,
                                         Amount power, Epoch now, bool token) {
    if (!AmountRange(power)) {
        return DaoError::InvalidInput;
    }
    
    PowerRecord& rec = records_[{org, account}];
    if (token) {
        rec.tokenPower = power;
    } else {
        rec.currencyPower = power;
    }
    rec.lastUpdated = now;
    return DaoError::OK;
}

DaoError PowerLedger::UpdateTokenPower(const OrgId& org, const AccountId& account,
                                       Amount power, Epoch now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return SetComponentLocked(org, account, power, now, true);
}

DaoError PowerLedger::UpdateCurrencyPower(const OrgId& org, const AccountId& account,
                                          Amount power, Epoch now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return SetComponentLocked(org, account, power, now, false);
}

DaoError PowerLedger::RefreshCurrencyPower(const OrgId& org, const AccountId& account,
                                           Epoch now) {
    Amount balance = oracle_.BalanceOf(std::nullopt, account);
    
    std::lock_guard<std::mutex> lock(mutex_);
    return SetComponentLocked(org, account, balance, now, false);
}

// ============================================================================
// Delegation
// ============================================================================

void PowerLedger::RemoveDelegationLocked(std::map<AccountKey, Delegation>::iterator it) {
    const Delegation& d = it->second;
    
    auto delegateIt = records_.find({d.org, d.delegate});
    if (delegateIt != records_.end()) {
        delegateIt->second.receivedPower -= d.amount;
    }
    
    auto delegatorIt = records_.find({d.org, d.delegator});
    if (delegatorIt != records_.end()) {
        delegatorIt->second.delegateTarget.reset();
    }
    
    auto revIt = reverse_.find({d.org, d.delegate});
    if (revIt != reverse_.end()) {
        revIt->second.erase(d.delegator);
        if (revIt->second.empty()) {
            reverse_.erase(revIt);
        }
    }
    
    delegations_.erase(it);
}

DaoError PowerLedger::Delegate(const ActionContext& ctx, const OrgId& org,
                               const AccountId& delegate, std::optional<Epoch> expiry) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    const AccountId& delegator = ctx.caller;
    if (delegator == delegate) {
        return DaoError::InvalidInput;
    }
    if (expiry && *expiry <= ctx.now) {
        return DaoError::InvalidInput;
    }
    
    auto existing = delegations_.find({org, delegator});
    bool reclaim = false;
    if (existing != delegations_.end()) {
        if (!existing->second.IsExpiredAt(ctx.now)) {
            return DaoError::AlreadyExists;
        }
        reclaim = true;
    }
    
    auto recIt = records_.find({org, delegator});
    if (recIt == records_.end()) {
        return DaoError::InvalidInput;
    }
    
    // Power as it stands once an expired outgoing delegation is reclaimed
    Amount amount = recIt->second.OwnPower();
    Amount effective = (recIt->second.HasDelegated() && !reclaim)
                           ? 0 : amount + recIt->second.receivedPower;
    if (effective == 0 || amount == 0) {
        return DaoError::InvalidInput;
    }
    
    auto targetIt = records_.find({org, delegate});
    Amount targetReceived = targetIt == records_.end() ? 0 : targetIt->second.receivedPower;
    if (reclaim && existing->second.delegate == delegate) {
        targetReceived -= existing->second.amount;
    }
    if (targetReceived > MAX_AMOUNT - amount) {
        return DaoError::InvalidInput;
    }
    
    if (reclaim) {
        LOG_INFO(util::LogCategory::POWER) << "Reclaimed expired "
                                           << existing->second.ToString();
        RemoveDelegationLocked(existing);
    }
    
    Delegation d;
    d.org = org;
    d.delegator = delegator;
    d.delegate = delegate;
    d.amount = amount;
    d.expiry = expiry;
    d.createdAt = ctx.now;
    
    records_[{org, delegate}].receivedPower += amount;
    records_[{org, delegator}].delegateTarget = delegate;
    reverse_[{org, delegate}].insert(delegator);
    delegations_[{org, delegator}] = d;
    
    return DaoError::OK;
}

DaoError PowerLedger::Revoke(const ActionContext& ctx, const OrgId& org) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = delegations_.find({org, ctx.caller});
    if (it == delegations_.end()) {
        return DaoError::NotFound;
    }
    RemoveDelegationLocked(it);
    return DaoError::OK;
}

Amount PowerLedger::CheckExpiry(const OrgId& org, const AccountId& delegator,
                                const AccountId& delegate, Epoch now) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = delegations_.find({org, delegator});
    if (it == delegations_.end() || it->second.delegate != delegate ||
        !it->second.IsExpiredAt(now)) {
        return 0;
    }
    Amount reclaimed = it->second.amount;
    RemoveDelegationLocked(it);
    return reclaimed;
}

std::vector<Delegation> PowerLedger::ExpireFor(const OrgId& org, const AccountId& account,
                                               Epoch now) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::vector<AccountKey> expired;
    
    auto own = delegations_.find({org, account});
    if (own != delegations_.end() && own->second.IsExpiredAt(now)) {
        expired.push_back(own->first);
    }
    
    auto revIt = reverse_.find({org, account});
    if (revIt != reverse_.end()) {
        for (const AccountId& delegator : revIt->second) {
            auto delIt = delegations_.find({org, delegator});
            if (delIt != delegations_.end() && delIt->second.IsExpiredAt(now)) {
                expired.push_back(delIt->first);
            }
        }
    }
    
    std::vector<Delegation> removed;
    for (const AccountKey& key : expired) {
        auto it = delegations_.find(key);
        if (it == delegations_.end()) {
            continue;
        }
        removed.push_back(it->second);
        RemoveDelegationLocked(it);
    }
    return removed;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<PowerRecord> PowerLedger::GetRecord(const OrgId& org,
                                                  const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find({org, account});
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Delegation> PowerLedger::GetDelegation(const OrgId& org,
                                                     const AccountId& delegator) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = delegations_.find({org, delegator});
    if (it == delegations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AccountId> PowerLedger::GetDelegators(const OrgId& org,
                                                  const AccountId& delegate) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reverse_.find({org, delegate});
    if (it == reverse_.end()) {
        return {};
    }
    return std::vector<AccountId>(it->second.begin(), it->second.end());
}

Amount PowerLedger::GetTotalReceived(const OrgId& org) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount total = 0;
    for (const auto& [key, rec] : records_) {
        if (key.first == org) {
            total += rec.receivedPower;
        }
    }
    return total;
}

Amount PowerLedger::GetTotalDelegated(const OrgId& org) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount total = 0;
    for (const auto& [key, d] : delegations_) {
        if (key.first == org) {
            total += d.amount;
        }
    }
    return total;
}

size_t PowerLedger::GetDelegationCount(const OrgId& org) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [key, d] : delegations_) {
        if (key.first == org) {
            ++count;
        }
    }
    return count;
}

} // namespace governance
} // namespace agora
