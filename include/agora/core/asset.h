// AGORA - Asset Capability
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Narrow interface to the external fungible-asset service. The escrow
// moves funds through it and the power ledger reads native balances from
// it. An empty asset means the native currency.

#ifndef AGORA_CORE_ASSET_H
#define AGORA_CORE_ASSET_H

#include "agora/core/types.h"

#include <map>
#include <mutex>
#include <optional>
#include <utility>

namespace agora {

/// Optional alternate asset (nullopt = native currency)
using AssetRef = std::optional<AssetId>;

/// Read-only balance source
class IBalanceOracle {
public:
    virtual ~IBalanceOracle() = default;
    
    /// Balance of account in the given asset
    virtual Amount BalanceOf(const AssetRef& asset, const AccountId& account) const = 0;
};

/// Transfer capability. Transfer either moves the full amount and returns
/// true, or moves nothing and returns false.
class IAssetLedger : public IBalanceOracle {
public:
    virtual bool Transfer(const AssetRef& asset, Amount amount,
                          const AccountId& from, const AccountId& to) = 0;
};

/// In-process ledger used by tests and the replay host
class MemoryAssetLedger : public IAssetLedger {
public:
    MemoryAssetLedger() = default;
    
    /// Credit newly created units to an account
    bool Mint(const AssetRef& asset, const AccountId& account, Amount amount);
    
    bool Transfer(const AssetRef& asset, Amount amount,
                  const AccountId& from, const AccountId& to) override;
    
    Amount BalanceOf(const AssetRef& asset, const AccountId& account) const override;
    
    /// Sum of all balances in an asset
    Amount TotalSupply(const AssetRef& asset) const;
    
    /// Make the next count transfers fail regardless of balances
    void FailNextTransfers(int count);
    
    /// Number of transfers that actually moved funds
    uint64_t GetTransferCount() const;

private:
    using Key = std::pair<AssetId, AccountId>;
    
    static Key MakeKey(const AssetRef& asset, const AccountId& account) {
        return {asset.value_or(AssetId()), account};
    }
    
    std::map<Key, Amount> balances_;
    int failNext_{0};
    uint64_t transferCount_{0};
    mutable std::mutex mutex_;
};

} // namespace agora

#endif // AGORA_CORE_ASSET_H
