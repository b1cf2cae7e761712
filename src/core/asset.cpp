// AGORA - Asset Capability Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/core/asset.h"

namespace agora {

bool MemoryAssetLedger::Mint(const AssetRef& asset, const AccountId& account,
                             Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount <= 0) {
        return false;
    }
    Amount& balance = balances_[MakeKey(asset, account)];
    if (balance > MAX_AMOUNT - amount) {
        return false;
    }
    balance += amount;
    return true;
}

bool MemoryAssetLedger::Transfer(const AssetRef& asset, Amount amount,
                                 const AccountId& from, const AccountId& to) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failNext_ > 0) {
        --failNext_;
        return false;
    }
    if (amount <= 0) {
        return false;
    }
    
    auto fromIt = balances_.find(MakeKey(asset, from));
    if (fromIt == balances_.end() || fromIt->second < amount) {
        return false;
    }
    Amount& toBalance = balances_[MakeKey(asset, to)];
    if (from != to && toBalance > MAX_AMOUNT - amount) {
        return false;
    }
    
    fromIt->second -= amount;
    toBalance += amount;
    ++transferCount_;
    return true;
}

Amount MemoryAssetLedger::BalanceOf(const AssetRef& asset,
                                    const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(MakeKey(asset, account));
    return it == balances_.end() ? 0 : it->second;
}

Amount MemoryAssetLedger::TotalSupply(const AssetRef& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    AssetId key = asset.value_or(AssetId());
    Amount total = 0;
    for (const auto& [k, balance] : balances_) {
        if (k.first == key) {
            total += balance;
        }
    }
    return total;
}

void MemoryAssetLedger::FailNextTransfers(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    failNext_ = count;
}

uint64_t MemoryAssetLedger::GetTransferCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transferCount_;
}

} // namespace agora
