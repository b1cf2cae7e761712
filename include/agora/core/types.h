// AGORA - Core Types Header
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// This file defines fundamental types used throughout AGORA: amounts,
// logical time, opaque account handles and the error taxonomy shared by
// every governance component.

#ifndef AGORA_CORE_TYPES_H
#define AGORA_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace agora {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in smallest asset units
using Amount = int64_t;

/// Voting power (always non-negative)
using Power = uint64_t;

/// Logical clock value supplied by the host ("epoch counter")
using Epoch = uint64_t;

/// Largest amount any single record may hold
constexpr Amount MAX_AMOUNT = INT64_MAX / 4;

/// Check if amount is in valid range
inline bool AmountRange(Amount value) {
    return value >= 0 && value <= MAX_AMOUNT;
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size opaque byte string
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;
    
    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }
    
    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept 
        : data_(data) {}
    
    /// Construct from raw bytes (truncated or zero-padded to SIZE)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }
    
    /// Check if all bytes are zero
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }
    
    void SetNull() noexcept {
        data_.fill(0);
    }
    
    constexpr size_t size() const noexcept { return SIZE; }
    
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }
    
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }
    
    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }
    
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }
    
    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }
    
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }
    
    /// Lower-case hex, first byte first
    std::string ToHex() const;
    
    /// Short hex prefix for log lines
    std::string ToShortHex() const { return ToHex().substr(0, 12); }
    
    /// Parse from hex (throws std::invalid_argument on malformed input)
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit digest (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}
};

/// 160-bit handle (20 bytes)
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& base) : BaseHash<160>(base) {}
};

// ============================================================================
// Type-safe Handles
// ============================================================================

/// Account handle (also used for organizations)
using AccountId = Hash160;

/// Organization that owns proposals
using OrgId = AccountId;

/// Alternate fungible asset identity
class AssetId : public Hash160 {
public:
    using Hash160::Hash160;
    AssetId() = default;
    explicit AssetId(const Hash160& h) : Hash160(h) {}
};

/// Proposal handle
class ProposalId : public Hash160 {
public:
    using Hash160::Hash160;
    ProposalId() = default;
    explicit ProposalId(const Hash160& h) : Hash160(h) {}
};

// ============================================================================
// Error Taxonomy
// ============================================================================

/// Outcome of every state-mutating governance action
enum class DaoError {
    OK = 0,
    
    /// Caller lacks the required role (proposer, organization, beneficiary)
    Unauthorized,
    
    /// Referenced proposal, delegation, funding record or contribution absent
    NotFound,
    
    /// Operation outside its valid lifecycle state or time window
    InvalidState,
    
    /// Zero/negative amount, malformed percentage, empty string, bad goals
    InvalidInput,
    
    /// Duplicate vote, duplicate active delegation, double initialization
    AlreadyExists,
    
    /// Funding target (or minimum, for refunds) already reached
    GoalReached,
    
    /// Funding minimum not reached
    GoalNotReached,
    
    /// Withdrawal or refund exceeds available balance
    InsufficientFunds,
    
    /// External asset transfer rejected
    TransferFailed,
};

/// Convert error to string
const char* DaoErrorToString(DaoError err);

} // namespace agora

#endif // AGORA_CORE_TYPES_H
