// AGORA - Audit Event Stream
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Append-only log of successful state-mutating actions. Each event is
// chained to its predecessor by a SHA-256 digest so any later edit of a
// stored event is detectable with Verify().

#ifndef AGORA_AUDIT_EVENTS_H
#define AGORA_AUDIT_EVENTS_H

#include "agora/core/types.h"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agora {
namespace audit {

// ============================================================================
// Event Kinds
// ============================================================================

enum class EventKind {
    ProposalRegistered,
    ProposalActivated,
    VoteCast,
    ProposalFinalized,
    ProposalExecuted,
    ProposalCanceled,
    TokenPowerUpdated,
    CurrencyPowerUpdated,
    DelegationCreated,
    DelegationRevoked,
    DelegationExpired,
    FundingInitialized,
    ContributionReceived,
    NativeWithdrawn,
    TokenWithdrawn,
    NativeRefunded,
    TokenRefunded,
};

/// Convert event kind to string
const char* EventKindToString(EventKind kind);

/// Ordered key/value pairs describing what changed
using FieldMap = std::map<std::string, std::string>;

// ============================================================================
// Audit Event
// ============================================================================

struct AuditEvent {
    /// Position in the log, starting at 0
    uint64_t sequence{0};
    
    EventKind kind{EventKind::ProposalRegistered};
    
    /// Logical time of the action
    Epoch epoch{0};
    
    /// Account that performed the action
    AccountId actor;
    
    /// Hex ids of the records touched (proposal, organization, accounts)
    std::vector<std::string> subjects;
    
    /// Changed fields
    FieldMap fields;
    
    /// Digest of the previous event (null for the first)
    Hash256 prevDigest;
    
    /// SHA256 over prevDigest and the length-suffixed fields above
    Hash256 digest;
    
    /// Recompute the digest from the other fields
    Hash256 ComputeDigest() const;
    
    /// Get human-readable description
    std::string ToString() const;
};

// ============================================================================
// Audit Log
// ============================================================================

class AuditLog {
public:
    using Subscriber = std::function<void(const AuditEvent&)>;
    
    AuditLog();
    ~AuditLog();
    
    /// Append a new event, chain it, and notify subscribers
    AuditEvent Append(EventKind kind, Epoch epoch, const AccountId& actor,
                      std::vector<std::string> subjects, FieldMap fields);
    
    /// Register a subscriber; returns a handle for Unsubscribe
    uint64_t Subscribe(Subscriber subscriber);
    
    void Unsubscribe(uint64_t handle);
    
    size_t Size() const;
    
    std::optional<AuditEvent> Get(uint64_t sequence) const;
    
    std::vector<AuditEvent> GetEvents() const;
    
    /// Events of one kind, in order
    std::vector<AuditEvent> GetEventsByKind(EventKind kind) const;
    
    /// Digest of the newest event (null when empty)
    Hash256 GetHeadDigest() const;
    
    /// Recompute the chain; returns the sequence of the first broken event
    std::optional<uint64_t> FindBrokenLink() const;
    
    bool Verify() const { return !FindBrokenLink().has_value(); }

private:
    friend class AuditLogTestAccess;
    
    mutable std::mutex mutex_;
    std::vector<AuditEvent> events_;
    std::map<uint64_t, Subscriber> subscribers_;
    uint64_t nextHandle_{1};
};

} // namespace audit
} // namespace agora

#endif // AGORA_AUDIT_EVENTS_H
