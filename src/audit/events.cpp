// AGORA - Audit Event Stream Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/audit/events.h"
#include "agora/crypto/hash.h"
#include "agora/util/logging.h"

#include <sstream>

namespace agora {
namespace audit {

const char* EventKindToString(EventKind kind) {
    switch (kind) {
        case EventKind::ProposalRegistered:   return "proposal.registered";
        case EventKind::ProposalActivated:    return "proposal.activated";
        case EventKind::VoteCast:             return "vote.cast";
        case EventKind::ProposalFinalized:    return "proposal.finalized";
        case EventKind::ProposalExecuted:     return "proposal.executed";
        case EventKind::ProposalCanceled:     return "proposal.canceled";
        case EventKind::TokenPowerUpdated:    return "power.token";
        case EventKind::CurrencyPowerUpdated: return "power.currency";
        case EventKind::DelegationCreated:    return "delegation.created";
        case EventKind::DelegationRevoked:    return "delegation.revoked";
        case EventKind::DelegationExpired:    return "delegation.expired";
        case EventKind::FundingInitialized:   return "funding.initialized";
        case EventKind::ContributionReceived: return "funding.contribution";
        case EventKind::NativeWithdrawn:      return "funding.withdraw";
        case EventKind::TokenWithdrawn:       return "funding.withdraw_token";
        case EventKind::NativeRefunded:       return "funding.refund";
        case EventKind::TokenRefunded:        return "funding.refund_token";
    }
    return "unknown";
}

// ============================================================================
// AuditEvent
// ============================================================================

Hash256 AuditEvent::ComputeDigest() const {
    SHA256 hasher;
    hasher.Write(prevDigest.data(), prevDigest.size());
    hasher.WriteU64(sequence);
    hasher.WriteField(EventKindToString(kind));
    hasher.WriteU64(epoch);
    hasher.Write(actor.data(), actor.size());
    
    // Every subject, key and value is length-suffixed so that no value can
    // be re-read as a field boundary.
    hasher.WriteU64(subjects.size());
    for (const auto& subject : subjects) {
        hasher.WriteField(subject);
    }
    hasher.WriteU64(fields.size());
    for (const auto& [key, value] : fields) {
        hasher.WriteField(key);
        hasher.WriteField(value);
    }
    return hasher.Finalize();
}

std::string AuditEvent::ToString() const {
    std::ostringstream oss;
    oss << "#" << sequence << " " << EventKindToString(kind)
        << " epoch=" << epoch
        << " actor=" << actor.ToShortHex();
    for (const auto& [key, value] : fields) {
        oss << " " << key << "=" << value;
    }
    return oss.str();
}

// ============================================================================
// AuditLog
// ============================================================================

AuditLog::AuditLog() = default;
AuditLog::~AuditLog() = default;

AuditEvent AuditLog::Append(EventKind kind, Epoch epoch, const AccountId& actor,
                            std::vector<std::string> subjects, FieldMap fields) {
    AuditEvent event;
    std::vector<Subscriber> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        
        event.sequence = events_.size();
        event.kind = kind;
        event.epoch = epoch;
        event.actor = actor;
        event.subjects = std::move(subjects);
        event.fields = std::move(fields);
        if (!events_.empty()) {
            event.prevDigest = events_.back().digest;
        }
        event.digest = event.ComputeDigest();
        events_.push_back(event);
        
        targets.reserve(subscribers_.size());
        for (const auto& [handle, subscriber] : subscribers_) {
            targets.push_back(subscriber);
        }
    }
    
    LOG_DEBUG(util::LogCategory::AUDIT) << event.ToString();
    
    for (const auto& subscriber : targets) {
        try {
            subscriber(event);
        } catch (const std::exception& e) {
            LOG_WARN(util::LogCategory::AUDIT) << "Subscriber failed on event #"
                                               << event.sequence << ": " << e.what();
        }
    }
    
    return event;
}

uint64_t AuditLog::Subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t handle = nextHandle_++;
    subscribers_[handle] = std::move(subscriber);
    return handle;
}

void AuditLog::Unsubscribe(uint64_t handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(handle);
}

size_t AuditLog::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

std::optional<AuditEvent> AuditLog::Get(uint64_t sequence) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sequence >= events_.size()) {
        return std::nullopt;
    }
    return events_[sequence];
}

std::vector<AuditEvent> AuditLog::GetEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::vector<AuditEvent> AuditLog::GetEventsByKind(EventKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditEvent> result;
    for (const auto& event : events_) {
        if (event.kind == kind) {
            result.push_back(event);
        }
    }
    return result;
}

Hash256 AuditLog::GetHeadDigest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.empty() ? Hash256() : events_.back().digest;
}

std::optional<uint64_t> AuditLog::FindBrokenLink() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Hash256 prev;
    for (const auto& event : events_) {
        if (event.prevDigest != prev || event.ComputeDigest() != event.digest) {
            return event.sequence;
        }
        prev = event.digest;
    }
    return std::nullopt;
}

} // namespace audit
} // namespace agora
