// AGORA - Proposal Lifecycle Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/governance/proposal.h"
#include "agora/crypto/hash.h"
#include "agora/util/logging.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace agora {
namespace governance {

// ============================================================================
// Enumerations
// ============================================================================

const char* ProposalStatusToString(ProposalStatus status) {
    switch (status) {
        case ProposalStatus::Draft:    return "DRAFT";
        case ProposalStatus::Active:   return "ACTIVE";
        case ProposalStatus::Passed:   return "PASSED";
        case ProposalStatus::Rejected: return "REJECTED";
        case ProposalStatus::Executed: return "EXECUTED";
        case ProposalStatus::Canceled: return "CANCELED";
    }
    return "UNKNOWN";
}

const char* VoteKindToString(VoteKind kind) {
    switch (kind) {
        case VoteKind::Yes:     return "YES";
        case VoteKind::No:      return "NO";
        case VoteKind::Abstain: return "ABSTAIN";
    }
    return "UNKNOWN";
}

std::optional<VoteKind> ParseVoteKind(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    
    if (lower == "yes") return VoteKind::Yes;
    if (lower == "no") return VoteKind::No;
    if (lower == "abstain") return VoteKind::Abstain;
    return std::nullopt;
}

// ============================================================================
// Records
// ============================================================================

std::string Proposal::ToString() const {
    std::ostringstream oss;
    oss << "Proposal(" << id.ToShortHex()
        << ", \"" << title << "\""
        << ", status=" << ProposalStatusToString(status)
        << ", window=[" << votingWindow.start << "," << votingWindow.end << ")"
        << ", minApproval=" << minApprovalPercent << "%";
    if (fundingGoal > 0) {
        oss << ", fundingGoal=" << fundingGoal;
    }
    oss << ")";
    return oss.str();
}

namespace {

/// floor(r * k / d) for r < d, using only 64-bit arithmetic
uint64_t ScaledFraction(uint64_t r, uint64_t d, uint32_t k) {
    uint64_t q = 0, rem = 0;        // accumulated r * k as q * d + rem
    uint64_t stepQ = 0, stepRem = r; // r * 2^i as stepQ * d + stepRem
    while (k > 0) {
        if (k & 1) {
            q += stepQ;
            if (rem >= d - stepRem) {
                rem -= d - stepRem;
                ++q;
            } else {
                rem += stepRem;
            }
        }
        k >>= 1;
        if (k > 0) {
            stepQ *= 2;
            if (stepRem >= d - stepRem) {
                stepRem -= d - stepRem;
                ++stepQ;
            } else {
                stepRem += stepRem;
            }
        }
    }
    return q;
}

} // namespace

uint32_t VoteTally::ApprovalPercent() const {
    uint64_t y = yes;
    uint64_t n = no;
    if (y > UINT64_MAX - n) {
        // CastVote keeps the sum in range; halve hand-built tallies
        y >>= 1;
        n >>= 1;
    }
    uint64_t decided = y + n;
    if (decided == 0) {
        return 0;
    }
    uint64_t whole = y / decided;
    uint64_t rest = y % decided;
    return static_cast<uint32_t>(whole * 100 + ScaledFraction(rest, decided, 100));
}

// ============================================================================
// ProposalBook
// ============================================================================

ProposalBook::ProposalBook(const ProposalLimits& limits) : limits_(limits) {}

ProposalBook::~ProposalBook() = default;

ProposalId ProposalBook::DeriveId(const Proposal& proposal, Epoch now) const {
    SHA256 hasher;
    hasher.Write(proposal.org.data(), proposal.org.size());
    hasher.Write(proposal.proposer.data(), proposal.proposer.size());
    hasher.WriteField(proposal.title);
    hasher.WriteU64(now);
    hasher.WriteU64(sequence_);
    return ProposalId(Truncate160(hasher.Finalize()));
}

DaoError ProposalBook::Register(const ActionContext& ctx, Proposal& proposal) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (proposal.org.IsNull() || proposal.proposer.IsNull()) {
        return DaoError::InvalidInput;
    }
    if (!proposal.IsManagedBy(ctx.caller)) {
        return DaoError::Unauthorized;
    }
    if (proposal.title.empty() || proposal.title.size() > limits_.maxTitleLength) {
        return DaoError::InvalidInput;
    }
    if (proposal.description.size() > limits_.maxDescriptionLength) {
        return DaoError::InvalidInput;
    }
    if (!proposal.votingWindow.IsValid() || proposal.minApprovalPercent > 100) {
        return DaoError::InvalidInput;
    }
    if (!AmountRange(proposal.fundingGoal)) {
        return DaoError::InvalidInput;
    }
    
    ProposalId id = DeriveId(proposal, ctx.now);
    if (proposals_.count(id) > 0) {
        return DaoError::AlreadyExists;
    }
    
    ++sequence_;
    proposal.id = id;
    proposal.status = ProposalStatus::Draft;
    proposal.createdAt = ctx.now;
    
    proposals_[id] = proposal;
    tallies_[id] = VoteTally();
    
    LOG_INFO(util::LogCategory::GOVERNANCE) << "Registered " << proposal.ToString();
    return DaoError::OK;
}

DaoError ProposalBook::Activate(const ActionContext& ctx, const ProposalId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return DaoError::NotFound;
    }
    Proposal& proposal = it->second;
    
    if (!proposal.IsManagedBy(ctx.caller)) {
        return DaoError::Unauthorized;
    }
    if (proposal.status != ProposalStatus::Draft) {
        return DaoError::InvalidState;
    }
    
    proposal.status = ProposalStatus::Active;
    return DaoError::OK;
}

DaoError ProposalBook::CheckCanVoteLocked(const ActionContext& ctx,
                                          const ProposalId& id) const {
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return DaoError::NotFound;
    }
    const Proposal& proposal = it->second;
    
    if (proposal.status != ProposalStatus::Active ||
        !proposal.votingWindow.Contains(ctx.now)) {
        return DaoError::InvalidState;
    }
    if (votes_.count(VoteKey(id, ctx.caller)) > 0) {
        return DaoError::AlreadyExists;
    }
    return DaoError::OK;
}

DaoError ProposalBook::CheckCanVote(const ActionContext& ctx, const ProposalId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CheckCanVoteLocked(ctx, id);
}

DaoError ProposalBook::CastVote(const ActionContext& ctx, const ProposalId& id,
                                VoteKind kind, Power power) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    DaoError err = CheckCanVoteLocked(ctx, id);
    if (err != DaoError::OK) {
        return err;
    }
    if (power == 0) {
        return DaoError::InvalidInput;
    }
    
    VoteTally& tally = tallies_[id];
    Power* bucket = nullptr;
    switch (kind) {
        case VoteKind::Yes:     bucket = &tally.yes; break;
        case VoteKind::No:      bucket = &tally.no; break;
        case VoteKind::Abstain: bucket = &tally.abstain; break;
    }
    if (bucket == nullptr) {
        return DaoError::InvalidInput;
    }
    if (tally.totalVoted > UINT64_MAX - power) {
        return DaoError::InvalidInput;
    }
    
    VoteRecord record;
    record.kind = kind;
    record.power = power;
    record.castAt = ctx.now;
    votes_[VoteKey(id, ctx.caller)] = record;
    
    *bucket += power;
    tally.totalVoted += power;
    ++tally.voterCount;
    
    return DaoError::OK;
}

DaoError ProposalBook::Finalize(const ActionContext& ctx, const ProposalId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return DaoError::NotFound;
    }
    Proposal& proposal = it->second;
    
    if (proposal.status != ProposalStatus::Active ||
        !proposal.votingWindow.HasClosed(ctx.now)) {
        return DaoError::InvalidState;
    }
    
    uint32_t approval = tallies_[id].ApprovalPercent();
    proposal.status = approval >= proposal.minApprovalPercent
                          ? ProposalStatus::Passed
                          : ProposalStatus::Rejected;
    
    LOG_INFO(util::LogCategory::GOVERNANCE) << "Finalized " << id.ToShortHex()
                                            << " approval=" << approval << "% -> "
                                            << ProposalStatusToString(proposal.status);
    return DaoError::OK;
}

DaoError ProposalBook::Execute(const ActionContext& ctx, const ProposalId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return DaoError::NotFound;
    }
    if (it->second.status != ProposalStatus::Passed) {
        return DaoError::InvalidState;
    }
    
    it->second.status = ProposalStatus::Executed;
    LOG_DEBUG(util::LogCategory::GOVERNANCE) << "Execution of " << id.ToShortHex()
                                             << " triggered by " << ctx.caller.ToShortHex()
                                             << " at epoch " << ctx.now;
    return DaoError::OK;
}

DaoError ProposalBook::Cancel(const ActionContext& ctx, const ProposalId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return DaoError::NotFound;
    }
    Proposal& proposal = it->second;
    
    if (!proposal.IsManagedBy(ctx.caller)) {
        return DaoError::Unauthorized;
    }
    if (proposal.status != ProposalStatus::Draft &&
        proposal.status != ProposalStatus::Active) {
        return DaoError::InvalidState;
    }
    
    proposal.status = ProposalStatus::Canceled;
    return DaoError::OK;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Proposal> ProposalBook::GetProposal(const ProposalId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Proposal> ProposalBook::GetProposalsByOrg(const OrgId& org) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Proposal> result;
    for (const auto& [id, proposal] : proposals_) {
        if (proposal.org == org) {
            result.push_back(proposal);
        }
    }
    return result;
}

std::vector<Proposal> ProposalBook::GetProposalsByStatus(ProposalStatus status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Proposal> result;
    for (const auto& [id, proposal] : proposals_) {
        if (proposal.status == status) {
            result.push_back(proposal);
        }
    }
    return result;
}

std::optional<VoteTally> ProposalBook::GetTally(const ProposalId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tallies_.find(id);
    if (it == tallies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<VoteRecord> ProposalBook::GetVote(const ProposalId& id,
                                                const AccountId& voter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = votes_.find(VoteKey(id, voter));
    if (it == votes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::pair<AccountId, VoteRecord>> ProposalBook::GetVotes(const ProposalId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<AccountId, VoteRecord>> result;
    for (auto it = votes_.lower_bound(VoteKey(id, AccountId()));
         it != votes_.end() && it->first.first == id; ++it) {
        result.emplace_back(it->first.second, it->second);
    }
    return result;
}

bool ProposalBook::HasVoted(const ProposalId& id, const AccountId& voter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return votes_.count(VoteKey(id, voter)) > 0;
}

size_t ProposalBook::GetProposalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proposals_.size();
}

} // namespace governance
} // namespace agora
