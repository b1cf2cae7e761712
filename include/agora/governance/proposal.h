// AGORA - Proposal Lifecycle
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Proposal records, vote records and tallies.
//
// Lifecycle:
//   Draft -> Active -> {Passed, Rejected}; Passed -> Executed
//   {Draft, Active} -> Canceled
// Any other transition fails with InvalidState.

#ifndef AGORA_GOVERNANCE_PROPOSAL_H
#define AGORA_GOVERNANCE_PROPOSAL_H

#include "agora/core/clock.h"
#include "agora/core/types.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agora {
namespace governance {

// ============================================================================
// Enumerations
// ============================================================================

enum class ProposalStatus {
    /// Created, editable by proposer or organization
    Draft,
    
    /// Accepting votes inside the voting window
    Active,
    
    /// Finalized with sufficient approval
    Passed,
    
    /// Finalized without sufficient approval
    Rejected,
    
    /// Passed and carried out
    Executed,
    
    /// Withdrawn before an outcome was reached
    Canceled
};

/// Convert status to string
const char* ProposalStatusToString(ProposalStatus status);

enum class VoteKind {
    Yes,
    No,
    Abstain
};

/// Convert vote kind to string
const char* VoteKindToString(VoteKind kind);

/// Parse vote kind from string ("yes", "no", "abstain")
std::optional<VoteKind> ParseVoteKind(const std::string& str);

/// Default limits on free-text fields
constexpr size_t DEFAULT_MAX_TITLE_LENGTH = 256;
constexpr size_t DEFAULT_MAX_DESCRIPTION_LENGTH = 16 * 1024;

// ============================================================================
// Records
// ============================================================================

/**
 * A proposal owned by an organization.
 */
struct Proposal {
    /// Assigned at registration
    ProposalId id;
    
    /// Owning organization
    OrgId org;
    
    /// Account that created the proposal
    AccountId proposer;
    
    std::string title;
    std::string description;
    
    ProposalStatus status{ProposalStatus::Draft};
    
    /// Epoch at registration
    Epoch createdAt{0};
    
    /// Votes are accepted in [start, end)
    EpochWindow votingWindow;
    
    /// Opaque execution payload handed to the host on execution
    std::vector<Byte> payload;
    
    /// Funding required before execution (0 = none)
    Amount fundingGoal{0};
    
    /// Minimum approval percentage (0-100) to pass
    uint32_t minApprovalPercent{50};
    
    /// Check whether caller may manage the proposal
    bool IsManagedBy(const AccountId& caller) const {
        return caller == proposer || caller == org;
    }
    
    /// Get human-readable description
    std::string ToString() const;
};

struct VoteRecord {
    VoteKind kind{VoteKind::Abstain};
    
    /// Effective power committed at cast time
    Power power{0};
    
    Epoch castAt{0};
};

struct VoteTally {
    Power yes{0};
    Power no{0};
    Power abstain{0};
    Power totalVoted{0};
    uint32_t voterCount{0};
    
    /// floor(yes * 100 / (yes + no)); 0 when no yes/no votes exist
    uint32_t ApprovalPercent() const;
};

// ============================================================================
// Proposal Book
// ============================================================================

struct ProposalLimits {
    size_t maxTitleLength{DEFAULT_MAX_TITLE_LENGTH};
    size_t maxDescriptionLength{DEFAULT_MAX_DESCRIPTION_LENGTH};
};

/**
 * Stores proposals, votes and tallies and enforces the lifecycle.
 */
class ProposalBook {
public:
    explicit ProposalBook(const ProposalLimits& limits = ProposalLimits());
    ~ProposalBook();
    
    /**
     * Validate and store a new proposal. On success proposal.id, status and
     * createdAt are filled in. The caller must be the proposer or the
     * organization.
     */
    DaoError Register(const ActionContext& ctx, Proposal& proposal);
    
    DaoError Activate(const ActionContext& ctx, const ProposalId& id);
    
    /// Check everything CastVote checks except the power value
    DaoError CheckCanVote(const ActionContext& ctx, const ProposalId& id) const;
    
    /// Record ctx.caller's vote with the given power
    DaoError CastVote(const ActionContext& ctx, const ProposalId& id,
                      VoteKind kind, Power power);
    
    /// Decide Passed/Rejected once the window has closed
    DaoError Finalize(const ActionContext& ctx, const ProposalId& id);
    
    DaoError Execute(const ActionContext& ctx, const ProposalId& id);
    
    DaoError Cancel(const ActionContext& ctx, const ProposalId& id);
    
    // === Queries ===
    
    std::optional<Proposal> GetProposal(const ProposalId& id) const;
    
    std::vector<Proposal> GetProposalsByOrg(const OrgId& org) const;
    
    std::vector<Proposal> GetProposalsByStatus(ProposalStatus status) const;
    
    std::optional<VoteTally> GetTally(const ProposalId& id) const;
    
    std::optional<VoteRecord> GetVote(const ProposalId& id, const AccountId& voter) const;
    
    std::vector<std::pair<AccountId, VoteRecord>> GetVotes(const ProposalId& id) const;
    
    bool HasVoted(const ProposalId& id, const AccountId& voter) const;
    
    size_t GetProposalCount() const;
    
    const ProposalLimits& GetLimits() const { return limits_; }

private:
    using VoteKey = std::pair<ProposalId, AccountId>;
    
    DaoError CheckCanVoteLocked(const ActionContext& ctx, const ProposalId& id) const;
    
    ProposalId DeriveId(const Proposal& proposal, Epoch now) const;
    
    ProposalLimits limits_;
    
    mutable std::mutex mutex_;
    std::map<ProposalId, Proposal> proposals_;
    std::map<ProposalId, VoteTally> tallies_;
    std::map<VoteKey, VoteRecord> votes_;
    uint64_t sequence_{0};
};

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_PROPOSAL_H
