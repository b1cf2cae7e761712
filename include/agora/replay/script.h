// AGORA - Action Script Replay
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Drives a GovernanceEngine from a line-oriented script. Accounts,
// organizations and assets are named by strings and hashed into ids, and
// proposals are referred to by script-local labels.
//
// Script format (one action per line, # starts a comment):
//   clock <epoch>
//   mint <account> <amount> [asset]
//   power <org> <account> token|currency <amount>
//   power <org> <account> refresh
//   propose <label> <org> <proposer> <start> <end> <min%> <goal> <title...>
//   activate|finalize|execute|cancel <label> <caller>
//   vote <label> <voter> yes|no|abstain
//   delegate <org> <delegator> <delegate> [expiry]
//   revoke <org> <delegator>
//   expire <org> <delegator> <delegate>
//   fund <label> <caller> <beneficiary> <start> <end> <min> <target> [closed]
//   contribute <label> <funder> <amount> [asset]
//   withdraw|withdrawtoken <label> <caller> <amount>
//   refund|refundtoken <label> <caller>
//   show <label> | show power <org> <account> | show balance <account> [asset]
//   expect <ErrorName>                      (result of the previous action)
//   expect status <label> <STATUS>
//   expect approval <label> <percent>
//   expect power <org> <account> <power>
//   expect balance <account> <amount> [asset]

#ifndef AGORA_REPLAY_SCRIPT_H
#define AGORA_REPLAY_SCRIPT_H

#include "agora/core/asset.h"
#include "agora/core/types.h"
#include "agora/governance/engine.h"

#include <istream>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace agora {
namespace replay {

/// Outcome of a whole script
struct ReplayResult {
    size_t lines{0};
    size_t actions{0};
    size_t expectations{0};
    size_t failedExpectations{0};
    size_t syntaxErrors{0};
    
    bool Success() const { return failedExpectations == 0 && syntaxErrors == 0; }
};

class ScriptRunner {
public:
    /// Results and show output are written to out
    ScriptRunner(governance::GovernanceEngine& engine, MemoryAssetLedger& ledger,
                 std::ostream& out);
    
    /// Run every line of a script
    ReplayResult Run(std::istream& script);
    
    /// Run a single line; lineNum is only used in messages
    void RunLine(const std::string& line, size_t lineNum, ReplayResult& result);
    
    /// Proposal id bound to a label
    std::optional<ProposalId> Lookup(const std::string& label) const;
    
    /// Result of the most recent action
    DaoError GetLastResult() const { return lastResult_; }

private:
    using Args = std::vector<std::string>;
    
    /// Execute an action; returns false on a syntax error
    bool RunAction(const Args& args, DaoError& err);
    
    /// Evaluate an expect line; returns false on a syntax error
    bool RunExpect(const Args& args, bool& passed, std::string& detail);
    
    bool RunShow(const Args& args);
    
    governance::GovernanceEngine& engine_;
    MemoryAssetLedger& ledger_;
    std::ostream& out_;
    
    std::map<std::string, ProposalId> labels_;
    DaoError lastResult_{DaoError::OK};
};

/// Parse an error name as printed by DaoErrorToString
std::optional<DaoError> ParseDaoError(const std::string& str);

/// Parse a proposal status name as printed by ProposalStatusToString
std::optional<governance::ProposalStatus> ParseProposalStatus(const std::string& str);

/// Asset reference for an optional script token ("" or "native" = native)
AssetRef AssetFromName(const std::string& name);

} // namespace replay
} // namespace agora

#endif // AGORA_REPLAY_SCRIPT_H
