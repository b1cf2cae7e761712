// AGORA - Action Script Replay Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include "agora/replay/script.h"
#include "agora/crypto/hash.h"
#include "agora/util/logging.h"

#include <sstream>

namespace agora {
namespace replay {

using governance::ProposalStatus;

namespace {

std::optional<uint64_t> ParseU64(const std::string& str) {
    if (str.empty() || str[0] == '-' || str[0] == '+') {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        unsigned long long value = std::stoull(str, &pos);
        if (pos != str.size()) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<Amount> ParseAmount(const std::string& str) {
    try {
        size_t pos = 0;
        long long value = std::stoll(str, &pos);
        if (pos != str.size()) {
            return std::nullopt;
        }
        return static_cast<Amount>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::vector<std::string> Tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) {
        if (token[0] == '#') {
            break;
        }
        tokens.push_back(token);
    }
    return tokens;
}

} // anonymous namespace

// ============================================================================
// Name Parsing
// ============================================================================

std::optional<DaoError> ParseDaoError(const std::string& str) {
    static const DaoError all[] = {
        DaoError::OK, DaoError::Unauthorized, DaoError::NotFound,
        DaoError::InvalidState, DaoError::InvalidInput, DaoError::AlreadyExists,
        DaoError::GoalReached, DaoError::GoalNotReached,
        DaoError::InsufficientFunds, DaoError::TransferFailed,
    };
    for (DaoError err : all) {
        if (str == DaoErrorToString(err)) {
            return err;
        }
    }
    return std::nullopt;
}

std::optional<ProposalStatus> ParseProposalStatus(const std::string& str) {
    static const ProposalStatus all[] = {
        ProposalStatus::Draft, ProposalStatus::Active, ProposalStatus::Passed,
        ProposalStatus::Rejected, ProposalStatus::Executed, ProposalStatus::Canceled,
    };
    for (ProposalStatus status : all) {
        if (str == governance::ProposalStatusToString(status)) {
            return status;
        }
    }
    return std::nullopt;
}

AssetRef AssetFromName(const std::string& name) {
    if (name.empty() || name == "native") {
        return std::nullopt;
    }
    return AssetIdFromSymbol(name);
}

// ============================================================================
// ScriptRunner
// ============================================================================

ScriptRunner::ScriptRunner(governance::GovernanceEngine& engine,
                           MemoryAssetLedger& ledger, std::ostream& out)
    : engine_(engine), ledger_(ledger), out_(out) {}

std::optional<ProposalId> ScriptRunner::Lookup(const std::string& label) const {
    auto it = labels_.find(label);
    if (it == labels_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ReplayResult ScriptRunner::Run(std::istream& script) {
    ReplayResult result;
    std::string line;
    size_t lineNum = 0;
    while (std::getline(script, line)) {
        ++lineNum;
        RunLine(line, lineNum, result);
    }
    result.lines = lineNum;
    return result;
}

void ScriptRunner::RunLine(const std::string& line, size_t lineNum, ReplayResult& result) {
    Args args = Tokenize(line);
    if (args.empty()) {
        return;
    }
    
    if (args[0] == "expect") {
        bool passed = false;
        std::string detail;
        if (!RunExpect(args, passed, detail)) {
            ++result.syntaxErrors;
            out_ << lineNum << ": syntax error: " << line << "\n";
            return;
        }
        ++result.expectations;
        if (!passed) {
            ++result.failedExpectations;
            out_ << lineNum << ": EXPECTATION FAILED: " << detail << "\n";
            LOG_ERROR(util::LogCategory::REPLAY) << "line " << lineNum << ": " << detail;
        }
        return;
    }
    
    if (args[0] == "show") {
        if (!RunShow(args)) {
            ++result.syntaxErrors;
            out_ << lineNum << ": syntax error: " << line << "\n";
        }
        return;
    }
    
    DaoError err = DaoError::OK;
    if (!RunAction(args, err)) {
        ++result.syntaxErrors;
        out_ << lineNum << ": syntax error: " << line << "\n";
        return;
    }
    ++result.actions;
    lastResult_ = err;
    out_ << lineNum << ": " << args[0] << " -> " << DaoErrorToString(err) << "\n";
}

bool ScriptRunner::RunAction(const Args& args, DaoError& err) {
    const std::string& cmd = args[0];
    
    auto labelArg = [this, &args](size_t idx) -> std::optional<ProposalId> {
        if (idx >= args.size()) {
            return std::nullopt;
        }
        auto id = Lookup(args[idx]);
        // Unknown labels resolve to a null id so the engine reports NotFound
        return id ? *id : ProposalId();
    };
    
    if (cmd == "clock" && args.size() == 2) {
        auto epoch = ParseU64(args[1]);
        if (!epoch) return false;
        err = engine_.SetEpoch(*epoch);
        return true;
    }
    
    if (cmd == "mint" && (args.size() == 3 || args.size() == 4)) {
        auto amount = ParseAmount(args[2]);
        if (!amount) return false;
        AssetRef asset = AssetFromName(args.size() == 4 ? args[3] : "");
        err = ledger_.Mint(asset, AccountIdFromName(args[1]), *amount)
                  ? DaoError::OK : DaoError::InvalidInput;
        return true;
    }
    
    if (cmd == "power" && args.size() >= 4) {
        OrgId org = AccountIdFromName(args[1]);
        AccountId account = AccountIdFromName(args[2]);
        if (args[3] == "refresh" && args.size() == 4) {
            err = engine_.RefreshCurrencyPower(org, account);
            return true;
        }
        if (args.size() != 5) return false;
        auto amount = ParseAmount(args[4]);
        if (!amount) return false;
        if (args[3] == "token") {
            err = engine_.UpdateTokenPower(org, account, *amount);
        } else if (args[3] == "currency") {
            err = engine_.UpdateCurrencyPower(org, account, *amount);
        } else {
            return false;
        }
        return true;
    }
    
    if (cmd == "propose" && args.size() >= 9) {
        auto start = ParseU64(args[4]);
        auto end = ParseU64(args[5]);
        auto minApproval = ParseU64(args[6]);
        auto goal = ParseAmount(args[7]);
        if (!start || !end || !minApproval || !goal) return false;
        
        governance::Proposal proposal;
        proposal.org = AccountIdFromName(args[2]);
        proposal.proposer = AccountIdFromName(args[3]);
        proposal.votingWindow = EpochWindow(*start, *end);
        proposal.minApprovalPercent = *minApproval > 100 ? 101
                                        : static_cast<uint32_t>(*minApproval);
        proposal.fundingGoal = *goal;
        for (size_t i = 8; i < args.size(); ++i) {
            if (i > 8) proposal.title += " ";
            proposal.title += args[i];
        }
        
        err = engine_.RegisterProposal(proposal.proposer, proposal);
        if (err == DaoError::OK) {
            labels_[args[1]] = proposal.id;
        }
        return true;
    }
    
    if ((cmd == "activate" || cmd == "finalize" || cmd == "execute" || cmd == "cancel") &&
        args.size() == 3) {
        ProposalId id = *labelArg(1);
        AccountId caller = AccountIdFromName(args[2]);
        if (cmd == "activate") {
            err = engine_.ActivateProposal(caller, id);
        } else if (cmd == "finalize") {
            err = engine_.FinalizeProposal(caller, id);
        } else if (cmd == "execute") {
            err = engine_.ExecuteProposal(caller, id);
        } else {
            err = engine_.CancelProposal(caller, id);
        }
        return true;
    }
    
    if (cmd == "vote" && args.size() == 4) {
        auto kind = governance::ParseVoteKind(args[3]);
        if (!kind) return false;
        err = engine_.CastVote(AccountIdFromName(args[2]), *labelArg(1), *kind);
        return true;
    }
    
    if (cmd == "delegate" && (args.size() == 4 || args.size() == 5)) {
        std::optional<Epoch> expiry;
        if (args.size() == 5) {
            expiry = ParseU64(args[4]);
            if (!expiry) return false;
        }
        err = engine_.Delegate(AccountIdFromName(args[2]), AccountIdFromName(args[1]),
                               AccountIdFromName(args[3]), expiry);
        return true;
    }
    
    if (cmd == "revoke" && args.size() == 3) {
        err = engine_.RevokeDelegation(AccountIdFromName(args[2]), AccountIdFromName(args[1]));
        return true;
    }
    
    if (cmd == "expire" && args.size() == 4) {
        Amount reclaimed = engine_.CheckDelegationExpiry(AccountIdFromName(args[1]),
                                                         AccountIdFromName(args[2]),
                                                         AccountIdFromName(args[3]));
        err = reclaimed > 0 ? DaoError::OK : DaoError::NotFound;
        return true;
    }
    
    if (cmd == "fund" && (args.size() == 8 || args.size() == 9)) {
        auto start = ParseU64(args[4]);
        auto end = ParseU64(args[5]);
        auto minGoal = ParseAmount(args[6]);
        auto target = ParseAmount(args[7]);
        if (!start || !end || !minGoal || !target) return false;
        bool fundable = true;
        if (args.size() == 9) {
            if (args[8] != "closed") return false;
            fundable = false;
        }
        err = engine_.InitializeFunding(AccountIdFromName(args[2]), *labelArg(1), fundable,
                                        EpochWindow(*start, *end), *minGoal, *target,
                                        AccountIdFromName(args[3]));
        return true;
    }
    
    if (cmd == "contribute" && (args.size() == 4 || args.size() == 5)) {
        auto amount = ParseAmount(args[3]);
        if (!amount) return false;
        AssetRef asset = AssetFromName(args.size() == 5 ? args[4] : "");
        err = engine_.Contribute(AccountIdFromName(args[2]), *labelArg(1), *amount, asset);
        return true;
    }
    
    if ((cmd == "withdraw" || cmd == "withdrawtoken") && args.size() == 4) {
        auto amount = ParseAmount(args[3]);
        if (!amount) return false;
        AccountId caller = AccountIdFromName(args[2]);
        err = cmd == "withdraw" ? engine_.Withdraw(caller, *labelArg(1), *amount)
                                : engine_.WithdrawToken(caller, *labelArg(1), *amount);
        return true;
    }
    
    if ((cmd == "refund" || cmd == "refundtoken") && args.size() == 3) {
        AccountId caller = AccountIdFromName(args[2]);
        err = cmd == "refund" ? engine_.Refund(caller, *labelArg(1))
                              : engine_.RefundToken(caller, *labelArg(1));
        return true;
    }
    
    return false;
}

bool ScriptRunner::RunExpect(const Args& args, bool& passed, std::string& detail) {
    if (args.size() < 2) {
        return false;
    }
    if (args.size() == 2) {
        auto expected = ParseDaoError(args[1]);
        if (!expected) return false;
        passed = lastResult_ == *expected;
        detail = std::string("expected ") + DaoErrorToString(*expected) +
                 ", got " + DaoErrorToString(lastResult_);
        return true;
    }
    
    if (args[1] == "status" && args.size() == 4) {
        auto expected = ParseProposalStatus(args[3]);
        if (!expected) return false;
        auto id = Lookup(args[2]);
        auto proposal = id ? engine_.GetProposals().GetProposal(*id) : std::nullopt;
        passed = proposal && proposal->status == *expected;
        detail = "expected " + args[2] + " to be " + args[3] + ", got " +
                 (proposal ? governance::ProposalStatusToString(proposal->status) : "nothing");
        return true;
    }
    
    if (args[1] == "approval" && args.size() == 4) {
        auto expected = ParseU64(args[3]);
        if (!expected) return false;
        auto id = Lookup(args[2]);
        auto tally = id ? engine_.GetProposals().GetTally(*id) : std::nullopt;
        uint64_t actual = tally ? tally->ApprovalPercent() : 0;
        passed = tally && actual == *expected;
        detail = "expected approval " + args[3] + "%, got " + std::to_string(actual) + "%";
        return true;
    }
    
    if (args[1] == "power" && args.size() == 5) {
        auto expected = ParseU64(args[4]);
        if (!expected) return false;
        Power actual = engine_.GetEffectivePower(AccountIdFromName(args[2]),
                                                 AccountIdFromName(args[3]));
        passed = actual == *expected;
        detail = "expected power " + args[4] + " for " + args[3] + ", got " +
                 std::to_string(actual);
        return true;
    }
    
    if (args[1] == "balance" && (args.size() == 4 || args.size() == 5)) {
        auto expected = ParseAmount(args[3]);
        if (!expected) return false;
        AssetRef asset = AssetFromName(args.size() == 5 ? args[4] : "");
        Amount actual = ledger_.BalanceOf(asset, AccountIdFromName(args[2]));
        passed = actual == *expected;
        detail = "expected balance " + args[3] + " for " + args[2] + ", got " +
                 std::to_string(actual);
        return true;
    }
    
    return false;
}

bool ScriptRunner::RunShow(const Args& args) {
    if (args.size() == 2) {
        auto id = Lookup(args[1]);
        if (!id) {
            out_ << "  " << args[1] << ": unknown proposal\n";
            return true;
        }
        auto proposal = engine_.GetProposals().GetProposal(*id);
        auto tally = engine_.GetProposals().GetTally(*id);
        if (proposal) {
            out_ << "  " << proposal->ToString() << "\n";
        }
        if (tally) {
            out_ << "  tally yes=" << tally->yes << " no=" << tally->no
                 << " abstain=" << tally->abstain << " total=" << tally->totalVoted
                 << " approval=" << tally->ApprovalPercent() << "%\n";
        }
        auto funding = engine_.GetEscrow().GetFunding(*id);
        if (funding) {
            out_ << "  " << funding->ToString() << "\n";
        }
        return true;
    }
    
    if (args.size() == 4 && args[1] == "power") {
        OrgId org = AccountIdFromName(args[2]);
        AccountId account = AccountIdFromName(args[3]);
        auto rec = engine_.GetPowerLedger().GetRecord(org, account);
        out_ << "  " << args[3] << ": effective=" << engine_.GetEffectivePower(org, account);
        if (rec) {
            out_ << " token=" << rec->tokenPower << " currency=" << rec->currencyPower
                 << " received=" << rec->receivedPower
                 << (rec->HasDelegated() ? " (delegated)" : "");
        }
        out_ << "\n";
        return true;
    }
    
    if ((args.size() == 3 || args.size() == 4) && args[1] == "balance") {
        AssetRef asset = AssetFromName(args.size() == 4 ? args[3] : "");
        out_ << "  " << args[2] << ": "
             << ledger_.BalanceOf(asset, AccountIdFromName(args[2])) << "\n";
        return true;
    }
    
    return false;
}

} // namespace replay
} // namespace agora
