// AGORA - Replay Tool
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Replays a governance action script against an in-memory asset ledger
// and reports the outcome of every action.
//
// Usage: agora-replay [options] <script>

#include "agora/core/asset.h"
#include "agora/governance/engine.h"
#include "agora/replay/script.h"
#include "agora/util/config.h"
#include "agora/util/logging.h"

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace agora {

namespace {

constexpr const char* VERSION = "0.1.0";

void PrintHelp() {
    std::cout << "AGORA Replay v" << VERSION << "\n\n"
              << "Usage: agora-replay [options] <script|->\n\n"
              << "Options:\n"
              << "  -conf=<file>                  Read configuration file\n"
              << "  -log.level=<level>            trace, debug, info, warn, error, off\n"
              << "  -log.file=<path>              Also write the log to a file\n"
              << "  -log.console=<0|1>            Log to the console (default: 1)\n"
              << "  -governance.maxtitlelength=<n>\n"
              << "  -governance.maxdescriptionlength=<n>\n"
              << "  -escrow.account=<name>        Escrow account name\n"
              << "  -help                         Show this help\n";
}

void AllowKnownKeys(util::ConfigManager& config) {
    using namespace util::ConfigKeys;
    config.AllowKey(CONF);
    config.AllowKey(SCRIPT);
    config.AllowKey("help");
    config.AllowKey(MAX_TITLE_LENGTH, SECTION_GOVERNANCE);
    config.AllowKey(MAX_DESCRIPTION_LENGTH, SECTION_GOVERNANCE);
    config.AllowKey(ESCROW_ACCOUNT, SECTION_ESCROW);
    config.AllowKey(LOG_LEVEL, SECTION_LOG);
    config.AllowKey(LOG_FILE, SECTION_LOG);
    config.AllowKey(LOG_CONSOLE, SECTION_LOG);
}

void SetupLogging(const util::ConfigManager& config) {
    using namespace util::ConfigKeys;
    
    auto& logger = util::Logger::Instance();
    logger.Initialize();
    
    // Drop the default sink; the configured ones replace it
    logger.ClearSinks();
    
    util::LogLevel level = util::LogLevelFromString(
        config.GetString(LOG_LEVEL, "warn", SECTION_LOG));
    logger.SetLevel(level);
    
    if (config.GetBool(LOG_CONSOLE, true, SECTION_LOG)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        consoleConfig.useStderr = true;
        consoleConfig.format.showTimestamp = false;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }
    
    std::string logPath = config.GetString(LOG_FILE, "", SECTION_LOG);
    if (!logPath.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = logPath;
        fileConfig.level = util::LogLevel::Debug;
        auto fileSink = std::make_shared<util::FileSink>(fileConfig);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
        } else {
            std::cerr << "Warning: cannot open log file " << logPath << std::endl;
        }
    }
}

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    
    auto cmdResult = config.ParseCommandLine(argc, argv);
    if (!cmdResult.success) {
        std::cerr << "Error: " << cmdResult.errorMessage << std::endl;
        return 1;
    }
    if (config.HasKey("help") || config.HasKey("h")) {
        PrintHelp();
        return 0;
    }
    
    auto confPath = config.TryGetString(util::ConfigKeys::CONF);
    if (confPath) {
        auto fileResult = config.ParseFile(*confPath);
        if (!fileResult.success) {
            std::cerr << "Error: " << fileResult.errorMessage;
            if (fileResult.errorLine > 0) {
                std::cerr << " (" << fileResult.errorFile << ":" << fileResult.errorLine << ")";
            }
            std::cerr << std::endl;
            return 1;
        }
    }
    
    SetupLogging(config);
    
    AllowKnownKeys(config);
    for (const auto& problem : config.Validate()) {
        LOG_WARN(util::LogCategory::CONFIG) << problem;
    }
    
    std::string scriptPath = config.GetString(util::ConfigKeys::SCRIPT, "");
    if (scriptPath.empty() && !config.GetPositional().empty()) {
        scriptPath = config.GetPositional().front();
    }
    if (scriptPath.empty()) {
        PrintHelp();
        return 1;
    }
    
    MemoryAssetLedger ledger;
    governance::GovernanceEngine engine(ledger, governance::EngineOptions::FromConfig(config));
    replay::ScriptRunner runner(engine, ledger, std::cout);
    
    replay::ReplayResult result;
    if (scriptPath == "-") {
        result = runner.Run(std::cin);
    } else {
        std::ifstream script(scriptPath);
        if (!script.is_open()) {
            std::cerr << "Error: cannot open script " << scriptPath << std::endl;
            return 1;
        }
        result = runner.Run(script);
    }
    
    bool chainOk = engine.GetAuditLog().Verify();
    
    std::cout << "\n" << result.actions << " actions, "
              << result.expectations << " expectations ("
              << result.failedExpectations << " failed), "
              << result.syntaxErrors << " syntax errors, "
              << engine.GetAuditLog().Size() << " audit events"
              << (chainOk ? "" : " (AUDIT CHAIN BROKEN)") << "\n";
    
    LOG_INFO(util::LogCategory::REPLAY) << "Audit head " << engine.GetAuditLog().GetHeadDigest().ToHex();
    util::Logger::Instance().Shutdown();
    
    return result.Success() && chainOk ? 0 : 2;
}

} // anonymous namespace

} // namespace agora

int main(int argc, char* argv[]) {
    try {
        return agora::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
