// AGORA - Configuration File Parser Tests
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <gtest/gtest.h>

#include "agora/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace agora {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }
    
    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }
    
    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/agora_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);
        
        std::ofstream file(filename);
        file << content;
        file.close();
        
        tempFiles_.push_back(filename);
        return filename;
    }
    
    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Basic Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseCommentsAndSections) {
    std::string content = R"(
# comment
; another comment
verbose

[governance]
maxtitlelength = 64

[escrow]
account = "agora.treasury"
)";
    auto result = config_.ParseString(content);
    ASSERT_TRUE(result.success) << result.errorMessage;
    
    EXPECT_EQ(config_.GetString("verbose", ""), "true");
    EXPECT_EQ(config_.GetInt("maxtitlelength", 0, "governance"), 64);
    EXPECT_EQ(config_.GetString("account", "", "escrow"), "agora.treasury");
    EXPECT_FALSE(config_.HasKey("maxtitlelength"));
    
    auto sections = config_.GetSections();
    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0], "escrow");
    EXPECT_EQ(sections[1], "governance");
}

TEST_F(ConfigTest, ParseErrorsReportLine) {
    auto result = config_.ParseString("ok=1\n[broken\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, "test.conf");
    EXPECT_EQ(result.errorLine, 2);
    
    result = config_.ParseString("bad key=1");
    EXPECT_FALSE(result.success);
}

TEST_F(ConfigTest, QuotedValues) {
    ASSERT_TRUE(config_.ParseString("a=\"x\\ty\"\nb='raw\\t'").success);
    EXPECT_EQ(config_.GetString("a", ""), "x\ty");
    EXPECT_EQ(config_.GetString("b", ""), "raw\\t");
}

// ============================================================================
// Typed Accessors
// ============================================================================

TEST_F(ConfigTest, IntegerAccessorsAreStrict) {
    ASSERT_TRUE(config_.ParseString("n=42\nneg=-3\njunk=12abc").success);
    EXPECT_EQ(config_.TryGetInt("n"), 42);
    EXPECT_EQ(config_.TryGetInt("neg"), -3);
    EXPECT_FALSE(config_.TryGetInt("junk").has_value());
    EXPECT_FALSE(config_.TryGetUInt("neg").has_value());
    EXPECT_EQ(config_.GetUInt("missing", 7), 7u);
}

TEST_F(ConfigTest, BooleanAccessor) {
    ASSERT_TRUE(config_.ParseString("a=yes\nb=off\nc=maybe").success);
    EXPECT_TRUE(config_.GetBool("a", false));
    EXPECT_FALSE(config_.GetBool("b", true));
    EXPECT_FALSE(config_.TryGetBool("c").has_value());
    EXPECT_TRUE(config_.GetBool("c", true));
}

TEST_F(ConfigTest, SetDefaultDoesNotOverride) {
    config_.Set("level", "debug", "log");
    config_.SetDefault("level", "warn", "log");
    config_.SetDefault("file", "agora.log", "log");
    EXPECT_EQ(config_.GetString("level", "", "log"), "debug");
    EXPECT_EQ(config_.GetString("file", "", "log"), "agora.log");
}

// ============================================================================
// Sources
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("[log]\nlevel=info\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(config_.GetString("level", "", "log"), "info");
}

TEST_F(ConfigTest, ParseMissingFileFails) {
    auto result = config_.ParseFile("/nonexistent/agora.conf");
    EXPECT_FALSE(result.success);
}

TEST_F(ConfigTest, CommandLineWinsOverFile) {
    const char* argv[] = {"agora-replay", "-log.level=debug", "-help", "run.txt"};
    ASSERT_TRUE(config_.ParseCommandLine(4, argv).success);
    
    std::string path = CreateTempFile("[log]\nlevel=error\nfile=out.log\n");
    ASSERT_TRUE(config_.ParseFile(path).success);
    
    EXPECT_EQ(config_.GetString("level", "", "log"), "debug");
    EXPECT_EQ(config_.GetString("file", "", "log"), "out.log");
    EXPECT_TRUE(config_.GetBool("help", false));
    ASSERT_EQ(config_.GetPositional().size(), 1u);
    EXPECT_EQ(config_.GetPositional()[0], "run.txt");
}

TEST_F(ConfigTest, ExpandEnvVars) {
    setenv("AGORA_TEST_DIR", "/var/agora", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${AGORA_TEST_DIR}/log"), "/var/agora/log");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("$HOME"), "$HOME");
    unsetenv("AGORA_TEST_DIR");
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigTest, ValidateReportsUnknownKeys) {
    config_.AllowKey(ConfigKeys::LOG_LEVEL, ConfigKeys::SECTION_LOG);
    ASSERT_TRUE(config_.ParseString("[log]\nlevel=info\nlevle=debug\n", "agora.conf").success);
    
    auto problems = config_.Validate();
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_EQ(problems[0], "Unknown configuration key: log.levle (agora.conf:3)");
}

TEST_F(ConfigTest, ValidateWithoutAllowListAcceptsAll) {
    ASSERT_TRUE(config_.ParseString("anything=1").success);
    EXPECT_TRUE(config_.Validate().empty());
}

TEST_F(ConfigTest, DumpMarksDefaults) {
    config_.SetDefault("level", "warn", "log");
    std::string dump = config_.Dump();
    EXPECT_NE(dump.find("[log]"), std::string::npos);
    EXPECT_NE(dump.find("level=warn  # (default)"), std::string::npos);
}

} // namespace test
} // namespace util
} // namespace agora
