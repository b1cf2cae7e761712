// AGORA - Configuration File Parser
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Parses INI-style configuration for the governance engine and the
// replay tool.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}
//
// Command-line overrides take the form -section.key=value or -key=value.

#ifndef AGORA_UTIL_CONFIG_H
#define AGORA_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace agora {
namespace util {

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path, "<string>" or "<command-line>"
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};
    
    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }
    
    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from defaults, files and command-line arguments.
 *
 * Priority order (highest to lowest):
 * 1. Command-line arguments
 * 2. Configuration files, later files overriding earlier ones
 * 3. Built-in defaults registered with SetDefault
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();
    
    // ========================================================================
    // Parsing
    // ========================================================================
    
    ConfigParseResult ParseFile(const std::string& filePath);
    
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");
    
    /**
     * Parse -key=value / -section.key=value arguments. Arguments without a
     * leading dash are collected as positional arguments.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);
    
    /// Positional (non-option) arguments seen by ParseCommandLine
    const std::vector<std::string>& GetPositional() const { return positional_; }
    
    // ========================================================================
    // Value Retrieval
    // ========================================================================
    
    bool HasKey(const std::string& key, const std::string& section = "") const;
    
    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;
    
    /// Returns nullopt if the key is missing or not a whole integer
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    
    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;
    
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    
    uint64_t GetUInt(const std::string& key,
                     uint64_t defaultValue,
                     const std::string& section = "") const;
    
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    
    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;
    
    // ========================================================================
    // Value Setting
    // ========================================================================
    
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");
    
    /// Set a value only if nothing else has set it
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");
    
    // ========================================================================
    // Introspection and Validation
    // ========================================================================
    
    std::vector<std::string> GetSections() const;
    std::vector<std::string> GetKeys(const std::string& section = "") const;
    
    /// Register a known key; Validate reports anything else
    void AllowKey(const std::string& key, const std::string& section = "");
    
    /// Returns one message per unknown key (empty when every key is allowed)
    std::vector<std::string> Validate() const;
    
    void Clear();
    size_t Size() const { return entries_.size(); }
    
    /// Expand ${VAR} references from the environment
    static std::string ExpandEnvVars(const std::string& value);
    
    /// Dump all configuration as an INI document
    std::string Dump() const;

private:
    static std::string MakeKey(const std::string& key, const std::string& section);
    
    ConfigParseResult ParseStream(std::istream& in, const std::string& sourceName);
    
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);
    
    void Store(const ConfigEntry& entry);
    
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    
    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> allowedKeys_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // [governance]
    constexpr const char* SECTION_GOVERNANCE = "governance";
    constexpr const char* MAX_TITLE_LENGTH = "maxtitlelength";
    constexpr const char* MAX_DESCRIPTION_LENGTH = "maxdescriptionlength";
    
    // [escrow]
    constexpr const char* SECTION_ESCROW = "escrow";
    constexpr const char* ESCROW_ACCOUNT = "account";
    
    // [log]
    constexpr const char* SECTION_LOG = "log";
    constexpr const char* LOG_LEVEL = "level";
    constexpr const char* LOG_FILE = "file";
    constexpr const char* LOG_CONSOLE = "console";
    
    // Global
    constexpr const char* CONF = "conf";
    constexpr const char* SCRIPT = "script";
}

} // namespace util
} // namespace agora

#endif // AGORA_UTIL_CONFIG_H
