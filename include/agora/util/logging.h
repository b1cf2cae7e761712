// AGORA - Logging System
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Leveled, category-tagged logging shared by the governance components
// and the replay tool. Entries are fanned out to pluggable sinks
// (console, file, callback) under a single process-wide Logger.

#ifndef AGORA_UTIL_LOGGING_H
#define AGORA_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace agora {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (case-insensitive, unknown -> Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* GOVERNANCE = "governance";
    constexpr const char* POWER = "power";
    constexpr const char* ESCROW = "escrow";
    constexpr const char* AUDIT = "audit";
    constexpr const char* CONFIG = "config";
    constexpr const char* REPLAY = "replay";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    std::string file;
    int line;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
    
    LogEntry() : level(LogLevel::Info), line(0) {}
};

/// Which prefix fields a text sink renders
struct LogFormat {
    bool showTimestamp{true};
    bool showLevel{true};
    bool showCategory{true};
    bool showThread{false};
    bool showLocation{false};
};

/// Render an entry as a single line (no trailing newline)
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;
    
    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes to stdout, or stderr for errors when configured
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{false};
        LogFormat format;
        LogLevel level{LogLevel::Info};
    };
    
    ConsoleSink();
    explicit ConsoleSink(const Config& config);
    
    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }
    
    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::mutex mutex_;
    
    static const char* ColorCode(LogLevel level);
};

/// Appends to a log file
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        LogFormat format{true, true, true, true, true};
        LogLevel level{LogLevel::Debug};
    };
    
    explicit FileSink(const Config& config);
    ~FileSink() override;
    
    bool IsOpen() const;
    
    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
};

/// Forwards entries to a function (used by tests and embedding hosts)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;
    
    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);
    
    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();
    
    /// Install the default console sink (idempotent)
    void Initialize();
    
    /// Flush and drop all sinks
    void Shutdown();
    
    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;
    
    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }
    
    /// Restrict output to the given category (may be called repeatedly)
    void EnableCategory(const std::string& category);
    
    /// Lift any category restriction
    void EnableAllCategories();
    
    bool IsCategoryEnabled(const std::string& category) const;
    
    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);
    
    bool WillLog(LogLevel level, const std::string& category) const;
    
    void Flush();

private:
    Logger() = default;
    ~Logger();
    
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;
    
    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    bool allCategoriesEnabled_{true};
    
    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message with operator<< and emits it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line);
    ~LogStream();
    
    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;
    
    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define AGORA_LOGGER ::agora::util::Logger::Instance()

#define AGORA_LOG_ENABLED(level, category) \
    AGORA_LOGGER.WillLog(::agora::util::LogLevel::level, category)

#define AGORA_LOG(level, category) \
    if (AGORA_LOG_ENABLED(level, category)) \
        ::agora::util::LogStream(::agora::util::LogLevel::level, category, \
                                 __FILE__, __LINE__)

#define LOG_TRACE(category)   AGORA_LOG(Trace, category)
#define LOG_DEBUG(category)   AGORA_LOG(Debug, category)
#define LOG_INFO(category)    AGORA_LOG(Info, category)
#define LOG_WARN(category)    AGORA_LOG(Warn, category)
#define LOG_ERROR(category)   AGORA_LOG(Error, category)

} // namespace util
} // namespace agora

#endif // AGORA_UTIL_LOGGING_H
