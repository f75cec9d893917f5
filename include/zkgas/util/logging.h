// ZKGAS - Logging System
// Copyright (c) 2025 ZKGAS Developers
// MIT License
//
// Provides a small logging system with:
// - Log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Log categories for filtering
// - Console and callback sinks
// - Printf-style and stream-style interfaces

#ifndef ZKGAS_UTIL_LOGGING_H
#define ZKGAS_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace zkgas {
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
    Fatal = 5,
    Off = 6
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (case-insensitive); false if unknown
bool ParseLogLevel(const std::string& str, LogLevel& out);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* PAYMASTER = "paymaster";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* CACHE = "cache";
    constexpr const char* QUOTA = "quota";
    constexpr const char* POLICY = "policy";
    constexpr const char* MEMBERSHIP = "membership";
    constexpr const char* CONFIG = "config";
}

// ============================================================================
// Log Entry
// ============================================================================

/// A single log entry
struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    std::string file;
    int line;
    std::chrono::system_clock::time_point timestamp;

    LogEntry() : level(LogLevel::Info), line(0) {}
};

// ============================================================================
// Log Sink Interface
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

// ============================================================================
// Console Sink
// ============================================================================

/// Log sink that writes to stdout (stderr for errors when configured)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useStderr{true};           // Write Error/Fatal to stderr
        bool showTimestamp{true};
        bool showCategory{true};
        bool showLocation{false};       // Include file:line
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::mutex mutex_;

    std::string Format(const LogEntry& entry) const;
};

// ============================================================================
// Callback Sink
// ============================================================================

/// Log sink that hands each entry to a callback
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    CallbackSink() = default;
    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_{LogLevel::Info};
};

// ============================================================================
// Logger
// ============================================================================

/// Process-wide logger. Holds no sinks until Initialize() or AddSink().
class Logger {
public:
    static Logger& Instance();

    /// Install a default console sink (once)
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to explicitly enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...);

    /// Check if a message would be logged
    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger();
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

/// Stream-style logging helper; emits on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (active_) {
            stream_ << value;
        }
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
    bool active_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define ZKGAS_LOGGER ::zkgas::util::Logger::Instance()

#define ZKGAS_LOG_ENABLED(level, category) \
    ZKGAS_LOGGER.WillLog(::zkgas::util::LogLevel::level, category)

#define ZKGAS_LOG(level, category) \
    if (ZKGAS_LOG_ENABLED(level, category)) \
        ::zkgas::util::LogStream(::zkgas::util::LogLevel::level, category, \
                                 __FILE__, __LINE__)

#define LOG_TRACE(category)   ZKGAS_LOG(Trace, category)
#define LOG_DEBUG(category)   ZKGAS_LOG(Debug, category)
#define LOG_INFO(category)    ZKGAS_LOG(Info, category)
#define LOG_WARN(category)    ZKGAS_LOG(Warn, category)
#define LOG_ERROR(category)   ZKGAS_LOG(Error, category)

#define ZKGAS_LOGF(level, category, ...) \
    do { \
        if (ZKGAS_LOG_ENABLED(level, category)) { \
            ZKGAS_LOGGER.LogF(::zkgas::util::LogLevel::level, category, \
                              __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while(0)

#define LogDebugF(category, ...)  ZKGAS_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   ZKGAS_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   ZKGAS_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  ZKGAS_LOGF(Error, category, __VA_ARGS__)

/// Format timestamp for logging
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

} // namespace util
} // namespace zkgas

#endif // ZKGAS_UTIL_LOGGING_H
