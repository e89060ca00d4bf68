// SOLSAFE - Logging System
// Copyright (c) 2024 SOLSAFE Developers
// MIT License
//
// Leveled, categorized, thread-safe logging with pluggable sinks.
//
// Vote secrets (salt, vote value) must never reach a log line. Digests are
// logged in abbreviated form via Hash256::ToShortHex().

#ifndef SOLSAFE_UTIL_LOGGING_H
#define SOLSAFE_UTIL_LOGGING_H

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

namespace solsafe {
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

const char* LogLevelToString(LogLevel level);

/// Parse a level name (case-insensitive). Unknown names return Info and
/// set *ok to false.
LogLevel LogLevelFromString(const std::string& str, bool* ok = nullptr);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* EVIDENCE = "evidence";
    constexpr const char* VOTE = "vote";
    constexpr const char* STORE = "store";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
    constexpr const char* CLI = "cli";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

/// Which fields a sink prints in front of the message
struct LogFormat {
    bool showTimestamp{true};
    bool showLevel{true};
    bool showCategory{true};
    bool showThread{false};
    bool showLocation{false};
};

/// Render an entry as one line (no trailing newline)
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

// ============================================================================
// Sinks
// ============================================================================

/// Output destination for log entries
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

protected:
    explicit ILogSink(LogLevel level) : level_(level) {}

    bool Accepts(const LogEntry& entry) const { return entry.level >= level_.load(); }

private:
    std::atomic<LogLevel> level_;
};

/// Writes to stdout, or stderr for Error and above when useStderr is set.
/// stderrOnly sends every line to stderr, keeping stdout for command output.
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{true};
        bool stderrOnly{false};
        LogFormat format;
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends to a file, rotating it to path.1 .. path.N once maxSize is reached
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
        LogFormat format{true, true, true, true, true};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;

    size_t GetCurrentSize() const { return currentSize_; }

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};

    void OpenLocked();
    void RotateLocked();
};

/// Hands entries to a callback (used by tests to capture output)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace);

    void Write(const LogEntry& entry) override;
    void Flush() override {}

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

/// Settings applied by Logger::Configure()
struct LoggingOptions {
    LogLevel level{LogLevel::Info};
    bool printToConsole{true};
    bool consoleStderrOnly{false};
    std::string logFile;                  // empty disables file output
    std::vector<std::string> categories;  // empty enables all
};

class Logger {
public:
    static Logger& Instance();

    /// Replace all sinks and filters according to options
    void Configure(const LoggingOptions& options);

    /// Flush and drop every sink
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the given category (and any others enabled)
    void EnableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

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
    std::atomic<bool> allCategoriesEnabled_{true};
    mutable std::mutex categoriesMutex_;
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message with operator<< and logs it on destruction
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

#define SOLSAFE_LOGGER ::solsafe::util::Logger::Instance()

#define SOLSAFE_LOG_ENABLED(level, category) \
    SOLSAFE_LOGGER.WillLog(::solsafe::util::LogLevel::level, category)

/// Stream-style logging; the message is only built when it will be written
#define SOLSAFE_LOG(level, category) \
    if (!SOLSAFE_LOG_ENABLED(level, category)) {} else \
        ::solsafe::util::LogStream(::solsafe::util::LogLevel::level, category, \
                                   __FILE__, __LINE__)

#define LOG_TRACE(category)   SOLSAFE_LOG(Trace, category)
#define LOG_DEBUG(category)   SOLSAFE_LOG(Debug, category)
#define LOG_INFO(category)    SOLSAFE_LOG(Info, category)
#define LOG_WARN(category)    SOLSAFE_LOG(Warn, category)
#define LOG_ERROR(category)   SOLSAFE_LOG(Error, category)

// ============================================================================
// Utility Functions
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

std::string GetBasename(const std::string& path);

} // namespace util
} // namespace solsafe

#endif // SOLSAFE_UTIL_LOGGING_H
