// REVGUARD - Logging System
// Copyright (c) 2024 REVGUARD Developers
// MIT License
//
// Leveled logging tagged with the ledger component that emits it. Records go
// to every sink attached to the Logger; each sink has its own threshold.
//
//   LOG_INFO(LogCategory::POOL) << "venue " << id << " assigned";

#ifndef REVGUARD_UTIL_LOGGING_H
#define REVGUARD_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace revguard {
namespace util {

enum class LogLevel {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off
};

const char* LogLevelToString(LogLevel level);

/// Case-insensitive; "warning" and "none" are accepted. nullopt if unknown.
std::optional<LogLevel> ParseLogLevel(const std::string& name);

/// Component tags
namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* POOL = "pool";
    constexpr const char* ENGINE = "engine";
    constexpr const char* ASSET = "asset";
    constexpr const char* VAULT = "vault";
    constexpr const char* STORE = "store";
    constexpr const char* CONFIG = "config";
    constexpr const char* SIM = "sim";
}

/// True for the tags above
bool IsKnownCategory(const std::string& category);

struct LogRecord {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    const char* file{nullptr};
    int line{0};
    std::chrono::system_clock::time_point time;
};

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    explicit LogSink(LogLevel threshold) : threshold_(threshold) {}
    virtual ~LogSink() = default;

    bool Accepts(LogLevel level) const { return level >= threshold_; }
    void SetThreshold(LogLevel level) { threshold_ = level; }

    virtual void Write(const LogRecord& record) = 0;
    virtual void Flush() {}

private:
    LogLevel threshold_;
};

/// "[LEVEL] [category] message" on stdout, or on stderr when requested
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(LogLevel threshold = LogLevel::Info, bool useStderr = false)
        : LogSink(threshold), useStderr_(useStderr) {}

    void Write(const LogRecord& record) override;
    void Flush() override;

private:
    bool useStderr_;
    std::mutex mutex_;
};

/// Appends timestamped records with their source location
class FileSink : public LogSink {
public:
    FileSink(const std::string& path, LogLevel threshold = LogLevel::Debug);

    bool IsOpen() const { return file_.is_open(); }

    void Write(const LogRecord& record) override;
    void Flush() override;

private:
    std::ofstream file_;
    std::mutex mutex_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<LogSink> sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Only the listed categories are logged; an empty list logs all of them
    void SetCategories(const std::vector<std::string>& categories);
    bool IsCategoryEnabled(const std::string& category) const;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Write(LogRecord record);

    /// Flush every sink and detach them
    void Shutdown();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::Info};

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::set<std::string> categories_;
};

/// Collects one record and hands it to the Logger when destroyed
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        buffer_ << value;
        return *this;
    }

private:
    LogRecord record_;
    std::ostringstream buffer_;
};

} // namespace util
} // namespace revguard

#define REVGUARD_LOG(level, category)                                                 \
    if (!::revguard::util::Logger::Instance().WillLog(level, category)) {            \
    } else                                                                            \
        ::revguard::util::LogStream(level, category, __FILE__, __LINE__)

#define LOG_DEBUG(category) REVGUARD_LOG(::revguard::util::LogLevel::Debug, category)
#define LOG_INFO(category)  REVGUARD_LOG(::revguard::util::LogLevel::Info, category)
#define LOG_WARN(category)  REVGUARD_LOG(::revguard::util::LogLevel::Warn, category)
#define LOG_ERROR(category) REVGUARD_LOG(::revguard::util::LogLevel::Error, category)

#endif // REVGUARD_UTIL_LOGGING_H
