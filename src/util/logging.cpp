// REVGUARD - Logging Implementation
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#include "revguard/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

namespace revguard {
namespace util {

namespace {

constexpr const char* KNOWN_CATEGORIES[] = {
    LogCategory::DEFAULT, LogCategory::POOL, LogCategory::ENGINE, LogCategory::ASSET,
    LogCategory::VAULT, LogCategory::STORE, LogCategory::CONFIG, LogCategory::SIM,
};

/// Local time with milliseconds
std::string FormatRecordTime(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms;
    return out.str();
}

std::string SourceLocation(const LogRecord& record) {
    if (record.file == nullptr) {
        return "";
    }
    std::string path(record.file);
    size_t slash = path.find_last_of("/\\");
    if (slash != std::string::npos) {
        path.erase(0, slash + 1);
    }
    return path + ":" + std::to_string(record.line);
}

} // namespace

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> ParseLogLevel(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "warning") return LogLevel::Warn;
    if (lower == "none") return LogLevel::Off;
    for (int i = static_cast<int>(LogLevel::Trace); i <= static_cast<int>(LogLevel::Off); ++i) {
        LogLevel level = static_cast<LogLevel>(i);
        std::string known = LogLevelToString(level);
        std::transform(known.begin(), known.end(), known.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == known) {
            return level;
        }
    }
    return std::nullopt;
}

bool IsKnownCategory(const std::string& category) {
    return std::find(std::begin(KNOWN_CATEGORIES), std::end(KNOWN_CATEGORIES), category) !=
           std::end(KNOWN_CATEGORIES);
}

// ============================================================================
// Sinks
// ============================================================================

void ConsoleSink::Write(const LogRecord& record) {
    std::ostringstream line;
    line << "[" << LogLevelToString(record.level) << "] ";
    if (record.category != LogCategory::DEFAULT) {
        line << "[" << record.category << "] ";
    }
    line << record.message << '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    std::fputs(line.str().c_str(), useStderr_ ? stderr : stdout);
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(useStderr_ ? stderr : stdout);
}

FileSink::FileSink(const std::string& path, LogLevel threshold)
    : LogSink(threshold), file_(path, std::ios::out | std::ios::app) {}

void FileSink::Write(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    file_ << FormatRecordTime(record.time) << " [" << LogLevelToString(record.level) << "] ["
          << record.category << "] ";
    std::string where = SourceLocation(record);
    if (!where.empty()) {
        file_ << where << " ";
    }
    file_ << record.message << '\n';
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.flush();
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::AddSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.size();
}

void Logger::SetCategories(const std::vector<std::string>& categories) {
    std::lock_guard<std::mutex> lock(mutex_);
    categories_ = std::set<std::string>(categories.begin(), categories.end());
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return categories_.empty() || categories_.count(category) > 0;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    return level >= level_.load() && level != LogLevel::Off && IsCategoryEnabled(category);
}

void Logger::Write(LogRecord record) {
    record.time = std::chrono::system_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        if (sink->Accepts(record.level)) {
            sink->Write(record);
        }
    }
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
    sinks_.clear();
}

LogStream::LogStream(LogLevel level, const char* category, const char* file, int line) {
    record_.level = level;
    record_.category = category;
    record_.file = file;
    record_.line = line;
}

LogStream::~LogStream() {
    record_.message = buffer_.str();
    Logger::Instance().Write(std::move(record_));
}

} // namespace util
} // namespace revguard
