#pragma once

#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace boxhunt {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "INFO";
}

// Accepts "debug", "info", "warning"/"warn", "error" (any case)
inline bool parse_log_level(std::string name, LogLevel& out) {
    for (auto& c : name) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (name == "debug") { out = LogLevel::DEBUG; return true; }
    if (name == "info") { out = LogLevel::INFO; return true; }
    if (name == "warning" || name == "warn") { out = LogLevel::WARNING; return true; }
    if (name == "error") { out = LogLevel::ERROR; return true; }
    return false;
}

/**
 * Logging sink. Implementations must be safe to call from worker threads.
 */
class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg) { log(LogLevel::INFO, msg); }
    void warning(const std::string& msg) { log(LogLevel::WARNING, msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel get_min_level() const { return min_level_; }

protected:
    // "2025-01-31 14:02:11 - INFO - message"
    static std::string format_line(LogLevel level, const std::string& message) {
        std::time_t now = std::time(nullptr);
        std::tm tm_buf{};
        localtime_r(&now, &tm_buf);
        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);
        return std::string(stamp) + " - " + log_level_name(level) + " - " + message;
    }

    LogLevel min_level_ = LogLevel::INFO;
};

class ConsoleLogger : public Logger {
public:
    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        std::string line = format_line(level, message);
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << line << std::endl;
    }

private:
    std::mutex mutex_;
};

/**
 * Appends log lines to a file. is_open() is false when the file could not
 * be opened; log() is then a no-op.
 */
class FileLogger : public Logger {
public:
    explicit FileLogger(const std::filesystem::path& path)
        : out_(path, std::ios::app) {}

    bool is_open() const { return out_.is_open(); }

    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        std::string line = format_line(level, message);
        std::lock_guard<std::mutex> lock(mutex_);
        if (!out_) return;
        out_ << line << '\n';
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mutex_;
};

/**
 * Forwards every message to a set of loggers, each applying its own level.
 */
class TeeLogger : public Logger {
public:
    TeeLogger() { min_level_ = LogLevel::DEBUG; }

    void add(std::unique_ptr<Logger> sink) { sinks_.push_back(std::move(sink)); }

    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        for (auto& sink : sinks_) {
            sink->log(level, message);
        }
    }

private:
    std::vector<std::unique_ptr<Logger>> sinks_;
};

class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string&) override {}
};

// Shared sink for components constructed without a logger
inline Logger* null_logger() {
    static NullLogger instance;
    return &instance;
}

}  // namespace boxhunt
