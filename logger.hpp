#pragma once
#include <cstdarg>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

struct LogEntry {
    LogLevel level;
    std::string message;
};

// Process-wide logger. Keeps a bounded buffer of recent entries and optionally
// echoes them to the console.
class Logger {
  public:
    static Logger& instance();

    void log(LogLevel level, const std::string& message);
    void logf(LogLevel level, const char* format, ...);

    void debugf(const char* format, ...);
    void infof(const char* format, ...);
    void warningf(const char* format, ...);
    void errorf(const char* format, ...);

    void set_level(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const;

    void set_echo_to_console(bool enabled);
    void set_max_entries(size_t max_entries);

    std::deque<LogEntry> entries() const;
    void clear();

    static const char* level_to_string(LogLevel level);

  private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void logv(LogLevel level, const char* format, va_list args);

    mutable std::mutex mutex_;
    std::deque<LogEntry> entries_;
    size_t max_entries_ = 1000;
    LogLevel level_ = LogLevel::INFO;
    bool echo_to_console_ = true;
};

#define LOG_DEBUGF(...) Logger::instance().debugf(__VA_ARGS__)
#define LOG_INFOF(...) Logger::instance().infof(__VA_ARGS__)
#define LOG_WARNINGF(...) Logger::instance().warningf(__VA_ARGS__)
#define LOG_ERRORF(...) Logger::instance().errorf(__VA_ARGS__)
