#include "logger.hpp"
#include <cstdio>


Logger&
Logger::instance() {
    static Logger logger;
    return logger;
}

void
Logger::log(LogLevel level, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) return;

        entries_.push_back(LogEntry{level, message});
        while (entries_.size() > max_entries_) {
            entries_.pop_front();
        }
        if (!echo_to_console_) return;
    }

    auto stream = (level >= LogLevel::WARNING) ? stderr : stdout;
    fprintf(stream, "[%s] %s\n", level_to_string(level), message.c_str());
}

void
Logger::logv(LogLevel level, const char* format, va_list args) {
    if (!enabled(level)) return;

    char buffer[1024];
    vsnprintf(buffer, sizeof(buffer), format, args);
    log(level, buffer);
}

void
Logger::logf(LogLevel level, const char* format, ...) {
    va_list args;
    va_start(args, format);
    logv(level, format, args);
    va_end(args);
}

void
Logger::debugf(const char* format, ...) {
    va_list args;
    va_start(args, format);
    logv(LogLevel::DEBUG, format, args);
    va_end(args);
}

void
Logger::infof(const char* format, ...) {
    va_list args;
    va_start(args, format);
    logv(LogLevel::INFO, format, args);
    va_end(args);
}

void
Logger::warningf(const char* format, ...) {
    va_list args;
    va_start(args, format);
    logv(LogLevel::WARNING, format, args);
    va_end(args);
}

void
Logger::errorf(const char* format, ...) {
    va_list args;
    va_start(args, format);
    logv(LogLevel::ERROR, format, args);
    va_end(args);
}

void
Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel
Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool
Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= level_;
}

void
Logger::set_echo_to_console(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    echo_to_console_ = enabled;
}

void
Logger::set_max_entries(size_t max_entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_entries_ = max_entries;
    while (entries_.size() > max_entries_) {
        entries_.pop_front();
    }
}

std::deque<LogEntry>
Logger::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

void
Logger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

const char*
Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}
