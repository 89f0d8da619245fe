#pragma once
#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, OFF };

const char* to_string(LogLevel lvl) noexcept;

// "trace".."error", "off"; any case. Throws std::invalid_argument.
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    // create with program wide name and optional output stream
    explicit Logger(std::string name, std::ostream& out = std::cerr);

    // non-copyable, movable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) noexcept;
    Logger& operator=(Logger&&) noexcept;

    void set_level(LogLevel level) noexcept;
    LogLevel level() const noexcept;
    bool enabled(LogLevel lvl) const noexcept;

    // thread-safe; OFF is not a message level and is dropped
    void log(LogLevel lvl, const std::string& msg);
    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);

    // debug("counter=", ctr, " algo=", name) without building the string when filtered
    template<typename... Args>
    void debug_fmt(Args&&... args);

private:
    std::string name_;
    std::atomic<LogLevel> level_;
    std::ostream* out_;
    std::unique_ptr<std::mutex> mutex_;
    void emit(LogLevel lvl, const std::string& payload);
};

template<typename... Args>
inline void Logger::debug_fmt(Args&&... args) {
    if (!enabled(LogLevel::DEBUG)) return;
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    emit(LogLevel::DEBUG, oss.str());
}
