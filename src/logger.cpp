#include "logger.h"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <stdexcept>

const char* to_string(LogLevel lvl) noexcept {
    switch (lvl) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF:   return "OFF";
    }
    return "?";
}

LogLevel parse_log_level(const std::string& name) {
    std::string up;
    for (char c : name) up.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    if (up == "TRACE") return LogLevel::TRACE;
    if (up == "DEBUG") return LogLevel::DEBUG;
    if (up == "INFO")  return LogLevel::INFO;
    if (up == "WARN" || up == "WARNING") return LogLevel::WARN;
    if (up == "ERROR") return LogLevel::ERROR;
    if (up == "OFF")   return LogLevel::OFF;
    throw std::invalid_argument("unknown log level: " + name);
}

Logger::Logger(std::string name, std::ostream& out)
  : name_(std::move(name)),
    level_(LogLevel::INFO),
    out_(&out),
    mutex_(std::make_unique<std::mutex>())
{}

Logger::Logger(Logger&& other) noexcept
  : name_(std::move(other.name_)),
    level_(other.level_.load()),
    out_(other.out_),
    mutex_(std::move(other.mutex_))
{}

Logger& Logger::operator=(Logger&& other) noexcept {
    if (this == &other) return *this;
    name_ = std::move(other.name_);
    level_.store(other.level_.load());
    out_ = other.out_;
    mutex_ = std::move(other.mutex_);
    return *this;
}

void Logger::set_level(LogLevel level) noexcept {
    level_.store(level);
}

LogLevel Logger::level() const noexcept {
    return level_.load();
}

bool Logger::enabled(LogLevel lvl) const noexcept {
    const LogLevel cur = level_.load();
    if (lvl == LogLevel::OFF || cur == LogLevel::OFF) return false;
    return static_cast<int>(lvl) >= static_cast<int>(cur);
}

void Logger::emit(LogLevel lvl, const std::string& payload) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    // UTC, same clock the codes are derived from
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream header;
    header << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << ms.count()
           << "Z [" << to_string(lvl) << "] " << name_ << ": ";

    std::lock_guard<std::mutex> lk(*mutex_);
    (*out_) << header.str() << payload << '\n';
    out_->flush();
}

void Logger::log(LogLevel lvl, const std::string& msg) {
    if (!enabled(lvl)) return;
    emit(lvl, msg);
}

void Logger::debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
void Logger::info(const std::string& msg)  { log(LogLevel::INFO,  msg); }
void Logger::warn(const std::string& msg)  { log(LogLevel::WARN,  msg); }
void Logger::error(const std::string& msg) { log(LogLevel::ERROR, msg); }
