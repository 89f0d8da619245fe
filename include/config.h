#pragma once
#include "hmac_engine.h"
#include "hotp.h"
#include "logger.h"

#include <chrono>
#include <string>

class Config {
public:
    // Load settings from json file; only "secret" is required.
    static Config load_from_file(const std::string& path);

    // TOTP_SECRET (required), TOTP_ALGORITHM, TOTP_DIGITS, TOTP_PERIOD, TOTP_FORMAT
    static Config from_env();

    // Accessors (read-only)
    const std::string& secret() const { return secret_; }
    TOTPAlgo algo() const { return algo_; }
    int digits() const { return digits_; }
    std::chrono::seconds period() const { return period_; }
    OtpFormat format() const { return format_; }
    LogLevel log_level() const { return log_level_; }

private:
    // private ctor enforce factory method
    Config() = default;

    std::string secret_;
    TOTPAlgo algo_ = TOTPAlgo::SHA1;
    int digits_ = 6;
    std::chrono::seconds period_{30};
    OtpFormat format_ = OtpFormat::Legacy;
    LogLevel log_level_ = LogLevel::INFO;
};
