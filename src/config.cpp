#include "config.h"
#include "totp_errors.h"

#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace {

int parse_int(const char* name, const std::string& text) {
    std::size_t pos = 0;
    int v = 0;
    try {
        v = std::stoi(text, &pos);
    } catch (const std::exception&) {
        throw InvalidParameterError(std::string(name) + " is not an integer: " + text);
    }
    if (pos != text.size()) {
        throw InvalidParameterError(std::string(name) + " is not an integer: " + text);
    }
    return v;
}

// Integer field with a default; rejects floats and values outside int.
int json_int(const nlohmann::json& j, const char* key, int fallback) {
    if (!j.contains(key)) return fallback;
    const auto& v = j.at(key);
    if (!v.is_number_integer()) {
        throw InvalidParameterError(std::string(key) + " must be an integer, got " + v.dump());
    }
    if (v.is_number_unsigned()) {
        if (v.get<unsigned long long>() >
            static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
            throw InvalidParameterError(std::string(key) + " out of range: " + v.dump());
        }
        return static_cast<int>(v.get<unsigned long long>());
    }
    const long long n = v.get<long long>();
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
        throw InvalidParameterError(std::string(key) + " out of range: " + v.dump());
    }
    return static_cast<int>(n);
}

void check_ranges(int digits, std::chrono::seconds period) {
    if (digits <= 0 || digits > kMaxDigits) {
        throw InvalidParameterError("digits must be between 1 and " + std::to_string(kMaxDigits) +
                                    ", got " + std::to_string(digits));
    }
    if (period.count() <= 0) {
        throw InvalidParameterError("period must be positive, got " +
                                    std::to_string(period.count()));
    }
}

} // namespace

Config Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Config file not found: " + path);
    }

    nlohmann::json j;
    in >> j;

    Config cfg;
    cfg.secret_  = j.at("secret").get<std::string>();
    cfg.algo_    = parse_algo(j.value("algorithm", std::string("SHA1")));
    cfg.digits_  = json_int(j, "digits", 6);
    cfg.period_  = std::chrono::seconds(json_int(j, "period", 30));
    cfg.format_  = parse_format(j.value("format", std::string("legacy")));
    cfg.log_level_ = parse_log_level(j.value("log_level", std::string("info")));
    check_ranges(cfg.digits_, cfg.period_);

    return cfg;
}

Config Config::from_env() {
    const char* sec = std::getenv("TOTP_SECRET");
    if (!sec) {
        throw std::runtime_error("TOTP_SECRET is not set");
    }

    Config cfg;
    cfg.secret_ = sec;
    if (const char* a = std::getenv("TOTP_ALGORITHM")) cfg.algo_ = parse_algo(a);
    if (const char* d = std::getenv("TOTP_DIGITS"))    cfg.digits_ = parse_int("TOTP_DIGITS", d);
    if (const char* p = std::getenv("TOTP_PERIOD"))
        cfg.period_ = std::chrono::seconds(parse_int("TOTP_PERIOD", p));
    if (const char* f = std::getenv("TOTP_FORMAT"))    cfg.format_ = parse_format(f);
    if (const char* l = std::getenv("TOTP_LOG_LEVEL")) cfg.log_level_ = parse_log_level(l);
    check_ranges(cfg.digits_, cfg.period_);
    return cfg;
}
