#pragma once
#include "counter.h"
#include "hmac_engine.h"
#include "hotp.h"

#include <string>
#include <cstdint>
#include <chrono>

class TOTP {
public:
    // Validates and decodes everything up front; throws DecodeError /
    // InvalidParameterError before any code is produced.
    TOTP(const std::string& secret_base32,
         int digits = 6,
         std::chrono::seconds period = std::chrono::seconds(30),
         TOTPAlgo algo = TOTPAlgo::SHA1,
         OtpFormat format = OtpFormat::Legacy);

    std::string code_at(UnixSeconds t) const;

    // reads system_clock once
    std::string now() const;

    std::uint64_t counter_at(UnixSeconds t) const;

    int digits() const noexcept { return digits_; }
    std::chrono::seconds period() const noexcept { return period_; }
    TOTPAlgo algo() const noexcept { return algo_; }
    OtpFormat format() const noexcept { return format_; }

private:
    std::string secret_; // raw bytes after Base32 decode
    int digits_;
    std::chrono::seconds period_;
    TOTPAlgo algo_;
    OtpFormat format_;
};

// One-shot: generate_totp("SHA-1", "GEZDGNBV...", 6, 30)
std::string generate_totp(const std::string& algorithm,
                          const std::string& secret,
                          int digits,
                          int period,
                          OtpFormat format = OtpFormat::Legacy);

std::string generate_totp_at(const std::string& algorithm,
                             const std::string& secret,
                             int digits,
                             int period,
                             UnixSeconds t,
                             OtpFormat format = OtpFormat::Legacy);
