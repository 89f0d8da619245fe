#include "totp.h"
#include "base32.h"
#include "totp_errors.h"

#include <string>

TOTP::TOTP(const std::string& secret_base32,
           int digits,
           std::chrono::seconds period,
           TOTPAlgo algo,
           OtpFormat format)
    : digits_(digits),
      period_(period),
      algo_(algo),
      format_(format)
{
    if (digits_ <= 0 || digits_ > kMaxDigits) {
        throw InvalidParameterError("TOTP: digits must be between 1 and " +
                                    std::to_string(kMaxDigits));
    }
    if (period_.count() <= 0) {
        throw InvalidParameterError("TOTP: period must be positive");
    }
    secret_ = base32_decode(secret_base32);
}

std::uint64_t TOTP::counter_at(UnixSeconds t) const {
    return time_counter(t, period_);
}

std::string TOTP::code_at(UnixSeconds t) const {
    return hotp(algo_, secret_, counter_at(t), digits_, format_);
}

std::string TOTP::now() const {
    return code_at(to_unix_seconds(std::chrono::system_clock::now()));
}

std::string generate_totp_at(const std::string& algorithm,
                             const std::string& secret,
                             int digits,
                             int period,
                             UnixSeconds t,
                             OtpFormat format) {
    TOTP totp(secret, digits, std::chrono::seconds(period), parse_algo(algorithm), format);
    return totp.code_at(t);
}

std::string generate_totp(const std::string& algorithm,
                          const std::string& secret,
                          int digits,
                          int period,
                          OtpFormat format) {
    TOTP totp(secret, digits, std::chrono::seconds(period), parse_algo(algorithm), format);
    return totp.now();
}
