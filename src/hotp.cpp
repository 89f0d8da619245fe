#include "hotp.h"
#include "counter.h"
#include "totp_errors.h"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

constexpr std::uint32_t kLegacyModulus = 1000000; // six decimal digits

std::uint32_t modulus_for(int digits) {
    // 2^31 - 1 has ten digits; beyond nine the modulus is a no-op
    if (digits >= 10) return 0;
    std::uint32_t mod = 1;
    for (int i = 0; i < digits; ++i) mod *= 10;
    return mod;
}

std::string left_pad(std::uint32_t val, int width) {
    std::ostringstream oss;
    oss << std::setw(width) << std::setfill('0') << val;
    return oss.str();
}

} // namespace

OtpFormat parse_format(const std::string& name) {
    std::string norm;
    for (char c : name) norm.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (norm == "legacy") return OtpFormat::Legacy;
    if (norm == "standard" || norm == "rfc") return OtpFormat::Standard;
    throw InvalidParameterError("TOTP: unknown format '" + name + "'");
}

const char* format_name(OtpFormat fmt) noexcept {
    switch (fmt) {
        case OtpFormat::Legacy:   return "legacy";
        case OtpFormat::Standard: return "standard";
    }
    return "?";
}

std::uint32_t dynamic_truncate(const std::vector<unsigned char>& digest) {
    if (digest.empty()) {
        throw std::invalid_argument("TOTP: empty digest");
    }
    const std::size_t offset = digest.back() & 0x0F;
    if (digest.size() < offset + 4) {
        throw std::invalid_argument("TOTP: digest too short (" + std::to_string(digest.size()) +
                                    " bytes) for offset " + std::to_string(offset));
    }
    return ((static_cast<std::uint32_t>(digest[offset])   & 0x7F) << 24) |
           ((static_cast<std::uint32_t>(digest[offset+1]) & 0xFF) << 16) |
           ((static_cast<std::uint32_t>(digest[offset+2]) & 0xFF) <<  8) |
           ((static_cast<std::uint32_t>(digest[offset+3]) & 0xFF) <<  0);
}

std::string format_otp(std::uint32_t p, int digits, OtpFormat fmt) {
    if (digits <= 0 || digits > kMaxDigits) {
        throw InvalidParameterError("TOTP: digits must be between 1 and " +
                                    std::to_string(kMaxDigits) + ", got " + std::to_string(digits));
    }

    if (fmt == OtpFormat::Legacy) {
        // six significant digits, then keep the rightmost `digits`
        std::string six = left_pad(p % kLegacyModulus, 6);
        if (digits <= 6) return six.substr(6 - static_cast<std::size_t>(digits));
        return std::string(static_cast<std::size_t>(digits) - 6, '0') + six;
    }

    const std::uint32_t mod = modulus_for(digits);
    return left_pad(mod ? p % mod : p, digits);
}

std::string hotp(TOTPAlgo algo, const std::string& key, std::uint64_t counter,
                 int digits, OtpFormat fmt) {
    const auto msg = encode_counter(counter);
    const auto mac = keyed_hash(algo, key, msg.data(), msg.size());
    return format_otp(dynamic_truncate(mac), digits, fmt);
}
