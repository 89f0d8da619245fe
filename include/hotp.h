#pragma once
#include "hmac_engine.h"

#include <cstdint>
#include <string>
#include <vector>

constexpr int kMaxDigits = 32;

// How the 31-bit truncated value becomes decimal.
//  Legacy:   P mod 10^6, zero-extended / right-aligned to `digits`
//            (what deployed verifiers of this code expect)
//  Standard: P mod 10^digits (RFC 4226 section 5.3)
// The two agree for digits <= 6.
enum class OtpFormat { Legacy, Standard };

// "legacy" / "standard" (also "rfc"), any case. Throws InvalidParameterError.
OtpFormat parse_format(const std::string& name);

const char* format_name(OtpFormat fmt) noexcept;

// RFC 4226 5.3: offset = low nibble of last byte, 4 bytes big-endian, top bit cleared.
// Throws std::invalid_argument if the digest is too short for the offset.
std::uint32_t dynamic_truncate(const std::vector<unsigned char>& digest);

// Exactly `digits` chars of 0-9. Throws InvalidParameterError unless 1 <= digits <= kMaxDigits.
std::string format_otp(std::uint32_t p, int digits, OtpFormat fmt = OtpFormat::Legacy);

// encode counter -> HMAC -> truncate -> format
std::string hotp(TOTPAlgo algo, const std::string& key, std::uint64_t counter,
                 int digits, OtpFormat fmt = OtpFormat::Legacy);
