#include "hmac_engine.h"
#include "hotp.h"
#include "totp_errors.h"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

static const std::string kSeed = "12345678901234567890";

int main() {
    // algorithm names
    assert(parse_algo("SHA1") == TOTPAlgo::SHA1);
    assert(parse_algo("sha-1") == TOTPAlgo::SHA1);
    assert(parse_algo("SHA-256") == TOTPAlgo::SHA256);
    assert(parse_algo("sha512") == TOTPAlgo::SHA512);
    bool threw = false;
    try { parse_algo("MD5"); } catch (const UnsupportedAlgorithmError&) { threw = true; }
    assert(threw);
    threw = false;
    try { parse_algo(""); } catch (const UnsupportedAlgorithmError&) { threw = true; }
    assert(threw);

    assert(digest_size(TOTPAlgo::SHA1) == 20);
    assert(digest_size(TOTPAlgo::SHA256) == 32);
    assert(digest_size(TOTPAlgo::SHA512) == 64);

    const unsigned char msg[8] = {0, 0, 0, 0, 0, 0, 0, 0};
    assert(keyed_hash(TOTPAlgo::SHA1, kSeed, msg, sizeof msg).size() == 20);
    assert(keyed_hash(TOTPAlgo::SHA512, kSeed, msg, sizeof msg).size() == 64);

    // RFC 4226 5.4 example digest: offset 10 -> 0x50ef7f19
    const std::vector<unsigned char> example{
        0x1f, 0x86, 0x98, 0x69, 0x0e, 0x02, 0xca, 0x16, 0x61, 0x85,
        0x50, 0xef, 0x7f, 0x19, 0xda, 0x8e, 0x94, 0x5b, 0x55, 0x5a};
    assert(dynamic_truncate(example) == 0x50ef7f19u);
    assert(dynamic_truncate(example) == 1357872921u);

    // high bit cleared
    std::vector<unsigned char> high(20, 0xFF);
    high.back() = 0xF0; // offset 0
    assert(dynamic_truncate(high) == 0x7FFFFFFFu);

    // offset 15 needs 19 bytes
    std::vector<unsigned char> short_digest(18, 0x0F);
    threw = false;
    try { dynamic_truncate(short_digest); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    // RFC 4226 appendix D
    const std::uint32_t truncated[] = {
        1284755224u, 1094287082u, 137359152u, 1726969429u, 1640338314u,
        868254676u, 1918287922u, 82162583u, 673399871u, 645520489u};
    const char* codes[] = {
        "755224", "287082", "359152", "969429", "338314",
        "254676", "287922", "162583", "399871", "520489"};
    for (std::uint64_t c = 0; c < 10; ++c) {
        const unsigned char m[8] = {0, 0, 0, 0, 0, 0, 0, static_cast<unsigned char>(c)};
        const auto mac = keyed_hash(TOTPAlgo::SHA1, kSeed, m, sizeof m);
        if (dynamic_truncate(mac) != truncated[c]) {
            std::cerr << "truncation mismatch at counter " << c << "\n";
            return 1;
        }
        const std::string got = hotp(TOTPAlgo::SHA1, kSeed, c, 6);
        if (got != codes[c]) {
            std::cerr << "HOTP mismatch at counter " << c << ": " << got << "\n";
            return 1;
        }
    }

    // formatting: both modes agree up to six digits
    assert(format_otp(1094287082u, 6) == "287082");
    assert(format_otp(1094287082u, 4) == "7082");
    assert(format_otp(1094287082u, 1) == "2");
    assert(format_otp(1094287082u, 4, OtpFormat::Standard) == "7082");
    assert(format_otp(137359152u, 6) == "359152");
    assert(format_otp(82162583u, 8, OtpFormat::Standard) == "82162583");

    // legacy zero-extends instead of adding significant digits
    assert(format_otp(1094287082u, 8) == "00287082");
    assert(format_otp(1094287082u, 8, OtpFormat::Standard) == "94287082");
    assert(format_otp(5u, 6) == "000005");
    assert(format_otp(5u, 10) == "0000000005");

    // standard above ten digits pads the full value
    assert(format_otp(1094287082u, 10, OtpFormat::Standard) == "1094287082");
    assert(format_otp(1094287082u, 12, OtpFormat::Standard) == "001094287082");

    for (int d = 1; d <= 12; ++d) {
        for (OtpFormat f : {OtpFormat::Legacy, OtpFormat::Standard}) {
            const std::string s = format_otp(0x7FFFFFFFu, d, f);
            assert(static_cast<int>(s.size()) == d);
            assert(s.find_first_not_of("0123456789") == std::string::npos);
        }
    }

    threw = false;
    try { format_otp(1u, 0); } catch (const InvalidParameterError&) { threw = true; }
    assert(threw);
    threw = false;
    try { format_otp(1u, kMaxDigits + 1); } catch (const InvalidParameterError&) { threw = true; }
    assert(threw);

    assert(parse_format("legacy") == OtpFormat::Legacy);
    assert(parse_format("RFC") == OtpFormat::Standard);
    assert(parse_format(format_name(OtpFormat::Standard)) == OtpFormat::Standard);
    assert(std::string(format_name(OtpFormat::Legacy)) == "legacy");
    threw = false;
    try { parse_format("hex"); } catch (const InvalidParameterError&) { threw = true; }
    assert(threw);

    std::cout << "HOTP test passed.\n";
    return 0;
}
