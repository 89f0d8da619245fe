#include "base32.h"
#include "totp_errors.h"

#include <cctype>

namespace {

constexpr const char* kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

int b32_val(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= '2' && c <= '7') return 26 + (c - '2');
    return -1;
}

} // namespace

std::string base32_decode(const std::string& b32) {
    // Normalize: uppercase, pad to a full 8-char block
    std::string in;
    in.reserve(b32.size() + 8);
    for (char c : b32) {
        in.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (in.size() % 8 != 0) {
        in.append(8 - in.size() % 8, '=');
    }

    std::string out;
    out.reserve(in.size() * 5 / 8);

    unsigned int buffer = 0;
    int bits_left = 0;
    bool in_padding = false;

    for (std::size_t i = 0; i < in.size(); ++i) {
        const char c = in[i];
        if (c == '=') {
            in_padding = true;
            continue;
        }
        int v = b32_val(c);
        if (v < 0) {
            throw DecodeError("base32: invalid character at position " + std::to_string(i));
        }
        if (in_padding) {
            throw DecodeError("base32: data after padding at position " + std::to_string(i));
        }
        buffer = ((buffer << 5) | static_cast<unsigned int>(v)) & 0xFFFFu;
        bits_left += 5;
        if (bits_left >= 8) {
            bits_left -= 8;
            out.push_back(static_cast<char>((buffer >> bits_left) & 0xFF));
        }
    }
    // trailing bits short of a byte are dropped

    if (out.empty()) {
        throw DecodeError("base32: secret decodes to zero bytes");
    }
    return out;
}

std::string base32_encode(const std::string& raw, bool pad) {
    std::string out;
    out.reserve((raw.size() + 4) / 5 * 8);

    unsigned int buffer = 0;
    int bits = 0;
    for (char ch : raw) {
        buffer = ((buffer << 8) | static_cast<unsigned char>(ch)) & 0xFFFFu;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(kAlphabet[(buffer >> bits) & 0x1F]);
        }
    }
    if (bits > 0) {
        out.push_back(kAlphabet[(buffer << (5 - bits)) & 0x1F]);
    }
    if (pad) {
        while (out.size() % 8 != 0) out.push_back('=');
    }
    return out;
}
