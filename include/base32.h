#pragma once
#include <string>

// RFC 4648 base32. Raw bytes are carried in std::string.

// Case-insensitive; input is padded with '=' to a multiple of 8 before decoding.
// Throws DecodeError on characters outside A-Z2-7=, on '=' before data,
// or when nothing decodes.
std::string base32_decode(const std::string& b32);

std::string base32_encode(const std::string& raw, bool pad = true);
