#pragma once
#include <cstddef>
#include <string>
#include <vector>

enum class TOTPAlgo { SHA1, SHA256, SHA512 };

// Accepts SHA1 / SHA-1 / SHA256 / SHA-256 / SHA512 / SHA-512, any case.
// Throws UnsupportedAlgorithmError otherwise.
TOTPAlgo parse_algo(const std::string& name);

const char* algo_name(TOTPAlgo algo) noexcept;

// Digest size in bytes (20 / 32 / 64)
std::size_t digest_size(TOTPAlgo algo);

// HMAC(key, message) with the selected hash (OpenSSL).
std::vector<unsigned char> keyed_hash(TOTPAlgo algo,
                                      const std::string& key,
                                      const unsigned char* msg, std::size_t msg_len);
