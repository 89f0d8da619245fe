#include "hmac_engine.h"
#include "totp_errors.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <array>
#include <cctype>
#include <stdexcept>

namespace {

const EVP_MD* md_for_algo(TOTPAlgo algo) {
    switch (algo) {
        case TOTPAlgo::SHA1:   return EVP_sha1();
        case TOTPAlgo::SHA256: return EVP_sha256();
        case TOTPAlgo::SHA512: return EVP_sha512();
    }
    throw UnsupportedAlgorithmError("TOTP: unknown algorithm tag");
}

} // namespace

TOTPAlgo parse_algo(const std::string& name) {
    std::string norm;
    norm.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == '_') continue;
        norm.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (norm == "SHA1")   return TOTPAlgo::SHA1;
    if (norm == "SHA256") return TOTPAlgo::SHA256;
    if (norm == "SHA512") return TOTPAlgo::SHA512;
    throw UnsupportedAlgorithmError("TOTP: unsupported algorithm '" + name + "'");
}

const char* algo_name(TOTPAlgo algo) noexcept {
    switch (algo) {
        case TOTPAlgo::SHA1:   return "SHA-1";
        case TOTPAlgo::SHA256: return "SHA-256";
        case TOTPAlgo::SHA512: return "SHA-512";
    }
    return "?";
}

std::size_t digest_size(TOTPAlgo algo) {
    return static_cast<std::size_t>(EVP_MD_size(md_for_algo(algo)));
}

std::vector<unsigned char> keyed_hash(TOTPAlgo algo,
                                      const std::string& key,
                                      const unsigned char* msg, std::size_t msg_len) {
    const EVP_MD* md = md_for_algo(algo);
    std::array<unsigned char, EVP_MAX_MD_SIZE> mac{};
    unsigned int len = 0;

    if (!HMAC(md,
              reinterpret_cast<const unsigned char*>(key.data()), static_cast<int>(key.size()),
              msg, msg_len,
              mac.data(), &len)) {
        throw std::runtime_error(std::string("TOTP: HMAC-") + algo_name(algo) + " failed");
    }
    return std::vector<unsigned char>(mac.begin(), mac.begin() + len);
}
