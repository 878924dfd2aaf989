#include "passwordHash.hpp"

#include <memory>
#include <stdexcept>
#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        EVP_MD_CTX_free(ctx);
    }
};

typedef std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> DigestContextPtr;

} // namespace

std::string hashPassword(const std::string& password) {
    DigestContextPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), password.data(), password.size()) != 1
        || EVP_DigestFinal_ex(ctx.get(), digest, &digestLength) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    static const char hexDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digestLength * 2);
    for (unsigned int i = 0; i < digestLength; ++i) {
        hex.push_back(hexDigits[digest[i] >> 4]);
        hex.push_back(hexDigits[digest[i] & 0x0F]);
    }
    return hex;
}

bool passwordHashesMatch(const std::string& expected, const std::string& supplied) {
    if (expected.size() != supplied.size()) {
        return false;
    }
    return CRYPTO_memcmp(expected.data(), supplied.data(), expected.size()) == 0;
}
