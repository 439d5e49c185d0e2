/** @file password_verifier.cpp
 *  @brief {CRYPT} / {SSHA} / plaintext credential verification
 */

#include "dirmock/password_verifier.h"
#include "dirmock/string_utils.h"
#include <crypt.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <spdlog/spdlog.h>
#include <cstring>
#include <memory>
#include <stdexcept>

namespace dirmock {

namespace {

constexpr const char* CRYPT_TAG = "{CRYPT}";
constexpr const char* SSHA_TAG = "{SSHA}";

// Split "{SCHEME}rest"; false if the value carries no tag
bool splitSchemeTag(const std::string& value, std::string& scheme, std::string& rest) {
    if (value.empty() || value[0] != '{') {
        return false;
    }
    size_t close = value.find('}');
    if (close == std::string::npos) {
        return false;
    }
    scheme = value.substr(1, close - 1);
    rest = value.substr(close + 1);
    return true;
}

std::vector<uint8_t> sha1(const std::string& password, const uint8_t* salt, size_t saltLength) {
    std::vector<uint8_t> digest(SHA_DIGEST_LENGTH);

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned int digestLength = 0;
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha1(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, password.data(), password.size()) == 1 &&
              (saltLength == 0 || EVP_DigestUpdate(ctx, salt, saltLength) == 1) &&
              EVP_DigestFinal_ex(ctx, digest.data(), &digestLength) == 1;
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        throw std::runtime_error("SHA1 digest failed");
    }
    digest.resize(digestLength);
    return digest;
}

bool verifySsha(const std::string& candidate, const std::string& encoded) {
    auto decoded = utils::fromBase64(encoded);
    if (!decoded || decoded->size() < SHA_DIGEST_LENGTH) {
        spdlog::debug("Malformed {{SSHA}} value ({} chars)", encoded.length());
        return false;
    }

    const uint8_t* salt = decoded->data() + SHA_DIGEST_LENGTH;
    size_t saltLength = decoded->size() - SHA_DIGEST_LENGTH;

    std::vector<uint8_t> digest = sha1(candidate, salt, saltLength);
    return std::memcmp(digest.data(), decoded->data(), SHA_DIGEST_LENGTH) == 0;
}

bool verifyCrypt(const std::string& candidate, const std::string& hash) {
    if (hash.empty()) {
        return false;
    }

    auto data = std::make_unique<crypt_data>();
    std::memset(data.get(), 0, sizeof(crypt_data));

    const char* derived = crypt_r(candidate.c_str(), hash.c_str(), data.get());
    if (derived == nullptr || derived[0] == '*') {
        spdlog::debug("crypt(3) rejected the stored {{CRYPT}} setting");
        return false;
    }
    return hash == derived;
}

} // anonymous namespace

PasswordScheme passwordSchemeOf(const std::string& storedValue) {
    std::string scheme;
    std::string rest;
    if (!splitSchemeTag(storedValue, scheme, rest)) {
        return PasswordScheme::Plain;
    }
    if (utils::equalsIgnoreCase(scheme, "CRYPT")) {
        return PasswordScheme::Crypt;
    }
    if (utils::equalsIgnoreCase(scheme, "SSHA")) {
        return PasswordScheme::Ssha;
    }
    return PasswordScheme::Unsupported;
}

bool verifyPassword(const std::string& candidate, const std::string& storedValue) {
    switch (passwordSchemeOf(storedValue)) {
        case PasswordScheme::Plain:
            return candidate == storedValue;
        case PasswordScheme::Crypt:
            return verifyCrypt(candidate, storedValue.substr(std::strlen(CRYPT_TAG)));
        case PasswordScheme::Ssha:
            return verifySsha(candidate, storedValue.substr(std::strlen(SSHA_TAG)));
        case PasswordScheme::Unsupported:
            return false;
    }
    return false;
}

std::string hashSsha(const std::string& password, const std::vector<uint8_t>& salt) {
    std::vector<uint8_t> payload = sha1(password, salt.data(), salt.size());
    payload.insert(payload.end(), salt.begin(), salt.end());
    return std::string(SSHA_TAG) + utils::toBase64(payload);
}

std::string hashSsha(const std::string& password) {
    std::vector<uint8_t> salt(8);
    if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
        throw std::runtime_error("Failed to generate random salt");
    }
    return hashSsha(password, salt);
}

} // namespace dirmock
