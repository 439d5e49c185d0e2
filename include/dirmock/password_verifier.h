#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace dirmock {

/// @brief Hash scheme of a stored credential value ("{SCHEME}rest")
enum class PasswordScheme {
    Plain,        ///< No scheme tag: literal comparison
    Crypt,        ///< {CRYPT}: system crypt(3)
    Ssha,         ///< {SSHA}: base64(SHA1(password + salt) + salt)
    Unsupported   ///< Tagged with a scheme not handled here; never matches
};

/**
 * @brief Determine the scheme of a stored credential value
 *
 * Scheme tags are matched case-insensitively.
 */
PasswordScheme passwordSchemeOf(const std::string& storedValue);

/**
 * @brief Verify a candidate password against a (possibly hashed) stored value
 *
 * - {CRYPT}: crypt(candidate, stored hash) must reproduce the stored hash
 * - {SSHA}: the stored value is base64-decoded; SHA1 over candidate bytes
 *   followed by the trailing salt must equal the leading 20 bytes
 * - untagged: literal equality
 * - any other tag: false
 *
 * @param candidate Plain text password to verify
 * @param storedValue Stored credential attribute value
 * @return true if password matches, false otherwise
 */
bool verifyPassword(const std::string& candidate, const std::string& storedValue);

/**
 * @brief Produce an {SSHA} value for @p password with the given salt
 */
std::string hashSsha(const std::string& password, const std::vector<uint8_t>& salt);

/**
 * @brief Produce an {SSHA} value with a random 8-byte salt
 */
std::string hashSsha(const std::string& password);

} // namespace dirmock
