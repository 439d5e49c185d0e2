/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Case folding, trimming and Base64 helpers shared by the DN model,
 * the filter engine and the password verifier.
 *
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace dirmock {
namespace utils {

/**
 * @brief Convert string to lowercase (ASCII only)
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Case-insensitive equality (ASCII only)
 */
bool equalsIgnoreCase(const std::string& lhs, const std::string& rhs);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Check if string starts with prefix
 */
bool startsWith(const std::string& str, const std::string& prefix);

/**
 * @brief Encode binary data to Base64 (no line breaks)
 *
 * @param data Binary data
 * @return Base64-encoded string
 */
std::string toBase64(const std::vector<uint8_t>& data);

/**
 * @brief Decode Base64 string
 *
 * @param base64 Base64-encoded string
 * @return Binary data, or std::nullopt if the input is not valid Base64
 */
std::optional<std::vector<uint8_t>> fromBase64(const std::string& base64);

/**
 * @brief Value of a single hex digit, or -1
 */
int hexDigitValue(char c);

/**
 * @brief Comparator for case-insensitive ordered containers
 *
 * Attribute names in the directory are case-insensitive; a map using this
 * comparator keeps the spelling of the first key inserted.
 */
struct CaseInsensitiveLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

} // namespace utils
} // namespace dirmock
