/**
 * @file string_utils.cpp
 * @brief Common string utility functions implementation
 */

#include "dirmock/string_utils.h"
#include <algorithm>
#include <cctype>
#include <openssl/evp.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>

namespace dirmock {
namespace utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool equalsIgnoreCase(const std::string& lhs, const std::string& rhs) {
    if (lhs.length() != rhs.length()) {
        return false;
    }
    for (size_t i = 0; i < lhs.length(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    if (start == str.length()) {
        return "";
    }

    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.length() >= prefix.length() &&
           str.compare(0, prefix.length(), prefix) == 0;
}

std::string toBase64(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new(BIO_s_mem());
    b64 = BIO_push(b64, mem);

    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(b64, data.data(), static_cast<int>(data.size()));
    BIO_flush(b64);

    BUF_MEM* bufferPtr = nullptr;
    BIO_get_mem_ptr(b64, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(b64);

    return result;
}

std::optional<std::vector<uint8_t>> fromBase64(const std::string& base64) {
    if (base64.empty()) {
        return std::vector<uint8_t>{};
    }

    // BIO silently skips garbage, so reject anything outside the alphabet first
    size_t padding = 0;
    for (size_t i = 0; i < base64.length(); ++i) {
        unsigned char c = static_cast<unsigned char>(base64[i]);
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0 || !(std::isalnum(c) || c == '+' || c == '/')) {
            return std::nullopt;
        }
    }
    if (base64.length() % 4 != 0 || padding > 2) {
        return std::nullopt;
    }

    std::vector<uint8_t> result((base64.length() * 3) / 4);

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new_mem_buf(base64.data(), static_cast<int>(base64.length()));
    mem = BIO_push(b64, mem);

    BIO_set_flags(mem, BIO_FLAGS_BASE64_NO_NL);
    int actualLength = BIO_read(mem, result.data(), static_cast<int>(result.size()));
    BIO_free_all(mem);

    if (actualLength < 0) {
        return std::nullopt;
    }

    result.resize(static_cast<size_t>(actualLength));
    return result;
}

int hexDigitValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    } else if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

bool CaseInsensitiveLess::operator()(const std::string& lhs, const std::string& rhs) const {
    return std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        [](unsigned char a, unsigned char b) { return std::tolower(a) < std::tolower(b); });
}

} // namespace utils
} // namespace dirmock
