/**
 * @file error.h
 * @brief Error kinds and the Outcome type returned by every directory operation
 *
 * Protocol-level failures are values, not exceptions: each operation returns
 * an Outcome holding either its result or a DirectoryError whose kind maps
 * onto the standard LDAP result code.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace dirmock {

/// @brief Closed set of failure conditions an operation can report
enum class ErrorKind {
    InvalidDnSyntax,             ///< DN string does not follow the DN grammar
    NoSuchObject,                ///< Target entry (or search base) is absent
    AlreadyExists,               ///< Target DN is already present
    ProtocolError,               ///< Request shape rejected (e.g. ADD with no values)
    InvalidCredentials,          ///< Simple bind failed
    FilterError,                 ///< Filter text is malformed
    UnsupportedFilterOperation,  ///< Filter form is valid but not evaluated here; seed required
    InvalidArgument              ///< Argument shape error (non-string value, unknown scope/op code)
};

/**
 * @brief Failure reported by a directory operation
 *
 * For InvalidCredentials, @c dn holds the attempted identity and
 * @c detail the attempted credential.
 */
struct DirectoryError {
    ErrorKind kind = ErrorKind::ProtocolError;
    std::string message;
    std::string dn;
    std::string detail;

    /**
     * @brief Standard LDAP result code for this error (LDAP_NO_SUCH_OBJECT, ...)
     */
    [[nodiscard]] int resultCode() const noexcept;

    /**
     * @brief "<ldap_err2string text>: <message>"
     */
    [[nodiscard]] std::string toString() const;

    static DirectoryError invalidDnSyntax(const std::string& dn);
    static DirectoryError noSuchObject(const std::string& dn);
    static DirectoryError alreadyExists(const std::string& dn);
    static DirectoryError protocolError(const std::string& message, const std::string& dn = "");
    static DirectoryError invalidCredentials(const std::string& who, const std::string& cred);
    static DirectoryError filterError(const std::string& message);
    static DirectoryError unsupportedFilter(const std::string& message);
    static DirectoryError invalidArgument(const std::string& message);
};

/// @brief Convert ErrorKind to string
std::string errorKindToString(ErrorKind kind);

/// @brief Map ErrorKind to the LDAP result code from <ldap.h>
int errorKindToResultCode(ErrorKind kind) noexcept;

/**
 * @brief Result of an operation: either a value or a DirectoryError
 *
 * Usage:
 * @code
 *   auto outcome = emulator.compare(dn, "cn", "alice");
 *   if (!outcome.ok()) {
 *       spdlog::warn("compare failed: {}", outcome.error().toString());
 *   }
 * @endcode
 */
template<typename T>
class Outcome {
public:
    Outcome(T value) : value_(std::move(value)) {}
    Outcome(DirectoryError error) : error_(std::move(error)) {}

    [[nodiscard]] bool ok() const noexcept {
        return value_.has_value();
    }

    /**
     * @brief Access the value
     * @throws std::logic_error if the outcome holds an error
     */
    [[nodiscard]] const T& value() const {
        if (!value_) {
            throw std::logic_error("Outcome holds an error: " + error_->toString());
        }
        return *value_;
    }

    [[nodiscard]] T& value() {
        if (!value_) {
            throw std::logic_error("Outcome holds an error: " + error_->toString());
        }
        return *value_;
    }

    /**
     * @brief Access the error
     * @throws std::logic_error if the outcome holds a value
     */
    [[nodiscard]] const DirectoryError& error() const {
        if (!error_) {
            throw std::logic_error("Outcome holds a value, not an error");
        }
        return *error_;
    }

    /**
     * @brief Error kind, or std::nullopt on success
     */
    [[nodiscard]] std::optional<ErrorKind> errorKind() const noexcept {
        if (error_) {
            return error_->kind;
        }
        return std::nullopt;
    }

private:
    std::optional<T> value_;
    std::optional<DirectoryError> error_;
};

} // namespace dirmock
