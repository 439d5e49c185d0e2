/**
 * @file error.cpp
 * @brief DirectoryError construction and result-code mapping
 */

#include "dirmock/error.h"
#include <ldap.h>

namespace dirmock {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidDnSyntax:            return "INVALID_DN_SYNTAX";
        case ErrorKind::NoSuchObject:               return "NO_SUCH_OBJECT";
        case ErrorKind::AlreadyExists:              return "ALREADY_EXISTS";
        case ErrorKind::ProtocolError:              return "PROTOCOL_ERROR";
        case ErrorKind::InvalidCredentials:         return "INVALID_CREDENTIALS";
        case ErrorKind::FilterError:                return "FILTER_ERROR";
        case ErrorKind::UnsupportedFilterOperation: return "UNSUPPORTED_FILTER_OPERATION";
        case ErrorKind::InvalidArgument:            return "INVALID_ARGUMENT";
    }
    return "UNKNOWN";
}

int errorKindToResultCode(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidDnSyntax:            return LDAP_INVALID_DN_SYNTAX;
        case ErrorKind::NoSuchObject:               return LDAP_NO_SUCH_OBJECT;
        case ErrorKind::AlreadyExists:              return LDAP_ALREADY_EXISTS;
        case ErrorKind::ProtocolError:              return LDAP_PROTOCOL_ERROR;
        case ErrorKind::InvalidCredentials:         return LDAP_INVALID_CREDENTIALS;
        case ErrorKind::FilterError:                return LDAP_FILTER_ERROR;
        case ErrorKind::UnsupportedFilterOperation: return LDAP_NOT_SUPPORTED;
        case ErrorKind::InvalidArgument:            return LDAP_PARAM_ERROR;
    }
    return LDAP_OTHER;
}

int DirectoryError::resultCode() const noexcept {
    return errorKindToResultCode(kind);
}

std::string DirectoryError::toString() const {
    std::string text = ldap_err2string(resultCode());
    if (!message.empty()) {
        text += ": " + message;
    }
    return text;
}

DirectoryError DirectoryError::invalidDnSyntax(const std::string& dn) {
    return DirectoryError{ErrorKind::InvalidDnSyntax, "invalid DN syntax: '" + dn + "'", dn, ""};
}

DirectoryError DirectoryError::noSuchObject(const std::string& dn) {
    return DirectoryError{ErrorKind::NoSuchObject, "no such object: " + dn, dn, ""};
}

DirectoryError DirectoryError::alreadyExists(const std::string& dn) {
    return DirectoryError{ErrorKind::AlreadyExists, "entry already exists: " + dn, dn, ""};
}

DirectoryError DirectoryError::protocolError(const std::string& message, const std::string& dn) {
    return DirectoryError{ErrorKind::ProtocolError, message, dn, ""};
}

DirectoryError DirectoryError::invalidCredentials(const std::string& who, const std::string& cred) {
    return DirectoryError{ErrorKind::InvalidCredentials, who + ":" + cred, who, cred};
}

DirectoryError DirectoryError::filterError(const std::string& message) {
    return DirectoryError{ErrorKind::FilterError, message, "", ""};
}

DirectoryError DirectoryError::unsupportedFilter(const std::string& message) {
    return DirectoryError{ErrorKind::UnsupportedFilterOperation, message, "", ""};
}

DirectoryError DirectoryError::invalidArgument(const std::string& message) {
    return DirectoryError{ErrorKind::InvalidArgument, message, "", ""};
}

} // namespace dirmock
