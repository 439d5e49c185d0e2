/**
 * @file dn.cpp
 * @brief DN parsing over ldap_str2dn and scope comparisons
 */

#include "dirmock/dn.h"
#include "dirmock/string_utils.h"
#include <stdexcept>
#include <ldap.h>
#include <spdlog/spdlog.h>

namespace dirmock {

namespace {

std::string fromBerval(const struct berval& bv) {
    if (bv.bv_val == nullptr) {
        return "";
    }
    return std::string(bv.bv_val, bv.bv_len);
}

// '#' form of a BER-encoded value, as ldap_str2dn decodes it to binary
std::string hexForm(const struct berval& bv) {
    static const char* digits = "0123456789abcdef";
    std::string hex = "#";
    for (ber_len_t i = 0; i < bv.bv_len; ++i) {
        unsigned char c = static_cast<unsigned char>(bv.bv_val[i]);
        hex += digits[c >> 4];
        hex += digits[c & 0x0f];
    }
    return hex;
}

// Offset of the first RDN separator outside quotes and escapes
size_t findFirstSeparator(const std::string& text) {
    bool quoted = false;
    for (size_t i = 0; i < text.length(); ++i) {
        char c = text[i];
        if (c == '\\') {
            ++i;
        } else if (c == '"') {
            quoted = !quoted;
        } else if (!quoted && (c == ',' || c == ';')) {
            return i;
        }
    }
    return std::string::npos;
}

std::string foldRdn(const Rdn& rdn) {
    std::string folded;
    for (size_t i = 0; i < rdn.size(); ++i) {
        if (i > 0) {
            folded += "+";
        }
        folded += utils::toLower(rdn[i].attribute) + "=" + utils::toLower(rdn[i].value);
    }
    return folded;
}

} // anonymous namespace

Outcome<DistinguishedName> DistinguishedName::parse(const std::string& dn) {
    if (dn.find('\0') != std::string::npos) {
        return DirectoryError::invalidDnSyntax(dn);
    }

    LDAPDN ldapDn = nullptr;
    int rc = ldap_str2dn(dn.c_str(), &ldapDn, LDAP_DN_FORMAT_LDAP);
    if (rc != LDAP_SUCCESS) {
        spdlog::debug("ldap_str2dn rejected '{}': {}", dn, ldap_err2string(rc));
        return DirectoryError::invalidDnSyntax(dn);
    }

    DistinguishedName result;
    result.raw_ = dn;

    for (int i = 0; ldapDn != nullptr && ldapDn[i] != nullptr; ++i) {
        Rdn rdn;
        for (int j = 0; ldapDn[i][j] != nullptr; ++j) {
            const LDAPAVA* ava = ldapDn[i][j];
            AttributeTypeAndValue item;
            item.attribute = fromBerval(ava->la_attr);
            item.value = (ava->la_flags & LDAP_AVA_BINARY) ? hexForm(ava->la_value)
                                                           : fromBerval(ava->la_value);
            rdn.push_back(std::move(item));
        }
        result.rdns_.push_back(std::move(rdn));
    }
    ldap_dnfree(ldapDn);

    if (result.rdns_.size() > 1) {
        result.firstSeparator_ = findFirstSeparator(dn);
    }

    result.folded_.reserve(result.rdns_.size());
    for (const auto& rdn : result.rdns_) {
        result.folded_.push_back(foldRdn(rdn));
    }

    return result;
}

bool DistinguishedName::isValid(const std::string& dn) {
    return parse(dn).ok();
}

const AttributeTypeAndValue& DistinguishedName::leading() const {
    if (rdns_.empty()) {
        throw std::out_of_range("DistinguishedName: the root DN has no leading RDN");
    }
    return rdns_.front().front();
}

std::string DistinguishedName::parentString() const {
    if (firstSeparator_ == std::string::npos) {
        return "";
    }
    return utils::trim(raw_.substr(firstSeparator_ + 1));
}

bool DistinguishedName::equalsIgnoreCase(const DistinguishedName& other) const {
    return folded_ == other.folded_;
}

bool DistinguishedName::isSuffixOf(const DistinguishedName& candidate) const {
    if (folded_.size() > candidate.folded_.size()) {
        return false;
    }
    size_t offset = candidate.folded_.size() - folded_.size();
    for (size_t i = 0; i < folded_.size(); ++i) {
        if (folded_[i] != candidate.folded_[offset + i]) {
            return false;
        }
    }
    return true;
}

bool DistinguishedName::isDescendantOf(const DistinguishedName& base) const {
    return folded_.size() > base.folded_.size() && base.isSuffixOf(*this);
}

bool DistinguishedName::isImmediateChildOf(const DistinguishedName& base) const {
    return folded_.size() == base.folded_.size() + 1 && base.isSuffixOf(*this);
}

} // namespace dirmock
