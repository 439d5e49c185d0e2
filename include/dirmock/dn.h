/**
 * @file dn.h
 * @brief Distinguished Name model
 *
 * Parses DN strings with OpenLDAP's ldap_str2dn (RFC 4514 syntax, plus the
 * LDAPv2 forms it accepts such as quoted values and ';' separators) into an
 * ordered sequence of RDNs and provides the case-insensitive structural comparisons
 * used for search scoping.
 *
 * @example
 * auto dn = DistinguishedName::parse("cn=alice,ou=people,dc=example,dc=com");
 * auto base = DistinguishedName::parse("dc=example,dc=com");
 * dn.value().isDescendantOf(base.value());   // true
 */

#pragma once

#include <string>
#include <vector>

#include "dirmock/error.h"

namespace dirmock {

/// @brief One attribute=value assertion inside an RDN (value unescaped, '#' form kept for BER values)
struct AttributeTypeAndValue {
    std::string attribute;
    std::string value;
};

/// @brief Relative distinguished name; more than one AVA when joined with '+'
using Rdn = std::vector<AttributeTypeAndValue>;

/**
 * @brief Parsed Distinguished Name
 *
 * A syntactically invalid string never becomes a DistinguishedName:
 * parse() fails with InvalidDnSyntax. The empty string is the zero-length
 * (root) DN.
 */
class DistinguishedName {
public:
    /**
     * @brief Parse a DN string
     * @param dn DN in RFC 4514 string form
     * @return Parsed DN, or InvalidDnSyntax
     */
    static Outcome<DistinguishedName> parse(const std::string& dn);

    /**
     * @brief True if @p dn parses
     */
    static bool isValid(const std::string& dn);

    /// @brief Original text as given to parse()
    [[nodiscard]] const std::string& raw() const noexcept { return raw_; }

    [[nodiscard]] const std::vector<Rdn>& rdns() const noexcept { return rdns_; }

    [[nodiscard]] size_t size() const noexcept { return rdns_.size(); }

    [[nodiscard]] bool empty() const noexcept { return rdns_.empty(); }

    /**
     * @brief Leading AVA of the leading RDN
     * @throws std::out_of_range for the empty DN
     */
    [[nodiscard]] const AttributeTypeAndValue& leading() const;

    /**
     * @brief Raw text following the leading RDN's separator ("" if none)
     */
    [[nodiscard]] std::string parentString() const;

    /**
     * @brief Lower-cased "attr=value" text per RDN, in order
     */
    [[nodiscard]] const std::vector<std::string>& foldedRdns() const noexcept { return folded_; }

    /// @brief Component-wise case-insensitive equality
    [[nodiscard]] bool equalsIgnoreCase(const DistinguishedName& other) const;

    /**
     * @brief True if this DN's components equal @p candidate's trailing components
     *
     * Subtree scope: the base is a suffix of every entry in its subtree,
     * including itself.
     */
    [[nodiscard]] bool isSuffixOf(const DistinguishedName& candidate) const;

    /// @brief True if @p base is a strict ancestor of this DN
    [[nodiscard]] bool isDescendantOf(const DistinguishedName& base) const;

    /**
     * @brief One-level scope: this DN minus its leading RDN equals @p base
     */
    [[nodiscard]] bool isImmediateChildOf(const DistinguishedName& base) const;

    bool operator==(const DistinguishedName& other) const {
        return equalsIgnoreCase(other);
    }

    bool operator!=(const DistinguishedName& other) const {
        return !(*this == other);
    }

private:
    DistinguishedName() = default;

    std::string raw_;
    std::vector<Rdn> rdns_;
    std::vector<std::string> folded_;
    size_t firstSeparator_ = std::string::npos;
};

} // namespace dirmock
