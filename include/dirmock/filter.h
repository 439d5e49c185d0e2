/**
 * @file filter.h
 * @brief Search filter parsing (RFC 4515 string form) and evaluation
 *
 * Supported: equality "(attr=value)", presence "(attr=*)", and the
 * "&", "|", "!" combinators. Substring, approximate, ordering and
 * extensible matches parse as UnsupportedFilterOperation so callers can
 * fall back to a seeded response instead of mis-evaluating them.
 */

#pragma once

#include <string>
#include <vector>

#include "dirmock/entry.h"
#include "dirmock/error.h"

namespace dirmock {

/**
 * @brief Parsed filter tree node
 */
struct FilterNode {
    enum class Type {
        Equality,  ///< attribute, value
        Presence,  ///< attribute
        And,       ///< children (empty: absolute true)
        Or,        ///< children (empty: absolute false)
        Not        ///< exactly one child
    };

    Type type = Type::Presence;
    std::string attribute;
    std::string value;
    std::vector<FilterNode> children;

    static FilterNode equality(std::string attribute, std::string value);
    static FilterNode presence(std::string attribute);
    static FilterNode conjunction(std::vector<FilterNode> children);
    static FilterNode disjunction(std::vector<FilterNode> children);
    static FilterNode negation(FilterNode child);

    /// @brief Render back to RFC 4515 text (values escaped)
    [[nodiscard]] std::string toString() const;
};

/**
 * @brief Parse filter text into a FilterNode tree
 *
 * A filter without enclosing parentheses ("cn=alice") is accepted as a
 * single item. Values may contain RFC 4515 "\XX" escapes.
 *
 * @return FilterError for malformed text, UnsupportedFilterOperation for
 *         valid forms this engine does not evaluate
 */
Outcome<FilterNode> parseFilter(const std::string& text);

/**
 * @brief Evaluates a parsed filter against entries
 *
 * Stateless apart from the name of the credential attribute, whose values
 * are compared through verifyPassword() rather than literally.
 */
class FilterEvaluator {
public:
    explicit FilterEvaluator(std::string credentialAttribute = "userPassword");

    [[nodiscard]] bool matches(const FilterNode& node, const Entry& entry) const;

private:
    bool matchesEquality(const FilterNode& node, const Entry& entry) const;

    std::string credentialAttribute_;
};

/**
 * @brief Escape a value for use inside filter text (RFC 4515)
 */
std::string escapeFilterValue(const std::string& value);

} // namespace dirmock
