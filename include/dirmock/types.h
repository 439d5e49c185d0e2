/**
 * @file types.h
 * @brief Common types for the directory emulator
 *
 * Value containers, scope and modify op-code enumerations, request/result
 * structs, and the protocol result-type constants returned on success.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <json/json.h>
#include <ldap.h>

#include "dirmock/error.h"
#include "dirmock/string_utils.h"

namespace dirmock {

/// Attribute value: opaque octets
using Value = std::string;
using ValueList = std::vector<Value>;

/// Attribute name (case-insensitive) -> ordered values
using AttributeMap = std::map<std::string, ValueList, utils::CaseInsensitiveLess>;

/// Caller-supplied initial tree: DN -> attribute map
using DirectorySeed = std::map<std::string, std::map<std::string, ValueList>>;

/// One attribute of an add request
using AttributeValues = std::pair<std::string, ValueList>;

/// Protocol message types returned on success (RFC 4511 application tags)
constexpr int RES_BIND = LDAP_RES_BIND;                  ///< 97
constexpr int RES_SEARCH_RESULT = LDAP_RES_SEARCH_RESULT; ///< 101
constexpr int RES_MODIFY = LDAP_RES_MODIFY;              ///< 103
constexpr int RES_ADD = LDAP_RES_ADD;                    ///< 105
constexpr int RES_DELETE = LDAP_RES_DELETE;              ///< 107
constexpr int RES_MODRDN = LDAP_RES_MODRDN;              ///< 109
constexpr int RES_EXTENDED = LDAP_RES_EXTENDED;          ///< 120

/// Default search filter
constexpr const char* DEFAULT_FILTER = "(objectClass=*)";

/// @brief Search scope
enum class SearchScope {
    Base,      ///< The base entry only
    OneLevel,  ///< Immediate children of the base
    Subtree    ///< The base and all its descendants
};

/// @brief Modify op code
enum class ModOp {
    Add,
    Delete,
    Replace
};

/// @brief Convert SearchScope to string
std::string searchScopeToString(SearchScope scope);

/// @brief Convert ModOp to string
std::string modOpToString(ModOp op);

/**
 * @brief Map an LDAP_SCOPE_* code to SearchScope
 * @return InvalidArgument for an unrecognized code
 */
Outcome<SearchScope> searchScopeFromCode(int code);

/**
 * @brief Map an LDAP_MOD_* code to ModOp
 * @return InvalidArgument for an unrecognized code
 */
Outcome<ModOp> modOpFromCode(int code);

/**
 * @brief Success result of a write or bind operation
 */
struct OperationResult {
    int resultType = 0;  ///< RES_BIND, RES_MODIFY, ...
    int messageId = 0;   ///< Message id (add reports the recorded call count)
};

/**
 * @brief One modification of a modify request
 *
 * The value is normalized on construction: no value becomes an empty list,
 * a single value becomes a one-element list.
 */
struct Modification {
    ModOp op;
    std::string attribute;
    ValueList values;

    Modification(ModOp op, std::string attribute)
        : op(op), attribute(std::move(attribute)) {}

    Modification(ModOp op, std::string attribute, Value value)
        : op(op), attribute(std::move(attribute)), values{std::move(value)} {}

    Modification(ModOp op, std::string attribute, ValueList values)
        : op(op), attribute(std::move(attribute)), values(std::move(values)) {}

    [[nodiscard]] Json::Value toJson() const;
};

/**
 * @brief Search request parameters
 */
struct SearchRequest {
    std::string base;
    SearchScope scope = SearchScope::Subtree;
    std::string filter = DEFAULT_FILTER;
    std::optional<std::vector<std::string>> attributes;  ///< Allow-list; nullopt keeps all
    bool attributesOnly = false;                          ///< Strip values, keep names

    [[nodiscard]] Json::Value toJson() const;

    /**
     * @brief Compact serialization used as a lookup key for seeded responses
     */
    [[nodiscard]] std::string key() const;
};

/**
 * @brief One search hit
 */
struct SearchResultEntry {
    std::string dn;
    AttributeMap attributes;

    bool operator==(const SearchResultEntry& other) const {
        return dn == other.dn && attributes == other.attributes;
    }
};

using SearchResults = std::vector<SearchResultEntry>;

/**
 * @brief Message delivered by fetching an async search ticket
 *
 * @c entries is std::nullopt when the ticket was already consumed or never
 * issued.
 */
struct SearchResultMessage {
    int resultType = RES_SEARCH_RESULT;
    std::optional<SearchResults> entries;
};

/// @brief Serialize a value list as a JSON array of strings
Json::Value valuesToJson(const ValueList& values);

} // namespace dirmock
