/**
 * @file entry.h
 * @brief Directory entry: case-insensitive attribute name -> ordered values
 */

#pragma once

#include <string>
#include <vector>

#include "dirmock/types.h"

namespace dirmock {

/**
 * @brief Attribute data stored at one DN
 *
 * Invariants:
 * - an attribute is never present with an empty value list; removing the
 *   last value removes the attribute
 * - values of one attribute are unique and keep insertion order
 */
class Entry {
public:
    Entry() = default;

    /**
     * @brief Build an entry from name/value pairs, de-duplicating values
     *
     * Attributes with no values are skipped.
     */
    static Entry fromAttributes(const std::map<std::string, ValueList>& attributes);

    [[nodiscard]] bool has(const std::string& attribute) const;

    /**
     * @brief Values of an attribute, or nullptr if absent
     */
    [[nodiscard]] const ValueList* values(const std::string& attribute) const;

    /**
     * @brief Set-union the given values into the attribute, creating it if absent
     */
    void addValues(const std::string& attribute, const ValueList& values);

    /**
     * @brief Remove the listed values; drops the attribute if none remain
     */
    void removeValues(const std::string& attribute, const ValueList& values);

    /**
     * @brief Drop the attribute entirely (no-op if absent)
     */
    void removeAttribute(const std::string& attribute);

    /**
     * @brief Overwrite the value list; an empty list drops the attribute
     */
    void replaceValues(const std::string& attribute, const ValueList& values);

    [[nodiscard]] const AttributeMap& attributes() const noexcept { return attributes_; }

    [[nodiscard]] size_t size() const noexcept { return attributes_.size(); }

    [[nodiscard]] bool empty() const noexcept { return attributes_.empty(); }

    /**
     * @brief Keep only allow-listed attributes (case-insensitive names)
     */
    [[nodiscard]] AttributeMap project(const std::vector<std::string>& allowList) const;

    bool operator==(const Entry& other) const {
        return attributes_ == other.attributes_;
    }

private:
    AttributeMap attributes_;
};

/**
 * @brief Replace every value list with an empty list (attrs-only results)
 */
AttributeMap stripValues(const AttributeMap& attributes);

} // namespace dirmock
