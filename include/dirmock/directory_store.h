/**
 * @file directory_store.h
 * @brief In-memory entry store keyed by lower-cased DN
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "dirmock/entry.h"

namespace dirmock {

/**
 * @brief Mapping from normalized DN to Entry
 *
 * Keys are the lower-cased DN string; lookups normalize the same way, so
 * DN uniqueness is case-insensitive. put() overwrites unconditionally;
 * callers check contains() first where overwriting is an error.
 */
class DirectoryStore {
public:
    using Map = std::map<std::string, Entry>;

    DirectoryStore() = default;

    /**
     * @brief Deep-copy a caller-supplied seed tree
     *
     * Seed DNs differing only in case collapse to one key; the first one in
     * the seed map's key order wins and the rest are dropped with a warning.
     */
    static DirectoryStore fromSeed(const DirectorySeed& seed);

    /// @brief Normalized key for a DN string
    static std::string normalize(const std::string& dn);

    [[nodiscard]] const Entry* get(const std::string& dn) const;
    [[nodiscard]] Entry* get(const std::string& dn);

    void put(const std::string& dn, Entry entry);

    /**
     * @return true if an entry was removed
     */
    bool remove(const std::string& dn);

    [[nodiscard]] bool contains(const std::string& dn) const;

    /// @brief Normalized DNs currently stored
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }

    [[nodiscard]] Map::const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] Map::const_iterator end() const noexcept { return entries_.end(); }

    /**
     * @brief Copy of the current tree in seed form
     */
    [[nodiscard]] DirectorySeed snapshot() const;

private:
    Map entries_;
};

} // namespace dirmock
