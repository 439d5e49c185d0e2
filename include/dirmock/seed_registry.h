/**
 * @file seed_registry.h
 * @brief Canned search responses registered ahead of time
 *
 * A seeded search request short-circuits evaluation: the stored result set
 * (or error) is returned as-is. This is the fallback for filter forms the
 * evaluator reports as unsupported.
 */

#pragma once

#include <map>
#include <optional>
#include <string>

#include "dirmock/error.h"
#include "dirmock/types.h"

namespace dirmock {

class SeedRegistry {
public:
    /**
     * @brief Register results for an exact search request
     *
     * Re-seeding the same request replaces the previous response.
     */
    void seedSearch(const SearchRequest& request, SearchResults results);

    /**
     * @brief Register a failure for an exact search request
     */
    void seedSearchError(const SearchRequest& request, DirectoryError error);

    /**
     * @brief Seeded response for @p request, if any
     *
     * Matching compares base, scope, filter, attribute list and the
     * attrs-only flag exactly.
     */
    [[nodiscard]] std::optional<Outcome<SearchResults>> lookupSearch(const SearchRequest& request) const;

    [[nodiscard]] size_t size() const noexcept { return searches_.size(); }

    void clear() noexcept { searches_.clear(); }

private:
    std::map<std::string, Outcome<SearchResults>> searches_;
};

} // namespace dirmock
