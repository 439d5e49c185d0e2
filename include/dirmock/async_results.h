/**
 * @file async_results.h
 * @brief One-shot ticket table for asynchronous search results
 */

#pragma once

#include <optional>
#include <vector>

#include "dirmock/types.h"

namespace dirmock {

/**
 * @brief Buffers search results behind integer tickets
 *
 * Tickets are issued in order starting at 0 and never reused. Fetching a
 * ticket returns its results once and clears the slot; a cleared or
 * never-issued ticket yields std::nullopt.
 */
class AsyncResultQueue {
public:
    /**
     * @brief Store results and issue a ticket for them
     */
    int push(SearchResults results);

    /**
     * @brief Consume a ticket
     * @return The stored results on first fetch, std::nullopt afterwards
     *         or for an out-of-range ticket
     */
    std::optional<SearchResults> pop(int ticket);

    /// @brief Number of tickets issued so far
    [[nodiscard]] size_t issued() const noexcept { return slots_.size(); }

    /// @brief Number of tickets still holding results
    [[nodiscard]] size_t pending() const noexcept;

private:
    std::vector<std::optional<SearchResults>> slots_;
};

} // namespace dirmock
