#include "dirmock/async_results.h"
#include <algorithm>

namespace dirmock {

int AsyncResultQueue::push(SearchResults results) {
    slots_.emplace_back(std::move(results));
    return static_cast<int>(slots_.size()) - 1;
}

std::optional<SearchResults> AsyncResultQueue::pop(int ticket) {
    if (ticket < 0 || static_cast<size_t>(ticket) >= slots_.size()) {
        return std::nullopt;
    }

    std::optional<SearchResults> value = std::move(slots_[ticket]);
    slots_[ticket].reset();
    return value;
}

size_t AsyncResultQueue::pending() const noexcept {
    return static_cast<size_t>(std::count_if(slots_.begin(), slots_.end(),
        [](const std::optional<SearchResults>& slot) { return slot.has_value(); }));
}

} // namespace dirmock
