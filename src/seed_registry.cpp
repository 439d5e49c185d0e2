#include "dirmock/seed_registry.h"
#include <spdlog/spdlog.h>

namespace dirmock {

void SeedRegistry::seedSearch(const SearchRequest& request, SearchResults results) {
    std::string key = request.key();
    spdlog::debug("Seeding search {} with {} result(s)", key, results.size());
    searches_.insert_or_assign(key, Outcome<SearchResults>(std::move(results)));
}

void SeedRegistry::seedSearchError(const SearchRequest& request, DirectoryError error) {
    std::string key = request.key();
    spdlog::debug("Seeding search {} with error {}", key, errorKindToString(error.kind));
    searches_.insert_or_assign(key, Outcome<SearchResults>(std::move(error)));
}

std::optional<Outcome<SearchResults>> SeedRegistry::lookupSearch(const SearchRequest& request) const {
    auto it = searches_.find(request.key());
    if (it == searches_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace dirmock
