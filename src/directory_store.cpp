/**
 * @file directory_store.cpp
 * @brief Entry store implementation
 */

#include "dirmock/directory_store.h"
#include <spdlog/spdlog.h>

namespace dirmock {

DirectoryStore DirectoryStore::fromSeed(const DirectorySeed& seed) {
    DirectoryStore store;
    for (const auto& [dn, attributes] : seed) {
        std::string key = normalize(dn);
        if (store.entries_.count(key) > 0) {
            spdlog::warn("Duplicate seed DN ignored (case-insensitive match): {}", dn);
            continue;
        }
        store.entries_.emplace(key, Entry::fromAttributes(attributes));
    }
    spdlog::debug("Directory store seeded with {} entries", store.entries_.size());
    return store;
}

std::string DirectoryStore::normalize(const std::string& dn) {
    return utils::toLower(dn);
}

const Entry* DirectoryStore::get(const std::string& dn) const {
    auto it = entries_.find(normalize(dn));
    return it == entries_.end() ? nullptr : &it->second;
}

Entry* DirectoryStore::get(const std::string& dn) {
    auto it = entries_.find(normalize(dn));
    return it == entries_.end() ? nullptr : &it->second;
}

void DirectoryStore::put(const std::string& dn, Entry entry) {
    entries_[normalize(dn)] = std::move(entry);
}

bool DirectoryStore::remove(const std::string& dn) {
    return entries_.erase(normalize(dn)) > 0;
}

bool DirectoryStore::contains(const std::string& dn) const {
    return entries_.find(normalize(dn)) != entries_.end();
}

std::vector<std::string> DirectoryStore::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

DirectorySeed DirectoryStore::snapshot() const {
    DirectorySeed seed;
    for (const auto& [dn, entry] : entries_) {
        auto& attributes = seed[dn];
        for (const auto& [name, values] : entry.attributes()) {
            attributes[name] = values;
        }
    }
    return seed;
}

} // namespace dirmock
