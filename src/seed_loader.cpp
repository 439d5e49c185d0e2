/**
 * @file seed_loader.cpp
 * @brief JSON seed parsing (jsoncpp)
 */

#include "dirmock/seed_loader.h"
#include <fstream>
#include <spdlog/spdlog.h>

namespace dirmock {

namespace {

Outcome<ValueList> parseValues(const std::string& dn, const std::string& attribute,
                               const Json::Value& node) {
    if (node.isString()) {
        return ValueList{node.asString()};
    }
    if (!node.isArray()) {
        return DirectoryError::invalidArgument(
            "expected a byte string for " + dn + " " + attribute);
    }

    ValueList values;
    values.reserve(node.size());
    for (const auto& item : node) {
        if (!item.isString()) {
            return DirectoryError::invalidArgument(
                "expected a byte string in the list for " + dn + " " + attribute);
        }
        values.push_back(item.asString());
    }
    return values;
}

} // anonymous namespace

Outcome<DirectorySeed> parseSeed(const Json::Value& root) {
    if (!root.isObject()) {
        return DirectoryError::invalidArgument("seed root must be a JSON object");
    }

    DirectorySeed seed;
    for (const auto& dn : root.getMemberNames()) {
        const Json::Value& entry = root[dn];
        if (!entry.isObject()) {
            return DirectoryError::invalidArgument("seed entry for '" + dn + "' must be a JSON object");
        }

        auto& attributes = seed[dn];
        for (const auto& attribute : entry.getMemberNames()) {
            auto values = parseValues(dn, attribute, entry[attribute]);
            if (!values.ok()) {
                return values.error();
            }
            attributes[attribute] = std::move(values.value());
        }
    }

    spdlog::debug("Parsed seed with {} entries", seed.size());
    return seed;
}

Outcome<DirectorySeed> loadSeedFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::warn("Cannot open seed file: {}", path);
        return DirectoryError::invalidArgument("cannot open seed file '" + path + "'");
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &root, &errors)) {
        spdlog::warn("Invalid JSON in seed file {}: {}", path, errors);
        return DirectoryError::invalidArgument("invalid JSON in seed file '" + path + "': " + errors);
    }

    spdlog::info("Loading directory seed from {}", path);
    return parseSeed(root);
}

} // namespace dirmock
