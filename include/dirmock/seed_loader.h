/**
 * @file seed_loader.h
 * @brief Build a directory seed tree from JSON
 *
 * Shape:
 * @code
 * {
 *   "cn=alice,ou=people,dc=example,dc=com": {
 *     "objectClass": ["top", "person"],
 *     "cn": "alice"
 *   }
 * }
 * @endcode
 * A bare string is wrapped into a one-element list.
 */

#pragma once

#include <string>
#include <json/json.h>

#include "dirmock/error.h"
#include "dirmock/types.h"

namespace dirmock {

/**
 * @brief Convert parsed JSON into a seed tree
 * @return InvalidArgument if the root or an entry is not an object, or if
 *         any value is not a string
 */
Outcome<DirectorySeed> parseSeed(const Json::Value& root);

/**
 * @brief Read and parse a JSON seed file
 * @return InvalidArgument if the file cannot be opened or is not valid JSON
 */
Outcome<DirectorySeed> loadSeedFile(const std::string& path);

} // namespace dirmock
