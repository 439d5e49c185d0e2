/**
 * @file types.cpp
 * @brief Enumeration mapping and JSON serialization of request types
 */

#include "dirmock/types.h"

namespace dirmock {

std::string searchScopeToString(SearchScope scope) {
    switch (scope) {
        case SearchScope::Base:     return "base";
        case SearchScope::OneLevel: return "onelevel";
        case SearchScope::Subtree:  return "subtree";
    }
    return "unknown";
}

std::string modOpToString(ModOp op) {
    switch (op) {
        case ModOp::Add:     return "add";
        case ModOp::Delete:  return "delete";
        case ModOp::Replace: return "replace";
    }
    return "unknown";
}

Outcome<SearchScope> searchScopeFromCode(int code) {
    switch (code) {
        case LDAP_SCOPE_BASE:     return SearchScope::Base;
        case LDAP_SCOPE_ONELEVEL: return SearchScope::OneLevel;
        case LDAP_SCOPE_SUBTREE:  return SearchScope::Subtree;
        default:
            return DirectoryError::invalidArgument("Unrecognized scope: " + std::to_string(code));
    }
}

Outcome<ModOp> modOpFromCode(int code) {
    switch (code) {
        case LDAP_MOD_ADD:     return ModOp::Add;
        case LDAP_MOD_DELETE:  return ModOp::Delete;
        case LDAP_MOD_REPLACE: return ModOp::Replace;
        default:
            return DirectoryError::invalidArgument("Unrecognized modify op code: " + std::to_string(code));
    }
}

Json::Value valuesToJson(const ValueList& values) {
    Json::Value array(Json::arrayValue);
    for (const auto& value : values) {
        array.append(value);
    }
    return array;
}

Json::Value Modification::toJson() const {
    Json::Value json(Json::arrayValue);
    json.append(modOpToString(op));
    json.append(attribute);
    json.append(valuesToJson(values));
    return json;
}

Json::Value SearchRequest::toJson() const {
    Json::Value json(Json::objectValue);
    json["base"] = base;
    json["scope"] = searchScopeToString(scope);
    json["filter"] = filter;
    if (attributes) {
        Json::Value list(Json::arrayValue);
        for (const auto& attr : *attributes) {
            list.append(attr);
        }
        json["attributes"] = list;
    } else {
        json["attributes"] = Json::Value(Json::nullValue);
    }
    json["attributesOnly"] = attributesOnly;
    return json;
}

std::string SearchRequest::key() const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, toJson());
}

} // namespace dirmock
