/**
 * @file entry.cpp
 * @brief Entry value-list semantics
 */

#include "dirmock/entry.h"
#include <algorithm>

namespace dirmock {

namespace {

bool contains(const ValueList& values, const Value& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

ValueList unique(const ValueList& values) {
    ValueList result;
    result.reserve(values.size());
    for (const auto& value : values) {
        if (!contains(result, value)) {
            result.push_back(value);
        }
    }
    return result;
}

} // anonymous namespace

Entry Entry::fromAttributes(const std::map<std::string, ValueList>& attributes) {
    Entry entry;
    for (const auto& [name, values] : attributes) {
        if (!values.empty()) {
            entry.addValues(name, values);
        }
    }
    return entry;
}

bool Entry::has(const std::string& attribute) const {
    return attributes_.find(attribute) != attributes_.end();
}

const ValueList* Entry::values(const std::string& attribute) const {
    auto it = attributes_.find(attribute);
    if (it == attributes_.end()) {
        return nullptr;
    }
    return &it->second;
}

void Entry::addValues(const std::string& attribute, const ValueList& values) {
    if (values.empty()) {
        return;
    }

    auto it = attributes_.find(attribute);
    if (it == attributes_.end()) {
        attributes_.emplace(attribute, unique(values));
        return;
    }

    for (const auto& value : values) {
        if (!contains(it->second, value)) {
            it->second.push_back(value);
        }
    }
}

void Entry::removeValues(const std::string& attribute, const ValueList& values) {
    auto it = attributes_.find(attribute);
    if (it == attributes_.end()) {
        return;
    }

    auto& current = it->second;
    current.erase(std::remove_if(current.begin(), current.end(),
                                 [&values](const Value& v) { return contains(values, v); }),
                  current.end());

    if (current.empty()) {
        attributes_.erase(it);
    }
}

void Entry::removeAttribute(const std::string& attribute) {
    attributes_.erase(attribute);
}

void Entry::replaceValues(const std::string& attribute, const ValueList& values) {
    if (values.empty()) {
        attributes_.erase(attribute);
        return;
    }

    auto it = attributes_.find(attribute);
    if (it == attributes_.end()) {
        attributes_.emplace(attribute, unique(values));
    } else {
        it->second = unique(values);
    }
}

AttributeMap Entry::project(const std::vector<std::string>& allowList) const {
    AttributeMap projected;
    for (const auto& [name, values] : attributes_) {
        bool allowed = std::any_of(allowList.begin(), allowList.end(),
                                   [&name](const std::string& a) {
                                       return utils::equalsIgnoreCase(a, name);
                                   });
        if (allowed) {
            projected.emplace(name, values);
        }
    }
    return projected;
}

AttributeMap stripValues(const AttributeMap& attributes) {
    AttributeMap stripped;
    for (const auto& entry : attributes) {
        stripped.emplace(entry.first, ValueList{});
    }
    return stripped;
}

} // namespace dirmock
