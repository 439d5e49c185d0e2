/**
 * @file directory_emulator.cpp
 * @brief Directory operation semantics
 */

#include "dirmock/directory_emulator.h"
#include "dirmock/filter.h"
#include "dirmock/password_verifier.h"
#include "dirmock/string_utils.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace dirmock {

namespace {

Json::Value optionalToJson(const std::optional<std::string>& value) {
    return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

} // anonymous namespace

DirectoryEmulator::DirectoryEmulator(const DirectorySeed& seed, EmulatorConfig config)
    : config_(std::move(config)),
      store_(DirectoryStore::fromSeed(seed)) {
    spdlog::debug("DirectoryEmulator created: {} entries, credential attribute '{}'",
                  store_.size(), config_.credentialAttribute);
}

// --- Session ---------------------------------------------------------------

void DirectoryEmulator::initialize(const std::string& uri) {
    Json::Value args(Json::arrayValue);
    args.append(uri);
    calls_.record("initialize", args);
}

Outcome<OperationResult> DirectoryEmulator::simpleBind(const std::string& who, const std::string& cred) {
    Json::Value args(Json::arrayValue);
    args.append(who);
    args.append(cred);
    calls_.record("simple_bind_s", args);

    bool success = false;
    if (who.empty() && cred.empty()) {
        success = true;
    } else {
        auto matched = compareValue(who, config_.credentialAttribute, cred);
        if (matched.ok()) {
            success = matched.value();
        } else if (matched.errorKind() != ErrorKind::NoSuchObject) {
            return matched.error();
        }
    }

    if (!success) {
        spdlog::debug("Bind failed for '{}'", who);
        return DirectoryError::invalidCredentials(who, cred);
    }

    boundAs_ = who;
    spdlog::debug("Bound as '{}'", who);
    return OperationResult{RES_BIND, 0};
}

void DirectoryEmulator::unbind() {
    calls_.record("unbind", Json::Value(Json::arrayValue));
    boundAs_.reset();
}

void DirectoryEmulator::unbindSync() {
    calls_.record("unbind_s", Json::Value(Json::arrayValue));
    boundAs_.reset();
}

std::string DirectoryEmulator::whoAmI() {
    calls_.record("whoami_s", Json::Value(Json::arrayValue));
    if (!boundAs_) {
        return "";
    }
    return "dn:" + *boundAs_;
}

void DirectoryEmulator::startTls() {
    calls_.record("start_tls_s", Json::Value(Json::arrayValue));
    tlsEnabled_ = true;
}

void DirectoryEmulator::setOption(int option, Json::Value value) {
    Json::Value args(Json::arrayValue);
    args.append(option);
    args.append(value);
    calls_.record("set_option", args);

    options_[option] = std::move(value);
}

std::optional<Json::Value> DirectoryEmulator::getOption(int option) {
    Json::Value args(Json::arrayValue);
    args.append(option);
    calls_.record("get_option", args);

    auto it = options_.find(option);
    if (it == options_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// --- Search ----------------------------------------------------------------

Outcome<int> DirectoryEmulator::search(const SearchRequest& request) {
    calls_.record("search", searchArgs(request));

    auto results = runSearch(request);
    if (!results.ok()) {
        return results.error();
    }
    int ticket = asyncResults_.push(std::move(results.value()));
    spdlog::debug("Search ticket {} issued for base '{}'", ticket, request.base);
    return ticket;
}

Outcome<int> DirectoryEmulator::search(const std::string& base, SearchScope scope,
                                       const std::string& filter,
                                       std::optional<std::vector<std::string>> attributes,
                                       bool attributesOnly) {
    return search(SearchRequest{base, scope, filter, std::move(attributes), attributesOnly});
}

SearchResultMessage DirectoryEmulator::result(int ticket, std::optional<double> timeout) {
    Json::Value args(Json::arrayValue);
    args.append(ticket);
    args.append(timeout ? Json::Value(*timeout) : Json::Value(Json::nullValue));
    calls_.record("result", args);

    SearchResultMessage message;
    message.entries = asyncResults_.pop(ticket);
    if (!message.entries) {
        spdlog::debug("No data for search ticket {}", ticket);
    }
    return message;
}

Outcome<SearchResults> DirectoryEmulator::searchImmediate(const SearchRequest& request) {
    calls_.record("search_s", searchArgs(request));
    return runSearch(request);
}

Outcome<SearchResults> DirectoryEmulator::searchImmediate(const std::string& base, SearchScope scope,
                                                          const std::string& filter,
                                                          std::optional<std::vector<std::string>> attributes,
                                                          bool attributesOnly) {
    return searchImmediate(SearchRequest{base, scope, filter, std::move(attributes), attributesOnly});
}

Outcome<SearchResults> DirectoryEmulator::runSearch(const SearchRequest& request) const {
    if (auto seeded = seeds_.lookupSearch(request)) {
        spdlog::debug("Returning seeded response for search on '{}'", request.base);
        return *seeded;
    }

    auto base = DistinguishedName::parse(request.base);
    if (!base.ok()) {
        return base.error();
    }
    if (!store_.contains(request.base)) {
        spdlog::debug("Search base not found: {}", request.base);
        return DirectoryError::noSuchObject(request.base);
    }

    auto filter = parseFilter(request.filter);
    if (!filter.ok()) {
        if (filter.errorKind() == ErrorKind::UnsupportedFilterOperation) {
            spdlog::warn("Search on '{}' needs a seeded response: {}", request.base, request.filter);
            return DirectoryError::unsupportedFilter(
                "Seed required for search " + request.key() + ": " + filter.error().message);
        }
        return filter.error();
    }

    FilterEvaluator evaluator(config_.credentialAttribute);
    SearchResults results;
    for (const auto& [key, entry] : store_) {
        auto dn = DistinguishedName::parse(key);
        if (!dn.ok()) {
            spdlog::warn("Skipping stored entry with unparsable DN: {}", key);
            continue;
        }
        if (!inScope(request.scope, base.value(), dn.value())) {
            continue;
        }
        if (!evaluator.matches(filter.value(), entry)) {
            continue;
        }

        AttributeMap attributes = request.attributes
            ? entry.project(*request.attributes)
            : entry.attributes();
        if (request.attributesOnly) {
            attributes = stripValues(attributes);
        }
        results.push_back(SearchResultEntry{key, std::move(attributes)});
    }

    spdlog::debug("Search base='{}' scope={} filter='{}': {} match(es)",
                  request.base, searchScopeToString(request.scope), request.filter, results.size());
    return results;
}

bool DirectoryEmulator::inScope(SearchScope scope, const DistinguishedName& base,
                                const DistinguishedName& dn) {
    switch (scope) {
        case SearchScope::Base:
            return dn.equalsIgnoreCase(base);
        case SearchScope::OneLevel:
            return dn.isImmediateChildOf(base);
        case SearchScope::Subtree:
            return base.isSuffixOf(dn);
    }
    return false;
}

Json::Value DirectoryEmulator::searchArgs(const SearchRequest& request) {
    Json::Value json = request.toJson();
    Json::Value args(Json::arrayValue);
    args.append(json["base"]);
    args.append(json["scope"]);
    args.append(json["filter"]);
    args.append(json["attributes"]);
    args.append(json["attributesOnly"]);
    return args;
}

// --- Compare ---------------------------------------------------------------

Outcome<bool> DirectoryEmulator::compare(const std::string& dn, const std::string& attribute,
                                         const std::string& value) {
    Json::Value args(Json::arrayValue);
    args.append(dn);
    args.append(attribute);
    args.append(value);
    calls_.record("compare_s", args);

    return compareValue(dn, attribute, value);
}

Outcome<bool> DirectoryEmulator::compareValue(const std::string& dn, const std::string& attribute,
                                              const std::string& value) const {
    auto parsed = DistinguishedName::parse(dn);
    if (!parsed.ok()) {
        return parsed.error();
    }

    const Entry* entry = store_.get(dn);
    if (!entry) {
        return DirectoryError::noSuchObject(dn);
    }

    const ValueList* values = entry->values(attribute);
    if (!values) {
        return false;
    }

    if (isCredentialAttribute(attribute)) {
        return std::any_of(values->begin(), values->end(), [&value](const Value& stored) {
            return verifyPassword(value, stored);
        });
    }
    return std::find(values->begin(), values->end(), value) != values->end();
}

bool DirectoryEmulator::isCredentialAttribute(const std::string& attribute) const {
    return utils::equalsIgnoreCase(attribute, config_.credentialAttribute);
}

// --- Modify ----------------------------------------------------------------

Outcome<OperationResult> DirectoryEmulator::modify(const std::string& dn,
                                                   const std::vector<Modification>& modifications) {
    Json::Value mods(Json::arrayValue);
    for (const auto& mod : modifications) {
        mods.append(mod.toJson());
    }
    Json::Value args(Json::arrayValue);
    args.append(dn);
    args.append(mods);
    calls_.record("modify_s", args);

    auto parsed = DistinguishedName::parse(dn);
    if (!parsed.ok()) {
        return parsed.error();
    }

    Entry* entry = store_.get(dn);
    if (!entry) {
        spdlog::debug("Modify target not found: {}", dn);
        return DirectoryError::noSuchObject(dn);
    }

    for (const auto& mod : modifications) {
        switch (mod.op) {
            case ModOp::Add:
                if (mod.values.empty()) {
                    return DirectoryError::protocolError(
                        "ADD of '" + mod.attribute + "' requires at least one value", dn);
                }
                entry->addValues(mod.attribute, mod.values);
                break;

            case ModOp::Delete:
                if (!entry->has(mod.attribute)) {
                    break;
                }
                if (mod.values.empty()) {
                    entry->removeAttribute(mod.attribute);
                } else {
                    entry->removeValues(mod.attribute, mod.values);
                }
                break;

            case ModOp::Replace:
                entry->replaceValues(mod.attribute, mod.values);
                break;
        }
    }

    spdlog::debug("Modified {} ({} change(s))", dn, modifications.size());
    return OperationResult{RES_MODIFY, 0};
}

// --- Add / delete / rename -------------------------------------------------

Outcome<OperationResult> DirectoryEmulator::add(const std::string& dn,
                                                const std::vector<AttributeValues>& attributes) {
    Json::Value record(Json::arrayValue);
    for (const auto& [name, values] : attributes) {
        Json::Value pair(Json::arrayValue);
        pair.append(name);
        pair.append(valuesToJson(values));
        record.append(pair);
    }
    Json::Value args(Json::arrayValue);
    args.append(dn);
    args.append(record);
    calls_.record("add_s", args);

    auto parsed = DistinguishedName::parse(dn);
    if (!parsed.ok()) {
        return parsed.error();
    }

    if (store_.contains(dn)) {
        spdlog::debug("Add rejected, entry exists: {}", dn);
        return DirectoryError::alreadyExists(dn);
    }

    Entry entry;
    for (const auto& [name, values] : attributes) {
        if (values.empty()) {
            return DirectoryError::protocolError("attribute '" + name + "' has no values", dn);
        }
        entry.addValues(name, values);
    }

    store_.put(dn, std::move(entry));
    spdlog::debug("Added {}", dn);
    return OperationResult{RES_ADD, static_cast<int>(calls_.size())};
}

Outcome<OperationResult> DirectoryEmulator::remove(const std::string& dn) {
    Json::Value args(Json::arrayValue);
    args.append(dn);
    calls_.record("delete_s", args);

    auto parsed = DistinguishedName::parse(dn);
    if (!parsed.ok()) {
        return parsed.error();
    }

    if (!store_.remove(dn)) {
        spdlog::debug("Delete target not found: {}", dn);
        return DirectoryError::noSuchObject(dn);
    }

    spdlog::debug("Deleted {}", dn);
    return OperationResult{RES_DELETE, 0};
}

Outcome<OperationResult> DirectoryEmulator::rename(const std::string& dn, const std::string& newRdn,
                                                   const std::optional<std::string>& newSuperior) {
    Json::Value args(Json::arrayValue);
    args.append(dn);
    args.append(newRdn);
    args.append(optionalToJson(newSuperior));
    calls_.record("rename_s", args);

    auto oldDn = DistinguishedName::parse(dn);
    if (!oldDn.ok()) {
        return oldDn.error();
    }
    auto rdn = DistinguishedName::parse(newRdn);
    if (!rdn.ok()) {
        return rdn.error();
    }
    if (rdn.value().size() != 1) {
        return DirectoryError::invalidDnSyntax(newRdn);
    }
    if (newSuperior) {
        auto superior = DistinguishedName::parse(*newSuperior);
        if (!superior.ok()) {
            return superior.error();
        }
    }

    Entry* entry = store_.get(dn);
    if (!entry || oldDn.value().empty()) {
        spdlog::debug("Rename target not found: {}", dn);
        return DirectoryError::noSuchObject(dn);
    }

    std::string parent = (newSuperior && !newSuperior->empty())
        ? *newSuperior
        : oldDn.value().parentString();
    std::string newDn = parent.empty() ? newRdn : newRdn + "," + parent;

    if (store_.contains(newDn)) {
        spdlog::debug("Rename rejected, {} exists", newDn);
        return DirectoryError::alreadyExists(newDn);
    }

    const auto& oldAva = oldDn.value().leading();
    const auto& newAva = rdn.value().leading();

    Entry renamed = *entry;
    const ValueList* oldValues = renamed.values(oldAva.attribute);
    if (utils::equalsIgnoreCase(oldAva.attribute, newAva.attribute) ||
        (oldValues && oldValues->size() > 1)) {
        renamed.removeValues(oldAva.attribute, {oldAva.value});
    } else {
        renamed.removeAttribute(oldAva.attribute);
    }
    renamed.addValues(newAva.attribute, {newAva.value});

    store_.remove(dn);
    store_.put(newDn, std::move(renamed));

    spdlog::debug("Renamed {} to {}", dn, newDn);
    return OperationResult{RES_MODRDN, 0};
}

// --- Password change -------------------------------------------------------

Outcome<OperationResult> DirectoryEmulator::changePassword(const std::string& dn,
                                                           const std::optional<std::string>& oldPassword,
                                                           const std::string& newPassword) {
    Json::Value args(Json::arrayValue);
    args.append(dn);
    args.append(optionalToJson(oldPassword));
    args.append(newPassword);
    calls_.record("passwd_s", args);

    auto parsed = DistinguishedName::parse(dn);
    if (!parsed.ok()) {
        return parsed.error();
    }

    Entry* entry = store_.get(dn);
    if (!entry) {
        spdlog::debug("Password change target not found: {}", dn);
        return DirectoryError::noSuchObject(dn);
    }

    if (oldPassword) {
        // Literal comparison against the first stored value, even if hashed
        const ValueList* current = entry->values(config_.credentialAttribute);
        if (!current || current->front() != *oldPassword) {
            spdlog::debug("Old password mismatch for {}; entry unchanged", dn);
            return OperationResult{RES_EXTENDED, 0};
        }
    }

    entry->replaceValues(config_.credentialAttribute, {newPassword});
    spdlog::debug("Password changed for {}", dn);
    return OperationResult{RES_EXTENDED, 0};
}

} // namespace dirmock
