/**
 * @file directory_emulator.h
 * @brief In-memory directory connection
 *
 * Reproduces the request/response semantics of a directory-access protocol
 * connection (bind, search, compare, modify, add, delete, rename, password
 * change) against a seeded entry tree, without any network or server.
 *
 * Every operation returns an Outcome; protocol failures never throw. Each
 * public call is appended to the emulator's CallLog before it executes.
 *
 * Single-threaded: callers must serialize access externally.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

#include "dirmock/async_results.h"
#include "dirmock/call_log.h"
#include "dirmock/config.h"
#include "dirmock/directory_store.h"
#include "dirmock/dn.h"
#include "dirmock/error.h"
#include "dirmock/seed_registry.h"
#include "dirmock/types.h"

namespace dirmock {

class DirectoryEmulator {
public:
    /**
     * @brief Construct from a seed tree
     *
     * The seed is deep-copied; later changes to either side never alias.
     */
    explicit DirectoryEmulator(const DirectorySeed& seed, EmulatorConfig config = {});

    // --- Session -----------------------------------------------------------

    /**
     * @brief Recorded only; marks the connection being opened for @p uri
     */
    void initialize(const std::string& uri);

    /**
     * @brief Simple bind
     *
     * An anonymous bind (empty identity and credential) always succeeds.
     * Otherwise the credential is checked against the identity's credential
     * attribute; an unknown identity fails InvalidCredentials like a wrong
     * password does.
     *
     * @return {RES_BIND}, InvalidCredentials or InvalidDnSyntax
     */
    Outcome<OperationResult> simpleBind(const std::string& who = "", const std::string& cred = "");

    void unbind();

    void unbindSync();

    /**
     * @return "dn:<bound identity>", or "" when unbound
     */
    std::string whoAmI();

    void startTls();

    void setOption(int option, Json::Value value);

    /**
     * @return The stored option value, or std::nullopt if never set
     */
    std::optional<Json::Value> getOption(int option);

    // --- Search ------------------------------------------------------------

    /**
     * @brief Issue an asynchronous search
     * @return Ticket to redeem with result()
     */
    Outcome<int> search(const SearchRequest& request);

    Outcome<int> search(const std::string& base, SearchScope scope,
                        const std::string& filter = DEFAULT_FILTER,
                        std::optional<std::vector<std::string>> attributes = std::nullopt,
                        bool attributesOnly = false);

    /**
     * @brief Redeem a search ticket
     *
     * The first fetch returns the stored results and clears the slot; every
     * later fetch, and any never-issued ticket, yields no entries. The
     * timeout is accepted and ignored.
     */
    SearchResultMessage result(int ticket, std::optional<double> timeout = std::nullopt);

    /**
     * @brief Search and return the results directly
     *
     * Fails NoSuchObject when the base is absent, whatever the filter.
     * Fails UnsupportedFilterOperation for filter forms the evaluator does
     * not handle unless a response was seeded for the exact request.
     */
    Outcome<SearchResults> searchImmediate(const SearchRequest& request);

    Outcome<SearchResults> searchImmediate(const std::string& base, SearchScope scope,
                                           const std::string& filter = DEFAULT_FILTER,
                                           std::optional<std::vector<std::string>> attributes = std::nullopt,
                                           bool attributesOnly = false);

    // --- Read / write operations -------------------------------------------

    /**
     * @brief Test whether @p attribute holds @p value
     *
     * For the credential attribute each stored value goes through
     * verifyPassword(); otherwise literal membership is tested.
     */
    Outcome<bool> compare(const std::string& dn, const std::string& attribute, const std::string& value);

    /**
     * @brief Apply modifications in order
     *
     * A failing modification aborts the call; earlier modifications stay
     * applied.
     *
     * @return {RES_MODIFY}, NoSuchObject, InvalidDnSyntax or ProtocolError
     */
    Outcome<OperationResult> modify(const std::string& dn, const std::vector<Modification>& modifications);

    /**
     * @brief Add a new entry
     * @return {RES_ADD, message id}, AlreadyExists (case-insensitive DN
     *         match), InvalidDnSyntax or ProtocolError (empty value list)
     */
    Outcome<OperationResult> add(const std::string& dn, const std::vector<AttributeValues>& attributes);

    /**
     * @return {RES_DELETE}, NoSuchObject or InvalidDnSyntax
     */
    Outcome<OperationResult> remove(const std::string& dn);

    /**
     * @brief Rename (and optionally move) an entry
     *
     * The new DN is @p newRdn joined with @p newSuperior, or with the old
     * DN's parent when no superior is given. The old RDN value is removed
     * from the entry and the new RDN value added.
     *
     * @return {RES_MODRDN}, NoSuchObject, AlreadyExists or InvalidDnSyntax
     */
    Outcome<OperationResult> rename(const std::string& dn, const std::string& newRdn,
                                    const std::optional<std::string>& newSuperior = std::nullopt);

    /**
     * @brief Password modify extended operation
     *
     * With @p oldPassword, the credential attribute is replaced only if its
     * first value equals @p oldPassword literally (hash tags are not
     * interpreted); otherwise the entry is left unchanged. Without it, the
     * attribute is replaced unconditionally.
     *
     * @return {RES_EXTENDED}, NoSuchObject or InvalidDnSyntax
     */
    Outcome<OperationResult> changePassword(const std::string& dn,
                                            const std::optional<std::string>& oldPassword,
                                            const std::string& newPassword);

    // --- Introspection -----------------------------------------------------

    [[nodiscard]] const CallLog& calls() const noexcept { return calls_; }
    CallLog& calls() noexcept { return calls_; }

    [[nodiscard]] const SeedRegistry& seeds() const noexcept { return seeds_; }
    SeedRegistry& seeds() noexcept { return seeds_; }

    [[nodiscard]] const DirectoryStore& directory() const noexcept { return store_; }

    [[nodiscard]] const std::optional<std::string>& boundAs() const noexcept { return boundAs_; }

    [[nodiscard]] bool tlsEnabled() const noexcept { return tlsEnabled_; }

    [[nodiscard]] const EmulatorConfig& config() const noexcept { return config_; }

private:
    Outcome<SearchResults> runSearch(const SearchRequest& request) const;

    Outcome<bool> compareValue(const std::string& dn, const std::string& attribute,
                               const std::string& value) const;

    bool isCredentialAttribute(const std::string& attribute) const;

    static bool inScope(SearchScope scope, const DistinguishedName& base, const DistinguishedName& dn);

    static Json::Value searchArgs(const SearchRequest& request);

    EmulatorConfig config_;
    DirectoryStore store_;
    AsyncResultQueue asyncResults_;
    CallLog calls_;
    SeedRegistry seeds_;
    std::map<int, Json::Value> options_;
    std::optional<std::string> boundAs_;
    bool tlsEnabled_ = false;
};

} // namespace dirmock
