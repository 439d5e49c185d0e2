/**
 * @file emulator_registry.h
 * @brief Per-URI emulator instances for code that opens its own connections
 *
 * Code under test usually calls a connection factory with a server URI.
 * A test configures the registry with seed trees, starts it, and routes
 * the factory to initialize(uri); each URI gets its own emulator, created
 * lazily and kept until stop().
 *
 * @code
 *   EmulatorRegistry registry(seed);
 *   registry.setDirectory(otherSeed, "ldap://replica/");
 *   registry.start();
 *   DirectoryEmulator& conn = registry.initialize("ldap://primary/");
 *   ...
 *   registry.stop();
 * @endcode
 */

#pragma once

#include <map>
#include <memory>
#include <string>

#include "dirmock/config.h"
#include "dirmock/directory_emulator.h"
#include "dirmock/types.h"

namespace dirmock {

class EmulatorRegistry {
public:
    explicit EmulatorRegistry(DirectorySeed defaultSeed = {}, EmulatorConfig config = {});

    /**
     * @brief Build a registry whose default tree comes from config.seedFile
     *
     * Also applies config.logLevel to the default logger.
     * @throws std::runtime_error if the seed file cannot be loaded
     */
    static EmulatorRegistry fromConfig(const EmulatorConfig& config);

    /**
     * @brief Set the tree for one URI, or the default tree when @p uri is empty
     *
     * Takes effect for emulators created afterwards.
     */
    void setDirectory(DirectorySeed seed, const std::string& uri = "");

    /**
     * @throws std::logic_error if already started
     */
    void start();

    /**
     * @brief Discard every emulator
     * @throws std::logic_error if not started
     */
    void stop();

    [[nodiscard]] bool started() const noexcept { return started_; }

    /**
     * @brief Emulator for @p uri, created on first use
     *
     * Records an "initialize" call on the returned emulator every time.
     *
     * @throws std::logic_error if not started
     */
    DirectoryEmulator& initialize(const std::string& uri);

    /**
     * @brief Existing emulator for @p uri
     * @throws std::out_of_range if initialize() was never called for @p uri
     */
    DirectoryEmulator& operator[](const std::string& uri);

    [[nodiscard]] bool contains(const std::string& uri) const;

    [[nodiscard]] size_t size() const noexcept { return emulators_.size(); }

private:
    const DirectorySeed& seedFor(const std::string& uri) const;

    DirectorySeed defaultSeed_;
    std::map<std::string, DirectorySeed> seeds_;
    std::map<std::string, std::unique_ptr<DirectoryEmulator>> emulators_;
    EmulatorConfig config_;
    bool started_ = false;
};

} // namespace dirmock
