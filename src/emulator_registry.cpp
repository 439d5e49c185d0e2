/**
 * @file emulator_registry.cpp
 * @brief Per-URI emulator registry
 */

#include "dirmock/emulator_registry.h"
#include "dirmock/logger.h"
#include "dirmock/seed_loader.h"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace dirmock {

EmulatorRegistry::EmulatorRegistry(DirectorySeed defaultSeed, EmulatorConfig config)
    : defaultSeed_(std::move(defaultSeed)), config_(std::move(config)) {}

EmulatorRegistry EmulatorRegistry::fromConfig(const EmulatorConfig& config) {
    Logger::setLevel(config.logLevel);

    if (config.seedFile.empty()) {
        return EmulatorRegistry({}, config);
    }

    auto seed = loadSeedFile(config.seedFile);
    if (!seed.ok()) {
        throw std::runtime_error("Failed to load seed file: " + seed.error().message);
    }
    return EmulatorRegistry(std::move(seed.value()), config);
}

void EmulatorRegistry::setDirectory(DirectorySeed seed, const std::string& uri) {
    if (uri.empty()) {
        defaultSeed_ = std::move(seed);
    } else {
        seeds_[uri] = std::move(seed);
    }
}

void EmulatorRegistry::start() {
    if (started_) {
        throw std::logic_error("EmulatorRegistry already started");
    }
    started_ = true;
    spdlog::debug("EmulatorRegistry started ({} per-URI tree(s))", seeds_.size());
}

void EmulatorRegistry::stop() {
    if (!started_) {
        throw std::logic_error("EmulatorRegistry not started");
    }
    emulators_.clear();
    started_ = false;
    spdlog::debug("EmulatorRegistry stopped");
}

DirectoryEmulator& EmulatorRegistry::initialize(const std::string& uri) {
    if (!started_) {
        throw std::logic_error("EmulatorRegistry::initialize called before start()");
    }

    auto it = emulators_.find(uri);
    if (it == emulators_.end()) {
        spdlog::debug("Creating emulator for {}", uri);
        it = emulators_.emplace(uri, std::make_unique<DirectoryEmulator>(seedFor(uri), config_)).first;
    }

    it->second->initialize(uri);
    return *it->second;
}

DirectoryEmulator& EmulatorRegistry::operator[](const std::string& uri) {
    auto it = emulators_.find(uri);
    if (it == emulators_.end()) {
        throw std::out_of_range("No emulator initialized for " + uri);
    }
    return *it->second;
}

bool EmulatorRegistry::contains(const std::string& uri) const {
    return emulators_.count(uri) > 0;
}

const DirectorySeed& EmulatorRegistry::seedFor(const std::string& uri) const {
    auto it = seeds_.find(uri);
    return it == seeds_.end() ? defaultSeed_ : it->second;
}

} // namespace dirmock
