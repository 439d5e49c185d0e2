/**
 * @file config.h
 * @brief Emulator configuration
 *
 * Loaded from environment variables by test harnesses; tests usually build
 * one directly.
 */

#pragma once

#include <string>

namespace dirmock {

struct EmulatorConfig {
    /// Attribute whose values are checked through the password verifier
    std::string credentialAttribute = "userPassword";

    std::string logLevel = "warn";

    /// JSON seed tree for EmulatorRegistry::fromConfig (empty: none)
    std::string seedFile;

    /**
     * @brief Read DIRMOCK_CREDENTIAL_ATTRIBUTE, DIRMOCK_LOG_LEVEL, DIRMOCK_SEED_FILE
     */
    static EmulatorConfig fromEnvironment();
};

} // namespace dirmock
