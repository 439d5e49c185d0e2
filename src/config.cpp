#include "dirmock/config.h"
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace dirmock {

EmulatorConfig EmulatorConfig::fromEnvironment() {
    EmulatorConfig config;

    if (auto val = std::getenv("DIRMOCK_CREDENTIAL_ATTRIBUTE")) {
        if (*val != '\0') config.credentialAttribute = val;
    }
    if (auto val = std::getenv("DIRMOCK_LOG_LEVEL")) config.logLevel = val;
    if (auto val = std::getenv("DIRMOCK_SEED_FILE")) config.seedFile = val;

    spdlog::debug("Emulator config: credentialAttribute={}, logLevel={}, seedFile={}",
                  config.credentialAttribute, config.logLevel,
                  config.seedFile.empty() ? "none" : config.seedFile);
    return config;
}

} // namespace dirmock
