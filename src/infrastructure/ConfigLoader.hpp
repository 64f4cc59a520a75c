/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving engine configuration (settings.json).
 *
 * Engine tunables live under the "correlation" key so the file can be shared
 * with other host-application settings.
 */

#pragma once

#include <string>
#include "application/EngineConfig.hpp"

namespace metriclens::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads the "correlation" section of settings.json.
     * @param projectRoot Directory holding settings.json.
     * @return Defaults for a missing or unparsable file and for missing keys.
     * @throws domain::ConfigError if a present value has the wrong type or range.
     */
    static application::EngineConfig LoadEngineConfig(const std::string& projectRoot);

    /**
     * @brief Writes the "correlation" section, preserving other keys if possible.
     * @return False if the file could not be written.
     */
    static bool SaveEngineConfig(const std::string& projectRoot, const application::EngineConfig& config);

    /** @brief Path of settings.json under a project root. */
    static std::string SettingsPath(const std::string& projectRoot);
};

} // namespace metriclens::infrastructure
