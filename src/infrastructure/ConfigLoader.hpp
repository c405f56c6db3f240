/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Provides a unified way to read server settings and engine table overrides
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "domain/engine/EngineConfig.hpp"

namespace tasksmind::infrastructure {

/**
 * @struct Settings
 * @brief Everything main() needs to wire the server.
 */
struct Settings {
    std::string host = "0.0.0.0";
    int port = 8080;
    std::string seedFile; ///< Org/authority seed JSON; resolved against the settings directory.
    domain::engine::EngineConfig engine;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json.
     * @param path Path to the file.
     * @return Defaults if the file is missing; defaults plus a logged error if it is malformed.
     */
    static Settings Load(const std::string& path);

    /** @brief Builds settings from an already-parsed document. Throws on type errors. */
    static Settings FromJson(const nlohmann::json& j);

    /** @brief Overlays the keys present in an "engine" object onto @p config. */
    static void ApplyEngineOverrides(const nlohmann::json& j, domain::engine::EngineConfig& config);

    /** @brief $XDG_CONFIG_HOME/TasksMind/settings.json (or ~/.config/...). */
    static std::string DefaultSettingsPath();
};

} // namespace tasksmind::infrastructure
