/**
 * @file PathUtils.hpp
 * @brief Locates the per-user configuration directory.
 */

#pragma once
#include <filesystem>

namespace tasksmind::infrastructure {

class PathUtils {
public:
    /** @brief $XDG_CONFIG_HOME, else ~/.config, else the working directory. */
    static std::filesystem::path GetConfigHome();

    /** @brief GetConfigHome()/TasksMind, where settings.json is looked up by default. */
    static std::filesystem::path GetSettingsDir();
};

} // namespace tasksmind::infrastructure
