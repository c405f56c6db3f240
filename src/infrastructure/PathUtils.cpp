/**
 * @file PathUtils.cpp
 * @brief Implementation of PathUtils.
 */

#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <optional>

namespace tasksmind::infrastructure {

namespace fs = std::filesystem;

namespace {

// Unset and empty variables are treated alike.
std::optional<fs::path> EnvPath(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return std::nullopt;
    return fs::path(value);
}

} // namespace

fs::path PathUtils::GetConfigHome() {
    if (auto xdg = EnvPath("XDG_CONFIG_HOME")) return *xdg;
    if (auto home = EnvPath("HOME")) return *home / ".config";
    return fs::current_path();
}

fs::path PathUtils::GetSettingsDir() {
    return GetConfigHome() / "TasksMind";
}

} // namespace tasksmind::infrastructure
