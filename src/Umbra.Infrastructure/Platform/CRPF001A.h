// CRPF001A.h - Platform Path Resolution
// Component ID: CRPF001A (Platform/Paths)
//
// Locates umbra.json configuration files using std::filesystem.

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Umbra::Platform {

namespace fs = std::filesystem;

/// Configuration file name searched for in every location
inline constexpr const char* CONFIG_FILE_NAME = "umbra.json";

/// @brief Cross-platform path resolution utilities
class PathResolver {
public:
    /// @brief Directory containing the running executable (empty if unknown)
    static fs::path executableDirectory();

    /// @brief User configuration directory (not created)
    /// Linux: $XDG_CONFIG_HOME/umbra or ~/.config/umbra
    /// Windows: %APPDATA%/Umbra
    /// macOS: ~/Library/Application Support/Umbra
    static fs::path userConfigDirectory();

    /// @brief System configuration directory
    /// Linux: /etc/umbra
    /// Windows: %PROGRAMDATA%/Umbra
    static fs::path systemConfigDirectory();

    /// @brief Config file candidates in priority order
    /// ./umbra.json, <exe dir>/umbra.json, <user dir>/umbra.json, <system dir>/umbra.json
    static std::vector<fs::path> configSearchPaths();

    /// @brief First existing entry of configSearchPaths()
    static std::optional<fs::path> findConfigFile();

    /// @return "Linux", "Windows", or "macOS"
    static std::string platformName();
};

} // namespace Umbra::Platform
