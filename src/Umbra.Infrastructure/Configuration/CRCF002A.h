// CRCF002A.h - Configuration Loader
// Component ID: CRCF002A (Configuration/Loader)
//
// Loads and merges configuration from multiple sources:
// 1. Built-in defaults
// 2. First config file found (explicit path, or the CRPF001A search paths)
// 3. Environment variables (UMBRA_* prefix)

#pragma once

#include "CRCF003A.h"
#include <BMOR001A.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Umbra::Configuration {

namespace fs = std::filesystem;

/// @brief Configuration loading and merging
class ConfigLoader {
public:
    /// @brief Load configuration from all sources (merged)
    /// @param overridePath Optional path to override config file search
    /// @return Merged configuration; unreadable files are logged and skipped
    static UmbraConfig load(const std::optional<std::string>& overridePath = std::nullopt);

    /// @brief Load configuration from a specific JSON file
    /// @return Loaded configuration, or defaults on error
    static UmbraConfig loadFromFile(const fs::path& path);

    /// @brief Defaults overridden by the keys present in a JSON document
    static UmbraConfig fromJson(const nlohmann::json& document);

    /// @brief Save configuration to a JSON file
    /// @return true if successful
    static bool saveToFile(const UmbraConfig& config, const fs::path& path);

    /// @brief Apply UMBRA_* environment variable overrides in place
    static void applyEnvironmentOverrides(UmbraConfig& config);

    /// @brief Path of the file merged by the last load(), if any
    static std::optional<fs::path> getLoadedConfigPath();

    /// @brief Validate configuration values
    /// @return Vector of validation error messages (empty if valid)
    static std::vector<std::string> validate(const UmbraConfig& config);

    /// @brief Default configuration as pretty-printed JSON
    static std::string generateDefaultConfig();

    /// @brief Orchestrator settings for a validated configuration
    /// @throws std::invalid_argument for an unknown differencing scheme
    static OrchestratorConfig toOrchestratorConfig(const UmbraConfig& config);

    /// @brief "central" or "richardson" (any case)
    static std::optional<DifferenceScheme> parseDifferenceScheme(const std::string& name);

private:
    /// @brief Merge source JSON into target (keys present in source win)
    static void mergeConfig(UmbraConfig& target, const nlohmann::json& source);

    static std::optional<std::string> getEnv(const std::string& name);
    static std::optional<int> getEnvInt(const std::string& name);
    static std::optional<double> getEnvDouble(const std::string& name);
    static std::optional<bool> getEnvBool(const std::string& name);

    /// @brief Last loaded config path
    static std::optional<fs::path> s_loadedPath;
};

} // namespace Umbra::Configuration
