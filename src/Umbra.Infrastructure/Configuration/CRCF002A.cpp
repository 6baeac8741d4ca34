// CRCF002A.cpp - Configuration Loader
// Component ID: CRCF002A (Configuration/Loader)

#include "CRCF002A.h"
#include <CRPF001A.h>
#include <IRLG001A.h>
#include <PHCN001A.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace Umbra::Configuration {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

// Static member initialization
std::optional<fs::path> ConfigLoader::s_loadedPath = std::nullopt;

UmbraConfig ConfigLoader::load(const std::optional<std::string>& overridePath) {
    UmbraConfig config = UmbraConfig::defaults();
    s_loadedPath = std::nullopt;

    // Determine which config file to load
    std::optional<fs::path> configPath;

    if (overridePath.has_value() && !overridePath->empty()) {
        fs::path path(*overridePath);
        std::error_code ec;
        if (fs::exists(path, ec)) {
            configPath = path;
        } else {
            LOG_WARN("[Config] " + path.string() + " not found, using defaults");
        }
    } else {
        configPath = Platform::PathResolver::findConfigFile();
    }

    if (configPath.has_value()) {
        try {
            std::ifstream file(configPath.value());
            if (file) {
                nlohmann::json j;
                file >> j;
                mergeConfig(config, j);
                s_loadedPath = configPath;
                LOG_INFO("[Config] Loaded " + configPath->string());
            } else {
                LOG_WARN("[Config] Cannot open " + configPath->string());
            }
        } catch (const std::exception& e) {
            LOG_WARN("[Config] Failed to load config from " + configPath->string() + ": " + e.what());
        }
    }

    applyEnvironmentOverrides(config);

    return config;
}

UmbraConfig ConfigLoader::loadFromFile(const fs::path& path) {
    UmbraConfig config = UmbraConfig::defaults();

    try {
        std::ifstream file(path);
        if (file) {
            nlohmann::json j;
            file >> j;
            config = j.get<UmbraConfig>();
        } else {
            LOG_ERROR("[Config] Cannot open " + path.string());
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Config] Error loading config from " + path.string() + ": " + e.what());
        config = UmbraConfig::defaults();
    }

    return config;
}

UmbraConfig ConfigLoader::fromJson(const nlohmann::json& document) {
    UmbraConfig config = UmbraConfig::defaults();
    mergeConfig(config, document);
    return config;
}

bool ConfigLoader::saveToFile(const UmbraConfig& config, const fs::path& path) {
    try {
        if (path.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(path.parent_path(), ec);
        }

        std::ofstream file(path);
        if (!file) {
            LOG_ERROR("[Config] Cannot write " + path.string());
            return false;
        }

        nlohmann::json j = config;
        file << j.dump(2);
        return static_cast<bool>(file);
    } catch (const std::exception& e) {
        LOG_ERROR("[Config] Error saving config to " + path.string() + ": " + e.what());
        return false;
    }
}

void ConfigLoader::applyEnvironmentOverrides(UmbraConfig& config) {
    // Spacetime
    if (auto val = getEnvDouble("UMBRA_MASS")) {
        config.spacetime.mass = *val;
    }
    if (auto val = getEnvDouble("UMBRA_SPIN")) {
        config.spacetime.spin = *val;
    }

    // Integrator
    if (auto val = getEnvDouble("UMBRA_STEP_SIZE")) {
        config.integrator.stepSize = *val;
    }
    if (auto val = getEnvInt("UMBRA_MAX_STEPS")) {
        config.integrator.maxSteps = *val;
    }
    if (auto val = getEnvDouble("UMBRA_NULL_TOLERANCE")) {
        config.integrator.nullTolerance = *val;
    }

    // Beam
    if (auto val = getEnvInt("UMBRA_RAYS")) {
        config.beam.rays = *val;
    }
    if (auto val = getEnvDouble("UMBRA_BEAM_WIDTH")) {
        config.beam.width = *val;
    }
    if (auto val = getEnvDouble("UMBRA_START_X")) {
        config.beam.startX = *val;
    }

    // Perturbation
    if (auto val = getEnvDouble("UMBRA_PERTURB_MASS")) {
        config.perturbation.mass = *val;
    }
    if (auto val = getEnvBool("UMBRA_PERTURB_ENABLED")) {
        config.perturbation.enabled = *val;
    }

    // Execution
    if (auto val = getEnvInt("UMBRA_THREADS")) {
        config.execution.threadCount = *val;
    }
    if (auto val = getEnv("UMBRA_LOG_LEVEL")) {
        config.execution.logLevel = *val;
    }
}

std::optional<fs::path> ConfigLoader::getLoadedConfigPath() {
    return s_loadedPath;
}

std::vector<std::string> ConfigLoader::validate(const UmbraConfig& config) {
    std::vector<std::string> errors;

    // =========================================================================
    // Spacetime
    // =========================================================================
    const auto& st = config.spacetime;
    if (!(st.mass > 0.0) || !std::isfinite(st.mass)) {
        errors.push_back("spacetime.mass must be positive");
    }
    if (!std::isfinite(st.spin)) {
        errors.push_back("spacetime.spin must be finite");
    } else if (std::abs(st.spin) > st.mass && st.mass > 0.0) {
        LOG_WARN("[Config] spacetime.spin = " + std::to_string(st.spin) +
                 " exceeds mass; it will be clamped to 0.99 M");
    }
    if (!(st.epsilon > 0.0)) {
        errors.push_back("spacetime.epsilon must be positive");
    }

    // =========================================================================
    // Integrator
    // =========================================================================
    const auto& in = config.integrator;
    if (!(in.stepSize > 0.0) || !std::isfinite(in.stepSize)) {
        errors.push_back("integrator.stepSize must be positive");
    }
    if (in.maxSteps < 1) {
        errors.push_back("integrator.maxSteps must be at least 1");
    }
    if (!(in.nullTolerance > 0.0)) {
        errors.push_back("integrator.nullTolerance must be positive");
    }
    if (!(in.captureMargin >= 1.0)) {
        errors.push_back("integrator.captureMargin must be at least 1");
    }
    if (!(in.maxRadiusFactor > in.captureMargin)) {
        errors.push_back("integrator.maxRadiusFactor must exceed integrator.captureMargin");
    }
    if (!(in.differencingStep > 0.0)) {
        errors.push_back("integrator.differencingStep must be positive");
    }
    if (!parseDifferenceScheme(in.differencingScheme)) {
        errors.push_back("integrator.differencingScheme must be one of: central, richardson");
    }

    // =========================================================================
    // Beam
    // =========================================================================
    const auto& beam = config.beam;
    if (beam.rays < 1) {
        errors.push_back("beam.rays must be at least 1");
    }
    if (!(beam.width >= 0.0)) {
        errors.push_back("beam.width must be non-negative");
    }
    if (!(beam.startX > 0.0)) {
        errors.push_back("beam.startX must be positive");
    }
    if (beam.energy == 0.0 || !std::isfinite(beam.energy)) {
        errors.push_back("beam.energy must be finite and non-zero");
    }

    // =========================================================================
    // Perturbation
    // =========================================================================
    const auto& pert = config.perturbation;
    if (!(pert.softening > 0.0)) {
        errors.push_back("perturbation.softening must be positive");
    }
    if (!(pert.forceScale >= 0.0)) {
        errors.push_back("perturbation.forceScale must be non-negative");
    }
    if (!(pert.mass >= 0.0)) {
        errors.push_back("perturbation.mass must be non-negative");
    }

    // =========================================================================
    // Execution
    // =========================================================================
    if (config.execution.threadCount < 0) {
        errors.push_back("execution.threadCount must be non-negative (0 = auto)");
    }
    if (!levelFromString(config.execution.logLevel)) {
        errors.push_back("execution.logLevel must be one of: debug, info, warn, error, fatal");
    }

    return errors;
}

std::string ConfigLoader::generateDefaultConfig() {
    UmbraConfig config = UmbraConfig::defaults();
    nlohmann::json j = config;
    return j.dump(2);
}

std::optional<DifferenceScheme> ConfigLoader::parseDifferenceScheme(const std::string& name) {
    const std::string lower = toLower(name);
    if (lower == "central") return DifferenceScheme::Central;
    if (lower == "richardson") return DifferenceScheme::Richardson;
    return std::nullopt;
}

OrchestratorConfig ConfigLoader::toOrchestratorConfig(const UmbraConfig& config) {
    const auto scheme = parseDifferenceScheme(config.integrator.differencingScheme);
    if (!scheme) {
        throw std::invalid_argument("Unknown differencing scheme: " + config.integrator.differencingScheme);
    }

    OrchestratorConfig out;
    out.mass = config.spacetime.mass;
    out.spin = config.spacetime.spin;
    out.epsilon = config.spacetime.epsilon;
    out.differencing.step = config.integrator.differencingStep;
    out.differencing.scheme = *scheme;

    out.integrator.stepSize = config.integrator.stepSize;
    out.integrator.nullTolerance = config.integrator.nullTolerance;
    out.integrator.maxRadiusFactor = config.integrator.maxRadiusFactor;
    out.integrator.captureMargin = config.integrator.captureMargin;
    out.defaultMaxSteps = config.integrator.maxSteps;

    out.perturbForceScale = config.perturbation.forceScale;
    out.perturbSoftening = config.perturbation.softening;
    out.threadCount = config.execution.threadCount;
    return out;
}

void ConfigLoader::mergeConfig(UmbraConfig& target, const nlohmann::json& source) {
    nlohmann::json targetJson = target;

    for (auto& [key, value] : source.items()) {
        if (targetJson.contains(key) && targetJson[key].is_object() && value.is_object()) {
            for (auto& [subKey, subValue] : value.items()) {
                targetJson[key][subKey] = subValue;
            }
        } else {
            targetJson[key] = value;
        }
    }

    target = targetJson.get<UmbraConfig>();
}

std::optional<std::string> ConfigLoader::getEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value && value[0] != '\0') {
        return std::string(value);
    }
    return std::nullopt;
}

std::optional<int> ConfigLoader::getEnvInt(const std::string& name) {
    if (auto str = getEnv(name)) {
        try {
            return std::stoi(*str);
        } catch (const std::exception&) {
            LOG_WARN("[Config] Ignoring " + name + "=" + *str + ": not an integer");
        }
    }
    return std::nullopt;
}

std::optional<double> ConfigLoader::getEnvDouble(const std::string& name) {
    if (auto str = getEnv(name)) {
        try {
            return std::stod(*str);
        } catch (const std::exception&) {
            LOG_WARN("[Config] Ignoring " + name + "=" + *str + ": not a number");
        }
    }
    return std::nullopt;
}

std::optional<bool> ConfigLoader::getEnvBool(const std::string& name) {
    if (auto str = getEnv(name)) {
        const std::string lower = toLower(*str);
        if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
            return true;
        }
        if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
            return false;
        }
        LOG_WARN("[Config] Ignoring " + name + "=" + *str + ": not a boolean");
    }
    return std::nullopt;
}

} // namespace Umbra::Configuration
