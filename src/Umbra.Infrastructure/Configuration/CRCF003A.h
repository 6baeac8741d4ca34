// CRCF003A.h - Configuration Schema
// Component ID: CRCF003A (Configuration/Schema)
//
// Run configuration with JSON serialization support. Every section uses
// WITH_DEFAULT serialization, so a partial document only overrides the keys
// it names.

#pragma once

#include <nlohmann/json.hpp>
#include <PHCN001A.h>
#include <string>

namespace Umbra::Configuration {

/// @brief Kerr spacetime parameters
struct SpacetimeConfig {
    double mass = 1.0;
    double spin = 0.9;          ///< |spin| > mass is clamped by the spacetime
    double epsilon = Umbra::Constants::Metric::DEFAULT_EPSILON;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(SpacetimeConfig,
        mass, spin, epsilon)
};

/// @brief RK4 integration and termination
struct IntegratorSettings {
    double stepSize = Umbra::Constants::Geodesic::DEFAULT_STEP_SIZE;
    int maxSteps = Umbra::Constants::Geodesic::DEFAULT_MAX_STEPS;
    double nullTolerance = Umbra::Constants::Geodesic::NULL_TOLERANCE;
    double maxRadiusFactor = Umbra::Constants::Geodesic::MAX_RADIUS_FACTOR;
    double captureMargin = Umbra::Constants::Geodesic::CAPTURE_MARGIN;
    double differencingStep = Umbra::Constants::Differentiation::DEFAULT_STEP;
    std::string differencingScheme = "central";   ///< central or richardson

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(IntegratorSettings,
        stepSize, maxSteps, nullTolerance, maxRadiusFactor, captureMargin,
        differencingStep, differencingScheme)
};

/// @brief Parallel beam geometry
struct BeamConfig {
    double startX = Umbra::Constants::Beam::DEFAULT_START_X;
    double width = Umbra::Constants::Beam::DEFAULT_WIDTH;
    int rays = Umbra::Constants::Beam::DEFAULT_RAYS;
    double theta = Umbra::Constants::Math::HALF_PI;
    double energy = Umbra::Constants::Beam::DEFAULT_ENERGY;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(BeamConfig,
        startX, width, rays, theta, energy)
};

/// @brief Point mass added for the perturbed run
struct PerturbationConfig {
    bool enabled = true;
    double r = 8.0;
    double theta = Umbra::Constants::Math::HALF_PI;
    double phi = Umbra::Constants::Math::QUARTER_PI;
    double mass = 0.5;
    double forceScale = Umbra::Constants::Perturbation::DEFAULT_FORCE_SCALE;
    double softening = Umbra::Constants::Perturbation::DEFAULT_SOFTENING;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(PerturbationConfig,
        enabled, r, theta, phi, mass, forceScale, softening)
};

/// @brief Threads and logging
struct ExecutionConfig {
    int threadCount = 0;          ///< 0 = auto-detect
    std::string logLevel = "info";
    std::string logFile;          ///< Empty = console only

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(ExecutionConfig,
        threadCount, logLevel, logFile)
};

/// @brief Root configuration structure
struct UmbraConfig {
    SpacetimeConfig spacetime;
    IntegratorSettings integrator;
    BeamConfig beam;
    PerturbationConfig perturbation;
    ExecutionConfig execution;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(UmbraConfig,
        spacetime, integrator, beam, perturbation, execution)

    /// @brief Get default configuration
    static UmbraConfig defaults() {
        return UmbraConfig{};
    }
};

/// @brief Command-line options (not persisted to config file)
struct GlobalOptions {
    std::string configPath;       ///< Override config file path
    bool printDefaultConfig = false;
    bool showHelp = false;
};

} // namespace Umbra::Configuration
