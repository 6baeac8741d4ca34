// TSCF001A.cpp - Configuration Loader Tests
// Tests for CRCF002A ConfigLoader and CRCF003A schema
// Verifies: defaults, partial JSON merge, UMBRA_* overrides, validation,
// file round trip and orchestrator mapping.

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include "../TSFT001A.h"
#include <CRCF002A.h>
#include <CRPF001A.h>
#include <IRLG001A.h>

namespace umbra::test {

using Umbra::Configuration::ConfigLoader;
using Umbra::Configuration::UmbraConfig;
namespace fs = std::filesystem;

namespace {

const char* const ENV_VARS[] = {
    "UMBRA_MASS", "UMBRA_SPIN", "UMBRA_STEP_SIZE", "UMBRA_MAX_STEPS",
    "UMBRA_NULL_TOLERANCE", "UMBRA_RAYS", "UMBRA_BEAM_WIDTH", "UMBRA_START_X",
    "UMBRA_PERTURB_MASS", "UMBRA_PERTURB_ENABLED", "UMBRA_THREADS", "UMBRA_LOG_LEVEL",
};

bool hasError(const std::vector<std::string>& errors, const std::string& field) {
    for (const auto& e : errors) {
        if (e.find(field) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

// =============================================================================
// Test Fixture
// =============================================================================

class ConfigLoaderTests : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::Fatal);
        for (const char* name : ENV_VARS) {
            unsetenv(name);
        }

        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tempDir = fs::temp_directory_path() / (std::string("umbra_") + info->name());
        fs::remove_all(tempDir);
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        for (const char* name : ENV_VARS) {
            unsetenv(name);
        }
        std::error_code ec;
        fs::remove_all(tempDir, ec);
        Logger::instance().setLevel(LogLevel::Info);
    }

    fs::path writeFile(const std::string& name, const std::string& contents) {
        const fs::path path = tempDir / name;
        std::ofstream out(path);
        out << contents;
        return path;
    }

    fs::path tempDir;
};

// =============================================================================
// Defaults and Merge
// =============================================================================

TEST_F(ConfigLoaderTests, DefaultsMatchConstants) {
    const UmbraConfig c = UmbraConfig::defaults();

    EXPECT_DOUBLE_EQ(c.spacetime.mass, 1.0);
    EXPECT_DOUBLE_EQ(c.spacetime.spin, 0.9);
    EXPECT_DOUBLE_EQ(c.integrator.stepSize, 0.05);
    EXPECT_EQ(c.integrator.maxSteps, 1500);
    EXPECT_DOUBLE_EQ(c.integrator.nullTolerance, 1e-2);
    EXPECT_DOUBLE_EQ(c.integrator.maxRadiusFactor, 50.0);
    EXPECT_DOUBLE_EQ(c.integrator.captureMargin, 1.05);
    EXPECT_EQ(c.integrator.differencingScheme, "central");
    EXPECT_DOUBLE_EQ(c.beam.startX, 20.0);
    EXPECT_DOUBLE_EQ(c.beam.width, 15.0);
    EXPECT_EQ(c.beam.rays, 30);
    EXPECT_TRUE(c.perturbation.enabled);
    EXPECT_DOUBLE_EQ(c.perturbation.r, 8.0);
    EXPECT_DOUBLE_EQ(c.perturbation.phi, MathConst::QUARTER_PI);
    EXPECT_DOUBLE_EQ(c.perturbation.mass, 0.5);
    EXPECT_EQ(c.execution.threadCount, 0);
    EXPECT_EQ(c.execution.logLevel, "info");

    EXPECT_TRUE(ConfigLoader::validate(c).empty());
}

TEST_F(ConfigLoaderTests, PartialJsonOverridesNamedKeysOnly) {
    const auto doc = nlohmann::json::parse(R"({
        "spacetime": { "spin": 0.5 },
        "beam": { "rays": 7 },
        "perturbation": { "enabled": false }
    })");
    const UmbraConfig c = ConfigLoader::fromJson(doc);

    EXPECT_DOUBLE_EQ(c.spacetime.spin, 0.5);
    EXPECT_DOUBLE_EQ(c.spacetime.mass, 1.0);
    EXPECT_EQ(c.beam.rays, 7);
    EXPECT_DOUBLE_EQ(c.beam.width, 15.0);
    EXPECT_FALSE(c.perturbation.enabled);
    EXPECT_DOUBLE_EQ(c.perturbation.r, 8.0);
    EXPECT_EQ(c.integrator.maxSteps, 1500);
}

TEST_F(ConfigLoaderTests, WrongTypeInJsonThrows) {
    const auto doc = nlohmann::json::parse(R"({ "beam": { "rays": "many" } })");
    EXPECT_THROW(ConfigLoader::fromJson(doc), nlohmann::json::exception);
}

TEST_F(ConfigLoaderTests, DefaultConfigIsValidJson) {
    const auto doc = nlohmann::json::parse(ConfigLoader::generateDefaultConfig());
    EXPECT_TRUE(doc.contains("spacetime"));
    EXPECT_TRUE(doc.contains("integrator"));
    EXPECT_TRUE(doc.contains("beam"));
    EXPECT_TRUE(doc.contains("perturbation"));
    EXPECT_TRUE(doc.contains("execution"));
    EXPECT_EQ(doc["beam"]["rays"].get<int>(), 30);
}

// =============================================================================
// Files
// =============================================================================

TEST_F(ConfigLoaderTests, SaveAndLoadFile) {
    UmbraConfig c = UmbraConfig::defaults();
    c.spacetime.spin = 0.3;
    c.beam.rays = 12;
    c.integrator.differencingScheme = "richardson";
    c.execution.logFile = "umbra.log";

    const fs::path path = tempDir / "nested" / "umbra.json";
    ASSERT_TRUE(ConfigLoader::saveToFile(c, path));

    const UmbraConfig loaded = ConfigLoader::loadFromFile(path);
    EXPECT_DOUBLE_EQ(loaded.spacetime.spin, 0.3);
    EXPECT_EQ(loaded.beam.rays, 12);
    EXPECT_EQ(loaded.integrator.differencingScheme, "richardson");
    EXPECT_EQ(loaded.execution.logFile, "umbra.log");
}

TEST_F(ConfigLoaderTests, MalformedFileFallsBackToDefaults) {
    const fs::path path = writeFile("broken.json", "{ \"beam\": { \"rays\": ");
    const UmbraConfig c = ConfigLoader::loadFromFile(path);
    EXPECT_EQ(c.beam.rays, 30);

    const UmbraConfig missing = ConfigLoader::loadFromFile(tempDir / "absent.json");
    EXPECT_EQ(missing.beam.rays, 30);
}

TEST_F(ConfigLoaderTests, LoadWithExplicitPathRecordsSource) {
    const fs::path path = writeFile("run.json", R"({ "beam": { "width": 4.0 } })");
    const UmbraConfig c = ConfigLoader::load(path.string());

    EXPECT_DOUBLE_EQ(c.beam.width, 4.0);
    ASSERT_TRUE(ConfigLoader::getLoadedConfigPath().has_value());
    EXPECT_EQ(ConfigLoader::getLoadedConfigPath()->string(), path.string());
}

TEST_F(ConfigLoaderTests, LoadWithMissingPathUsesDefaults) {
    const UmbraConfig c = ConfigLoader::load((tempDir / "absent.json").string());
    EXPECT_DOUBLE_EQ(c.beam.width, 15.0);
    EXPECT_FALSE(ConfigLoader::getLoadedConfigPath().has_value());
}

// =============================================================================
// Environment
// =============================================================================

TEST_F(ConfigLoaderTests, EnvironmentOverrides) {
    setenv("UMBRA_MASS", "2.0", 1);
    setenv("UMBRA_SPIN", "0.4", 1);
    setenv("UMBRA_MAX_STEPS", "250", 1);
    setenv("UMBRA_RAYS", "9", 1);
    setenv("UMBRA_PERTURB_ENABLED", "off", 1);
    setenv("UMBRA_THREADS", "3", 1);
    setenv("UMBRA_LOG_LEVEL", "debug", 1);

    UmbraConfig c = UmbraConfig::defaults();
    ConfigLoader::applyEnvironmentOverrides(c);

    EXPECT_DOUBLE_EQ(c.spacetime.mass, 2.0);
    EXPECT_DOUBLE_EQ(c.spacetime.spin, 0.4);
    EXPECT_EQ(c.integrator.maxSteps, 250);
    EXPECT_EQ(c.beam.rays, 9);
    EXPECT_FALSE(c.perturbation.enabled);
    EXPECT_EQ(c.execution.threadCount, 3);
    EXPECT_EQ(c.execution.logLevel, "debug");
    EXPECT_DOUBLE_EQ(c.beam.width, 15.0) << "Unset variables leave values alone";
}

TEST_F(ConfigLoaderTests, EnvironmentWinsOverFile) {
    const fs::path path = writeFile("run.json", R"({ "beam": { "rays": 5 } })");
    setenv("UMBRA_RAYS", "11", 1);

    const UmbraConfig c = ConfigLoader::load(path.string());
    EXPECT_EQ(c.beam.rays, 11);
}

TEST_F(ConfigLoaderTests, MalformedEnvironmentIgnored) {
    setenv("UMBRA_RAYS", "lots", 1);
    setenv("UMBRA_MASS", "heavy", 1);
    setenv("UMBRA_PERTURB_ENABLED", "maybe", 1);

    UmbraConfig c = UmbraConfig::defaults();
    ConfigLoader::applyEnvironmentOverrides(c);

    EXPECT_EQ(c.beam.rays, 30);
    EXPECT_DOUBLE_EQ(c.spacetime.mass, 1.0);
    EXPECT_TRUE(c.perturbation.enabled);
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(ConfigLoaderTests, ValidationReportsEachField) {
    UmbraConfig c = UmbraConfig::defaults();
    c.spacetime.mass = 0.0;
    c.integrator.stepSize = -0.05;
    c.integrator.maxSteps = 0;
    c.integrator.differencingScheme = "simpson";
    c.beam.rays = 0;
    c.beam.energy = 0.0;
    c.perturbation.softening = 0.0;
    c.execution.threadCount = -1;
    c.execution.logLevel = "loud";

    const auto errors = ConfigLoader::validate(c);
    EXPECT_TRUE(hasError(errors, "spacetime.mass"));
    EXPECT_TRUE(hasError(errors, "integrator.stepSize"));
    EXPECT_TRUE(hasError(errors, "integrator.maxSteps"));
    EXPECT_TRUE(hasError(errors, "integrator.differencingScheme"));
    EXPECT_TRUE(hasError(errors, "beam.rays"));
    EXPECT_TRUE(hasError(errors, "beam.energy"));
    EXPECT_TRUE(hasError(errors, "perturbation.softening"));
    EXPECT_TRUE(hasError(errors, "execution.threadCount"));
    EXPECT_TRUE(hasError(errors, "execution.logLevel"));
    EXPECT_EQ(errors.size(), 9u);
}

TEST_F(ConfigLoaderTests, EscapeRadiusMustExceedCaptureMargin) {
    UmbraConfig c = UmbraConfig::defaults();
    c.integrator.maxRadiusFactor = 1.0;
    EXPECT_TRUE(hasError(ConfigLoader::validate(c), "integrator.maxRadiusFactor"));
}

TEST_F(ConfigLoaderTests, OverExtremalSpinIsOnlyAWarning) {
    UmbraConfig c = UmbraConfig::defaults();
    c.spacetime.spin = 1.2;
    EXPECT_TRUE(ConfigLoader::validate(c).empty());
}

// =============================================================================
// Orchestrator Mapping
// =============================================================================

TEST_F(ConfigLoaderTests, DifferenceSchemeNames) {
    EXPECT_EQ(ConfigLoader::parseDifferenceScheme("central"), DifferenceScheme::Central);
    EXPECT_EQ(ConfigLoader::parseDifferenceScheme("Richardson"), DifferenceScheme::Richardson);
    EXPECT_FALSE(ConfigLoader::parseDifferenceScheme("forward").has_value());
}

TEST_F(ConfigLoaderTests, OrchestratorConfigMapping) {
    UmbraConfig c = UmbraConfig::defaults();
    c.spacetime.mass = 2.0;
    c.spacetime.spin = 0.5;
    c.integrator.stepSize = 0.02;
    c.integrator.maxSteps = 800;
    c.integrator.differencingStep = 1e-4;
    c.integrator.differencingScheme = "RICHARDSON";
    c.perturbation.forceScale = 25.0;
    c.execution.threadCount = 2;

    const OrchestratorConfig o = ConfigLoader::toOrchestratorConfig(c);
    EXPECT_DOUBLE_EQ(o.mass, 2.0);
    EXPECT_DOUBLE_EQ(o.spin, 0.5);
    EXPECT_DOUBLE_EQ(o.integrator.stepSize, 0.02);
    EXPECT_EQ(o.defaultMaxSteps, 800);
    EXPECT_DOUBLE_EQ(o.differencing.step, 1e-4);
    EXPECT_EQ(o.differencing.scheme, DifferenceScheme::Richardson);
    EXPECT_DOUBLE_EQ(o.perturbForceScale, 25.0);
    EXPECT_EQ(o.threadCount, 2);

    c.integrator.differencingScheme = "forward";
    EXPECT_THROW(ConfigLoader::toOrchestratorConfig(c), std::invalid_argument);
}

// =============================================================================
// Search Paths
// =============================================================================

TEST_F(ConfigLoaderTests, SearchPathsStartInWorkingDirectory) {
    const auto paths = Umbra::Platform::PathResolver::configSearchPaths();
    ASSERT_GE(paths.size(), 2u);
    EXPECT_EQ(paths.front().string(), (fs::current_path() / "umbra.json").string());
    EXPECT_EQ(paths.back().filename().string(), "umbra.json");
    for (const auto& path : paths) {
        EXPECT_EQ(path.filename().string(), Umbra::Platform::CONFIG_FILE_NAME);
    }
}

TEST_F(ConfigLoaderTests, ConfigFileFoundInWorkingDirectory) {
    const fs::path previous = fs::current_path();
    fs::current_path(tempDir);
    writeFile("umbra.json", R"({ "beam": { "rays": 3 } })");

    const auto found = Umbra::Platform::PathResolver::findConfigFile();
    const UmbraConfig c = ConfigLoader::load();
    fs::current_path(previous);

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->filename().string(), "umbra.json");
    EXPECT_EQ(c.beam.rays, 3);
    EXPECT_FALSE(Umbra::Platform::PathResolver::platformName().empty());
}

// =============================================================================
// Log Levels
// =============================================================================

TEST_F(ConfigLoaderTests, LogLevelNames) {
    EXPECT_EQ(levelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(levelFromString("info"), LogLevel::Info);
    EXPECT_EQ(levelFromString("warn"), LogLevel::Warning);
    EXPECT_EQ(levelFromString("warning"), LogLevel::Warning);
    EXPECT_EQ(levelFromString("Error"), LogLevel::Error);
    EXPECT_EQ(levelFromString("fatal"), LogLevel::Fatal);
    EXPECT_FALSE(levelFromString("verbose").has_value());
}

} // namespace umbra::test
