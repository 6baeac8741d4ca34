// CREP001A.cpp - Program Entry Point
// Component ID: CREP001A (Application/Entry Point)
//
// Runs a baseline beam, adds the configured point mass, runs the same beam
// again and logs both summaries, the comparison and the largest per-ray
// deflection changes.

#include <BMOR001A.h>
#include <BMST001A.h>
#include <CRCF002A.h>
#include <CRPF001A.h>
#include <IRLG001A.h>

#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>

namespace {

void printUsage(const char* programName) {
    std::cout << "Umbra Beam Tracer\n";
    std::cout << "=================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << programName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --help, -h              Show this help message\n";
    std::cout << "  --config, -c PATH       Configuration file (default: search for umbra.json)\n";
    std::cout << "  --print-default-config  Print the default configuration as JSON and exit\n";
    std::cout << "\n";
    std::cout << "Environment overrides: UMBRA_MASS, UMBRA_SPIN, UMBRA_STEP_SIZE, UMBRA_MAX_STEPS,\n";
    std::cout << "  UMBRA_NULL_TOLERANCE, UMBRA_RAYS, UMBRA_BEAM_WIDTH, UMBRA_START_X,\n";
    std::cout << "  UMBRA_PERTURB_MASS, UMBRA_PERTURB_ENABLED, UMBRA_THREADS, UMBRA_LOG_LEVEL\n";
    std::cout << "\n";
}

std::string formatValue(double value) {
    if (std::isnan(value)) {
        return "n/a";
    }
    std::ostringstream ss;
    ss << std::setprecision(6) << value;
    return ss.str();
}

void logStatistics(const std::string& title, const std::map<std::string, double>& values) {
    LOG_INFO(title);
    for (const auto& [name, value] : values) {
        std::ostringstream ss;
        ss << "  " << std::left << std::setw(32) << name << formatValue(value);
        LOG_INFO(ss.str());
    }
}

void applyLogging(const Umbra::Configuration::ExecutionConfig& execution) {
    auto& logger = Umbra::Logger::instance();
    if (auto level = Umbra::levelFromString(execution.logLevel)) {
        logger.setLevel(*level);
    }
    if (!execution.logFile.empty() && !logger.setLogFile(execution.logFile)) {
        LOG_WARN("Cannot open log file " + execution.logFile);
    }
}

int runComparison(const Umbra::Configuration::UmbraConfig& config) {
    using namespace Umbra;

    BeamOrchestrator orchestrator(Configuration::ConfigLoader::toOrchestratorConfig(config));

    BeamRequest request;
    request.startX = config.beam.startX;
    request.width = config.beam.width;
    request.rays = config.beam.rays;
    request.maxSteps = config.integrator.maxSteps;
    request.theta = config.beam.theta;
    request.energy = config.beam.energy;

    LOG_INFO("Baseline beam");
    const BeamResult baseline = orchestrator.runBeam(request);
    logStatistics("Baseline summary", summarizeTrajectories(baseline.trajectories).asMap());

    if (!config.perturbation.enabled) {
        LOG_INFO("Perturbation disabled; skipping comparison");
        return 0;
    }

    const auto& p = config.perturbation;
    orchestrator.addPerturbation(p.r, p.theta, p.phi, p.mass, p.forceScale, p.softening);

    LOG_INFO("Perturbed beam");
    const BeamResult perturbed = orchestrator.runBeam(request);
    logStatistics("Perturbed summary", summarizeTrajectories(perturbed.trajectories).asMap());

    logStatistics("Comparison",
                  compareTrajectorySets(baseline.trajectories, perturbed.trajectories).asMap());

    const auto top = topRayDeltas(perRayDeltas(baseline.trajectories, perturbed.trajectories), 5);
    LOG_INFO("Largest deflection changes");
    for (const auto& row : top) {
        std::ostringstream ss;
        ss << "  ray " << std::setw(3) << row.rayIndex
           << "  y = " << std::setw(8) << formatValue(row.initialY)
           << "  " << statusName(row.baselineStatus) << " -> " << statusName(row.perturbedStatus)
           << "  delta |dphi| = " << formatValue(row.deltaAbsDeflection);
        LOG_INFO(ss.str());
    }

    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        Umbra::Configuration::GlobalOptions options;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                options.showHelp = true;
            }
            else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
                options.configPath = argv[++i];
            }
            else if (arg == "--print-default-config") {
                options.printDefaultConfig = true;
            }
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }

        if (options.showHelp) {
            printUsage(argv[0]);
            return 0;
        }
        if (options.printDefaultConfig) {
            std::cout << Umbra::Configuration::ConfigLoader::generateDefaultConfig() << std::endl;
            return 0;
        }

        std::optional<std::string> configPath;
        if (!options.configPath.empty()) {
            configPath = options.configPath;
        }
        const auto config = Umbra::Configuration::ConfigLoader::load(configPath);
        applyLogging(config.execution);
        LOG_DEBUG("Platform: " + Umbra::Platform::PathResolver::platformName());
        if (const auto source = Umbra::Configuration::ConfigLoader::getLoadedConfigPath()) {
            LOG_DEBUG("Configuration: " + source->string());
        } else {
            LOG_DEBUG("Configuration: built-in defaults");
        }

        const auto errors = Umbra::Configuration::ConfigLoader::validate(config);
        if (!errors.empty()) {
            for (const auto& error : errors) {
                LOG_ERROR("Invalid configuration: " + error);
            }
            return 1;
        }

        return runComparison(config);
    }
    catch (const std::exception& e) {
        LOG_FATAL(std::string("Fatal error: ") + e.what());
        return 1;
    }
}
