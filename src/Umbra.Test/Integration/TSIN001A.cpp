// TSIN001A.cpp - Beam Integration Tests
// Component ID: TSIN001A
// Runs the orchestrator, integrator and statistics together on the
// reference configuration M = 1, a = 0.9, h = 0.05.

#include <gtest/gtest.h>
#include <cmath>
#include "BMOR001A.h"
#include "BMST001A.h"
#include "CRCF002A.h"
#include "IRLG001A.h"

using namespace Umbra;

namespace {

class BeamIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::instance().setLevel(LogLevel::Warning); }
    void TearDown() override { Logger::instance().setLevel(LogLevel::Info); }
};

} // namespace

//==============================================================================
// Single-Ray Outcomes
//==============================================================================

/// A ray aimed straight at the hole falls in
TEST_F(BeamIntegrationTest, CentralRayIsCaptured) {
    BeamOrchestrator orchestrator;
    const auto state = orchestrator.initializeParallelRay(20.0, 0.0, Constants::Math::HALF_PI, 1.0);
    ASSERT_TRUE(state.has_value());

    const TrajectoryRecord rec = orchestrator.traceRay(*state, 1500);
    EXPECT_EQ(rec.status, TraceStatus::Captured);
    EXPECT_LT(rec.r.back(), orchestrator.integrator().captureRadius());
    EXPECT_LE(rec.steps, 1500);
}

/// Impact parameter 15 passes wide of the photon-capture cross-section
TEST_F(BeamIntegrationTest, WideRayEscapes) {
    BeamOrchestrator orchestrator;
    const auto state = orchestrator.initializeParallelRay(20.0, 15.0, Constants::Math::HALF_PI, 1.0);
    ASSERT_TRUE(state.has_value());

    const TrajectoryRecord rec = orchestrator.traceRay(*state, 3000);
    EXPECT_EQ(rec.status, TraceStatus::Escaped);
    EXPECT_GT(rec.r.back(), orchestrator.integrator().escapeRadius());

    // Deflected toward the hole: φ advances past the launch azimuth
    EXPECT_GT(std::abs(rec.phi.back() - state->x.phi), 0.0);
}

//==============================================================================
// Full Beam
//==============================================================================

/// Reference beam contains both outcomes and every ray is accounted for
TEST_F(BeamIntegrationTest, ReferenceBeamMixesCaptureAndEscape) {
    OrchestratorConfig config;
    config.defaultMaxSteps = 3000;
    BeamOrchestrator orchestrator(config);

    const BeamResult result = orchestrator.runBeam(BeamRequest{});
    EXPECT_EQ(result.requestedRays, 30);
    EXPECT_EQ(static_cast<int>(result.trajectories.size()) + result.skippedRays, 30);

    const BeamSummary summary = summarizeTrajectories(result.trajectories);
    EXPECT_GT(summary.capturedFraction, 0.0);
    EXPECT_GT(summary.escapedFraction, 0.0);
    EXPECT_LE(summary.capturedFraction + summary.escapedFraction, 1.0 + 1e-12);
    EXPECT_TRUE(std::isfinite(summary.meanAbsDeflection));
    EXPECT_LE(summary.meanSteps, 3000.0);
}

/// Self-comparison of a real beam is exactly zero
TEST_F(BeamIntegrationTest, BeamComparedWithItself) {
    BeamOrchestrator orchestrator;
    BeamRequest request;
    request.rays = 6;
    request.maxSteps = 400;
    const BeamResult result = orchestrator.runBeam(request);

    const BeamComparison c = compareTrajectorySets(result.trajectories, result.trajectories);
    EXPECT_EQ(c.commonRays, static_cast<int>(result.trajectories.size()));
    EXPECT_DOUBLE_EQ(c.meanDeltaAbsDeflection, 0.0);
    EXPECT_DOUBLE_EQ(c.capturedDelta, 0.0);
    EXPECT_DOUBLE_EQ(c.escapedDelta, 0.0);
}

//==============================================================================
// Perturbed Beam
//==============================================================================

/// A point mass near φ = π/4 changes the beam
TEST_F(BeamIntegrationTest, PerturbationChangesBeam) {
    BeamOrchestrator orchestrator;
    BeamRequest request;
    request.rays = 5;
    request.width = 15.0;

    const BeamResult baseline = orchestrator.runBeam(request);
    orchestrator.addPerturbation(8.0, Constants::Math::HALF_PI, Constants::Math::QUARTER_PI, 0.5);
    const BeamResult perturbed = orchestrator.runBeam(request);

    const BeamComparison c = compareTrajectorySets(baseline.trajectories, perturbed.trajectories);
    ASSERT_GT(c.commonRays, 0);
    const bool changed = (std::isfinite(c.meanDeltaAbsDeflection) && c.meanDeltaAbsDeflection != 0.0) ||
                         c.capturedDelta != 0.0;
    EXPECT_TRUE(changed);

    const auto rows = perRayDeltas(baseline.trajectories, perturbed.trajectories);
    EXPECT_EQ(static_cast<int>(rows.size()), c.commonRays);
    EXPECT_FALSE(topRayDeltas(rows, 3).empty());
}

/// Configuration file values flow through to the beam
TEST_F(BeamIntegrationTest, ConfigurationDrivesBeam) {
    auto config = Configuration::ConfigLoader::fromJson(nlohmann::json::parse(R"({
        "spacetime": { "spin": 0.5 },
        "integrator": { "maxSteps": 50 },
        "beam": { "rays": 4 },
        "execution": { "threadCount": 2 }
    })"));
    ASSERT_TRUE(Configuration::ConfigLoader::validate(config).empty());

    BeamOrchestrator orchestrator(Configuration::ConfigLoader::toOrchestratorConfig(config));
    EXPECT_DOUBLE_EQ(orchestrator.spacetime().spin(), 0.5);

    BeamRequest request;
    request.rays = config.beam.rays;
    const BeamResult result = orchestrator.runBeam(request);
    EXPECT_EQ(result.threadsUsed, 2);
    ASSERT_EQ(result.trajectories.size(), 4u);
    for (const auto& rec : result.trajectories) {
        EXPECT_LE(rec.steps, 50);
    }
}
