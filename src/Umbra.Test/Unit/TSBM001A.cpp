// TSBM001A.cpp - Beam Orchestrator Tests
// Tests for BMOR001A BeamOrchestrator
// Verifies: aiming geometry, ray tagging, skipped-ray accounting,
// thread-count independence and perturbation snapshots.

#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include <stdexcept>
#include "../TSFT001A.h"
#include <BMOR001A.h>
#include <IRLG001A.h>

namespace umbra::test {

// =============================================================================
// Test Fixture
// =============================================================================

class BeamOrchestratorTests : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::Warning);
    }

    void TearDown() override {
        Logger::instance().setLevel(LogLevel::Info);
    }

    static OrchestratorConfig withThreads(int threads) {
        OrchestratorConfig config;
        config.threadCount = threads;
        return config;
    }

    static BeamRequest smallBeam(int rays, int maxSteps) {
        BeamRequest request;
        request.rays = rays;
        request.maxSteps = maxSteps;
        return request;
    }
};

// =============================================================================
// Aiming Geometry
// =============================================================================

TEST_F(BeamOrchestratorTests, OffsetsSpanWidthInclusive) {
    const auto offsets = BeamOrchestrator::aimingOffsets(15.0, 30);
    ASSERT_EQ(offsets.size(), 30u);
    EXPECT_DOUBLE_EQ(offsets.front(), -7.5);
    EXPECT_DOUBLE_EQ(offsets.back(), 7.5);

    const double spacing = 15.0 / 29.0;
    for (size_t i = 1; i < offsets.size(); ++i) {
        EXPECT_NEAR(offsets[i] - offsets[i - 1], spacing, 1e-12) << "gap " << i;
    }
}

TEST_F(BeamOrchestratorTests, OddRayCountHitsCentre) {
    const auto offsets = BeamOrchestrator::aimingOffsets(10.0, 3);
    ASSERT_EQ(offsets.size(), 3u);
    EXPECT_DOUBLE_EQ(offsets[0], -5.0);
    EXPECT_DOUBLE_EQ(offsets[1], 0.0);
    EXPECT_DOUBLE_EQ(offsets[2], 5.0);
}

TEST_F(BeamOrchestratorTests, SingleAndEmptyBeams) {
    const auto one = BeamOrchestrator::aimingOffsets(15.0, 1);
    ASSERT_EQ(one.size(), 1u);
    EXPECT_DOUBLE_EQ(one[0], -7.5);

    EXPECT_TRUE(BeamOrchestrator::aimingOffsets(15.0, 0).empty());
    EXPECT_TRUE(BeamOrchestrator::aimingOffsets(15.0, -3).empty());
}

TEST_F(BeamOrchestratorTests, ParallelRayGeometry) {
    BeamOrchestrator orchestrator;
    const auto state = orchestrator.initializeParallelRay(20.0, 5.0, MathConst::HALF_PI, 1.0);
    ASSERT_TRUE(state.has_value());

    EXPECT_DOUBLE_EQ(state->x.r, std::sqrt(425.0));
    EXPECT_DOUBLE_EQ(state->x.phi, std::atan2(5.0, 20.0));
    EXPECT_DOUBLE_EQ(state->p.t, -1.0);
    EXPECT_DOUBLE_EQ(state->p.phi, 5.0) << "Impact parameter carried by p_φ";
    EXPECT_LT(state->p.r, 0.0) << "Launched inward";
    EXPECT_LE(std::abs(orchestrator.spacetime().nullConstraint(*state)), Tolerances::INITIAL_NULL);
}

TEST_F(BeamOrchestratorTests, ParallelRayWithoutRealMomentum) {
    // E = 0.5 at x = 0, y = 10: the angular term dominates and p_r² < 0
    BeamOrchestrator orchestrator;
    EXPECT_FALSE(orchestrator.initializeParallelRay(0.0, 10.0, MathConst::HALF_PI, 0.5).has_value());
    EXPECT_FALSE(orchestrator.initializeParallelRay(0.0, -10.0, MathConst::HALF_PI, 0.5).has_value());
}

// =============================================================================
// Running Beams
// =============================================================================

TEST_F(BeamOrchestratorTests, RaysAreTaggedInOrder) {
    BeamOrchestrator orchestrator(withThreads(2));
    const BeamRequest request = smallBeam(6, 100);
    const BeamResult result = orchestrator.runBeam(request);
    const auto offsets = BeamOrchestrator::aimingOffsets(request.width, request.rays);

    EXPECT_EQ(result.requestedRays, 6);
    EXPECT_EQ(result.skippedRays, 0);
    ASSERT_EQ(result.trajectories.size(), 6u);

    for (size_t i = 0; i < result.trajectories.size(); ++i) {
        const TrajectoryRecord& rec = result.trajectories[i];
        ASSERT_TRUE(rec.rayIndex.has_value());
        EXPECT_EQ(*rec.rayIndex, static_cast<int>(i));
        EXPECT_DOUBLE_EQ(rec.initialY, offsets[i]);
        EXPECT_DOUBLE_EQ(rec.initialPhi, std::atan2(offsets[i], request.startX));
        EXPECT_LE(rec.steps, 100);
        EXPECT_FALSE(rec.empty());
    }
}

TEST_F(BeamOrchestratorTests, SkippedRaysAreCounted) {
    BeamOrchestrator orchestrator(withThreads(1));
    BeamRequest request = smallBeam(2, 50);
    request.startX = 0.0;
    request.width = 20.0;
    request.energy = 0.5;

    const BeamResult result = orchestrator.runBeam(request);
    EXPECT_EQ(result.requestedRays, 2);
    EXPECT_EQ(result.skippedRays, 2);
    EXPECT_TRUE(result.trajectories.empty());
    ASSERT_EQ(result.skippedIndices.size(), 2u);
    EXPECT_EQ(result.skippedIndices[0], 0);
    EXPECT_EQ(result.skippedIndices[1], 1);
}

TEST_F(BeamOrchestratorTests, TracedPlusSkippedEqualsRequested) {
    BeamOrchestrator orchestrator(withThreads(2));
    BeamRequest request = smallBeam(4, 50);
    request.startX = 0.0;
    request.width = 20.0;
    request.energy = 0.5;

    const BeamResult result = orchestrator.runBeam(request);
    EXPECT_EQ(static_cast<int>(result.trajectories.size()) + result.skippedRays, 4);
    EXPECT_GE(result.skippedRays, 2) << "Both edge rays at |y| = 10 have no real p_r";

    for (const auto& rec : result.trajectories) {
        ASSERT_TRUE(rec.rayIndex.has_value());
        for (int skipped : result.skippedIndices) {
            EXPECT_NE(*rec.rayIndex, skipped);
        }
    }
}

TEST_F(BeamOrchestratorTests, ResultIndependentOfThreadCount) {
    BeamOrchestrator serial(withThreads(1));
    BeamOrchestrator parallel(withThreads(4));
    const BeamRequest request = smallBeam(8, 200);

    const BeamResult a = serial.runBeam(request);
    const BeamResult b = parallel.runBeam(request);

    EXPECT_EQ(a.threadsUsed, 1);
    EXPECT_EQ(b.threadsUsed, 4);
    ASSERT_EQ(a.trajectories.size(), b.trajectories.size());
    for (size_t i = 0; i < a.trajectories.size(); ++i) {
        EXPECT_EQ(a.trajectories[i].status, b.trajectories[i].status) << "ray " << i;
        EXPECT_EQ(a.trajectories[i].steps, b.trajectories[i].steps) << "ray " << i;
        EXPECT_EQ(a.trajectories[i].r, b.trajectories[i].r) << "ray " << i;
        EXPECT_EQ(a.trajectories[i].phi, b.trajectories[i].phi) << "ray " << i;
    }
}

TEST_F(BeamOrchestratorTests, ThreadsCappedByRayCount) {
    BeamOrchestrator orchestrator(withThreads(8));
    const BeamResult result = orchestrator.runBeam(smallBeam(3, 20));
    EXPECT_EQ(result.threadsUsed, 3);
    EXPECT_EQ(result.trajectories.size(), 3u);
}

TEST_F(BeamOrchestratorTests, EmptyBeam) {
    BeamOrchestrator orchestrator;
    const BeamResult result = orchestrator.runBeam(smallBeam(0, 100));
    EXPECT_TRUE(result.trajectories.empty());
    EXPECT_EQ(result.requestedRays, 0);
    EXPECT_EQ(result.skippedRays, 0);
}

TEST_F(BeamOrchestratorTests, PositionalFormMatchesRequest) {
    BeamOrchestrator orchestrator(withThreads(1));
    const auto records = orchestrator.runBeamSimulation(20.0, 15.0, 3, 80);
    const BeamResult result = orchestrator.runBeam(smallBeam(3, 80));

    ASSERT_EQ(records.size(), result.trajectories.size());
    for (size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(records[i].phi, result.trajectories[i].phi);
    }
}

TEST_F(BeamOrchestratorTests, TraceRayUsesDefaultBudget) {
    OrchestratorConfig config;
    config.defaultMaxSteps = 25;
    BeamOrchestrator orchestrator(config);

    const PhotonStateD s = orchestrator.integrator().initializePhoton(20.0, MathConst::HALF_PI, 0.0);
    EXPECT_EQ(orchestrator.traceRay(s).steps, 25);
    EXPECT_EQ(orchestrator.traceRay(s, 10).steps, 10);
}

// =============================================================================
// Perturbations
// =============================================================================

TEST_F(BeamOrchestratorTests, AddPerturbationUsesConfiguredDefaults) {
    OrchestratorConfig config;
    config.perturbForceScale = 50.0;
    config.perturbSoftening = 0.2;
    BeamOrchestrator orchestrator(config);

    orchestrator.addPerturbation(8.0, MathConst::HALF_PI, MathConst::QUARTER_PI, 0.5);
    orchestrator.addPerturbation(12.0, MathConst::HALF_PI, 1.0, 0.1, 10.0, 0.5);

    const auto set = orchestrator.snapshot();
    ASSERT_EQ(set->size(), 2u);
    EXPECT_DOUBLE_EQ((*set)[0].forceScale(), 50.0);
    EXPECT_DOUBLE_EQ((*set)[0].softening(), 0.2);
    EXPECT_DOUBLE_EQ((*set)[1].forceScale(), 10.0);
    EXPECT_DOUBLE_EQ((*set)[1].softening(), 0.5);

    orchestrator.clearPerturbations();
    EXPECT_EQ(orchestrator.perturbationCount(), 0u);
    EXPECT_EQ(set->size(), 2u) << "Earlier snapshot is immutable";
}

TEST_F(BeamOrchestratorTests, SnapshotUnaffectedByLaterAdditions) {
    BeamOrchestrator orchestrator(withThreads(2));
    const BeamRequest request = smallBeam(4, 150);

    const auto empty = orchestrator.snapshot();
    const BeamResult baseline = orchestrator.runBeam(request);

    orchestrator.addPerturbation(8.0, MathConst::HALF_PI, MathConst::QUARTER_PI, 0.5);
    EXPECT_EQ(empty->size(), 0u);
    EXPECT_EQ(orchestrator.perturbationCount(), 1u);

    const BeamResult replay = orchestrator.runBeam(request, empty);
    ASSERT_EQ(replay.trajectories.size(), baseline.trajectories.size());
    for (size_t i = 0; i < replay.trajectories.size(); ++i) {
        EXPECT_EQ(replay.trajectories[i].phi, baseline.trajectories[i].phi) << "ray " << i;
    }
}

TEST_F(BeamOrchestratorTests, NullSnapshotTreatedAsEmpty) {
    BeamOrchestrator orchestrator(withThreads(1));
    const BeamRequest request = smallBeam(2, 40);
    const BeamResult a = orchestrator.runBeam(request, nullptr);
    const BeamResult b = orchestrator.runBeam(request);
    ASSERT_EQ(a.trajectories.size(), b.trajectories.size());
    for (size_t i = 0; i < a.trajectories.size(); ++i) {
        EXPECT_EQ(a.trajectories[i].r, b.trajectories[i].r);
    }
}

// =============================================================================
// Configuration and Argument Checks
// =============================================================================

TEST_F(BeamOrchestratorTests, SpinAboveMassIsClamped) {
    OrchestratorConfig config;
    config.spin = 1.5;
    BeamOrchestrator orchestrator(config);
    EXPECT_TRUE(orchestrator.spacetime().spinWasClamped());
    EXPECT_DOUBLE_EQ(orchestrator.spacetime().spin(), 0.99);
}

TEST_F(BeamOrchestratorTests, InvalidConfigurationRejected) {
    OrchestratorConfig badMass;
    badMass.mass = 0.0;
    EXPECT_THROW(BeamOrchestrator bad(badMass), std::invalid_argument);

    OrchestratorConfig badStep;
    badStep.integrator.stepSize = -0.1;
    EXPECT_THROW(BeamOrchestrator bad(badStep), std::invalid_argument);

    OrchestratorConfig badBudget;
    badBudget.defaultMaxSteps = -1;
    EXPECT_THROW(BeamOrchestrator bad(badBudget), std::invalid_argument);
}

TEST_F(BeamOrchestratorTests, InvalidRequestRejected) {
    BeamOrchestrator orchestrator;
    EXPECT_THROW(orchestrator.runBeam(smallBeam(-1, 10)), std::invalid_argument);
    EXPECT_THROW(orchestrator.runBeam(smallBeam(3, -1)), std::invalid_argument);
}

TEST_F(BeamOrchestratorTests, ThreadCountResolution) {
    EXPECT_EQ(BeamOrchestrator::resolveThreadCount(3), 3);
    EXPECT_GE(BeamOrchestrator::resolveThreadCount(0), 1);
    EXPECT_GE(BeamOrchestrator::resolveThreadCount(-4), 1);
}

} // namespace umbra::test
