// TSBM002A.cpp - Beam Statistics Tests
// Tests for BMST001A summarizeTrajectories / compareTrajectorySets
// Verifies: status fractions, NaN-skipping means, deflection reference,
// matching by ray index and per-ray ranking.

#include <gtest/gtest.h>
#include <cmath>
#include <optional>
#include <vector>
#include "../TSFT001A.h"
#include <BMST001A.h>

namespace umbra::test {

namespace {

/// Synthetic record whose φ runs from phi0 to phi1
TrajectoryRecord makeRecord(TraceStatus status, double phi0, double phi1,
                            std::optional<int> rayIndex = std::nullopt,
                            int steps = 4) {
    TrajectoryRecord rec;
    rec.status = status;
    rec.rayIndex = rayIndex;
    rec.steps = steps;
    rec.properTime = steps * 0.5;
    for (int i = 0; i < steps; ++i) {
        const double s = steps > 1 ? static_cast<double>(i) / (steps - 1) : 0.0;
        rec.t.push_back(i);
        rec.r.push_back(20.0 - i);
        rec.theta.push_back(MathConst::HALF_PI);
        rec.phi.push_back(phi0 + (phi1 - phi0) * s);
        rec.nullError.push_back(1e-6);
    }
    if (!rec.nullError.empty()) {
        rec.initialNullError = 1e-6;
        rec.finalNullError = 1e-6;
        rec.meanNullError = 1e-6;
        rec.maxNullError = 1e-6;
    }
    return rec;
}

} // namespace

// =============================================================================
// Test Fixture
// =============================================================================

class BeamStatisticsTests : public ::testing::Test {
protected:
    void SetUp() override {
        beam.push_back(makeRecord(TraceStatus::Captured, 0.0, 0.5, 0));
        beam.push_back(makeRecord(TraceStatus::Escaped, 0.0, -1.0, 1));
        beam.push_back(makeRecord(TraceStatus::Escaped, 0.25, 0.5, 2));
        beam.push_back(makeRecord(TraceStatus::MaxSteps, 0.0, 0.25, 3));
    }

    std::vector<TrajectoryRecord> beam;
};

// =============================================================================
// Deflection
// =============================================================================

TEST_F(BeamStatisticsTests, DeflectionFromFirstPhiWhenUntagged) {
    EXPECT_DOUBLE_EQ(deflectionAngle(makeRecord(TraceStatus::Escaped, 0.25, 1.0)), 0.75);
}

TEST_F(BeamStatisticsTests, DeflectionUsesLaunchAzimuthWhenTagged) {
    TrajectoryRecord rec = makeRecord(TraceStatus::Escaped, 0.25, 1.0, 0);
    rec.initialPhi = 0.5;
    EXPECT_DOUBLE_EQ(deflectionAngle(rec), 0.5);
}

TEST_F(BeamStatisticsTests, DeflectionOfEmptyRecordIsNaN) {
    EXPECT_TRUE(std::isnan(deflectionAngle(TrajectoryRecord{})));
}

// =============================================================================
// Summary
// =============================================================================

TEST_F(BeamStatisticsTests, StatusFractions) {
    const BeamSummary s = summarizeTrajectories(beam);

    EXPECT_EQ(s.totalRays, 4);
    EXPECT_DOUBLE_EQ(s.capturedFraction, 0.25);
    EXPECT_DOUBLE_EQ(s.escapedFraction, 0.5);
    EXPECT_DOUBLE_EQ(s.maxStepsFraction, 0.25);
    EXPECT_DOUBLE_EQ(s.numericalErrorFraction, 0.0);
    EXPECT_DOUBLE_EQ(s.constraintWarningFraction, 0.0);
    EXPECT_DOUBLE_EQ(s.constraintViolationFraction, 0.0);

    double sum = 0.0;
    for (TraceStatus status : {TraceStatus::Captured, TraceStatus::Escaped, TraceStatus::MaxSteps,
                               TraceStatus::NumericalError, TraceStatus::ConstraintWarning}) {
        sum += s.fraction(status);
    }
    EXPECT_DOUBLE_EQ(sum, 1.0) << "Status fractions partition the beam";
}

TEST_F(BeamStatisticsTests, DeflectionStatistics) {
    // Deflections: 0.5, -1.0, 0.25, 0.25
    const BeamSummary s = summarizeTrajectories(beam);

    EXPECT_DOUBLE_EQ(s.meanAbsDeflection, 0.5);
    EXPECT_DOUBLE_EQ(s.maxAbsDeflection, 1.0);
    EXPECT_DOUBLE_EQ(s.meanSignedDeflection, 0.0);
}

TEST_F(BeamStatisticsTests, StepAndErrorStatistics) {
    beam.push_back(makeRecord(TraceStatus::Captured, 0.0, 0.5, 4, 8));
    const BeamSummary s = summarizeTrajectories(beam);

    EXPECT_DOUBLE_EQ(s.meanSteps, (4.0 * 4 + 8.0) / 5.0);
    EXPECT_DOUBLE_EQ(s.meanProperTime, (2.0 * 4 + 4.0) / 5.0);
    EXPECT_NEAR(s.meanNullError, 1e-6, 1e-18);
    EXPECT_NEAR(s.meanFinalNullError, 1e-6, 1e-18);
    EXPECT_NEAR(s.maxNullError, 1e-6, 1e-18);
}

TEST_F(BeamStatisticsTests, EmptyRecordsSkippedInMeans) {
    TrajectoryRecord empty;
    empty.status = TraceStatus::NumericalError;
    beam.push_back(empty);

    const BeamSummary s = summarizeTrajectories(beam);
    EXPECT_EQ(s.totalRays, 5);
    EXPECT_DOUBLE_EQ(s.numericalErrorFraction, 0.2);
    EXPECT_DOUBLE_EQ(s.meanAbsDeflection, 0.5) << "NaN deflection excluded";
    EXPECT_NEAR(s.meanNullError, 1e-6, 1e-18) << "NaN null error excluded";
    EXPECT_DOUBLE_EQ(s.meanSteps, 16.0 / 5.0) << "Step counts are always finite";
}

TEST_F(BeamStatisticsTests, ConstraintViolationFraction) {
    beam[1].constraintViolated = true;
    beam[3].constraintViolated = true;
    beam[3].status = TraceStatus::ConstraintWarning;

    const BeamSummary s = summarizeTrajectories(beam);
    EXPECT_DOUBLE_EQ(s.constraintViolationFraction, 0.5);
    EXPECT_DOUBLE_EQ(s.constraintWarningFraction, 0.25);
    EXPECT_DOUBLE_EQ(s.maxStepsFraction, 0.0);
}

TEST_F(BeamStatisticsTests, EmptySummary) {
    const BeamSummary s = summarizeTrajectories({});

    EXPECT_EQ(s.totalRays, 0);
    EXPECT_DOUBLE_EQ(s.capturedFraction, 0.0);
    EXPECT_DOUBLE_EQ(s.escapedFraction, 0.0);
    EXPECT_TRUE(std::isnan(s.meanAbsDeflection));
    EXPECT_TRUE(std::isnan(s.maxAbsDeflection));
    EXPECT_TRUE(std::isnan(s.meanSteps));
    EXPECT_TRUE(std::isnan(s.maxNullError));
}

TEST_F(BeamStatisticsTests, SummaryMapKeys) {
    const auto map = summarizeTrajectories(beam).asMap();

    EXPECT_EQ(map.size(), 15u);
    for (const char* key : {"total_rays", "captured_fraction", "escaped_fraction",
                            "max_steps_fraction", "numerical_error_fraction",
                            "constraint_warning_fraction", "constraint_violation_fraction",
                            "mean_abs_deflection", "max_abs_deflection", "mean_signed_deflection",
                            "mean_steps", "mean_proper_time", "mean_null_error",
                            "mean_final_null_error", "max_null_error"}) {
        EXPECT_EQ(map.count(key), 1u) << key;
    }
    EXPECT_DOUBLE_EQ(map.at("total_rays"), 4.0);
}

// =============================================================================
// Comparison
// =============================================================================

TEST_F(BeamStatisticsTests, SelfComparisonIsZero) {
    const BeamComparison c = compareTrajectorySets(beam, beam);

    EXPECT_EQ(c.commonRays, 4);
    EXPECT_DOUBLE_EQ(c.meanDeltaAbsDeflection, 0.0);
    EXPECT_DOUBLE_EQ(c.maxDeltaAbsDeflection, 0.0);
    EXPECT_DOUBLE_EQ(c.capturedDelta, 0.0);
    EXPECT_DOUBLE_EQ(c.escapedDelta, 0.0);
}

TEST_F(BeamStatisticsTests, ComparisonOverCommonRays) {
    std::vector<TrajectoryRecord> perturbed;
    perturbed.push_back(makeRecord(TraceStatus::Captured, 0.0, 1.0, 1));    // |Δ| 1.0 -> 1.0
    perturbed.push_back(makeRecord(TraceStatus::Captured, 0.25, 1.0, 2));   // 0.25 -> 0.75
    perturbed.push_back(makeRecord(TraceStatus::Escaped, 0.0, 3.0, 9));     // no baseline

    const BeamComparison c = compareTrajectorySets(beam, perturbed);

    EXPECT_EQ(c.commonRays, 2);
    EXPECT_DOUBLE_EQ(c.meanDeltaAbsDeflection, 0.25);
    EXPECT_DOUBLE_EQ(c.maxDeltaAbsDeflection, 0.5);
    EXPECT_DOUBLE_EQ(c.capturedDelta, 1.0) << "Baseline rays 1, 2 both escaped";
    EXPECT_DOUBLE_EQ(c.escapedDelta, -1.0);
}

TEST_F(BeamStatisticsTests, ComparisonFractionsUseMatchedRaysOnly) {
    std::vector<TrajectoryRecord> perturbed;
    perturbed.push_back(makeRecord(TraceStatus::Escaped, 0.0, 0.5, 0));    // was captured
    perturbed.push_back(makeRecord(TraceStatus::Captured, 0.0, 0.25, 3));  // was max steps

    const BeamComparison c = compareTrajectorySets(beam, perturbed);
    EXPECT_EQ(c.commonRays, 2);
    EXPECT_DOUBLE_EQ(c.capturedDelta, 0.0);
    EXPECT_DOUBLE_EQ(c.escapedDelta, 0.5) << "Escaped baseline rays 1, 2 are unmatched";
}

TEST_F(BeamStatisticsTests, DisjointBeamsCompareEmpty) {
    std::vector<TrajectoryRecord> other;
    other.push_back(makeRecord(TraceStatus::Escaped, 0.0, 1.0, 10));
    other.push_back(makeRecord(TraceStatus::Escaped, 0.0, 1.0));   // untagged

    const BeamComparison c = compareTrajectorySets(beam, other);
    EXPECT_EQ(c.commonRays, 0);
    EXPECT_TRUE(std::isnan(c.meanDeltaAbsDeflection));
    EXPECT_TRUE(std::isnan(c.maxDeltaAbsDeflection));
    EXPECT_TRUE(std::isnan(c.capturedDelta));
    EXPECT_TRUE(std::isnan(c.escapedDelta));
}

TEST_F(BeamStatisticsTests, DuplicateIndexLastRecordWins) {
    std::vector<TrajectoryRecord> perturbed;
    perturbed.push_back(makeRecord(TraceStatus::Captured, 0.0, 2.0, 0));
    perturbed.push_back(makeRecord(TraceStatus::Captured, 0.0, 0.75, 0));

    const BeamComparison c = compareTrajectorySets(beam, perturbed);
    EXPECT_EQ(c.commonRays, 1);
    EXPECT_DOUBLE_EQ(c.meanDeltaAbsDeflection, 0.25);
}

TEST_F(BeamStatisticsTests, ComparisonMapKeys) {
    const auto map = compareTrajectorySets(beam, beam).asMap();
    EXPECT_EQ(map.size(), 5u);
    EXPECT_DOUBLE_EQ(map.at("common_rays"), 4.0);
    EXPECT_EQ(map.count("mean_delta_abs_deflection"), 1u);
    EXPECT_EQ(map.count("max_delta_abs_deflection"), 1u);
    EXPECT_EQ(map.count("captured_delta"), 1u);
    EXPECT_EQ(map.count("escaped_delta"), 1u);
}

// =============================================================================
// Per-Ray Deltas
// =============================================================================

TEST_F(BeamStatisticsTests, PerRayRowsInIndexOrder) {
    std::vector<TrajectoryRecord> perturbed;
    perturbed.push_back(makeRecord(TraceStatus::Captured, 0.0, 0.5, 3));
    perturbed.push_back(makeRecord(TraceStatus::Escaped, 0.0, 1.0, 0));
    perturbed.back().initialY = -7.5;
    beam[0].initialY = -7.5;

    const auto rows = perRayDeltas(beam, perturbed);
    ASSERT_EQ(rows.size(), 2u);

    EXPECT_EQ(rows[0].rayIndex, 0);
    EXPECT_DOUBLE_EQ(rows[0].initialY, -7.5);
    EXPECT_EQ(rows[0].baselineStatus, TraceStatus::Captured);
    EXPECT_EQ(rows[0].perturbedStatus, TraceStatus::Escaped);
    EXPECT_DOUBLE_EQ(rows[0].baselineAbsDeflection, 0.5);
    EXPECT_DOUBLE_EQ(rows[0].perturbedAbsDeflection, 1.0);
    EXPECT_DOUBLE_EQ(rows[0].deltaAbsDeflection, 0.5);

    EXPECT_EQ(rows[1].rayIndex, 3);
    EXPECT_DOUBLE_EQ(rows[1].deltaAbsDeflection, 0.25);
}

TEST_F(BeamStatisticsTests, PerRayOffsetPrefersPerturbedRecord) {
    std::vector<TrajectoryRecord> perturbed;
    perturbed.push_back(makeRecord(TraceStatus::Captured, 0.0, 0.5, 0));
    perturbed.push_back(makeRecord(TraceStatus::Escaped, 0.0, -1.0, 1));
    perturbed[0].initialY = -5.0;
    beam[0].initialY = -7.5;
    beam[1].initialY = 2.5;

    const auto rows = perRayDeltas(beam, perturbed);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_DOUBLE_EQ(rows[0].initialY, -5.0);
    EXPECT_DOUBLE_EQ(rows[1].initialY, 2.5) << "Falls back to the baseline offset";
}

TEST_F(BeamStatisticsTests, PerRayDeltaNaNForEmptyRecord) {
    TrajectoryRecord empty;
    empty.rayIndex = 2;
    empty.status = TraceStatus::NumericalError;

    const auto rows = perRayDeltas(beam, {empty});
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_DOUBLE_EQ(rows[0].baselineAbsDeflection, 0.25);
    EXPECT_TRUE(std::isnan(rows[0].perturbedAbsDeflection));
    EXPECT_TRUE(std::isnan(rows[0].deltaAbsDeflection));
}

TEST_F(BeamStatisticsTests, TopDeltasRankedByMagnitude) {
    std::vector<PerRayDelta> rows(4);
    rows[0].rayIndex = 0;
    rows[0].deltaAbsDeflection = 0.1;
    rows[1].rayIndex = 1;
    rows[1].deltaAbsDeflection = -0.4;
    rows[2].rayIndex = 2;   // NaN delta dropped
    rows[3].rayIndex = 3;
    rows[3].deltaAbsDeflection = 0.1;

    const auto top = topRayDeltas(rows, 2);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].rayIndex, 1);
    EXPECT_EQ(top[1].rayIndex, 0) << "Ties keep input order";

    EXPECT_EQ(topRayDeltas(rows, 10).size(), 3u);
    EXPECT_TRUE(topRayDeltas(rows, 0).empty());
}

} // namespace umbra::test
