// TSDG001A.cpp - Integrator Numerical Diagnostics
// Tests: boundary starts, on-axis photons, null-constraint drift,
// step-size convergence and differencing scheme agreement.

#include <cmath>
#include <gtest/gtest.h>
#include "../TSFT001A.h"
#include "PHGD002A.h"
#include "PHMT100B.h"

namespace umbra::test {

// =============================================================================
// Test Fixture
// =============================================================================

class IntegratorDiagnosticTests : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    // Every recorded coordinate and null error is finite
    bool isRecordFinite(const TrajectoryRecord& rec) {
        for (size_t i = 0; i < rec.r.size(); ++i) {
            if (!std::isfinite(rec.t[i]) || !std::isfinite(rec.r[i]) ||
                !std::isfinite(rec.theta[i]) || !std::isfinite(rec.phi[i]) ||
                !std::isfinite(rec.nullError[i])) {
                return false;
            }
        }
        return true;
    }

    KerrSpacetimeD kerr{1.0, 0.9};
};

// =============================================================================
// Boundary Starts
// =============================================================================

TEST_F(IntegratorDiagnosticTests, StartInsideCaptureRadius) {
    HamiltonianGeodesicIntegrator integrator(kerr);
    PhotonStateD s(Vec4d(0.0, 1.2, MathConst::HALF_PI, 0.0), Vec4d(-1.0, -1.0, 0.0, 0.0));

    const TrajectoryRecord rec = integrator.trace(s, 100);
    EXPECT_EQ(rec.status, TraceStatus::Captured);
    EXPECT_EQ(rec.steps, 1) << "Initial position is recorded before the check";
    EXPECT_DOUBLE_EQ(rec.finalState.x.r, 1.2);
}

TEST_F(IntegratorDiagnosticTests, StartBeyondEscapeRadius) {
    HamiltonianGeodesicIntegrator integrator(kerr);
    const PhotonStateD s = integrator.initializePhoton(60.0, MathConst::HALF_PI, 0.0);

    const TrajectoryRecord rec = integrator.trace(s, 100);
    EXPECT_EQ(rec.status, TraceStatus::Escaped);
    EXPECT_EQ(rec.steps, 1);
}

TEST_F(IntegratorDiagnosticTests, OnAxisInfallStaysFinite) {
    // sin²θ floored: the default p_φ is forbidden and the photon falls along the axis
    HamiltonianGeodesicIntegrator integrator(kerr);
    const PhotonStateD s = integrator.initializePhoton(20.0, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(s.p.phi, 0.0);

    const TrajectoryRecord rec = integrator.trace(s, 200);
    EXPECT_NE(rec.status, TraceStatus::NumericalError);
    EXPECT_TRUE(isRecordFinite(rec));
    for (double theta : rec.theta) {
        EXPECT_DOUBLE_EQ(theta, 0.0) << "∂H/∂θ vanishes on the axis";
    }
}

TEST_F(IntegratorDiagnosticTests, ForceSingularityIsSoftened) {
    // Point mass placed exactly on the launch position
    HamiltonianGeodesicIntegrator integrator(kerr);
    const PhotonStateD s = integrator.initializePhoton(12.0, MathConst::HALF_PI, 0.0, 1.0, 3.0);
    const PerturbationSet onTop{MassPerturbation(12.0, MathConst::HALF_PI, 0.0, 0.5)};

    const TrajectoryRecord rec = integrator.trace(s, 50, onTop);
    EXPECT_NE(rec.status, TraceStatus::NumericalError);
    EXPECT_TRUE(isRecordFinite(rec));
}

// =============================================================================
// Accuracy
// =============================================================================

TEST_F(IntegratorDiagnosticTests, NullConstraintDriftStaysBounded) {
    HamiltonianGeodesicIntegrator integrator(kerr);
    const PhotonStateD s = integrator.initializePhoton(20.0, MathConst::HALF_PI, 0.0, 1.0, 10.0);

    const TrajectoryRecord rec = integrator.trace(s, 1500);
    EXPECT_FALSE(rec.constraintViolated);
    EXPECT_LT(rec.maxNullError, Tolerances::NULL_CONSTRAINT);
    EXPECT_LE(rec.initialNullError, Tolerances::INITIAL_NULL);
    EXPECT_TRUE(isRecordFinite(rec));
}

TEST_F(IntegratorDiagnosticTests, HalvingStepConverges) {
    IntegratorConfig coarse;
    coarse.stepSize = 0.05;
    IntegratorConfig fine;
    fine.stepSize = 0.025;

    HamiltonianGeodesicIntegrator a(kerr, coarse);
    HamiltonianGeodesicIntegrator b(kerr, fine);
    const PhotonStateD s = a.initializePhoton(20.0, MathConst::HALF_PI, 0.0, 1.0, 10.0);

    // Same affine length λ = 10
    const TrajectoryRecord ra = a.trace(s, 200);
    const TrajectoryRecord rb = b.trace(s, 400);
    ASSERT_EQ(ra.status, TraceStatus::MaxSteps);
    ASSERT_EQ(rb.status, TraceStatus::MaxSteps);

    EXPECT_NEAR(ra.finalState.x.r, rb.finalState.x.r, 1e-4);
    EXPECT_NEAR(ra.finalState.x.phi, rb.finalState.x.phi, 1e-4);
    EXPECT_NEAR(ra.properTime, rb.properTime, 1e-12);
}

TEST_F(IntegratorDiagnosticTests, DifferencingSchemesAgreeAlongTrajectory) {
    DifferencingConfig richardson;
    richardson.step = 1e-3;
    richardson.scheme = DifferenceScheme::Richardson;
    KerrSpacetimeD fourthOrder(1.0, 0.9, Constants::Metric::DEFAULT_EPSILON, richardson);

    HamiltonianGeodesicIntegrator central(kerr);
    HamiltonianGeodesicIntegrator fivePoint(fourthOrder);
    const PhotonStateD s = central.initializePhoton(20.0, 1.2, 0.0, 1.0, 5.0);

    const TrajectoryRecord ra = central.trace(s, 200);
    const TrajectoryRecord rb = fivePoint.trace(s, 200);
    ASSERT_EQ(ra.steps, rb.steps);

    for (int i = 0; i < PhotonStateD::SIZE; ++i) {
        EXPECT_NEAR(ra.finalState[i], rb.finalState[i], 1e-6) << "component " << i;
    }
}

TEST_F(IntegratorDiagnosticTests, ConservedMomentaUnchangedUnderPerturbation) {
    // Forces enter dp_r, dp_θ, dp_φ; p_t is never driven
    HamiltonianGeodesicIntegrator integrator(kerr);
    const PhotonStateD s = integrator.initializePhoton(20.0, MathConst::HALF_PI, 0.0, 1.0, 5.0);
    const PerturbationSet set{MassPerturbation(8.0, MathConst::HALF_PI, MathConst::QUARTER_PI, 0.5)};

    const TrajectoryRecord plain = integrator.trace(s, 300);
    const TrajectoryRecord pert = integrator.trace(s, 300, set);

    EXPECT_DOUBLE_EQ(plain.finalState.p.t, s.p.t);
    EXPECT_DOUBLE_EQ(plain.finalState.p.phi, s.p.phi);
    EXPECT_DOUBLE_EQ(pert.finalState.p.t, s.p.t);
}

} // namespace umbra::test
