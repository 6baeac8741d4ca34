// TSGD001A.cpp - Hamiltonian Geodesic Integrator Tests
// Tests for PHGD002A HamiltonianGeodesicIntegrator
// Verifies: photon initialisation, RK4 reversibility, termination status,
// record bookkeeping and perturbation coupling.

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <memory>
#include "../TSFT001A.h"
#include <PHGD002A.h>
#include <PHMT100B.h>

namespace umbra::test {

namespace {

// Spacetime with hand-chosen constant inverse components
class FixedInverseSpacetime : public ISpacetimeD {
public:
    explicit FixedInverseSpacetime(const MetricComponents& inverse) : m_inverse(inverse) {}

    MetricComponents metricComponents(double, double) const override { return MetricComponents{}; }
    MetricComponents inverseMetricComponents(double, double) const override { return m_inverse; }
    double nullConstraint(const PhotonStateD&) const override { return 0.0; }
    PhotonStateD derivatives(const PhotonStateD&) const override { return PhotonStateD(); }
    double horizonRadius() const override { return 2.0; }
    double ergosphereRadius(double) const override { return 2.0; }
    double mass() const override { return 1.0; }
    double spin() const override { return 0.0; }
    const char* getName() const override { return "FixedInverse"; }

private:
    MetricComponents m_inverse;
};

bool isKnownStatus(TraceStatus status) {
    switch (status) {
        case TraceStatus::Captured:
        case TraceStatus::Escaped:
        case TraceStatus::MaxSteps:
        case TraceStatus::NumericalError:
        case TraceStatus::ConstraintWarning:
            return true;
    }
    return false;
}

} // namespace

// =============================================================================
// Test Fixture
// =============================================================================

class HamiltonianIntegratorTests : public ::testing::Test {
protected:
    void SetUp() override {
        kerr = std::make_unique<KerrSpacetimeD>(1.0, 0.9);
        integrator = std::make_unique<HamiltonianGeodesicIntegrator>(*kerr);
    }

    std::unique_ptr<KerrSpacetimeD> kerr;
    std::unique_ptr<HamiltonianGeodesicIntegrator> integrator;
};

// =============================================================================
// Initialisation
// =============================================================================

TEST_F(HamiltonianIntegratorTests, InitializedPhotonIsNull) {
    const double radii[] = {4.0, 10.0, 20.0, 40.0};
    const double angularMomenta[] = {0.0, -2.0, 1.0, 3.5};

    for (double r : radii) {
        for (double theta : {MathConst::HALF_PI, 1.0, 2.2}) {
            for (double L : angularMomenta) {
                const PhotonStateD s = integrator->initializePhoton(r, theta, 0.3, 1.0, L);
                EXPECT_LE(std::abs(kerr->nullConstraint(s)), Tolerances::INITIAL_NULL)
                    << "r=" << r << " theta=" << theta << " L=" << L;
                EXPECT_LE(std::abs(kerr->nullConstraint(s)), Tolerances::NULL_CONSTRAINT);
            }
        }
    }
}

TEST_F(HamiltonianIntegratorTests, InitializationFixesConservedMomenta) {
    const PhotonStateD s = integrator->initializePhoton(20.0, MathConst::HALF_PI, 0.5, -2.0, 3.0);

    EXPECT_DOUBLE_EQ(s.x.t, 0.0);
    EXPECT_DOUBLE_EQ(s.x.r, 20.0);
    EXPECT_DOUBLE_EQ(s.x.phi, 0.5);
    EXPECT_DOUBLE_EQ(s.p.t, -2.0) << "p_t = -|E|";
    EXPECT_DOUBLE_EQ(s.p.theta, 0.0);
    EXPECT_DOUBLE_EQ(s.p.phi, 3.0);
    EXPECT_DOUBLE_EQ(s.energy(), 2.0);
    EXPECT_DOUBLE_EQ(s.angularMomentum(), 3.0);
}

TEST_F(HamiltonianIntegratorTests, ZeroAngularMomentumUsesDefault) {
    const PhotonStateD s = integrator->initializePhoton(20.0, MathConst::HALF_PI, 0.0);
    EXPECT_DOUBLE_EQ(s.p.phi, Constants::Initialisation::DEFAULT_ANGULAR_MOMENTUM);
}

TEST_F(HamiltonianIntegratorTests, DirectionSelectsRadialSign) {
    const PhotonStateD in = integrator->initializePhoton(20.0, MathConst::HALF_PI, 0.0, 1.0, 2.0,
                                                         0.0, RadialDirection::Inward);
    const PhotonStateD out = integrator->initializePhoton(20.0, MathConst::HALF_PI, 0.0, 1.0, 2.0,
                                                          0.0, RadialDirection::Outward);
    EXPECT_LT(in.p.r, 0.0);
    EXPECT_GT(out.p.r, 0.0);
    EXPECT_DOUBLE_EQ(in.p.r, -out.p.r);
}

TEST_F(HamiltonianIntegratorTests, ForbiddenAngularMomentumFallsBackToRadial) {
    // L = 100 at r = 20 is far inside the centrifugal barrier
    const PhotonStateD s = integrator->initializePhoton(20.0, MathConst::HALF_PI, 0.0, 1.0, 100.0);
    EXPECT_DOUBLE_EQ(s.p.phi, 0.0);
    EXPECT_LT(s.p.r, 0.0);
    EXPECT_LE(std::abs(kerr->nullConstraint(s)), Tolerances::INITIAL_NULL);
}

TEST_F(HamiltonianIntegratorTests, DegenerateRadialCoefficientThrows) {
    // Δ(2M) = 0 for Schwarzschild, so g^rr = 0
    KerrSpacetimeD schw(1.0, 0.0);
    HamiltonianGeodesicIntegrator onHorizon(schw);
    EXPECT_THROW(onHorizon.initializePhoton(2.0, MathConst::HALF_PI, 0.0), InitializationError);
}

TEST_F(HamiltonianIntegratorTests, NoRealRadialMomentumThrows) {
    // g^tt > 0 with g^rr > 0: even p_φ = 0 leaves p_r² < 0
    MetricComponents inverse;
    inverse.tt = 1.0;
    inverse.rr = 1.0;
    inverse.thth = 1.0;
    inverse.phiphi = 1.0;
    FixedInverseSpacetime pathological(inverse);
    HamiltonianGeodesicIntegrator integ(pathological);

    EXPECT_THROW(integ.initializePhoton(10.0, MathConst::HALF_PI, 0.0), InitializationError);
    EXPECT_FALSE(solveRadialMomentum(inverse, -1.0, 0.0, 0.0).has_value());
}

TEST_F(HamiltonianIntegratorTests, SolveRadialMomentumMatchesInitializer) {
    const PhotonStateD s = integrator->initializePhoton(15.0, 1.1, 0.0, 1.0, 2.5);
    const auto pr = solveRadialMomentum(kerr->inverseMetricComponents(15.0, 1.1), -1.0, 0.0, 2.5);
    ASSERT_TRUE(pr.has_value());
    EXPECT_DOUBLE_EQ(*pr, -s.p.r);
}

// =============================================================================
// RK4 Step
// =============================================================================

TEST_F(HamiltonianIntegratorTests, ForwardBackwardStepReturnsToStart) {
    const PhotonStateD s0 = integrator->initializePhoton(20.0, MathConst::HALF_PI, 0.0, 1.0, 3.0);
    const double h = 0.05;

    const PhotonStateD s1 = integrator->rk4Step(s0, h);
    const PhotonStateD back = integrator->rk4Step(s1, -h);

    for (int i = 0; i < PhotonStateD::SIZE; ++i) {
        EXPECT_NEAR(back[i], s0[i], Tolerances::RK4_REVERSIBILITY) << "component " << i;
    }
}

TEST_F(HamiltonianIntegratorTests, StepPreservesNullConstraint) {
    PhotonStateD s = integrator->initializePhoton(20.0, 1.2, 0.0, 1.0, 3.0);
    for (int i = 0; i < 50; ++i) {
        s = integrator->rk4Step(s, 0.05);
    }
    EXPECT_LE(std::abs(kerr->nullConstraint(s)), Tolerances::NULL_CONSTRAINT);
}

TEST_F(HamiltonianIntegratorTests, NonFiniteStateGivesInvalidStep) {
    PhotonStateD s = integrator->initializePhoton(20.0, MathConst::HALF_PI, 0.0);
    s.p.r = std::numeric_limits<double>::infinity();

    const PhotonStateD next = integrator->rk4Step(s, 0.05);
    for (int i = 0; i < PhotonStateD::SIZE; ++i) {
        EXPECT_TRUE(std::isnan(next[i])) << "component " << i;
    }
}

TEST_F(HamiltonianIntegratorTests, DerivativeAddsForceToMomentumOnly) {
    const PhotonStateD s = integrator->initializePhoton(12.0, MathConst::HALF_PI, 0.2, 1.0, 2.0);
    const PerturbationSet none;
    const PerturbationSet one{MassPerturbation(8.0, MathConst::HALF_PI, MathConst::QUARTER_PI, 0.5)};

    const PhotonStateD base = computeDerivative(s, *kerr, none);
    const PhotonStateD pert = computeDerivative(s, *kerr, one);
    const Vec4d F = totalForce(one, s);

    for (int i = 0; i < 4; ++i) {
        EXPECT_DOUBLE_EQ(pert.x[i], base.x[i]) << "position slot " << i;
        EXPECT_NEAR(pert.p[i], base.p[i] + F[i], Tolerances::GENERAL_DOUBLE) << "momentum slot " << i;
    }
    EXPECT_DOUBLE_EQ(pert.p.t, 0.0);
}

// =============================================================================
// Trace
// =============================================================================

TEST_F(HamiltonianIntegratorTests, RecordBookkeeping) {
    const PhotonStateD s = integrator->initializePhoton(20.0, MathConst::HALF_PI, 0.0, 1.0, 3.0);
    const TrajectoryRecord rec = integrator->trace(s, 10);

    EXPECT_TRUE(rec.status == TraceStatus::MaxSteps || rec.status == TraceStatus::ConstraintWarning);
    EXPECT_EQ(rec.steps, 10);
    EXPECT_EQ(rec.t.size(), 10u);
    EXPECT_EQ(rec.r.size(), 10u);
    EXPECT_EQ(rec.theta.size(), 10u);
    EXPECT_EQ(rec.nullError.size(), 10u);
    EXPECT_DOUBLE_EQ(rec.properTime, 10 * 0.05);
    EXPECT_DOUBLE_EQ(rec.r.front(), 20.0);
    EXPECT_DOUBLE_EQ(rec.initialNullError, rec.nullError.front());
    EXPECT_DOUBLE_EQ(rec.finalNullError, rec.nullError.back());
    EXPECT_GE(rec.maxNullError, rec.meanNullError);
    EXPECT_FALSE(rec.rayIndex.has_value());
}

TEST_F(HamiltonianIntegratorTests, ZeroStepBudget) {
    const PhotonStateD s = integrator->initializePhoton(20.0, MathConst::HALF_PI, 0.0);
    const TrajectoryRecord rec = integrator->trace(s, 0);

    EXPECT_EQ(rec.status, TraceStatus::MaxSteps);
    EXPECT_EQ(rec.steps, 0);
    EXPECT_TRUE(rec.empty());
    EXPECT_DOUBLE_EQ(rec.properTime, 0.0);
    EXPECT_TRUE(std::isnan(rec.initialNullError));
    EXPECT_TRUE(std::isnan(rec.finalNullError));
    EXPECT_TRUE(std::isnan(rec.meanNullError));
}

TEST_F(HamiltonianIntegratorTests, NegativeStepBudgetRejected) {
    const PhotonStateD s = integrator->initializePhoton(20.0, MathConst::HALF_PI, 0.0);
    EXPECT_THROW(integrator->trace(s, -1), std::invalid_argument);
}

TEST_F(HamiltonianIntegratorTests, NonPositiveStepSizeRejected) {
    IntegratorConfig config;
    config.stepSize = 0.0;
    EXPECT_THROW(HamiltonianGeodesicIntegrator bad(*kerr, config), std::invalid_argument);
}

TEST_F(HamiltonianIntegratorTests, NonFiniteInitialStateIsNumericalError) {
    PhotonStateD s = integrator->initializePhoton(20.0, MathConst::HALF_PI, 0.0);
    s.x.theta = std::nan("");

    const TrajectoryRecord rec = integrator->trace(s, 100);
    EXPECT_EQ(rec.status, TraceStatus::NumericalError);
    EXPECT_EQ(rec.steps, 0);
}

TEST_F(HamiltonianIntegratorTests, OffShellStateRaisesConstraintWarning) {
    // p_r = p_φ = 0 with p_t = -1 is timelike-ish: |H| ≈ 0.55
    PhotonStateD s(Vec4d(0.0, 20.0, MathConst::HALF_PI, 0.0), Vec4d(-1.0, 0.0, 0.0, 0.0));
    const TrajectoryRecord rec = integrator->trace(s, 5);

    EXPECT_TRUE(rec.constraintViolated);
    EXPECT_EQ(rec.status, TraceStatus::ConstraintWarning);
    EXPECT_GT(rec.maxNullError, Tolerances::NULL_CONSTRAINT);
}

TEST_F(HamiltonianIntegratorTests, OutwardPhotonEscapes) {
    const PhotonStateD s = integrator->initializePhoton(20.0, MathConst::HALF_PI, 0.0, 1.0, 0.0,
                                                        0.0, RadialDirection::Outward);
    const TrajectoryRecord rec = integrator->trace(s, 1500);

    EXPECT_EQ(rec.status, TraceStatus::Escaped);
    EXPECT_GT(rec.r.back(), integrator->escapeRadius());
    EXPECT_LE(rec.steps, 1500);
    EXPECT_FALSE(rec.constraintViolated);
}

TEST_F(HamiltonianIntegratorTests, LargeStepBudgetReservesBoundedRecord) {
    const PhotonStateD s = integrator->initializePhoton(40.0, MathConst::HALF_PI, 0.0, 1.0, 0.0,
                                                        0.0, RadialDirection::Outward);
    const TrajectoryRecord rec = integrator->trace(s, std::numeric_limits<int>::max());

    EXPECT_EQ(rec.status, TraceStatus::Escaped);
    EXPECT_LT(rec.steps, Constants::Geodesic::RECORD_RESERVE);
    EXPECT_LE(rec.r.capacity(), static_cast<size_t>(Constants::Geodesic::RECORD_RESERVE));
    EXPECT_LE(rec.nullError.capacity(), static_cast<size_t>(Constants::Geodesic::RECORD_RESERVE));
}

TEST_F(HamiltonianIntegratorTests, RadialInfallIsCaptured) {
    IntegratorConfig fine;
    fine.stepSize = 0.01;
    HamiltonianGeodesicIntegrator fineIntegrator(*kerr, fine);

    // Forbidden L forces p_φ = 0: pure radial infall
    const PhotonStateD s = fineIntegrator.initializePhoton(20.0, MathConst::HALF_PI, 0.0, 1.0, 100.0);
    const TrajectoryRecord rec = fineIntegrator.trace(s, 5000);

    EXPECT_EQ(rec.status, TraceStatus::Captured);
    EXPECT_LT(rec.r.back(), fineIntegrator.captureRadius());
    EXPECT_GT(rec.r.back(), kerr->horizonRadius());
}

TEST_F(HamiltonianIntegratorTests, StatusAlwaysFromFixedSet) {
    const double angularMomenta[] = {-6.0, -1.0, 0.5, 2.0, 4.0, 8.0};
    for (double L : angularMomenta) {
        const PhotonStateD s = integrator->initializePhoton(20.0, MathConst::HALF_PI, 0.0, 1.0, L);
        const TrajectoryRecord rec = integrator->trace(s, 300);
        EXPECT_TRUE(isKnownStatus(rec.status)) << "L=" << L;
        EXPECT_LE(rec.steps, 300) << "L=" << L;
        EXPECT_EQ(rec.steps, static_cast<int>(rec.phi.size()));
    }
}

TEST_F(HamiltonianIntegratorTests, PerturbationChangesTrajectory) {
    const PhotonStateD s = integrator->initializePhoton(20.0, MathConst::HALF_PI, 0.0, 1.0, 5.0);
    const PerturbationSet one{MassPerturbation(8.0, MathConst::HALF_PI, MathConst::QUARTER_PI, 0.5)};

    const TrajectoryRecord base = integrator->trace(s, 200);
    const TrajectoryRecord pert = integrator->trace(s, 200, one);

    ASSERT_FALSE(base.empty());
    ASSERT_FALSE(pert.empty());
    const bool differs = base.steps != pert.steps ||
                         std::abs(base.r.back() - pert.r.back()) > 1e-9 ||
                         std::abs(base.phi.back() - pert.phi.back()) > 1e-9;
    EXPECT_TRUE(differs);
}

TEST_F(HamiltonianIntegratorTests, StatusNames) {
    EXPECT_STREQ(statusName(TraceStatus::Captured), "captured");
    EXPECT_STREQ(statusName(TraceStatus::Escaped), "escaped");
    EXPECT_STREQ(statusName(TraceStatus::MaxSteps), "max_steps");
    EXPECT_STREQ(statusName(TraceStatus::NumericalError), "numerical_error");
    EXPECT_STREQ(statusName(TraceStatus::ConstraintWarning), "constraint_warning");
}

} // namespace umbra::test
