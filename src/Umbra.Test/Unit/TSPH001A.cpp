// TSPH001A.cpp - Kerr Spacetime Tests
// Tests for PHMT100B KerrSpacetimeD
// Verifies: spin clamp, horizon/ergosphere, inverse metric identity,
// Hamiltonian derivatives and the signed-floor guards.

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <limits>
#include <stdexcept>
#include "../TSFT001A.h"
#include <PHMT100B.h>

namespace umbra::test {

// =============================================================================
// Test Fixture
// =============================================================================

class KerrSpacetimeTests : public ::testing::Test {
protected:
    // Max |g^μα g_αν - δ^μ_ν| over the non-zero block structure
    static double inverseResidual(const MetricComponents& g, const MetricComponents& gi) {
        const double tt = g.tt * gi.tt + g.tphi * gi.tphi - 1.0;
        const double tphi = g.tt * gi.tphi + g.tphi * gi.phiphi;
        const double phit = g.tphi * gi.tt + g.phiphi * gi.tphi;
        const double phiphi = g.tphi * gi.tphi + g.phiphi * gi.phiphi - 1.0;
        const double rr = g.rr * gi.rr - 1.0;
        const double thth = g.thth * gi.thth - 1.0;

        double worst = 0.0;
        for (double v : {tt, tphi, phit, phiphi, rr, thth}) {
            worst = std::max(worst, std::abs(v));
        }
        return worst;
    }

    // Schwarzschild equatorial ∂H/∂r in closed form
    static double schwarzschildDHdr(double r, double E, double pr, double L) {
        const double f = 1.0 - 2.0 / r;
        const double df = 2.0 / (r * r);
        return E * E * df / (2.0 * f * f) + 0.5 * df * pr * pr - L * L / (r * r * r);
    }
};

// =============================================================================
// Construction
// =============================================================================

TEST_F(KerrSpacetimeTests, SubExtremalSpinKept) {
    KerrSpacetimeD kerr(1.0, 0.5);
    EXPECT_DOUBLE_EQ(kerr.spin(), 0.5);
    EXPECT_DOUBLE_EQ(kerr.requestedSpin(), 0.5);
    EXPECT_FALSE(kerr.spinWasClamped());
}

TEST_F(KerrSpacetimeTests, OverExtremalSpinClamped) {
    KerrSpacetimeD kerr(1.0, 1.5);
    EXPECT_DOUBLE_EQ(kerr.spin(), 0.99);
    EXPECT_DOUBLE_EQ(kerr.requestedSpin(), 1.5);
    EXPECT_TRUE(kerr.spinWasClamped());

    KerrSpacetimeD retrograde(2.0, -5.0);
    EXPECT_DOUBLE_EQ(retrograde.spin(), -1.98)
        << "Clamp keeps the sign of the requested spin";
}

TEST_F(KerrSpacetimeTests, EffectiveSpinNeverExceedsMass) {
    const double masses[] = {0.5, 1.0, 3.0};
    const double spins[] = {-10.0, -1.0, -0.3, 0.0, 0.7, 1.0, 1.0001, 42.0};

    for (double M : masses) {
        for (double a : spins) {
            KerrSpacetimeD kerr(M, a);
            EXPECT_LE(std::abs(kerr.spin()), M) << "M=" << M << " a=" << a;

            const double rPlus = kerr.horizonRadius();
            EXPECT_TRUE(std::isfinite(rPlus)) << "M=" << M << " a=" << a;
            EXPECT_GE(rPlus, 0.0);
            EXPECT_NEAR(rPlus, M + std::sqrt(M * M - kerr.spin() * kerr.spin()),
                        Tolerances::GENERAL_DOUBLE);
        }
    }
}

TEST_F(KerrSpacetimeTests, NonPositiveMassRejected) {
    EXPECT_THROW(KerrSpacetimeD(0.0, 0.0), std::invalid_argument);
    EXPECT_THROW(KerrSpacetimeD(-1.0, 0.5), std::invalid_argument);
}

TEST_F(KerrSpacetimeTests, NonFiniteSpinRejected) {
    EXPECT_THROW(KerrSpacetimeD(1.0, std::nan("")), std::invalid_argument);
    EXPECT_THROW(KerrSpacetimeD(1.0, std::numeric_limits<double>::infinity()), std::invalid_argument);
}

TEST_F(KerrSpacetimeTests, EpsilonMustBePositive) {
    EXPECT_THROW(KerrSpacetimeD(1.0, 0.5, 0.0), std::invalid_argument);

    KerrSpacetimeD kerr(1.0, 0.5);
    EXPECT_THROW(kerr.setEpsilon(-1e-12), std::invalid_argument);
    kerr.setEpsilon(1e-9);
    EXPECT_DOUBLE_EQ(kerr.epsilon(), 1e-9);
}

TEST_F(KerrSpacetimeTests, NameReflectsSpin) {
    EXPECT_STREQ(KerrSpacetimeD(1.0, 0.0).getName(), "Schwarzschild");
    EXPECT_STREQ(KerrSpacetimeD(1.0, 0.9).getName(), "Kerr");
}

// =============================================================================
// Horizon and Ergosphere
// =============================================================================

TEST_F(KerrSpacetimeTests, SchwarzschildHorizon) {
    KerrSpacetimeD schw(1.0, 0.0);
    EXPECT_NEAR(schw.horizonRadius(), PhysicalRef::HORIZON_SCHWARZSCHILD, Tolerances::GENERAL_DOUBLE);
    EXPECT_NEAR(schw.ergosphereRadius(MathConst::QUARTER_PI), 2.0, Tolerances::GENERAL_DOUBLE)
        << "Static limit coincides with the horizon without rotation";
}

TEST_F(KerrSpacetimeTests, KerrHorizonAndErgosphere) {
    KerrSpacetimeD kerr(1.0, 0.9);
    EXPECT_NEAR(kerr.horizonRadius(), PhysicalRef::HORIZON_KERR_09, Tolerances::GENERAL_DOUBLE);

    // Equator: r_ergo = 2M; pole: r_ergo = r+
    EXPECT_NEAR(kerr.ergosphereRadius(MathConst::HALF_PI), 2.0, Tolerances::GENERAL_DOUBLE);
    EXPECT_NEAR(kerr.ergosphereRadius(0.0), kerr.horizonRadius(), Tolerances::GENERAL_DOUBLE);

    for (double theta : MathConst::TEST_ANGLES) {
        EXPECT_GE(kerr.ergosphereRadius(theta), kerr.horizonRadius() - Tolerances::GENERAL_DOUBLE)
            << "theta=" << theta;
    }
}

// =============================================================================
// Metric Components
// =============================================================================

TEST_F(KerrSpacetimeTests, HelperScalars) {
    KerrSpacetimeD kerr(1.0, 0.9);
    const double r = 5.0, theta = 1.0;
    const MetricComponents g = kerr.metricComponents(r, theta);

    const double cos_th = std::cos(theta);
    EXPECT_NEAR(g.Sigma, r * r + 0.81 * cos_th * cos_th, Tolerances::GENERAL_DOUBLE);
    EXPECT_NEAR(g.Delta, r * r - 2.0 * r + 0.81, Tolerances::GENERAL_DOUBLE);
    EXPECT_DOUBLE_EQ(g.thth, g.Sigma);
}

TEST_F(KerrSpacetimeTests, InverseIdentityAwayFromSingularities) {
    for (double a : MathConst::TEST_SPINS) {
        KerrSpacetimeD kerr(1.0, a);
        for (double r : MathConst::TEST_RADII) {
            for (double theta : MathConst::TEST_ANGLES) {
                const MetricComponents g = kerr.metricComponents(r, theta);
                const MetricComponents gi = kerr.inverseMetricComponents(r, theta);
                EXPECT_LT(inverseResidual(g, gi), Tolerances::INVERSE_METRIC)
                    << "a=" << a << " r=" << r << " theta=" << theta;
            }
        }
    }
}

TEST_F(KerrSpacetimeTests, LorentzianSignatureOutsideErgosphere) {
    KerrSpacetimeD kerr(1.0, 0.9);
    const MetricComponents g = kerr.metricComponents(10.0, 1.2);
    EXPECT_LT(g.tt, 0.0);
    EXPECT_GT(g.rr, 0.0);
    EXPECT_GT(g.thth, 0.0);
    EXPECT_GT(g.phiphi, 0.0);
    EXPECT_LT(g.tphi, 0.0) << "Frame dragging for a > 0";
}

// =============================================================================
// Signed Floor Guards
// =============================================================================

TEST_F(KerrSpacetimeTests, FiniteOnHorizon) {
    // Δ(2M) = 0 exactly for Schwarzschild
    KerrSpacetimeD schw(1.0, 0.0);
    const MetricComponents g = schw.metricComponents(2.0, MathConst::HALF_PI);
    const MetricComponents gi = schw.inverseMetricComponents(2.0, MathConst::HALF_PI);

    EXPECT_DOUBLE_EQ(g.Delta, 0.0);
    EXPECT_TRUE(std::isfinite(g.rr));
    EXPECT_TRUE(std::isfinite(gi.tt));
    EXPECT_TRUE(std::isfinite(gi.phiphi));
}

TEST_F(KerrSpacetimeTests, FiniteOnAxis) {
    KerrSpacetimeD kerr(1.0, 0.9);
    const MetricComponents gi = kerr.inverseMetricComponents(6.0, 0.0);
    EXPECT_TRUE(std::isfinite(gi.phiphi));
    EXPECT_TRUE(std::isfinite(gi.tt));
    EXPECT_GT(gi.phiphi, 0.0);
}

TEST_F(KerrSpacetimeTests, FloorPreservesSignOfDelta) {
    // Between the horizons Δ < 0, so g^tt flips sign relative to outside
    KerrSpacetimeD kerr(1.0, 0.9);
    const double rInside = 1.0;  // r- < 1 < r+
    const MetricComponents inside = kerr.inverseMetricComponents(rInside, MathConst::HALF_PI);
    const MetricComponents outside = kerr.inverseMetricComponents(10.0, MathConst::HALF_PI);

    EXPECT_LT(inside.Delta, 0.0);
    EXPECT_LT(outside.tt, 0.0);
    EXPECT_GT(inside.tt, 0.0);
    EXPECT_LT(inside.rr, 0.0);
}

// =============================================================================
// Hamiltonian Flow
// =============================================================================

TEST_F(KerrSpacetimeTests, CyclicMomentaHaveZeroDerivative) {
    KerrSpacetimeD kerr(1.0, 0.9);
    PhotonStateD state(Vec4d(0.0, 7.0, 1.1, 0.3), Vec4d(-1.0, -0.4, 0.2, 2.5));

    const PhotonStateD d = kerr.derivatives(state);
    EXPECT_EQ(d.p.t, 0.0);
    EXPECT_EQ(d.p.phi, 0.0);
}

TEST_F(KerrSpacetimeTests, PositionDerivativesRaiseMomentum) {
    KerrSpacetimeD kerr(1.0, 0.7);
    PhotonStateD state(Vec4d(0.0, 9.0, 1.3, 0.0), Vec4d(-1.0, 0.3, -0.5, 3.0));
    const MetricComponents gi = kerr.inverseMetricComponents(9.0, 1.3);

    const PhotonStateD d = kerr.derivatives(state);
    EXPECT_NEAR(d.x.t, gi.tt * -1.0 + gi.tphi * 3.0, Tolerances::GENERAL_DOUBLE);
    EXPECT_NEAR(d.x.r, gi.rr * 0.3, Tolerances::GENERAL_DOUBLE);
    EXPECT_NEAR(d.x.theta, gi.thth * -0.5, Tolerances::GENERAL_DOUBLE);
    EXPECT_NEAR(d.x.phi, gi.tphi * -1.0 + gi.phiphi * 3.0, Tolerances::GENERAL_DOUBLE);
}

TEST_F(KerrSpacetimeTests, RadialForceMatchesSchwarzschildClosedForm) {
    KerrSpacetimeD schw(1.0, 0.0);
    const double r = 10.0, E = 1.0, pr = -0.5, L = 3.0;
    PhotonStateD state(Vec4d(0.0, r, MathConst::HALF_PI, 0.0), Vec4d(-E, pr, 0.0, L));

    const PhotonStateD d = schw.derivatives(state);
    EXPECT_NEAR(d.p.r, -schwarzschildDHdr(r, E, pr, L), Tolerances::GRADIENT);
    EXPECT_NEAR(d.p.theta, 0.0, Tolerances::GRADIENT)
        << "Equatorial reflection symmetry: ∂H/∂θ = 0 at θ = π/2";
}

TEST_F(KerrSpacetimeTests, RichardsonAgreesWithCentral) {
    DifferencingConfig richardson;
    richardson.scheme = DifferenceScheme::Richardson;
    richardson.step = 1e-3;

    KerrSpacetimeD central(1.0, 0.9);
    KerrSpacetimeD fourthOrder(1.0, 0.9, Constants::Metric::DEFAULT_EPSILON, richardson);

    const Vec4d p(-1.0, -0.3, 0.4, 2.0);
    EXPECT_NEAR(central.dHdr(6.0, 1.2, p), fourthOrder.dHdr(6.0, 1.2, p), Tolerances::GRADIENT);
    EXPECT_NEAR(central.dHdtheta(6.0, 1.2, p), fourthOrder.dHdtheta(6.0, 1.2, p), Tolerances::GRADIENT);
    EXPECT_EQ(fourthOrder.differencing().scheme, DifferenceScheme::Richardson);
}

TEST_F(KerrSpacetimeTests, NullConstraintIsHamiltonian) {
    KerrSpacetimeD kerr(1.0, 0.9);
    const Vec4d p(-1.0, 0.2, 0.1, 1.5);
    PhotonStateD state(Vec4d(0.0, 12.0, 0.9, 2.0), p);
    EXPECT_DOUBLE_EQ(kerr.nullConstraint(state), kerr.hamiltonian(12.0, 0.9, p));
}

} // namespace umbra::test
