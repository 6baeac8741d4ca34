// TSPH002A.cpp - Point-Mass Perturbation Tests
// Tests for PHPT001A MassPerturbation and totalForce
// Verifies: inverse-square magnitude, basis projection, angular scaling,
// softening and vector summation.

#include <gtest/gtest.h>
#include <cmath>
#include "../TSFT001A.h"
#include <PHPT001A.h>

namespace umbra::test {

namespace {

PhotonStateD photonAt(double r, double theta, double phi) {
    return PhotonStateD(Vec4d(0.0, r, theta, phi), Vec4d(-1.0, -0.5, 0.0, 1.0));
}

} // namespace

// =============================================================================
// Test Fixture
// =============================================================================

class MassPerturbationTests : public ::testing::Test {
protected:
    // Mass 0.5 on the +x axis at r = 8, default scale 100 and softening 0.1
    MassPerturbation onAxis{8.0, MathConst::HALF_PI, 0.0, 0.5};
};

// =============================================================================
// Construction
// =============================================================================

TEST_F(MassPerturbationTests, DefaultsAndCachedPosition) {
    EXPECT_DOUBLE_EQ(onAxis.mass(), 0.5);
    EXPECT_DOUBLE_EQ(onAxis.forceScale(), Constants::Perturbation::DEFAULT_FORCE_SCALE);
    EXPECT_DOUBLE_EQ(onAxis.softening(), Constants::Perturbation::DEFAULT_SOFTENING);

    EXPECT_NEAR(onAxis.position().x, 8.0, Tolerances::GENERAL_DOUBLE);
    EXPECT_NEAR(onAxis.position().y, 0.0, Tolerances::GENERAL_DOUBLE);
    EXPECT_NEAR(onAxis.position().z, 0.0, Tolerances::GENERAL_DOUBLE);
}

TEST_F(MassPerturbationTests, SofteningFlooredAtEpsilon) {
    MassPerturbation p(8.0, MathConst::HALF_PI, 0.0, 0.5, 100.0, 0.0);
    EXPECT_DOUBLE_EQ(p.softening(), Constants::Perturbation::DEFAULT_EPSILON);
}

// =============================================================================
// Force
// =============================================================================

TEST_F(MassPerturbationTests, RadialAttractionOnAxis) {
    // Separation 4: strength = 100 · 0.5 / 16
    const Vec4d F = onAxis.getForce(photonAt(4.0, MathConst::HALF_PI, 0.0));

    EXPECT_EQ(F.t, 0.0);
    EXPECT_NEAR(F.r, 3.125, 1e-9) << "Outward pull toward the mass";
    EXPECT_NEAR(F.theta, 0.0, Tolerances::GENERAL_DOUBLE);
    EXPECT_NEAR(F.phi, 0.0, Tolerances::GENERAL_DOUBLE);
}

TEST_F(MassPerturbationTests, PhotonBeyondMassPulledInward) {
    const Vec4d F = onAxis.getForce(photonAt(12.0, MathConst::HALF_PI, 0.0));
    EXPECT_NEAR(F.r, -3.125, 1e-9);
}

TEST_F(MassPerturbationTests, AzimuthalComponentScaledByRadius) {
    // Mass at (4, 3, 0), photon at (4, 0, 0): separation is purely +y = e_φ
    MassPerturbation p(5.0, MathConst::HALF_PI, std::atan2(3.0, 4.0), 0.5);
    const Vec4d F = p.getForce(photonAt(4.0, MathConst::HALF_PI, 0.0));

    const double strength = 100.0 * 0.5 / 9.0;
    EXPECT_NEAR(F.r, 0.0, 1e-9);
    EXPECT_NEAR(F.phi, strength / 4.0, 1e-9) << "F_φ = F·e_φ / (r sinθ)";
    EXPECT_NEAR(F.theta, 0.0, 1e-9);
}

TEST_F(MassPerturbationTests, PolarComponentScaledByRadius) {
    // Mass directly above the photon: separation is -e_θ at the equator
    MassPerturbation p(5.0, std::atan2(4.0, 3.0), 0.0, 0.5);   // (4, 0, 3)
    const Vec4d F = p.getForce(photonAt(4.0, MathConst::HALF_PI, 0.0));

    const double strength = 100.0 * 0.5 / 9.0;
    EXPECT_NEAR(F.theta, -strength / 4.0, 1e-9);
    EXPECT_NEAR(F.r, 0.0, 1e-9);
}

TEST_F(MassPerturbationTests, SofteningCapsCloseEncounter) {
    // |diff| = 0.05 < softening: f = k m · diff / softening³
    const Vec4d F = onAxis.getForce(photonAt(7.95, MathConst::HALF_PI, 0.0));
    EXPECT_NEAR(F.r, 2500.0, 1e-6);
    EXPECT_TRUE(std::isfinite(F.r));
}

TEST_F(MassPerturbationTests, CoincidentPositionGivesZeroForce) {
    const Vec4d F = onAxis.getForce(photonAt(8.0, MathConst::HALF_PI, 0.0));
    EXPECT_EQ(F.t, 0.0);
    EXPECT_NEAR(F.r, 0.0, Tolerances::GENERAL_DOUBLE);
    EXPECT_NEAR(F.theta, 0.0, Tolerances::GENERAL_DOUBLE);
    EXPECT_NEAR(F.phi, 0.0, Tolerances::GENERAL_DOUBLE);
}

TEST_F(MassPerturbationTests, FiniteOnAxisAndAtOrigin) {
    const Vec4d onPole = onAxis.getForce(photonAt(4.0, 0.0, 0.0));
    EXPECT_TRUE(onPole.isFinite());

    const Vec4d atOrigin = onAxis.getForce(photonAt(0.0, MathConst::HALF_PI, 0.0));
    EXPECT_TRUE(atOrigin.isFinite());
}

TEST_F(MassPerturbationTests, ForceScaleIsLinear) {
    MassPerturbation weak(8.0, MathConst::HALF_PI, 0.0, 0.5, 10.0);
    const PhotonStateD photon = photonAt(4.0, MathConst::HALF_PI, 0.0);
    EXPECT_NEAR(onAxis.getForce(photon).r, 10.0 * weak.getForce(photon).r, 1e-9);
}

// =============================================================================
// Summation
// =============================================================================

TEST_F(MassPerturbationTests, TotalForceSumsContributions) {
    const PhotonStateD photon = photonAt(6.0, 1.2, 0.4);
    PerturbationSet set{onAxis, MassPerturbation(10.0, 1.0, 2.0, 0.2)};

    const Vec4d expected = onAxis.getForce(photon) + set[1].getForce(photon);
    const Vec4d total = totalForce(set, photon);
    for (int i = 0; i < 4; ++i) {
        EXPECT_NEAR(total[i], expected[i], Tolerances::GENERAL_DOUBLE) << "component " << i;
    }
}

TEST_F(MassPerturbationTests, EmptySetGivesZeroForce) {
    const Vec4d total = totalForce(PerturbationSet{}, photonAt(6.0, 1.2, 0.4));
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(total[i], 0.0);
    }
}

} // namespace umbra::test
