// =============================================================================
// TSFT001A.h - Unified Test Constants and Tolerances
// Component ID: TSFT001A (Test/Fixtures/Constants)
// =============================================================================
//
// PURPOSE:
// Centralizes test tolerances and reference values by importing from
// PHCN001A.h, so tests and production code agree on every threshold.
//
// TESTS: Used by all unit, diagnostic and integration tests
// =============================================================================

#ifndef TSFT001A_H
#define TSFT001A_H

#include <PHCN001A.h>
#include <cmath>

namespace umbra::test {
using namespace Umbra;

// =============================================================================
// Tolerances
// =============================================================================

namespace Tolerances {

/// @brief Inverse metric accuracy away from Δ ≈ 0 and sinθ ≈ 0
constexpr double INVERSE_METRIC = 1e-12;

/// @brief Soft null-constraint tolerance of the integrator
constexpr double NULL_CONSTRAINT = Umbra::Constants::Geodesic::NULL_TOLERANCE;  // 1e-2

/// @brief |H| of a freshly initialised photon (pure round-off)
constexpr double INITIAL_NULL = 1e-10;

/// @brief RK4 forward/backward return: O(h⁵) local error at h = 0.05
constexpr double RK4_REVERSIBILITY = 1e-5;

/// @brief Central-difference gradient against the five-point stencil
constexpr double GRADIENT = 1e-6;

/// @brief General numerical equality tolerance (double precision)
constexpr double GENERAL_DOUBLE = 1e-12;

} // namespace Tolerances

// =============================================================================
// Reference Values
// =============================================================================

namespace PhysicalRef {

/// @brief Schwarzschild horizon radius r = 2M
constexpr double HORIZON_SCHWARZSCHILD = 2.0;

/// @brief Kerr a = 0.9, M = 1: r+ = 1 + √0.19
const double HORIZON_KERR_09 = 1.0 + std::sqrt(0.19);

} // namespace PhysicalRef

// =============================================================================
// Test Parameters
// =============================================================================

namespace MathConst {

constexpr double PI = Umbra::Constants::Math::PI;
constexpr double HALF_PI = Umbra::Constants::Math::HALF_PI;
constexpr double QUARTER_PI = Umbra::Constants::Math::QUARTER_PI;

/// @brief Polar angles away from the axis
constexpr double TEST_ANGLES[] = {PI/6, PI/4, PI/3, HALF_PI, 2*PI/3, 3*PI/4};

/// @brief Radii well outside the horizon for every test spin (units of M)
constexpr double TEST_RADII[] = {3.0, 5.0, 6.0, 10.0, 20.0, 45.0};

/// @brief Spin parameters for Kerr tests
constexpr double TEST_SPINS[] = {0.0, 0.3, 0.5, 0.7, 0.9, 0.99};

} // namespace MathConst

} // namespace umbra::test

#endif // TSFT001A_H
