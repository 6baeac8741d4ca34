// =============================================================================
// PHCN001A.h - Unified Numerical Constants and Tolerances
// Component ID: PHCN001A (Physics/Constants)
// =============================================================================
//
// PURPOSE:
// Centralizes the numerical floors, tolerances and simulation defaults used by
// the spacetime model, the perturbation model, the integrator and the beam
// orchestrator. Configuration defaults (CRCF003A) and test tolerances
// (TSFT001A) are derived from these values.
//
// UNITS:
// Geometric units throughout (G = c = 1). Radii are in units of the central
// mass M; the affine parameter λ is dimensionless.
//
// TESTS: All tolerance values exercised by the TSPH/TSGD/TSDG tests
// =============================================================================

#ifndef PHCN001A_H
#define PHCN001A_H

#include <cmath>
#include <limits>

namespace Umbra {
namespace Constants {

// =============================================================================
// Sentinels
// =============================================================================

/// @brief Quiet NaN used for "unavailable" statistics
constexpr double NOT_AVAILABLE = std::numeric_limits<double>::quiet_NaN();

// =============================================================================
// Spacetime Model
// =============================================================================

namespace Metric {

/// @brief Default signed floor substituted for near-zero Δ and sin²θ
constexpr double DEFAULT_EPSILON = 1e-12;

/// @brief Fraction of M an over-extremal spin is clamped to: |a| → 0.99 M
constexpr double SPIN_CLAMP_FRACTION = 0.99;

} // namespace Metric

// =============================================================================
// Numerical Differentiation of the Hamiltonian
// =============================================================================

namespace Differentiation {

/// @brief Default coordinate step for ∂H/∂r and ∂H/∂θ
constexpr double DEFAULT_STEP = 1e-5;

} // namespace Differentiation

// =============================================================================
// Geodesic Integration
// =============================================================================

namespace Geodesic {

/// @brief Fixed RK4 step in affine parameter
constexpr double DEFAULT_STEP_SIZE = 0.05;

/// @brief Default per-ray step budget
constexpr int DEFAULT_MAX_STEPS = 1500;

/// @brief Soft null-constraint tolerance: |H| above this flags the ray
constexpr double NULL_TOLERANCE = 1e-2;

/// @brief Escape radius in units of M
constexpr double MAX_RADIUS_FACTOR = 50.0;

/// @brief Capture when r < r_+ · CAPTURE_MARGIN
constexpr double CAPTURE_MARGIN = 1.05;

/// @brief Upper bound on the points reserved up front for one trajectory
constexpr int RECORD_RESERVE = 4096;

} // namespace Geodesic

// =============================================================================
// Photon Initialisation
// =============================================================================

namespace Initialisation {

/// @brief |g^rr| below this makes the radial direction degenerate
constexpr double RADIAL_DEGENERACY_TOL = 1e-12;

/// @brief p_r² may be this negative before the null condition is declared unsolvable
constexpr double NEGATIVE_PR2_TOL = 1e-10;

/// @brief p_φ used by initializePhoton when no angular momentum is requested
constexpr double DEFAULT_ANGULAR_MOMENTUM = 4.0;

} // namespace Initialisation

// =============================================================================
// Point-Mass Perturbation
// =============================================================================

namespace Perturbation {

/// @brief Force scale applied to the softened inverse-square law
constexpr double DEFAULT_FORCE_SCALE = 100.0;

/// @brief Default softening length (floor on photon-mass distance)
constexpr double DEFAULT_SOFTENING = 0.1;

/// @brief Default mass of an added perturbation
constexpr double DEFAULT_MASS = 0.1;

/// @brief Floor on r and sinθ when converting linear force to momentum units
constexpr double DEFAULT_EPSILON = 1e-9;

} // namespace Perturbation

// =============================================================================
// Beam Defaults
// =============================================================================

namespace Beam {

constexpr double DEFAULT_START_X = 20.0;
constexpr double DEFAULT_WIDTH = 15.0;
constexpr int DEFAULT_RAYS = 30;
constexpr double DEFAULT_ENERGY = 1.0;

} // namespace Beam

// =============================================================================
// Mathematical Constants
// =============================================================================

namespace Math {

constexpr double PI = 3.14159265358979323846;
constexpr double HALF_PI = PI / 2.0;
constexpr double QUARTER_PI = PI / 4.0;

} // namespace Math

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Replace a near-zero value by a floor carrying the value's sign
/// Keeps 1/x continuous in sign across the floor (Δ near the horizon).
inline double signedFloor(double value, double floor) {
    if (std::abs(value) < floor) {
        return std::copysign(floor, value);
    }
    return value;
}

} // namespace Constants
} // namespace Umbra

#endif // PHCN001A_H
