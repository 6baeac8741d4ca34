// =============================================================================
// PHGD000A.h - Geodesic Integration Types
// Component ID: PHGD000A (Physics/Geodesic/Types)
// =============================================================================
//
// PURPOSE:
// Configuration, termination classification and trajectory record shared by
// the Hamiltonian integrator (PHGD002A) and the beam layer (BMOR001A,
// BMST001A).
//
// TERMINATION:
//   running ──► Captured          r < r_+ · captureMargin
//          ├──► Escaped           r > maxRadiusFactor · M
//          ├──► NumericalError    non-finite state at the top of a step
//          └──► MaxSteps          step budget exhausted
//                 └──► ConstraintWarning  if |H| ever exceeded nullTolerance
//
// TESTS: TSGD001A.cpp, TSDG001A.cpp
// =============================================================================

#ifndef PHGD000A_H
#define PHGD000A_H

#include "../Transport/MTTP001A.h"
#include <PHCN001A.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Umbra {

// =============================================================================
// Integration Configuration
// =============================================================================

/// @brief Configuration for fixed-step Hamiltonian integration
struct IntegratorConfig {
    double stepSize = Constants::Geodesic::DEFAULT_STEP_SIZE;        ///< Affine step h
    double nullTolerance = Constants::Geodesic::NULL_TOLERANCE;      ///< Soft |H| limit
    double maxRadiusFactor = Constants::Geodesic::MAX_RADIUS_FACTOR; ///< Escape at r > factor·M
    double captureMargin = Constants::Geodesic::CAPTURE_MARGIN;      ///< Capture at r < r_+·margin
};

// =============================================================================
// Termination Status
// =============================================================================

enum class TraceStatus {
    Captured,           ///< Fell inside the capture radius
    Escaped,            ///< Left the escape radius
    MaxSteps,           ///< Step budget exhausted
    NumericalError,     ///< Non-finite state encountered
    ConstraintWarning   ///< MaxSteps with the null constraint violated at some step
};

constexpr int TRACE_STATUS_COUNT = 5;

/// @brief Stable lower-case name ("captured", "escaped", "max_steps", ...)
inline const char* statusName(TraceStatus status) {
    switch (status) {
        case TraceStatus::Captured:          return "captured";
        case TraceStatus::Escaped:           return "escaped";
        case TraceStatus::MaxSteps:          return "max_steps";
        case TraceStatus::NumericalError:    return "numerical_error";
        case TraceStatus::ConstraintWarning: return "constraint_warning";
    }
    return "unknown";
}

// =============================================================================
// Trajectory Record
// =============================================================================

/// @brief Output of one trace; immutable once returned
///
/// One entry per recorded step in t/r/theta/phi/nullError, in temporal order.
/// Null-error statistics are NaN when nothing was recorded.
struct TrajectoryRecord {
    std::vector<double> t;
    std::vector<double> r;
    std::vector<double> theta;
    std::vector<double> phi;
    std::vector<double> nullError;     ///< |H| at each recorded point

    TraceStatus status = TraceStatus::MaxSteps;
    int steps = 0;                     ///< Number of recorded points
    double properTime = 0.0;           ///< steps · h

    double initialNullError = Constants::NOT_AVAILABLE;
    double finalNullError = Constants::NOT_AVAILABLE;
    double meanNullError = Constants::NOT_AVAILABLE;
    double maxNullError = 0.0;         ///< Over finite entries only
    bool constraintViolated = false;

    PhotonStateD finalState;           ///< State at termination

    // Beam tagging (set by BMOR001A)
    std::optional<int> rayIndex;
    double initialY = Constants::NOT_AVAILABLE;
    double initialPhi = Constants::NOT_AVAILABLE;

    bool empty() const { return phi.empty(); }
};

// =============================================================================
// Photon Initialisation
// =============================================================================

enum class RadialDirection {
    Inward = -1,
    Outward = 1
};

/// @brief Raised when no real null momentum exists for the requested photon
class InitializationError : public std::runtime_error {
public:
    explicit InitializationError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace Umbra

#endif // PHGD000A_H
