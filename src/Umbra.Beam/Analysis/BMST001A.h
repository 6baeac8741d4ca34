// =============================================================================
// BMST001A.h - Beam Statistics
// Component ID: BMST001A (Beam/Analysis/Statistics)
// =============================================================================
//
// PURPOSE:
// Aggregate statistics over a set of trajectory records, and ray-by-ray
// comparison of two beams matched by ray index.
//
// DEFINITIONS:
//   deflection(ray) = φ_final - φ_initial   (φ_initial from beam tagging,
//                                            else the first recorded φ)
//   Δ(ray) = |deflection_perturbed| - |deflection_baseline|
//
// All functions are total: empty or degenerate input yields 0 for counts and
// fractions and quiet NaN for statistics with no finite samples.
//
// TESTS: TSBM002A.cpp
// =============================================================================

#ifndef BMST001A_H
#define BMST001A_H

#include <PHGD000A.h>

#include <map>
#include <string>
#include <vector>

namespace Umbra {

// =============================================================================
// Summary
// =============================================================================

struct BeamSummary {
    int totalRays = 0;

    double capturedFraction = 0.0;
    double escapedFraction = 0.0;
    double maxStepsFraction = 0.0;
    double numericalErrorFraction = 0.0;
    double constraintWarningFraction = 0.0;
    double constraintViolationFraction = 0.0;   ///< Rays with the soft flag set

    double meanAbsDeflection = Constants::NOT_AVAILABLE;
    double maxAbsDeflection = Constants::NOT_AVAILABLE;
    double meanSignedDeflection = Constants::NOT_AVAILABLE;

    double meanSteps = Constants::NOT_AVAILABLE;
    double meanProperTime = Constants::NOT_AVAILABLE;
    double meanNullError = Constants::NOT_AVAILABLE;
    double meanFinalNullError = Constants::NOT_AVAILABLE;
    double maxNullError = Constants::NOT_AVAILABLE;

    /// @brief Fraction of rays with the given terminal status
    double fraction(TraceStatus status) const;

    /// @brief Statistic name → value, using the snake_case report keys
    std::map<std::string, double> asMap() const;
};

// =============================================================================
// Comparison
// =============================================================================

struct BeamComparison {
    int commonRays = 0;
    double meanDeltaAbsDeflection = Constants::NOT_AVAILABLE;
    double maxDeltaAbsDeflection = Constants::NOT_AVAILABLE;   ///< max |Δ|
    double capturedDelta = Constants::NOT_AVAILABLE;           ///< perturbed - baseline
    double escapedDelta = Constants::NOT_AVAILABLE;

    std::map<std::string, double> asMap() const;
};

/// @brief One matched ray in a comparison
struct PerRayDelta {
    int rayIndex = 0;
    double initialY = Constants::NOT_AVAILABLE;
    TraceStatus baselineStatus = TraceStatus::MaxSteps;
    TraceStatus perturbedStatus = TraceStatus::MaxSteps;
    double baselineAbsDeflection = Constants::NOT_AVAILABLE;
    double perturbedAbsDeflection = Constants::NOT_AVAILABLE;
    double deltaAbsDeflection = Constants::NOT_AVAILABLE;     ///< NaN unless both are finite
};

// =============================================================================
// Functions
// =============================================================================

/// @brief Net azimuthal change of a ray; NaN for an empty record
double deflectionAngle(const TrajectoryRecord& record);

BeamSummary summarizeTrajectories(const std::vector<TrajectoryRecord>& records);

/// @brief Compare two beams over the ray indices present in both
/// Untagged records are ignored; for duplicate indices the last record wins.
BeamComparison compareTrajectorySets(const std::vector<TrajectoryRecord>& baseline,
                                     const std::vector<TrajectoryRecord>& perturbed);

/// @brief Matched rays in ascending index order
std::vector<PerRayDelta> perRayDeltas(const std::vector<TrajectoryRecord>& baseline,
                                      const std::vector<TrajectoryRecord>& perturbed);

/// @brief The n rows with finite Δ and the largest |Δ|, largest first
std::vector<PerRayDelta> topRayDeltas(const std::vector<PerRayDelta>& rows, size_t n);

} // namespace Umbra

#endif // BMST001A_H
