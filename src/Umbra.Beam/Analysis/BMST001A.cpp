// BMST001A.cpp - Beam Statistics Implementation
#include "BMST001A.h"

#include <algorithm>
#include <cmath>

namespace Umbra {

namespace {

/// Mean over finite samples; NaN if there are none
double nanMean(const std::vector<double>& values) {
    double sum = 0.0;
    size_t count = 0;
    for (double v : values) {
        if (std::isfinite(v)) {
            sum += v;
            ++count;
        }
    }
    return count > 0 ? sum / static_cast<double>(count) : Constants::NOT_AVAILABLE;
}

/// Max over finite samples; NaN if there are none
double nanMax(const std::vector<double>& values) {
    double best = Constants::NOT_AVAILABLE;
    for (double v : values) {
        if (std::isfinite(v) && !(v <= best)) {
            best = v;
        }
    }
    return best;
}

std::map<int, const TrajectoryRecord*> indexByRay(const std::vector<TrajectoryRecord>& records) {
    std::map<int, const TrajectoryRecord*> byRay;
    for (const auto& record : records) {
        if (record.rayIndex) {
            byRay[*record.rayIndex] = &record;
        }
    }
    return byRay;
}

/// Matched pairs in ascending ray index
std::vector<std::pair<const TrajectoryRecord*, const TrajectoryRecord*>>
matchRays(const std::vector<TrajectoryRecord>& baseline,
          const std::vector<TrajectoryRecord>& perturbed) {
    const auto baseMap = indexByRay(baseline);
    const auto pertMap = indexByRay(perturbed);

    std::vector<std::pair<const TrajectoryRecord*, const TrajectoryRecord*>> pairs;
    for (const auto& [index, base] : baseMap) {
        auto it = pertMap.find(index);
        if (it != pertMap.end()) {
            pairs.emplace_back(base, it->second);
        }
    }
    return pairs;
}

} // namespace

// =============================================================================
// Deflection
// =============================================================================

double deflectionAngle(const TrajectoryRecord& record) {
    if (record.phi.empty()) {
        return Constants::NOT_AVAILABLE;
    }
    const double initialPhi = std::isnan(record.initialPhi) ? record.phi.front() : record.initialPhi;
    return record.phi.back() - initialPhi;
}

// =============================================================================
// Summary
// =============================================================================

double BeamSummary::fraction(TraceStatus status) const {
    switch (status) {
        case TraceStatus::Captured:          return capturedFraction;
        case TraceStatus::Escaped:           return escapedFraction;
        case TraceStatus::MaxSteps:          return maxStepsFraction;
        case TraceStatus::NumericalError:    return numericalErrorFraction;
        case TraceStatus::ConstraintWarning: return constraintWarningFraction;
    }
    return 0.0;
}

std::map<std::string, double> BeamSummary::asMap() const {
    return {
        {"total_rays", static_cast<double>(totalRays)},
        {"captured_fraction", capturedFraction},
        {"escaped_fraction", escapedFraction},
        {"max_steps_fraction", maxStepsFraction},
        {"numerical_error_fraction", numericalErrorFraction},
        {"constraint_warning_fraction", constraintWarningFraction},
        {"constraint_violation_fraction", constraintViolationFraction},
        {"mean_abs_deflection", meanAbsDeflection},
        {"max_abs_deflection", maxAbsDeflection},
        {"mean_signed_deflection", meanSignedDeflection},
        {"mean_steps", meanSteps},
        {"mean_proper_time", meanProperTime},
        {"mean_null_error", meanNullError},
        {"mean_final_null_error", meanFinalNullError},
        {"max_null_error", maxNullError},
    };
}

BeamSummary summarizeTrajectories(const std::vector<TrajectoryRecord>& records) {
    BeamSummary summary;
    if (records.empty()) {
        return summary;
    }

    const size_t total = records.size();
    summary.totalRays = static_cast<int>(total);

    int counts[TRACE_STATUS_COUNT] = {0, 0, 0, 0, 0};
    int violations = 0;

    std::vector<double> deflections, absDeflections;
    std::vector<double> steps, properTimes, meanNullErrors, finalNullErrors, maxNullErrors;
    deflections.reserve(total);
    steps.reserve(total);
    properTimes.reserve(total);
    meanNullErrors.reserve(total);
    finalNullErrors.reserve(total);
    maxNullErrors.reserve(total);

    for (const auto& record : records) {
        counts[static_cast<int>(record.status)]++;
        if (record.constraintViolated) {
            violations++;
        }

        const double deflection = deflectionAngle(record);
        deflections.push_back(deflection);
        if (std::isfinite(deflection)) {
            absDeflections.push_back(std::abs(deflection));
        }

        steps.push_back(static_cast<double>(record.steps));
        properTimes.push_back(record.properTime);
        meanNullErrors.push_back(record.meanNullError);
        finalNullErrors.push_back(record.finalNullError);
        maxNullErrors.push_back(record.maxNullError);
    }

    const double n = static_cast<double>(total);
    summary.capturedFraction = counts[static_cast<int>(TraceStatus::Captured)] / n;
    summary.escapedFraction = counts[static_cast<int>(TraceStatus::Escaped)] / n;
    summary.maxStepsFraction = counts[static_cast<int>(TraceStatus::MaxSteps)] / n;
    summary.numericalErrorFraction = counts[static_cast<int>(TraceStatus::NumericalError)] / n;
    summary.constraintWarningFraction = counts[static_cast<int>(TraceStatus::ConstraintWarning)] / n;
    summary.constraintViolationFraction = violations / n;

    summary.meanAbsDeflection = nanMean(absDeflections);
    summary.maxAbsDeflection = nanMax(absDeflections);
    summary.meanSignedDeflection = nanMean(deflections);

    summary.meanSteps = nanMean(steps);
    summary.meanProperTime = nanMean(properTimes);
    summary.meanNullError = nanMean(meanNullErrors);
    summary.meanFinalNullError = nanMean(finalNullErrors);
    summary.maxNullError = nanMax(maxNullErrors);

    return summary;
}

// =============================================================================
// Comparison
// =============================================================================

std::map<std::string, double> BeamComparison::asMap() const {
    return {
        {"common_rays", static_cast<double>(commonRays)},
        {"mean_delta_abs_deflection", meanDeltaAbsDeflection},
        {"max_delta_abs_deflection", maxDeltaAbsDeflection},
        {"captured_delta", capturedDelta},
        {"escaped_delta", escapedDelta},
    };
}

BeamComparison compareTrajectorySets(const std::vector<TrajectoryRecord>& baseline,
                                     const std::vector<TrajectoryRecord>& perturbed) {
    BeamComparison comparison;

    const auto pairs = matchRays(baseline, perturbed);
    if (pairs.empty()) {
        return comparison;
    }

    std::vector<double> deltas;
    std::vector<double> absDeltas;
    int capturedBase = 0, capturedPert = 0;
    int escapedBase = 0, escapedPert = 0;

    for (const auto& [base, pert] : pairs) {
        const double dBase = std::abs(deflectionAngle(*base));
        const double dPert = std::abs(deflectionAngle(*pert));
        if (std::isfinite(dBase) && std::isfinite(dPert)) {
            deltas.push_back(dPert - dBase);
            absDeltas.push_back(std::abs(dPert - dBase));
        }
        capturedBase += base->status == TraceStatus::Captured;
        capturedPert += pert->status == TraceStatus::Captured;
        escapedBase += base->status == TraceStatus::Escaped;
        escapedPert += pert->status == TraceStatus::Escaped;
    }

    const double matched = static_cast<double>(pairs.size());
    comparison.commonRays = static_cast<int>(pairs.size());
    comparison.meanDeltaAbsDeflection = nanMean(deltas);
    comparison.maxDeltaAbsDeflection = nanMax(absDeltas);
    comparison.capturedDelta = capturedPert / matched - capturedBase / matched;
    comparison.escapedDelta = escapedPert / matched - escapedBase / matched;
    return comparison;
}

std::vector<PerRayDelta> perRayDeltas(const std::vector<TrajectoryRecord>& baseline,
                                      const std::vector<TrajectoryRecord>& perturbed) {
    std::vector<PerRayDelta> rows;
    for (const auto& [base, pert] : matchRays(baseline, perturbed)) {
        PerRayDelta row;
        row.rayIndex = *base->rayIndex;
        // The perturbed run's aiming offset wins when it carries one
        row.initialY = std::isnan(pert->initialY) ? base->initialY : pert->initialY;
        row.baselineStatus = base->status;
        row.perturbedStatus = pert->status;

        const double dBase = std::abs(deflectionAngle(*base));
        const double dPert = std::abs(deflectionAngle(*pert));
        if (std::isfinite(dBase)) row.baselineAbsDeflection = dBase;
        if (std::isfinite(dPert)) row.perturbedAbsDeflection = dPert;
        if (std::isfinite(dBase) && std::isfinite(dPert)) {
            row.deltaAbsDeflection = dPert - dBase;
        }
        rows.push_back(row);
    }
    return rows;
}

std::vector<PerRayDelta> topRayDeltas(const std::vector<PerRayDelta>& rows, size_t n) {
    std::vector<PerRayDelta> ranked;
    for (const auto& row : rows) {
        if (std::isfinite(row.deltaAbsDeflection)) {
            ranked.push_back(row);
        }
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const PerRayDelta& a, const PerRayDelta& b) {
                         return std::abs(a.deltaAbsDeflection) > std::abs(b.deltaAbsDeflection);
                     });

    if (ranked.size() > n) {
        ranked.resize(n);
    }
    return ranked;
}

} // namespace Umbra
