// PHGD002A.cpp - Hamiltonian Geodesic Integrator Implementation
#include "PHGD002A.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace Umbra {

PhotonStateD computeDerivative(const PhotonStateD& state,
                               const ISpacetimeD& spacetime,
                               const PerturbationSet& perturbations) {
    if (!state.isFinite()) {
        return PhotonStateD::invalid();
    }

    // Base geodesic flow
    PhotonStateD deriv = spacetime.derivatives(state);

    // Forces act on dp_μ/dλ
    if (!perturbations.empty()) {
        deriv.p += totalForce(perturbations, state);
    }

    return deriv;
}

std::optional<double> solveRadialMomentum(const MetricComponents& inverse,
                                          double pt, double ptheta, double pphi) {
    const double A = inverse.rr;
    if (std::abs(A) < Constants::Initialisation::RADIAL_DEGENERACY_TOL) {
        return std::nullopt;
    }

    const double B = inverse.tt * pt * pt +
                     2.0 * inverse.tphi * pt * pphi +
                     inverse.thth * ptheta * ptheta +
                     inverse.phiphi * pphi * pphi;

    const double pr2 = -B / A;
    if (!(pr2 >= -Constants::Initialisation::NEGATIVE_PR2_TOL)) {
        return std::nullopt;
    }
    return std::sqrt(std::max(pr2, 0.0));
}

HamiltonianGeodesicIntegrator::HamiltonianGeodesicIntegrator(const ISpacetimeD& spacetime,
                                                             const IntegratorConfig& config)
    : m_Spacetime(&spacetime), m_Config(config) {
    if (!(config.stepSize > 0.0) || !std::isfinite(config.stepSize)) {
        throw std::invalid_argument("HamiltonianGeodesicIntegrator: step size must be positive, got " +
                                    std::to_string(config.stepSize));
    }
}

PhotonStateD HamiltonianGeodesicIntegrator::rk4Step(const PhotonStateD& state, double h,
                                                    const PerturbationSet& perturbations) const {
    if (!state.isFinite()) {
        return PhotonStateD::invalid();
    }

    const ISpacetimeD& st = *m_Spacetime;

    // k1 = f(y_n)
    const PhotonStateD k1 = computeDerivative(state, st, perturbations);

    // k2 = f(y_n + h/2 * k1)
    const PhotonStateD k2 = computeDerivative(state + k1 * (0.5 * h), st, perturbations);

    // k3 = f(y_n + h/2 * k2)
    const PhotonStateD k3 = computeDerivative(state + k2 * (0.5 * h), st, perturbations);

    // k4 = f(y_n + h * k3)
    const PhotonStateD k4 = computeDerivative(state + k3 * h, st, perturbations);

    if (!k1.isFinite() || !k2.isFinite() || !k3.isFinite() || !k4.isFinite()) {
        return PhotonStateD::invalid();
    }

    // y_{n+1} = y_n + h/6 * (k1 + 2*k2 + 2*k3 + k4)
    const PhotonStateD next = state + (k1 + k2 * 2.0 + k3 * 2.0 + k4) * (h / 6.0);

    if (!next.isFinite()) {
        return PhotonStateD::invalid();
    }
    return next;
}

TrajectoryRecord HamiltonianGeodesicIntegrator::trace(const PhotonStateD& initial, int maxSteps,
                                                      const PerturbationSet& perturbations) const {
    if (maxSteps < 0) {
        throw std::invalid_argument("HamiltonianGeodesicIntegrator::trace: maxSteps must be >= 0, got " +
                                    std::to_string(maxSteps));
    }

    // maxSteps only bounds the trace; larger records grow on demand
    const size_t reserve = static_cast<size_t>(std::min(maxSteps, Constants::Geodesic::RECORD_RESERVE));
    TrajectoryRecord record;
    record.t.reserve(reserve);
    record.r.reserve(reserve);
    record.theta.reserve(reserve);
    record.phi.reserve(reserve);
    record.nullError.reserve(reserve);

    const double rCapture = captureRadius();
    const double rEscape = escapeRadius();

    TraceStatus status = TraceStatus::MaxSteps;
    PhotonStateD current = initial;

    for (int step = 0; step < maxSteps; ++step) {
        if (!current.isFinite()) {
            status = TraceStatus::NumericalError;
            break;
        }

        // Record current position
        record.t.push_back(current.x.t);
        record.r.push_back(current.x.r);
        record.theta.push_back(current.x.theta);
        record.phi.push_back(current.x.phi);

        const double err = std::abs(m_Spacetime->nullConstraint(current));
        record.nullError.push_back(err);
        if (std::isfinite(err) && err > record.maxNullError) {
            record.maxNullError = err;
        }
        if (err > m_Config.nullTolerance) {
            record.constraintViolated = true;
        }

        const double r = current.x.r;

        // Captured by the hole
        if (r < rCapture) {
            status = TraceStatus::Captured;
            break;
        }

        // Escaped to large radius
        if (r > rEscape) {
            status = TraceStatus::Escaped;
            break;
        }

        current = rk4Step(current, m_Config.stepSize, perturbations);
    }

    if (status == TraceStatus::MaxSteps && record.constraintViolated) {
        status = TraceStatus::ConstraintWarning;
    }

    record.status = status;
    record.finalState = current;
    record.steps = static_cast<int>(record.phi.size());
    record.properTime = record.steps * m_Config.stepSize;

    if (!record.nullError.empty()) {
        double sum = 0.0;
        for (double e : record.nullError) {
            sum += e;
        }
        record.initialNullError = record.nullError.front();
        record.finalNullError = record.nullError.back();
        record.meanNullError = sum / static_cast<double>(record.nullError.size());
    }

    return record;
}

PhotonStateD HamiltonianGeodesicIntegrator::initializePhoton(double r, double theta, double phi,
                                                             double E, double L, double Q,
                                                             RadialDirection direction) const {
    (void)Q;

    const MetricComponents g_inv = m_Spacetime->inverseMetricComponents(r, theta);

    const double pt = -std::abs(E);
    const double ptheta = 0.0;
    double pphi = (L != 0.0) ? L : Constants::Initialisation::DEFAULT_ANGULAR_MOMENTUM;

    const double A = g_inv.rr;
    if (std::abs(A) < Constants::Initialisation::RADIAL_DEGENERACY_TOL) {
        throw InitializationError("Unable to initialize photon: near-singular radial metric component at r = " +
                                  std::to_string(r));
    }

    double B = g_inv.tt * pt * pt +
               2.0 * g_inv.tphi * pt * pphi +
               g_inv.thth * ptheta * ptheta +
               g_inv.phiphi * pphi * pphi;

    // Turning-point region for this p_φ: launch radially instead
    if (-B / A < 0.0) {
        pphi = 0.0;
        B = g_inv.tt * pt * pt;
    }

    const double pr2 = -B / A;
    if (!(pr2 >= -Constants::Initialisation::NEGATIVE_PR2_TOL)) {
        throw InitializationError("Unable to initialize photon: null condition gives negative p_r^2 at r = " +
                                  std::to_string(r));
    }

    double pr = std::sqrt(std::max(pr2, 0.0));
    if (direction == RadialDirection::Inward) {
        pr = -pr;
    }

    return PhotonStateD(Vec4d(0.0, r, theta, phi), Vec4d(pt, pr, ptheta, pphi));
}

} // namespace Umbra
