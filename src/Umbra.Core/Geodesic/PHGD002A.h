// =============================================================================
// Umbra.Core/Geodesic/PHGD002A.h - Hamiltonian Geodesic Integrator
// =============================================================================
// Fixed-step RK4 integration of photon phase-space trajectories.
//
// Mathematical Foundation:
//   State y = (x^μ, p_μ), 8 components
//   dy/dλ = f(y) = spacetime.derivatives(y) + [0, 0, 0, 0, ΣF_μ]
//   y_{n+1} = y_n + (h/6)(k1 + 2k2 + 2k3 + k4)
//
// The derivative is a pure function of (state, spacetime, perturbations);
// the integrator holds no mutable state, so one instance may be shared by
// any number of threads.
// =============================================================================
#pragma once

#include "PHGD000A.h"
#include <PHMT000B.h>
#include <PHPT001A.h>

#include <optional>

namespace Umbra {

/// @brief Right-hand side of the perturbed Hamiltonian flow
/// Perturbation forces are added to the momentum slots only.
PhotonStateD computeDerivative(const PhotonStateD& state,
                               const ISpacetimeD& spacetime,
                               const PerturbationSet& perturbations);

/// @brief Solve A·p_r² + B = 0 for |p_r| with A = g^rr
/// @return nullopt if |g^rr| is degenerate or p_r² is negative beyond tolerance
std::optional<double> solveRadialMomentum(const MetricComponents& inverse,
                                          double pt, double ptheta, double pphi);

// =============================================================================
// HamiltonianGeodesicIntegrator - RK4 integration over an ISpacetimeD
// =============================================================================
class HamiltonianGeodesicIntegrator {
public:
    /// @pre spacetime outlives the integrator
    /// @throws std::invalid_argument if config.stepSize is not positive
    explicit HamiltonianGeodesicIntegrator(const ISpacetimeD& spacetime,
                                           const IntegratorConfig& config = IntegratorConfig{});

    const ISpacetimeD& spacetime() const { return *m_Spacetime; }
    const IntegratorConfig& config() const { return m_Config; }

    // Termination radii
    double horizonRadius() const { return m_Spacetime->horizonRadius(); }
    double captureRadius() const { return horizonRadius() * m_Config.captureMargin; }
    double escapeRadius() const { return m_Config.maxRadiusFactor * m_Spacetime->mass(); }

    /// @brief Trace one photon until capture, escape, divergence or maxSteps
    /// @throws std::invalid_argument if maxSteps < 0
    /// @post record.steps ≤ maxSteps
    TrajectoryRecord trace(const PhotonStateD& initial, int maxSteps,
                           const PerturbationSet& perturbations = PerturbationSet{}) const;

    /// @brief Single classic RK4 step of size h (h may be negative)
    /// @return PhotonStateD::invalid() if any stage or the result is non-finite
    PhotonStateD rk4Step(const PhotonStateD& state, double h,
                         const PerturbationSet& perturbations = PerturbationSet{}) const;

    /// @brief Build a null initial state at (r, θ, φ)
    ///
    /// p_t = -|E|, p_θ = 0, p_φ = L (DEFAULT_ANGULAR_MOMENTUM when L == 0), and
    /// p_r from H = 0. If the requested p_φ leaves no real p_r the photon is
    /// launched with p_φ = 0 instead. Q is accepted for the Carter-constant
    /// signature but p_θ is always zero.
    ///
    /// @throws InitializationError if g^rr is degenerate or no real p_r exists
    PhotonStateD initializePhoton(double r, double theta, double phi,
                                  double E = 1.0, double L = 0.0, double Q = 0.0,
                                  RadialDirection direction = RadialDirection::Inward) const;

private:
    const ISpacetimeD* m_Spacetime;
    IntegratorConfig m_Config;
};

} // namespace Umbra
