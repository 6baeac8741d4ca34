// PHMT100B.h - Kerr Spacetime Double-Precision Implementation
// Component ID: PHMT100B
// Purpose: Closed-form Kerr metric with Hamiltonian photon flow
//
// MATHEMATICAL BASIS:
// Boyer-Lindquist coordinates (t, r, θ, φ) with metric:
//   ds² = -(1 - 2Mr/Σ)dt² - (4aMr sin²θ/Σ)dt dφ + (Σ/Δ)dr² + Σ dθ²
//        + sin²θ[(r² + a²)² - a²Δ sin²θ]/Σ dφ²
//
// where: Σ = r² + a²cos²θ,  Δ = r² - 2Mr + a²
//
// Inverse (non-zero components):
//   g^tt = -[(r² + a²)² - a²Δ sin²θ] / (ΔΣ)
//   g^tφ = -2Mar / (ΔΣ)
//   g^rr = Δ/Σ,  g^θθ = 1/Σ
//   g^φφ = (Δ - a² sin²θ) / (ΔΣ sin²θ)
//
// EQUATIONS OF MOTION:
// Position derivatives are analytic (g^μν p_ν). ∂H/∂r and ∂H/∂θ are taken by
// finite differences of H itself (DifferencingConfig), so curvature terms
// never have to be derived symbolically. p_t and p_φ are cyclic.
//
// REFERENCE: Misner, Thorne & Wheeler (1973), Chandrasekhar (1983)

#pragma once

#include "PHMT000B.h"

namespace Umbra {

//==============================================================================
// KerrSpacetimeD: Double-precision Kerr spacetime
//==============================================================================

class KerrSpacetimeD : public ISpacetimeD {
public:
    /// @param M Mass, must be positive and finite
    /// @param a Spin; |a| > M is clamped to sign(a)·0.99·M
    /// @param epsilon Signed floor for near-zero Δ and sin²θ
    /// @param differencing Stencil for ∂H/∂r and ∂H/∂θ
    /// @throws std::invalid_argument for M ≤ 0, non-finite a, epsilon ≤ 0 or a bad stencil step
    explicit KerrSpacetimeD(double M = 1.0, double a = 0.9,
                            double epsilon = Constants::Metric::DEFAULT_EPSILON,
                            const DifferencingConfig& differencing = DifferencingConfig{});

    //--------------------------------------------------------------------------
    // ISpacetimeD Implementation
    //--------------------------------------------------------------------------

    MetricComponents metricComponents(double r, double theta) const override;
    MetricComponents inverseMetricComponents(double r, double theta) const override;

    double nullConstraint(const PhotonStateD& state) const override;
    PhotonStateD derivatives(const PhotonStateD& state) const override;

    double horizonRadius() const override;
    double ergosphereRadius(double theta) const override;

    double mass() const override { return m_M; }
    double spin() const override { return m_a; }
    const char* getName() const override;

    //--------------------------------------------------------------------------
    // Kerr Specific
    //--------------------------------------------------------------------------

    /// H = (1/2) g^μν p_μ p_ν evaluated at an arbitrary (r, θ)
    double hamiltonian(double r, double theta, const Vec4d& p) const;

    /// Numerical ∂H/∂r and ∂H/∂θ at fixed momentum
    double dHdr(double r, double theta, const Vec4d& p) const;
    double dHdtheta(double r, double theta, const Vec4d& p) const;

    /// Spin as passed to the constructor, before clamping
    double requestedSpin() const { return m_requestedSpin; }
    bool spinWasClamped() const { return m_a != m_requestedSpin; }

    double epsilon() const { return m_eps; }
    void setEpsilon(double epsilon);

    const DifferencingConfig& differencing() const { return m_differencing; }

private:
    double m_M;
    double m_a;
    double m_requestedSpin;
    double m_eps;
    DifferencingConfig m_differencing;
};

} // namespace Umbra
