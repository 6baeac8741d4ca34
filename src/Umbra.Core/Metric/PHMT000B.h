// PHMT000B.h - Double-Precision Spacetime Interface
// Component ID: PHMT000B
// Purpose: Abstract base class for stationary, axisymmetric spacetimes
//
// MATHEMATICAL BASIS:
// In coordinates (t, r, θ, φ) adapted to the two Killing vectors ∂_t and ∂_φ
// the only non-zero metric components are g_tt, g_tφ, g_rr, g_θθ and g_φφ.
// Photon motion follows Hamilton's equations for
//   H = (1/2) g^μν p_μ p_ν        (H = 0 on a null geodesic)
//   dx^μ/dλ =  ∂H/∂p_μ = g^μν p_ν
//   dp_μ/dλ = -∂H/∂x^μ
//
// STRICT REQUIREMENTS:
// - Components are finite wherever r and θ are finite: near-zero Δ and sin²θ
//   are replaced by a signed floor, never divided through
// - dp_t/dλ = dp_φ/dλ = 0 exactly (stationarity and axisymmetry)

#pragma once

#include "../Transport/MTTP001A.h"
#include <PHCN001A.h>

namespace Umbra {

//==============================================================================
// MetricComponents: non-zero components of g_μν (or g^μν) at (r, θ)
// Sigma and Delta are the two scalar helpers the components are built from.
//==============================================================================

struct MetricComponents {
    double tt = 0.0;
    double tphi = 0.0;
    double rr = 0.0;
    double thth = 0.0;
    double phiphi = 0.0;
    double Sigma = 0.0;
    double Delta = 0.0;
};

//==============================================================================
// DifferencingConfig: numerical ∂H/∂r and ∂H/∂θ
//==============================================================================

enum class DifferenceScheme {
    Central,     ///< [f(x+h) - f(x-h)] / 2h, error O(h²)
    Richardson   ///< [f(x-2h) - 8f(x-h) + 8f(x+h) - f(x+2h)] / 12h, error O(h⁴)
};

struct DifferencingConfig {
    double step = Constants::Differentiation::DEFAULT_STEP;
    DifferenceScheme scheme = DifferenceScheme::Central;
};

//==============================================================================
// ISpacetimeD: Abstract interface for double-precision spacetime evaluation
//==============================================================================

class ISpacetimeD {
public:
    virtual ~ISpacetimeD() = default;

    //--------------------------------------------------------------------------
    // Metric Evaluation
    //--------------------------------------------------------------------------

    /// Covariant components g_μν at (r, θ)
    virtual MetricComponents metricComponents(double r, double theta) const = 0;

    /// Contravariant components g^μν at (r, θ)
    /// @post composed with metricComponents gives δ^μ_ν away from Δ ≈ 0, sinθ ≈ 0
    virtual MetricComponents inverseMetricComponents(double r, double theta) const = 0;

    //--------------------------------------------------------------------------
    // Hamiltonian Flow
    //--------------------------------------------------------------------------

    /// Null constraint H = (1/2) g^μν p_μ p_ν at the state's position
    virtual double nullConstraint(const PhotonStateD& state) const = 0;

    /// Right-hand side of Hamilton's equations for the unperturbed spacetime
    /// @return [dx^μ/dλ, dp_μ/dλ] packed like the state
    virtual PhotonStateD derivatives(const PhotonStateD& state) const = 0;

    //--------------------------------------------------------------------------
    // Boundaries
    //--------------------------------------------------------------------------

    /// Outer event horizon radius r+
    virtual double horizonRadius() const = 0;

    /// Outer boundary of the ergosphere at polar angle θ
    virtual double ergosphereRadius(double theta) const = 0;

    //--------------------------------------------------------------------------
    // Parameters
    //--------------------------------------------------------------------------

    /// Mass parameter M (geometric units: G = c = 1)
    virtual double mass() const = 0;

    /// Effective spin parameter a (|a| ≤ M after construction)
    virtual double spin() const = 0;

    /// Human-readable name
    virtual const char* getName() const = 0;
};

} // namespace Umbra
