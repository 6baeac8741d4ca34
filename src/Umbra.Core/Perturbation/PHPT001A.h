// PHPT001A.h - Point-Mass Perturbation
// Component ID: PHPT001A
// Purpose: Heuristic softened inverse-square force on a photon's momentum
//
// MODEL:
// Both the perturbing mass and the photon are placed in a flat Cartesian
// embedding of (r, θ, φ). The force on the photon is
//   F = k m (x_m - x_γ) / d³,   d = max(|x_m - x_γ|, softening)
// projected onto the local orthonormal basis (e_r, e_θ, e_φ) at the photon and
// converted to coordinate-momentum units:
//   F_r = F·e_r,   F_θ = F·e_θ / r,   F_φ = F·e_φ / (r sinθ)
// with r and sinθ floored by ε. F_t is always zero.
//
// This is not a solution of the field equations; it models a small nearby
// mass as an external force on an otherwise Kerr photon flow.

#pragma once

#include "../Transport/MTTP001A.h"
#include <PHCN001A.h>
#include <PHCT001A.h>

#include <vector>

namespace Umbra {

//==============================================================================
// MassPerturbation
//==============================================================================

class MassPerturbation {
public:
    /// @param r, theta, phi Fixed location (Boyer-Lindquist-like)
    /// @param mass Perturbing mass
    /// @param forceScale Multiplier on the inverse-square law
    /// @param softening Floor on separation distance (itself floored at ε)
    /// @param epsilon Floor on r and |sinθ| in the angular conversion
    MassPerturbation(double r, double theta, double phi,
                     double mass = Constants::Perturbation::DEFAULT_MASS,
                     double forceScale = Constants::Perturbation::DEFAULT_FORCE_SCALE,
                     double softening = Constants::Perturbation::DEFAULT_SOFTENING,
                     double epsilon = Constants::Perturbation::DEFAULT_EPSILON);

    /// @brief Force aligned with the momentum-derivative slots [F_t, F_r, F_θ, F_φ]
    /// @post result.t == 0
    Vec4d getForce(const PhotonStateD& state) const;

    double r() const { return m_r; }
    double theta() const { return m_theta; }
    double phi() const { return m_phi; }
    double mass() const { return m_mass; }
    double forceScale() const { return m_forceScale; }
    double softening() const { return m_softening; }
    double epsilon() const { return m_eps; }

    /// Cached embedding position
    const Coordinates::Vec3d& position() const { return m_position; }

private:
    double m_r;
    double m_theta;
    double m_phi;
    double m_mass;
    double m_forceScale;
    double m_softening;
    double m_eps;
    Coordinates::Vec3d m_position;
};

/// Immutable set of perturbations passed to each trace
using PerturbationSet = std::vector<MassPerturbation>;

/// @brief Vector sum of every perturbation's force on the state
Vec4d totalForce(const PerturbationSet& perturbations, const PhotonStateD& state);

} // namespace Umbra
