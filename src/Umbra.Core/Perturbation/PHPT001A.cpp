// PHPT001A.cpp - Point-Mass Perturbation
#include "PHPT001A.h"

#include <algorithm>
#include <cmath>

namespace Umbra {

MassPerturbation::MassPerturbation(double r, double theta, double phi,
                                   double mass, double forceScale,
                                   double softening, double epsilon)
    : m_r(r), m_theta(theta), m_phi(phi),
      m_mass(mass), m_forceScale(forceScale),
      m_softening(std::max(softening, epsilon)),
      m_eps(epsilon),
      m_position(Coordinates::sphericalToCartesian(r, theta, phi)) {}

Vec4d MassPerturbation::getForce(const PhotonStateD& state) const {
    const double r = state.x.r;
    const double theta = state.x.theta;
    const double phi = state.x.phi;

    const Coordinates::Vec3d photon = Coordinates::sphericalToCartesian(r, theta, phi);
    const Coordinates::Vec3d diff = m_position - photon;
    const double dist = std::max(diff.norm(), m_softening);

    // Softened inverse-square magnitude along the separation
    const double strength = m_forceScale * m_mass / (dist * dist);
    const Coordinates::Vec3d force = diff * (strength / dist);

    const Coordinates::SphericalBasis basis = Coordinates::sphericalBasis(theta, phi);

    const double r_safe = std::max(std::abs(r), m_eps);
    const double sin_safe = std::max(std::abs(std::sin(theta)), m_eps);

    Vec4d F;
    F.t = 0.0;
    F.r = force.dot(basis.e_r);
    F.theta = force.dot(basis.e_theta) / r_safe;
    F.phi = force.dot(basis.e_phi) / (r_safe * sin_safe);
    return F;
}

Vec4d totalForce(const PerturbationSet& perturbations, const PhotonStateD& state) {
    Vec4d total;
    for (const auto& perturbation : perturbations) {
        total += perturbation.getForce(state);
    }
    return total;
}

} // namespace Umbra
