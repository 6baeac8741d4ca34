// =============================================================================
// PHCT001A.h - Coordinate Transformation Utilities
// Component ID: PHCT001A (Physics/Coordinate/Transformations)
// =============================================================================
//
// PURPOSE
// =======
// Conversion from Boyer-Lindquist-like spherical coordinates to the flat
// Cartesian embedding used by the point-mass perturbation model, plus the
// local orthonormal spherical basis used to project embedding-space forces
// back onto (r, θ, φ).
//
// COORDINATE CONVENTIONS
// ======================
// Cartesian: (x, y, z) with standard orientation
// Spherical: (r, θ, φ) where:
//   - r = √(x² + y² + z²)
//   - θ = arccos(z/r)     (polar angle from +z axis)
//   - φ = atan2(y, x)     (azimuthal angle in xy-plane)
//
// The embedding is flat: it ignores the spin-induced oblateness of
// Boyer-Lindquist surfaces of constant r.
// =============================================================================

#ifndef PHCT001A_H
#define PHCT001A_H

#include <cmath>

namespace Umbra {
namespace Coordinates {

// =============================================================================
// Cartesian 3-vector
// =============================================================================

struct Vec3d {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    Vec3d() = default;
    Vec3d(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    Vec3d operator+(const Vec3d& o) const { return {x + o.x, y + o.y, z + o.z}; }
    Vec3d operator-(const Vec3d& o) const { return {x - o.x, y - o.y, z - o.z}; }
    Vec3d operator*(double s) const { return {x * s, y * s, z * s}; }

    double dot(const Vec3d& o) const { return x * o.x + y * o.y + z * o.z; }
    double norm() const { return std::sqrt(dot(*this)); }
};

// =============================================================================
// Spherical to Cartesian Conversion
// =============================================================================

template<typename T>
inline void sphericalToCartesian(T r, T theta, T phi, T& x, T& y, T& z) {
    T sin_theta = std::sin(theta);
    T cos_theta = std::cos(theta);
    T sin_phi = std::sin(phi);
    T cos_phi = std::cos(phi);

    x = r * sin_theta * cos_phi;
    y = r * sin_theta * sin_phi;
    z = r * cos_theta;
}

inline Vec3d sphericalToCartesian(double r, double theta, double phi) {
    Vec3d v;
    sphericalToCartesian(r, theta, phi, v.x, v.y, v.z);
    return v;
}

// =============================================================================
// Local Orthonormal Spherical Basis
// =============================================================================
//   e_r = (sinθ cosφ, sinθ sinφ,  cosθ)
//   e_θ = (cosθ cosφ, cosθ sinφ, -sinθ)
//   e_φ = (-sinφ,     cosφ,       0   )

struct SphericalBasis {
    Vec3d e_r;
    Vec3d e_theta;
    Vec3d e_phi;
};

inline SphericalBasis sphericalBasis(double theta, double phi) {
    const double sin_th = std::sin(theta);
    const double cos_th = std::cos(theta);
    const double sin_ph = std::sin(phi);
    const double cos_ph = std::cos(phi);

    SphericalBasis basis;
    basis.e_r = Vec3d(sin_th * cos_ph, sin_th * sin_ph, cos_th);
    basis.e_theta = Vec3d(cos_th * cos_ph, cos_th * sin_ph, -sin_th);
    basis.e_phi = Vec3d(-sin_ph, cos_ph, 0.0);
    return basis;
}

} // namespace Coordinates
} // namespace Umbra

#endif // PHCT001A_H
