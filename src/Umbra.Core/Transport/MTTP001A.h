// MTTP001A.h - Double-Precision Types for Geodesic Integration
// Component ID: MTTP001A
// Purpose: Provides Vec4d and PhotonStateD, the 8-component phase-space state
//
// MATHEMATICAL BASIS:
// A photon is described by its position x^μ = (t, r, θ, φ) in Boyer-Lindquist
// coordinates and its covariant wave vector p_μ = (p_t, p_r, p_θ, p_φ).
// Flattened index order: [t, r, θ, φ, p_t, p_r, p_θ, p_φ].
//
// STRICT REQUIREMENTS:
// - All components are IEEE 754 double precision
// - isFinite() is the only divergence test used by the integrator

#pragma once

#include <cmath>

namespace Umbra {

//==============================================================================
// Vec4d: Double-precision 4-vector for spacetime coordinates
// Indices: 0=t, 1=r, 2=theta, 3=phi (Boyer-Lindquist)
//==============================================================================

struct Vec4d {
    double t, r, theta, phi;

    Vec4d() : t(0), r(0), theta(0), phi(0) {}

    Vec4d(double t_, double r_, double th_, double ph_)
        : t(t_), r(r_), theta(th_), phi(ph_) {}

    // Indexed access (0=t, 1=r, 2=theta, 3=phi)
    double& operator[](int i) {
        return (&t)[i];
    }

    const double& operator[](int i) const {
        return (&t)[i];
    }

    Vec4d operator+(const Vec4d& o) const {
        return Vec4d(t + o.t, r + o.r, theta + o.theta, phi + o.phi);
    }

    Vec4d operator*(double s) const {
        return Vec4d(t * s, r * s, theta * s, phi * s);
    }

    Vec4d& operator+=(const Vec4d& o) {
        t += o.t; r += o.r; theta += o.theta; phi += o.phi;
        return *this;
    }

    bool isFinite() const {
        return std::isfinite(t) && std::isfinite(r) &&
               std::isfinite(theta) && std::isfinite(phi);
    }
};

//==============================================================================
// PhotonStateD: Phase-space state of a single photon
// x = position, p = covariant momentum (wave 4-vector)
//==============================================================================

struct PhotonStateD {
    static constexpr int SIZE = 8;

    Vec4d x;   // Position: (t, r, θ, φ)
    Vec4d p;   // Covariant momentum: (p_t, p_r, p_θ, p_φ)

    PhotonStateD() : x(), p() {}

    PhotonStateD(const Vec4d& pos, const Vec4d& mom) : x(pos), p(mom) {}

    // Flattened access: 0-3 position, 4-7 momentum
    double& operator[](int i) {
        return i < 4 ? x[i] : p[i - 4];
    }

    const double& operator[](int i) const {
        return i < 4 ? x[i] : p[i - 4];
    }

    PhotonStateD operator+(const PhotonStateD& o) const {
        return PhotonStateD(x + o.x, p + o.p);
    }

    PhotonStateD operator*(double s) const {
        return PhotonStateD(x * s, p * s);
    }

    bool isFinite() const {
        return x.isFinite() && p.isFinite();
    }

    /// @brief State with every component set to quiet NaN
    static PhotonStateD invalid() {
        const double nan = std::nan("");
        return PhotonStateD(Vec4d(nan, nan, nan, nan), Vec4d(nan, nan, nan, nan));
    }

    // Killing quantities of the unperturbed flow
    double energy() const { return -p.t; }
    double angularMomentum() const { return p.phi; }
};

} // namespace Umbra
