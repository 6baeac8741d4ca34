// PHMT100B.cpp - Kerr Spacetime Double-Precision Implementation
#include "PHMT100B.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace Umbra {

namespace {

void checkEpsilon(double epsilon) {
    if (!(epsilon > 0.0) || !std::isfinite(epsilon)) {
        throw std::invalid_argument("KerrSpacetimeD: epsilon must be positive and finite, got " +
                                    std::to_string(epsilon));
    }
}

} // namespace

KerrSpacetimeD::KerrSpacetimeD(double M, double a, double epsilon,
                               const DifferencingConfig& differencing)
    : m_M(M), m_a(a), m_requestedSpin(a), m_eps(epsilon), m_differencing(differencing) {
    if (!(M > 0.0) || !std::isfinite(M)) {
        throw std::invalid_argument("KerrSpacetimeD: mass must be positive and finite, got " +
                                    std::to_string(M));
    }
    if (!std::isfinite(a)) {
        throw std::invalid_argument("KerrSpacetimeD: spin must be finite, got " + std::to_string(a));
    }
    checkEpsilon(epsilon);
    if (!(differencing.step > 0.0) || !std::isfinite(differencing.step)) {
        throw std::invalid_argument("KerrSpacetimeD: differencing step must be positive");
    }

    // Cosmic censorship: no naked singularities
    if (std::abs(m_a) > m_M) {
        m_a = std::copysign(Constants::Metric::SPIN_CLAMP_FRACTION * m_M, m_a);
    }
}

void KerrSpacetimeD::setEpsilon(double epsilon) {
    checkEpsilon(epsilon);
    m_eps = epsilon;
}

const char* KerrSpacetimeD::getName() const {
    return (m_a == 0.0) ? "Schwarzschild" : "Kerr";
}

//==============================================================================
// Metric Components
//==============================================================================

MetricComponents KerrSpacetimeD::metricComponents(double r, double theta) const {
    const double a2 = m_a * m_a;
    const double r2 = r * r;
    const double sinth = std::sin(theta);
    const double costh = std::cos(theta);
    const double sin2th = sinth * sinth;

    MetricComponents g;
    g.Sigma = r2 + a2 * costh * costh;
    g.Delta = r2 - 2.0 * m_M * r + a2;

    const double Sigma = Constants::signedFloor(g.Sigma, m_eps);
    const double Delta = Constants::signedFloor(g.Delta, m_eps);
    const double rho2 = r2 + a2;

    g.tt = -(1.0 - 2.0 * m_M * r / Sigma);
    g.tphi = -2.0 * m_M * m_a * r * sin2th / Sigma;
    g.rr = Sigma / Delta;
    g.thth = g.Sigma;
    g.phiphi = (rho2 * rho2 - g.Delta * a2 * sin2th) * sin2th / Sigma;
    return g;
}

MetricComponents KerrSpacetimeD::inverseMetricComponents(double r, double theta) const {
    const double a2 = m_a * m_a;
    const double r2 = r * r;
    const double sinth = std::sin(theta);
    const double costh = std::cos(theta);

    MetricComponents g_inv;
    g_inv.Sigma = r2 + a2 * costh * costh;
    g_inv.Delta = r2 - 2.0 * m_M * r + a2;

    // Signed floors keep 1/Δ and 1/sin²θ finite at the horizon and on the axis
    const double Sigma = Constants::signedFloor(g_inv.Sigma, m_eps);
    const double Delta = Constants::signedFloor(g_inv.Delta, m_eps);
    const double sin2th = Constants::signedFloor(sinth * sinth, m_eps);
    const double rho2 = r2 + a2;
    const double DeltaSigma = Delta * Sigma;

    g_inv.tt = -(rho2 * rho2 - g_inv.Delta * a2 * sin2th) / DeltaSigma;
    g_inv.tphi = -2.0 * m_M * m_a * r / DeltaSigma;
    g_inv.rr = g_inv.Delta / Sigma;
    g_inv.thth = 1.0 / Sigma;
    g_inv.phiphi = (g_inv.Delta - a2 * sin2th) / (DeltaSigma * sin2th);
    return g_inv;
}

//==============================================================================
// Hamiltonian
//==============================================================================

double KerrSpacetimeD::hamiltonian(double r, double theta, const Vec4d& p) const {
    const MetricComponents g_inv = inverseMetricComponents(r, theta);

    // H = 0.5 (g^tt pt² + 2 g^tφ pt pφ + g^rr pr² + g^θθ pθ² + g^φφ pφ²)
    return 0.5 * (g_inv.tt * p.t * p.t +
                  2.0 * g_inv.tphi * p.t * p.phi +
                  g_inv.rr * p.r * p.r +
                  g_inv.thth * p.theta * p.theta +
                  g_inv.phiphi * p.phi * p.phi);
}

double KerrSpacetimeD::nullConstraint(const PhotonStateD& state) const {
    return hamiltonian(state.x.r, state.x.theta, state.p);
}

double KerrSpacetimeD::dHdr(double r, double theta, const Vec4d& p) const {
    const double h = m_differencing.step;
    if (m_differencing.scheme == DifferenceScheme::Richardson) {
        return (hamiltonian(r - 2.0 * h, theta, p) - 8.0 * hamiltonian(r - h, theta, p) +
                8.0 * hamiltonian(r + h, theta, p) - hamiltonian(r + 2.0 * h, theta, p)) /
               (12.0 * h);
    }
    return (hamiltonian(r + h, theta, p) - hamiltonian(r - h, theta, p)) / (2.0 * h);
}

double KerrSpacetimeD::dHdtheta(double r, double theta, const Vec4d& p) const {
    const double h = m_differencing.step;
    if (m_differencing.scheme == DifferenceScheme::Richardson) {
        return (hamiltonian(r, theta - 2.0 * h, p) - 8.0 * hamiltonian(r, theta - h, p) +
                8.0 * hamiltonian(r, theta + h, p) - hamiltonian(r, theta + 2.0 * h, p)) /
               (12.0 * h);
    }
    return (hamiltonian(r, theta + h, p) - hamiltonian(r, theta - h, p)) / (2.0 * h);
}

PhotonStateD KerrSpacetimeD::derivatives(const PhotonStateD& state) const {
    const double r = state.x.r;
    const double theta = state.x.theta;
    const Vec4d& p = state.p;

    const MetricComponents g_inv = inverseMetricComponents(r, theta);

    PhotonStateD d;

    // dx^μ/dλ = g^μν p_ν
    d.x.t = g_inv.tt * p.t + g_inv.tphi * p.phi;
    d.x.r = g_inv.rr * p.r;
    d.x.theta = g_inv.thth * p.theta;
    d.x.phi = g_inv.tphi * p.t + g_inv.phiphi * p.phi;

    // dp_μ/dλ = -∂H/∂x^μ; t and φ are cyclic
    d.p.t = 0.0;
    d.p.r = -dHdr(r, theta, p);
    d.p.theta = -dHdtheta(r, theta, p);
    d.p.phi = 0.0;

    return d;
}

//==============================================================================
// Boundaries
//==============================================================================

double KerrSpacetimeD::horizonRadius() const {
    // r+ = M + √(M² - a²)
    return m_M + std::sqrt(std::max(m_M * m_M - m_a * m_a, 0.0));
}

double KerrSpacetimeD::ergosphereRadius(double theta) const {
    // r_ergo = M + √(M² - a²cos²θ)
    const double costh = std::cos(theta);
    return m_M + std::sqrt(std::max(m_M * m_M - m_a * m_a * costh * costh, 0.0));
}

} // namespace Umbra
