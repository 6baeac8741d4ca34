// BMOR001A.h - Beam Orchestrator
// Component ID: BMOR001A (Beam/Session/Orchestrator)
//
// Owns one Kerr spacetime, the perturbation set and one integrator, and
// traces parallel beams of photons across worker threads.
//
// Perturbations are copy-on-write: addPerturbation/clearPerturbations swap in
// a new immutable PerturbationSet, and every run traces against the snapshot
// taken when it started. Ray outputs are ordered by ray index and do not
// depend on the number of worker threads.

#pragma once

#include <PHGD002A.h>
#include <PHMT100B.h>
#include <PHPT001A.h>

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace Umbra {

//==============================================================================
// Orchestrator Configuration
//==============================================================================
struct OrchestratorConfig {
    // Spacetime
    double mass = 1.0;
    double spin = 0.9;
    double epsilon = Constants::Metric::DEFAULT_EPSILON;
    DifferencingConfig differencing;

    // Integration
    IntegratorConfig integrator;
    int defaultMaxSteps = Constants::Geodesic::DEFAULT_MAX_STEPS;

    // Defaults for addPerturbation
    double perturbForceScale = Constants::Perturbation::DEFAULT_FORCE_SCALE;
    double perturbSoftening = Constants::Perturbation::DEFAULT_SOFTENING;

    int threadCount = 0;    ///< 0 = auto-detect, 1 = single-threaded
};

//==============================================================================
// Beam Request / Result
//==============================================================================
struct BeamRequest {
    double startX = Constants::Beam::DEFAULT_START_X;   ///< Launch plane x = startX
    double width = Constants::Beam::DEFAULT_WIDTH;      ///< Aiming offsets span [-w/2, w/2]
    int rays = Constants::Beam::DEFAULT_RAYS;
    std::optional<int> maxSteps;                         ///< Unset = defaultMaxSteps
    double theta = Constants::Math::HALF_PI;
    double energy = Constants::Beam::DEFAULT_ENERGY;
};

struct BeamResult {
    std::vector<TrajectoryRecord> trajectories;   ///< Traced rays, ascending ray index
    int requestedRays = 0;
    int skippedRays = 0;                          ///< Rays with no real inward p_r
    std::vector<int> skippedIndices;
    int threadsUsed = 0;
};

//==============================================================================
// BeamOrchestrator
//==============================================================================
class BeamOrchestrator {
public:
    /// @throws std::invalid_argument for non-positive mass or step size
    explicit BeamOrchestrator(const OrchestratorConfig& config = OrchestratorConfig{});

    BeamOrchestrator(const BeamOrchestrator&) = delete;
    BeamOrchestrator& operator=(const BeamOrchestrator&) = delete;

    const OrchestratorConfig& config() const { return m_Config; }
    const KerrSpacetimeD& spacetime() const { return *m_Spacetime; }
    const HamiltonianGeodesicIntegrator& integrator() const { return *m_Integrator; }

    //--------------------------------------------------------------------------
    // Perturbations
    //--------------------------------------------------------------------------

    /// @brief Append a point mass; unset forceScale/softening use the orchestrator defaults
    void addPerturbation(double r, double theta, double phi,
                         double mass = Constants::Perturbation::DEFAULT_MASS,
                         std::optional<double> forceScale = std::nullopt,
                         std::optional<double> softening = std::nullopt);

    void clearPerturbations();

    /// @brief Immutable view of the current set, unaffected by later additions
    std::shared_ptr<const PerturbationSet> snapshot() const;

    size_t perturbationCount() const;

    //--------------------------------------------------------------------------
    // Tracing
    //--------------------------------------------------------------------------

    /// @brief Trace one photon against the current perturbation snapshot
    TrajectoryRecord traceRay(const PhotonStateD& initial,
                              std::optional<int> maxSteps = std::nullopt) const;

    /// @brief Trace a parallel beam against the current perturbation snapshot
    /// @throws std::invalid_argument if rays < 0 or maxSteps < 0
    BeamResult runBeam(const BeamRequest& request) const;

    /// @brief Trace a parallel beam against an explicit perturbation set
    BeamResult runBeam(const BeamRequest& request,
                       std::shared_ptr<const PerturbationSet> perturbations) const;

    /// @brief Positional form of runBeam returning the traced rays only
    std::vector<TrajectoryRecord> runBeamSimulation(double startX, double width, int rays,
                                                    std::optional<int> maxSteps = std::nullopt,
                                                    double theta = Constants::Math::HALF_PI,
                                                    double energy = Constants::Beam::DEFAULT_ENERGY) const;

    //--------------------------------------------------------------------------
    // Beam Geometry
    //--------------------------------------------------------------------------

    /// @brief Evenly spaced offsets from -width/2 to +width/2 inclusive
    /// A single ray sits at -width/2.
    static std::vector<double> aimingOffsets(double width, int rays);

    /// @brief Inward null state for the ray at offset y, or nullopt if none exists
    std::optional<PhotonStateD> initializeParallelRay(double startX, double y,
                                                      double theta, double energy) const;

    /// @brief Worker count for a request: 0 = hardware concurrency minus one, at least one
    static int resolveThreadCount(int requested);

private:
    OrchestratorConfig m_Config;
    std::unique_ptr<KerrSpacetimeD> m_Spacetime;
    std::unique_ptr<HamiltonianGeodesicIntegrator> m_Integrator;

    mutable std::mutex m_PerturbationMutex;
    std::shared_ptr<const PerturbationSet> m_Perturbations;
};

} // namespace Umbra
