// BMOR001A.cpp - Beam Orchestrator Implementation
#include "BMOR001A.h"

#include <IRLG001A.h>

#include <atomic>
#include <cmath>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

namespace Umbra {

namespace {

struct RaySlot {
    std::optional<TrajectoryRecord> record;
    bool skipped = false;
};

} // namespace

BeamOrchestrator::BeamOrchestrator(const OrchestratorConfig& config)
    : m_Config(config),
      m_Perturbations(std::make_shared<const PerturbationSet>()) {
    if (config.defaultMaxSteps < 0) {
        throw std::invalid_argument("BeamOrchestrator: defaultMaxSteps must be >= 0, got " +
                                    std::to_string(config.defaultMaxSteps));
    }

    m_Spacetime = std::make_unique<KerrSpacetimeD>(config.mass, config.spin,
                                                   config.epsilon, config.differencing);
    m_Integrator = std::make_unique<HamiltonianGeodesicIntegrator>(*m_Spacetime, config.integrator);

    if (m_Spacetime->spinWasClamped()) {
        std::ostringstream ss;
        ss << "[Beam] Spin a = " << m_Spacetime->requestedSpin() << " exceeds M = "
           << m_Spacetime->mass() << "; clamped to a = " << m_Spacetime->spin();
        LOG_WARN(ss.str());
    }

    std::ostringstream ss;
    ss << "[Beam] " << m_Spacetime->getName() << " spacetime M = " << m_Spacetime->mass()
       << ", a = " << m_Spacetime->spin() << ", r+ = " << m_Spacetime->horizonRadius();
    LOG_DEBUG(ss.str());
}

//==============================================================================
// Perturbations
//==============================================================================

void BeamOrchestrator::addPerturbation(double r, double theta, double phi, double mass,
                                       std::optional<double> forceScale,
                                       std::optional<double> softening) {
    MassPerturbation perturbation(r, theta, phi, mass,
                                  forceScale.value_or(m_Config.perturbForceScale),
                                  softening.value_or(m_Config.perturbSoftening));
    {
        std::lock_guard<std::mutex> lock(m_PerturbationMutex);
        auto next = std::make_shared<PerturbationSet>(*m_Perturbations);
        next->push_back(perturbation);
        m_Perturbations = std::move(next);
    }

    std::ostringstream ss;
    ss << "[Beam] Added perturbation at r = " << r << ", phi = " << phi << ", mass = " << mass;
    LOG_INFO(ss.str());
}

void BeamOrchestrator::clearPerturbations() {
    std::lock_guard<std::mutex> lock(m_PerturbationMutex);
    m_Perturbations = std::make_shared<const PerturbationSet>();
}

std::shared_ptr<const PerturbationSet> BeamOrchestrator::snapshot() const {
    std::lock_guard<std::mutex> lock(m_PerturbationMutex);
    return m_Perturbations;
}

size_t BeamOrchestrator::perturbationCount() const {
    return snapshot()->size();
}

//==============================================================================
// Beam Geometry
//==============================================================================

std::vector<double> BeamOrchestrator::aimingOffsets(double width, int rays) {
    std::vector<double> offsets;
    if (rays <= 0) {
        return offsets;
    }

    offsets.reserve(static_cast<size_t>(rays));
    const double start = -0.5 * width;
    if (rays == 1) {
        offsets.push_back(start);
        return offsets;
    }

    const double spacing = width / static_cast<double>(rays - 1);
    for (int i = 0; i < rays - 1; ++i) {
        offsets.push_back(start + spacing * i);
    }
    offsets.push_back(0.5 * width);
    return offsets;
}

std::optional<PhotonStateD> BeamOrchestrator::initializeParallelRay(double startX, double y,
                                                                    double theta,
                                                                    double energy) const {
    const double r = std::sqrt(startX * startX + y * y);
    const double phi = std::atan2(y, startX);

    // Approximately parallel to the x axis: impact parameter carried by p_φ
    const double pt = -std::abs(energy);
    const double pphi = y;
    const double ptheta = 0.0;

    const MetricComponents g_inv = m_Spacetime->inverseMetricComponents(r, theta);
    const std::optional<double> prMagnitude = solveRadialMomentum(g_inv, pt, ptheta, pphi);
    if (!prMagnitude) {
        return std::nullopt;
    }

    return PhotonStateD(Vec4d(0.0, r, theta, phi), Vec4d(pt, -*prMagnitude, ptheta, pphi));
}

int BeamOrchestrator::resolveThreadCount(int requested) {
    if (requested > 0) {
        return requested;
    }
    // Auto-detect: use hardware concurrency, leave 1 core for system
    int threads = static_cast<int>(std::thread::hardware_concurrency());
    if (threads > 1) threads--;
    if (threads < 1) threads = 1;
    return threads;
}

//==============================================================================
// Tracing
//==============================================================================

TrajectoryRecord BeamOrchestrator::traceRay(const PhotonStateD& initial,
                                            std::optional<int> maxSteps) const {
    const auto perturbations = snapshot();
    return m_Integrator->trace(initial, maxSteps.value_or(m_Config.defaultMaxSteps), *perturbations);
}

BeamResult BeamOrchestrator::runBeam(const BeamRequest& request) const {
    return runBeam(request, snapshot());
}

BeamResult BeamOrchestrator::runBeam(const BeamRequest& request,
                                     std::shared_ptr<const PerturbationSet> perturbations) const {
    const int maxSteps = request.maxSteps.value_or(m_Config.defaultMaxSteps);
    if (request.rays < 0) {
        throw std::invalid_argument("BeamOrchestrator::runBeam: rays must be >= 0, got " +
                                    std::to_string(request.rays));
    }
    if (maxSteps < 0) {
        throw std::invalid_argument("BeamOrchestrator::runBeam: maxSteps must be >= 0, got " +
                                    std::to_string(maxSteps));
    }
    if (!perturbations) {
        perturbations = std::make_shared<const PerturbationSet>();
    }

    BeamResult result;
    result.requestedRays = request.rays;

    const std::vector<double> offsets = aimingOffsets(request.width, request.rays);
    const int rayCount = static_cast<int>(offsets.size());

    int numThreads = resolveThreadCount(m_Config.threadCount);
    if (numThreads > rayCount) numThreads = rayCount;
    if (numThreads < 1) numThreads = 1;
    result.threadsUsed = numThreads;

    {
        std::ostringstream ss;
        ss << "[Beam] Tracing " << rayCount << " rays from x = " << request.startX
           << " (width " << request.width << ", max steps " << maxSteps << ", "
           << perturbations->size() << " perturbation(s), " << numThreads << " thread(s))";
        LOG_INFO(ss.str());
    }

    std::vector<RaySlot> slots(static_cast<size_t>(rayCount));
    std::atomic<int> nextRay{0};

    auto worker = [&]() {
        for (int i = nextRay.fetch_add(1); i < rayCount; i = nextRay.fetch_add(1)) {
            RaySlot& slot = slots[static_cast<size_t>(i)];
            const double y = offsets[static_cast<size_t>(i)];

            const std::optional<PhotonStateD> initial =
                initializeParallelRay(request.startX, y, request.theta, request.energy);
            if (!initial) {
                slot.skipped = true;
                continue;
            }

            TrajectoryRecord record = m_Integrator->trace(*initial, maxSteps, *perturbations);
            record.rayIndex = i;
            record.initialY = y;
            record.initialPhi = initial->x.phi;
            slot.record = std::move(record);
        }
    };

    if (numThreads == 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        std::vector<std::exception_ptr> errors(static_cast<size_t>(numThreads));
        threads.reserve(static_cast<size_t>(numThreads));

        for (int t = 0; t < numThreads; ++t) {
            threads.emplace_back([&, t]() {
                try {
                    worker();
                } catch (...) {
                    errors[static_cast<size_t>(t)] = std::current_exception();
                    nextRay.store(rayCount);
                }
            });
        }

        for (auto& thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }

        for (const auto& error : errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }
    }

    // Collect in ray order
    result.trajectories.reserve(static_cast<size_t>(rayCount));
    for (int i = 0; i < rayCount; ++i) {
        RaySlot& slot = slots[static_cast<size_t>(i)];
        if (slot.skipped) {
            result.skippedIndices.push_back(i);
            LOG_DEBUG("[Beam] Ray " + std::to_string(i) + " skipped: no real inward p_r at y = " +
                      std::to_string(offsets[static_cast<size_t>(i)]));
        } else if (slot.record) {
            result.trajectories.push_back(std::move(*slot.record));
        }
    }
    result.skippedRays = static_cast<int>(result.skippedIndices.size());

    {
        std::ostringstream ss;
        ss << "[Beam] Traced " << result.trajectories.size() << " rays";
        if (result.skippedRays > 0) {
            ss << ", skipped " << result.skippedRays;
        }
        LOG_INFO(ss.str());
    }

    return result;
}

std::vector<TrajectoryRecord> BeamOrchestrator::runBeamSimulation(double startX, double width, int rays,
                                                                  std::optional<int> maxSteps,
                                                                  double theta, double energy) const {
    BeamRequest request;
    request.startX = startX;
    request.width = width;
    request.rays = rays;
    request.maxSteps = maxSteps;
    request.theta = theta;
    request.energy = energy;
    return runBeam(request).trajectories;
}

} // namespace Umbra
