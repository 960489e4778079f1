#include "fluid_sim.h"
#include "parallel_for.h"

#include <cmath>
#include <cstdio>
#include <new>
#include <string>
#include <utility>

FluidSim::FluidSim() {
    m_clock.normalTimeScale = m_settings.normalTimeScale;
    m_clock.slowTimeScale   = m_settings.slowTimeScale;
    m_clock.maxTimestepFPS  = m_settings.maxTimestepFPS;
    resizeAffectorArenas();
    updateKernelConstants();
}

FluidSim::FluidSim(const FluidSettings& s) : FluidSim() {
    if (!applySettings(s)) {
        std::printf("[settings] keeping defaults\n");
    }
}

bool FluidSim::initialize(const SpawnData& spawn) {
    const int n = (int)spawn.points.size();

    try {
        m_particles.allocate(n);
        m_hash.allocate(n);
        m_spawn = spawn;
        m_spawn.velocities.resize((size_t)n);
    } catch (const std::bad_alloc&) {
        std::printf("[init] failed to allocate buffers for %d particles\n", n);
        m_initialized = false;
        return false;
    }

    m_particles.seed(m_spawn);
    m_simTime = 0.0f;
    m_frameCount = 0;
    m_densityMap = DensityMap();
    updateKernelConstants();
    buildSpatialHash();

    reseedCollisionTracks();
    reseedForceZoneTracks();

    m_initialized = true;
    std::printf("[init] %d particles, h=%.3f, %d worker threads\n",
                n, m_settings.smoothingRadius, parallelWorkerCount());

    if (!m_initNotified) {
        m_initNotified = true;
        std::vector<InitCallback> callbacks;
        callbacks.swap(m_initCallbacks);
        for (InitCallback& cb : callbacks) {
            if (cb) cb(*this);
        }
    }
    return true;
}

void FluidSim::onInitialized(InitCallback cb) {
    if (!cb) return;
    if (m_initNotified) {
        cb(*this);
        return;
    }
    m_initCallbacks.push_back(std::move(cb));
}

bool FluidSim::applySettings(const FluidSettings& s) {
    std::string reason;
    if (!validateFluidSettings(s, reason)) {
        std::printf("[settings] rejected: %s\n", reason.c_str());
        return false;
    }
    if (s.maxCollisionObjects < collisionObjectCount()) {
        std::printf("[settings] rejected: maxCollisionObjects %d < %d objects in use\n",
                    s.maxCollisionObjects, collisionObjectCount());
        return false;
    }
    if (s.maxForceZones < forceZoneCount()) {
        std::printf("[settings] rejected: maxForceZones %d < %d zones in use\n",
                    s.maxForceZones, forceZoneCount());
        return false;
    }

    m_settings = s;

    m_clock.normalTimeScale = s.normalTimeScale;
    m_clock.slowTimeScale   = s.slowTimeScale;
    m_clock.maxTimestepFPS  = s.maxTimestepFPS;

    resizeAffectorArenas();
    updateKernelConstants();
    // Density queries between frames must see the new cell size.
    if (m_initialized) buildSpatialHash();
    return true;
}

void FluidSim::updateKernelConstants() {
    if (m_settings.smoothingRadius == m_kernelRadius) return;
    m_kernelRadius = m_settings.smoothingRadius;
    m_kernel = KernelConstants::forRadius(m_kernelRadius);
}

void FluidSim::update(float hostDt) {
    if (!m_initialized) return;

    if (m_clock.shouldAdvance()) {
        runFrameInternal(m_clock.frameDelta(hostDt), hostDt);
    }
    m_clock.finishFrame();
}

void FluidSim::runFrame(float dt) {
    runFrameInternal(dt, dt);
}

void FluidSim::runFrameInternal(float frameDt, float hostDt) {
    if (!m_initialized) return;
    if (!std::isfinite(frameDt) || frameDt < 0.0f) frameDt = 0.0f;

    updateKernelConstants();

    resampleAffectors(hostDt);
    uploadAffectors();

    const int iterations = m_settings.iterationsPerFrame;
    const float subDt = frameDt / (float)iterations;

    for (int it = 0; it < iterations; ++it) {
        m_simTime += subDt;
        runSimulationStep(subDt);
    }

    if (m_settings.densityMapResolution > 0) {
        if (!exportDensityMap(m_settings.densityMapResolution, m_densityMap)) {
            m_densityMap = DensityMap();
        }
    }
    ++m_frameCount;
}

void FluidSim::runSimulationStep(float dt) {
    applyExternalForces(dt);

    buildSpatialHash();
    reorderIntoHashOrder();

    computeDensities();
    applyPressureForces(dt);
    if (m_settings.viscosityStrength != 0.0f) applyViscosity(dt);
    integrateAndCollide(dt);

    restoreOriginalOrder();
}

void FluidSim::reset() {
    if (!m_initialized) return;

    m_particles.seed(m_spawn);
    m_simTime = 0.0f;
    buildSpatialHash();
    m_clock.pauseAfterNextFrame();

    std::printf("[reset] %d particles reseeded\n", numParticles());
}
