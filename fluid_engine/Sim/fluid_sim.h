#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "fluid_settings.h"
#include "frame_clock.h"
#include "particle_store.h"
#include "spatial_hash.h"
#include "spawner.h"
#include "sph_kernels.h"
#include "Affectors/affector_tracking.h"
#include "Affectors/collision_object.h"
#include "Affectors/force_zone.h"
#include "Affectors/gpu_records.h"

// Scalar density sampled on a voxel grid spanning the simulation bounds.
struct DensityMap {
    int width  = 0;
    int height = 0;
    int depth  = 0;
    std::vector<float> values; // x + width * (y + height * z)

    float at(int x, int y, int z) const { return values[(size_t)x + (size_t)width * ((size_t)y + (size_t)height * (size_t)z)]; }
    bool empty() const { return values.empty(); }
};

// -----------------------------------------------------------------------------
// 3D SPH fluid (density / near-density pressure, optional viscosity).
//
// Per sub-step:
//   external forces -> spatial hash -> reorder -> density -> pressure
//   -> viscosity (if != 0) -> integrate + collide -> restore original order
//
// Each stage is one parallelFor over the particles. Between steps every
// particle buffer is in original order (ids()[i] == i).
//
// Affectors are resampled from their pose sources once per frame and held
// constant across the frame's sub-steps.
// -----------------------------------------------------------------------------
class FluidSim {
public:
    using InitCallback = std::function<void(FluidSim&)>;

    FluidSim();
    explicit FluidSim(const FluidSettings& s);

    // --- Lifecycle ---
    // Allocates N = spawn.points.size() particles. Returns false (logged) if the
    // buffers can't be allocated.
    bool initialize(const SpawnData& spawn);
    bool initialize(const Spawner& spawner) { return initialize(spawner.spawnData()); }
    bool initialized() const { return m_initialized; }

    // Fires once at the end of initialize(); fires immediately if that already happened.
    void onInitialized(InitCallback cb);

    // --- Configuration ---
    bool applySettings(const FluidSettings& s);
    const FluidSettings& settings() const { return m_settings; }

    FrameClock& clock() { return m_clock; }
    const FrameClock& clock() const { return m_clock; }

    // --- Stepping ---
    // One host frame: consults the clock (pause, single step, time scale, clamp).
    void update(float hostDt);

    // One simulation frame of `dt`, split into iterationsPerFrame sub-steps.
    // Ignores the clock. Affector velocities use the same dt.
    void runFrame(float dt);

    // Reseed from the cached spawn data, zero simTime, then pause after one frame.
    // Affector lists are left alone.
    void reset();

    // --- Collision objects ---
    bool addCollisionObject(const CollisionObject& obj);
    bool removeCollisionObject(const CollisionObject& obj);
    bool removeCollisionObjectAt(int index);
    void clearCollisionObjects();
    int  collisionObjectCount() const { return (int)m_collisionObjects.size(); }
    bool getCollisionObject(int index, CollisionObject& out) const;
    bool updateCollisionObjectAt(int index, const CollisionObject& obj);

    // --- Force zones ---
    bool addForceZone(const ForceZone& zone);
    bool removeForceZone(const ForceZone& zone);
    bool removeForceZoneAt(int index);
    void clearForceZones();
    int  forceZoneCount() const { return (int)m_forceZones.size(); }
    bool getForceZone(int index, ForceZone& out) const;
    bool updateForceZoneAt(int index, const ForceZone& zone);

    // Capacity-sized, rewritten in full every frame (unused slots zeroed).
    const std::vector<GpuCollisionObject>& collisionRecords() const { return m_collisionRecords; }
    const std::vector<GpuForceZone>& forceZoneRecords() const { return m_forceZoneRecords; }

    // --- Read-only particle buffers (original order) ---
    int numParticles() const { return m_particles.size(); }
    const std::vector<Vec3>& positions() const { return m_particles.position; }
    const std::vector<Vec3>& predictedPositions() const { return m_particles.predicted; }
    const std::vector<Vec3>& velocities() const { return m_particles.velocity; }
    const std::vector<DensityPair>& densities() const { return m_particles.density; }
    const std::vector<uint32_t>& ids() const { return m_particles.id; }
    const SpawnData& spawnData() const { return m_spawn; }

    const SpatialHash& spatialHash() const { return m_hash; }
    const KernelConstants& kernelConstants() const { return m_kernel; }

    float simTime() const { return m_simTime; }
    uint64_t frameCount() const { return m_frameCount; }

    // --- Density field ---
    // SPH density at p from the last step's predicted positions.
    float sampleDensity(const Vec3& p) const;

    // Voxel grid sized to the bounds' aspect ratio, `resolution` voxels on
    // the longest axis. Returns false before initialization or for resolution < 1.
    bool exportDensityMap(int resolution, DensityMap& out) const;

    // Refreshed every frame when settings().densityMapResolution > 0.
    const DensityMap& densityMap() const { return m_densityMap; }

private:
    // frame / step
    void runFrameInternal(float frameDt, float hostDt);
    void runSimulationStep(float dt);
    void updateKernelConstants();

    // stages (one parallel dispatch each)
    void applyExternalForces(float dt);
    void buildSpatialHash();
    void reorderIntoHashOrder();
    void computeDensities();
    void applyPressureForces(float dt);
    void applyViscosity(float dt);
    void integrateAndCollide(float dt);
    void restoreOriginalOrder();

    // affectors
    void resampleAffectors(float hostDt);
    void uploadAffectors();
    void reseedCollisionTracks();
    void reseedForceZoneTracks();
    void resizeAffectorArenas();

    FluidSettings   m_settings;
    FrameClock      m_clock;
    KernelConstants m_kernel;
    float           m_kernelRadius = -1.0f;

    ParticleStore m_particles;
    SpatialHash   m_hash;
    SpawnData     m_spawn;

    bool     m_initialized = false;
    bool     m_initNotified = false;
    std::vector<InitCallback> m_initCallbacks;

    float    m_simTime = 0.0f;
    uint64_t m_frameCount = 0;

    // Affector arenas (reserved at capacity, compacted on removal)
    std::vector<CollisionObject>    m_collisionObjects;
    std::vector<KinematicsTrack>    m_collisionTracks;
    std::vector<GpuCollisionObject> m_collisionRecords;

    std::vector<ForceZone>       m_forceZones;
    std::vector<KinematicsTrack> m_forceZoneTracks;
    std::vector<GpuForceZone>    m_forceZoneRecords;

    // Active record counts seen by the kernels this frame
    int m_numCollisionRecords = 0;
    int m_numForceZoneRecords = 0;

    DensityMap m_densityMap;
};
