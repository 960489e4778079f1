#pragma once

#include <cstdint>
#include <vector>

#include "sph_common.h"

struct DensityPair {
    float density = 0.0f;
    float nearDensity = 0.0f;
};

// Initial particle state produced by the spawner. Kept by the solver so reset
// can reseed from exactly the same data.
struct SpawnData {
    std::vector<Vec3> points;
    std::vector<Vec3> velocities;
    std::vector<Vec3> colors; // display only (rgb 0..1)
};

// Structure-of-arrays particle buffers. N is fixed by allocate().
// Between steps every buffer is in original particle order (id[i] == i).
struct ParticleStore {
    std::vector<Vec3>        position;
    std::vector<Vec3>        predicted;
    std::vector<Vec3>        velocity;
    std::vector<DensityPair> density;
    std::vector<uint32_t>    id;

    // Sort targets (scatter destinations for the reorder stage).
    std::vector<Vec3>        sortPosition;
    std::vector<Vec3>        sortPredicted;
    std::vector<Vec3>        sortVelocity;
    std::vector<DensityPair> sortDensity;
    std::vector<uint32_t>    sortId;

    // Velocity snapshot read by the viscosity kernel.
    std::vector<Vec3>        velocityScratch;

    // Throws std::bad_alloc if the buffers can't be allocated.
    void allocate(int numParticles);

    // Writes positions/velocities/ids from spawn data. Does not reallocate.
    void seed(const SpawnData& spawn);

    int size() const { return (int)position.size(); }
};
