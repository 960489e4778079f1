#pragma once

#include <cstdint>
#include <vector>

#include "particle_store.h"

// Cube of fluid at the start of the simulation.
struct SpawnRegion {
    Vec3  centre;       // relative to Spawner::origin
    float size = 1.0f;  // edge length

    float volume() const { return size * size * size; }

    // cbrt of the whole-particle target count, truncated.
    int particleCountPerAxis(int spawnDensity) const;
};

// Deterministic initial state: the same spawner always yields the same
// points, so cached spawn data and a fresh call agree.
struct Spawner {
    int      particleSpawnDensity = 600; // particles per unit volume
    Vec3     initialVelocity;
    float    jitterStrength = 0.0f;      // radius of the random offset ball
    Vec3     origin;
    uint32_t jitterSeed = 1;

    bool useRandomColors = true;
    std::vector<Vec3> colorPalette = {
        Vec3(0.2f, 0.6f, 1.0f), // blue
        Vec3(0.0f, 0.8f, 0.4f), // green
        Vec3(1.0f, 0.4f, 0.2f), // orange
        Vec3(0.8f, 0.2f, 0.8f), // purple
        Vec3(1.0f, 0.8f, 0.2f), // yellow
        Vec3(1.0f, 0.2f, 0.2f)  // red
    };

    std::vector<SpawnRegion> regions;

    SpawnData spawnData() const;

    // Sum over regions of particlesPerAxis^3.
    int particleCount() const;
    float spawnVolume() const;
};
