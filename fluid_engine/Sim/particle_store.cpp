#include "particle_store.h"

#include <algorithm>

void ParticleStore::allocate(int numParticles) {
    const size_t n = (size_t)std::max(0, numParticles);

    position.assign(n, Vec3());
    predicted.assign(n, Vec3());
    velocity.assign(n, Vec3());
    density.assign(n, DensityPair());
    id.assign(n, 0u);

    sortPosition.assign(n, Vec3());
    sortPredicted.assign(n, Vec3());
    sortVelocity.assign(n, Vec3());
    sortDensity.assign(n, DensityPair());
    sortId.assign(n, 0u);

    velocityScratch.assign(n, Vec3());
}

void ParticleStore::seed(const SpawnData& spawn) {
    const size_t n = position.size();

    for (size_t i = 0; i < n; ++i) {
        const Vec3 p = i < spawn.points.size() ? spawn.points[i] : Vec3();
        const Vec3 v = i < spawn.velocities.size() ? spawn.velocities[i] : Vec3();
        position[i]  = p;
        predicted[i] = p;
        velocity[i]  = v;
        density[i]   = DensityPair();
        id[i]        = (uint32_t)i;
    }
}
