#include "fluid_sim.h"
#include "parallel_for.h"

#include <cmath>

// All three stages run on hash-ordered buffers: the slot handed out by the
// neighbour query indexes the primary buffers directly.

void FluidSim::computeDensities() {
    const int n = m_particles.size();
    const KernelConstants k = m_kernel;
    const float h2 = k.radius * k.radius;

    const Vec3* pred = m_particles.predicted.data();
    DensityPair* dens = m_particles.density.data();
    const SpatialHash& hash = m_hash;

    parallelFor(n, [&](int i) {
        const Vec3 p = pred[i];
        float density = 0.0f;
        float nearDensity = 0.0f;

        hash.forEachNeighbour(p, [&](int j) {
            const Vec3 offset = pred[j] - p;
            const float d2 = lengthSq(offset);
            if (d2 > h2) return;

            const float d = std::sqrt(d2);
            density     += sph_kernels::densityKernel(d, k);
            nearDensity += sph_kernels::nearDensityKernel(d, k);
        });

        dens[i].density = density;
        dens[i].nearDensity = nearDensity;
    });
}

void FluidSim::applyPressureForces(float dt) {
    const int n = m_particles.size();
    const KernelConstants k = m_kernel;
    const float h2 = k.radius * k.radius;
    const float targetDensity = m_settings.targetDensity;
    const float pressureMul = m_settings.pressureMultiplier;
    const float nearPressureMul = m_settings.nearPressureMultiplier;

    const Vec3* pred = m_particles.predicted.data();
    const DensityPair* dens = m_particles.density.data();
    Vec3* vel = m_particles.velocity.data();
    const SpatialHash& hash = m_hash;

    auto pressureOf = [&](float density) { return (density - targetDensity) * pressureMul; };
    auto nearPressureOf = [&](float nearDensity) { return nearDensity * nearPressureMul; };

    parallelFor(n, [&](int i) {
        const float density = dens[i].density;
        const float nearDensity = dens[i].nearDensity;
        if (!(density > 0.0f)) return;

        const float pressure = pressureOf(density);
        const float nearPressure = nearPressureOf(nearDensity);
        const Vec3 p = pred[i];

        Vec3 force;
        hash.forEachNeighbour(p, [&](int j) {
            if (j == i) return;

            const Vec3 offset = pred[j] - p;
            const float d2 = lengthSq(offset);
            if (d2 > h2) return;

            const float d = std::sqrt(d2);
            const Vec3 dir = (d > 0.0f) ? offset / d : Vec3(0.0f, 1.0f, 0.0f);

            const float densityJ = dens[j].density;
            const float nearDensityJ = dens[j].nearDensity;
            const float sharedPressure = 0.5f * (pressure + pressureOf(densityJ));
            const float sharedNearPressure = 0.5f * (nearPressure + nearPressureOf(nearDensityJ));

            if (densityJ > 0.0f) {
                force += dir * (sph_kernels::densityDerivative(d, k) * sharedPressure / densityJ);
            }
            if (nearDensityJ > 0.0f) {
                force += dir * (sph_kernels::nearDensityDerivative(d, k) * sharedNearPressure / nearDensityJ);
            }
        });

        vel[i] += force / density * dt;
    });
}

// Reads a snapshot so the result doesn't depend on which particles were
// already updated.
void FluidSim::applyViscosity(float dt) {
    const int n = m_particles.size();
    const KernelConstants k = m_kernel;
    const float h2 = k.radius * k.radius;
    const float strength = m_settings.viscosityStrength;

    m_particles.velocityScratch = m_particles.velocity;

    const Vec3* pred = m_particles.predicted.data();
    const Vec3* velIn = m_particles.velocityScratch.data();
    Vec3* vel = m_particles.velocity.data();
    const SpatialHash& hash = m_hash;

    parallelFor(n, [&](int i) {
        const Vec3 p = pred[i];
        const Vec3 v = velIn[i];

        Vec3 viscosityForce;
        hash.forEachNeighbour(p, [&](int j) {
            if (j == i) return;

            const float d2 = lengthSq(pred[j] - p);
            if (d2 > h2) return;

            viscosityForce += (velIn[j] - v) * sph_kernels::viscosityKernel(std::sqrt(d2), k);
        });

        vel[i] += viscosityForce * (strength * dt);
    });
}
