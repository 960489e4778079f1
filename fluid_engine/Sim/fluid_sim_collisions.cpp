#include "fluid_sim.h"
#include "parallel_for.h"
#include "Affectors/affector_shapes.h"

#include <cmath>

namespace {

// Clamp into the container; the offending velocity component is reflected
// and scaled by the damping factor.
inline void resolveBounds(const SimBounds& b, float damping, Vec3& pos, Vec3& vel) {
    const Vec3 half = b.size * 0.5f;
    Vec3 local = pos - b.centre;

    if (std::fabs(local.x) > half.x) {
        local.x = half.x * (local.x < 0.0f ? -1.0f : 1.0f);
        vel.x *= -damping;
    }
    if (std::fabs(local.y) > half.y) {
        local.y = half.y * (local.y < 0.0f ? -1.0f : 1.0f);
        vel.y *= -damping;
    }
    if (std::fabs(local.z) > half.z) {
        local.z = half.z * (local.z < 0.0f ? -1.0f : 1.0f);
        vel.z *= -damping;
    }

    pos = b.centre + local;
}

} // namespace

void FluidSim::integrateAndCollide(float dt) {
    const int n = m_particles.size();
    const SimBounds bounds = m_settings.bounds;
    const float damping = m_settings.collisionDamping;

    // Bodies are the same for every particle; build them once per step.
    std::vector<affector_internal::RigidBody> bodies;
    affector_internal::collectRigidBodies(m_collisionRecords.data(), m_numCollisionRecords,
                                          m_forceZoneRecords.data(), m_numForceZoneRecords, bodies);

    Vec3* pos = m_particles.position.data();
    Vec3* vel = m_particles.velocity.data();
    const affector_internal::RigidBody* body = bodies.data();
    const int numBodies = (int)bodies.size();

    parallelFor(n, [&](int i) {
        Vec3 p = pos[i] + vel[i] * dt;
        Vec3 v = vel[i];

        for (int b = 0; b < numBodies; ++b) {
            affector_internal::resolveRigidContact(body[b], p, v);
        }
        resolveBounds(bounds, damping, p, v);

        pos[i] = p;
        vel[i] = v;
    });
}
