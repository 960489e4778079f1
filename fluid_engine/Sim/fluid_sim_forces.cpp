#include "fluid_sim.h"
#include "parallel_for.h"
#include "Affectors/affector_shapes.h"

#include <vector>

// Gravity plus force-zone accelerations, then the drag of moving rigid bodies
// on particles caught inside them, then the predicted position the spatial
// hash and the density/pressure stages work from.
void FluidSim::applyExternalForces(float dt) {
    const int n = m_particles.size();
    const Vec3 gravity(0.0f, m_settings.gravity, 0.0f);
    const float simTime = m_simTime;

    const GpuForceZone* zones = m_forceZoneRecords.data();
    const int numZones = m_numForceZoneRecords;

    std::vector<affector_internal::RigidBody> bodies;
    affector_internal::collectRigidBodies(m_collisionRecords.data(), m_numCollisionRecords,
                                          zones, numZones, bodies);
    const affector_internal::RigidBody* body = bodies.data();
    const int numBodies = (int)bodies.size();

    Vec3* pos  = m_particles.position.data();
    Vec3* vel  = m_particles.velocity.data();
    Vec3* pred = m_particles.predicted.data();

    parallelFor(n, [&](int i) {
        Vec3 accel = gravity;
        for (int z = 0; z < numZones; ++z) {
            accel += affector_internal::forceZoneAcceleration(zones[z], pos[i], simTime);
        }

        Vec3 v = vel[i] + accel * dt;
        for (int b = 0; b < numBodies; ++b) {
            affector_internal::applyAffectorDrag(body[b], pos[i], dt, v);
        }

        vel[i] = v;
        pred[i] = pos[i] + v * dt;
    });
}
