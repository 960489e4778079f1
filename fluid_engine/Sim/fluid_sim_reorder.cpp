#include "fluid_sim.h"
#include "parallel_for.h"

void FluidSim::buildSpatialHash() {
    m_hash.build(m_particles.predicted, m_settings.smoothingRadius);
}

// Scatter into the sort targets by the hash permutation, then copy back so the
// primary buffers are in hash order for the neighbour stages. Slot s of every
// primary buffer then holds particle sortedIndices()[s].
void FluidSim::reorderIntoHashOrder() {
    const int n = m_particles.size();
    const uint32_t* order = m_hash.sortedIndices().data();
    ParticleStore& ps = m_particles;

    parallelFor(n, [&](int slot) {
        const uint32_t src = order[slot];
        ps.sortPosition[(size_t)slot]  = ps.position[src];
        ps.sortPredicted[(size_t)slot] = ps.predicted[src];
        ps.sortVelocity[(size_t)slot]  = ps.velocity[src];
        ps.sortId[(size_t)slot]        = ps.id[src];
    });

    parallelFor(n, [&](int i) {
        ps.position[(size_t)i]  = ps.sortPosition[(size_t)i];
        ps.predicted[(size_t)i] = ps.sortPredicted[(size_t)i];
        ps.velocity[(size_t)i]  = ps.sortVelocity[(size_t)i];
        ps.id[(size_t)i]        = ps.sortId[(size_t)i];
    });
}

// Inverse of the reorder: every buffer (density included) goes back to the
// slot named by its stable id, so id[i] == i between steps.
void FluidSim::restoreOriginalOrder() {
    const int n = m_particles.size();
    ParticleStore& ps = m_particles;

    parallelFor(n, [&](int slot) {
        const uint32_t dst = ps.id[(size_t)slot];
        ps.sortPosition[dst]  = ps.position[(size_t)slot];
        ps.sortPredicted[dst] = ps.predicted[(size_t)slot];
        ps.sortVelocity[dst]  = ps.velocity[(size_t)slot];
        ps.sortDensity[dst]   = ps.density[(size_t)slot];
        ps.sortId[dst]        = dst;
    });

    ps.position.swap(ps.sortPosition);
    ps.predicted.swap(ps.sortPredicted);
    ps.velocity.swap(ps.sortVelocity);
    ps.density.swap(ps.sortDensity);
    ps.id.swap(ps.sortId);
}
