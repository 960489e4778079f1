#include "fluid_sim.h"
#include "parallel_for.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <new>

// Between steps the primary buffers are back in original order, so a hash slot
// maps to a particle through sortedIndices(). Predicted positions are what the
// hash was built from and nothing after the hash stage writes them.
float FluidSim::sampleDensity(const Vec3& p) const {
    if (!m_initialized || m_hash.size() <= 0) return 0.0f;

    const KernelConstants k = m_kernel;
    const float h2 = k.radius * k.radius;
    const std::vector<uint32_t>& order = m_hash.sortedIndices();
    const std::vector<Vec3>& pred = m_particles.predicted;

    float density = 0.0f;
    m_hash.forEachNeighbour(p, [&](int slot) {
        const float d2 = lengthSq(pred[order[(size_t)slot]] - p);
        if (d2 > h2) return;
        density += sph_kernels::densityKernel(std::sqrt(d2), k);
    });
    return density;
}

bool FluidSim::exportDensityMap(int resolution, DensityMap& out) const {
    if (!m_initialized || resolution < 1) return false;

    const Vec3 size = m_settings.bounds.size;
    const float maxAxis = maxComponent(size);
    if (!(maxAxis > 0.0f)) return false;

    const int w = std::max(1, (int)std::lround(size.x / maxAxis * (float)resolution));
    const int h = std::max(1, (int)std::lround(size.y / maxAxis * (float)resolution));
    const int d = std::max(1, (int)std::lround(size.z / maxAxis * (float)resolution));

    try {
        out.values.assign((size_t)w * (size_t)h * (size_t)d, 0.0f);
    } catch (const std::bad_alloc&) {
        std::printf("[density] failed to allocate %dx%dx%d map\n", w, h, d);
        return false;
    }
    out.width = w;
    out.height = h;
    out.depth = d;

    const Vec3 origin = m_settings.bounds.centre - size * 0.5f;
    const Vec3 voxel(size.x / (float)w, size.y / (float)h, size.z / (float)d);

    parallelFor(w * h * d, [&](int idx) {
        const int x = idx % w;
        const int y = (idx / w) % h;
        const int z = idx / (w * h);

        const Vec3 p(origin.x + ((float)x + 0.5f) * voxel.x,
                     origin.y + ((float)y + 0.5f) * voxel.y,
                     origin.z + ((float)z + 0.5f) * voxel.z);
        out.values[(size_t)idx] = sampleDensity(p);
    });
    return true;
}
