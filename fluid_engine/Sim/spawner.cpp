#include "spawner.h"

#include <cmath>
#include <random>

int SpawnRegion::particleCountPerAxis(int spawnDensity) const {
    const int target = (int)(volume() * (float)spawnDensity);
    if (target <= 0) return 0;
    return (int)std::cbrt((double)target);
}

namespace {

Vec3 randomInsideUnitSphere(std::mt19937& rng) {
    std::uniform_real_distribution<float> u(-1.0f, 1.0f);
    for (;;) {
        const Vec3 p(u(rng), u(rng), u(rng));
        if (lengthSq(p) <= 1.0f) return p;
    }
}

} // namespace

SpawnData Spawner::spawnData() const {
    SpawnData out;

    std::mt19937 jitterRng(jitterSeed);
    std::mt19937 colorRng(42u);

    for (const SpawnRegion& region : regions) {
        const int n = region.particleCountPerAxis(particleSpawnDensity);
        if (n <= 0) continue;

        const Vec3 centre = origin + region.centre;
        const float denom = (n > 1) ? (float)(n - 1) : 1.0f;

        for (int x = 0; x < n; ++x) {
            for (int y = 0; y < n; ++y) {
                for (int z = 0; z < n; ++z) {
                    const float tx = (n > 1) ? (float)x / denom : 0.5f;
                    const float ty = (n > 1) ? (float)y / denom : 0.5f;
                    const float tz = (n > 1) ? (float)z / denom : 0.5f;

                    Vec3 p((tx - 0.5f) * region.size + centre.x,
                           (ty - 0.5f) * region.size + centre.y,
                           (tz - 0.5f) * region.size + centre.z);
                    if (jitterStrength > 0.0f) {
                        p += randomInsideUnitSphere(jitterRng) * jitterStrength;
                    }

                    out.points.push_back(p);
                    out.velocities.push_back(initialVelocity);

                    if (useRandomColors && !colorPalette.empty()) {
                        std::uniform_int_distribution<size_t> pick(0, colorPalette.size() - 1);
                        out.colors.push_back(colorPalette[pick(colorRng)]);
                    } else {
                        out.colors.push_back(Vec3(1.0f, 1.0f, 1.0f));
                    }
                }
            }
        }
    }
    return out;
}

int Spawner::particleCount() const {
    int total = 0;
    for (const SpawnRegion& r : regions) {
        const int n = r.particleCountPerAxis(particleSpawnDensity);
        total += n * n * n;
    }
    return total;
}

float Spawner::spawnVolume() const {
    float v = 0.0f;
    for (const SpawnRegion& r : regions) v += r.volume();
    return v;
}
