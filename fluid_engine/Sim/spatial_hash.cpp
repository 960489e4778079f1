#include "spatial_hash.h"
#include "parallel_for.h"

#include <algorithm>
#include <cmath>

void SpatialHash::allocate(int numParticles) {
    m_n = std::max(0, numParticles);
    const size_t n = (size_t)m_n;

    m_keys.assign(n, 0u);
    m_sortedIndices.assign(n, 0u);
    m_sortedKeys.assign(n, 0u);
    m_offsets.assign(n, (uint32_t)n);
    m_counts.assign(n, 0u);
}

SpatialHash::Cell SpatialHash::cellOf(const Vec3& p, float cellSize) {
    Cell c;
    c.x = (int)std::floor(p.x / cellSize);
    c.y = (int)std::floor(p.y / cellSize);
    c.z = (int)std::floor(p.z / cellSize);
    return c;
}

uint32_t SpatialHash::hashCell(const Cell& c) {
    // Unsigned wraparound is intended.
    const uint32_t a = (uint32_t)c.x * kHashK1;
    const uint32_t b = (uint32_t)c.y * kHashK2;
    const uint32_t d = (uint32_t)c.z * kHashK3;
    return a + b + d;
}

void SpatialHash::build(const std::vector<Vec3>& positions, float cellSize) {
    if (m_n <= 0 || (int)positions.size() != m_n) return;
    if (!(cellSize > 0.0f)) return;

    m_cellSize = cellSize;
    const uint32_t tableSize = (uint32_t)m_n;

    // (1) keys: one dispatch over particles
    parallelFor(m_n, [&](int i) {
        m_keys[(size_t)i] = keyFromHash(hashCell(cellOf(positions[(size_t)i], cellSize)), tableSize);
    });

    // (2) histogram
    std::fill(m_counts.begin(), m_counts.end(), 0u);
    for (int i = 0; i < m_n; ++i) {
        m_counts[m_keys[(size_t)i]]++;
    }

    // (3) exclusive prefix sum -> start of every key's run. Empty keys get the
    // sentinel tableSize in the offset table.
    uint32_t running = 0;
    for (uint32_t k = 0; k < tableSize; ++k) {
        const uint32_t c = m_counts[k];
        m_offsets[k] = c ? running : tableSize;
        m_counts[k] = running; // reuse as scatter cursor
        running += c;
    }

    // (4) stable scatter
    for (int i = 0; i < m_n; ++i) {
        const uint32_t key = m_keys[(size_t)i];
        const uint32_t slot = m_counts[key]++;
        m_sortedIndices[slot] = (uint32_t)i;
        m_sortedKeys[slot] = key;
    }
}
