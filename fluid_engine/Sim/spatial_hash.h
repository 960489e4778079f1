#pragma once

#include <cstdint>
#include <vector>

#include "sph_common.h"

// Counting-sort spatial hash.
//
//   key(p)   = hash(floor(p / cellSize)) % tableSize
//   sorted   = stable counting sort of particle indices by key
//   offsets  = first sorted slot of every key (tableSize when the key is empty)
//
// Different cells may share a key; neighbour queries return every particle in
// the matching runs and the caller filters by distance.
class SpatialHash {
public:
    struct Cell { int x = 0, y = 0, z = 0; };

    static constexpr uint32_t kHashK1 = 15823u;
    static constexpr uint32_t kHashK2 = 9737333u;
    static constexpr uint32_t kHashK3 = 440817757u;

    SpatialHash() = default;

    // Sizes all tables for numParticles entries. Throws std::bad_alloc on failure.
    void allocate(int numParticles);

    // Rebuild from scratch. positions.size() must equal the allocated size.
    void build(const std::vector<Vec3>& positions, float cellSize);

    static Cell cellOf(const Vec3& p, float cellSize);
    static uint32_t hashCell(const Cell& c);
    static uint32_t keyFromHash(uint32_t hash, uint32_t tableSize) { return hash % tableSize; }

    // fn(sortedSlot) for every entry in the 3x3x3 cell block around p.
    template <class Fn>
    void forEachNeighbour(const Vec3& p, const Fn& fn) const;

    int size() const { return m_n; }
    float cellSize() const { return m_cellSize; }

    // sortedIndices()[slot] = original index of the particle in that slot.
    const std::vector<uint32_t>& sortedIndices() const { return m_sortedIndices; }
    const std::vector<uint32_t>& sortedKeys() const { return m_sortedKeys; }
    const std::vector<uint32_t>& offsets() const { return m_offsets; }
    const std::vector<uint32_t>& keys() const { return m_keys; }

private:
    int   m_n = 0;
    float m_cellSize = 1.0f;

    std::vector<uint32_t> m_keys;          // per original index
    std::vector<uint32_t> m_sortedIndices; // per sorted slot
    std::vector<uint32_t> m_sortedKeys;    // per sorted slot
    std::vector<uint32_t> m_offsets;       // per key
    std::vector<uint32_t> m_counts;        // per key (scratch)
};

template <class Fn>
void SpatialHash::forEachNeighbour(const Vec3& p, const Fn& fn) const {
    if (m_n <= 0) return;

    const Cell centre = cellOf(p, m_cellSize);
    const uint32_t tableSize = (uint32_t)m_n;

    uint32_t visited[27];
    int numVisited = 0;

    for (int dz = -1; dz <= 1; ++dz) {
        for (int dy = -1; dy <= 1; ++dy) {
            for (int dx = -1; dx <= 1; ++dx) {
                const Cell c{ centre.x + dx, centre.y + dy, centre.z + dz };
                const uint32_t key = keyFromHash(hashCell(c), tableSize);

                bool seen = false;
                for (int k = 0; k < numVisited; ++k) {
                    if (visited[k] == key) { seen = true; break; }
                }
                if (seen) continue;
                visited[numVisited++] = key;

                uint32_t slot = m_offsets[key];
                while (slot < tableSize && m_sortedKeys[slot] == key) {
                    fn((int)slot);
                    ++slot;
                }
            }
        }
    }
}
