#pragma once
// Kernel-side affector math. Everything here reads GPU records only, so the
// same code serves collision objects and rigid-mode force zones.

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

#include "falloff_curve.h"
#include "gpu_records.h"

namespace affector_internal {

// Local frame of a record: p_local = R^T (p - position).
struct ShapeFrame {
    int   shapeType = SHAPE_NONE;
    Vec3  position;
    Vec3  size;
    float radius = 0.0f;
    Mat4  rotation;
};

inline ShapeFrame frameOf(const GpuCollisionObject& o) {
    ShapeFrame f;
    f.shapeType = o.shapeType;
    f.position = o.position;
    f.size = o.size;
    f.radius = o.radius;
    for (int k = 0; k < 16; ++k) f.rotation.m[k] = o.rotationMatrix[k];
    return f;
}

inline ShapeFrame frameOf(const GpuForceZone& z) {
    ShapeFrame f;
    f.shapeType = z.shapeType;
    f.position = z.position;
    f.size = z.size;
    f.radius = z.radius;
    for (int k = 0; k < 16; ++k) f.rotation.m[k] = z.rotationMatrix[k];
    return f;
}

inline Vec3 toLocal(const ShapeFrame& f, const Vec3& p) {
    return f.rotation.inverseRotate(p - f.position);
}

inline float signOf(float v) { return v < 0.0f ? -1.0f : 1.0f; }

// Capsule segment half-length along local Y (height includes both caps).
inline float capsuleHalfSegment(const ShapeFrame& f) {
    return std::max(0.5f * f.size.x - f.radius, 0.0f);
}

// Signed distance in local space (negative inside) and the outward local
// normal at the closest surface point.
inline float signedDistanceLocal(const ShapeFrame& f, const Vec3& l, Vec3& normal) {
    switch (f.shapeType) {
    case SHAPE_SPHERE: {
        const float d = length(l);
        normal = (d > 1e-6f) ? l / d : Vec3(0.0f, 1.0f, 0.0f);
        return d - f.radius;
    }
    case SHAPE_BOX: {
        const Vec3 half = f.size * 0.5f;
        const Vec3 q = absComponents(l) - half;
        const Vec3 qPos(std::max(q.x, 0.0f), std::max(q.y, 0.0f), std::max(q.z, 0.0f));
        const float outside = length(qPos);
        if (outside > 0.0f) {
            normal = normalizeOrZero(Vec3(qPos.x * signOf(l.x), qPos.y * signOf(l.y), qPos.z * signOf(l.z)));
            return outside;
        }
        // Inside: nearest face.
        if (q.x >= q.y && q.x >= q.z) { normal = Vec3(signOf(l.x), 0.0f, 0.0f); return q.x; }
        if (q.y >= q.z)               { normal = Vec3(0.0f, signOf(l.y), 0.0f); return q.y; }
        normal = Vec3(0.0f, 0.0f, signOf(l.z));
        return q.z;
    }
    case SHAPE_CYLINDER: {
        const float halfH = 0.5f * f.size.x;
        const float rXZ = std::sqrt(l.x * l.x + l.z * l.z);
        const float dR = rXZ - f.radius;
        const float dY = std::fabs(l.y) - halfH;
        const Vec3 radialN = (rXZ > 1e-6f) ? Vec3(l.x / rXZ, 0.0f, l.z / rXZ) : Vec3(1.0f, 0.0f, 0.0f);
        const Vec3 capN(0.0f, signOf(l.y), 0.0f);

        if (dR > 0.0f && dY > 0.0f) {
            normal = normalizeOrZero(radialN * dR + capN * dY);
            return std::sqrt(dR * dR + dY * dY);
        }
        if (dR > dY) { normal = radialN; return dR; }
        normal = capN;
        return dY;
    }
    case SHAPE_CAPSULE: {
        const float hs = capsuleHalfSegment(f);
        const Vec3 closest(0.0f, sph_internal::clampf(l.y, -hs, hs), 0.0f);
        const Vec3 d = l - closest;
        const float dist = length(d);
        normal = (dist > 1e-6f) ? d / dist : Vec3(1.0f, 0.0f, 0.0f);
        return dist - f.radius;
    }
    default:
        normal = Vec3(0.0f, 1.0f, 0.0f);
        return 1e30f;
    }
}

// Inside test plus normalised distance t in [0,1] (0 = centre/axis, 1 = edge).
inline bool insideNormalised(const ShapeFrame& f, const Vec3& l, float& t) {
    switch (f.shapeType) {
    case SHAPE_SPHERE: {
        if (!(f.radius > 0.0f)) return false;
        t = length(l) / f.radius;
        break;
    }
    case SHAPE_BOX: {
        const Vec3 half = f.size * 0.5f;
        if (!(half.x > 0.0f && half.y > 0.0f && half.z > 0.0f)) return false;
        const Vec3 a = absComponents(l);
        t = std::max(a.x / half.x, std::max(a.y / half.y, a.z / half.z));
        break;
    }
    case SHAPE_CYLINDER: {
        if (!(f.radius > 0.0f)) return false;
        if (std::fabs(l.y) > 0.5f * f.size.x) return false;
        t = std::sqrt(l.x * l.x + l.z * l.z) / f.radius;
        break;
    }
    case SHAPE_CAPSULE: {
        if (!(f.radius > 0.0f)) return false;
        const float hs = capsuleHalfSegment(f);
        const Vec3 closest(0.0f, sph_internal::clampf(l.y, -hs, hs), 0.0f);
        t = length(l - closest) / f.radius;
        break;
    }
    default:
        return false;
    }
    if (t > 1.0f) return false;
    t = sph_internal::clamp01(t);
    return true;
}

// --- Value noise -------------------------------------------------------------

inline float hashLattice(int x, int y, int z, uint32_t seed) {
    uint32_t h = seed;
    h ^= (uint32_t)x * 73856093u;
    h ^= (uint32_t)y * 19349663u;
    h ^= (uint32_t)z * 83492791u;
    h ^= h >> 13;
    h *= 0x5bd1e995u;
    h ^= h >> 15;
    return (float)(h & 0x00ffffffu) / (float)0x00ffffffu * 2.0f - 1.0f; // [-1, 1]
}

inline float smoothStep01(float t) { return t * t * (3.0f - 2.0f * t); }

inline float valueNoise(const Vec3& p, uint32_t seed) {
    const float fx = std::floor(p.x), fy = std::floor(p.y), fz = std::floor(p.z);
    const int ix = (int)fx, iy = (int)fy, iz = (int)fz;
    const float tx = smoothStep01(p.x - fx);
    const float ty = smoothStep01(p.y - fy);
    const float tz = smoothStep01(p.z - fz);

    auto lerp = [](float a, float b, float t) { return a + (b - a) * t; };

    const float c000 = hashLattice(ix,     iy,     iz,     seed);
    const float c100 = hashLattice(ix + 1, iy,     iz,     seed);
    const float c010 = hashLattice(ix,     iy + 1, iz,     seed);
    const float c110 = hashLattice(ix + 1, iy + 1, iz,     seed);
    const float c001 = hashLattice(ix,     iy,     iz + 1, seed);
    const float c101 = hashLattice(ix + 1, iy,     iz + 1, seed);
    const float c011 = hashLattice(ix,     iy + 1, iz + 1, seed);
    const float c111 = hashLattice(ix + 1, iy + 1, iz + 1, seed);

    const float x00 = lerp(c000, c100, tx);
    const float x10 = lerp(c010, c110, tx);
    const float x01 = lerp(c001, c101, tx);
    const float x11 = lerp(c011, c111, tx);
    return lerp(lerp(x00, x10, ty), lerp(x01, x11, ty), tz);
}

inline float fractalNoise(const Vec3& p, int octaves, uint32_t seed) {
    float sum = 0.0f, amp = 1.0f, norm = 0.0f;
    Vec3 q = p;
    for (int o = 0; o < octaves; ++o) {
        sum += valueNoise(q, seed + (uint32_t)o * 1013u) * amp;
        norm += amp;
        amp *= 0.5f;
        q = q * 2.0f;
    }
    return (norm > 0.0f) ? sum / norm : 0.0f;
}

// Three decorrelated channels; time scrolls the sample point.
inline Vec3 turbulenceVector(const Vec3& p, float frequency, float octavesF, float time) {
    const int octaves = sph_internal::clampi((int)octavesF, 1, 8);
    const Vec3 q = p * frequency;
    const Vec3 scroll(time * 0.73f, time * 0.51f, time * 0.37f);
    return Vec3(fractalNoise(q + scroll,                              octaves, 0x9e3779b9u),
                fractalNoise(q + scroll + Vec3(31.4f, 17.2f, 5.9f),   octaves, 0x85ebca6bu),
                fractalNoise(q + scroll + Vec3(-11.8f, 47.3f, 23.1f), octaves, 0xc2b2ae35u));
}

// --- Force laws ----------------------------------------------------------------

// Acceleration contributed by one zone at world position p. Zero outside the
// shape, for inactive zones and for the rigid modes.
inline Vec3 forceZoneAcceleration(const GpuForceZone& z, const Vec3& p, float simTime) {
    if (!(z.isActive > 0.5f)) return Vec3();
    if (z.forceMode == FORCE_NONE || isRigidMode(z.forceMode)) return Vec3();

    const ShapeFrame f = frameOf(z);
    float t = 0.0f;
    if (!insideNormalised(f, toLocal(f, p), t)) return Vec3();

    const float strength = z.forceStrength;

    switch (z.forceMode) {
    case FORCE_DIRECTIONAL:
        return z.forceDirection * (strength * sampleFalloff(z.falloffSamples0, z.falloffSamples1, 0.0f));

    case FORCE_DIRECTIONAL_WITH_FALLOFF:
        return z.forceDirection * (strength * sampleFalloff(z.falloffSamples0, z.falloffSamples1, t));

    case FORCE_RADIAL: {
        const Vec3 dir = normalizeOrZero(p - z.position);
        return dir * (strength * sampleFalloff(z.falloffSamples0, z.falloffSamples1, t));
    }

    case FORCE_VORTEX: {
        const Vec3 axis = z.vortexAxis;
        const Vec3 r = p - z.position;
        const Vec3 radialDir = normalizeOrZero(r - axis * dot(r, axis));
        const Vec3 tangent = cross(axis, radialDir);
        const float fo = sampleFalloff(z.falloffSamples0, z.falloffSamples1, t);
        return (tangent + radialDir * z.vortexTwist) * (strength * fo);
    }

    case FORCE_TURBULENCE: {
        const float fo = sampleFalloff(z.falloffSamples0, z.falloffSamples1, t);
        return turbulenceVector(p, z.turbulenceFrequency, z.turbulenceOctaves, simTime) * (strength * fo);
    }

    default:
        return Vec3();
    }
}

// --- Rigid contact -------------------------------------------------------------

struct RigidBody {
    ShapeFrame frame;
    Vec3  velocity;
    Vec3  angularVelocity;
    Vec3  rotationCenter;
    float bounciness = 0.0f;
    float friction = 0.0f;
    bool  momentumTransfer = false;
};

inline RigidBody rigidBodyOf(const GpuCollisionObject& o) {
    RigidBody b;
    b.frame = frameOf(o);
    b.velocity = o.velocity;
    b.angularVelocity = o.angularVelocity;
    b.rotationCenter = o.rotationCenter;
    b.bounciness = o.bounciness;
    b.friction = o.friction;
    b.momentumTransfer = o.enableMomentumTransfer > 0.5f;
    return b;
}

inline RigidBody rigidBodyOf(const GpuForceZone& z) {
    RigidBody b;
    b.frame = frameOf(z);
    b.velocity = z.velocity;
    b.angularVelocity = z.angularVelocity;
    b.rotationCenter = z.rotationCenter;
    b.bounciness = z.bounciness;
    b.friction = z.friction;
    b.momentumTransfer = (z.forceMode == FORCE_RIGID_DYNAMIC);
    return b;
}

// Pushes a penetrating particle out to the surface and reflects its velocity
// relative to the surface when approaching. The surface velocity is added back
// only with momentum transfer. Returns true on contact.
inline bool resolveRigidContact(const RigidBody& b, Vec3& pos, Vec3& vel) {
    const Vec3 l = toLocal(b.frame, pos);
    Vec3 nLocal;
    const float d = signedDistanceLocal(b.frame, l, nLocal);
    if (!(d < 0.0f)) return false;

    const Vec3 n = normalizeOrZero(b.frame.rotation.rotate(nLocal));
    pos = b.frame.position + b.frame.rotation.rotate(l - nLocal * d);

    const Vec3 surfaceVel = b.velocity + cross(b.angularVelocity, pos - b.rotationCenter);
    const Vec3 vRel = vel - surfaceVel;

    const float vn = dot(vRel, n);
    if (vn < 0.0f) {
        const Vec3 vNormal = n * vn;
        const Vec3 vTangent = vRel - vNormal;
        const Vec3 vRelOut = vNormal * (-b.bounciness) + vTangent * (1.0f - b.friction);
        vel = b.momentumTransfer ? vRelOut + surfaceVel : vRelOut;
    }
    return true;
}

// Active collision objects followed by active rigid-mode zones.
inline void collectRigidBodies(const GpuCollisionObject* objects, int numObjects,
                               const GpuForceZone* zones, int numZones,
                               std::vector<RigidBody>& out) {
    out.clear();
    out.reserve((size_t)(numObjects + numZones));
    for (int c = 0; c < numObjects; ++c) {
        if (objects[c].isActive > 0.5f) out.push_back(rigidBodyOf(objects[c]));
    }
    for (int z = 0; z < numZones; ++z) {
        if (zones[z].isActive > 0.5f && isRigidMode(zones[z].forceMode)) out.push_back(rigidBodyOf(zones[z]));
    }
}

// Fraction of the gap to the surface velocity closed per second.
constexpr float kAffectorDragRate = 20.0f;

// A particle that starts the step inside a momentum-transferring body is
// carried along: its velocity moves toward v + w x (p - pivot) of that body.
// Returns true when the particle was inside.
inline bool applyAffectorDrag(const RigidBody& b, const Vec3& pos, float dt, Vec3& vel) {
    if (!b.momentumTransfer) return false;

    Vec3 nLocal;
    if (!(signedDistanceLocal(b.frame, toLocal(b.frame, pos), nLocal) < 0.0f)) return false;

    const Vec3 surfaceVel = b.velocity + cross(b.angularVelocity, pos - b.rotationCenter);
    const float t = std::min(1.0f, std::max(0.0f, kAffectorDragRate * dt));
    vel += (surfaceVel - vel) * t;
    return true;
}

} // namespace affector_internal
