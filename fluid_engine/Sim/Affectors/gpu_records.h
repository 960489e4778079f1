#pragma once

#include <cstddef>
#include <cstdint>

#include "../sph_common.h"

enum AffectorShape : int {
    SHAPE_NONE     = 0,
    SHAPE_SPHERE   = 1,
    SHAPE_BOX      = 2,
    SHAPE_CYLINDER = 3,
    SHAPE_CAPSULE  = 4
};

enum ForceZoneMode : int {
    FORCE_NONE                     = 0,
    FORCE_DIRECTIONAL              = 1,
    FORCE_RADIAL                   = 2,
    FORCE_VORTEX                   = 3,
    FORCE_TURBULENCE               = 4,
    FORCE_DIRECTIONAL_WITH_FALLOFF = 5,
    FORCE_RIGID_STATIC             = 6, // bounce, no momentum transfer
    FORCE_RIGID_DYNAMIC            = 7  // bounce + momentum transfer
};

inline bool isRigidMode(int mode) {
    return mode == FORCE_RIGID_STATIC || mode == FORCE_RIGID_DYNAMIC;
}

// -----------------------------------------------------------------------------
// Records consumed by the kernels. Field order is a fixed binary contract:
// 4-byte fields grouped into 16-byte rows, matrix column-major.
// Cylinder/capsule height lives in size.x.
// -----------------------------------------------------------------------------
struct GpuCollisionObject {
    Vec3    position;               // 12
    float   radius;                 // 4

    Vec3    velocity;               // 12
    int32_t shapeType;              // 4

    Vec3    size;                   // 12
    float   mass;                   // 4

    float   bounciness;             // 4
    float   friction;               // 4
    float   enableMomentumTransfer; // 4 (0/1)
    float   isActive;               // 4 (0/1)

    float   rotationMatrix[16];     // 64

    Vec3    angularVelocity;        // 12 (rad/s)
    Vec3    rotationCenter;         // 12
    float   padding;                // 4
};

struct GpuForceZone {
    Vec3    position;               // 12
    float   radius;                 // 4

    Vec3    forceDirection;         // 12 (world, normalised)
    int32_t shapeType;              // 4

    Vec3    size;                   // 12
    int32_t forceMode;              // 4

    float   forceStrength;          // 4
    float   isActive;               // 4
    float   vortexTwist;            // 4
    float   turbulenceFrequency;    // 4

    float   rotationMatrix[16];     // 64

    Vec3    vortexAxis;             // 12 (world, normalised)
    float   turbulenceOctaves;      // 4

    float   falloffSamples0[4];     // 16 (t = 0/7 .. 3/7)
    float   falloffSamples1[4];     // 16 (t = 4/7 .. 7/7)

    Vec3    velocity;               // 12
    float   mass;                   // 4

    float   bounciness;             // 4
    float   friction;               // 4
    Vec3    angularVelocity;        // 12

    Vec3    rotationCenter;         // 12
    float   padding;                // 4
};

static_assert(sizeof(Vec3) == 12, "Vec3 must be 3 packed floats");

static_assert(offsetof(GpuCollisionObject, velocity) == 16, "collision record layout");
static_assert(offsetof(GpuCollisionObject, size) == 32, "collision record layout");
static_assert(offsetof(GpuCollisionObject, bounciness) == 48, "collision record layout");
static_assert(offsetof(GpuCollisionObject, rotationMatrix) == 64, "collision record layout");
static_assert(offsetof(GpuCollisionObject, angularVelocity) == 128, "collision record layout");
static_assert(offsetof(GpuCollisionObject, rotationCenter) == 140, "collision record layout");
static_assert(sizeof(GpuCollisionObject) == 156, "collision record must stay 156 bytes");

static_assert(offsetof(GpuForceZone, forceDirection) == 16, "force zone record layout");
static_assert(offsetof(GpuForceZone, size) == 32, "force zone record layout");
static_assert(offsetof(GpuForceZone, forceStrength) == 48, "force zone record layout");
static_assert(offsetof(GpuForceZone, rotationMatrix) == 64, "force zone record layout");
static_assert(offsetof(GpuForceZone, vortexAxis) == 128, "force zone record layout");
static_assert(offsetof(GpuForceZone, falloffSamples0) == 144, "force zone record layout");
static_assert(offsetof(GpuForceZone, falloffSamples1) == 160, "force zone record layout");
static_assert(offsetof(GpuForceZone, velocity) == 176, "force zone record layout");
static_assert(offsetof(GpuForceZone, bounciness) == 192, "force zone record layout");
static_assert(offsetof(GpuForceZone, rotationCenter) == 212, "force zone record layout");
static_assert(sizeof(GpuForceZone) == 228, "force zone record must stay 228 bytes");
