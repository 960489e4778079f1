#pragma once

#include "pose.h"
#include "gpu_records.h"

// Finite-difference velocity history for one affector slot.
struct KinematicsTrack {
    Vec3 lastPosition;
    Vec3 lastEuler;
    Vec3 velocity;
    Vec3 angularVelocity;  // rad/s
    bool hasHistory = false;

    // Seeds the history without reporting any motion.
    void reseed(const Pose& p) {
        lastPosition = p.position;
        lastEuler = p.eulerDegrees;
        velocity = Vec3();
        angularVelocity = Vec3();
        hasHistory = false;
    }

    // First observation after a reseed reports zero velocity.
    void observe(const Pose& p, float deltaTime) {
        if (hasHistory && deltaTime > 0.0f) {
            velocity = (p.position - lastPosition) / deltaTime;

            Vec3 d = p.eulerDegrees - lastEuler;
            d.x = sph_internal::wrapDegrees(d.x);
            d.y = sph_internal::wrapDegrees(d.y);
            d.z = sph_internal::wrapDegrees(d.z);
            angularVelocity = d * (sph_internal::kDeg2Rad / deltaTime);
        } else {
            velocity = Vec3();
            angularVelocity = Vec3();
        }

        lastPosition = p.position;
        lastEuler = p.eulerDegrees;
        hasHistory = true;
    }
};

// Scale-derived dimensions from cached unscaled base values.
// Sphere: radius * max axis. Box: per axis. Cylinder/capsule: height (size.x)
// by Y, radius by max(X, Z).
inline void rescaleShape(int shape, const Vec3& scale,
                         const Vec3& baseSize, float baseRadius,
                         Vec3& outSize, float& outRadius) {
    switch (shape) {
    case SHAPE_SPHERE:
        outRadius = baseRadius * maxComponent(scale);
        break;
    case SHAPE_BOX:
        outSize = mulComponents(baseSize, scale);
        break;
    case SHAPE_CYLINDER:
    case SHAPE_CAPSULE:
        outRadius = baseRadius * std::max(scale.x, scale.z);
        outSize = Vec3(baseSize.x * scale.y, 0.0f, 0.0f);
        break;
    default:
        break;
    }
}
