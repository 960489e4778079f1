#pragma once

#include <memory>

#include "affector_tracking.h"
#include "gpu_records.h"
#include "pose.h"

// -----------------------------------------------------------------------------
// Rigid shape particles bounce off. The solver owns a bounded list of these;
// the host only supplies the pose source (and optionally a pivot source).
//
// Base size/radius are the unscaled authoring values; size/radius are
// recomputed from them and the source's scale every frame.
// -----------------------------------------------------------------------------
struct CollisionObject {
    std::weak_ptr<PoseSource> source;
    std::weak_ptr<PoseSource> rotationPivot; // empty = rotate around own centre

    int   shapeType  = SHAPE_SPHERE;
    Vec3  baseSize;
    float baseRadius = 0.5f;

    // Physical response
    float mass       = 1.0f;  // carried in the record, unused by the kernels
    float bounciness = 0.7f;  // 0..1
    float friction   = 0.8f;  // 0..1
    bool  enableMomentumTransfer = true;
    bool  active     = true;

    // --- Runtime (rewritten by refreshFromSource) ---
    Vec3  size;
    float radius = 0.5f;
    Vec3  position;
    Mat4  rotation;
    Vec3  rotationCenter;

    static CollisionObject sphere(const std::shared_ptr<PoseSource>& src, float radius, float mass = 1.0f);
    static CollisionObject box(const std::shared_ptr<PoseSource>& src, const Vec3& size, float mass = 1.0f);
    static CollisionObject cylinder(const std::shared_ptr<PoseSource>& src, float height, float radius, float mass = 1.0f);
    static CollisionObject capsule(const std::shared_ptr<PoseSource>& src, float height, float radius, float mass = 1.0f);

    // Samples the source pose and updates position/rotation/scale-derived size.
    // Returns false (state untouched) when the source is gone or not ready.
    bool refreshFromSource(Pose& sampled);

    GpuCollisionObject toGpuRecord(const KinematicsTrack& track) const;

    // Same source entity and same shape.
    bool operator==(const CollisionObject& o) const;
    bool operator!=(const CollisionObject& o) const { return !(*this == o); }
};

// Host-side overrides for an object's physical response.
struct CollisionObjectSettings {
    float mass       = 1.0f;
    float bounciness = 0.7f;
    float friction   = 0.8f;
    bool  enableMomentumTransfer = true;
    std::weak_ptr<PoseSource> rotationPivot;

    void applyTo(CollisionObject& obj) const;
};
