#include "collision_object.h"

#include <cstring>

CollisionObject CollisionObject::sphere(const std::shared_ptr<PoseSource>& src, float r, float m) {
    CollisionObject o;
    o.source = src;
    o.shapeType = SHAPE_SPHERE;
    o.baseRadius = r;
    o.radius = r;
    o.mass = m;
    return o;
}

CollisionObject CollisionObject::box(const std::shared_ptr<PoseSource>& src, const Vec3& s, float m) {
    CollisionObject o;
    o.source = src;
    o.shapeType = SHAPE_BOX;
    o.baseSize = s;
    o.size = s;
    o.baseRadius = 0.0f;
    o.radius = 0.0f;
    o.mass = m;
    return o;
}

CollisionObject CollisionObject::cylinder(const std::shared_ptr<PoseSource>& src, float height, float r, float m) {
    CollisionObject o;
    o.source = src;
    o.shapeType = SHAPE_CYLINDER;
    o.baseSize = Vec3(height, 0.0f, 0.0f);
    o.size = o.baseSize;
    o.baseRadius = r;
    o.radius = r;
    o.mass = m;
    return o;
}

CollisionObject CollisionObject::capsule(const std::shared_ptr<PoseSource>& src, float height, float r, float m) {
    CollisionObject o = cylinder(src, height, r, m);
    o.shapeType = SHAPE_CAPSULE;
    o.bounciness = 0.8f;
    o.friction = 0.9f;
    return o;
}

bool CollisionObject::refreshFromSource(Pose& sampled) {
    std::shared_ptr<PoseSource> src = source.lock();
    if (!src || !src->samplePose(sampled)) return false;

    position = sampled.position;
    rotation = sampled.rotation();
    rescaleShape(shapeType, sampled.scale, baseSize, baseRadius, size, radius);

    rotationCenter = position;
    if (std::shared_ptr<PoseSource> pivot = rotationPivot.lock()) {
        Pose p;
        if (pivot->samplePose(p)) rotationCenter = p.position;
    }
    return true;
}

GpuCollisionObject CollisionObject::toGpuRecord(const KinematicsTrack& track) const {
    GpuCollisionObject r{};

    r.position = position;
    r.radius = radius;
    r.velocity = track.velocity;
    r.shapeType = shapeType;
    r.size = size;
    r.mass = mass;
    r.bounciness = bounciness;
    r.friction = friction;
    r.enableMomentumTransfer = enableMomentumTransfer ? 1.0f : 0.0f;
    r.isActive = active ? 1.0f : 0.0f;
    std::memcpy(r.rotationMatrix, rotation.m, sizeof(r.rotationMatrix));
    r.angularVelocity = track.angularVelocity;
    r.rotationCenter = rotationCenter;
    return r;
}

bool CollisionObject::operator==(const CollisionObject& o) const {
    return shapeType == o.shapeType && sameSource(source, o.source);
}

void CollisionObjectSettings::applyTo(CollisionObject& obj) const {
    obj.mass = mass;
    obj.bounciness = sph_internal::clamp01(bounciness);
    obj.friction = sph_internal::clamp01(friction);
    obj.enableMomentumTransfer = enableMomentumTransfer;
    obj.rotationPivot = rotationPivot;
}
