#include "force_zone.h"

#include <cmath>
#include <cstring>

void ForceZoneSettings::applyParametersTo(ForceZone& zone) const {
    zone.forceMode = forceMode;
    zone.localDirection = normalizeOrZero(forceDirection);
    zone.localVortexAxis = normalizeOrZero(vortexAxis);
    zone.forceStrength = forceStrength;
    if (zone.falloff() != falloffCurve) zone.setFalloff(falloffCurve);
    zone.vortexTwist = vortexTwist;
    zone.turbulenceFrequency = turbulenceFrequency;
    zone.turbulenceOctaves = turbulenceOctaves;
    zone.mass = mass;
    zone.bounciness = sph_internal::clamp01(bounciness);
    zone.friction = sph_internal::clamp01(friction);
}

void ForceZoneSettings::applyTo(ForceZone& zone) const {
    applyParametersTo(zone);

    if (shapeOverride == SHAPE_NONE) return;

    zone.shapeType = shapeOverride;
    switch (shapeOverride) {
    case SHAPE_SPHERE:
        zone.baseRadius = customRadius;
        break;
    case SHAPE_BOX:
        zone.baseSize = customSize;
        break;
    case SHAPE_CYLINDER:
    case SHAPE_CAPSULE:
        zone.baseSize = Vec3(customHeight, 0.0f, 0.0f);
        zone.baseRadius = customRadius;
        break;
    default:
        break;
    }
    zone.size = zone.baseSize;
    zone.radius = zone.baseRadius;
}

ForceZone ForceZone::directional(const std::shared_ptr<PoseSource>& src, const Vec3& s,
                                 const Vec3& direction, float strength) {
    ForceZone z;
    z.source = src;
    z.shapeType = SHAPE_BOX;
    z.baseSize = s;
    z.size = s;
    z.forceMode = FORCE_DIRECTIONAL;
    z.localDirection = normalizeOrZero(direction);
    z.worldDirection = z.localDirection;
    z.forceStrength = strength;
    z.setFalloff(FalloffCurve::constant(0.0f, 1.0f, 1.0f));
    return z;
}

ForceZone ForceZone::radial(const std::shared_ptr<PoseSource>& src, float r,
                            float strength, bool pullToward) {
    ForceZone z;
    z.source = src;
    z.shapeType = SHAPE_SPHERE;
    z.baseRadius = r;
    z.radius = r;
    z.forceMode = FORCE_RADIAL;
    z.forceStrength = pullToward ? -std::fabs(strength) : std::fabs(strength);
    z.setFalloff(FalloffCurve::easeInOut(0.0f, 1.0f, 1.0f, 0.0f));
    return z;
}

ForceZone ForceZone::vortex(const std::shared_ptr<PoseSource>& src, float r, float height,
                            const Vec3& axis, float strength, float twist) {
    ForceZone z;
    z.source = src;
    z.shapeType = SHAPE_CYLINDER;
    z.baseSize = Vec3(height, 0.0f, 0.0f);
    z.size = z.baseSize;
    z.baseRadius = r;
    z.radius = r;
    z.forceMode = FORCE_VORTEX;
    z.localVortexAxis = normalizeOrZero(axis);
    z.worldVortexAxis = z.localVortexAxis;
    z.forceStrength = strength;
    z.vortexTwist = twist;
    z.setFalloff(FalloffCurve::linear(0.0f, 1.0f, 1.0f, 0.0f));
    return z;
}

ForceZone ForceZone::turbulence(const std::shared_ptr<PoseSource>& src, const Vec3& s,
                                float strength, float frequency, float octaves) {
    ForceZone z;
    z.source = src;
    z.shapeType = SHAPE_BOX;
    z.baseSize = s;
    z.size = s;
    z.forceMode = FORCE_TURBULENCE;
    z.forceStrength = strength;
    z.turbulenceFrequency = frequency;
    z.turbulenceOctaves = octaves;
    z.setFalloff(FalloffCurve::constant(0.0f, 1.0f, 1.0f));
    return z;
}

void ForceZone::setFalloff(const FalloffCurve& curve) {
    m_falloff = curve;
    m_samples = m_falloff.sample();
}

bool ForceZone::refreshFromSource(Pose& sampled) {
    if (settings) settings->applyParametersTo(*this);

    std::shared_ptr<PoseSource> src = source.lock();
    if (!src || !src->samplePose(sampled)) return false;

    position = sampled.position;
    rotation = sampled.rotation();
    rescaleShape(shapeType, sampled.scale, baseSize, baseRadius, size, radius);

    worldDirection = normalizeOrZero(rotation.rotate(localDirection));
    worldVortexAxis = normalizeOrZero(rotation.rotate(localVortexAxis));
    return true;
}

GpuForceZone ForceZone::toGpuRecord(const KinematicsTrack& track) const {
    GpuForceZone r{};

    r.position = position;
    r.radius = radius;
    r.forceDirection = worldDirection;
    r.shapeType = shapeType;
    r.size = size;
    r.forceMode = forceMode;
    r.forceStrength = forceStrength;
    r.isActive = active ? 1.0f : 0.0f;
    r.vortexTwist = vortexTwist;
    r.turbulenceFrequency = turbulenceFrequency;
    std::memcpy(r.rotationMatrix, rotation.m, sizeof(r.rotationMatrix));
    r.vortexAxis = worldVortexAxis;
    r.turbulenceOctaves = turbulenceOctaves;
    for (int k = 0; k < 4; ++k) {
        r.falloffSamples0[k] = m_samples[(size_t)k];
        r.falloffSamples1[k] = m_samples[(size_t)k + 4];
    }
    r.velocity = track.velocity;
    r.mass = mass;
    r.bounciness = bounciness;
    r.friction = friction;
    r.angularVelocity = track.angularVelocity;
    r.rotationCenter = position;
    return r;
}

bool ForceZone::operator==(const ForceZone& o) const {
    return shapeType == o.shapeType && forceMode == o.forceMode && sameSource(source, o.source);
}
