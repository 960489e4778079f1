#pragma once

#include <array>
#include <memory>

#include "affector_tracking.h"
#include "falloff_curve.h"
#include "gpu_records.h"
#include "pose.h"

struct ForceZone;

// Authoring-side parameters for a force zone. A zone that keeps a pointer to
// one of these re-reads its force-law parameters from it every frame, so the
// host can tweak a running zone by editing the settings object.
struct ForceZoneSettings {
    int   forceMode = FORCE_DIRECTIONAL;

    Vec3  forceDirection{ 0.0f, 0.0f, 1.0f }; // local space
    float forceStrength = 10.0f;
    FalloffCurve falloffCurve = FalloffCurve::constant(0.0f, 1.0f, 1.0f);

    Vec3  vortexAxis{ 0.0f, 1.0f, 0.0f };     // local space
    float vortexTwist = 0.0f;                 // -1..1, <0 pulls inward

    float turbulenceFrequency = 1.0f;
    float turbulenceOctaves   = 3.0f;

    // RigidStatic / RigidDynamic only
    float mass       = 1.0f;
    float bounciness = 0.5f;
    float friction   = 0.9f;

    // SHAPE_NONE keeps the shape the zone was created with.
    int   shapeOverride = SHAPE_NONE;
    Vec3  customSize{ 1.0f, 1.0f, 1.0f };
    float customRadius = 1.0f;
    float customHeight = 2.0f;

    // Force-law parameters only (mode, directions, strength, falloff, vortex,
    // turbulence, rigid response).
    void applyParametersTo(ForceZone& zone) const;

    // Parameters plus the shape override.
    void applyTo(ForceZone& zone) const;
};

// -----------------------------------------------------------------------------
// Volume that pushes particles around (or, in the rigid modes, acts as a
// collider). Directions are authored in local space and re-expressed in
// world space each frame from the source's rotation.
// -----------------------------------------------------------------------------
struct ForceZone {
    std::weak_ptr<PoseSource> source;
    std::shared_ptr<const ForceZoneSettings> settings; // optional live settings

    int   shapeType  = SHAPE_BOX;
    Vec3  baseSize{ 1.0f, 1.0f, 1.0f };
    float baseRadius = 0.0f;

    int   forceMode = FORCE_DIRECTIONAL;
    Vec3  localDirection{ 0.0f, 0.0f, 1.0f };
    Vec3  localVortexAxis{ 0.0f, 1.0f, 0.0f };
    float forceStrength = 10.0f;
    float vortexTwist = 0.0f;
    float turbulenceFrequency = 1.0f;
    float turbulenceOctaves = 3.0f;

    float mass       = 1.0f;
    float bounciness = 0.5f;
    float friction   = 0.9f;
    bool  active     = true;

    // --- Runtime ---
    Vec3  size{ 1.0f, 1.0f, 1.0f };
    float radius = 0.0f;
    Vec3  position;
    Mat4  rotation;
    Vec3  worldDirection{ 0.0f, 0.0f, 1.0f };
    Vec3  worldVortexAxis{ 0.0f, 1.0f, 0.0f };

    static ForceZone directional(const std::shared_ptr<PoseSource>& src, const Vec3& size,
                                 const Vec3& direction, float strength);
    static ForceZone radial(const std::shared_ptr<PoseSource>& src, float radius,
                            float strength, bool pullToward = false);
    static ForceZone vortex(const std::shared_ptr<PoseSource>& src, float radius, float height,
                            const Vec3& axis, float strength, float twist = 0.0f);
    static ForceZone turbulence(const std::shared_ptr<PoseSource>& src, const Vec3& size,
                                float strength, float frequency = 1.0f, float octaves = 3.0f);

    void setFalloff(const FalloffCurve& curve);
    const FalloffCurve& falloff() const { return m_falloff; }
    const std::array<float, FalloffCurve::kSampleCount>& falloffSamples() const { return m_samples; }

    // Settings refresh, pose sample, rescale, local->world directions.
    // Returns false (pose state untouched) when the source is gone or not ready.
    bool refreshFromSource(Pose& sampled);

    GpuForceZone toGpuRecord(const KinematicsTrack& track) const;

    bool operator==(const ForceZone& o) const;
    bool operator!=(const ForceZone& o) const { return !(*this == o); }

private:
    FalloffCurve m_falloff = FalloffCurve::constant(0.0f, 1.0f, 1.0f);
    std::array<float, FalloffCurve::kSampleCount> m_samples = { 1, 1, 1, 1, 1, 1, 1, 1 };
};
