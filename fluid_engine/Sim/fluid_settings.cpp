#include "fluid_settings.h"

#include <cmath>

namespace {

bool allFinite(const FluidSettings& s) {
    const float values[] = {
        s.normalTimeScale, s.slowTimeScale, s.maxTimestepFPS,
        s.gravity, s.smoothingRadius, s.targetDensity,
        s.pressureMultiplier, s.nearPressureMultiplier,
        s.viscosityStrength, s.collisionDamping
    };
    for (float v : values) {
        if (!std::isfinite(v)) return false;
    }
    return isFiniteVec(s.bounds.centre) && isFiniteVec(s.bounds.size);
}

} // namespace

bool validateFluidSettings(const FluidSettings& s, std::string& reason) {
    if (!allFinite(s)) {
        reason = "non-finite value";
        return false;
    }
    if (s.smoothingRadius <= 0.0f) {
        reason = "smoothingRadius must be > 0";
        return false;
    }
    if (s.targetDensity <= 0.0f) {
        reason = "targetDensity must be > 0";
        return false;
    }
    if (s.iterationsPerFrame < 1) {
        reason = "iterationsPerFrame must be >= 1";
        return false;
    }
    if (s.normalTimeScale < 0.0f || s.slowTimeScale < 0.0f) {
        reason = "time scales must be >= 0";
        return false;
    }
    if (s.maxTimestepFPS < 0.0f) {
        reason = "maxTimestepFPS must be >= 0 (0 disables the clamp)";
        return false;
    }
    if (s.collisionDamping < 0.0f || s.collisionDamping > 1.0f) {
        reason = "collisionDamping must be in [0, 1]";
        return false;
    }
    if (!(s.bounds.size.x > 0.0f && s.bounds.size.y > 0.0f && s.bounds.size.z > 0.0f)) {
        reason = "bounds size must be > 0 on every axis";
        return false;
    }
    if (s.maxCollisionObjects < kMinAffectorCapacity || s.maxCollisionObjects > kMaxCollisionObjectsLimit) {
        reason = "maxCollisionObjects must be in [1, 64]";
        return false;
    }
    if (s.maxForceZones < kMinAffectorCapacity || s.maxForceZones > kMaxForceZonesLimit) {
        reason = "maxForceZones must be in [1, 32]";
        return false;
    }
    if (s.densityMapResolution < 0 || s.densityMapResolution > kMaxDensityMapResolution) {
        reason = "densityMapResolution must be in [0, 512]";
        return false;
    }
    return true;
}
