#pragma once

#include <string>

#include "sph_common.h"

// Axis-aligned container. Particles leaving it are clamped back with the
// offending velocity component reflected and damped.
struct SimBounds {
    Vec3 centre{ 0.0f, 0.0f, 0.0f };
    Vec3 size{ 8.0f, 5.0f, 4.0f };
};

// Every knob the solver reads. Applied through FluidSim::applySettings, which
// rejects degenerate values and keeps the previous settings.
struct FluidSettings {
    // --- Time step ---
    float normalTimeScale    = 1.0f;
    float slowTimeScale      = 0.1f;
    float maxTimestepFPS     = 60.0f; // frame delta clamp; 0 disables
    int   iterationsPerFrame = 3;

    // --- Fluid ---
    float gravity                = -10.0f;
    float smoothingRadius        = 0.2f;
    float targetDensity          = 630.0f;
    float pressureMultiplier     = 288.0f;
    float nearPressureMultiplier = 2.15f;
    float viscosityStrength      = 0.0f;
    float collisionDamping       = 0.95f; // 0..1

    SimBounds bounds;

    // --- Affector capacities ---
    int maxCollisionObjects = 16; // 1..64
    int maxForceZones       = 8;  // 1..32

    // --- Density map (0 = don't sample every frame) ---
    int densityMapResolution = 0;
};

constexpr int kMinAffectorCapacity       = 1;
constexpr int kMaxCollisionObjectsLimit  = 64;
constexpr int kMaxForceZonesLimit        = 32;
constexpr int kMaxDensityMapResolution   = 512;

// Returns false and fills `reason` for the first degenerate value found.
bool validateFluidSettings(const FluidSettings& s, std::string& reason);
