#include <gtest/gtest.h>

#include <limits>
#include <string>

#include "Sim/fluid_settings.h"

namespace {

bool valid(const FluidSettings& s) {
    std::string reason;
    return validateFluidSettings(s, reason);
}

} // namespace

TEST(FluidSettings, DefaultsAreValid) {
    std::string reason;
    EXPECT_TRUE(validateFluidSettings(FluidSettings(), reason)) << reason;
}

TEST(FluidSettings, RejectsDegenerateKernel) {
    FluidSettings s;
    s.smoothingRadius = 0.0f;
    EXPECT_FALSE(valid(s));

    s = FluidSettings();
    s.targetDensity = -1.0f;
    EXPECT_FALSE(valid(s));

    s = FluidSettings();
    s.iterationsPerFrame = 0;
    EXPECT_FALSE(valid(s));
}

TEST(FluidSettings, RejectsNonFiniteValues) {
    FluidSettings s;
    s.gravity = std::numeric_limits<float>::quiet_NaN();
    std::string reason;
    EXPECT_FALSE(validateFluidSettings(s, reason));
    EXPECT_FALSE(reason.empty());

    s = FluidSettings();
    s.bounds.size.y = std::numeric_limits<float>::infinity();
    EXPECT_FALSE(valid(s));
}

TEST(FluidSettings, RejectsNegativeTimeScalesAndBadDamping) {
    FluidSettings s;
    s.slowTimeScale = -0.1f;
    EXPECT_FALSE(valid(s));

    s = FluidSettings();
    s.normalTimeScale = 0.0f; // frozen is allowed
    EXPECT_TRUE(valid(s));

    s = FluidSettings();
    s.collisionDamping = 1.5f;
    EXPECT_FALSE(valid(s));
}

TEST(FluidSettings, RejectsOutOfRangeCapacities) {
    FluidSettings s;
    s.maxCollisionObjects = 0;
    EXPECT_FALSE(valid(s));

    s = FluidSettings();
    s.maxCollisionObjects = kMaxCollisionObjectsLimit + 1;
    EXPECT_FALSE(valid(s));

    s = FluidSettings();
    s.maxForceZones = kMaxForceZonesLimit;
    EXPECT_TRUE(valid(s));

    s = FluidSettings();
    s.densityMapResolution = -1;
    EXPECT_FALSE(valid(s));
}

TEST(FluidSettings, RejectsFlatBounds) {
    FluidSettings s;
    s.bounds.size.z = 0.0f;
    EXPECT_FALSE(valid(s));
}
