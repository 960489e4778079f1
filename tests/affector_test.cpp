#include <gtest/gtest.h>

#include <cmath>
#include <cstddef>
#include <memory>

#include "Sim/Affectors/affector_shapes.h"
#include "Sim/Affectors/affector_tracking.h"
#include "Sim/Affectors/collision_object.h"
#include "Sim/Affectors/falloff_curve.h"
#include "Sim/Affectors/force_zone.h"
#include "Sim/Affectors/gpu_records.h"

namespace {

std::shared_ptr<TransformNode> nodeAt(const Vec3& p, const Vec3& euler = Vec3(),
                                      const Vec3& scale = Vec3(1.0f, 1.0f, 1.0f)) {
    Pose pose;
    pose.position = p;
    pose.eulerDegrees = euler;
    pose.scale = scale;
    return std::make_shared<TransformNode>(pose);
}

void expectVecNear(const Vec3& a, const Vec3& b, float tol) {
    EXPECT_NEAR(a.x, b.x, tol);
    EXPECT_NEAR(a.y, b.y, tol);
    EXPECT_NEAR(a.z, b.z, tol);
}

} // namespace

// --- Falloff -------------------------------------------------------------------

TEST(FalloffCurve, SamplesMatchCurveAtSevenths) {
    const FalloffCurve c = FalloffCurve::linear(0.0f, 1.0f, 1.0f, 0.0f);
    const auto s = c.sample();
    for (int k = 0; k < FalloffCurve::kSampleCount; ++k) {
        const float t = (float)k / 7.0f;
        EXPECT_NEAR(s[(size_t)k], c.evaluate(t), 1e-6f);
        EXPECT_NEAR(s[(size_t)k], 1.0f - t, 1e-5f);
    }
}

TEST(FalloffCurve, ConstantCurveGivesIdenticalSamples) {
    const auto s = FalloffCurve::constant(0.0f, 1.0f, 0.35f).sample();
    for (float v : s) EXPECT_FLOAT_EQ(v, 0.35f);
}

TEST(FalloffCurve, EmptyCurveSamplesAsOnes) {
    const FalloffCurve c;
    EXPECT_TRUE(c.empty());
    for (float v : c.sample()) EXPECT_FLOAT_EQ(v, 1.0f);
}

TEST(FalloffCurve, EaseInOutHasFlatEnds) {
    const FalloffCurve c = FalloffCurve::easeInOut(0.0f, 1.0f, 1.0f, 0.0f);
    EXPECT_FLOAT_EQ(c.evaluate(0.0f), 1.0f);
    EXPECT_FLOAT_EQ(c.evaluate(1.0f), 0.0f);
    EXPECT_NEAR(c.evaluate(0.5f), 0.5f, 1e-6f);
    EXPECT_GT(c.evaluate(0.1f), 0.9f); // 1 - 3s^2 + 2s^3 at s=0.1 is 0.972
}

TEST(FalloffCurve, KernelLookupInterpolatesPackedSamples) {
    const float s0[4] = { 0.0f, 1.0f, 2.0f, 3.0f };
    const float s1[4] = { 4.0f, 5.0f, 6.0f, 7.0f };
    EXPECT_FLOAT_EQ(sampleFalloff(s0, s1, 0.0f), 0.0f);
    EXPECT_FLOAT_EQ(sampleFalloff(s0, s1, 1.0f), 7.0f);
    EXPECT_NEAR(sampleFalloff(s0, s1, 0.5f), 3.5f, 1e-5f);
    EXPECT_FLOAT_EQ(sampleFalloff(s0, s1, 2.0f), 7.0f); // clamped
}

// --- Kinematics --------------------------------------------------------------

TEST(KinematicsTrack, FirstObservationReportsZeroVelocity) {
    KinematicsTrack track;
    Pose p;
    p.position = Vec3(1.0f, 0.0f, 0.0f);
    track.reseed(p);

    p.position = Vec3(5.0f, 0.0f, 0.0f);
    track.observe(p, 0.1f);
    expectVecNear(track.velocity, Vec3(), 0.0f);

    p.position = Vec3(5.5f, 0.0f, 0.0f);
    track.observe(p, 0.1f);
    expectVecNear(track.velocity, Vec3(5.0f, 0.0f, 0.0f), 1e-4f);
}

TEST(KinematicsTrack, AngularVelocityWrapsAcrossZero) {
    KinematicsTrack track;
    Pose p;
    p.eulerDegrees = Vec3(0.0f, 350.0f, 0.0f);
    track.reseed(p);
    track.observe(p, 1.0f);

    p.eulerDegrees = Vec3(0.0f, 10.0f, 0.0f);
    track.observe(p, 1.0f);
    EXPECT_NEAR(track.angularVelocity.y, 20.0f * sph_internal::kDeg2Rad, 1e-5f);

    p.eulerDegrees = Vec3(0.0f, 350.0f, 0.0f);
    track.observe(p, 1.0f);
    EXPECT_NEAR(track.angularVelocity.y, -20.0f * sph_internal::kDeg2Rad, 1e-5f);
}

TEST(KinematicsTrack, ZeroDeltaTimeReportsZeroVelocity) {
    KinematicsTrack track;
    Pose p;
    track.reseed(p);
    track.observe(p, 0.1f);
    p.position = Vec3(1.0f, 1.0f, 1.0f);
    track.observe(p, 0.0f);
    expectVecNear(track.velocity, Vec3(), 0.0f);
}

// --- Scaling -------------------------------------------------------------------

TEST(AffectorScaling, SphereUsesLargestAxis) {
    Vec3 size;
    float radius = 0.0f;
    rescaleShape(SHAPE_SPHERE, Vec3(1.0f, 3.0f, 2.0f), Vec3(), 0.5f, size, radius);
    EXPECT_FLOAT_EQ(radius, 1.5f);
}

TEST(AffectorScaling, BoxScalesPerAxis) {
    Vec3 size;
    float radius = 0.0f;
    rescaleShape(SHAPE_BOX, Vec3(2.0f, 0.5f, 3.0f), Vec3(1.0f, 2.0f, 1.0f), 0.0f, size, radius);
    expectVecNear(size, Vec3(2.0f, 1.0f, 3.0f), 1e-6f);
}

TEST(AffectorScaling, CylinderHeightFromYRadiusFromXZ) {
    Vec3 size;
    float radius = 0.0f;
    rescaleShape(SHAPE_CAPSULE, Vec3(2.0f, 3.0f, 4.0f), Vec3(1.5f, 0.0f, 0.0f), 0.25f, size, radius);
    EXPECT_FLOAT_EQ(size.x, 4.5f);
    EXPECT_FLOAT_EQ(radius, 1.0f);
}

TEST(AffectorScaling, CollisionObjectRescalesFromBaseEveryRefresh) {
    auto node = nodeAt(Vec3(), Vec3(), Vec3(2.0f, 2.0f, 2.0f));
    CollisionObject obj = CollisionObject::sphere(node, 0.5f);

    Pose p;
    ASSERT_TRUE(obj.refreshFromSource(p));
    EXPECT_FLOAT_EQ(obj.radius, 1.0f);

    // scaled twice from base, not compounded
    ASSERT_TRUE(obj.refreshFromSource(p));
    EXPECT_FLOAT_EQ(obj.radius, 1.0f);
    EXPECT_FLOAT_EQ(obj.baseRadius, 0.5f);
}

// --- Sources ---------------------------------------------------------------------

TEST(AffectorSource, MissingOrUnreadySourceLeavesStateAlone) {
    auto node = nodeAt(Vec3(1.0f, 2.0f, 3.0f));
    CollisionObject obj = CollisionObject::box(node, Vec3(1.0f, 1.0f, 1.0f));

    Pose p;
    ASSERT_TRUE(obj.refreshFromSource(p));
    expectVecNear(obj.position, Vec3(1.0f, 2.0f, 3.0f), 0.0f);

    node->ready = false;
    node->pose.position = Vec3(9.0f, 9.0f, 9.0f);
    EXPECT_FALSE(obj.refreshFromSource(p));
    expectVecNear(obj.position, Vec3(1.0f, 2.0f, 3.0f), 0.0f);

    node.reset();
    EXPECT_FALSE(obj.refreshFromSource(p));
}

TEST(AffectorSource, RotationPivotSetsRotationCentre) {
    auto node = nodeAt(Vec3(1.0f, 0.0f, 0.0f));
    auto pivot = nodeAt(Vec3(0.0f, 0.0f, 0.0f));
    CollisionObject obj = CollisionObject::sphere(node, 0.2f);

    CollisionObjectSettings settings;
    settings.rotationPivot = pivot;
    settings.bounciness = 2.0f; // clamped
    settings.applyTo(obj);
    EXPECT_FLOAT_EQ(obj.bounciness, 1.0f);

    Pose p;
    ASSERT_TRUE(obj.refreshFromSource(p));
    expectVecNear(obj.rotationCenter, Vec3(), 0.0f);
}

TEST(AffectorSource, EqualityIsSourceAndShape) {
    auto a = nodeAt(Vec3());
    auto b = nodeAt(Vec3());
    EXPECT_EQ(CollisionObject::sphere(a, 1.0f), CollisionObject::sphere(a, 2.0f));
    EXPECT_NE(CollisionObject::sphere(a, 1.0f), CollisionObject::sphere(b, 1.0f));
    EXPECT_NE(CollisionObject::sphere(a, 1.0f), CollisionObject::box(a, Vec3(1.0f, 1.0f, 1.0f)));
}

// --- Force zones -------------------------------------------------------------------

TEST(ForceZone, DirectionFollowsSourceRotation) {
    auto node = nodeAt(Vec3(), Vec3(0.0f, 90.0f, 0.0f));
    ForceZone zone = ForceZone::directional(node, Vec3(1.0f, 1.0f, 1.0f), Vec3(0.0f, 0.0f, 1.0f), 5.0f);

    Pose p;
    ASSERT_TRUE(zone.refreshFromSource(p));
    expectVecNear(zone.worldDirection, Vec3(1.0f, 0.0f, 0.0f), 1e-5f);

    node->pose.eulerDegrees = Vec3(-90.0f, 0.0f, 0.0f);
    ASSERT_TRUE(zone.refreshFromSource(p));
    expectVecNear(zone.worldDirection, Vec3(0.0f, 1.0f, 0.0f), 1e-5f);
}

TEST(ForceZone, LiveSettingsAreReappliedOnRefresh) {
    auto node = nodeAt(Vec3());
    auto settings = std::make_shared<ForceZoneSettings>();
    settings->forceMode = FORCE_DIRECTIONAL;
    settings->forceDirection = Vec3(0.0f, 2.0f, 0.0f);
    settings->forceStrength = 3.0f;

    ForceZone zone = ForceZone::directional(node, Vec3(1.0f, 1.0f, 1.0f), Vec3(1.0f, 0.0f, 0.0f), 1.0f);
    zone.settings = settings;

    Pose p;
    ASSERT_TRUE(zone.refreshFromSource(p));
    EXPECT_FLOAT_EQ(zone.forceStrength, 3.0f);
    expectVecNear(zone.worldDirection, Vec3(0.0f, 1.0f, 0.0f), 1e-6f);

    settings->forceStrength = 7.0f;
    settings->falloffCurve = FalloffCurve::constant(0.0f, 1.0f, 0.5f);
    ASSERT_TRUE(zone.refreshFromSource(p));
    EXPECT_FLOAT_EQ(zone.forceStrength, 7.0f);
    EXPECT_FLOAT_EQ(zone.falloffSamples()[3], 0.5f);
}

TEST(ForceZone, ShapeOverrideReplacesBaseDimensions) {
    auto node = nodeAt(Vec3());
    ForceZone zone = ForceZone::directional(node, Vec3(1.0f, 1.0f, 1.0f), Vec3(0.0f, 0.0f, 1.0f), 1.0f);

    ForceZoneSettings s;
    s.forceMode = FORCE_RIGID_STATIC;
    s.shapeOverride = SHAPE_CAPSULE;
    s.customRadius = 0.4f;
    s.customHeight = 2.0f;
    s.applyTo(zone);

    EXPECT_EQ(zone.shapeType, SHAPE_CAPSULE);
    EXPECT_FLOAT_EQ(zone.baseRadius, 0.4f);
    EXPECT_FLOAT_EQ(zone.baseSize.x, 2.0f);
}

TEST(ForceZone, RecordCarriesSamplesAndKinematics) {
    auto node = nodeAt(Vec3(0.5f, 0.0f, 0.0f));
    ForceZone zone = ForceZone::vortex(node, 1.0f, 2.0f, Vec3(0.0f, 1.0f, 0.0f), 4.0f, 0.1f);

    Pose p;
    ASSERT_TRUE(zone.refreshFromSource(p));

    KinematicsTrack track;
    track.velocity = Vec3(1.0f, 2.0f, 3.0f);
    const GpuForceZone r = zone.toGpuRecord(track);

    EXPECT_EQ(r.forceMode, FORCE_VORTEX);
    EXPECT_EQ(r.shapeType, SHAPE_CYLINDER);
    EXPECT_FLOAT_EQ(r.size.x, 2.0f);
    EXPECT_FLOAT_EQ(r.isActive, 1.0f);
    EXPECT_FLOAT_EQ(r.falloffSamples0[0], 1.0f);
    EXPECT_NEAR(r.falloffSamples1[3], 0.0f, 1e-6f);
    expectVecNear(r.velocity, Vec3(1.0f, 2.0f, 3.0f), 0.0f);
    expectVecNear(r.rotationCenter, Vec3(0.5f, 0.0f, 0.0f), 0.0f);
}

TEST(ForceZone, RadialPullTowardIsNegative) {
    auto node = nodeAt(Vec3());
    EXPECT_LT(ForceZone::radial(node, 1.0f, 5.0f, true).forceStrength, 0.0f);
    EXPECT_GT(ForceZone::radial(node, 1.0f, 5.0f, false).forceStrength, 0.0f);
}

// --- Kernel-side math ----------------------------------------------------------------

TEST(ForceLaws, DirectionalInsideOnlyAndRigidModesExertNothing) {
    GpuForceZone z{};
    z.shapeType = SHAPE_BOX;
    z.size = Vec3(2.0f, 2.0f, 2.0f);
    z.forceMode = FORCE_DIRECTIONAL;
    z.forceDirection = Vec3(0.0f, 0.0f, 1.0f);
    z.forceStrength = 10.0f;
    z.isActive = 1.0f;
    Mat4 id;
    for (int k = 0; k < 16; ++k) z.rotationMatrix[k] = id.m[k];
    for (int k = 0; k < 4; ++k) { z.falloffSamples0[k] = 1.0f; z.falloffSamples1[k] = 1.0f; }

    expectVecNear(affector_internal::forceZoneAcceleration(z, Vec3(0.5f, 0.0f, 0.0f), 0.0f),
                  Vec3(0.0f, 0.0f, 10.0f), 1e-6f);
    expectVecNear(affector_internal::forceZoneAcceleration(z, Vec3(1.5f, 0.0f, 0.0f), 0.0f),
                  Vec3(), 0.0f);

    z.forceMode = FORCE_RIGID_DYNAMIC;
    expectVecNear(affector_internal::forceZoneAcceleration(z, Vec3(), 0.0f), Vec3(), 0.0f);

    z.forceMode = FORCE_DIRECTIONAL;
    z.isActive = 0.0f;
    expectVecNear(affector_internal::forceZoneAcceleration(z, Vec3(), 0.0f), Vec3(), 0.0f);
}

TEST(ForceLaws, VortexIsTangentialAroundAxis) {
    GpuForceZone z{};
    z.shapeType = SHAPE_CYLINDER;
    z.size = Vec3(2.0f, 0.0f, 0.0f);
    z.radius = 1.0f;
    z.forceMode = FORCE_VORTEX;
    z.vortexAxis = Vec3(0.0f, 1.0f, 0.0f);
    z.forceStrength = 2.0f;
    z.isActive = 1.0f;
    Mat4 id;
    for (int k = 0; k < 16; ++k) z.rotationMatrix[k] = id.m[k];
    for (int k = 0; k < 4; ++k) { z.falloffSamples0[k] = 1.0f; z.falloffSamples1[k] = 1.0f; }

    // axis (0,1,0) x radial (1,0,0) = (0,0,-1)
    const Vec3 a = affector_internal::forceZoneAcceleration(z, Vec3(0.5f, 0.0f, 0.0f), 0.0f);
    expectVecNear(a, Vec3(0.0f, 0.0f, -2.0f), 1e-5f);
}

TEST(ForceLaws, TurbulenceIsBoundedAndDeterministic) {
    const Vec3 p(0.3f, -1.2f, 2.7f);
    const Vec3 a = affector_internal::turbulenceVector(p, 1.5f, 3.0f, 0.25f);
    const Vec3 b = affector_internal::turbulenceVector(p, 1.5f, 3.0f, 0.25f);
    EXPECT_EQ(a, b);
    EXPECT_LE(std::fabs(a.x), 1.0f);
    EXPECT_LE(std::fabs(a.y), 1.0f);
    EXPECT_LE(std::fabs(a.z), 1.0f);
}

TEST(RigidContact, PushesOutAndReflectsApproachingVelocity) {
    auto node = nodeAt(Vec3());
    CollisionObject obj = CollisionObject::sphere(node, 1.0f);
    obj.enableMomentumTransfer = false;
    Pose p;
    ASSERT_TRUE(obj.refreshFromSource(p));

    const affector_internal::RigidBody body = affector_internal::rigidBodyOf(obj.toGpuRecord(KinematicsTrack()));

    Vec3 pos(0.5f, 0.0f, 0.0f);
    Vec3 vel(-1.0f, 0.0f, 0.0f);
    EXPECT_TRUE(affector_internal::resolveRigidContact(body, pos, vel));
    expectVecNear(pos, Vec3(1.0f, 0.0f, 0.0f), 1e-5f);
    expectVecNear(vel, Vec3(0.7f, 0.0f, 0.0f), 1e-5f);

    // separating velocity is left alone
    pos = Vec3(0.0f, 0.5f, 0.0f);
    vel = Vec3(0.0f, 2.0f, 0.0f);
    EXPECT_TRUE(affector_internal::resolveRigidContact(body, pos, vel));
    expectVecNear(vel, Vec3(0.0f, 2.0f, 0.0f), 1e-6f);

    // outside: no contact
    pos = Vec3(2.0f, 0.0f, 0.0f);
    EXPECT_FALSE(affector_internal::resolveRigidContact(body, pos, vel));
}

TEST(RigidContact, MomentumTransferAddsSurfaceVelocity) {
    GpuCollisionObject r{};
    r.shapeType = SHAPE_BOX;
    r.size = Vec3(2.0f, 2.0f, 2.0f);
    r.velocity = Vec3(0.0f, 3.0f, 0.0f);
    r.bounciness = 0.0f;
    r.friction = 1.0f;
    r.enableMomentumTransfer = 1.0f;
    r.isActive = 1.0f;
    Mat4 id;
    for (int k = 0; k < 16; ++k) r.rotationMatrix[k] = id.m[k];

    const affector_internal::RigidBody body = affector_internal::rigidBodyOf(r);

    // resting particle just under the top face of a box moving up at 3
    Vec3 pos(0.0f, 0.9f, 0.0f);
    Vec3 vel;
    EXPECT_TRUE(affector_internal::resolveRigidContact(body, pos, vel));
    EXPECT_NEAR(pos.y, 1.0f, 1e-5f);
    expectVecNear(vel, Vec3(0.0f, 3.0f, 0.0f), 1e-5f);
}

namespace {

GpuCollisionObject movingBox(const Vec3& velocity, float momentumTransfer) {
    GpuCollisionObject r{};
    r.shapeType = SHAPE_BOX;
    r.size = Vec3(2.0f, 2.0f, 2.0f);
    r.velocity = velocity;
    r.bounciness = 0.5f;
    r.friction = 0.0f;
    r.enableMomentumTransfer = momentumTransfer;
    r.isActive = 1.0f;
    Mat4 id;
    for (int k = 0; k < 16; ++k) r.rotationMatrix[k] = id.m[k];
    return r;
}

} // namespace

TEST(RigidContact, ReflectsRelativeVelocityWithoutMomentumTransfer) {
    const affector_internal::RigidBody body =
        affector_internal::rigidBodyOf(movingBox(Vec3(0.0f, 3.0f, 0.0f), 0.0f));

    // relative velocity (0,-3,0) reflected with bounciness 0.5; the box's own
    // velocity is not added back
    Vec3 pos(0.0f, 0.9f, 0.0f);
    Vec3 vel;
    EXPECT_TRUE(affector_internal::resolveRigidContact(body, pos, vel));
    EXPECT_NEAR(pos.y, 1.0f, 1e-5f);
    expectVecNear(vel, Vec3(0.0f, 1.5f, 0.0f), 1e-5f);

    // with transfer the same hit leaves at 3 + 1.5
    const affector_internal::RigidBody carrying =
        affector_internal::rigidBodyOf(movingBox(Vec3(0.0f, 3.0f, 0.0f), 1.0f));
    pos = Vec3(0.0f, 0.9f, 0.0f);
    vel = Vec3();
    EXPECT_TRUE(affector_internal::resolveRigidContact(carrying, pos, vel));
    expectVecNear(vel, Vec3(0.0f, 4.5f, 0.0f), 1e-5f);
}

TEST(AffectorDrag, PullsInsideParticleTowardSurfaceVelocity) {
    const affector_internal::RigidBody body =
        affector_internal::rigidBodyOf(movingBox(Vec3(0.0f, 0.0f, 3.0f), 1.0f));

    Vec3 vel;
    EXPECT_TRUE(affector_internal::applyAffectorDrag(body, Vec3(0.2f, 0.0f, 0.0f), 1.0f / 60.0f, vel));
    expectVecNear(vel, Vec3(0.0f, 0.0f, 1.0f), 1e-5f);

    // a long step snaps to the surface velocity instead of overshooting
    vel = Vec3();
    EXPECT_TRUE(affector_internal::applyAffectorDrag(body, Vec3(0.2f, 0.0f, 0.0f), 1.0f, vel));
    expectVecNear(vel, Vec3(0.0f, 0.0f, 3.0f), 1e-5f);

    vel = Vec3();
    EXPECT_FALSE(affector_internal::applyAffectorDrag(body, Vec3(1.5f, 0.0f, 0.0f), 1.0f / 60.0f, vel));
    EXPECT_EQ(vel, Vec3());
}

TEST(AffectorDrag, RotatingBodyDragsWithTangentialVelocity) {
    GpuCollisionObject r = movingBox(Vec3(), 1.0f);
    r.angularVelocity = Vec3(0.0f, 2.0f, 0.0f);
    const affector_internal::RigidBody body = affector_internal::rigidBodyOf(r);

    // w x (p - pivot) = (0,2,0) x (0.5,0,0) = (0,0,-1)
    Vec3 vel;
    EXPECT_TRUE(affector_internal::applyAffectorDrag(body, Vec3(0.5f, 0.0f, 0.0f), 1.0f, vel));
    expectVecNear(vel, Vec3(0.0f, 0.0f, -1.0f), 1e-5f);
}

TEST(AffectorDrag, NoDragWithoutMomentumTransfer) {
    const affector_internal::RigidBody body =
        affector_internal::rigidBodyOf(movingBox(Vec3(0.0f, 0.0f, 3.0f), 0.0f));
    Vec3 vel(1.0f, 0.0f, 0.0f);
    EXPECT_FALSE(affector_internal::applyAffectorDrag(body, Vec3(), 1.0f / 60.0f, vel));
    EXPECT_EQ(vel, Vec3(1.0f, 0.0f, 0.0f));
}

TEST(RigidContact, CapsuleHeightIncludesCaps) {
    affector_internal::ShapeFrame f;
    f.shapeType = SHAPE_CAPSULE;
    f.size = Vec3(2.0f, 0.0f, 0.0f);
    f.radius = 0.25f;

    Vec3 n;
    EXPECT_NEAR(affector_internal::signedDistanceLocal(f, Vec3(0.0f, 1.0f, 0.0f), n), 0.0f, 1e-6f);
    EXPECT_LT(affector_internal::signedDistanceLocal(f, Vec3(0.0f, 0.5f, 0.0f), n), 0.0f);
    EXPECT_GT(affector_internal::signedDistanceLocal(f, Vec3(0.0f, 1.1f, 0.0f), n), 0.0f);
}

// --- Record layout ---------------------------------------------------------------------

TEST(RecordLayout, CollisionRecordOffsets) {
    EXPECT_EQ(sizeof(GpuCollisionObject), 156u);
    EXPECT_EQ(offsetof(GpuCollisionObject, position), 0u);
    EXPECT_EQ(offsetof(GpuCollisionObject, shapeType), 28u);
    EXPECT_EQ(offsetof(GpuCollisionObject, mass), 44u);
    EXPECT_EQ(offsetof(GpuCollisionObject, isActive), 60u);
    EXPECT_EQ(offsetof(GpuCollisionObject, padding), 152u);
}

TEST(RecordLayout, ForceZoneRecordOffsets) {
    EXPECT_EQ(sizeof(GpuForceZone), 228u);
    EXPECT_EQ(offsetof(GpuForceZone, forceMode), 44u);
    EXPECT_EQ(offsetof(GpuForceZone, turbulenceOctaves), 140u);
    EXPECT_EQ(offsetof(GpuForceZone, mass), 188u);
    EXPECT_EQ(offsetof(GpuForceZone, angularVelocity), 200u);
    EXPECT_EQ(offsetof(GpuForceZone, padding), 224u);
}
