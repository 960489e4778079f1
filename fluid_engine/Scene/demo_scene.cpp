#include "demo_scene.h"
#include "../Sim/fluid_sim.h"

#include <cmath>
#include <cstdio>
#include <utility>

namespace Scene {

namespace {

std::shared_ptr<TransformNode> makeNode(const Vec3& position, const Vec3& euler = Vec3(),
                                        const Vec3& scale = Vec3(1.0f, 1.0f, 1.0f)) {
    Pose p;
    p.position = position;
    p.eulerDegrees = euler;
    p.scale = scale;
    return std::make_shared<TransformNode>(p);
}

float wrap360(float a) {
    a = std::fmod(a, 360.0f);
    return (a < 0.0f) ? a + 360.0f : a;
}

} // namespace

// --- Animators -----------------------------------------------------------------

MoveBackAndForth::MoveBackAndForth(std::shared_ptr<TransformNode> node, const Vec3& travelDistance, float period)
    : m_node(std::move(node)), m_start(m_node->pose.position), m_travel(travelDistance), m_period(period) {}

void MoveBackAndForth::update(float /*dt*/, float time) {
    if (!(m_period > 0.0f)) return;
    m_node->pose.position = m_start + m_travel * std::sin(time / m_period);
}

MoveInCircle::MoveInCircle(std::shared_ptr<TransformNode> node, float radius, float period)
    : m_node(std::move(node)), m_start(m_node->pose.position), m_radius(radius), m_period(period) {}

void MoveInCircle::update(float dt, float /*time*/) {
    if (!(m_period > 0.0f)) return;
    m_angle += (2.0f * sph_internal::kPi / m_period) * dt;
    m_node->pose.position = m_start + Vec3(std::cos(m_angle) * m_radius, 0.0f, std::sin(m_angle) * m_radius);
}

AutoRotate::AutoRotate(std::shared_ptr<TransformNode> node, const Vec3& degreesPerSecond)
    : m_node(std::move(node)), m_speed(degreesPerSecond) {}

void AutoRotate::update(float dt, float /*time*/) {
    Vec3& e = m_node->pose.eulerDegrees;
    e = Vec3(wrap360(e.x + m_speed.x * dt),
             wrap360(e.y + m_speed.y * dt),
             wrap360(e.z + m_speed.z * dt));
}

// --- Scene -----------------------------------------------------------------------

void DemoScene::update(float dt) {
    time += dt;
    for (auto& a : animators) a->update(dt, time);
}

bool DemoScene::attachTo(FluidSim& sim) const {
    if (!sim.applySettings(settings)) return false;

    const std::vector<CollisionObject> objects = collisionObjects;
    const std::vector<ForceZone> zones = forceZones;

    sim.onInitialized([objects, zones](FluidSim& s) {
        int added = 0;
        for (const CollisionObject& o : objects) added += s.addCollisionObject(o) ? 1 : 0;
        for (const ForceZone& z : zones) added += s.addForceZone(z) ? 1 : 0;
        std::printf("[scene] %d / %d affectors registered\n", added, (int)(objects.size() + zones.size()));
    });

    return sim.initialize(spawner);
}

std::unique_ptr<DemoScene> makeDemoScene(int particleDensity) {
    auto scene = std::make_unique<DemoScene>();

    FluidSettings& s = scene->settings;
    s.bounds.centre = Vec3(0.0f, 0.0f, 0.0f);
    s.bounds.size = Vec3(8.0f, 5.0f, 4.0f);

    scene->spawner.particleSpawnDensity = particleDensity;
    scene->spawner.jitterStrength = 0.02f;
    scene->spawner.regions.push_back(SpawnRegion{ Vec3(-2.2f, 0.2f, 0.0f), 2.5f });

    // Paddle: sphere sliding along Z near the floor.
    auto paddle = makeNode(Vec3(1.2f, -1.6f, 0.0f));
    scene->nodes.push_back(paddle);
    scene->animators.push_back(std::make_unique<MoveBackAndForth>(paddle, Vec3(0.0f, 0.0f, 1.2f), 0.6f));
    scene->collisionObjects.push_back(CollisionObject::sphere(paddle, 0.5f, 2.0f));

    // Spinning block, scaled flat.
    auto block = makeNode(Vec3(2.8f, -1.9f, -0.8f), Vec3(), Vec3(1.6f, 0.5f, 1.0f));
    scene->nodes.push_back(block);
    scene->animators.push_back(std::make_unique<AutoRotate>(block, Vec3(0.0f, 45.0f, 0.0f)));
    scene->collisionObjects.push_back(CollisionObject::box(block, Vec3(1.0f, 1.0f, 1.0f), 5.0f));

    // Current along +X over the floor.
    auto current = makeNode(Vec3(0.0f, -1.8f, 0.0f));
    scene->nodes.push_back(current);
    scene->forceZones.push_back(ForceZone::directional(current, Vec3(4.0f, 1.2f, 4.0f), Vec3(1.0f, 0.0f, 0.0f), 4.0f));

    // Vortex circling the tank centre.
    auto vortex = makeNode(Vec3(0.0f, 0.0f, 0.0f));
    scene->nodes.push_back(vortex);
    scene->animators.push_back(std::make_unique<MoveInCircle>(vortex, 1.0f, 6.0f));
    scene->forceZones.push_back(ForceZone::vortex(vortex, 1.2f, 5.0f, Vec3(0.0f, 1.0f, 0.0f), 6.0f, -0.2f));

    // Light turbulence in the upper half.
    auto stir = makeNode(Vec3(0.0f, 1.2f, 0.0f));
    scene->nodes.push_back(stir);
    scene->forceZones.push_back(ForceZone::turbulence(stir, Vec3(8.0f, 2.5f, 4.0f), 1.5f, 1.2f, 3.0f));

    // Rigid capsule driven through live settings (a zone in RigidDynamic mode).
    auto capsuleNode = makeNode(Vec3(-2.5f, -1.5f, 0.0f), Vec3(0.0f, 0.0f, 90.0f));
    scene->nodes.push_back(capsuleNode);
    scene->animators.push_back(std::make_unique<MoveBackAndForth>(capsuleNode, Vec3(1.0f, 0.0f, 0.0f), 0.8f));

    auto capsuleSettings = std::make_shared<ForceZoneSettings>();
    capsuleSettings->forceMode = FORCE_RIGID_DYNAMIC;
    capsuleSettings->bounciness = 0.3f;
    capsuleSettings->friction = 0.6f;
    capsuleSettings->shapeOverride = SHAPE_CAPSULE;
    capsuleSettings->customRadius = 0.3f;
    capsuleSettings->customHeight = 1.6f;
    scene->capsuleSettings = capsuleSettings;

    ForceZone rigid = ForceZone::directional(capsuleNode, Vec3(1.0f, 1.0f, 1.0f), Vec3(0.0f, 0.0f, 1.0f), 0.0f);
    capsuleSettings->applyTo(rigid);
    rigid.settings = capsuleSettings;
    scene->forceZones.push_back(rigid);

    return scene;
}

} // namespace Scene
