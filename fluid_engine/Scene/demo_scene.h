#pragma once

#include <memory>
#include <vector>

#include "../Sim/Affectors/collision_object.h"
#include "../Sim/Affectors/force_zone.h"
#include "../Sim/Affectors/pose.h"
#include "../Sim/fluid_settings.h"
#include "../Sim/spawner.h"

class FluidSim;

namespace Scene {

// Scripted motion of one transform node, advanced once per host frame.
class Animator {
public:
    virtual ~Animator() = default;
    virtual void update(float dt, float time) = 0;
};

// position = start + sin(time / period) * travelDistance
class MoveBackAndForth : public Animator {
public:
    MoveBackAndForth(std::shared_ptr<TransformNode> node, const Vec3& travelDistance, float period);
    void update(float dt, float time) override;

private:
    std::shared_ptr<TransformNode> m_node;
    Vec3  m_start;
    Vec3  m_travel;
    float m_period;
};

// Circles the start position in the XZ plane, one turn per period.
class MoveInCircle : public Animator {
public:
    MoveInCircle(std::shared_ptr<TransformNode> node, float radius, float period);
    void update(float dt, float time) override;

private:
    std::shared_ptr<TransformNode> m_node;
    Vec3  m_start;
    float m_radius;
    float m_period;
    float m_angle = 0.0f;
};

// Adds degreesPerSecond * dt to the node's Euler angles, wrapped to [0, 360).
class AutoRotate : public Animator {
public:
    AutoRotate(std::shared_ptr<TransformNode> node, const Vec3& degreesPerSecond);
    void update(float dt, float time) override;

private:
    std::shared_ptr<TransformNode> m_node;
    Vec3 m_speed;
};

// Tank of fluid with a moving paddle, a spinning block, a current, a vortex,
// a little turbulence and a rigid capsule driven through live zone settings.
struct DemoScene {
    FluidSettings settings;
    Spawner spawner;

    std::vector<std::shared_ptr<TransformNode>> nodes;
    std::vector<std::unique_ptr<Animator>> animators;
    std::shared_ptr<ForceZoneSettings> capsuleSettings;

    std::vector<CollisionObject> collisionObjects;
    std::vector<ForceZone> forceZones;

    float time = 0.0f;

    // Applies settings and initializes the sim; affectors are registered from
    // the sim's initialized notification.
    bool attachTo(FluidSim& sim) const;

    void update(float dt);
};

// Default tank. particleDensity scales the particle count (600 ~ 9k particles).
std::unique_ptr<DemoScene> makeDemoScene(int particleDensity = 600);

} // namespace Scene
