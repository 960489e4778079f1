#pragma once

#include <memory>

#include "../sph_common.h"

// Snapshot of a host entity's world transform at one instant.
struct Pose {
    Vec3 position;
    Vec3 eulerDegrees;          // Z, then X, then Y
    Vec3 scale{ 1.0f, 1.0f, 1.0f };

    Mat4 rotation() const { return Mat4::fromEulerDegrees(eulerDegrees); }
};

// What the host environment supplies per affector per frame. The solver holds
// sources through std::weak_ptr and never touches the host's object model.
class PoseSource {
public:
    virtual ~PoseSource() = default;

    // Returns false while the entity isn't ready; out is left untouched then.
    virtual bool samplePose(Pose& out) const = 0;
};

// Plain pose holder. Hosts (and the tests) move it by writing `pose`.
class TransformNode : public PoseSource {
public:
    TransformNode() = default;
    explicit TransformNode(const Pose& p) : pose(p) {}

    bool samplePose(Pose& out) const override {
        if (!ready) return false;
        out = pose;
        return true;
    }

    Pose pose;
    bool ready = true;
};

// Same owning entity (both empty also counts as the same).
inline bool sameSource(const std::weak_ptr<PoseSource>& a, const std::weak_ptr<PoseSource>& b) {
    return !a.owner_before(b) && !b.owner_before(a);
}
