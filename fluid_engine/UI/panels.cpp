#include "panels.h"

#include "imgui.h"
#include <algorithm>
#include <cfloat>
#include <cmath>
#include <cstdio>
#include <vector>

#include "../Sim/fluid_sim.h"
#include "../Renderer/particle_renderer.h"
#include "../Scene/demo_scene.h"

namespace UI {

struct Ring {
    std::vector<float> v;
    int head = 0;
    bool filled = false;

    Ring(int cap=240) : v(cap, 0.0f) {}

    void push(float x) {
        v[head] = x;
        head = (head + 1) % (int)v.size();
        if (head == 0) filled = true;
    }

    int size() const { return filled ? (int)v.size() : head; }

    // Copy in chronological order into out (for plotting)
    void toChrono(std::vector<float>& out) const {
        int n = size();
        out.resize(n);
        if (!filled) {
            for (int i=0;i<n;i++) out[i] = v[i];
            return;
        }
        for (int i=0;i<n;i++) out[i] = v[(head + i) % (int)v.size()];
    }
};

enum StatID {
    STAT_FRAME_MS,
    STAT_MAX_SPEED,
    STAT_AVG_DENSITY,
    STAT_MAX_DENSITY,

    STAT_COUNT
};

static const char* kStatNames[STAT_COUNT] = {
    "frame ms",
    "max speed",
    "avg density",
    "max density"
};

static Ring g_hist[STAT_COUNT] = { Ring(360), Ring(360), Ring(360), Ring(360) };

static int  g_selectedStat = STAT_FRAME_MS;
static bool g_recordStats  = true;
static std::vector<float> g_plotScratch;
static int  g_spawnDensity = 600;

static const char* kShapeNames[] = { "none", "sphere", "box", "cylinder", "capsule" };
static const char* kModeNames[] = {
    "none", "directional", "radial", "vortex", "turbulence",
    "directional+falloff", "rigid static", "rigid dynamic"
};

static const char* shapeName(int s) { return (s >= 0 && s <= SHAPE_CAPSULE) ? kShapeNames[s] : "?"; }
static const char* modeName(int m) { return (m >= 0 && m <= FORCE_RIGID_DYNAMIC) ? kModeNames[m] : "?"; }

// ---------- helpers ----------
struct FluidStats {
    float maxSpeed = 0.0f;
    float avgDensity = 0.0f;
    float maxDensity = 0.0f;
};

static void computeStats(const FluidSim& sim, FluidStats& out) {
    out = FluidStats{};
    const int n = sim.numParticles();
    if (n == 0) return;

    const std::vector<Vec3>& vel = sim.velocities();
    const std::vector<DensityPair>& dens = sim.densities();

    double sum = 0.0;
    for (int i = 0; i < n; ++i) {
        out.maxSpeed = std::max(out.maxSpeed, length(vel[(size_t)i]));
        out.maxDensity = std::max(out.maxDensity, dens[(size_t)i].density);
        sum += (double)dens[(size_t)i].density;
    }
    out.avgDensity = (float)(sum / (double)n);
}

void SyncFromSim(const FluidSim& sim, Settings& ui) {
    ui.fluid = sim.settings();
    ui.lastApplyRejected = false;
}

static Actions drawControls(FluidSim& sim, Settings& ui) {
    Actions a;

    ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(330, 760), ImGuiCond_FirstUseEver);
    ImGui::Begin("Controls");

    FrameClock& clock = sim.clock();
    const bool paused = clock.paused();
    if (ImGui::Button(paused ? "Play" : "Pause")) clock.togglePause();
    ImGui::SameLine();
    if (ImGui::Button("Step")) clock.requestSingleStep();
    ImGui::SameLine();
    if (ImGui::Button("Reset")) a.resetRequested = true;

    bool slow = clock.slowMode();
    if (ImGui::Checkbox("Slow motion", &slow)) clock.setSlowMode(slow);

    ImGui::Text("t = %.3f s   frame %llu", sim.simTime(), (unsigned long long)sim.frameCount());
    ImGui::Text("%d particles", sim.numParticles());

    ImGui::Separator();
    ImGui::SliderInt("Spawn density", &g_spawnDensity, 50, 2000);
    if (ImGui::Button("Respawn")) {
        a.respawnRequested = true;
        a.spawnDensity = g_spawnDensity;
    }

    bool changed = false;
    FluidSettings& f = ui.fluid;

    if (ImGui::CollapsingHeader("Time step", ImGuiTreeNodeFlags_DefaultOpen)) {
        changed |= ImGui::SliderFloat("Time scale", &f.normalTimeScale, 0.0f, 4.0f);
        changed |= ImGui::SliderFloat("Slow time scale", &f.slowTimeScale, 0.0f, 1.0f);
        changed |= ImGui::SliderFloat("Max timestep FPS", &f.maxTimestepFPS, 0.0f, 240.0f);
        changed |= ImGui::SliderInt("Iterations / frame", &f.iterationsPerFrame, 1, 10);
    }

    if (ImGui::CollapsingHeader("Fluid", ImGuiTreeNodeFlags_DefaultOpen)) {
        changed |= ImGui::SliderFloat("Gravity", &f.gravity, -30.0f, 30.0f);
        changed |= ImGui::SliderFloat("Smoothing radius", &f.smoothingRadius, 0.05f, 0.6f);
        changed |= ImGui::SliderFloat("Target density", &f.targetDensity, 10.0f, 2000.0f);
        changed |= ImGui::SliderFloat("Pressure", &f.pressureMultiplier, 0.0f, 1000.0f);
        changed |= ImGui::SliderFloat("Near pressure", &f.nearPressureMultiplier, 0.0f, 20.0f);
        changed |= ImGui::SliderFloat("Viscosity", &f.viscosityStrength, 0.0f, 0.5f);
        changed |= ImGui::SliderFloat("Collision damping", &f.collisionDamping, 0.0f, 1.0f);
    }

    if (ImGui::CollapsingHeader("Bounds")) {
        changed |= ImGui::DragFloat3("Centre", &f.bounds.centre.x, 0.05f);
        changed |= ImGui::DragFloat3("Size", &f.bounds.size.x, 0.05f, 0.1f, 50.0f);
    }

    if (ImGui::CollapsingHeader("Capacity / density map")) {
        changed |= ImGui::SliderInt("Max collision objects", &f.maxCollisionObjects, kMinAffectorCapacity, kMaxCollisionObjectsLimit);
        changed |= ImGui::SliderInt("Max force zones", &f.maxForceZones, kMinAffectorCapacity, kMaxForceZonesLimit);
        changed |= ImGui::SliderInt("Density map res", &f.densityMapResolution, 0, 128);
    }

    ImGui::Checkbox("Auto apply", &ui.autoApply);
    ImGui::SameLine();
    bool apply = ImGui::Button("Apply");
    ImGui::SameLine();
    if (ImGui::Button("Revert")) SyncFromSim(sim, ui);

    if ((changed && ui.autoApply) || apply) {
        ui.lastApplyRejected = !sim.applySettings(ui.fluid);
    }
    if (ui.lastApplyRejected) {
        ImGui::TextColored(ImVec4(1.0f, 0.4f, 0.3f, 1.0f), "Settings rejected (see log)");
    }

    ImGui::End();
    return a;
}

static void drawAffectorPanel(FluidSim& sim, Scene::DemoScene& scene) {
    if (ImGui::CollapsingHeader("Collision objects", ImGuiTreeNodeFlags_DefaultOpen)) {
        ImGui::Text("%d / %d", sim.collisionObjectCount(), sim.settings().maxCollisionObjects);
        for (int i = 0; i < sim.collisionObjectCount(); ++i) {
            CollisionObject obj;
            if (!sim.getCollisionObject(i, obj)) continue;

            ImGui::PushID(i);
            bool edited = false;
            edited |= ImGui::Checkbox("##active", &obj.active);
            ImGui::SameLine();
            ImGui::Text("#%d %s  r=%.2f", i, shapeName(obj.shapeType), obj.radius);
            edited |= ImGui::SliderFloat("Bounciness", &obj.bounciness, 0.0f, 1.0f);
            edited |= ImGui::SliderFloat("Friction", &obj.friction, 0.0f, 1.0f);
            edited |= ImGui::Checkbox("Momentum transfer", &obj.enableMomentumTransfer);
            if (edited) sim.updateCollisionObjectAt(i, obj);
            if (ImGui::SmallButton("Remove")) sim.removeCollisionObjectAt(i);
            ImGui::Separator();
            ImGui::PopID();
        }
    }

    if (ImGui::CollapsingHeader("Force zones", ImGuiTreeNodeFlags_DefaultOpen)) {
        ImGui::Text("%d / %d", sim.forceZoneCount(), sim.settings().maxForceZones);
        for (int i = 0; i < sim.forceZoneCount(); ++i) {
            ForceZone zone;
            if (!sim.getForceZone(i, zone)) continue;

            ImGui::PushID(1000 + i);
            bool edited = false;
            edited |= ImGui::Checkbox("##active", &zone.active);
            ImGui::SameLine();
            ImGui::Text("#%d %s (%s)", i, modeName(zone.forceMode), shapeName(zone.shapeType));

            if (zone.settings) {
                ImGui::TextDisabled("driven by live settings");
            } else if (!isRigidMode(zone.forceMode)) {
                edited |= ImGui::SliderFloat("Strength", &zone.forceStrength, -50.0f, 50.0f);
                if (zone.forceMode == FORCE_VORTEX)
                    edited |= ImGui::SliderFloat("Twist", &zone.vortexTwist, -1.0f, 1.0f);
                if (zone.forceMode == FORCE_TURBULENCE) {
                    edited |= ImGui::SliderFloat("Frequency", &zone.turbulenceFrequency, 0.1f, 8.0f);
                    edited |= ImGui::SliderFloat("Octaves", &zone.turbulenceOctaves, 1.0f, 8.0f);
                }
            }
            if (edited) sim.updateForceZoneAt(i, zone);
            if (ImGui::SmallButton("Remove")) sim.removeForceZoneAt(i);
            ImGui::Separator();
            ImGui::PopID();
        }
    }

    if (scene.capsuleSettings && ImGui::CollapsingHeader("Capsule settings")) {
        ForceZoneSettings& cs = *scene.capsuleSettings;
        bool dynamic = cs.forceMode == FORCE_RIGID_DYNAMIC;
        if (ImGui::Checkbox("Momentum transfer##capsule", &dynamic))
            cs.forceMode = dynamic ? FORCE_RIGID_DYNAMIC : FORCE_RIGID_STATIC;
        ImGui::SliderFloat("Bounciness##capsule", &cs.bounciness, 0.0f, 1.0f);
        ImGui::SliderFloat("Friction##capsule", &cs.friction, 0.0f, 1.0f);
        ImGui::SliderFloat("Radius##capsule", &cs.customRadius, 0.05f, 1.0f);
        ImGui::SliderFloat("Height##capsule", &cs.customHeight, 0.2f, 3.0f);
    }
}

static void drawDebug(FluidSim& sim, Scene::DemoScene& scene, Settings& ui, float frameMs) {
    ImGui::SetNextWindowPos(ImVec2(10, 780), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(330, 360), ImGuiCond_FirstUseEver);
    ImGui::Begin("Data / Debug");

    FluidStats st;
    computeStats(sim, st);

    if (g_recordStats && sim.clock().state() != CLOCK_PAUSED) {
        g_hist[STAT_FRAME_MS].push(frameMs);
        g_hist[STAT_MAX_SPEED].push(st.maxSpeed);
        g_hist[STAT_AVG_DENSITY].push(st.avgDensity);
        g_hist[STAT_MAX_DENSITY].push(st.maxDensity);
    }

    if (ImGui::BeginTabBar("DebugTabs")) {
        if (ImGui::BeginTabItem("Stats")) {
            ImGui::Text("frame: %.2f ms", frameMs);
            ImGui::Text("max speed: %.3f", st.maxSpeed);
            ImGui::Text("density avg / max: %.1f / %.1f (target %.1f)",
                        st.avgDensity, st.maxDensity, sim.settings().targetDensity);
            ImGui::Text("hash table: %d slots", sim.spatialHash().size());

            ImGui::Separator();
            ImGui::Checkbox("Record", &g_recordStats);
            ImGui::Combo("Stat", &g_selectedStat, kStatNames, STAT_COUNT);
            g_hist[g_selectedStat].toChrono(g_plotScratch);
            if (!g_plotScratch.empty()) {
                ImGui::PlotLines("History", g_plotScratch.data(), (int)g_plotScratch.size(),
                                 0, nullptr, FLT_MAX, FLT_MAX, ImVec2(0, 80));
            }
            ImGui::EndTabItem();
        }
        if (ImGui::BeginTabItem("Affectors")) {
            drawAffectorPanel(sim, scene);
            ImGui::EndTabItem();
        }
        if (ImGui::BeginTabItem("View")) {
            ParticleRenderSettings& r = ui.render;
            const char* planes[] = { "side (XY)", "top (XZ)", "front (ZY)" };
            const char* colors[] = { "spawn", "speed", "density" };
            ImGui::Combo("Plane", &r.viewPlane, planes, 3);
            ImGui::Combo("Colour", &r.colorMode, colors, 3);
            ImGui::SliderInt("Point radius", &r.pointRadius, 0, 4);
            ImGui::SliderFloat("Speed scale", &r.speedScale, 0.5f, 20.0f);
            ImGui::SliderFloat("Density scale", &r.densityScale, 0.5f, 4.0f);
            ImGui::Checkbox("Show affectors", &r.showAffectors);
            ImGui::SliderFloat("View scale", &ui.viewScale, 0.5f, 3.0f);

            ImGui::Separator();
            ImGui::Checkbox("Density slice", &ui.slice.show);
            ImGui::SliderInt("Slice resolution", &ui.sliceResolution, 8, 128);
            ImGui::SliderFloat("Slice", &ui.slice.slice, 0.0f, 1.0f);
            ImGui::SliderFloat("Slice scale", &ui.slice.scale, 0.25f, 4.0f);
            ImGui::EndTabItem();
        }
        ImGui::EndTabBar();
    }

    ImGui::End();
}

static void drawFluidView(ParticleRenderer& renderer, Settings& ui) {
    ImGui::SetNextWindowPos(ImVec2(350, 10), ImGuiCond_FirstUseEver);
    ImGui::Begin("Fluid View");

    const float scale = ui.viewScale;
    const ImVec2 size((float)renderer.width() * scale, (float)renderer.height() * scale);
    ImGui::Image((ImTextureID)(intptr_t)renderer.particleTex(), size);

    if (ui.slice.show) {
        ImGui::Image((ImTextureID)(intptr_t)renderer.densityTex(), size);
    }

    ImGui::End();
}

Actions DrawAll(FluidSim& sim,
                Scene::DemoScene& scene,
                ParticleRenderer& renderer,
                Settings& ui,
                float frameMs)
{
    Actions a = drawControls(sim, ui);
    drawDebug(sim, scene, ui, frameMs);
    drawFluidView(renderer, ui);
    return a;
}

}
