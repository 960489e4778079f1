#pragma once
#include <cstdint>

#include "../Sim/fluid_settings.h"
#include "../Renderer/particle_renderer.h"

class FluidSim;

namespace Scene { struct DemoScene; }

namespace UI {

struct Settings {
    // Editable copy of the solver settings; pushed through applySettings on Apply
    FluidSettings fluid;
    bool  autoApply = true;
    bool  lastApplyRejected = false;

    // View
    ParticleRenderSettings render;
    DensitySliceSettings   slice;
    float viewScale = 1.0f;

    // Density slice export
    int   sliceResolution = 48;
};

struct Actions {
    bool resetRequested = false;
    bool respawnRequested = false; // re-run the scene's spawner at a new density
    int  spawnDensity = 600;
};

// Copies the sim's current settings into the UI's editable copy.
void SyncFromSim(const FluidSim& sim, Settings& ui);

// Draw all panels (Controls, Data / Debug, Fluid View).
Actions DrawAll(FluidSim& sim,
                Scene::DemoScene& scene,
                ParticleRenderer& renderer,
                Settings& ui,
                float frameMs);

}
