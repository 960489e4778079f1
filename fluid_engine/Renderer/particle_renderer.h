#pragma once
#include <vector>
#include <cstdint>

class FluidSim;
struct DensityMap;

enum ViewPlane : int {
    VIEW_SIDE  = 0, // X right, Y up
    VIEW_TOP   = 1, // X right, Z up
    VIEW_FRONT = 2  // Z right, Y up
};

enum ParticleColorMode : int {
    COLOR_SPAWN   = 0,
    COLOR_SPEED   = 1,
    COLOR_DENSITY = 2
};

struct ParticleRenderSettings {
    int   viewPlane = VIEW_SIDE;
    int   colorMode = COLOR_SPEED;
    int   pointRadius = 1;        // pixels
    float speedScale = 6.0f;      // speed mapped to full heat
    float densityScale = 2.0f;    // density / targetDensity mapped to full heat
    bool  showAffectors = true;
};

struct DensitySliceSettings {
    bool  show = false;
    float slice = 0.5f;   // 0..1 along the view depth axis
    float scale = 1.0f;   // density / targetDensity mapped to white
};

// Orthographic CPU splat of the particles into an RGBA texture shown by ImGui.
class ParticleRenderer {
public:
    ParticleRenderer(int w, int h);
    ~ParticleRenderer();

    void resize(int w, int h);

    void updateFromSim(const FluidSim& sim, const ParticleRenderSettings& s);
    void updateDensitySlice(const FluidSim& sim, const DensityMap& map,
                            const ParticleRenderSettings& s, const DensitySliceSettings& ds);

    unsigned int particleTex() const { return m_particleTex; }
    unsigned int densityTex()  const { return m_densityTex; }
    int width() const  { return m_w; }
    int height() const { return m_h; }

private:
    int m_w = 0, m_h = 0;
    unsigned int m_particleTex = 0;
    unsigned int m_densityTex = 0;
    std::vector<uint8_t> m_img;

    unsigned int makeTexture(int w, int h);
    void upload(unsigned int tex);
    void drawAffectors(const FluidSim& sim, const ParticleRenderSettings& s);
};
