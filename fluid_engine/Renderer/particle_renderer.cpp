#include "particle_renderer.h"
#include "Sim/fluid_sim.h"
#include <algorithm>
#include <cmath>

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#ifdef __APPLE__
  #define GL_SILENCE_DEPRECATION
  #include <OpenGL/gl3.h>
#else
  #include <GL/gl.h>
#endif

namespace {

// Projects world p onto the view plane; returns normalised (u, v) in the bounds
// and the depth coordinate in `depth`.
void project(const SimBounds& b, int plane, const Vec3& p, float& u, float& v, float& depth) {
    const Vec3 lo = b.centre - b.size * 0.5f;
    const Vec3 t((p.x - lo.x) / b.size.x, (p.y - lo.y) / b.size.y, (p.z - lo.z) / b.size.z);
    switch (plane) {
    case VIEW_TOP:   u = t.x; v = t.z; depth = t.y; break;
    case VIEW_FRONT: u = t.z; v = t.y; depth = t.x; break;
    default:         u = t.x; v = t.y; depth = t.z; break;
    }
}

// Cheap blue -> cyan -> yellow -> red ramp.
void heat(float t, float& r, float& g, float& b) {
    t = sph_internal::clamp01(t);
    r = sph_internal::clamp01(t * 2.0f - 0.5f);
    g = sph_internal::clamp01(t < 0.5f ? t * 2.0f : 2.0f - t * 2.0f) * 0.9f + 0.1f;
    b = sph_internal::clamp01(1.0f - t * 2.0f);
}

} // namespace

// ---------------- helpers ----------------
unsigned int ParticleRenderer::makeTexture(int w, int h) {
    GLuint tex = 0;
    glGenTextures(1, &tex);
    glBindTexture(GL_TEXTURE_2D, tex);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    std::vector<uint8_t> blank((size_t)w * (size_t)h * 4, 0);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, w, h, 0, GL_RGBA, GL_UNSIGNED_BYTE, blank.data());
    return (unsigned int)tex;
}

ParticleRenderer::ParticleRenderer(int w, int h) : m_w(w), m_h(h) {
    m_particleTex = makeTexture(w, h);
    m_densityTex = makeTexture(w, h);
}

ParticleRenderer::~ParticleRenderer() {
    if (m_particleTex) glDeleteTextures(1, (GLuint*)&m_particleTex);
    if (m_densityTex)  glDeleteTextures(1, (GLuint*)&m_densityTex);
}

void ParticleRenderer::resize(int w, int h) {
    if (w == m_w && h == m_h) return;
    m_w = w; m_h = h;
    if (m_particleTex) glDeleteTextures(1, (GLuint*)&m_particleTex);
    if (m_densityTex)  glDeleteTextures(1, (GLuint*)&m_densityTex);
    m_particleTex = makeTexture(w, h);
    m_densityTex = makeTexture(w, h);
}

void ParticleRenderer::upload(unsigned int tex) {
    glBindTexture(GL_TEXTURE_2D, tex);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, m_w, m_h, GL_RGBA, GL_UNSIGNED_BYTE, m_img.data());
}

void ParticleRenderer::updateFromSim(const FluidSim& sim, const ParticleRenderSettings& s) {
    const int w = m_w, h = m_h;
    m_img.assign((size_t)w * (size_t)h * 4, 0);

    // background
    for (size_t i = 0; i < (size_t)w * (size_t)h; ++i) {
        m_img[i * 4 + 0] = 12;
        m_img[i * 4 + 1] = 14;
        m_img[i * 4 + 2] = 20;
        m_img[i * 4 + 3] = 255;
    }

    const SimBounds& b = sim.settings().bounds;
    const std::vector<Vec3>& pos = sim.positions();
    const std::vector<Vec3>& vel = sim.velocities();
    const std::vector<DensityPair>& dens = sim.densities();
    const std::vector<Vec3>& colors = sim.spawnData().colors;
    const float target = sim.settings().targetDensity;
    const int rad = std::max(0, s.pointRadius);

    // far-to-near so nearer particles land on top
    std::vector<std::pair<float, int>> order;
    order.reserve(pos.size());
    for (size_t i = 0; i < pos.size(); ++i) {
        float u, v, d;
        project(b, s.viewPlane, pos[i], u, v, d);
        order.emplace_back(d, (int)i);
    }
    std::sort(order.begin(), order.end(),
              [](const std::pair<float, int>& a, const std::pair<float, int>& c) { return a.first > c.first; });

    for (const auto& e : order) {
        const size_t i = (size_t)e.second;
        float u, v, depth;
        project(b, s.viewPlane, pos[i], u, v, depth);

        const int cx = (int)(u * (float)w);
        const int cy = h - 1 - (int)(v * (float)h);

        float r = 0.2f, g = 0.6f, bl = 1.0f;
        if (s.colorMode == COLOR_SPAWN && i < colors.size()) {
            r = colors[i].x; g = colors[i].y; bl = colors[i].z;
        } else if (s.colorMode == COLOR_SPEED) {
            heat(length(vel[i]) / std::max(s.speedScale, 1e-3f), r, g, bl);
        } else if (s.colorMode == COLOR_DENSITY && target > 0.0f) {
            heat(dens[i].density / (target * std::max(s.densityScale, 1e-3f)), r, g, bl);
        }

        const float shade = 0.55f + 0.45f * (1.0f - sph_internal::clamp01(depth));
        for (int dy = -rad; dy <= rad; ++dy) {
            for (int dx = -rad; dx <= rad; ++dx) {
                const int x = cx + dx, y = cy + dy;
                if (x < 0 || y < 0 || x >= w || y >= h) continue;
                uint8_t* px = &m_img[((size_t)x + (size_t)w * (size_t)y) * 4];
                px[0] = (uint8_t)std::lround(sph_internal::clamp01(r * shade) * 255.0f);
                px[1] = (uint8_t)std::lround(sph_internal::clamp01(g * shade) * 255.0f);
                px[2] = (uint8_t)std::lround(sph_internal::clamp01(bl * shade) * 255.0f);
                px[3] = 255;
            }
        }
    }

    if (s.showAffectors) drawAffectors(sim, s);
    upload(m_particleTex);
}

// Outline (circle of the bounding radius) plus a centre dot per active record.
void ParticleRenderer::drawAffectors(const FluidSim& sim, const ParticleRenderSettings& s) {
    const int w = m_w, h = m_h;
    const SimBounds& b = sim.settings().bounds;
    const float pxPerUnit = (float)w / ((s.viewPlane == VIEW_FRONT) ? b.size.z : b.size.x);

    auto setpix = [&](int x, int y, uint8_t r, uint8_t g, uint8_t bl) {
        if (x < 0 || y < 0 || x >= w || y >= h) return;
        uint8_t* px = &m_img[((size_t)x + (size_t)w * (size_t)y) * 4];
        px[0] = r; px[1] = g; px[2] = bl; px[3] = 255;
    };

    auto outline = [&](const Vec3& c, float worldRadius, uint8_t r, uint8_t g, uint8_t bl) {
        float u, v, d;
        project(b, s.viewPlane, c, u, v, d);
        const int cx = (int)(u * (float)w);
        const int cy = h - 1 - (int)(v * (float)h);
        const float pr = std::max(2.0f, worldRadius * pxPerUnit);
        const int segments = 64;
        for (int k = 0; k < segments; ++k) {
            const float a = 2.0f * sph_internal::kPi * (float)k / (float)segments;
            setpix(cx + (int)std::lround(std::cos(a) * pr), cy + (int)std::lround(std::sin(a) * pr), r, g, bl);
        }
        setpix(cx, cy, r, g, bl);
    };

    auto boundingRadius = [](int shape, const Vec3& size, float radius) {
        switch (shape) {
        case SHAPE_SPHERE: return radius;
        case SHAPE_BOX: return 0.5f * length(size);
        case SHAPE_CYLINDER:
        case SHAPE_CAPSULE: return std::max(radius, 0.5f * size.x);
        default: return 0.0f;
        }
    };

    const std::vector<GpuCollisionObject>& objs = sim.collisionRecords();
    for (int i = 0; i < sim.collisionObjectCount(); ++i) {
        const GpuCollisionObject& o = objs[(size_t)i];
        if (!(o.isActive > 0.5f)) continue;
        outline(o.position, boundingRadius(o.shapeType, o.size, o.radius), 240, 240, 240);
    }

    const std::vector<GpuForceZone>& zones = sim.forceZoneRecords();
    for (int i = 0; i < sim.forceZoneCount(); ++i) {
        const GpuForceZone& z = zones[(size_t)i];
        if (!(z.isActive > 0.5f)) continue;
        if (isRigidMode(z.forceMode)) outline(z.position, boundingRadius(z.shapeType, z.size, z.radius), 240, 200, 60);
        else outline(z.position, boundingRadius(z.shapeType, z.size, z.radius), 90, 220, 120);
    }
}

void ParticleRenderer::updateDensitySlice(const FluidSim& sim, const DensityMap& map,
                                          const ParticleRenderSettings& s, const DensitySliceSettings& ds) {
    const int w = m_w, h = m_h;
    m_img.assign((size_t)w * (size_t)h * 4, 0);
    if (map.empty()) {
        upload(m_densityTex);
        return;
    }

    const float target = sim.settings().targetDensity;
    const float inv = (target > 0.0f && ds.scale > 0.0f) ? 1.0f / (target * ds.scale) : 0.0f;

    for (int j = 0; j < h; ++j) {
        const float v = 1.0f - ((float)j + 0.5f) / (float)h;
        for (int i = 0; i < w; ++i) {
            const float u = ((float)i + 0.5f) / (float)w;

            int x = 0, y = 0, z = 0;
            const float sl = sph_internal::clamp01(ds.slice);
            switch (s.viewPlane) {
            case VIEW_TOP:
                x = (int)(u * map.width); z = (int)(v * map.depth); y = (int)(sl * map.height);
                break;
            case VIEW_FRONT:
                z = (int)(u * map.depth); y = (int)(v * map.height); x = (int)(sl * map.width);
                break;
            default:
                x = (int)(u * map.width); y = (int)(v * map.height); z = (int)(sl * map.depth);
                break;
            }
            x = sph_internal::clampi(x, 0, map.width - 1);
            y = sph_internal::clampi(y, 0, map.height - 1);
            z = sph_internal::clampi(z, 0, map.depth - 1);

            const float t = sph_internal::clamp01(map.at(x, y, z) * inv);
            float r, g, b;
            heat(t, r, g, b);

            uint8_t* px = &m_img[((size_t)i + (size_t)w * (size_t)j) * 4];
            px[0] = (uint8_t)std::lround(r * t * 255.0f);
            px[1] = (uint8_t)std::lround(g * t * 255.0f);
            px[2] = (uint8_t)std::lround(b * t * 255.0f);
            px[3] = 255;
        }
    }
    upload(m_densityTex);
}
