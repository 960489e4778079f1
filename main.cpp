#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "fluid_engine/Scene/demo_scene.h"
#include "fluid_engine/Sim/fluid_sim.h"

// Headless run of the demo tank: steps the solver at a fixed 60 Hz and writes
// a side view (XY projection) of the particles per frame.

static inline int idx(int x, int y, int w) { return x + y * w; }

static bool writePPM(const std::string& path, int w, int h, const std::vector<uint8_t>& rgb) {
    std::ofstream f(path, std::ios::binary);
    if (!f) return false;
    f << "P6\n" << w << " " << h << "\n255\n";
    f.write(reinterpret_cast<const char*>(rgb.data()), (std::streamsize)rgb.size());
    return (bool)f;
}

// Splat particles into an RGB image, slower = spawn colour, faster = whiter.
static void renderSideView(const FluidSim& sim, int w, int h, std::vector<uint8_t>& rgb) {
    rgb.assign((size_t)w * (size_t)h * 3, 0);

    const SimBounds& b = sim.settings().bounds;
    const Vec3 lo = b.centre - b.size * 0.5f;
    const std::vector<Vec3>& pos = sim.positions();
    const std::vector<Vec3>& vel = sim.velocities();
    const std::vector<Vec3>& colors = sim.spawnData().colors;

    for (size_t i = 0; i < pos.size(); ++i) {
        const float tx = (pos[i].x - lo.x) / b.size.x;
        const float ty = (pos[i].y - lo.y) / b.size.y;
        const int x = (int)(tx * (float)w);
        const int y = h - 1 - (int)(ty * (float)h);
        if (x < 0 || y < 0 || x >= w || y >= h) continue;

        const Vec3 base = i < colors.size() ? colors[i] : Vec3(0.2f, 0.6f, 1.0f);
        const float speedT = std::min(length(vel[i]) / 6.0f, 1.0f);
        const Vec3 c = base * (1.0f - speedT) + Vec3(1.0f, 1.0f, 1.0f) * speedT;

        uint8_t* px = &rgb[(size_t)idx(x, y, w) * 3];
        px[0] = (uint8_t)std::clamp((int)std::lround(c.x * 255.0f), 0, 255);
        px[1] = (uint8_t)std::clamp((int)std::lround(c.y * 255.0f), 0, 255);
        px[2] = (uint8_t)std::clamp((int)std::lround(c.z * 255.0f), 0, 255);
    }
}

int main(int argc, char** argv) {
    const int frames = (argc > 1) ? std::max(1, std::atoi(argv[1])) : 240;
    const std::string outDir = (argc > 2) ? argv[2] : "out";
    const int spawnDensity = (argc > 3) ? std::max(1, std::atoi(argv[3])) : 600;

    std::error_code ec;
    std::filesystem::create_directories(outDir, ec);
    if (ec) {
        std::printf("[headless] can't create %s: %s\n", outDir.c_str(), ec.message().c_str());
        return 1;
    }

    std::unique_ptr<Scene::DemoScene> scene = Scene::makeDemoScene(spawnDensity);

    FluidSim sim;
    if (!scene->attachTo(sim)) {
        std::printf("[headless] simulation failed to initialize\n");
        return 1;
    }

    const float hostDt = 1.0f / 60.0f;
    const int w = 320;
    const int h = (int)std::lround(320.0f * sim.settings().bounds.size.y / sim.settings().bounds.size.x);
    std::vector<uint8_t> rgb;

    for (int f = 0; f < frames; ++f) {
        scene->update(hostDt);
        sim.update(hostDt);

        renderSideView(sim, w, h, rgb);

        char buf[64];
        std::snprintf(buf, sizeof(buf), "frame_%04d.ppm", f);
        const std::string path = (std::filesystem::path(outDir) / buf).string();
        if (!writePPM(path, w, h, rgb)) {
            std::printf("[headless] failed to write %s\n", path.c_str());
            return 1;
        }

        if (f % 30 == 0) {
            std::printf("[headless] frame %d  simTime=%.3f  particles=%d\n", f, sim.simTime(), sim.numParticles());
        }
    }

    std::cout << "Done. Convert to video:\n"
              << "ffmpeg -framerate 60 -i " << outDir << "/frame_%04d.ppm -c:v libx264 -pix_fmt yuv420p fluid.mp4\n";
    return 0;
}
