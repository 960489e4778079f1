#include <cstdio>
#include <cmath>
#include <memory>

#include "UI/panels.h"

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#ifdef __APPLE__
  #include <OpenGL/gl3.h>
#else
  #include <GL/gl.h>
#endif

#include "Sim/fluid_sim.h"
#include "Scene/demo_scene.h"
#include "Renderer/particle_renderer.h"

#include "imgui.h"
#include "backends/imgui_impl_glfw.h"
#include "backends/imgui_impl_opengl3.h"

// view texture resolution (side view of the default tank is 8 x 5)
static const int VIEW_W = 640;
static const int VIEW_H = 400;

int main()
{
    if (!glfwInit()) return 1;

    // OpenGL / GLFW hints
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 2);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);

    GLFWwindow* win = glfwCreateWindow(1100, 800, "Fluid Engine", nullptr, nullptr);
    if (!win) {
        glfwTerminate();
        return 1;
    }

    glfwMakeContextCurrent(win);
    glfwSwapInterval(1);

    // ImGui init
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = "imgui.ini";

    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForOpenGL(win, true);
    ImGui_ImplOpenGL3_Init("#version 150");

    int exitCode = 0;
    {
        ParticleRenderer renderer(VIEW_W, VIEW_H);

        std::unique_ptr<Scene::DemoScene> scene = Scene::makeDemoScene();
        FluidSim sim;

        if (!scene->attachTo(sim)) {
            std::printf("[main] simulation failed to initialize\n");
            exitCode = 1;
        }

        UI::Settings ui;
        UI::SyncFromSim(sim, ui);

        double lastTime = glfwGetTime();
        float frameMs = 0.0f;
        DensityMap slice;

        while (exitCode == 0 && !glfwWindowShouldClose(win))
        {
            glfwPollEvents();

            double now = glfwGetTime();
            const float hostDt = (float)(now - lastTime);
            lastTime = now;

            // animators run on host time so affector velocities match what the sim sees
            if (!sim.clock().paused()) scene->update(hostDt);

            const double t0 = glfwGetTime();
            sim.update(hostDt);
            frameMs = (float)((glfwGetTime() - t0) * 1000.0);

            renderer.updateFromSim(sim, ui.render);
            if (ui.slice.show) {
                if (!sim.densityMap().empty()) {
                    renderer.updateDensitySlice(sim, sim.densityMap(), ui.render, ui.slice);
                } else if (sim.exportDensityMap(ui.sliceResolution, slice)) {
                    renderer.updateDensitySlice(sim, slice, ui.render, ui.slice);
                }
            }

            // start imgui frame
            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            UI::Actions actions = UI::DrawAll(sim, *scene, renderer, ui, frameMs);

            if (actions.resetRequested) {
                sim.reset();
            }
            if (actions.respawnRequested) {
                scene->spawner.particleSpawnDensity = actions.spawnDensity;
                if (!sim.initialize(scene->spawner)) {
                    std::printf("[main] respawn at density %d failed\n", actions.spawnDensity);
                    exitCode = 1;
                }
            }

            // render GL
            int w, h;
            glfwGetFramebufferSize(win, &w, &h);
            glViewport(0, 0, w, h);
            glClearColor(0, 0, 0, 1);
            glClear(GL_COLOR_BUFFER_BIT);

            ImGui::Render();
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

            glfwSwapBuffers(win);
        }
    }

    // shutdown
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    glfwDestroyWindow(win);
    glfwTerminate();
    return exitCode;
}
