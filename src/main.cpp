#include "components.hpp"
#include "config_loader.hpp"
#include "input_state.hpp"
#include "pipeline.hpp"
#include "scene.hpp"
#include "sim_config.hpp"
#include "modules/debug_module.hpp"
#include "modules/event_bus_module.hpp"
#include "modules/input_module.hpp"
#include "modules/physics_module.hpp"
#include "modules/render_module.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <string>

static const char* CONFIG_PATH = "resources/config/default.json";

int main(int argc, char** argv) {
    const std::string config_path = (argc > 1) ? argv[1] : CONFIG_PATH;

    cubesim::SimConfig config;
    std::string error;
    if (!cubesim::ConfigLoader::load(config_path, config, &error)) {
        TraceLog(LOG_WARNING, "CONFIG: %s, using defaults", error.c_str());
    } else {
        TraceLog(LOG_INFO, "CONFIG: Loaded '%s'", config_path.c_str());
    }
    TraceLog(LOG_INFO, "CONFIG: friction %.3f, force %.1f, dt %.4f s, restitution %.2f",
             config.friction, config.input_force, config.fixed_dt, config.restitution);

    const int width  = static_cast<int>(config.bounds.max.x - config.bounds.min.x);
    const int height = static_cast<int>(config.bounds.max.y - config.bounds.min.y);
    InitWindow(width, height, "Cube Sim");
    SetTargetFPS(60);

    ecs::World world;
    cubesim::Pipeline pipeline(config.fixed_dt, config.max_steps_per_frame);

    // --- Module installation (order matters) ---
    // EventBus first: its flush must be the first Pre-Update step.
    // Debug before the game modules so they can add rows.
    // Render before the Debug overlay so the overlay is drawn on top.
    EventBusModule::install(world, pipeline);
    DebugModule::install(world, pipeline);
    InputModule::install(world, pipeline);
    PhysicsModule::install(world, pipeline, config);
    RenderModule::install(world, pipeline);
    DebugModule::install_overlay(world, pipeline);

    SceneLoader::load(world, config);

    // --- Main Loop ---
    while (!WindowShouldClose()) {
        float dt = GetFrameTime();

        // 1. Input & Logic
        pipeline.update(world, dt);

        if (world.resource<InputRecord>().keys_pressed[KEY_R]) {
            SceneLoader::unload(world);
            SceneLoader::load(world, config);
            TraceLog(LOG_INFO, "SCENE: Body reset");
        }

        // 2. Physics (fixed timestep)
        const float dropped_before = pipeline.stepper().dropped_time();
        const int steps = pipeline.step_physics(world, dt);
        if (pipeline.stepper().dropped_time() > dropped_before) {
            TraceLog(LOG_WARNING, "SIM: Step cap hit, dropped %.3f s of simulation time",
                     pipeline.stepper().dropped_time() - dropped_before);
        }

        auto& clock = world.resource<SimClock>();
        clock.last_frame_steps = steps;
        clock.total_steps      = pipeline.stepper().total_steps();
        clock.dropped_time     = pipeline.stepper().dropped_time();

        // 3. Render
        BeginDrawing();
        pipeline.render(world, dt);
        EndDrawing();
    }

    SceneLoader::unload(world);
    CloseWindow();
    return 0;
}
