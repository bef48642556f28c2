#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../systems/debug.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// DebugModule
//
// Creates the DebugPanel and SimClock world resources and registers
// Engine-level debug rows (FPS, frame time, entity count, fixed steps).
//
// install() must run BEFORE any module that adds its own debug rows, so the
// DebugPanel resource exists when they call try_resource<DebugPanel>().
// install_overlay() adds DebugSystem to the Render phase and must come after
// RenderModule so the overlay is drawn on top.
// ---------------------------------------------------------------------------

struct DebugModule {
    static void install(ecs::World& world, cubesim::Pipeline& /*pipeline*/) {
        DebugPanel panel;

        panel.watch("Engine", "FPS", []() {
            return std::to_string(GetFPS());
        });
        panel.watch("Engine", "Frame Time", []() {
            char b[16];
            std::snprintf(b, sizeof(b), "%d ms", (int)(GetFrameTime() * 1000));
            return std::string(b);
        });
        panel.watch("Engine", "Entities", [&world]() {
            return std::to_string(world.count());
        });
        panel.watch("Engine", "Steps/Frame", [&world]() {
            auto* clock = world.try_resource<SimClock>();
            if (!clock) return std::string("-");
            return std::to_string(clock->last_frame_steps);
        });
        panel.watch("Engine", "Total Steps", [&world]() {
            auto* clock = world.try_resource<SimClock>();
            if (!clock) return std::string("-");
            return std::to_string(clock->total_steps);
        });
        panel.watch("Engine", "Dropped", [&world]() {
            auto* clock = world.try_resource<SimClock>();
            if (!clock) return std::string("-");
            char b[16];
            std::snprintf(b, sizeof(b), "%.2f s", clock->dropped_time);
            return std::string(b);
        });

        world.set_resource(std::move(panel));
        world.set_resource(SimClock{});
    }

    static void install_overlay(ecs::World& /*world*/, cubesim::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float dt) { DebugSystem::Update(w, dt); });
    }
};
