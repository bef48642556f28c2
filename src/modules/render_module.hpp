#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../systems/contact_feedback.hpp"
#include "../systems/renderer.hpp"
#include <ecs/ecs.hpp>
#include <string>

// ---------------------------------------------------------------------------
// RenderModule
//
// Creates the ContactStats world resource and adds ContactFeedbackSystem and
// RenderSystem to the Render phase, in that order (feedback arms the border
// flash that the renderer draws this frame).
//
// Must be installed before DebugModule so the overlay is drawn last.
// ---------------------------------------------------------------------------

struct RenderModule {
    static void install(ecs::World& world, cubesim::Pipeline& pipeline) {
        world.set_resource(ContactStats{});
        pipeline.add_render([](ecs::World& w, float dt) { ContactFeedbackSystem::Update(w, dt); });
        pipeline.add_render([](ecs::World& w, float)    { RenderSystem::Update(w); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Body", "Wall Hits", [&world]() {
                auto* stats = world.try_resource<ContactStats>();
                if (!stats) return std::string("-");
                return std::to_string(stats->wall_hits);
            });
        }
    }
};
