#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../events.hpp"
#include "../pipeline.hpp"
#include "../sim_config.hpp"
#include "../systems/physics.hpp"
#include <ecs/ecs.hpp>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// PhysicsModule
//
// Stores the validated SimConfig as a read-only world resource, registers the
// BoundaryHitEvent queue (PhysicsSystem is the emitter), wires PhysicsSystem
// into the fixed-step Physics phase and adds "Body" debug rows.
//
// Must be installed after EventBusModule and DebugModule.
// ---------------------------------------------------------------------------

struct PhysicsModule {
    static void install(ecs::World& world, cubesim::Pipeline& pipeline,
                        const cubesim::SimConfig& config) {
        world.set_resource(config);
        world.resource<EventRegistry>().register_queue<BoundaryHitEvent>(world);

        pipeline.add_physics([](ecs::World& w, float dt) { PhysicsSystem::Update(w, dt); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Body", "Position", [&world]() {
                std::string r = "-";
                world.each<PlayerTag, Position>([&](ecs::Entity, PlayerTag&, Position& p) {
                    r = DebugPanel::format_pair(p.value.x, p.value.y);
                });
                return r;
            });
            panel->watch("Body", "Velocity", [&world]() {
                std::string r = "-";
                world.each<PlayerTag, LinearVelocity>([&](ecs::Entity, PlayerTag&, LinearVelocity& v) {
                    r = DebugPanel::format_pair(v.value.x, v.value.y);
                });
                return r;
            });
            panel->watch("Body", "Speed", [&world]() {
                std::string r = "-";
                world.each<PlayerTag, LinearVelocity>([&](ecs::Entity, PlayerTag&, LinearVelocity& v) {
                    char b[16];
                    std::snprintf(b, sizeof(b), "%.1f u/s", glm::length(v.value));
                    r = b;
                });
                return r;
            });
            panel->watch("Body", "Boost", [&world]() {
                std::string r = "-";
                world.each<PlayerTag, PlayerInput>([&](ecs::Entity, PlayerTag&, PlayerInput& in) {
                    int level = (in.intent.boost ? 1 : 0) + (in.intent.mouse_boost ? 1 : 0);
                    r = "x" + std::to_string(level);
                });
                return r;
            });
        }
    }
};
