#pragma once
#include "sim_config.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// SceneLoader — spawns the movable cube described by a SimConfig.
//
// The body starts at config.start (clamped into the arena) at rest.
// No Raylib dependency — compilable in the headless test target.
// ---------------------------------------------------------------------------

class SceneLoader {
public:
    static ecs::Entity load(ecs::World& world, const cubesim::SimConfig& config);

    // Destroy all WorldTag entities and flush deferred commands.
    static void unload(ecs::World& world);
};
