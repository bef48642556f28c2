#pragma once
#include <ecs/ecs.hpp>

// Samples keyboard and mouse state from Raylib into the InputRecord resource.
// First Pre-Update step after the event flush; nothing else calls Raylib's
// input functions.
class InputGatherSystem {
public:
    static void Update(ecs::World& world);
};
