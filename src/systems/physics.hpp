#pragma once
#include "../body.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// PhysicsSystem — fixed-step system; advances every movable body by one tick.
//
// Gathers the body's components into a cubesim::BodyState, runs
// cubesim::tick (input -> integrate -> clamp/reflect) and writes the result
// back in one go. Reads SimConfig as a read-only resource. Emits
// BoundaryHitEvent when a wall reflects the body.
// ---------------------------------------------------------------------------

class PhysicsSystem {
public:
    static void Update(ecs::World& world, float dt);
};
