#pragma once
#include "../body.hpp"
#include "../components.hpp"
#include "../input_state.hpp"
#include <ecs/ecs.hpp>

// Maps the InputRecord to the player's MoveIntent and boost tint.
// Runs in Pre-Update after InputGatherSystem.
//
// Bindings: W/Up/K, S/Down/J, A/Left/H, D/Right/L; Shift boosts, the left
// mouse button boosts again on top.
class PlayerInputSystem {
public:
    static void Update(ecs::World& world);

    // Pure mapping from raw key/button state; raylib constants only.
    static cubesim::MoveIntent read_intent(const InputRecord& record);

    // Mouse boost colour wins over Shift, Shift over idle.
    static Color4 tint_for(const cubesim::MoveIntent& intent);
};
