#pragma once
#include "math_util.hpp"

namespace cubesim {

// Per-tick snapshot of held movement keys. Directions are not exclusive:
// up + left is a diagonal, up + down cancels.
struct MoveIntent {
    bool up          = false;
    bool down        = false;
    bool left        = false;
    bool right       = false;
    bool boost       = false;  // Shift
    bool mouse_boost = false;  // left mouse button, stacks with boost
};

// Everything the core needs to advance one movable body.
struct BodyState {
    Vec2  position     = Vec2(0.0f);
    Vec2  velocity     = Vec2(0.0f);  // units/s
    Vec2  acceleration = Vec2(0.0f);  // units/s^2, valid for the current tick only
    float friction = 0.95f;
    float extent   = 25.0f;
};

} // namespace cubesim
