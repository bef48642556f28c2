#pragma once
#include "body.hpp"
#include "math_util.hpp"

// Components are plain data and free of ecs/raylib headers, so the headless
// test target can include them.

// ---------------------------------------------------------------------------
// Physics state (one movable body)
// ---------------------------------------------------------------------------

struct Position {
    cubesim::Vec2 value = cubesim::Vec2(0.0f);
};

struct LinearVelocity {
    cubesim::Vec2 value = cubesim::Vec2(0.0f);
};

// Transient: written from input at the start of a tick, zero after it.
struct Acceleration {
    cubesim::Vec2 value = cubesim::Vec2(0.0f);
};

struct Friction {
    float retention = 0.95f;
};

// Half-size of the body's box.
struct Extent {
    float half = 25.0f;
};

// ---------------------------------------------------------------------------
// Visuals
// ---------------------------------------------------------------------------

struct Color4 {
    float r, g, b, a;
};

namespace Colors {
    constexpr Color4 Idle       = {0.25f, 0.25f, 0.75f, 1.0f};
    constexpr Color4 Boost      = {0.90f, 0.25f, 0.75f, 1.0f};
    constexpr Color4 MouseBoost = {0.90f, 0.90f, 0.75f, 1.0f};
}

struct Tint {
    Color4 color = Colors::Idle;
};

// ---------------------------------------------------------------------------
// Gameplay / Input
// ---------------------------------------------------------------------------

struct PlayerInput {
    cubesim::MoveIntent intent;
};

struct PlayerTag {};
struct WorldTag {};

// ---------------------------------------------------------------------------
// Resources
// ---------------------------------------------------------------------------

// Fixed-step bookkeeping, refreshed by main after each frame's physics.
struct SimClock {
    int   last_frame_steps = 0;
    long  total_steps      = 0;
    float dropped_time     = 0.0f;
};

// Wall-contact feedback, fed by BoundaryHitEvent.
struct ContactStats {
    int   wall_hits   = 0;
    float flash_timer = 0.0f;  // seconds of border highlight left
};
