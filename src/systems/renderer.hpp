#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderSystem — Render-phase system; draws the arena, the cube and the HUD.
//
// First Render-phase step. The caller wraps the phase in
// BeginDrawing()/EndDrawing() so later overlays land in the same frame.
//
// Read-only with respect to physics state. World space is y-up with the
// origin at the arena centre; the Camera2D flips it onto the screen.
// ---------------------------------------------------------------------------

class RenderSystem {
public:
    static void Update(ecs::World& world);
};
