#include "renderer.hpp"
#include "../components.hpp"
#include "../sim_config.hpp"
#include <raylib.h>

using namespace ecs;

// Convert our engine Color4 to Raylib's Color at draw time.
static inline Color to_raylib(const Color4& c) {
    return Color{
        static_cast<unsigned char>(c.r * 255.0f),
        static_cast<unsigned char>(c.g * 255.0f),
        static_cast<unsigned char>(c.b * 255.0f),
        static_cast<unsigned char>(c.a * 255.0f),
    };
}

// World (y-up) to Camera2D space (y-down).
static inline Vector2 to_screen(cubesim::Vec2 p) {
    return {p.x, -p.y};
}

static void draw_rect(const cubesim::Rect& r, float thickness, Color col) {
    Rectangle rec = {r.min.x, -r.max.y, r.width(), r.height()};
    DrawRectangleLinesEx(rec, thickness, col);
}

void RenderSystem::Update(World& world) {
    const auto* config = world.try_resource<cubesim::SimConfig>();
    if (!config) return;

    ClearBackground({35, 35, 40, 255});

    Camera2D camera = {};
    camera.offset   = {GetScreenWidth() * 0.5f, GetScreenHeight() * 0.5f};
    camera.target   = {0.0f, 0.0f};
    camera.rotation = 0.0f;
    camera.zoom     = 1.0f;

    bool flashing = false;
    if (const auto* stats = world.try_resource<ContactStats>())
        flashing = stats->flash_timer > 0.0f;

    // 1. Arena
    BeginMode2D(camera);
        const cubesim::Rect arena = {config->bounds.min, config->bounds.max};
        const cubesim::Rect inner = config->bounds.effective(0.0f);
        draw_rect(arena, 2.0f, flashing ? RED : GRAY);
        draw_rect(inner, 1.0f, DARKGRAY);

        // 2. Bodies
        world.each<Position, Extent, Tint>([&](Entity, Position& pos, Extent& ext, Tint& tint) {
            Vector2 c = to_screen(pos.value);
            DrawRectangleV({c.x - ext.half, c.y - ext.half}, {2.0f * ext.half, 2.0f * ext.half},
                           to_raylib(tint.color));
        });
    EndMode2D();

    // 3. UI
    DrawFPS(10, 10);
    DrawText("WASD / ARROWS / HJKL: Move | SHIFT, LMB: Boost | R: Reset | F3: Debug",
             10, 30, 20, LIGHTGRAY);
}
