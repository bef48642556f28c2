#pragma once
#include "../components.hpp"
#include "../events.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// ContactFeedbackSystem — Render-phase system; consumes BoundaryHitEvent.
//
// Counts wall hits and arms the arena-border flash that RenderSystem draws.
// Must run before RenderSystem in the Render phase (the events are sent
// during the fixed steps of the same frame and flushed at the next one).
// ---------------------------------------------------------------------------

class ContactFeedbackSystem {
public:
    static constexpr float FLASH_SECONDS = 0.15f;

    static void Update(ecs::World& world, float dt);

    // Pure update, no Raylib dependency. Exposed for unit testing.
    static void apply(const Events<BoundaryHitEvent>& hits, float dt, ContactStats& stats);
};
