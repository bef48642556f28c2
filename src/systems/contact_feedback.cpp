#include "contact_feedback.hpp"
#include <algorithm>

void ContactFeedbackSystem::apply(const Events<BoundaryHitEvent>& hits, float dt,
                                  ContactStats& stats) {
    stats.flash_timer = std::max(0.0f, stats.flash_timer - dt);

    if (!hits.empty()) {
        stats.wall_hits  += static_cast<int>(hits.read().size());
        stats.flash_timer = FLASH_SECONDS;
    }
}

void ContactFeedbackSystem::Update(ecs::World& world, float dt) {
    auto* stats = world.try_resource<ContactStats>();
    if (!stats) return;

    if (const auto* evts = world.try_resource<Events<BoundaryHitEvent>>()) {
        apply(*evts, dt, *stats);
    }
}
