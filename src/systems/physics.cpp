#include "physics.hpp"
#include "../components.hpp"
#include "../events.hpp"
#include "../sim/tick.hpp"

using namespace ecs;

void PhysicsSystem::Update(World& world, float dt) {
    const auto* config = world.try_resource<cubesim::SimConfig>();
    if (!config) return;

    auto* hits = world.try_resource<Events<BoundaryHitEvent>>();

    world.each<PlayerInput, Position, LinearVelocity, Acceleration, Friction, Extent>(
        [&](Entity e, PlayerInput& input, Position& pos, LinearVelocity& vel,
            Acceleration& acc, Friction& friction, Extent& extent) {
            cubesim::BodyState body;
            body.position     = pos.value;
            body.velocity     = vel.value;
            body.acceleration = acc.value;
            body.friction     = friction.retention;
            body.extent       = extent.half;

            const cubesim::TickResult r = cubesim::tick(body, input.intent, *config, dt);

            pos.value = r.state.position;
            vel.value = r.state.velocity;
            acc.value = r.state.acceleration;

            if (hits && r.contact.reflected()) {
                hits->send({e, r.contact.reflected_x, r.contact.reflected_y,
                            glm::length(r.state.velocity)});
            }
        });
}
