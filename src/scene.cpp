#include "scene.hpp"
#include "components.hpp"
#include <vector>

ecs::Entity SceneLoader::load(ecs::World& world, const cubesim::SimConfig& config) {
    auto ent = world.create();

    // Physics state
    const cubesim::Vec2 start = config.bounds.clamp_position(config.start, config.extent);
    world.add(ent, Position{start});
    world.add(ent, LinearVelocity{});
    world.add(ent, Acceleration{});
    world.add(ent, Friction{config.friction});
    world.add(ent, Extent{config.extent});

    // Input + visuals
    world.add(ent, PlayerInput{});
    world.add(ent, Tint{});

    world.add(ent, PlayerTag{});
    world.add(ent, WorldTag{});
    return ent;
}

void SceneLoader::unload(ecs::World& world) {
    std::vector<ecs::Entity> to_destroy;
    world.each<WorldTag>([&](ecs::Entity e, WorldTag&) { to_destroy.push_back(e); });
    for (auto e : to_destroy) world.destroy(e);
    world.deferred().flush(world);
}
