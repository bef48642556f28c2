#pragma once
#include "../input_state.hpp"
#include "../pipeline.hpp"
#include "../systems/input_gather.hpp"
#include "../systems/player_input.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// InputModule
//
// Creates the InputRecord resource and adds InputGatherSystem and
// PlayerInputSystem to the Pre-Update phase. InputGather must precede
// PlayerInput (it writes the InputRecord that PlayerInput reads). The
// resulting MoveIntent is a once-per-frame snapshot, so every fixed step of
// the frame sees the same held keys.
// ---------------------------------------------------------------------------

struct InputModule {
    static void install(ecs::World& world, cubesim::Pipeline& pipeline) {
        world.set_resource(InputRecord{});
        pipeline.add_pre_update([](ecs::World& w, float) { InputGatherSystem::Update(w); });
        pipeline.add_pre_update([](ecs::World& w, float) { PlayerInputSystem::Update(w); });
    }
};
