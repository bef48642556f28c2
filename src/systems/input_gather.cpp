#include "input_gather.hpp"
#include "../input_state.hpp"
#include <raylib.h>

void InputGatherSystem::Update(ecs::World& world) {
    InputRecord* input_ptr = world.try_resource<InputRecord>();
    if (!input_ptr) {
        world.set_resource(InputRecord{});
        input_ptr = world.try_resource<InputRecord>();
    }
    auto& input = *input_ptr;

    // 1. Keyboard
    for (int i = 0; i < 512; i++) {
        input.keys_down[i] = IsKeyDown(i);
        input.keys_pressed[i] = IsKeyPressed(i);
    }

    // 2. Mouse
    for (int i = 0; i < 8; i++) {
        input.mouse_buttons[i] = IsMouseButtonDown(i);
    }
}
