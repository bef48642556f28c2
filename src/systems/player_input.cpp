#include "player_input.hpp"
#include <raylib.h>

using namespace ecs;

static bool any_down(const InputRecord& record, int a, int b, int c) {
    return record.keys_down[a] || record.keys_down[b] || record.keys_down[c];
}

cubesim::MoveIntent PlayerInputSystem::read_intent(const InputRecord& record) {
    cubesim::MoveIntent intent;
    intent.up    = any_down(record, KEY_W, KEY_UP,    KEY_K);
    intent.down  = any_down(record, KEY_S, KEY_DOWN,  KEY_J);
    intent.left  = any_down(record, KEY_A, KEY_LEFT,  KEY_H);
    intent.right = any_down(record, KEY_D, KEY_RIGHT, KEY_L);

    intent.boost       = record.keys_down[KEY_LEFT_SHIFT] || record.keys_down[KEY_RIGHT_SHIFT];
    intent.mouse_boost = record.mouse_buttons[MOUSE_BUTTON_LEFT];
    return intent;
}

Color4 PlayerInputSystem::tint_for(const cubesim::MoveIntent& intent) {
    if (intent.mouse_boost) return Colors::MouseBoost;
    if (intent.boost)       return Colors::Boost;
    return Colors::Idle;
}

void PlayerInputSystem::Update(World& world) {
    auto* input_ptr = world.try_resource<InputRecord>();
    if (!input_ptr) return;
    const auto& record = *input_ptr;

    world.single<PlayerInput, Tint>([&](Entity, PlayerInput& input, Tint& tint) {
        input.intent = read_intent(record);
        tint.color   = tint_for(input.intent);
    });
}
