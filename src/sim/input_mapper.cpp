#include "input_mapper.hpp"

namespace cubesim {

Vec2 intent_direction(const MoveIntent& intent) {
    Vec2 dir = {0.0f, 0.0f};
    if (intent.right) dir.x += 1.0f;
    if (intent.left)  dir.x -= 1.0f;
    if (intent.up)    dir.y += 1.0f;
    if (intent.down)  dir.y -= 1.0f;
    return math::normalized(dir);
}

Vec2 map_intent(const MoveIntent& intent, const SimConfig& config) {
    float force = config.input_force;
    if (intent.boost)       force *= config.boost_multiplier;
    if (intent.mouse_boost) force *= config.boost_multiplier;
    return intent_direction(intent) * force;
}

} // namespace cubesim
