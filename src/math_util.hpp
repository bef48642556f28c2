#pragma once
#include <glm/glm.hpp>

namespace cubesim {

// 2-D vector used by the simulation core. glm only, so the core links
// without ecs or raylib.
using Vec2 = glm::vec2;

namespace math {

/**
 * @brief glm::normalize with a zero guard.
 * @return The zero vector unchanged (there is no direction to preserve).
 */
inline Vec2 normalized(Vec2 v) {
    if (v.x == 0.0f && v.y == 0.0f) return Vec2(0.0f);
    return glm::normalize(v);
}

} // namespace math
} // namespace cubesim
