#pragma once
#include "../body.hpp"
#include "../sim_config.hpp"

namespace cubesim {

/**
 * @brief Unit (or zero) direction for the held keys. Diagonals are
 * normalized so they are no faster than a single axis.
 */
Vec2 intent_direction(const MoveIntent& intent);

/**
 * @brief Acceleration produced by the held keys this tick:
 * direction * input_force, times boost_multiplier for each active boost.
 */
Vec2 map_intent(const MoveIntent& intent, const SimConfig& config);

} // namespace cubesim
