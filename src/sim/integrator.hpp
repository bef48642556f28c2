#pragma once
#include "../body.hpp"

namespace cubesim {

// Semi-implicit Euler step with multiplicative friction:
//   velocity = velocity * friction + acceleration * dt
//   position = position + velocity * dt
// Acceleration is consumed (zeroed) afterwards.
void integrate(BodyState& body, float dt);

// Velocity a body settles at under constant acceleration `accel`.
// Requires friction < 1.
float terminal_speed(float accel, float friction, float dt);

} // namespace cubesim
