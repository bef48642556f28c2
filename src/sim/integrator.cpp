#include "integrator.hpp"

namespace cubesim {

void integrate(BodyState& body, float dt) {
    body.velocity = body.velocity * body.friction + body.acceleration * dt;
    body.position += body.velocity * dt;
    body.acceleration = {0.0f, 0.0f};
}

float terminal_speed(float accel, float friction, float dt) {
    return accel * dt / (1.0f - friction);
}

} // namespace cubesim
