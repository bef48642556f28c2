#include "tick.hpp"
#include "input_mapper.hpp"
#include "integrator.hpp"

namespace cubesim {

TickResult tick(const BodyState& state, const MoveIntent& intent,
                const SimConfig& config, float dt) {
    TickResult result;
    result.state = state;

    // Acceleration is a per-tick input, never carried over.
    result.state.acceleration = map_intent(intent, config);
    integrate(result.state, dt);
    result.contact = resolve_bounds(result.state, config.bounds, config.restitution);

    return result;
}

} // namespace cubesim
