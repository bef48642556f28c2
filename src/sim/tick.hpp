#pragma once
#include "../body.hpp"
#include "../sim_config.hpp"
#include "boundary.hpp"

namespace cubesim {

struct TickResult {
    BodyState       state;
    BoundaryContact contact;
};

// One fixed simulation step: Input Mapper -> Integrator -> Boundary Resolver,
// in that order, on a copy of `state`. The caller publishes the returned
// state in one assignment, so observers never see a partial update.
TickResult tick(const BodyState& state, const MoveIntent& intent,
                const SimConfig& config, float dt);

} // namespace cubesim
