#pragma once
#include "../body.hpp"
#include "../sim_config.hpp"

namespace cubesim {

// What the resolver did on each axis during one call. Informational only;
// callers use it for feedback (events, debug counters).
struct BoundaryContact {
    bool clamped_x   = false;
    bool clamped_y   = false;
    bool reflected_x = false;
    bool reflected_y = false;

    bool clamped()   const { return clamped_x || clamped_y; }
    bool reflected() const { return reflected_x || reflected_y; }
};

// Clamps the body to `area` and reflects any velocity component still
// pointing out of it, scaled by restitution. Axes are handled independently,
// so a corner hit reflects both in the same call. A body resting on an edge
// with zero velocity is clamped but not reflected.
BoundaryContact resolve_bounds(BodyState& body, const Rect& area, float restitution = 1.0f);

// Convenience overload: area = bounds.effective(body.extent).
BoundaryContact resolve_bounds(BodyState& body, const WorldBounds& bounds, float restitution = 1.0f);

} // namespace cubesim
