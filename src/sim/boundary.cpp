#include "boundary.hpp"

namespace cubesim {

// One axis of the clamp-and-reflect rule.
static void resolve_axis(float& p, float& v, float lo, float hi, float restitution,
                         bool& clamped, bool& reflected) {
    if (p < lo) {
        p = lo;
        clamped = true;
        if (v < 0.0f) {
            v = -v * restitution;
            reflected = true;
        }
    } else if (p > hi) {
        p = hi;
        clamped = true;
        if (v > 0.0f) {
            v = -v * restitution;
            reflected = true;
        }
    }
}

BoundaryContact resolve_bounds(BodyState& body, const Rect& area, float restitution) {
    BoundaryContact contact;
    resolve_axis(body.position.x, body.velocity.x, area.min.x, area.max.x, restitution,
                 contact.clamped_x, contact.reflected_x);
    resolve_axis(body.position.y, body.velocity.y, area.min.y, area.max.y, restitution,
                 contact.clamped_y, contact.reflected_y);
    return contact;
}

BoundaryContact resolve_bounds(BodyState& body, const WorldBounds& bounds, float restitution) {
    return resolve_bounds(body, bounds.effective(body.extent), restitution);
}

} // namespace cubesim
