#include "sim_config.hpp"
#include <string>

namespace cubesim {

WorldBounds WorldBounds::from_window_size(float width, float height, float margin) {
    WorldBounds b;
    b.min    = {-width * 0.5f, -height * 0.5f};
    b.max    = { width * 0.5f,  height * 0.5f};
    b.margin = margin;
    return b;
}

Rect WorldBounds::effective(float extent) const {
    const float inset = extent + margin;
    return {{min.x + inset, min.y + inset}, {max.x - inset, max.y - inset}};
}

const char* to_string(ConfigError::Kind kind) {
    switch (kind) {
        case ConfigError::Kind::InvalidFriction:  return "InvalidFriction";
        case ConfigError::Kind::DegenerateBounds: return "DegenerateBounds";
        case ConfigError::Kind::InvalidTimestep:  return "InvalidTimestep";
        case ConfigError::Kind::InvalidParameter: return "InvalidParameter";
    }
    return "Unknown";
}

static void require(bool ok, ConfigError::Kind kind, const std::string& msg) {
    if (!ok) throw ConfigError(kind, msg);
}

void SimConfig::validate() const {
    using Kind = ConfigError::Kind;

    require(friction > 0.0f && friction <= 1.0f, Kind::InvalidFriction,
            "friction must be in (0, 1], got " + std::to_string(friction));

    require(extent >= 0.0f, Kind::InvalidParameter,
            "extent must be non-negative, got " + std::to_string(extent));
    require(bounds.margin >= 0.0f, Kind::InvalidParameter,
            "margin must be non-negative, got " + std::to_string(bounds.margin));

    // An arena of exactly 2 * (extent + margin) leaves a single resting point.
    const Rect area = bounds.effective(extent);
    require(area.width() >= 0.0f && area.height() >= 0.0f, Kind::DegenerateBounds,
            "world bounds leave no room for a body of extent " + std::to_string(extent) +
            " with margin " + std::to_string(bounds.margin));

    require(fixed_dt >= MIN_FIXED_DT, Kind::InvalidTimestep,
            "fixed_dt must be at least " + std::to_string(MIN_FIXED_DT) +
            " s, got " + std::to_string(fixed_dt));
    require(max_steps_per_frame >= 0, Kind::InvalidParameter,
            "max_steps_per_frame must be non-negative");

    require(input_force >= 0.0f, Kind::InvalidParameter,
            "input_force must be non-negative, got " + std::to_string(input_force));
    require(boost_multiplier >= 0.0f, Kind::InvalidParameter,
            "boost_multiplier must be non-negative, got " + std::to_string(boost_multiplier));
    require(restitution >= 0.0f && restitution <= 1.0f, Kind::InvalidParameter,
            "restitution must be in [0, 1], got " + std::to_string(restitution));
}

} // namespace cubesim
