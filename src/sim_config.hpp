#pragma once
#include "math_util.hpp"
#include <stdexcept>
#include <string>

namespace cubesim {

// ---------------------------------------------------------------------------
// Rect — axis-aligned rectangle, inclusive on every edge.
// ---------------------------------------------------------------------------

struct Rect {
    Vec2 min = Vec2(0.0f);
    Vec2 max = Vec2(0.0f);

    float width()  const { return max.x - min.x; }
    float height() const { return max.y - min.y; }

    bool contains(Vec2 p) const {
        return p.x >= min.x && p.x <= max.x && p.y >= min.y && p.y <= max.y;
    }

    Vec2 clamp_position(Vec2 p) const {
        return glm::clamp(p, min, max);
    }
};

// ---------------------------------------------------------------------------
// WorldBounds — the arena rectangle plus a margin kept clear along every
// edge. Built once at startup and never mutated while the simulation runs.
// ---------------------------------------------------------------------------

struct WorldBounds {
    Vec2  min    = {-640.0f, -360.0f};
    Vec2  max    = { 640.0f,  360.0f};
    float margin = 15.0f;

    // A width x height arena centred on the origin.
    static WorldBounds from_window_size(float width, float height, float margin);

    // Region a body's centre may occupy: the arena inset by extent + margin.
    Rect effective(float extent) const;

    bool contains(Vec2 p, float extent = 0.0f) const { return effective(extent).contains(p); }
    Vec2 clamp_position(Vec2 p, float extent = 0.0f) const { return effective(extent).clamp_position(p); }
};

// ---------------------------------------------------------------------------
// ConfigError — the only failure class of the simulation. Raised by
// SimConfig::validate() before any tick runs.
// ---------------------------------------------------------------------------

class ConfigError : public std::runtime_error {
public:
    enum class Kind {
        InvalidFriction,   // friction outside (0, 1]
        DegenerateBounds,  // arena narrower than 2 * (extent + margin)
        InvalidTimestep,   // fixed_dt below MIN_FIXED_DT
        InvalidParameter,  // any other out-of-range scalar
    };

    ConfigError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

const char* to_string(ConfigError::Kind kind);

// ---------------------------------------------------------------------------
// SimConfig — immutable simulation parameters, passed by const reference
// into every tick.
// ---------------------------------------------------------------------------

struct SimConfig {
    // Smallest accepted fixed_dt (10 kHz).
    static constexpr float MIN_FIXED_DT = 1e-4f;

    WorldBounds bounds;

    float friction         = 0.95f;   // velocity retained per tick
    float input_force      = 500.0f;  // units/s^2
    float boost_multiplier = 3.0f;
    float restitution      = 1.0f;    // 1.0 = perfectly elastic walls
    float extent           = 25.0f;   // half-size of the cube
    Vec2  start            = {0.0f, 0.0f};

    float fixed_dt            = 1.0f / 60.0f;
    int   max_steps_per_frame = 0;    // 0 = unlimited catch-up

    // Throws ConfigError when any parameter is out of range.
    void validate() const;
};

} // namespace cubesim
