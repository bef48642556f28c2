#pragma once
#include "sim/fixed_stepper.hpp"
#include <ecs/ecs.hpp>
#include <vector>
#include <functional>

namespace cubesim {

/**
 * @brief Manages groups of systems categorized by execution phase, and owns
 * the fixed-timestep accumulator that drives the physics phase.
 */
class Pipeline {
public:
    using SystemFunc = std::function<void(ecs::World&, float)>;

    explicit Pipeline(float fixed_dt = 1.0f / 60.0f, int max_steps_per_frame = 0)
        : stepper_(fixed_dt, max_steps_per_frame) {}

    void add_pre_update(SystemFunc func) { pre_update_.push_back(func); }
    void add_logic(SystemFunc func) { logic_.push_back(func); }
    void add_physics(SystemFunc func) { physics_.push_back(func); }
    void add_render(SystemFunc func) { render_.push_back(func); }

    /**
     * @brief Input and per-frame logic, at display rate.
     */
    void update(ecs::World& world, float dt) {
        for (auto& sys : pre_update_) sys(world, dt);
        for (auto& sys : logic_) sys(world, dt);

        // Sync structural changes (e.g. a respawned body) before physics
        world.deferred().flush(world);
    }

    /**
     * @brief Runs the physics systems once per whole fixed step contained in
     * the accumulated frame time.
     * @return Number of fixed steps run this frame.
     */
    int step_physics(ecs::World& world, float frame_dt) {
        return stepper_.advance(frame_dt, [&](float dt) {
            for (auto& sys : physics_) sys(world, dt);
        });
    }

    /**
     * @brief Executes rendering systems. dt is the display frame time.
     */
    void render(ecs::World& world, float dt) {
        for (auto& sys : render_) sys(world, dt);
    }

    const FixedStepper& stepper() const { return stepper_; }
    void reset_clock() { stepper_.reset(); }

private:
    FixedStepper stepper_;
    std::vector<SystemFunc> pre_update_;
    std::vector<SystemFunc> logic_;
    std::vector<SystemFunc> physics_;
    std::vector<SystemFunc> render_;
};

} // namespace cubesim
