#pragma once
#include <algorithm>
#include <cmath>
#include <limits>

namespace cubesim {

/**
 * @brief Accumulator-based fixed-timestep driver.
 *
 * Frame time is accumulated; each whole `dt` worth of it runs one step.
 * Simulation cadence is therefore independent of the display rate. The
 * leftover fraction is exposed through alpha() but never used to
 * interpolate simulation state.
 */
class FixedStepper {
public:
    // max_steps == 0 means no cap on catch-up steps per advance() call.
    explicit FixedStepper(float dt, int max_steps = 0)
        : dt_(dt), max_steps_(max_steps) {}

    /**
     * @brief Adds frame_dt to the accumulator and runs step(dt) while a full
     * step is available.
     * @return Number of steps run. Negative frame deltas are ignored.
     *
     * When the step cap is hit, the remaining whole steps are discarded and
     * added to dropped_time() so a long stall cannot snowball.
     */
    template <typename StepFn>
    int advance(float frame_dt, StepFn&& step) {
        if (frame_dt > 0.0f) accumulator_ += frame_dt;

        // Whole steps are counted up front: repeated `accumulator_ -= dt_`
        // stops making progress once dt_ falls below the accumulator's ULP.
        const double whole = std::floor(static_cast<double>(accumulator_) / dt_);
        double budget = whole;
        if (max_steps_ > 0 && budget > max_steps_) budget = max_steps_;
        budget = std::min(budget, static_cast<double>(std::numeric_limits<int>::max()));
        const int steps = static_cast<int>(budget);

        for (int i = 0; i < steps; ++i) step(dt_);

        const double left = static_cast<double>(accumulator_) - whole * dt_;
        accumulator_   = left > 0.0 ? static_cast<float>(left) : 0.0f;
        dropped_time_ += static_cast<float>((whole - steps) * dt_);
        total_steps_  += steps;
        return steps;
    }

    float dt()           const { return dt_; }
    float accumulator()  const { return accumulator_; }
    float alpha()        const { return accumulator_ / dt_; }
    float dropped_time() const { return dropped_time_; }
    long  total_steps()  const { return total_steps_; }

    void reset() {
        accumulator_  = 0.0f;
        dropped_time_ = 0.0f;
        total_steps_  = 0;
    }

private:
    float dt_;
    int   max_steps_;
    float accumulator_  = 0.0f;
    float dropped_time_ = 0.0f;
    long  total_steps_  = 0;
};

} // namespace cubesim
