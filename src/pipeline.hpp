#pragma once
#include <ecs/ecs.hpp>
#include <algorithm>
#include <vector>
#include <functional>

namespace ecs {

/**
 * @brief Manages groups of systems categorized by execution phase.
 *
 * Pre-Update and Logic run once per frame with the frame dt. Physics runs
 * at a fixed rate from advance(); Render runs once per frame.
 */
class Pipeline {
public:
    using SystemFunc = std::function<void(World&, float)>;

    explicit Pipeline(float fixed_dt = 1.0f / 60.0f, int max_steps = 5)
        : fixed_dt_(fixed_dt), max_steps_(std::max(1, max_steps)) {}

    void add_pre_update(SystemFunc func) { pre_update_.push_back(std::move(func)); }
    void add_logic(SystemFunc func) { logic_.push_back(std::move(func)); }
    void add_physics(SystemFunc func) { physics_.push_back(std::move(func)); }
    void add_render(SystemFunc func) { render_.push_back(std::move(func)); }

    /**
     * @brief Executes the per-frame flow: input, then gameplay logic.
     */
    void update(World& world, float dt) {
        // 1. Input / Pre-processing
        for (auto& sys : pre_update_) sys(world, dt);

        // 2. Gameplay Logic
        for (auto& sys : logic_) sys(world, dt);

        // 3. Sync structural changes before the fixed steps
        world.deferred().flush(world);
    }

    /**
     * @brief Executes only the physics/simulation systems, once.
     */
    void step_physics(World& world, float dt) {
        for (auto& sys : physics_) sys(world, dt);
        world.deferred().flush(world);
    }

    /**
     * @brief Accumulates frame time and runs as many fixed physics steps as
     * it covers. At most max_steps run per call; time beyond that is dropped
     * so a long stall cannot snowball.
     * @return number of steps run.
     */
    int advance(World& world, float frame_dt) {
        accumulator_ += std::max(0.0f, frame_dt);
        int steps = 0;
        while (accumulator_ >= fixed_dt_ && steps < max_steps_) {
            step_physics(world, fixed_dt_);
            accumulator_ -= fixed_dt_;
            ++steps;
        }
        if (steps == max_steps_) accumulator_ = std::min(accumulator_, fixed_dt_);
        last_steps_ = steps;
        return steps;
    }

    /**
     * @brief Executes rendering systems.
     */
    void render(World& world) {
        for (auto& sys : render_) sys(world, 0.0f);
    }

    float fixed_dt() const { return fixed_dt_; }
    float accumulator() const { return accumulator_; }
    int last_steps() const { return last_steps_; }

private:
    std::vector<SystemFunc> pre_update_;
    std::vector<SystemFunc> logic_;
    std::vector<SystemFunc> physics_;
    std::vector<SystemFunc> render_;

    float fixed_dt_;
    int   max_steps_;
    float accumulator_ = 0.0f;
    int   last_steps_  = 0;
};

} // namespace ecs
