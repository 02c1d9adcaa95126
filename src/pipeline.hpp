#pragma once
#include <ecs/ecs.hpp>
#include <vector>
#include <functional>

namespace charctl {

/**
 * @brief Groups systems by execution phase.
 *
 * The controller runs in the logic phase on the same fixed step as the
 * physics phase, so hosts call update() and step_physics() with the same dt.
 */
class Pipeline {
public:
    using SystemFunc = std::function<void(ecs::World&, float)>;

    void add_pre_update(SystemFunc func) { pre_update_.push_back(std::move(func)); }
    void add_logic(SystemFunc func) { logic_.push_back(std::move(func)); }
    void add_physics(SystemFunc func) { physics_.push_back(std::move(func)); }

    /**
     * @brief Runs pre-update and logic, then flushes structural changes.
     */
    void update(ecs::World& world, float dt) {
        for (auto& sys : pre_update_) sys(world, dt);
        for (auto& sys : logic_) sys(world, dt);
        world.deferred().flush(world);
    }

    /**
     * @brief Executes only the physics/simulation systems.
     */
    void step_physics(ecs::World& world, float dt) {
        for (auto& sys : physics_) sys(world, dt);
    }

    /**
     * @brief One fixed tick: update() followed by step_physics().
     */
    void tick(ecs::World& world, float dt) {
        update(world, dt);
        step_physics(world, dt);
    }

private:
    std::vector<SystemFunc> pre_update_;
    std::vector<SystemFunc> logic_;
    std::vector<SystemFunc> physics_;
};

} // namespace charctl
