#include "character_input.hpp"
#include "../math_util.hpp"
#include <algorithm>
#include <cmath>

namespace charctl {

using namespace ecs;

MovementIntent CharacterInputSystem::make_intent(const PlayerInput& input,
                                                 const ControllerConfig& config) {
    const glm::vec3 flat_fwd{std::sin(input.yaw), 0.0f, std::cos(input.yaw)};
    const glm::vec3 right = glm::cross(flat_fwd, math::kUp);

    glm::vec3 fwd = flat_fwd;
    if (config.fly) {
        const float cp = std::cos(input.pitch);
        fwd = {flat_fwd.x * cp, std::sin(input.pitch), flat_fwd.z * cp};
    }

    // Project the 2D move input onto the look frame.
    const glm::vec3 move = fwd * input.move_axes.y + right * input.move_axes.x;

    MovementIntent intent;
    intent.direction      = math::normalize_or_zero(move);
    intent.speed          = config.walk_speed * std::min(1.0f, glm::length(move));
    intent.jump_requested = input.jump;
    intent.sprint         = input.sprint;
    intent.crouch         = input.crouch;
    if (glm::length(intent.direction) == 0.0f) intent.speed = 0.0f;
    return intent;
}

void CharacterInputSystem::Update(World& world, float /*dt*/) {
    world.each<PlayerTag, PlayerInput, ControllerConfig, MovementIntent>(
        [&](Entity, PlayerTag&, PlayerInput& input, ControllerConfig& config,
            MovementIntent& intent) {
            // Hosts accumulate yaw freely; keep it wrapped.
            input.yaw = math::normalize_angle(input.yaw);
            intent    = make_intent(input, config);
            // The jump press is consumed once it has been turned into intent.
            input.jump = false;
        });
}

} // namespace charctl
