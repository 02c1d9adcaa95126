#pragma once
#include "../components.hpp"
#include <ecs/ecs.hpp>

namespace charctl {

// Translates PlayerInput (move axes + look yaw/pitch) into a world-space
// MovementIntent. Runs in the Logic phase, before CharacterControllerSystem.
class CharacterInputSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Pure mapping, exposed for unit testing.
    // Yaw 0 faces +Z; positive axes.x strafes to the right of the view.
    // In fly mode the forward vector follows pitch as well.
    static MovementIntent make_intent(const PlayerInput& input, const ControllerConfig& config);
};

} // namespace charctl
