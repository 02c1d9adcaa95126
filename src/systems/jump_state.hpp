#pragma once
#include "../components.hpp"

namespace charctl {

// Owns the jump / gravity state machine: landing, coyote time, jump buffering,
// jump budget and the airborne vertical velocity.
// Runs after the ground probe and before the movement resolver.
class JumpSystem {
public:
    // State a freshly spawned character starts with (airborne, ground jump forfeited).
    static JumpState initial_state(const ControllerConfig& config);

    // Pure state transition, no backend dependency. Exposed for unit testing.
    // jump_requested is the press of this tick, not a held button.
    static void apply_state(const GroundState& ground, bool jump_requested, float dt,
                            const ControllerConfig& config, JumpState& state);
};

} // namespace charctl
