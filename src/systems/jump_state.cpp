#include "jump_state.hpp"
#include <algorithm>
#include <limits>

namespace charctl {

using Phase = JumpState::Phase;

static void land(const ControllerConfig& config, JumpState& state) {
    state.landed              = true;
    state.landing_speed       = -state.vertical_velocity;
    state.phase               = Phase::Grounded;
    state.time_since_grounded = 0.0f;
    state.vertical_velocity   = 0.0f;
    state.jump_consumed       = false;
    state.jumps_remaining     = config.max_jumps;
}

JumpState JumpSystem::initial_state(const ControllerConfig& config) {
    JumpState state;
    state.jumps_remaining = std::max(0, config.max_jumps - 1);
    return state;
}

void JumpSystem::apply_state(const GroundState& ground, bool jump_requested, float dt,
                             const ControllerConfig& config, JumpState& state) {
    state.jumped        = false;
    state.landed        = false;
    state.landing_speed = 0.0f;

    if (jump_requested) {
        state.time_since_jump_request = 0.0f;
    } else {
        state.time_since_jump_request += dt;
    }

    if (config.fly) {
        state.phase                   = Phase::Airborne;
        state.vertical_velocity       = 0.0f;
        state.time_since_jump_request = std::numeric_limits<float>::infinity();
        return;
    }

    // --- Ground transitions ---
    const bool on_ground = ground.grounded();
    switch (state.phase) {
        case Phase::Grounded:
            if (!on_ground) {
                state.phase               = Phase::CoyoteWindow;
                state.time_since_grounded = 0.0f;
            }
            break;
        case Phase::CoyoteWindow:
        case Phase::Airborne:
            // Only land while falling or level; mid-ascent contacts don't count.
            if (on_ground && state.vertical_velocity <= 0.0f) land(config, state);
            break;
    }

    if (state.phase != Phase::Grounded) {
        state.time_since_grounded += dt;
        if (state.phase == Phase::CoyoteWindow && state.time_since_grounded > config.coyote_time) {
            // Coyote window missed: the ground jump is gone, air jumps remain.
            state.phase           = Phase::Airborne;
            state.jumps_remaining = std::min(state.jumps_remaining, config.max_jumps - 1);
        }
    }

    // --- Jump consumption ---
    const bool buffered = state.time_since_jump_request <= config.jump_buffer_time;
    if (buffered && state.jumps_remaining > 0) {
        state.jumps_remaining        -= 1;
        state.phase                   = Phase::Airborne;
        state.vertical_velocity       = config.jump_velocity;
        state.time_since_jump_request = std::numeric_limits<float>::infinity();
        state.jump_consumed           = true;
        state.jumped                  = true;
        return;
    }

    // --- Gravity ---
    if (state.phase == Phase::Grounded) {
        state.vertical_velocity = 0.0f;
        return;
    }

    float gravity = config.gravity;
    if (state.vertical_velocity < 0.0f) gravity *= config.fall_gravity_multiplier;
    state.vertical_velocity =
        std::max(state.vertical_velocity + gravity * dt, -config.terminal_velocity);
}

} // namespace charctl
