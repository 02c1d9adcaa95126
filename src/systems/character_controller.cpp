#include "character_controller.hpp"
#include "ground_probe.hpp"
#include "jump_state.hpp"
#include "movement_resolver.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../events.hpp"
#include "../math_util.hpp"
#include <iostream>
#include <memory>

namespace charctl {

using namespace ecs;

void CharacterControllerSystem::Register(World& world) {
    world.on_add<CharacterBody>([](World& w, Entity e, CharacterBody&) {
        ControllerConfig config;
        if (auto* c = w.try_get<ControllerConfig>(e)) config = *c;
        else w.add(e, config);

        w.add(e, GroundState{});
        w.add(e, JumpSystem::initial_state(config));
        if (!w.try_get<MovementIntent>(e)) w.add(e, MovementIntent{});
    });
}

Entity CharacterControllerSystem::spawn(World& world, const CharacterBody& body,
                                        const ControllerConfig& config) {
    validate_config(config);
    validate_body(body);

    if (auto* backend = world.try_resource<std::shared_ptr<PhysicsBackend>>()) {
        if (*backend && !(*backend)->has_body(body.body)) throw BodyNotFound(body.body);
    }

    // Config first so the CharacterBody hook sees it.
    Entity e = world.create();
    world.add(e, config);
    world.add(e, body);
    return e;
}

MovementOutput CharacterControllerSystem::step(PhysicsBackend& backend, const CharacterBody& body,
                                               const ControllerConfig& config,
                                               const MovementIntent& intent, GroundState& ground,
                                               JumpState& jump, float dt) {
    const glm::vec3 position = backend.get_position(body.body);
    const glm::vec3 velocity = backend.get_linear_velocity(body.body);

    // --- Ground ---
    // Ascent release looks at the vertical velocity the controller drives, not
    // the measured one, so walking up a ramp never counts as a jump.
    GroundState next_ground;
    if (!config.fly) {
        next_ground = GroundProbe::probe(backend, body, position, jump.vertical_velocity, config);
    }

    // --- Jump / gravity ---
    JumpState next_jump = jump;
    if (next_jump.phase != JumpState::Phase::Grounded && next_jump.vertical_velocity > 0.0f &&
        velocity.y <= 0.0f) {
        // Head hit a ceiling: the body stopped rising, so does the accumulator.
        next_jump.vertical_velocity = 0.0f;
    }
    JumpSystem::apply_state(next_ground, intent.jump_requested, dt, config, next_jump);

    // --- Step-up (optional adjustment) ---
    StepProbeResult step_result;
    if (next_jump.phase == JumpState::Phase::Grounded) {
        const glm::vec3 target = math::horizontal(intent.direction) *
                                 MovementResolver::target_speed(intent, config);
        const glm::vec3 desired = math::approach(math::horizontal(velocity), target,
                                                 config.ground_acceleration, dt,
                                                 config.velocity_snap_epsilon);
        try {
            step_result = MovementResolver::probe_step(backend, body, position, next_ground,
                                                       desired, config, dt);
        } catch (const QueryFailed& err) {
            std::cerr << "[CharacterController] body " << body.body
                      << " step probe skipped: " << err.what() << std::endl;
        }
    }

    // --- Resolve ---
    MovementOutput out = MovementResolver::resolve(intent, next_ground, next_jump, velocity,
                                                   step_result, body.mass, config, dt);

    // The slide owns the vertical velocity while on a steep slope.
    if (next_ground.sloped() && !next_jump.jumped && !config.fly) {
        next_jump.vertical_velocity = out.velocity.y;
    }

    apply_output(backend, body.body, out, dt);

    ground = next_ground;
    jump   = next_jump;
    return out;
}

void CharacterControllerSystem::apply_output(PhysicsBackend& backend, BodyId body,
                                             const MovementOutput& out, float dt) {
    if (out.step_up > 0.0f) backend.translate(body, math::kUp * out.step_up);

    switch (out.mode) {
        case OutputMode::KinematicDisplacement:
            backend.move_kinematic(body, out.value, dt);
            break;
        case OutputMode::KinematicVelocity:
            backend.set_linear_velocity(body, out.value);
            break;
        case OutputMode::DynamicImpulse:
            backend.apply_impulse(body, out.value);
            break;
        case OutputMode::DynamicForce:
            backend.apply_force(body, out.value);
            break;
    }
}

void CharacterControllerSystem::Update(World& world, float dt) {
    auto* backend_ptr = world.try_resource<std::shared_ptr<PhysicsBackend>>();
    if (!backend_ptr || !*backend_ptr) return;
    if (!(dt > 0.0f)) return;
    auto& backend = **backend_ptr;

    auto* jumps = world.try_resource<Events<JumpEvent>>();
    auto* lands = world.try_resource<Events<LandEvent>>();

    world.each<CharacterBody, ControllerConfig, MovementIntent, GroundState, JumpState>(
        [&](Entity e, CharacterBody& body, ControllerConfig& config, MovementIntent& intent,
            GroundState& ground, JumpState& jump) {
            try {
                validate_config(config);
                step(backend, body, config, intent, ground, jump, dt);
            } catch (const ControllerError& err) {
                std::cerr << "[CharacterController] body " << body.body
                          << " skipped: " << err.what() << std::endl;
                intent.jump_requested = false;
                return;
            }
            // The press now lives in the jump buffer.
            intent.jump_requested = false;

            if (jump.landed && lands) lands->send(LandEvent{e, jump.landing_speed});
            if (jump.jumped && jumps) {
                jumps->send(JumpEvent{e, config.max_jumps - jump.jumps_remaining,
                                      jump.vertical_velocity});
            }
        });
}

} // namespace charctl
