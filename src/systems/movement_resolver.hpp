#pragma once
#include "../components.hpp"
#include "../physics_backend.hpp"

namespace charctl {

// Result of the forward probe at foot height.
struct StepProbeResult {
    enum class Kind { Clear, StepUp, Wall };

    Kind kind = Kind::Clear;
    float height = 0.0f;                     // obstacle height above the feet (StepUp, Wall)
    glm::vec3 normal = {0.0f, 0.0f, 0.0f};   // obstacle face normal (StepUp, Wall)
};

// Turns intent + ground / jump state into the velocity to apply this tick and
// converts it into the body's output mode.
//
// Rule precedence:
//   1. Sloped:   intent along the slope with climbing removed, plus a downslope
//                slide that grows with gravity; the intent fades out as the
//                slope gets steeper than max_slope_angle
//   2. Grounded: horizontal velocity eases onto direction * speed, vertical
//                follows the ground plane plus a small downward bias that
//                keeps contact
//   3. Airborne: horizontal velocity eases toward the intent with air control
//                (zero intent keeps momentum), vertical comes from JumpState
//   4. Step-up:  on the ground, a low obstacle lifts the body by its height; a
//                tall one is a wall and the velocity into it is removed
class MovementResolver {
public:
    // Desired speed after sprint / crouch modifiers.
    static float target_speed(const MovementIntent& intent, const ControllerConfig& config);

    // Pure resolution, no backend. Exposed for unit testing.
    static MovementOutput resolve(const MovementIntent& intent, const GroundState& ground,
                                  const JumpState& jump, const glm::vec3& current_velocity,
                                  const StepProbeResult& step, float mass,
                                  const ControllerConfig& config, float dt);

    // Velocity on a non-walkable slope (rule 1).
    static glm::vec3 slide_velocity(const glm::vec3& desired, const glm::vec3& current_velocity,
                                    const GroundState& ground, const ControllerConfig& config,
                                    float dt);

    // Forward ray at foot height along desired_velocity, as far as the
    // collider travels this tick, then a downward ray to measure the obstacle.
    // Only probes while grounded.
    static StepProbeResult probe_step(const PhysicsBackend& backend, const CharacterBody& body,
                                      const glm::vec3& position, const GroundState& ground,
                                      const glm::vec3& desired_velocity,
                                      const ControllerConfig& config, float dt);

    // Packs a target velocity into the vector the output mode applies.
    static MovementOutput make_output(const glm::vec3& target, const glm::vec3& current_velocity,
                                      float step_up, float mass, OutputMode mode, float dt);
};

} // namespace charctl
