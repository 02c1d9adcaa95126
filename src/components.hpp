#pragma once
#include <glm/glm.hpp>
#include <cstdint>
#include <limits>

namespace charctl {

// Opaque handle of a body inside the physics backend.
using BodyId = std::uint32_t;
inline constexpr BodyId kInvalidBody = 0xffffffffu;

// ---------------------------------------------------------------------------
// Body geometry
// ---------------------------------------------------------------------------

enum class ShapeKind { Capsule, Cylinder };

// Vertical-axis collider used both for the body and for its probes.
// half_height is the half length of the straight section (Jolt convention):
// a capsule reaches half_height + radius above and below its center.
struct BodyShape {
    ShapeKind kind = ShapeKind::Capsule;
    float radius = 0.4f;
    float half_height = 0.5f;

    // Distance from the center to the top / bottom of the collider.
    float extent_y() const {
        return kind == ShapeKind::Capsule ? half_height + radius : half_height;
    }
};

// The body under control. The host owns the body itself; this is only the link.
struct CharacterBody {
    BodyId body = kInvalidBody;
    BodyShape shape;
    float mass = 70.0f;
};

// ---------------------------------------------------------------------------
// Configuration (per body, mutable after spawn)
// ---------------------------------------------------------------------------

enum class OutputMode {
    KinematicDisplacement, // move_kinematic(velocity * dt)
    KinematicVelocity,     // set_linear_velocity(velocity)
    DynamicImpulse,        // apply_impulse(mass * delta_v)
    DynamicForce           // apply_force(mass * delta_v / dt)
};

struct ControllerConfig {
    // Ground contact
    float max_slope_angle      = 45.0f; // degrees
    float skin_width           = 0.05f; // m
    float ground_probe_factor  = 2.0f;  // probe reach = skin_width * factor
    float ascent_release_speed = 0.5f;  // m/s upward; faster than this is never grounded
    float ground_stick_speed   = 0.1f;  // m/s downward bias while grounded

    // Horizontal motion
    float walk_speed            = 5.0f;  // m/s
    float run_speed             = 8.0f;  // m/s
    float crouch_speed_factor   = 0.5f;
    float ground_acceleration   = 15.0f; // 1/s
    float air_acceleration      = 5.0f;  // 1/s
    float velocity_snap_epsilon = 0.01f; // m/s

    // Slopes and steps
    float slide_blend_rate    = 4.0f;  // blend weight per radian beyond max_slope_angle
    float step_up_height      = 0.35f; // m
    float step_probe_distance = 0.1f;  // m past an obstacle's face where its top is sampled

    // Vertical motion
    float gravity                 = -9.81f; // m/s^2
    float fall_gravity_multiplier = 1.0f;
    float terminal_velocity       = 53.0f;  // m/s, magnitude
    float jump_velocity           = 6.0f;   // m/s
    float coyote_time             = 0.2f;   // s
    float jump_buffer_time        = 0.1f;   // s
    int   max_jumps               = 1;

    OutputMode output_mode = OutputMode::KinematicVelocity;
    bool fly = false;
};

// ---------------------------------------------------------------------------
// Input
// ---------------------------------------------------------------------------

// Raw per-tick player input as delivered by the input-mapping collaborator.
struct PlayerInput {
    glm::vec2 move_axes = {0.0f, 0.0f}; // x = strafe right, y = forward
    float yaw   = 0.0f;                 // radians, 0 faces +Z
    float pitch = 0.0f;                 // radians, positive looks up
    bool jump   = false;                // pressed this tick
    bool sprint = false;
    bool crouch = false;
};

// What the character wants to do this tick. Recomputed every tick.
struct MovementIntent {
    glm::vec3 direction = {0.0f, 0.0f, 0.0f}; // unit or zero; horizontal unless flying
    float speed = 0.0f;                       // m/s
    bool jump_requested = false;
    bool sprint = false;
    bool crouch = false;
};

// ---------------------------------------------------------------------------
// Per-body controller state
// ---------------------------------------------------------------------------

struct GroundState {
    enum class Kind { Grounded, Sloped, Airborne };

    Kind kind = Kind::Airborne;
    glm::vec3 normal = {0.0f, 1.0f, 0.0f};
    float distance = 0.0f; // gap between the collider and the ground (Grounded)
    float angle = 0.0f;    // radians from level (Grounded, Sloped)

    bool grounded() const { return kind == Kind::Grounded; }
    bool sloped() const { return kind == Kind::Sloped; }
    bool airborne() const { return kind == Kind::Airborne; }
};

struct JumpState {
    enum class Phase { Grounded, CoyoteWindow, Airborne };

    Phase phase = Phase::Airborne;
    float time_since_grounded = 0.0f;
    float time_since_jump_request = std::numeric_limits<float>::infinity();
    float vertical_velocity = 0.0f;
    bool jump_consumed = false; // a jump fired since the last landing
    int jumps_remaining = 0;

    // One-tick signals, cleared at the start of every update.
    bool jumped = false;
    bool landed = false;
    float landing_speed = 0.0f;
};

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

struct MovementOutput {
    OutputMode mode = OutputMode::KinematicVelocity;
    glm::vec3 value = {0.0f, 0.0f, 0.0f};    // displacement, velocity, impulse or force
    glm::vec3 velocity = {0.0f, 0.0f, 0.0f}; // resolved target velocity
    float step_up = 0.0f;                    // upward lift applied before moving
};

// Tags
struct PlayerTag {};
struct WorldTag {};

} // namespace charctl
