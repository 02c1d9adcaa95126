#include "movement_resolver.hpp"
#include "../math_util.hpp"
#include <algorithm>
#include <cmath>

namespace charctl {

using math::kUp;

float MovementResolver::target_speed(const MovementIntent& intent, const ControllerConfig& config) {
    float speed = intent.speed;
    if (intent.sprint && config.walk_speed > 0.0f) speed *= config.run_speed / config.walk_speed;
    if (intent.crouch) speed *= config.crouch_speed_factor;
    return speed;
}

glm::vec3 MovementResolver::slide_velocity(const glm::vec3& desired, const glm::vec3& current_velocity,
                                           const GroundState& ground, const ControllerConfig& config,
                                           float dt) {
    const glm::vec3 down = math::downslope_direction(ground.normal);

    // Intent along the surface, minus anything that would climb it.
    glm::vec3 along = math::project_on_plane(desired, ground.normal);
    float uphill = glm::dot(along, -down);
    if (uphill > 0.0f) along += down * uphill;

    // Gravity along the slope keeps feeding the slide.
    float slide_speed = std::max(0.0f, glm::dot(current_velocity, down));
    slide_speed += std::abs(config.gravity) * std::sin(ground.angle) * dt;
    slide_speed  = std::min(slide_speed, config.terminal_velocity);

    const float excess = ground.angle - glm::radians(config.max_slope_angle);
    const float weight = std::clamp(excess * config.slide_blend_rate, 0.0f, 1.0f);

    return along * (1.0f - weight) + down * slide_speed;
}

MovementOutput MovementResolver::resolve(const MovementIntent& intent, const GroundState& ground,
                                         const JumpState& jump, const glm::vec3& current_velocity,
                                         const StepProbeResult& step, float mass,
                                         const ControllerConfig& config, float dt) {
    const float speed = target_speed(intent, config);
    const glm::vec3 current_h = math::horizontal(current_velocity);
    const glm::vec3 target_h  = math::horizontal(intent.direction) * speed;

    glm::vec3 velocity(0.0f);
    float step_up = 0.0f;

    if (config.fly) {
        velocity = math::approach(current_velocity, intent.direction * speed,
                                  config.ground_acceleration, dt, config.velocity_snap_epsilon);
    } else if (ground.sloped() && !jump.jumped) {
        velocity = slide_velocity(target_h, current_velocity, ground, config, dt);
    } else if (jump.phase == JumpState::Phase::Grounded) {
        glm::vec3 h = math::approach(current_h, target_h, config.ground_acceleration, dt,
                                     config.velocity_snap_epsilon);

        if (step.kind == StepProbeResult::Kind::Wall) {
            glm::vec3 n = math::normalize_or_zero(math::horizontal(step.normal));
            float into = glm::dot(h, n);
            if (into < 0.0f) h -= n * into;
        }

        // Follow the ground plane, plus a bias that keeps contact.
        float follow = 0.0f;
        if (ground.normal.y > 1e-4f) {
            follow = -(ground.normal.x * h.x + ground.normal.z * h.z) / ground.normal.y;
        }
        float down = std::max(config.ground_stick_speed, ground.distance / dt);
        if (step.kind == StepProbeResult::Kind::StepUp) {
            step_up = step.height;
            follow  = 0.0f;
            down    = 0.0f;
        }
        velocity = {h.x, follow - down, h.z};
    } else {
        glm::vec3 h = current_h;
        if (glm::length(target_h) > 0.0f) {
            h = math::approach(current_h, target_h, config.air_acceleration, dt,
                               config.velocity_snap_epsilon);
        }
        velocity = {h.x, jump.vertical_velocity, h.z};
    }

    return make_output(velocity, current_velocity, step_up, mass, config.output_mode, dt);
}

StepProbeResult MovementResolver::probe_step(const PhysicsBackend& backend, const CharacterBody& body,
                                             const glm::vec3& position, const GroundState& ground,
                                             const glm::vec3& desired_velocity,
                                             const ControllerConfig& config, float dt) {
    StepProbeResult result;
    if (config.fly || !ground.grounded()) return result;

    const glm::vec3 desired_h = math::horizontal(desired_velocity);
    const float speed = glm::length(desired_h);
    if (speed < 1e-4f) return result;
    const glm::vec3 dir = desired_h / speed;

    const float foot = position.y - body.shape.extent_y();
    const glm::vec3 origin{position.x, foot + config.skin_width, position.z};

    // Only obstacles the collider reaches this tick matter.
    const float reach = body.shape.radius + speed * dt;
    auto hit = backend.cast_ray(body.body, origin, dir, reach);
    if (!hit) return result;

    // A walkable ramp is the ground probe's business, not an obstacle.
    if (glm::dot(hit->normal, kUp) >= std::cos(glm::radians(config.max_slope_angle))) return result;

    // Drop a ray onto the obstacle, just past its face, from above the
    // highest climbable step.
    const float drop = config.step_up_height + config.skin_width;
    glm::vec3 top = hit->point + dir * config.step_probe_distance;
    top.y = foot + drop;

    auto down = backend.cast_ray(body.body, top, -kUp, drop);
    if (!down) return result;

    const float height = top.y - down->distance - foot;
    result.normal = hit->normal;
    result.height = height;
    if (height >= config.step_up_height) {
        result.kind = StepProbeResult::Kind::Wall;
    } else if (height > 0.0f) {
        result.kind = StepProbeResult::Kind::StepUp;
    }
    return result;
}

MovementOutput MovementResolver::make_output(const glm::vec3& target, const glm::vec3& current_velocity,
                                             float step_up, float mass, OutputMode mode, float dt) {
    MovementOutput out;
    out.mode     = mode;
    out.velocity = target;
    out.step_up  = step_up;

    switch (mode) {
        case OutputMode::KinematicDisplacement:
            out.value = target * dt;
            break;
        case OutputMode::KinematicVelocity:
            out.value = target;
            break;
        case OutputMode::DynamicImpulse:
            out.value = (target - current_velocity) * mass;
            break;
        case OutputMode::DynamicForce:
            out.value = (target - current_velocity) * mass / dt;
            break;
    }
    return out;
}

} // namespace charctl
