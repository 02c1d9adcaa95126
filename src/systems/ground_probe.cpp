#include "ground_probe.hpp"
#include "../math_util.hpp"
#include <algorithm>
#include <cmath>

namespace charctl {

float GroundProbe::probe_distance(const ControllerConfig& config) {
    return config.skin_width * config.ground_probe_factor;
}

GroundState GroundProbe::classify(const std::optional<ShapeHit>& hit, float vertical_velocity,
                                  const ControllerConfig& config) {
    GroundState state; // Airborne
    if (!hit) return state;

    // Still rising from a jump: touching the ground must not re-snap the body.
    if (vertical_velocity > config.ascent_release_speed) return state;

    const float cos_limit = std::cos(glm::radians(config.max_slope_angle));
    const float up_dot    = glm::dot(hit->normal, math::kUp);

    // A downward-facing hit is a ceiling the lifted cast started in, not ground.
    if (up_dot <= 0.0f) return state;

    if (up_dot < cos_limit) {
        state.kind     = GroundState::Kind::Sloped;
        state.normal   = hit->normal;
        state.distance = hit->distance;
        state.angle    = math::slope_angle(hit->normal);
        return state;
    }

    if (hit->distance <= config.skin_width) {
        state.kind     = GroundState::Kind::Grounded;
        state.normal   = hit->normal;
        state.distance = hit->distance;
        state.angle    = math::slope_angle(hit->normal);
    }
    return state;
}

GroundState GroundProbe::probe(const PhysicsBackend& backend, const CharacterBody& body,
                               const glm::vec3& position, float vertical_velocity,
                               const ControllerConfig& config) {
    // Start the cast one skin width up so a resting body is not already
    // touching the ground at distance 0.
    const glm::vec3 origin = position + math::kUp * config.skin_width;
    const float reach      = config.skin_width + probe_distance(config);

    auto hit = backend.cast_shape(body.body, origin, -math::kUp, reach, body.shape);
    if (hit) hit->distance = std::max(0.0f, hit->distance - config.skin_width);

    return classify(hit, vertical_velocity, config);
}

} // namespace charctl
