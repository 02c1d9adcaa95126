#pragma once
#include "../components.hpp"
#include "../physics_backend.hpp"
#include <optional>

namespace charctl {

// Downward shape cast under the body and its Grounded / Sloped / Airborne
// classification. Runs first in every controller tick.
class GroundProbe {
public:
    // How far below the collider ground is still looked for.
    static float probe_distance(const ControllerConfig& config);

    // Pure classification, no backend. hit->distance is the gap between the
    // bottom of the collider and the surface.
    static GroundState classify(const std::optional<ShapeHit>& hit, float vertical_velocity,
                                const ControllerConfig& config);

    // Casts the body's own shape from skin_width above its position and
    // classifies the result. Throws BodyNotFound / QueryFailed from the backend.
    static GroundState probe(const PhysicsBackend& backend, const CharacterBody& body,
                             const glm::vec3& position, float vertical_velocity,
                             const ControllerConfig& config);
};

} // namespace charctl
