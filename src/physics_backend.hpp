#pragma once
#include "components.hpp"
#include <glm/glm.hpp>
#include <optional>

namespace charctl {

// Closest obstruction reported by a cast.
struct ShapeHit {
    glm::vec3 point  = {0.0f, 0.0f, 0.0f};
    glm::vec3 normal = {0.0f, 1.0f, 0.0f}; // surface normal, facing the caster
    float distance   = 0.0f;               // travel along the cast direction
    BodyId body      = kInvalidBody;       // kInvalidBody for static geometry
};

enum class MotionType { Kinematic, Dynamic };

enum class BackendKind { Reference, Jolt };

// ---------------------------------------------------------------------------
// PhysicsBackend
//
// The only wire between the controller and a physics engine. Implemented once
// per engine and chosen when the host builds its world.
//
// Contract for every implementation:
//   * casts never report the querying body (self) and only return the
//     closest hit; a cast starting inside geometry reports distance 0
//   * any call naming a body that does not exist throws BodyNotFound
//   * malformed query input (degenerate shape, non-unit direction, negative
//     reach) throws QueryFailed
// ---------------------------------------------------------------------------

class PhysicsBackend {
public:
    virtual ~PhysicsBackend() = default;

    virtual const char* name() const = 0;

    // --- Queries ---
    virtual std::optional<ShapeHit> cast_shape(BodyId self, const glm::vec3& origin,
                                               const glm::vec3& direction, float max_distance,
                                               const BodyShape& shape) const = 0;
    virtual std::optional<ShapeHit> cast_ray(BodyId self, const glm::vec3& origin,
                                             const glm::vec3& direction,
                                             float max_distance) const = 0;

    virtual bool has_body(BodyId body) const = 0;
    virtual glm::vec3 get_position(BodyId body) const = 0;
    virtual glm::vec3 get_linear_velocity(BodyId body) const = 0;

    // --- Application ---
    virtual void set_linear_velocity(BodyId body, const glm::vec3& velocity) = 0;
    virtual void apply_force(BodyId body, const glm::vec3& force) = 0;
    virtual void apply_impulse(BodyId body, const glm::vec3& impulse) = 0;
    // Reaches position + displacement at the end of the next step of length dt.
    virtual void move_kinematic(BodyId body, const glm::vec3& displacement, float dt) = 0;
    // Teleports by offset without touching velocity.
    virtual void translate(BodyId body, const glm::vec3& offset) = 0;

    // --- World ---
    virtual BodyId create_body(const glm::vec3& position, const BodyShape& shape,
                               float mass, MotionType motion) = 0;
    virtual void remove_body(BodyId body) = 0;
    virtual void add_static_box(const glm::vec3& center, const glm::vec3& half_extents) = 0;
    virtual void add_static_plane(const glm::vec3& point, const glm::vec3& normal) = 0;

    virtual void step(float dt) = 0;
};

} // namespace charctl
