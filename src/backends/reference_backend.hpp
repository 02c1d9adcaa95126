#pragma once
#include "../physics_backend.hpp"
#include <cstddef>
#include <unordered_map>
#include <vector>

namespace charctl {

// ---------------------------------------------------------------------------
// ReferenceBackend
//
// Small deterministic world in plain C++: static infinite planes, static
// axis-aligned boxes and vertical capsule/cylinder bodies. No world gravity;
// the controller integrates its own. Used by the headless tests and as the
// second backend of the demo.
//
// Simplifications:
//   * against boxes and other bodies, cast shapes are swept as their bounding
//     boxes (rounded capsule ends are ignored)
//   * after integration, bodies are pushed out of static geometry along the
//     contact normal and lose the velocity component into it; body/body
//     contacts are not resolved
//   * forces on kinematic bodies are ignored, as in most engines
// ---------------------------------------------------------------------------

class ReferenceBackend final : public PhysicsBackend {
public:
    const char* name() const override { return "reference"; }

    std::optional<ShapeHit> cast_shape(BodyId self, const glm::vec3& origin,
                                       const glm::vec3& direction, float max_distance,
                                       const BodyShape& shape) const override;
    std::optional<ShapeHit> cast_ray(BodyId self, const glm::vec3& origin,
                                     const glm::vec3& direction,
                                     float max_distance) const override;

    bool has_body(BodyId body) const override;
    glm::vec3 get_position(BodyId body) const override;
    glm::vec3 get_linear_velocity(BodyId body) const override;

    void set_linear_velocity(BodyId body, const glm::vec3& velocity) override;
    void apply_force(BodyId body, const glm::vec3& force) override;
    void apply_impulse(BodyId body, const glm::vec3& impulse) override;
    void move_kinematic(BodyId body, const glm::vec3& displacement, float dt) override;
    void translate(BodyId body, const glm::vec3& offset) override;

    BodyId create_body(const glm::vec3& position, const BodyShape& shape,
                       float mass, MotionType motion) override;
    void remove_body(BodyId body) override;
    void add_static_box(const glm::vec3& center, const glm::vec3& half_extents) override;
    void add_static_plane(const glm::vec3& point, const glm::vec3& normal) override;

    void step(float dt) override;

    std::size_t body_count() const { return bodies_.size(); }

private:
    struct Body {
        glm::vec3 position = {0.0f, 0.0f, 0.0f};
        glm::vec3 velocity = {0.0f, 0.0f, 0.0f};
        glm::vec3 accumulated_force = {0.0f, 0.0f, 0.0f};
        BodyShape shape;
        float mass = 1.0f;
        MotionType motion = MotionType::Dynamic;
    };

    // Solid half-space: dot(normal, x) <= offset is inside.
    struct Plane {
        glm::vec3 normal;
        float offset;
    };

    struct Box {
        glm::vec3 min;
        glm::vec3 max;
    };

    Body& body_ref(BodyId body);
    const Body& body_ref(BodyId body) const;
    void resolve_contacts(Body& body) const;

    std::unordered_map<BodyId, Body> bodies_;
    std::vector<Plane> planes_;
    std::vector<Box> boxes_;
    BodyId next_id_ = 1;
};

} // namespace charctl
