#pragma once
#include "../physics_backend.hpp"
#include "jolt_context.hpp"
#include <Jolt/Physics/Body/BodyID.h>
#include <Jolt/Physics/Collision/Shape/Shape.h>
#include <memory>
#include <vector>

namespace charctl {

// ---------------------------------------------------------------------------
// JoltBackend
//
// PhysicsBackend on Jolt Physics. Controlled bodies are dynamic bodies with
// rotation locked and linear-cast motion quality; world gravity is zero since
// the controller integrates its own. Planes become large thin static boxes.
// BodyId is the Jolt BodyID's index and sequence number.
// ---------------------------------------------------------------------------

class JoltBackend final : public PhysicsBackend {
public:
    JoltBackend();
    ~JoltBackend() override;

    const char* name() const override { return "jolt"; }

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

private:
    JPH::BodyID checked_id(BodyId body) const;
    void add_static(JPH::RefConst<JPH::Shape> shape, const glm::vec3& position,
                    const JPH::Quat& rotation);

    std::unique_ptr<JoltContext> ctx_;
    std::vector<JPH::BodyID> static_bodies_;
};

} // namespace charctl
