#pragma once
#include "../components.hpp"
#include "../physics_backend.hpp"
#include <ecs/ecs.hpp>

namespace charctl {

// ---------------------------------------------------------------------------
// CharacterControllerSystem
//
// Per-tick orchestration for every entity with a CharacterBody:
//   ground probe -> jump / gravity -> step probe -> movement resolve -> output
//
// GroundState, JumpState and MovementIntent live on the entity and are added
// by the on_add hook. The backend is the World resource
// std::shared_ptr<PhysicsBackend>. A ControllerError thrown while stepping one
// body is logged and costs only that body its tick.
// ---------------------------------------------------------------------------

class CharacterControllerSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);

    // Validates and creates a controlled character for an existing backend
    // body. Throws InvalidConfiguration (nothing is created) or BodyNotFound
    // when the backend resource does not know the body.
    static ecs::Entity spawn(ecs::World& world, const CharacterBody& body,
                             const ControllerConfig& config = {});

    // One tick for one body. ground and jump are only written when the whole
    // tick succeeds. Exposed for unit testing.
    static MovementOutput step(PhysicsBackend& backend, const CharacterBody& body,
                               const ControllerConfig& config, const MovementIntent& intent,
                               GroundState& ground, JumpState& jump, float dt);

    static void apply_output(PhysicsBackend& backend, BodyId body, const MovementOutput& out,
                             float dt);
};

} // namespace charctl
