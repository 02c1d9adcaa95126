#pragma once
#include "../events.hpp"
#include "../pipeline.hpp"
#include "../systems/character_controller.hpp"
#include "../systems/character_input.hpp"
#include <ecs/ecs.hpp>

namespace charctl {

// ---------------------------------------------------------------------------
// ControllerModule
//
// Registers the CharacterBody lifecycle hook, the event queues the controller
// emits (JumpEvent, LandEvent), and wires CharacterInputSystem then
// CharacterControllerSystem into the Logic phase.
//
// Install after EventBusModule and PhysicsModule. The controller must be the
// last Logic step before the Physics phase.
// ---------------------------------------------------------------------------

struct ControllerModule {
    static void install(ecs::World& world, Pipeline& pipeline) {
        CharacterControllerSystem::Register(world);

        if (auto* registry = world.try_resource<EventRegistry>()) {
            registry->register_queue<JumpEvent>(world);
            registry->register_queue<LandEvent>(world);
        }

        pipeline.add_logic([](ecs::World& w, float dt) { CharacterInputSystem::Update(w, dt); });
        pipeline.add_logic([](ecs::World& w, float dt) { CharacterControllerSystem::Update(w, dt); });
    }
};

} // namespace charctl
