#pragma once
#include "../physics_backend.hpp"
#include "../pipeline.hpp"
#include <ecs/ecs.hpp>
#include <memory>

namespace charctl {

// ---------------------------------------------------------------------------
// PhysicsModule
//
// Registers the chosen backend as the std::shared_ptr<PhysicsBackend> world
// resource and wires its fixed step into the Physics pipeline phase. The
// backend is picked by the host (see make_backend), never inspected here.
// ---------------------------------------------------------------------------

struct PhysicsModule {
    static void install(ecs::World& world, Pipeline& pipeline,
                        std::shared_ptr<PhysicsBackend> backend) {
        world.set_resource(std::move(backend));
        pipeline.add_physics([](ecs::World& w, float dt) {
            auto* b = w.try_resource<std::shared_ptr<PhysicsBackend>>();
            if (b && *b) (*b)->step(dt);
        });
    }
};

} // namespace charctl
