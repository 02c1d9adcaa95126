#pragma once
#include <ecs/ecs.hpp>
#include <string>

namespace charctl {

// ---------------------------------------------------------------------------
// SceneLoader — reads JSON scene files into the world's PhysicsBackend and
// ECS World.
//
// Static geometry ("plane", "box") goes straight into the backend. Each
// "character" creates a backend body and a controlled entity through
// CharacterControllerSystem::spawn. Requires the std::shared_ptr<PhysicsBackend>
// resource and a registered controller.
// ---------------------------------------------------------------------------

class SceneLoader {
public:
    // Load entities from a JSON file into world.
    // Returns false if the file cannot be opened, the JSON is malformed or a
    // character fails validation.
    static bool load(ecs::World& world, const std::string& path);

    // Parse and spawn from a JSON string — identical to load() but avoids
    // file I/O. Intended for unit testing.
    static bool load_from_string(ecs::World& world, const std::string& json);

    // Destroy all WorldTag entities, removing the bodies of scene characters
    // from the backend. Static geometry stays in the backend.
    static void unload(ecs::World& world);
};

} // namespace charctl
