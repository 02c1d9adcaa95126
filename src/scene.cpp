#include "scene.hpp"
#include "components.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "physics_backend.hpp"
#include "systems/character_controller.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace charctl {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static glm::vec3 parse_vec3(const json& j) {
    return {j.at(0).get<float>(), j.at(1).get<float>(), j.at(2).get<float>()};
}

static ShapeKind parse_shape_kind(const std::string& s) {
    if (s == "Capsule")  return ShapeKind::Capsule;
    if (s == "Cylinder") return ShapeKind::Cylinder;
    throw InvalidConfiguration("unknown shape '" + s + "'");
}

static MotionType parse_motion(const std::string& s) {
    if (s == "Dynamic")   return MotionType::Dynamic;
    if (s == "Kinematic") return MotionType::Kinematic;
    throw InvalidConfiguration("unknown motion type '" + s + "'");
}

struct EntityTags {
    bool world  = false;
    bool player = false;
};

// Read before anything is created, so a malformed tag list leaves no body or
// entity behind.
static EntityTags parse_tags(const json& e) {
    EntityTags tags;
    if (!e.contains("tags")) return tags;
    for (const auto& tag : e["tags"]) {
        const std::string t = tag.get<std::string>();
        if (t == "World")  tags.world  = true;
        if (t == "Player") tags.player = true;
    }
    return tags;
}

static void add_tags(ecs::World& world, ecs::Entity ent, const EntityTags& tags) {
    if (tags.world) world.add(ent, WorldTag{});
    if (tags.player) {
        world.add(ent, PlayerTag{});
        world.add(ent, PlayerInput{});
    }
}

// ---------------------------------------------------------------------------
// Entity spawning
// ---------------------------------------------------------------------------

static void spawn_entity(ecs::World& world, PhysicsBackend& backend, const json& e) {
    const EntityTags tags = parse_tags(e);

    if (e.contains("plane")) {
        const auto& p = e["plane"];
        glm::vec3 point  = p.contains("point")  ? parse_vec3(p["point"])  : glm::vec3(0.0f);
        glm::vec3 normal = p.contains("normal") ? parse_vec3(p["normal"]) : glm::vec3(0.0f, 1.0f, 0.0f);
        backend.add_static_plane(point, normal);
    }

    if (e.contains("box")) {
        const auto& b = e["box"];
        backend.add_static_box(parse_vec3(b.at("center")), parse_vec3(b.at("half_extents")));
    }

    if (e.contains("character")) {
        const auto& ch = e["character"];

        CharacterBody body;
        if (ch.contains("shape")) {
            const auto& s = ch["shape"];
            body.shape.kind        = parse_shape_kind(s.value("kind", std::string("Capsule")));
            body.shape.radius      = s.value("radius",      body.shape.radius);
            body.shape.half_height = s.value("half_height", body.shape.half_height);
        }
        body.mass = ch.value("mass", body.mass);

        ControllerConfig config;
        if (ch.contains("controller")) config = ConfigLoader::from_json(ch["controller"]);

        glm::vec3 pos = ch.contains("position") ? parse_vec3(ch["position"]) : glm::vec3(0.0f);
        MotionType motion = parse_motion(ch.value("motion", std::string("Dynamic")));

        body.body = backend.create_body(pos, body.shape, body.mass, motion);
        try {
            ecs::Entity ent = CharacterControllerSystem::spawn(world, body, config);
            add_tags(world, ent, tags);
        } catch (const ControllerError&) {
            backend.remove_body(body.body);
            throw;
        }
        return;
    }

    // Static entries get an entity only when they carry tags.
    if (e.contains("tags")) add_tags(world, world.create(), tags);
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool SceneLoader::load_from_string(ecs::World& world, const std::string& json_str) {
    auto* backend = world.try_resource<std::shared_ptr<PhysicsBackend>>();
    if (!backend || !*backend) {
        std::cerr << "[SceneLoader] no physics backend registered" << std::endl;
        return false;
    }

    try {
        json scene = json::parse(json_str);
        for (const auto& entity_json : scene.at("entities")) {
            spawn_entity(world, **backend, entity_json);
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[SceneLoader] " << e.what() << std::endl;
        return false;
    }
}

bool SceneLoader::load(ecs::World& world, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[SceneLoader] cannot open " << path << std::endl;
        return false;
    }
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(world, content);
}

void SceneLoader::unload(ecs::World& world) {
    auto* backend = world.try_resource<std::shared_ptr<PhysicsBackend>>();

    std::vector<ecs::Entity> to_destroy;
    world.each<WorldTag>([&](ecs::Entity e, WorldTag&) { to_destroy.push_back(e); });
    for (auto e : to_destroy) {
        auto* body = world.try_get<CharacterBody>(e);
        if (body && backend && *backend && (*backend)->has_body(body->body)) {
            (*backend)->remove_body(body->body);
        }
        world.destroy(e);
    }
    world.deferred().flush(world);
}

} // namespace charctl
