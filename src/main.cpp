#include "components.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "pipeline.hpp"
#include "scene.hpp"
#include "backends/backend_factory.hpp"
#include "modules/controller_module.hpp"
#include "modules/event_bus_module.hpp"
#include "modules/physics_module.hpp"
#include <ecs/ecs.hpp>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

static const char* SCENE_PATH = "resources/scenes/default.json";

namespace {

struct DemoOptions {
    charctl::BackendKind backend = charctl::BackendKind::Reference;
    std::optional<charctl::OutputMode> mode;
    std::string scene = SCENE_PATH;
    float seconds = 6.0f;
};

void print_usage() {
    std::cout << "usage: charctl_demo [--backend reference|jolt] [--mode <output mode>]\n"
                 "                    [--scene <file>] [--seconds N]\n"
                 "output modes: KinematicDisplacement KinematicVelocity DynamicImpulse DynamicForce"
              << std::endl;
}

// Returns false on a malformed command line.
bool parse_args(int argc, char** argv, DemoOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") return false;
        if (i + 1 >= argc) {
            std::cerr << "[Demo] missing value for " << arg << std::endl;
            return false;
        }
        const std::string value = argv[++i];
        try {
            if (arg == "--backend")      opts.backend = charctl::parse_backend_kind(value);
            else if (arg == "--mode")    opts.mode    = charctl::parse_output_mode(value);
            else if (arg == "--scene")   opts.scene   = value;
            else if (arg == "--seconds") opts.seconds = std::stof(value);
            else {
                std::cerr << "[Demo] unknown option " << arg << std::endl;
                return false;
            }
        } catch (const std::exception& e) {
            std::cerr << "[Demo] bad value for " << arg << ": " << e.what() << std::endl;
            return false;
        }
    }
    return true;
}

const char* ground_name(const charctl::GroundState& g) {
    switch (g.kind) {
        case charctl::GroundState::Kind::Grounded: return "Grounded";
        case charctl::GroundState::Kind::Sloped:   return "Sloped";
        case charctl::GroundState::Kind::Airborne: return "Airborne";
    }
    return "?";
}

// Scripted player: walk forward, hop at 0.5 s, sprint from 2.5 s, hop again at
// 4 s, then keep turning from 5 s.
void drive_input(charctl::PlayerInput& input, float t, float dt) {
    auto pressed_at = [&](float at) { return t <= at && at < t + dt; };
    input.move_axes = {0.0f, 1.0f};
    if (t >= 5.0f) input.yaw += 1.5f * dt;
    input.sprint    = t >= 2.5f;
    input.jump      = pressed_at(0.5f) || pressed_at(4.0f);
}

} // namespace

int main(int argc, char** argv) {
    DemoOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return 1;
    }

    ecs::World world;
    charctl::Pipeline pipeline;

    std::shared_ptr<charctl::PhysicsBackend> backend;
    try {
        backend = charctl::make_backend(opts.backend);
    } catch (const std::exception& e) {
        std::cerr << "[Demo] cannot create " << charctl::to_string(opts.backend)
                  << " backend: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "[Demo] backend: " << backend->name() << std::endl;

    charctl::EventBusModule::install(world, pipeline);
    charctl::PhysicsModule::install(world, pipeline, backend);
    charctl::ControllerModule::install(world, pipeline);

    if (!charctl::SceneLoader::load(world, opts.scene)) {
        std::cerr << "[Demo] failed to load scene " << opts.scene << std::endl;
        return 1;
    }

    if (opts.mode) {
        world.each<charctl::PlayerTag, charctl::ControllerConfig>(
            [&](ecs::Entity, charctl::PlayerTag&, charctl::ControllerConfig& cfg) {
                cfg.output_mode = *opts.mode;
            });
    }

    // Scripted input runs after the event flush, before the controller.
    float t = 0.0f;
    const float fixed_dt = 1.0f / 60.0f;
    pipeline.add_pre_update([&t](ecs::World& w, float dt) {
        w.each<charctl::PlayerTag, charctl::PlayerInput>(
            [&](ecs::Entity, charctl::PlayerTag&, charctl::PlayerInput& input) {
                drive_input(input, t, dt);
            });
    });

    std::string last_ground;
    const int ticks = static_cast<int>(opts.seconds / fixed_dt);

    for (int i = 0; i < ticks; ++i, t += fixed_dt) {
        pipeline.update(world, fixed_dt);

        for (const auto& ev : world.resource<charctl::Events<charctl::JumpEvent>>().read()) {
            std::printf("[Demo] t=%5.2f jump #%d  launch %.2f m/s\n", t, ev.jump_number, ev.launch_velocity);
        }
        for (const auto& ev : world.resource<charctl::Events<charctl::LandEvent>>().read()) {
            std::printf("[Demo] t=%5.2f land     impact %.2f m/s\n", t, ev.impact_velocity);
        }

        world.each<charctl::PlayerTag, charctl::GroundState>(
            [&](ecs::Entity, charctl::PlayerTag&, charctl::GroundState& g) {
                const std::string now = ground_name(g);
                if (now != last_ground) {
                    std::printf("[Demo] t=%5.2f ground   %s\n", t, now.c_str());
                    last_ground = now;
                }
            });

        pipeline.step_physics(world, fixed_dt);
    }

    world.each<charctl::PlayerTag, charctl::CharacterBody>(
        [&](ecs::Entity, charctl::PlayerTag&, charctl::CharacterBody& body) {
            try {
                glm::vec3 p = backend->get_position(body.body);
                std::printf("[Demo] final position (%.2f, %.2f, %.2f)\n", p.x, p.y, p.z);
            } catch (const charctl::ControllerError& e) {
                std::cerr << "[Demo] " << e.what() << std::endl;
            }
        });

    charctl::SceneLoader::unload(world);
    return 0;
}
