#include "config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <iostream>
#include <iterator>

using json = nlohmann::json;

namespace charctl {

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

static void require(bool ok, const char* what) {
    if (!ok) throw InvalidConfiguration(what);
}

void validate_config(const ControllerConfig& c) {
    require(std::isfinite(c.max_slope_angle) && c.max_slope_angle >= 0.0f &&
                c.max_slope_angle < 90.0f,
            "max_slope_angle must be in [0, 90) degrees");
    require(c.skin_width > 0.0f, "skin_width must be positive");
    require(c.ground_probe_factor >= 1.0f, "ground_probe_factor must be at least 1");
    require(c.ascent_release_speed >= 0.0f, "ascent_release_speed must not be negative");
    require(c.ground_stick_speed >= 0.0f, "ground_stick_speed must not be negative");

    require(c.walk_speed >= 0.0f, "walk_speed must not be negative");
    require(c.run_speed >= 0.0f, "run_speed must not be negative");
    require(c.crouch_speed_factor >= 0.0f, "crouch_speed_factor must not be negative");
    require(c.ground_acceleration > 0.0f, "ground_acceleration must be positive");
    require(c.air_acceleration >= 0.0f, "air_acceleration must not be negative");
    require(c.velocity_snap_epsilon >= 0.0f, "velocity_snap_epsilon must not be negative");

    require(c.slide_blend_rate > 0.0f, "slide_blend_rate must be positive");
    require(c.step_up_height >= 0.0f, "step_up_height must not be negative");
    require(c.step_probe_distance >= 0.0f, "step_probe_distance must not be negative");

    require(std::isfinite(c.gravity) && c.gravity <= 0.0f, "gravity must point down");
    require(c.fall_gravity_multiplier > 0.0f, "fall_gravity_multiplier must be positive");
    require(c.terminal_velocity > 0.0f, "terminal_velocity must be positive");
    require(c.jump_velocity >= 0.0f, "jump_velocity must not be negative");
    require(c.coyote_time >= 0.0f, "coyote_time must not be negative");
    require(c.jump_buffer_time >= 0.0f, "jump_buffer_time must not be negative");
    require(c.max_jumps >= 0, "max_jumps must not be negative");
}

void validate_body(const CharacterBody& b) {
    require(b.body != kInvalidBody, "body handle is not set");
    require(b.shape.radius > 0.0f, "shape radius must be positive");
    require(b.shape.half_height >= 0.0f, "shape half_height must not be negative");
    require(b.shape.kind != ShapeKind::Cylinder || b.shape.half_height > 0.0f,
            "cylinder half_height must be positive");
    require(b.mass > 0.0f, "mass must be positive");
}

// ---------------------------------------------------------------------------
// Enum names
// ---------------------------------------------------------------------------

const char* to_string(OutputMode mode) {
    switch (mode) {
        case OutputMode::KinematicDisplacement: return "KinematicDisplacement";
        case OutputMode::KinematicVelocity:     return "KinematicVelocity";
        case OutputMode::DynamicImpulse:        return "DynamicImpulse";
        case OutputMode::DynamicForce:          return "DynamicForce";
    }
    return "Unknown";
}

const char* to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::Reference: return "reference";
        case BackendKind::Jolt:      return "jolt";
    }
    return "unknown";
}

OutputMode parse_output_mode(const std::string& s) {
    if (s == "KinematicDisplacement") return OutputMode::KinematicDisplacement;
    if (s == "KinematicVelocity")     return OutputMode::KinematicVelocity;
    if (s == "DynamicImpulse")        return OutputMode::DynamicImpulse;
    if (s == "DynamicForce")          return OutputMode::DynamicForce;
    throw InvalidConfiguration("unknown output mode '" + s + "'");
}

BackendKind parse_backend_kind(const std::string& s) {
    if (s == "reference") return BackendKind::Reference;
    if (s == "jolt")      return BackendKind::Jolt;
    throw InvalidConfiguration("unknown backend '" + s + "'");
}

// ---------------------------------------------------------------------------
// ConfigLoader
// ---------------------------------------------------------------------------

ControllerConfig ConfigLoader::from_json(const json& j, const ControllerConfig& defaults) {
    if (!j.is_object()) throw InvalidConfiguration("controller block must be an object");

    ControllerConfig c = defaults;
    try {
        c.max_slope_angle      = j.value("max_slope_angle",      c.max_slope_angle);
        c.skin_width           = j.value("skin_width",           c.skin_width);
        c.ground_probe_factor  = j.value("ground_probe_factor",  c.ground_probe_factor);
        c.ascent_release_speed = j.value("ascent_release_speed", c.ascent_release_speed);
        c.ground_stick_speed   = j.value("ground_stick_speed",   c.ground_stick_speed);

        c.walk_speed            = j.value("walk_speed",            c.walk_speed);
        c.run_speed             = j.value("run_speed",             c.run_speed);
        c.crouch_speed_factor   = j.value("crouch_speed_factor",   c.crouch_speed_factor);
        c.ground_acceleration   = j.value("ground_acceleration",   c.ground_acceleration);
        c.air_acceleration      = j.value("air_acceleration",      c.air_acceleration);
        c.velocity_snap_epsilon = j.value("velocity_snap_epsilon", c.velocity_snap_epsilon);

        c.slide_blend_rate    = j.value("slide_blend_rate",    c.slide_blend_rate);
        c.step_up_height      = j.value("step_up_height",      c.step_up_height);
        c.step_probe_distance = j.value("step_probe_distance", c.step_probe_distance);

        c.gravity                 = j.value("gravity",                 c.gravity);
        c.fall_gravity_multiplier = j.value("fall_gravity_multiplier", c.fall_gravity_multiplier);
        c.terminal_velocity       = j.value("terminal_velocity",       c.terminal_velocity);
        c.jump_velocity           = j.value("jump_velocity",           c.jump_velocity);
        c.coyote_time             = j.value("coyote_time",             c.coyote_time);
        c.jump_buffer_time        = j.value("jump_buffer_time",        c.jump_buffer_time);
        c.max_jumps               = j.value("max_jumps",               c.max_jumps);

        c.fly = j.value("fly", c.fly);
        if (j.contains("output_mode")) {
            c.output_mode = parse_output_mode(j["output_mode"].get<std::string>());
        }
    } catch (const json::exception& e) {
        throw InvalidConfiguration(e.what());
    }

    validate_config(c);
    return c;
}

bool ConfigLoader::load_from_string(const std::string& json_str, ControllerConfig& out) {
    try {
        out = from_json(json::parse(json_str), out);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] " << e.what() << std::endl;
        return false;
    }
}

bool ConfigLoader::load(const std::string& path, ControllerConfig& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ConfigLoader] cannot open " << path << std::endl;
        return false;
    }
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(content, out);
}

} // namespace charctl
