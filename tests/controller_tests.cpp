#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/backends/reference_backend.hpp"
#include "../src/errors.hpp"
#include "../src/events.hpp"
#include "../src/modules/controller_module.hpp"
#include "../src/modules/event_bus_module.hpp"
#include "../src/modules/physics_module.hpp"
#include "../src/pipeline.hpp"
#include "../src/systems/character_controller.hpp"
#include "../src/systems/jump_state.hpp"
#include "../src/systems/movement_resolver.hpp"
#include <algorithm>
#include <cmath>
#include <memory>
#include <optional>

// Whole-tick scenarios: modules + pipeline over the reference backend.

using namespace charctl;
using Catch::Matchers::WithinAbs;

static constexpr float kDt = 1.0f / 60.0f;

// ---------------------------------------------------------------------------
// Fixture
// ---------------------------------------------------------------------------

struct ReferenceWorld {
    ecs::World world;
    Pipeline pipeline;
    std::shared_ptr<ReferenceBackend> backend = std::make_shared<ReferenceBackend>();

    explicit ReferenceWorld(bool with_floor = true) {
        EventBusModule::install(world, pipeline);
        PhysicsModule::install(world, pipeline, backend);
        ControllerModule::install(world, pipeline);
        if (with_floor) backend->add_static_plane({0, 0, 0}, {0, 1, 0});
    }

    // Capsule r 0.4 / hh 0.5: rests on the floor at y = 0.9.
    ecs::Entity spawn(const glm::vec3& position, const ControllerConfig& config = {}) {
        CharacterBody body;
        body.body = backend->create_body(position, body.shape, body.mass, MotionType::Dynamic);
        return CharacterControllerSystem::spawn(world, body, config);
    }

    void run(int ticks) {
        for (int i = 0; i < ticks; ++i) pipeline.tick(world, kDt);
    }

    template<typename T>
    T& get(ecs::Entity e) {
        T* c = world.try_get<T>(e);
        REQUIRE(c != nullptr);
        return *c;
    }

    glm::vec3 position(ecs::Entity e) { return backend->get_position(get<CharacterBody>(e).body); }
    glm::vec3 velocity(ecs::Entity e) { return backend->get_linear_velocity(get<CharacterBody>(e).body); }

    const std::vector<JumpEvent>& jumps() { return world.resource<Events<JumpEvent>>().read(); }
    const std::vector<LandEvent>& lands() { return world.resource<Events<LandEvent>>().read(); }

    void walk(ecs::Entity e, const glm::vec3& direction, float speed = 5.0f) {
        auto& intent     = get<MovementIntent>(e);
        intent.direction = direction;
        intent.speed     = speed;
    }
};

static glm::vec3 tilted_normal(float degrees) {
    const float a = glm::radians(degrees);
    return {std::sin(a), std::cos(a), 0.0f};
}

// ---------------------------------------------------------------------------
// Spawning
// ---------------------------------------------------------------------------

TEST_CASE("spawn — adds the controller state", "[controller]") {
    ReferenceWorld fx;
    ControllerConfig cfg;
    cfg.max_jumps = 2;
    auto e = fx.spawn({0, 0.9f, 0}, cfg);

    CHECK(fx.get<ControllerConfig>(e).max_jumps == 2);
    CHECK(fx.get<GroundState>(e).airborne());
    CHECK(fx.get<JumpState>(e).phase == JumpState::Phase::Airborne);
    CHECK(fx.get<JumpState>(e).jumps_remaining == 1);
    CHECK(fx.get<MovementIntent>(e).speed == 0.0f);
}

TEST_CASE("spawn — adding CharacterBody directly gets a default config", "[controller]") {
    ReferenceWorld fx;
    CharacterBody body;
    body.body = fx.backend->create_body({0, 0.9f, 0}, body.shape, body.mass, MotionType::Dynamic);

    auto e = fx.world.create();
    fx.world.add(e, body);

    CHECK(fx.get<ControllerConfig>(e).walk_speed == ControllerConfig{}.walk_speed);
    CHECK(fx.world.try_get<GroundState>(e) != nullptr);
    CHECK(fx.world.try_get<JumpState>(e) != nullptr);
    CHECK(fx.world.try_get<MovementIntent>(e) != nullptr);
}

TEST_CASE("spawn — rejects invalid input without creating anything", "[controller]") {
    ReferenceWorld fx;
    CharacterBody body;
    body.body = fx.backend->create_body({0, 0.9f, 0}, body.shape, body.mass, MotionType::Dynamic);
    const auto before = fx.world.count();

    SECTION("Invalid configuration") {
        ControllerConfig cfg;
        cfg.skin_width = 0.0f;
        CHECK_THROWS_AS(CharacterControllerSystem::spawn(fx.world, body, cfg), InvalidConfiguration);

        cfg = ControllerConfig{};
        cfg.max_slope_angle = 90.0f;
        CHECK_THROWS_AS(CharacterControllerSystem::spawn(fx.world, body, cfg), InvalidConfiguration);
    }

    SECTION("Invalid body") {
        CharacterBody bad = body;
        bad.mass = 0.0f;
        CHECK_THROWS_AS(CharacterControllerSystem::spawn(fx.world, bad, {}), InvalidConfiguration);

        bad = body;
        bad.body = kInvalidBody;
        CHECK_THROWS_AS(CharacterControllerSystem::spawn(fx.world, bad, {}), InvalidConfiguration);
    }

    SECTION("Unknown body") {
        CharacterBody unknown = body;
        unknown.body = 999;
        CHECK_THROWS_AS(CharacterControllerSystem::spawn(fx.world, unknown, {}), BodyNotFound);
    }

    CHECK(fx.world.count() == before);
}

TEST_CASE("spawn — resting on the ground lands on the first tick", "[controller]") {
    ReferenceWorld fx;
    auto e = fx.spawn({0, 0.9f, 0});

    fx.run(1);

    CHECK(fx.get<GroundState>(e).grounded());
    CHECK(fx.get<JumpState>(e).phase == JumpState::Phase::Grounded);
    REQUIRE(fx.lands().size() == 1);
    CHECK_THAT(fx.lands()[0].impact_velocity, WithinAbs(0.0f, 1e-6f));

    // Events live for one tick.
    fx.run(1);
    CHECK(fx.lands().empty());
}

// ---------------------------------------------------------------------------
// Ground movement
// ---------------------------------------------------------------------------

TEST_CASE("Controller — walks at the target speed on flat ground", "[controller]") {
    ReferenceWorld fx;
    auto e = fx.spawn({0, 0.9f, 0});
    fx.walk(e, {1, 0, 0});

    fx.run(60);

    CHECK_THAT(fx.velocity(e).x, WithinAbs(5.0f, 1e-4f));
    CHECK(fx.velocity(e).z == 0.0f);
    CHECK_THAT(fx.position(e).y, WithinAbs(0.9f, 1e-3f));
    CHECK(fx.position(e).x > 4.0f);
    CHECK(fx.get<GroundState>(e).grounded());
}

TEST_CASE("Controller — stops exactly when the intent goes idle", "[controller]") {
    ReferenceWorld fx;
    auto e = fx.spawn({0, 0.9f, 0});
    fx.walk(e, {1, 0, 0});
    fx.run(40);

    fx.walk(e, {0, 0, 0}, 0.0f);
    fx.run(40);

    CHECK(fx.velocity(e).x == 0.0f);
    CHECK(fx.velocity(e).z == 0.0f);
}

TEST_CASE("Controller — every output mode reaches the same walk speed", "[controller]") {
    const OutputMode mode = GENERATE(OutputMode::KinematicDisplacement, OutputMode::KinematicVelocity,
                                     OutputMode::DynamicImpulse, OutputMode::DynamicForce);
    ReferenceWorld fx;
    ControllerConfig cfg;
    cfg.output_mode = mode;
    auto e = fx.spawn({0, 0.9f, 0}, cfg);
    fx.walk(e, {0, 0, 1});

    fx.run(60);

    CHECK_THAT(fx.velocity(e).z, WithinAbs(5.0f, 1e-3f));
    CHECK_THAT(fx.position(e).y, WithinAbs(0.9f, 1e-3f));
    CHECK(fx.get<GroundState>(e).grounded());
}

TEST_CASE("Controller — climbs a walkable ramp", "[controller][slope]") {
    ReferenceWorld fx(false);
    fx.backend->add_static_plane({0, 0, 0}, tilted_normal(30.0f)); // uphill is -X
    auto e = fx.spawn({0, 0.97f, 0});
    fx.walk(e, {-1, 0, 0});

    for (int i = 0; i < 60; ++i) {
        fx.run(1);
        CHECK(fx.get<GroundState>(e).grounded());
    }

    CHECK(fx.position(e).x < -4.0f);
    CHECK(fx.position(e).y > 1.97f);
}

TEST_CASE("Controller — slides down a steep slope and never climbs it", "[controller][slope]") {
    ReferenceWorld fx(false);
    fx.backend->add_static_plane({0, 0, 0}, tilted_normal(60.0f)); // uphill is -X
    auto e = fx.spawn({0, 1.3f, 0});
    fx.walk(e, {-1, 0, 0});

    float last_x = fx.position(e).x;
    for (int i = 0; i < 60; ++i) {
        fx.run(1);
        CHECK(fx.get<GroundState>(e).sloped());
        CHECK(fx.position(e).x >= last_x);
        last_x = fx.position(e).x;
    }

    CHECK(fx.position(e).x > 1.0f);
    CHECK(fx.position(e).y < 0.0f);
    CHECK(fx.get<JumpState>(e).phase != JumpState::Phase::Grounded);
    CHECK(fx.lands().empty());
}

TEST_CASE("Controller — steps onto a low ledge", "[controller][step]") {
    ReferenceWorld fx;
    fx.backend->add_static_box({6.0f, 0.1f, 0}, {4.0f, 0.1f, 1.0f}); // 0.2 high from x = 2
    auto e = fx.spawn({0, 0.9f, 0});
    fx.walk(e, {1, 0, 0});

    fx.run(60);

    CHECK_THAT(fx.position(e).y, WithinAbs(1.1f, 0.02f));
    CHECK(fx.position(e).x > 3.0f);
    CHECK_THAT(fx.velocity(e).x, WithinAbs(5.0f, 1e-4f));
    CHECK(fx.get<GroundState>(e).grounded());
}

TEST_CASE("Controller — stops at a wall taller than the step height", "[controller][step]") {
    ReferenceWorld fx;
    fx.backend->add_static_box({2.5f, 0.5f, 0}, {0.5f, 0.5f, 1.0f}); // 1.0 high from x = 2
    auto e = fx.spawn({0, 0.9f, 0});
    fx.walk(e, {1, 0, 0});

    for (int i = 0; i < 90; ++i) {
        fx.run(1);
        CHECK(fx.position(e).x <= 1.6f + 1e-3f);
    }

    CHECK_THAT(fx.position(e).y, WithinAbs(0.9f, 1e-3f));
    CHECK_THAT(fx.velocity(e).x, WithinAbs(0.0f, 1e-6f));
    CHECK(fx.get<GroundState>(e).grounded());
}

// ---------------------------------------------------------------------------
// probe_step
// ---------------------------------------------------------------------------

// Body with its feet at y = 0, walking +X at 5 m/s. Obstacles start at x = 0.45,
// inside this tick's reach of r + 5 * dt.
struct StepFixture {
    ReferenceBackend backend;
    CharacterBody body;
    ControllerConfig config;
    GroundState ground;

    StepFixture() {
        body.body   = backend.create_body({0, body.shape.extent_y(), 0}, body.shape, body.mass,
                                          MotionType::Dynamic);
        ground.kind = GroundState::Kind::Grounded;
    }

    void add_ledge(float height) {
        backend.add_static_box({0.95f, height * 0.5f, 0}, {0.5f, height * 0.5f, 1.0f});
    }

    StepProbeResult probe() {
        return MovementResolver::probe_step(backend, body, {0, body.shape.extent_y(), 0},
                                            ground, {5.0f, 0, 0}, config, kDt);
    }
};

TEST_CASE("probe_step — step height boundary", "[resolver][step]") {
    StepFixture fx;

    SECTION("Just below the step height climbs") {
        fx.add_ledge(fx.config.step_up_height - 0.01f);
        auto r = fx.probe();
        CHECK(r.kind == StepProbeResult::Kind::StepUp);
        CHECK_THAT(r.height, WithinAbs(fx.config.step_up_height - 0.01f, 1e-5f));
        CHECK_THAT(r.normal.x, WithinAbs(-1.0f, 1e-6f));
    }

    SECTION("Exactly the step height is a wall") {
        fx.add_ledge(fx.config.step_up_height);
        CHECK(fx.probe().kind == StepProbeResult::Kind::Wall);
    }

    SECTION("Above the step height is a wall") {
        fx.add_ledge(fx.config.step_up_height + 0.01f);
        CHECK(fx.probe().kind == StepProbeResult::Kind::Wall);
    }
}

TEST_CASE("probe_step — walkable ramps and far obstacles are clear", "[resolver][step]") {
    StepFixture fx;

    SECTION("Walkable ramp rising ahead") {
        fx.backend.add_static_plane({0.3f, 0, 0}, tilted_normal(-30.0f));
        CHECK(fx.probe().kind == StepProbeResult::Kind::Clear);
    }

    SECTION("Obstacle beyond this tick's reach") {
        fx.backend.add_static_box({1.5f, 0.1f, 0}, {0.5f, 0.1f, 1.0f}); // face at x = 1
        CHECK(fx.probe().kind == StepProbeResult::Kind::Clear);
    }

    SECTION("Only probes while grounded") {
        fx.add_ledge(0.2f);
        fx.ground.kind = GroundState::Kind::Airborne;
        CHECK(fx.probe().kind == StepProbeResult::Kind::Clear);
    }
}

// ---------------------------------------------------------------------------
// Vertical motion
// ---------------------------------------------------------------------------

TEST_CASE("Controller — free fall integrates gravity", "[controller][gravity]") {
    ReferenceWorld fx;

    SECTION("One second") {
        auto e = fx.spawn({0, 50.0f, 0});
        fx.run(60);
        CHECK_THAT(fx.velocity(e).y, WithinAbs(-9.81f, 1e-3f));
        CHECK(fx.get<GroundState>(e).airborne());
        CHECK(fx.lands().empty());
    }

    SECTION("Terminal velocity") {
        ControllerConfig cfg;
        cfg.terminal_velocity = 10.0f;
        auto e = fx.spawn({0, 50.0f, 0}, cfg);
        fx.run(120);
        CHECK_THAT(fx.velocity(e).y, WithinAbs(-10.0f, 1e-6f));
    }
}

TEST_CASE("Controller — jump, apex and landing", "[controller][jump]") {
    ReferenceWorld fx;
    auto e = fx.spawn({0, 0.9f, 0});
    fx.run(5);

    fx.get<MovementIntent>(e).jump_requested = true;
    fx.run(1);

    REQUIRE(fx.jumps().size() == 1);
    CHECK(fx.jumps()[0].jump_number == 1);
    CHECK_THAT(fx.jumps()[0].launch_velocity, WithinAbs(6.0f, 1e-6f));
    CHECK_FALSE(fx.get<MovementIntent>(e).jump_requested);
    CHECK(fx.get<JumpState>(e).phase == JumpState::Phase::Airborne);

    float apex = fx.position(e).y;
    int landed_after = -1;
    float impact = 0.0f;
    for (int i = 1; i <= 120 && landed_after < 0; ++i) {
        fx.run(1);
        apex = std::max(apex, fx.position(e).y);
        if (!fx.lands().empty()) {
            landed_after = i;
            impact = fx.lands()[0].impact_velocity;
        }
    }

    // v^2 / 2g is about 1.83 m; the discrete integration lands a little higher.
    CHECK(apex - 0.9f > 1.6f);
    CHECK(apex - 0.9f < 2.0f);
    REQUIRE(landed_after > 0);
    CHECK(landed_after >= 60);
    CHECK(landed_after <= 90);
    CHECK(impact > 5.0f);
    CHECK(impact < 7.0f);
    CHECK(fx.get<JumpState>(e).phase == JumpState::Phase::Grounded);
    CHECK_THAT(fx.position(e).y, WithinAbs(0.9f, 1e-3f));
}

TEST_CASE("Controller — double jump", "[controller][jump]") {
    ReferenceWorld fx;
    ControllerConfig cfg;
    cfg.max_jumps = 2;
    auto e = fx.spawn({0, 0.9f, 0}, cfg);
    fx.run(5);

    fx.get<MovementIntent>(e).jump_requested = true;
    fx.run(1);
    REQUIRE(fx.jumps().size() == 1);
    CHECK(fx.jumps()[0].jump_number == 1);

    fx.run(10);
    fx.get<MovementIntent>(e).jump_requested = true;
    fx.run(1);
    REQUIRE(fx.jumps().size() == 1);
    CHECK(fx.jumps()[0].jump_number == 2);
    CHECK_THAT(fx.velocity(e).y, WithinAbs(6.0f, 1e-6f));

    // Budget spent.
    fx.run(5);
    fx.get<MovementIntent>(e).jump_requested = true;
    fx.run(1);
    CHECK(fx.jumps().empty());
}

TEST_CASE("Controller — a ceiling cuts the jump short", "[controller][jump]") {
    ReferenceWorld fx;
    fx.backend->add_static_box({0, 2.5f, 0}, {2.0f, 0.5f, 2.0f}); // underside at y = 2
    auto e = fx.spawn({0, 0.9f, 0});
    fx.run(5);

    fx.get<MovementIntent>(e).jump_requested = true;
    fx.run(1);
    REQUIRE(fx.jumps().size() == 1);

    int landed_after = -1;
    for (int i = 1; i <= 40 && landed_after < 0; ++i) {
        fx.run(1);
        CHECK(fx.position(e).y <= 1.1f + 1e-3f);
        if (!fx.lands().empty()) landed_after = i;
    }

    REQUIRE(landed_after > 0);
    CHECK(landed_after < 20);
}

TEST_CASE("Controller — fly mode follows the intent in 3D without gravity", "[controller]") {
    ReferenceWorld fx;
    ControllerConfig cfg;
    cfg.fly = true;
    auto e = fx.spawn({0, 5.0f, 0}, cfg);
    fx.walk(e, {0, 1, 0});

    fx.run(60);

    CHECK_THAT(fx.velocity(e).y, WithinAbs(5.0f, 1e-4f));
    CHECK(fx.position(e).y > 9.0f);
    CHECK(fx.get<GroundState>(e).airborne());
}

// ---------------------------------------------------------------------------
// Player input path
// ---------------------------------------------------------------------------

TEST_CASE("Controller — PlayerInput drives the intent", "[controller][input]") {
    ReferenceWorld fx;
    auto e = fx.spawn({0, 0.9f, 0});
    fx.world.add(e, PlayerTag{});
    fx.world.add(e, PlayerInput{});
    fx.run(5);

    auto& input = fx.get<PlayerInput>(e);
    input.move_axes = {0.0f, 1.0f};
    input.jump      = true;
    fx.run(1);

    CHECK(fx.jumps().size() == 1);
    CHECK_FALSE(fx.get<PlayerInput>(e).jump);
    CHECK(fx.velocity(e).z > 0.0f);

    fx.run(1);
    CHECK(fx.jumps().empty());
}

TEST_CASE("Controller — accumulated yaw is wrapped into [-pi, pi]", "[controller][input]") {
    const float pi = 3.1415926535f;
    ReferenceWorld fx;
    auto e = fx.spawn({0, 0.9f, 0});
    fx.world.add(e, PlayerTag{});
    fx.world.add(e, PlayerInput{});
    fx.run(5);

    auto& input     = fx.get<PlayerInput>(e);
    input.move_axes = {0.0f, 1.0f};
    input.yaw       = 4.0f * pi + 0.5f * pi; // four full turns, then face +X
    fx.run(1);

    CHECK_THAT(fx.get<PlayerInput>(e).yaw, WithinAbs(0.5f * pi, 1e-4f));
    const MovementIntent& intent = fx.get<MovementIntent>(e);
    CHECK_THAT(intent.direction.x, WithinAbs(1.0f, 1e-4f));
    CHECK_THAT(intent.direction.z, WithinAbs(0.0f, 1e-4f));
}

// ---------------------------------------------------------------------------
// Failure isolation
// ---------------------------------------------------------------------------

TEST_CASE("Controller — a missing body only skips its own tick", "[controller][errors]") {
    ReferenceWorld fx;
    auto lost = fx.spawn({0, 0.9f, 0});
    auto kept = fx.spawn({5, 0.9f, 0});
    fx.walk(lost, {0, 0, 1});
    fx.walk(kept, {0, 0, 1});
    fx.run(1);

    fx.backend->remove_body(fx.get<CharacterBody>(lost).body);
    fx.get<MovementIntent>(lost).jump_requested = true;
    const GroundState ground_before = fx.get<GroundState>(lost);

    CHECK_NOTHROW(fx.run(30));

    CHECK_THAT(fx.velocity(kept).z, WithinAbs(5.0f, 1e-4f));
    CHECK(fx.get<GroundState>(lost).kind == ground_before.kind);
    CHECK_FALSE(fx.get<MovementIntent>(lost).jump_requested);
}

TEST_CASE("step — failure leaves the state untouched", "[controller][errors]") {
    ReferenceBackend backend;
    CharacterBody body;
    body.body = backend.create_body({0, 0.9f, 0}, body.shape, body.mass, MotionType::Dynamic);
    backend.remove_body(body.body);

    GroundState ground;
    ground.kind = GroundState::Kind::Grounded;
    JumpState jump;
    jump.phase           = JumpState::Phase::Grounded;
    jump.jumps_remaining = 1;

    MovementIntent intent;
    intent.jump_requested = true;

    CHECK_THROWS_AS(CharacterControllerSystem::step(backend, body, {}, intent, ground, jump, kDt),
                    BodyNotFound);
    CHECK(ground.grounded());
    CHECK(jump.phase == JumpState::Phase::Grounded);
    CHECK(jump.jumps_remaining == 1);
}

// Reference world whose ray casts fail, as a backend rejecting a query would.
class RayFailingBackend final : public PhysicsBackend {
public:
    ReferenceBackend inner;

    const char* name() const override { return "ray-failing"; }

    std::optional<ShapeHit> cast_shape(BodyId self, const glm::vec3& origin,
                                       const glm::vec3& direction, float max_distance,
                                       const BodyShape& shape) const override {
        return inner.cast_shape(self, origin, direction, max_distance, shape);
    }
    std::optional<ShapeHit> cast_ray(BodyId, const glm::vec3&, const glm::vec3&,
                                     float) const override {
        throw QueryFailed("ray casts unavailable");
    }

    bool has_body(BodyId body) const override { return inner.has_body(body); }
    glm::vec3 get_position(BodyId body) const override { return inner.get_position(body); }
    glm::vec3 get_linear_velocity(BodyId body) const override { return inner.get_linear_velocity(body); }

    void set_linear_velocity(BodyId body, const glm::vec3& v) override { inner.set_linear_velocity(body, v); }
    void apply_force(BodyId body, const glm::vec3& f) override { inner.apply_force(body, f); }
    void apply_impulse(BodyId body, const glm::vec3& j) override { inner.apply_impulse(body, j); }
    void move_kinematic(BodyId body, const glm::vec3& d, float dt) override { inner.move_kinematic(body, d, dt); }
    void translate(BodyId body, const glm::vec3& offset) override { inner.translate(body, offset); }

    BodyId create_body(const glm::vec3& position, const BodyShape& shape, float mass,
                       MotionType motion) override {
        return inner.create_body(position, shape, mass, motion);
    }
    void remove_body(BodyId body) override { inner.remove_body(body); }
    void add_static_box(const glm::vec3& c, const glm::vec3& h) override { inner.add_static_box(c, h); }
    void add_static_plane(const glm::vec3& p, const glm::vec3& n) override { inner.add_static_plane(p, n); }

    void step(float dt) override { inner.step(dt); }
};

TEST_CASE("step — a failing step probe only costs the step-up", "[controller][errors]") {
    RayFailingBackend backend;
    backend.add_static_plane({0, 0, 0}, {0, 1, 0});
    CharacterBody body;
    body.body = backend.create_body({0, 0.9f, 0}, body.shape, body.mass, MotionType::Dynamic);

    const ControllerConfig config;
    GroundState ground;
    JumpState jump = JumpSystem::initial_state(config);

    MovementIntent intent;
    intent.direction = {1, 0, 0};
    intent.speed     = 5.0f;

    MovementOutput out;
    REQUIRE_NOTHROW(out = CharacterControllerSystem::step(backend, body, config, intent, ground,
                                                          jump, kDt));

    // First ground tick: a quarter of the way to 5 m/s.
    CHECK_THAT(out.velocity.x, WithinAbs(1.25f, 1e-4f));
    CHECK(out.step_up == 0.0f);
    CHECK_THAT(backend.get_linear_velocity(body.body).x, WithinAbs(1.25f, 1e-4f));

    // The tick was committed: the spawned body landed.
    CHECK(ground.grounded());
    CHECK(jump.phase == JumpState::Phase::Grounded);
    CHECK(jump.jumps_remaining == config.max_jumps);
}

TEST_CASE("Controller — no backend resource is a no-op", "[controller][errors]") {
    ecs::World world;
    Pipeline pipeline;
    EventBusModule::install(world, pipeline);
    ControllerModule::install(world, pipeline);

    CharacterBody body;
    body.body = 1;
    auto e = CharacterControllerSystem::spawn(world, body, {});

    CHECK_NOTHROW(pipeline.tick(world, kDt));
    CHECK(world.try_get<GroundState>(e)->airborne());
}
