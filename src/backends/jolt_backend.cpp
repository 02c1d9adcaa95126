#include "jolt_backend.hpp"
#include "jolt_bridge.hpp"
#include "query_checks.hpp"
#include "../errors.hpp"
#include <Jolt/Physics/Body/BodyCreationSettings.h>
#include <Jolt/Physics/Body/BodyFilter.h>
#include <Jolt/Physics/Body/BodyLock.h>
#include <Jolt/Physics/Collision/CastResult.h>
#include <Jolt/Physics/Collision/CollisionCollectorImpl.h>
#include <Jolt/Physics/Collision/NarrowPhaseQuery.h>
#include <Jolt/Physics/Collision/RayCast.h>
#include <Jolt/Physics/Collision/ShapeCast.h>
#include <Jolt/Physics/Collision/Shape/BoxShape.h>
#include <Jolt/Physics/Collision/Shape/CapsuleShape.h>
#include <Jolt/Physics/Collision/Shape/CylinderShape.h>
#include <Jolt/Physics/Collision/Shape/SphereShape.h>
#include <algorithm>
#include <iostream>
#include <string>

namespace charctl {

using namespace JPH;

// Half size of the box standing in for an infinite plane.
static constexpr float kPlaneHalfExtent    = 1000.0f;
static constexpr float kPlaneHalfThickness = 1.0f;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static RefConst<Shape> make_shape(const BodyShape& shape) {
    check_shape(shape);

    ShapeSettings::ShapeResult result;
    if (shape.kind == ShapeKind::Capsule) {
        if (shape.half_height > 0.0f) {
            result = CapsuleShapeSettings(shape.half_height, shape.radius).Create();
        } else {
            result = SphereShapeSettings(shape.radius).Create();
        }
    } else {
        float convex = std::min({cDefaultConvexRadius, shape.half_height, shape.radius});
        result = CylinderShapeSettings(shape.half_height, shape.radius, convex).Create();
    }

    if (result.HasError()) throw QueryFailed(std::string("shape creation: ") + result.GetError().c_str());
    return result.Get();
}

static BodyId to_handle(const BodyID& id) {
    return id.GetIndexAndSequenceNumber();
}

// ---------------------------------------------------------------------------
// Lifetime
// ---------------------------------------------------------------------------

JoltBackend::JoltBackend() : ctx_(std::make_unique<JoltContext>()) {}

JoltBackend::~JoltBackend() {
    BodyInterface& bi = ctx_->GetBodyInterface();
    for (const BodyID& id : static_bodies_) {
        bi.RemoveBody(id);
        bi.DestroyBody(id);
    }
}

JPH::BodyID JoltBackend::checked_id(BodyId body) const {
    BodyID id(body);
    if (body == kInvalidBody || !ctx_->GetBodyInterface().IsAdded(id)) throw BodyNotFound(body);
    return id;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<ShapeHit> JoltBackend::cast_shape(BodyId self, const glm::vec3& origin,
                                                const glm::vec3& direction, float max_distance,
                                                const BodyShape& shape) const {
    check_cast(origin, direction, max_distance);
    RefConst<Shape> cast_shape = make_shape(shape);

    const RVec3 base = MathBridge::ToJoltR(origin);
    RShapeCast cast = RShapeCast::sFromWorldTransform(
        cast_shape, Vec3::sReplicate(1.0f), RMat44::sTranslation(base),
        MathBridge::ToJolt(direction * max_distance));

    ShapeCastSettings settings;
    settings.mBackFaceModeTriangles = EBackFaceMode::IgnoreBackFaces;
    settings.mBackFaceModeConvex    = EBackFaceMode::IgnoreBackFaces;

    ClosestHitCollisionCollector<CastShapeCollector> collector;
    IgnoreSingleBodyFilter body_filter(BodyID(self));

    ctx_->physics_system->GetNarrowPhaseQuery().CastShape(
        cast, settings, base, collector, {}, {}, body_filter);

    if (!collector.HadHit()) return std::nullopt;

    const ShapeCastResult& r = collector.mHit;
    ShapeHit hit;
    hit.distance = r.mFraction * max_distance;
    hit.point    = MathBridge::FromJolt(base + r.mContactPointOn2);
    hit.normal   = MathBridge::FromJolt(-r.mPenetrationAxis.NormalizedOr(-Vec3::sAxisY()));
    hit.body     = ctx_->GetBodyInterface().GetMotionType(r.mBodyID2) == EMotionType::Static
                       ? kInvalidBody
                       : to_handle(r.mBodyID2);
    return hit;
}

std::optional<ShapeHit> JoltBackend::cast_ray(BodyId self, const glm::vec3& origin,
                                              const glm::vec3& direction,
                                              float max_distance) const {
    check_cast(origin, direction, max_distance);

    RRayCast ray{MathBridge::ToJoltR(origin), MathBridge::ToJolt(direction * max_distance)};
    RayCastResult result;
    IgnoreSingleBodyFilter body_filter(BodyID(self));

    if (!ctx_->physics_system->GetNarrowPhaseQuery().CastRay(ray, result, {}, {}, body_filter)) {
        return std::nullopt;
    }

    const RVec3 point = ray.GetPointOnRay(result.mFraction);

    ShapeHit hit;
    hit.distance = result.mFraction * max_distance;
    hit.point    = MathBridge::FromJolt(point);

    BodyLockRead lock(ctx_->physics_system->GetBodyLockInterface(), result.mBodyID);
    if (!lock.Succeeded()) throw QueryFailed("ray hit body could not be locked");
    const Body& body = lock.GetBody();
    hit.normal = MathBridge::FromJolt(body.GetWorldSpaceSurfaceNormal(result.mSubShapeID2, point));
    hit.body   = body.IsStatic() ? kInvalidBody : to_handle(result.mBodyID);
    return hit;
}

bool JoltBackend::has_body(BodyId body) const {
    return body != kInvalidBody && ctx_->GetBodyInterface().IsAdded(BodyID(body));
}

glm::vec3 JoltBackend::get_position(BodyId body) const {
    return MathBridge::FromJolt(ctx_->GetBodyInterface().GetPosition(checked_id(body)));
}

glm::vec3 JoltBackend::get_linear_velocity(BodyId body) const {
    return MathBridge::FromJolt(ctx_->GetBodyInterface().GetLinearVelocity(checked_id(body)));
}

// ---------------------------------------------------------------------------
// Application
// ---------------------------------------------------------------------------

void JoltBackend::set_linear_velocity(BodyId body, const glm::vec3& velocity) {
    BodyID id = checked_id(body);
    BodyInterface& bi = ctx_->GetBodyInterface();
    bi.SetLinearVelocity(id, MathBridge::ToJolt(velocity));
    bi.ActivateBody(id);
}

void JoltBackend::apply_force(BodyId body, const glm::vec3& force) {
    ctx_->GetBodyInterface().AddForce(checked_id(body), MathBridge::ToJolt(force));
}

void JoltBackend::apply_impulse(BodyId body, const glm::vec3& impulse) {
    ctx_->GetBodyInterface().AddImpulse(checked_id(body), MathBridge::ToJolt(impulse));
}

void JoltBackend::move_kinematic(BodyId body, const glm::vec3& displacement, float dt) {
    BodyID id = checked_id(body);
    if (!(dt > 0.0f)) throw QueryFailed("move_kinematic needs a positive time step");

    BodyInterface& bi = ctx_->GetBodyInterface();
    if (bi.GetMotionType(id) == EMotionType::Kinematic) {
        RVec3 target = bi.GetPosition(id) + MathBridge::ToJolt(displacement);
        bi.MoveKinematic(id, target, Quat::sIdentity(), dt);
    } else {
        // A dynamic body reaches the target through its velocity so the
        // solver still stops it at walls.
        bi.SetLinearVelocity(id, MathBridge::ToJolt(displacement / dt));
        bi.ActivateBody(id);
    }
}

void JoltBackend::translate(BodyId body, const glm::vec3& offset) {
    BodyID id = checked_id(body);
    BodyInterface& bi = ctx_->GetBodyInterface();
    bi.SetPosition(id, bi.GetPosition(id) + MathBridge::ToJolt(offset),
                   EActivation::Activate);
}

// ---------------------------------------------------------------------------
// World
// ---------------------------------------------------------------------------

BodyId JoltBackend::create_body(const glm::vec3& position, const BodyShape& shape,
                                float mass, MotionType motion) {
    BodyCreationSettings settings(make_shape(shape), MathBridge::ToJoltR(position),
                                  Quat::sIdentity(),
                                  motion == MotionType::Dynamic ? EMotionType::Dynamic
                                                                : EMotionType::Kinematic,
                                  Layers::MOVING);
    settings.mAllowedDOFs   = EAllowedDOFs::TranslationX | EAllowedDOFs::TranslationY |
                              EAllowedDOFs::TranslationZ;
    settings.mMotionQuality = EMotionQuality::LinearCast;
    settings.mFriction      = 0.0f;
    settings.mRestitution   = 0.0f;
    settings.mLinearDamping = 0.0f;
    if (mass > 0.0f) {
        settings.mOverrideMassProperties       = EOverrideMassProperties::CalculateInertia;
        settings.mMassPropertiesOverride.mMass = mass;
    }

    BodyID id = ctx_->GetBodyInterface().CreateAndAddBody(settings, EActivation::Activate);
    if (id.IsInvalid()) throw QueryFailed("out of Jolt bodies");
    return to_handle(id);
}

void JoltBackend::remove_body(BodyId body) {
    BodyID id = checked_id(body);
    BodyInterface& bi = ctx_->GetBodyInterface();
    bi.RemoveBody(id);
    bi.DestroyBody(id);
}

void JoltBackend::add_static(RefConst<Shape> shape, const glm::vec3& position,
                             const Quat& rotation) {
    BodyCreationSettings settings(shape, MathBridge::ToJoltR(position), rotation,
                                  EMotionType::Static, Layers::NON_MOVING);
    settings.mFriction = 0.0f;

    BodyID id = ctx_->GetBodyInterface().CreateAndAddBody(settings, EActivation::DontActivate);
    if (id.IsInvalid()) throw QueryFailed("out of Jolt bodies");
    static_bodies_.push_back(id);
}

void JoltBackend::add_static_box(const glm::vec3& center, const glm::vec3& half_extents) {
    add_static(new BoxShape(MathBridge::ToJolt(half_extents)), center, Quat::sIdentity());
}

void JoltBackend::add_static_plane(const glm::vec3& point, const glm::vec3& normal) {
    if (glm::length(normal) < 1e-4f) throw QueryFailed("plane normal has no direction");
    const glm::vec3 n = glm::normalize(normal);

    // Top face of the box lies on the plane.
    add_static(new BoxShape(Vec3(kPlaneHalfExtent, kPlaneHalfThickness, kPlaneHalfExtent)),
               point - n * kPlaneHalfThickness,
               Quat::sFromTo(Vec3::sAxisY(), MathBridge::ToJolt(n)));
}

void JoltBackend::step(float dt) {
    EPhysicsUpdateError err = ctx_->physics_system->Update(dt, 1, ctx_->temp_allocator, ctx_->job_system);
    if (err != EPhysicsUpdateError::None) {
        std::cerr << "[Jolt] physics update reported error " << static_cast<int>(err) << std::endl;
    }
}

} // namespace charctl
