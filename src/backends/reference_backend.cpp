#include "reference_backend.hpp"
#include "query_checks.hpp"
#include "../errors.hpp"
#include "../math_util.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

namespace charctl {

using math::kUp;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static glm::vec3 half_extents_of(const BodyShape& shape) {
    return {shape.radius, shape.extent_y(), shape.radius};
}

// Farthest point of shape (centered at c) in direction dir.
static glm::vec3 support(const BodyShape& shape, const glm::vec3& c, const glm::vec3& dir) {
    float sy = dir.y > 0.0f ? 1.0f : (dir.y < 0.0f ? -1.0f : 0.0f);
    if (shape.kind == ShapeKind::Capsule) {
        return c + kUp * (shape.half_height * sy) + dir * shape.radius;
    }
    return c + kUp * (shape.half_height * sy) + math::normalize_or_zero(math::horizontal(dir)) * shape.radius;
}

struct RayHit {
    float distance;
    glm::vec3 normal;
};

// Slab test. A ray starting inside the box hits at distance 0 on the face
// closest to the origin.
static std::optional<RayHit> ray_box(const glm::vec3& o, const glm::vec3& d, float max_distance,
                                     const glm::vec3& bmin, const glm::vec3& bmax) {
    float t_enter = -std::numeric_limits<float>::infinity();
    float t_exit  =  std::numeric_limits<float>::infinity();
    glm::vec3 n_enter(0.0f);

    for (int i = 0; i < 3; ++i) {
        if (std::abs(d[i]) < 1e-8f) {
            if (o[i] < bmin[i] || o[i] > bmax[i]) return std::nullopt;
            continue;
        }
        float t1 = (bmin[i] - o[i]) / d[i];
        float t2 = (bmax[i] - o[i]) / d[i];
        glm::vec3 n(0.0f);
        n[i] = -1.0f;
        if (t1 > t2) {
            std::swap(t1, t2);
            n[i] = 1.0f;
        }
        if (t1 > t_enter) {
            t_enter = t1;
            n_enter = n;
        }
        t_exit = std::min(t_exit, t2);
    }

    if (t_enter > t_exit || t_exit < 0.0f) return std::nullopt;

    if (t_enter < 0.0f) {
        float best = std::numeric_limits<float>::infinity();
        glm::vec3 n(0.0f, 1.0f, 0.0f);
        for (int i = 0; i < 3; ++i) {
            float to_min = o[i] - bmin[i];
            float to_max = bmax[i] - o[i];
            if (to_min < best) { best = to_min; n = glm::vec3(0.0f); n[i] = -1.0f; }
            if (to_max < best) { best = to_max; n = glm::vec3(0.0f); n[i] =  1.0f; }
        }
        return RayHit{0.0f, n};
    }

    if (t_enter > max_distance) return std::nullopt;
    return RayHit{t_enter, n_enter};
}

// Ray against a solid half-space.
static std::optional<RayHit> ray_plane(const glm::vec3& o, const glm::vec3& d, float max_distance,
                                       const glm::vec3& n, float offset) {
    float s0 = glm::dot(n, o) - offset;
    if (s0 < 0.0f) return RayHit{0.0f, n};
    float dn = glm::dot(d, n);
    if (dn >= 0.0f) return std::nullopt;
    float t = s0 / -dn;
    if (t > max_distance) return std::nullopt;
    return RayHit{t, n};
}

static void keep_closest(std::optional<ShapeHit>& best, const ShapeHit& hit) {
    if (!best || hit.distance < best->distance) best = hit;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<ShapeHit> ReferenceBackend::cast_shape(BodyId self, const glm::vec3& origin,
                                                     const glm::vec3& direction, float max_distance,
                                                     const BodyShape& shape) const {
    check_cast(origin, direction, max_distance);
    check_shape(shape);

    std::optional<ShapeHit> best;
    const glm::vec3 ext = half_extents_of(shape);

    for (const auto& plane : planes_) {
        glm::vec3 p = support(shape, origin, -plane.normal);
        float s0 = glm::dot(plane.normal, p) - plane.offset;
        float t = 0.0f;
        if (s0 >= 0.0f) {
            float dn = glm::dot(direction, plane.normal);
            if (dn >= 0.0f) continue;
            t = s0 / -dn;
            if (t > max_distance) continue;
        }
        keep_closest(best, ShapeHit{p + direction * t, plane.normal, t, kInvalidBody});
    }

    auto sweep_box = [&](const glm::vec3& bmin, const glm::vec3& bmax, BodyId owner) {
        auto hit = ray_box(origin, direction, max_distance, bmin - ext, bmax + ext);
        if (!hit) return;
        glm::vec3 center = origin + direction * hit->distance;
        glm::vec3 point  = center - hit->normal * ext;
        keep_closest(best, ShapeHit{point, hit->normal, hit->distance, owner});
    };

    for (const auto& box : boxes_) sweep_box(box.min, box.max, kInvalidBody);

    for (const auto& [id, other] : bodies_) {
        if (id == self) continue;
        glm::vec3 e = half_extents_of(other.shape);
        sweep_box(other.position - e, other.position + e, id);
    }

    return best;
}

std::optional<ShapeHit> ReferenceBackend::cast_ray(BodyId self, const glm::vec3& origin,
                                                   const glm::vec3& direction,
                                                   float max_distance) const {
    check_cast(origin, direction, max_distance);

    std::optional<ShapeHit> best;
    auto consider = [&](const std::optional<RayHit>& hit, BodyId owner) {
        if (!hit) return;
        keep_closest(best, ShapeHit{origin + direction * hit->distance, hit->normal, hit->distance, owner});
    };

    for (const auto& plane : planes_)
        consider(ray_plane(origin, direction, max_distance, plane.normal, plane.offset), kInvalidBody);
    for (const auto& box : boxes_)
        consider(ray_box(origin, direction, max_distance, box.min, box.max), kInvalidBody);
    for (const auto& [id, other] : bodies_) {
        if (id == self) continue;
        glm::vec3 e = half_extents_of(other.shape);
        consider(ray_box(origin, direction, max_distance, other.position - e, other.position + e), id);
    }
    return best;
}

bool ReferenceBackend::has_body(BodyId body) const {
    return bodies_.find(body) != bodies_.end();
}

glm::vec3 ReferenceBackend::get_position(BodyId body) const {
    return body_ref(body).position;
}

glm::vec3 ReferenceBackend::get_linear_velocity(BodyId body) const {
    return body_ref(body).velocity;
}

// ---------------------------------------------------------------------------
// Application
// ---------------------------------------------------------------------------

void ReferenceBackend::set_linear_velocity(BodyId body, const glm::vec3& velocity) {
    body_ref(body).velocity = velocity;
}

void ReferenceBackend::apply_force(BodyId body, const glm::vec3& force) {
    Body& b = body_ref(body);
    if (b.motion == MotionType::Dynamic) b.accumulated_force += force;
}

void ReferenceBackend::apply_impulse(BodyId body, const glm::vec3& impulse) {
    Body& b = body_ref(body);
    if (b.motion == MotionType::Dynamic) b.velocity += impulse / b.mass;
}

void ReferenceBackend::move_kinematic(BodyId body, const glm::vec3& displacement, float dt) {
    Body& b = body_ref(body);
    if (!(dt > 0.0f)) throw QueryFailed("move_kinematic needs a positive time step");
    b.velocity = displacement / dt;
}

void ReferenceBackend::translate(BodyId body, const glm::vec3& offset) {
    body_ref(body).position += offset;
}

// ---------------------------------------------------------------------------
// World
// ---------------------------------------------------------------------------

BodyId ReferenceBackend::create_body(const glm::vec3& position, const BodyShape& shape,
                                     float mass, MotionType motion) {
    check_shape(shape);
    Body b;
    b.position = position;
    b.shape    = shape;
    b.mass     = mass > 0.0f ? mass : 1.0f;
    b.motion   = motion;
    BodyId id = next_id_++;
    bodies_.emplace(id, b);
    return id;
}

void ReferenceBackend::remove_body(BodyId body) {
    if (bodies_.erase(body) == 0) throw BodyNotFound(body);
}

void ReferenceBackend::add_static_box(const glm::vec3& center, const glm::vec3& half_extents) {
    boxes_.push_back({center - half_extents, center + half_extents});
}

void ReferenceBackend::add_static_plane(const glm::vec3& point, const glm::vec3& normal) {
    glm::vec3 n = math::normalize_or_zero(normal);
    if (n == glm::vec3(0.0f)) throw QueryFailed("plane normal has no direction");
    planes_.push_back({n, glm::dot(n, point)});
}

void ReferenceBackend::step(float dt) {
    for (auto& [id, b] : bodies_) {
        if (b.motion == MotionType::Dynamic) {
            b.velocity += b.accumulated_force / b.mass * dt;
        }
        b.accumulated_force = glm::vec3(0.0f);
        b.position += b.velocity * dt;
        resolve_contacts(b);
    }
}

void ReferenceBackend::resolve_contacts(Body& b) const {
    for (const auto& plane : planes_) {
        glm::vec3 p = support(b.shape, b.position, -plane.normal);
        float depth = plane.offset - glm::dot(plane.normal, p);
        if (depth <= 0.0f) continue;
        b.position += plane.normal * depth;
        float vn = glm::dot(b.velocity, plane.normal);
        if (vn < 0.0f) b.velocity -= plane.normal * vn;
    }

    const glm::vec3 e = half_extents_of(b.shape);
    for (const auto& box : boxes_) {
        glm::vec3 bmin = b.position - e;
        glm::vec3 bmax = b.position + e;
        int axis = -1;
        float least = std::numeric_limits<float>::infinity();
        for (int i = 0; i < 3; ++i) {
            float overlap = std::min(bmax[i], box.max[i]) - std::max(bmin[i], box.min[i]);
            if (overlap <= 1e-6f) { axis = -1; break; }
            if (overlap < least) { least = overlap; axis = i; }
        }
        if (axis < 0) continue;

        float box_center = 0.5f * (box.min[axis] + box.max[axis]);
        float sign = b.position[axis] < box_center ? -1.0f : 1.0f;
        b.position[axis] += sign * least;
        if (b.velocity[axis] * sign < 0.0f) b.velocity[axis] = 0.0f;
    }
}

ReferenceBackend::Body& ReferenceBackend::body_ref(BodyId body) {
    auto it = bodies_.find(body);
    if (it == bodies_.end()) throw BodyNotFound(body);
    return it->second;
}

const ReferenceBackend::Body& ReferenceBackend::body_ref(BodyId body) const {
    auto it = bodies_.find(body);
    if (it == bodies_.end()) throw BodyNotFound(body);
    return it->second;
}

} // namespace charctl
