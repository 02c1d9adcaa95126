#pragma once
#include "../components.hpp"
#include "../errors.hpp"
#include <glm/glm.hpp>
#include <cmath>

namespace charctl {

// Input checks shared by every backend. Throw QueryFailed.

inline bool is_finite(const glm::vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

inline void check_cast(const glm::vec3& origin, const glm::vec3& direction, float max_distance) {
    if (!is_finite(origin)) throw QueryFailed("non-finite cast origin");
    if (!is_finite(direction) || std::abs(glm::length(direction) - 1.0f) > 1e-3f)
        throw QueryFailed("cast direction must be a unit vector");
    if (!(max_distance >= 0.0f)) throw QueryFailed("negative cast distance");
}

inline void check_shape(const BodyShape& shape) {
    if (!(shape.radius > 0.0f) || !(shape.half_height >= 0.0f))
        throw QueryFailed("degenerate cast shape");
}

} // namespace charctl
