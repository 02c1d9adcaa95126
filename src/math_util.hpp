#pragma once
#include <glm/glm.hpp>
#include <algorithm>
#include <cmath>

namespace charctl::math {

inline const glm::vec3 kUp{0.0f, 1.0f, 0.0f};

/**
 * @brief Normalizes an angle into the range [-PI, PI].
 */
inline float normalize_angle(float angle) {
    const float pi = 3.1415926535f;
    while (angle < -pi) angle += 2.0f * pi;
    while (angle >  pi) angle -= 2.0f * pi;
    return angle;
}

/**
 * @brief Drops the vertical component of a vector.
 */
inline glm::vec3 horizontal(const glm::vec3& v) { return {v.x, 0.0f, v.z}; }

/**
 * @brief Normalizes v, or returns zero when v is too short to have a direction.
 */
inline glm::vec3 normalize_or_zero(const glm::vec3& v, float min_length = 1e-4f) {
    float len = glm::length(v);
    if (len < min_length) return glm::vec3(0.0f);
    return v / len;
}

/**
 * @brief Removes the component of v along the (unit) plane normal n.
 */
inline glm::vec3 project_on_plane(const glm::vec3& v, const glm::vec3& n) {
    return v - n * glm::dot(v, n);
}

/**
 * @brief Angle in radians between a surface normal and world up.
 */
inline float slope_angle(const glm::vec3& normal) {
    return std::acos(std::clamp(glm::dot(normal, kUp), -1.0f, 1.0f));
}

/**
 * @brief Unit vector pointing down the slope described by normal.
 * @return Zero for a level surface.
 */
inline glm::vec3 downslope_direction(const glm::vec3& normal) {
    return normalize_or_zero(project_on_plane(-kUp, normal));
}

/**
 * @brief Exponential approach of current toward target.
 *
 * Moves by the fraction clamp(rate * dt, 0, 1) of the remaining difference and
 * lands exactly on target once closer than snap. Never overshoots.
 */
inline glm::vec3 approach(const glm::vec3& current, const glm::vec3& target,
                          float rate, float dt, float snap) {
    float t = std::clamp(rate * dt, 0.0f, 1.0f);
    glm::vec3 next = current + (target - current) * t;
    if (glm::length(target - next) < snap) return target;
    return next;
}

} // namespace charctl::math
