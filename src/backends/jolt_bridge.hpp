#pragma once
#include <Jolt/Jolt.h>
#include <glm/glm.hpp>

namespace charctl {

// ---------------------------------------------------------------------------
// Math Bridge  (Jolt <-> glm conversions; kept out of components.hpp so the
// controller core stays free of Jolt headers and builds in the test target)
// ---------------------------------------------------------------------------
namespace MathBridge {
    inline JPH::Vec3 ToJolt(const glm::vec3& v) { return {v.x, v.y, v.z}; }
    inline JPH::RVec3 ToJoltR(const glm::vec3& v) { return JPH::RVec3(v.x, v.y, v.z); }

    inline glm::vec3 FromJolt(const JPH::Vec3& v) { return {v.GetX(), v.GetY(), v.GetZ()}; }
#ifdef JPH_DOUBLE_PRECISION
    inline glm::vec3 FromJolt(const JPH::RVec3& v) {
        return {static_cast<float>(v.GetX()), static_cast<float>(v.GetY()), static_cast<float>(v.GetZ())};
    }
#endif
}

} // namespace charctl
