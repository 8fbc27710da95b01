#pragma once

/// @file types.hpp
/// @brief Core type definitions and constants for crowd_math

#define GLM_FORCE_RADIANS
#define GLM_ENABLE_EXPERIMENTAL

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtx/euler_angles.hpp>
#include <glm/gtx/norm.hpp>

#include "fwd.hpp"

#include <cmath>
#include <limits>

namespace crowd_math {

// =============================================================================
// Scalar Constants
// =============================================================================

namespace consts {

inline constexpr float PI = 3.14159265358979323846f;
inline constexpr float TAU = 6.28318530717958647692f;
inline constexpr float DEG_TO_RAD = PI / 180.0f;
inline constexpr float RAD_TO_DEG = 180.0f / PI;

/// Small epsilon for floating point comparisons
inline constexpr float EPSILON = 1e-6f;

inline constexpr float MAX_FLOAT = std::numeric_limits<float>::max();

} // namespace consts

// =============================================================================
// Vector Constants (Z is up)
// =============================================================================

namespace vec3 {
    inline constexpr Vec3 ZERO  = Vec3(0.0f, 0.0f, 0.0f);
    inline constexpr Vec3 ONE   = Vec3(1.0f, 1.0f, 1.0f);
    inline constexpr Vec3 X     = Vec3(1.0f, 0.0f, 0.0f);
    inline constexpr Vec3 Y     = Vec3(0.0f, 1.0f, 0.0f);
    inline constexpr Vec3 Z     = Vec3(0.0f, 0.0f, 1.0f);

    inline constexpr Vec3 UP   = Z;
    inline constexpr Vec3 DOWN = Vec3(0.0f, 0.0f, -1.0f);
}

// =============================================================================
// Conversions
// =============================================================================

[[nodiscard]] inline float radians(float degrees) noexcept {
    return degrees * consts::DEG_TO_RAD;
}

[[nodiscard]] inline Vec3 radians(const Vec3& degrees) noexcept {
    return degrees * consts::DEG_TO_RAD;
}

/// Transform a point by a 4x4 matrix (w = 1)
[[nodiscard]] inline Vec3 transform_point(const Mat4& m, const Vec3& p) noexcept {
    return Vec3(m * glm::vec4(p, 1.0f));
}

/// Transform a direction by a 4x4 matrix (w = 0)
[[nodiscard]] inline Vec3 transform_vector(const Mat4& m, const Vec3& v) noexcept {
    return Vec3(m * glm::vec4(v, 0.0f));
}

/// Check if vector has any NaN or infinite components
[[nodiscard]] inline bool is_finite(const Vec3& v) noexcept {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

} // namespace crowd_math
