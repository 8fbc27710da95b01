#pragma once

/// @file ray.hpp
/// @brief Ray type for crowd_math

#include "types.hpp"

namespace crowd_math {

/// 3D Ray with origin and direction
struct Ray {
    Vec3 origin = vec3::ZERO;
    Vec3 direction = vec3::DOWN;  ///< Normalized

    constexpr Ray() noexcept = default;

    /// Create ray from origin and direction (direction will be normalized)
    Ray(const Vec3& orig, const Vec3& dir) noexcept
        : origin(orig), direction(glm::normalize(dir)) {}

    [[nodiscard]] Vec3 at(float t) const noexcept {
        return origin + direction * t;
    }
};

} // namespace crowd_math
