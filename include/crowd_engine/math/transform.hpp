#pragma once

/// @file transform.hpp
/// @brief Object transform (location, Euler rotation, scale)

#include "rotation.hpp"

namespace crowd_math {

/// Location, XYZ Euler rotation and per-axis scale of a scene object
struct Transform {
    Vec3 location = vec3::ZERO;
    Vec3 rotation = vec3::ZERO;  ///< XYZ Euler, radians
    Vec3 scale = vec3::ONE;

    /// World matrix: translate * rotate * scale
    [[nodiscard]] Mat4 matrix() const noexcept {
        Mat4 m = Mat4(euler_to_mat3(rotation));
        m[0] *= scale.x;
        m[1] *= scale.y;
        m[2] *= scale.z;
        m[3] = glm::vec4(location, 1.0f);
        return m;
    }

    /// Matrix without the translation part
    [[nodiscard]] Mat4 linear_matrix() const noexcept {
        Mat4 m = matrix();
        m[3] = glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
        return m;
    }

    /// Frame built from a location, rotation and uniform scale
    [[nodiscard]] static Transform uniform(const Vec3& location, const Vec3& rotation, float scale) noexcept {
        return Transform{location, rotation, Vec3(scale)};
    }
};

} // namespace crowd_math
