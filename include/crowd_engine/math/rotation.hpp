#pragma once

/// @file rotation.hpp
/// @brief Euler angle helpers
///
/// Euler angles are XYZ: X is applied first, then Y, then Z, so the
/// equivalent matrix is Rz * Ry * Rx.

#include "types.hpp"

namespace crowd_math {

/// Rotation matrix for XYZ Euler angles (radians)
[[nodiscard]] inline Mat3 euler_to_mat3(const Vec3& euler) noexcept {
    return Mat3(glm::eulerAngleZYX(euler.z, euler.y, euler.x));
}

/// XYZ Euler angles (radians) for a rotation matrix
[[nodiscard]] inline Vec3 mat3_to_euler(const Mat3& m) noexcept {
    float z = 0.0f;
    float y = 0.0f;
    float x = 0.0f;
    glm::extractEulerAngleZYX(Mat4(m), z, y, x);
    return Vec3(x, y, z);
}

/// Rotate a vector by XYZ Euler angles
[[nodiscard]] inline Vec3 rotate_euler(const Vec3& v, const Vec3& euler) noexcept {
    return euler_to_mat3(euler) * v;
}

/// Rotation (XYZ Euler) that points local +Y along direction with +Z up
///
/// Falls back to +Y as the up reference when direction is parallel to Z.
/// A zero direction yields no rotation.
[[nodiscard]] inline Vec3 track_to_euler(const Vec3& direction) noexcept {
    const float len_sq = glm::length2(direction);
    if (len_sq < consts::EPSILON * consts::EPSILON) {
        return vec3::ZERO;
    }

    const Vec3 forward = direction / std::sqrt(len_sq);
    Vec3 up = vec3::UP;
    if (std::abs(glm::dot(forward, up)) > 1.0f - 1e-5f) {
        up = vec3::Y;
    }

    const Vec3 right = glm::normalize(glm::cross(forward, up));
    const Vec3 true_up = glm::cross(right, forward);

    // Columns are the rotated local X, Y and Z axes
    Mat3 basis(right, forward, true_up);
    return mat3_to_euler(basis);
}

} // namespace crowd_math
