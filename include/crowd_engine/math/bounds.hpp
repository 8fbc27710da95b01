#pragma once

/// @file bounds.hpp
/// @brief Bounding volume types for crowd_math

#include "types.hpp"
#include <algorithm>
#include <array>

namespace crowd_math {

// =============================================================================
// AABB (Axis-Aligned Bounding Box)
// =============================================================================

/// Axis-Aligned Bounding Box
struct AABB {
    Vec3 min = Vec3(consts::MAX_FLOAT);   ///< Minimum corner
    Vec3 max = Vec3(-consts::MAX_FLOAT);  ///< Maximum corner

    constexpr AABB() noexcept = default;

    constexpr AABB(const Vec3& min_point, const Vec3& max_point) noexcept
        : min(min_point), max(max_point) {}

    /// Create from center and half extents
    static AABB from_center_half_extents(const Vec3& center, const Vec3& half_extents) noexcept {
        return AABB(center - half_extents, center + half_extents);
    }

    [[nodiscard]] Vec3 center() const noexcept { return (min + max) * 0.5f; }
    [[nodiscard]] Vec3 half_extents() const noexcept { return (max - min) * 0.5f; }
    [[nodiscard]] Vec3 size() const noexcept { return max - min; }

    /// Check if AABB is valid (min <= max for all components)
    [[nodiscard]] bool is_valid() const noexcept {
        return min.x <= max.x && min.y <= max.y && min.z <= max.z;
    }

    /// Get longest axis (0=X, 1=Y, 2=Z)
    [[nodiscard]] int longest_axis() const noexcept {
        const Vec3 s = size();
        if (s.x >= s.y && s.x >= s.z) return 0;
        if (s.y >= s.z) return 1;
        return 2;
    }

    void expand_to_include(const Vec3& point) noexcept {
        min = glm::min(min, point);
        max = glm::max(max, point);
    }

    void expand_to_include(const AABB& other) noexcept {
        if (!other.is_valid()) return;
        min = glm::min(min, other.min);
        max = glm::max(max, other.max);
    }

    /// Test if point is inside AABB (boundary inclusive)
    [[nodiscard]] bool contains_point(const Vec3& point) const noexcept {
        return point.x >= min.x && point.x <= max.x &&
               point.y >= min.y && point.y <= max.y &&
               point.z >= min.z && point.z <= max.z;
    }

    /// Test if another AABB is completely contained
    [[nodiscard]] bool contains_aabb(const AABB& other) const noexcept {
        return other.min.x >= min.x && other.max.x <= max.x &&
               other.min.y >= min.y && other.max.y <= max.y &&
               other.min.z >= min.z && other.max.z <= max.z;
    }

    [[nodiscard]] bool intersects(const AABB& other) const noexcept {
        return min.x <= other.max.x && max.x >= other.min.x &&
               min.y <= other.max.y && max.y >= other.min.y &&
               min.z <= other.max.z && max.z >= other.min.z;
    }

    /// Squared distance from point to AABB (zero inside)
    [[nodiscard]] float distance_squared_to_point(const Vec3& point) const noexcept {
        return glm::length2(point - glm::clamp(point, min, max));
    }

    /// Child octant bounds (bit 0 = x, bit 1 = y, bit 2 = z)
    [[nodiscard]] AABB octant(int index) const noexcept {
        const Vec3 c = center();
        AABB child;
        child.min.x = (index & 1) ? c.x : min.x;
        child.max.x = (index & 1) ? max.x : c.x;
        child.min.y = (index & 2) ? c.y : min.y;
        child.max.y = (index & 2) ? max.y : c.y;
        child.min.z = (index & 4) ? c.z : min.z;
        child.max.z = (index & 4) ? max.z : c.z;
        return child;
    }
};

// =============================================================================
// Sphere
// =============================================================================

/// Bounding sphere
struct Sphere {
    Vec3 center = vec3::ZERO;
    float radius = 0.0f;

    [[nodiscard]] bool contains_point(const Vec3& point) const noexcept {
        return glm::length2(point - center) <= radius * radius;
    }

    [[nodiscard]] AABB bounds() const noexcept {
        return AABB::from_center_half_extents(center, Vec3(radius));
    }
};

} // namespace crowd_math
