#pragma once

/// @file intersect.hpp
/// @brief Intersection and closest-point queries for crowd_math

#include "bounds.hpp"
#include "ray.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <utility>

namespace crowd_math {

// =============================================================================
// Intersection Result Types
// =============================================================================

/// Result of ray-triangle intersection
struct TriangleHit {
    float distance;                    ///< Distance along ray to hit point
    std::array<float, 3> barycentric;  ///< Barycentric coordinates [w, u, v]
};

// =============================================================================
// Ray-AABB Intersection (Slab Method)
// =============================================================================

/// Entry distance of a ray into an AABB within [0, max_distance]
[[nodiscard]] inline std::optional<float> ray_aabb(
    const Ray& ray, const AABB& aabb, float max_distance = consts::MAX_FLOAT) noexcept {

    float tmin = 0.0f;
    float tmax = max_distance;

    for (int axis = 0; axis < 3; ++axis) {
        const float origin = ray.origin[axis];
        const float dir = ray.direction[axis];

        if (std::abs(dir) < consts::EPSILON) {
            // Parallel to this slab: must already lie within it
            if (origin < aabb.min[axis] || origin > aabb.max[axis]) {
                return std::nullopt;
            }
            continue;
        }

        const float inv_d = 1.0f / dir;
        float t0 = (aabb.min[axis] - origin) * inv_d;
        float t1 = (aabb.max[axis] - origin) * inv_d;
        if (t0 > t1) std::swap(t0, t1);

        tmin = std::max(tmin, t0);
        tmax = std::min(tmax, t1);
        if (tmin > tmax) {
            return std::nullopt;
        }
    }

    return tmin;
}

// =============================================================================
// Ray-Triangle Intersection (Moller-Trumbore)
// =============================================================================

/// Ray-Triangle intersection test
/// @param cull_backface If true, only counter-clockwise front faces are hit
[[nodiscard]] inline std::optional<TriangleHit> ray_triangle(
    const Ray& ray,
    const Vec3& v0, const Vec3& v1, const Vec3& v2,
    bool cull_backface = false) noexcept {

    constexpr float EPS = 1e-8f;

    const Vec3 edge1 = v1 - v0;
    const Vec3 edge2 = v2 - v0;
    const Vec3 h = glm::cross(ray.direction, edge2);
    const float a = glm::dot(edge1, h);

    if (cull_backface ? a < EPS : std::abs(a) < EPS) {
        return std::nullopt;
    }

    const float f = 1.0f / a;
    const Vec3 s = ray.origin - v0;
    const float u = f * glm::dot(s, h);
    if (u < 0.0f || u > 1.0f) {
        return std::nullopt;
    }

    const Vec3 q = glm::cross(s, edge1);
    const float v = f * glm::dot(ray.direction, q);
    if (v < 0.0f || u + v > 1.0f) {
        return std::nullopt;
    }

    const float t = f * glm::dot(edge2, q);
    if (t < 0.0f) {
        return std::nullopt;
    }

    return TriangleHit{t, {1.0f - u - v, u, v}};
}

// =============================================================================
// Triangle Utilities
// =============================================================================

/// Unnormalized face normal (counter-clockwise winding)
[[nodiscard]] inline Vec3 triangle_normal(const Vec3& a, const Vec3& b, const Vec3& c) noexcept {
    return glm::cross(b - a, c - a);
}

[[nodiscard]] inline float triangle_area(const Vec3& a, const Vec3& b, const Vec3& c) noexcept {
    return 0.5f * glm::length(triangle_normal(a, b, c));
}

/// Closest point on triangle abc to p (Ericson, Real-Time Collision Detection 5.1.5)
[[nodiscard]] inline Vec3 closest_point_on_triangle(
    const Vec3& p, const Vec3& a, const Vec3& b, const Vec3& c) noexcept {

    const Vec3 ab = b - a;
    const Vec3 ac = c - a;
    const Vec3 ap = p - a;

    const float d1 = glm::dot(ab, ap);
    const float d2 = glm::dot(ac, ap);
    if (d1 <= 0.0f && d2 <= 0.0f) return a;

    const Vec3 bp = p - b;
    const float d3 = glm::dot(ab, bp);
    const float d4 = glm::dot(ac, bp);
    if (d3 >= 0.0f && d4 <= d3) return b;

    const float vc = d1 * d4 - d3 * d2;
    if (vc <= 0.0f && d1 >= 0.0f && d3 <= 0.0f) {
        const float v = d1 / (d1 - d3);
        return a + ab * v;
    }

    const Vec3 cp = p - c;
    const float d5 = glm::dot(ab, cp);
    const float d6 = glm::dot(ac, cp);
    if (d6 >= 0.0f && d5 <= d6) return c;

    const float vb = d5 * d2 - d1 * d6;
    if (vb <= 0.0f && d2 >= 0.0f && d6 <= 0.0f) {
        const float w = d2 / (d2 - d6);
        return a + ac * w;
    }

    const float va = d3 * d6 - d5 * d4;
    if (va <= 0.0f && (d4 - d3) >= 0.0f && (d5 - d6) >= 0.0f) {
        const float w = (d4 - d3) / ((d4 - d3) + (d5 - d6));
        return b + (c - b) * w;
    }

    const float denom = 1.0f / (va + vb + vc);
    const float v = vb * denom;
    const float w = vc * denom;
    return a + ab * v + ac * w;
}

} // namespace crowd_math
