#pragma once

/// @file bvh.hpp
/// @brief Bounding volume hierarchy over a triangle mesh

#include "fwd.hpp"
#include <crowd_engine/math/bounds.hpp>
#include <crowd_engine/math/ray.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace crowd_spatial {

using crowd_math::AABB;
using crowd_math::Vec3;

/// Closest ray hit against the mesh
struct RayHit {
    Vec3 point;
    Vec3 normal;           ///< Unit face normal (counter-clockwise winding)
    float distance = 0.0f;
    std::uint32_t triangle = 0;
};

/// Closest surface point to a query position
struct NearestHit {
    Vec3 point;
    float distance = 0.0f;
    std::uint32_t triangle = 0;
};

/// Triangle BVH supporting ray casts and nearest-point queries
///
/// Both faces of every triangle are hit by ray casts.
class TriangleBvh {
public:
    using Triangle = std::array<std::uint32_t, 3>;

    TriangleBvh() = default;

    /// Build over vertices and triangles; triangles with out-of-range indices are skipped
    TriangleBvh(std::vector<Vec3> vertices, const std::vector<Triangle>& triangles);

    /// Cast a ray from origin along direction
    [[nodiscard]] std::optional<RayHit> ray_cast(
        const Vec3& origin, const Vec3& direction,
        float max_distance = crowd_math::consts::MAX_FLOAT) const;

    /// Closest point on the mesh surface
    [[nodiscard]] std::optional<NearestHit> nearest_point(const Vec3& point) const;

    [[nodiscard]] std::size_t triangle_count() const noexcept { return m_triangles.size(); }
    [[nodiscard]] std::size_t node_count() const noexcept { return m_nodes.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_nodes.empty(); }

    /// Bounds of the whole mesh (invalid if empty)
    [[nodiscard]] AABB bounds() const noexcept;

private:
    struct Node {
        AABB bounds;
        std::uint32_t left_child = UINT32_MAX;   // Index of left child (or first primitive if leaf)
        std::uint32_t right_child = UINT32_MAX;  // Index of right child (or primitive count if leaf)
        bool is_leaf = true;
    };

    struct Primitive {
        AABB bounds;
        Vec3 centroid;
        std::uint32_t triangle = 0;
    };

    void build_recursive(std::uint32_t node_index, std::uint32_t start, std::uint32_t end);
    void ray_cast_recursive(const crowd_math::Ray& ray, std::uint32_t node_index,
                            std::optional<RayHit>& closest, float& max_distance) const;
    void nearest_recursive(const Vec3& point, std::uint32_t node_index,
                           std::optional<NearestHit>& closest, float& best_dist_sq) const;

    static constexpr std::uint32_t MAX_LEAF_PRIMITIVES = 4;

    std::vector<Vec3> m_vertices;
    std::vector<Triangle> m_triangles;
    std::vector<Node> m_nodes;
    std::vector<Primitive> m_primitives;
};

} // namespace crowd_spatial
