/// @file bvh.cpp
/// @brief TriangleBvh implementation

#include <crowd_engine/spatial/bvh.hpp>
#include <crowd_engine/math/intersect.hpp>
#include <crowd_engine/core/log.hpp>

#include <algorithm>
#include <cmath>

namespace crowd_spatial {

TriangleBvh::TriangleBvh(std::vector<Vec3> vertices, const std::vector<Triangle>& triangles)
    : m_vertices(std::move(vertices)) {
    const auto vertex_count = static_cast<std::uint32_t>(m_vertices.size());

    m_triangles.reserve(triangles.size());
    std::size_t skipped = 0;
    for (const auto& tri : triangles) {
        if (tri[0] >= vertex_count || tri[1] >= vertex_count || tri[2] >= vertex_count) {
            ++skipped;
            continue;
        }
        m_triangles.push_back(tri);
    }
    if (skipped > 0) {
        crowd_core::spatial_logger()->warn(
            "TriangleBvh: skipped {} triangle(s) with out-of-range vertex indices", skipped);
    }

    m_primitives.reserve(m_triangles.size());
    for (std::uint32_t i = 0; i < m_triangles.size(); ++i) {
        const auto& tri = m_triangles[i];
        Primitive prim;
        prim.bounds.expand_to_include(m_vertices[tri[0]]);
        prim.bounds.expand_to_include(m_vertices[tri[1]]);
        prim.bounds.expand_to_include(m_vertices[tri[2]]);
        prim.centroid = (m_vertices[tri[0]] + m_vertices[tri[1]] + m_vertices[tri[2]]) / 3.0f;
        prim.triangle = i;
        m_primitives.push_back(prim);
    }

    if (m_primitives.empty()) {
        return;
    }

    m_nodes.reserve(m_primitives.size() * 2);
    m_nodes.push_back(Node{});
    build_recursive(0, 0, static_cast<std::uint32_t>(m_primitives.size()));

    crowd_core::spatial_logger()->debug("TriangleBvh: {} triangles, {} nodes",
                                        m_triangles.size(), m_nodes.size());
}

AABB TriangleBvh::bounds() const noexcept {
    return m_nodes.empty() ? AABB{} : m_nodes.front().bounds;
}

void TriangleBvh::build_recursive(std::uint32_t node_index, std::uint32_t start, std::uint32_t end) {
    AABB bounds;
    for (std::uint32_t i = start; i < end; ++i) {
        bounds.expand_to_include(m_primitives[i].bounds);
    }
    m_nodes[node_index].bounds = bounds;

    const std::uint32_t primitive_count = end - start;

    if (primitive_count <= MAX_LEAF_PRIMITIVES) {
        Node& leaf = m_nodes[node_index];
        leaf.is_leaf = true;
        leaf.left_child = start;
        leaf.right_child = primitive_count;
        return;
    }

    const int split_axis = bounds.longest_axis();
    const std::uint32_t mid = start + primitive_count / 2;

    std::nth_element(
        m_primitives.begin() + start,
        m_primitives.begin() + mid,
        m_primitives.begin() + end,
        [split_axis](const Primitive& a, const Primitive& b) {
            return a.centroid[split_axis] < b.centroid[split_axis];
        });

    const auto left = static_cast<std::uint32_t>(m_nodes.size());
    m_nodes.push_back(Node{});
    const auto right = static_cast<std::uint32_t>(m_nodes.size());
    m_nodes.push_back(Node{});

    // Re-fetch after push_back
    Node& node = m_nodes[node_index];
    node.is_leaf = false;
    node.left_child = left;
    node.right_child = right;

    build_recursive(left, start, mid);
    build_recursive(right, mid, end);
}

// =============================================================================
// Ray cast
// =============================================================================

std::optional<RayHit> TriangleBvh::ray_cast(
    const Vec3& origin, const Vec3& direction, float max_distance) const {
    if (m_nodes.empty() || glm::length2(direction) <= 0.0f) {
        return std::nullopt;
    }

    const crowd_math::Ray ray(origin, direction);
    std::optional<RayHit> closest;
    float limit = max_distance;
    ray_cast_recursive(ray, 0, closest, limit);
    return closest;
}

void TriangleBvh::ray_cast_recursive(const crowd_math::Ray& ray, std::uint32_t node_index,
                                     std::optional<RayHit>& closest, float& max_distance) const {
    const Node& node = m_nodes[node_index];

    if (!crowd_math::ray_aabb(ray, node.bounds, max_distance)) {
        return;
    }

    if (node.is_leaf) {
        const std::uint32_t start = node.left_child;
        const std::uint32_t count = node.right_child;
        for (std::uint32_t i = start; i < start + count; ++i) {
            const std::uint32_t tri_index = m_primitives[i].triangle;
            const auto& tri = m_triangles[tri_index];
            const Vec3& v0 = m_vertices[tri[0]];
            const Vec3& v1 = m_vertices[tri[1]];
            const Vec3& v2 = m_vertices[tri[2]];

            auto hit = crowd_math::ray_triangle(ray, v0, v1, v2, false);
            if (hit && hit->distance <= max_distance) {
                max_distance = hit->distance;
                closest = RayHit{
                    ray.at(hit->distance),
                    glm::normalize(crowd_math::triangle_normal(v0, v1, v2)),
                    hit->distance,
                    tri_index};
            }
        }
        return;
    }

    // Front-to-back order
    auto t_left = crowd_math::ray_aabb(ray, m_nodes[node.left_child].bounds, max_distance);
    auto t_right = crowd_math::ray_aabb(ray, m_nodes[node.right_child].bounds, max_distance);

    if (t_left && t_right) {
        if (*t_left <= *t_right) {
            ray_cast_recursive(ray, node.left_child, closest, max_distance);
            if (*t_right <= max_distance) {
                ray_cast_recursive(ray, node.right_child, closest, max_distance);
            }
        } else {
            ray_cast_recursive(ray, node.right_child, closest, max_distance);
            if (*t_left <= max_distance) {
                ray_cast_recursive(ray, node.left_child, closest, max_distance);
            }
        }
    } else if (t_left) {
        ray_cast_recursive(ray, node.left_child, closest, max_distance);
    } else if (t_right) {
        ray_cast_recursive(ray, node.right_child, closest, max_distance);
    }
}

// =============================================================================
// Nearest point
// =============================================================================

std::optional<NearestHit> TriangleBvh::nearest_point(const Vec3& point) const {
    if (m_nodes.empty()) {
        return std::nullopt;
    }

    std::optional<NearestHit> closest;
    float best_dist_sq = crowd_math::consts::MAX_FLOAT;
    nearest_recursive(point, 0, closest, best_dist_sq);

    if (closest) {
        closest->distance = std::sqrt(best_dist_sq);
    }
    return closest;
}

void TriangleBvh::nearest_recursive(const Vec3& point, std::uint32_t node_index,
                                    std::optional<NearestHit>& closest, float& best_dist_sq) const {
    const Node& node = m_nodes[node_index];

    if (node.bounds.distance_squared_to_point(point) > best_dist_sq) {
        return;
    }

    if (node.is_leaf) {
        const std::uint32_t start = node.left_child;
        const std::uint32_t count = node.right_child;
        for (std::uint32_t i = start; i < start + count; ++i) {
            const std::uint32_t tri_index = m_primitives[i].triangle;
            const auto& tri = m_triangles[tri_index];
            const Vec3 candidate = crowd_math::closest_point_on_triangle(
                point, m_vertices[tri[0]], m_vertices[tri[1]], m_vertices[tri[2]]);
            const float dist_sq = glm::length2(candidate - point);
            if (dist_sq < best_dist_sq) {
                best_dist_sq = dist_sq;
                closest = NearestHit{candidate, 0.0f, tri_index};
            }
        }
        return;
    }

    const float d_left = m_nodes[node.left_child].bounds.distance_squared_to_point(point);
    const float d_right = m_nodes[node.right_child].bounds.distance_squared_to_point(point);

    if (d_left <= d_right) {
        nearest_recursive(point, node.left_child, closest, best_dist_sq);
        nearest_recursive(point, node.right_child, closest, best_dist_sq);
    } else {
        nearest_recursive(point, node.right_child, closest, best_dist_sq);
        nearest_recursive(point, node.left_child, closest, best_dist_sq);
    }
}

} // namespace crowd_spatial
