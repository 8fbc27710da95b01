#pragma once

/// @file kd_tree.hpp
/// @brief Balanced 3-d tree for nearest-neighbour and radius queries

#include "fwd.hpp"
#include <crowd_engine/math/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace crowd_spatial {

using crowd_math::Vec3;

/// Point stored in the tree together with a caller-defined index
struct KdItem {
    Vec3 point;
    std::size_t index = 0;
};

/// Query result
struct KdNeighbor {
    Vec3 point;
    std::size_t index = 0;
    float distance = 0.0f;
};

/// Balanced k-d tree
///
/// The tree is built once in the constructor by median splits and is
/// read-only afterwards. Nodes are stored implicitly: the median of each
/// range is the node, its left and right halves are the subtrees.
class KdTree {
public:
    KdTree() = default;
    explicit KdTree(std::vector<KdItem> items);

    /// Build from points, using each point's position in the span as its index
    [[nodiscard]] static KdTree from_points(std::span<const Vec3> points);

    /// Closest item to point, nullopt if the tree is empty
    [[nodiscard]] std::optional<KdNeighbor> nearest(const Vec3& point) const;

    /// All items within radius of point (inclusive), sorted by distance
    [[nodiscard]] std::vector<KdNeighbor> find_range(const Vec3& point, float radius) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_items.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_items.empty(); }

private:
    void build(std::size_t begin, std::size_t end);
    void nearest_recursive(std::size_t begin, std::size_t end, const Vec3& point,
                           std::size_t& best, float& best_dist_sq) const;
    void range_recursive(std::size_t begin, std::size_t end, const Vec3& point,
                         float radius, std::vector<KdNeighbor>& out) const;

    std::vector<KdItem> m_items;
    std::vector<std::uint8_t> m_axes;
};

} // namespace crowd_spatial
