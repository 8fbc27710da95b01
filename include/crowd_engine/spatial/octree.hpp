#pragma once

/// @file octree.hpp
/// @brief Octree over spheres and boxes for point containment queries

#include "fwd.hpp"
#include <crowd_engine/math/bounds.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace crowd_spatial {

using crowd_math::AABB;
using crowd_math::Vec3;

/// A sphere or an axis-aligned box
struct BoundingVolume {
    enum class Shape : std::uint8_t { Box, Sphere };

    Shape shape = Shape::Box;
    AABB box;
    crowd_math::Sphere sphere;

    [[nodiscard]] static BoundingVolume make_box(const Vec3& center, const Vec3& half_extents) {
        BoundingVolume v;
        v.shape = Shape::Box;
        v.box = AABB::from_center_half_extents(center, half_extents);
        return v;
    }

    [[nodiscard]] static BoundingVolume make_sphere(const Vec3& center, float radius) {
        BoundingVolume v;
        v.shape = Shape::Sphere;
        v.sphere = crowd_math::Sphere{center, radius};
        return v;
    }

    /// Boundary inclusive
    [[nodiscard]] bool contains(const Vec3& point) const noexcept {
        return shape == Shape::Box ? box.contains_point(point) : sphere.contains_point(point);
    }

    [[nodiscard]] AABB bounds() const noexcept {
        return shape == Shape::Box ? box : sphere.bounds();
    }
};

/// Octree of bounding volumes
///
/// A volume is stored in the deepest node whose octant fully contains it;
/// volumes straddling octant boundaries stay in the parent.
class VolumeOctree {
public:
    struct Config {
        std::size_t max_items_per_node = 8;
        std::size_t max_depth = 8;
    };

    VolumeOctree() = default;
    explicit VolumeOctree(std::vector<BoundingVolume> volumes);
    VolumeOctree(std::vector<BoundingVolume> volumes, Config config);

    /// Indices of all volumes containing point, in ascending order
    [[nodiscard]] std::vector<std::size_t> containing(const Vec3& point) const;

    /// True if any volume contains point
    [[nodiscard]] bool any_contains(const Vec3& point) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_volumes.size(); }
    [[nodiscard]] std::size_t node_count() const noexcept { return m_nodes.size(); }
    [[nodiscard]] const BoundingVolume& volume(std::size_t index) const { return m_volumes[index]; }

private:
    static constexpr std::uint32_t INVALID = UINT32_MAX;

    struct Node {
        AABB bounds;
        std::array<std::uint32_t, 8> children{INVALID, INVALID, INVALID, INVALID,
                                              INVALID, INVALID, INVALID, INVALID};
        std::vector<std::uint32_t> items;
        bool is_leaf = true;
    };

    void subdivide(std::uint32_t node_index, std::size_t depth);

    Config m_config;
    std::vector<BoundingVolume> m_volumes;
    std::vector<Node> m_nodes;
};

} // namespace crowd_spatial
