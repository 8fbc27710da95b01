/// @file octree.cpp
/// @brief VolumeOctree implementation

#include <crowd_engine/spatial/octree.hpp>
#include <crowd_engine/core/log.hpp>

#include <algorithm>

namespace crowd_spatial {

VolumeOctree::VolumeOctree(std::vector<BoundingVolume> volumes)
    : VolumeOctree(std::move(volumes), Config{}) {}

VolumeOctree::VolumeOctree(std::vector<BoundingVolume> volumes, Config config)
    : m_config(config)
    , m_volumes(std::move(volumes)) {
    if (m_volumes.empty()) {
        return;
    }

    Node root;
    for (std::uint32_t i = 0; i < m_volumes.size(); ++i) {
        root.bounds.expand_to_include(m_volumes[i].bounds());
        root.items.push_back(i);
    }
    m_nodes.push_back(std::move(root));
    subdivide(0, 0);

    crowd_core::spatial_logger()->debug("VolumeOctree: {} volumes, {} nodes",
                                        m_volumes.size(), m_nodes.size());
}

void VolumeOctree::subdivide(std::uint32_t node_index, std::size_t depth) {
    if (m_nodes[node_index].items.size() <= m_config.max_items_per_node ||
        depth >= m_config.max_depth) {
        return;
    }

    const AABB bounds = m_nodes[node_index].bounds;
    std::array<std::vector<std::uint32_t>, 8> child_items;
    std::vector<std::uint32_t> straddlers;

    for (std::uint32_t item : m_nodes[node_index].items) {
        const AABB item_bounds = m_volumes[item].bounds();
        bool placed = false;
        for (int octant = 0; octant < 8; ++octant) {
            if (bounds.octant(octant).contains_aabb(item_bounds)) {
                child_items[octant].push_back(item);
                placed = true;
                break;
            }
        }
        if (!placed) {
            straddlers.push_back(item);
        }
    }

    // Everything straddles: splitting gains nothing
    if (straddlers.size() == m_nodes[node_index].items.size()) {
        return;
    }

    m_nodes[node_index].items = std::move(straddlers);
    m_nodes[node_index].is_leaf = false;

    for (int octant = 0; octant < 8; ++octant) {
        if (child_items[octant].empty()) {
            continue;
        }
        Node child;
        child.bounds = bounds.octant(octant);
        child.items = std::move(child_items[octant]);

        const auto child_index = static_cast<std::uint32_t>(m_nodes.size());
        m_nodes.push_back(std::move(child));
        m_nodes[node_index].children[octant] = child_index;

        subdivide(child_index, depth + 1);
    }
}

std::vector<std::size_t> VolumeOctree::containing(const Vec3& point) const {
    std::vector<std::size_t> result;
    if (m_nodes.empty()) {
        return result;
    }

    std::vector<std::uint32_t> stack{0};
    while (!stack.empty()) {
        const Node& node = m_nodes[stack.back()];
        stack.pop_back();

        if (!node.bounds.contains_point(point)) {
            continue;
        }

        for (std::uint32_t item : node.items) {
            if (m_volumes[item].contains(point)) {
                result.push_back(item);
            }
        }

        if (!node.is_leaf) {
            for (std::uint32_t child : node.children) {
                if (child != INVALID) {
                    stack.push_back(child);
                }
            }
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

bool VolumeOctree::any_contains(const Vec3& point) const {
    if (m_nodes.empty()) {
        return false;
    }

    std::vector<std::uint32_t> stack{0};
    while (!stack.empty()) {
        const Node& node = m_nodes[stack.back()];
        stack.pop_back();

        if (!node.bounds.contains_point(point)) {
            continue;
        }

        for (std::uint32_t item : node.items) {
            if (m_volumes[item].contains(point)) {
                return true;
            }
        }

        if (!node.is_leaf) {
            for (std::uint32_t child : node.children) {
                if (child != INVALID) {
                    stack.push_back(child);
                }
            }
        }
    }
    return false;
}

} // namespace crowd_spatial
