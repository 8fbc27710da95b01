/// @file kd_tree.cpp
/// @brief KdTree implementation

#include <crowd_engine/spatial/kd_tree.hpp>

#include <algorithm>
#include <cmath>

namespace crowd_spatial {

KdTree::KdTree(std::vector<KdItem> items)
    : m_items(std::move(items))
    , m_axes(m_items.size(), 0) {
    build(0, m_items.size());
}

KdTree KdTree::from_points(std::span<const Vec3> points) {
    std::vector<KdItem> items;
    items.reserve(points.size());
    for (std::size_t i = 0; i < points.size(); ++i) {
        items.push_back(KdItem{points[i], i});
    }
    return KdTree(std::move(items));
}

void KdTree::build(std::size_t begin, std::size_t end) {
    if (end - begin <= 1) {
        return;
    }

    // Split along the axis with the largest spread
    Vec3 lo(crowd_math::consts::MAX_FLOAT);
    Vec3 hi(-crowd_math::consts::MAX_FLOAT);
    for (std::size_t i = begin; i < end; ++i) {
        lo = glm::min(lo, m_items[i].point);
        hi = glm::max(hi, m_items[i].point);
    }
    const Vec3 extent = hi - lo;
    std::uint8_t axis = 0;
    if (extent.y > extent[axis]) axis = 1;
    if (extent.z > extent[axis]) axis = 2;

    const std::size_t mid = begin + (end - begin) / 2;
    std::nth_element(
        m_items.begin() + static_cast<std::ptrdiff_t>(begin),
        m_items.begin() + static_cast<std::ptrdiff_t>(mid),
        m_items.begin() + static_cast<std::ptrdiff_t>(end),
        [axis](const KdItem& a, const KdItem& b) { return a.point[axis] < b.point[axis]; });
    m_axes[mid] = axis;

    build(begin, mid);
    build(mid + 1, end);
}

std::optional<KdNeighbor> KdTree::nearest(const Vec3& point) const {
    if (m_items.empty()) {
        return std::nullopt;
    }

    std::size_t best = 0;
    float best_dist_sq = crowd_math::consts::MAX_FLOAT;
    nearest_recursive(0, m_items.size(), point, best, best_dist_sq);

    const KdItem& item = m_items[best];
    return KdNeighbor{item.point, item.index, std::sqrt(best_dist_sq)};
}

void KdTree::nearest_recursive(std::size_t begin, std::size_t end, const Vec3& point,
                               std::size_t& best, float& best_dist_sq) const {
    if (begin >= end) {
        return;
    }

    const std::size_t mid = begin + (end - begin) / 2;
    const KdItem& item = m_items[mid];

    const float dist_sq = glm::length2(item.point - point);
    if (dist_sq < best_dist_sq) {
        best_dist_sq = dist_sq;
        best = mid;
    }

    const std::uint8_t axis = m_axes[mid];
    const float diff = point[axis] - item.point[axis];

    if (diff < 0.0f) {
        nearest_recursive(begin, mid, point, best, best_dist_sq);
        if (diff * diff < best_dist_sq) {
            nearest_recursive(mid + 1, end, point, best, best_dist_sq);
        }
    } else {
        nearest_recursive(mid + 1, end, point, best, best_dist_sq);
        if (diff * diff < best_dist_sq) {
            nearest_recursive(begin, mid, point, best, best_dist_sq);
        }
    }
}

std::vector<KdNeighbor> KdTree::find_range(const Vec3& point, float radius) const {
    std::vector<KdNeighbor> result;
    if (m_items.empty() || radius < 0.0f) {
        return result;
    }

    range_recursive(0, m_items.size(), point, radius, result);

    std::sort(result.begin(), result.end(),
              [](const KdNeighbor& a, const KdNeighbor& b) { return a.distance < b.distance; });
    return result;
}

void KdTree::range_recursive(std::size_t begin, std::size_t end, const Vec3& point,
                             float radius, std::vector<KdNeighbor>& out) const {
    if (begin >= end) {
        return;
    }

    const std::size_t mid = begin + (end - begin) / 2;
    const KdItem& item = m_items[mid];

    const float dist_sq = glm::length2(item.point - point);
    if (dist_sq <= radius * radius) {
        out.push_back(KdNeighbor{item.point, item.index, std::sqrt(dist_sq)});
    }

    const std::uint8_t axis = m_axes[mid];
    const float diff = point[axis] - item.point[axis];

    if (diff <= radius) {
        range_recursive(begin, mid, point, radius, out);
    }
    if (diff >= -radius) {
        range_recursive(mid + 1, end, point, radius, out);
    }
}

} // namespace crowd_spatial
