/// @file relax.cpp
/// @brief Point relaxation

#include <crowd_engine/spatial/relax.hpp>
#include <crowd_engine/spatial/kd_tree.hpp>
#include <crowd_engine/core/log.hpp>

#include <cmath>

namespace crowd_spatial {

void relax_positions(std::vector<crowd_math::Vec3>& points, float radius, int iterations) {
    if (points.size() < 2 || radius <= 0.0f || iterations <= 0) {
        return;
    }

    const float diameter = 2.0f * radius;
    std::vector<Vec3> next(points.size());

    for (int iter = 0; iter < iterations; ++iter) {
        const KdTree tree = KdTree::from_points(points);
        std::size_t moved = 0;

        for (std::size_t i = 0; i < points.size(); ++i) {
            const Vec3& p = points[i];
            Vec3 push(0.0f);
            int count = 0;

            for (const auto& neighbor : tree.find_range(p, diameter)) {
                const float d = neighbor.distance;
                if (d <= 0.0f || d >= diameter) {
                    continue;
                }
                push += (p - neighbor.point) * ((diameter - d) / d);
                ++count;
            }

            if (count > 0) {
                next[i] = p + push / static_cast<float>(count);
                ++moved;
            } else {
                next[i] = p;
            }
        }

        points.swap(next);
        crowd_core::spatial_logger()->debug("relax_positions: iteration {} moved {} of {} points",
                                            iter + 1, moved, points.size());
    }
}

} // namespace crowd_spatial
