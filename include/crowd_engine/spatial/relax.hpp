#pragma once

/// @file relax.hpp
/// @brief Fixed-iteration repulsion relaxation of point sets

#include <crowd_engine/math/types.hpp>

#include <vector>

namespace crowd_spatial {

/// Push apart points closer than 2 * radius
///
/// Each of the iterations builds a k-d tree over the current positions. Every
/// neighbour q of p with 0 < |p - q| < 2r contributes (p - q) * (2r - d) / d,
/// and p moves by the average contribution. Points without such neighbours
/// stay put. There is no convergence test.
void relax_positions(std::vector<crowd_math::Vec3>& points, float radius, int iterations);

} // namespace crowd_spatial
