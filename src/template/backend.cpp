/// @file backend.cpp
/// @brief Scene backend snapshot helpers

#include <crowd_engine/template/backend.hpp>

namespace crowd_template {

std::vector<Vec3> MeshData::world_vertices() const {
    const crowd_math::Mat4 m = transform.matrix();
    std::vector<Vec3> out;
    out.reserve(vertices.size());
    for (const auto& v : vertices) {
        out.push_back(crowd_math::transform_point(m, v));
    }
    return out;
}

} // namespace crowd_template
