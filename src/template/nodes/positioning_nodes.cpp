/// @file positioning_nodes.cpp
/// @brief Placement nodes that fan one request out into many

#include <crowd_engine/template/nodes/positioning_nodes.hpp>
#include <crowd_engine/spatial/relax.hpp>
#include <crowd_engine/math/intersect.hpp>
#include <crowd_engine/math/rotation.hpp>
#include <crowd_engine/core/log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace crowd_template {

using crowd_core::Ok;
using crowd_core::Result;
using crowd_math::Vec3;

namespace {

/// Sum of two uniform draws folded back into [0, 1]
float folded_length(RandomSource& random) {
    double length = random.random() + random.random();
    if (length > 1.0) {
        length = 2.0 - length;
    }
    return static_cast<float>(length);
}

bool validate_count(ValidationContext& ctx, const INode& node) {
    if (node.settings().get_int("noToPlace", 1) < 0) {
        ctx.report(node, "noToPlace must not be negative");
        return false;
    }
    return true;
}

bool validate_relax(ValidationContext& ctx, const INode& node) {
    if (!node.settings().get_bool("relax", false)) {
        return true;
    }
    bool ok = true;
    if (node.settings().get_float("relaxRadius", 0.0) < 0.0) {
        ctx.report(node, "relaxRadius must not be negative");
        ok = false;
    }
    if (node.settings().get_int("relaxIterations", 1) < 0) {
        ctx.report(node, "relaxIterations must not be negative");
        ok = false;
    }
    return ok;
}

void relax_if_enabled(const Settings& settings, std::vector<Vec3>& points) {
    if (settings.get_bool("relax", false)) {
        crowd_spatial::relax_positions(points,
                                       static_cast<float>(settings.get_float("relaxRadius", 0.0)),
                                       static_cast<int>(settings.get_int("relaxIterations", 1)));
    }
}

} // namespace

// =============================================================================
// RandomPositionNode
// =============================================================================

bool RandomPositionNode::validate_settings(ValidationContext& ctx) const {
    bool ok = validate_count(ctx, *this);
    const std::string type = settings().get_string("locationType", "radius");
    if (type != "radius" && type != "area" && type != "sector") {
        ctx.report(*this, fmt::format("unknown locationType '{}'", type));
        ok = false;
    }
    return validate_relax(ctx, *this) && ok;
}

Vec3 RandomPositionNode::draw_offset(RandomSource& random) const {
    const std::string type = settings().get_string("locationType", "radius");

    if (type == "area") {
        const double half_x = settings().get_float("MaxX", 1.0) * 0.5;
        const double half_y = settings().get_float("MaxY", 1.0) * 0.5;
        return Vec3(static_cast<float>(random.uniform(-half_x, half_x)),
                    static_cast<float>(random.uniform(-half_y, half_y)),
                    0.0f);
    }

    double angle = 0.0;
    if (type == "sector") {
        const double direction = settings().get_float("direction", 0.0);
        const double half_width = settings().get_float("angle", 45.0);
        angle = crowd_math::radians(static_cast<float>(random.uniform(direction - half_width,
                                                                      direction + half_width)));
    } else {
        angle = random.uniform(-crowd_math::consts::PI, crowd_math::consts::PI);
    }

    const float length = folded_length(random) * static_cast<float>(settings().get_float("radius", 1.0));
    return Vec3(static_cast<float>(std::sin(angle)) * length,
                static_cast<float>(std::cos(angle)) * length,
                0.0f);
}

Result<void> RandomPositionNode::evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) {
    const auto count = static_cast<std::size_t>(std::max<std::int64_t>(0, settings().get_int("noToPlace", 1)));

    std::vector<Vec3> positions;
    positions.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const Vec3 offset = crowd_math::rotate_euler(draw_offset(ctx.random()), request.rotation);
        positions.push_back(request.position + offset);
    }

    relax_if_enabled(settings(), positions);

    for (const auto& position : positions) {
        PlacementRequest next = request;
        next.position = position;
        auto result = forward(ctx, "Template", next);
        if (!result) {
            return result;
        }
    }
    return Ok();
}

// =============================================================================
// MeshPositionNode
// =============================================================================

bool MeshPositionNode::validate_settings(ValidationContext& ctx) const {
    bool ok = ctx.require_mesh(*this, "guideMesh");
    ok = validate_count(ctx, *this) && ok;
    const std::string mode = settings().get_string("positionMode", "world");
    if (mode != "world" && mode != "local") {
        ctx.report(*this, fmt::format("unknown positionMode '{}'", mode));
        ok = false;
    }
    return validate_relax(ctx, *this) && ok;
}

const MeshPositionNode::Guide& MeshPositionNode::guide(const ISceneBackend& backend) {
    return m_guide.get([&] {
        MeshData mesh = backend.mesh_data(settings().get_string("guideMesh"));
        crowd_spatial::TriangleBvh bvh(mesh.vertices, mesh.triangles);
        crowd_core::template_logger()->debug("{}: built guide BVH ({} triangles)", id(), bvh.triangle_count());
        return Guide{std::move(mesh), std::move(bvh)};
    });
}

void MeshPositionNode::prepare(const ISceneBackend& backend) {
    (void)guide(backend);
}

Result<void> MeshPositionNode::evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) {
    const Guide& g = guide(ctx.backend());
    const auto& vertices = g.mesh.vertices;
    const auto& triangles = g.mesh.triangles;
    auto& random = ctx.random();

    const crowd_math::Mat4 frame = settings().get_string("positionMode", "world") == "local"
        ? request.transform().matrix()
        : g.mesh.transform.matrix();
    const crowd_math::Mat4 inverse_frame = glm::inverse(frame);

    // Cumulative area in the target frame
    std::vector<double> cumulative;
    cumulative.reserve(triangles.size());
    double total = 0.0;
    for (const auto& tri : triangles) {
        if (tri[0] >= vertices.size() || tri[1] >= vertices.size() || tri[2] >= vertices.size()) {
            cumulative.push_back(total);
            continue;
        }
        total += crowd_math::triangle_area(crowd_math::transform_point(frame, vertices[tri[0]]),
                                           crowd_math::transform_point(frame, vertices[tri[1]]),
                                           crowd_math::transform_point(frame, vertices[tri[2]]));
        cumulative.push_back(total);
    }

    if (total <= 0.0) {
        ctx.warn(*this, fmt::format("guide mesh '{}' has no surface area", settings().get_string("guideMesh")));
        return Ok();
    }

    const auto count = static_cast<std::size_t>(std::max<std::int64_t>(0, settings().get_int("noToPlace", 1)));
    std::vector<Vec3> positions;
    positions.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const double s = random.random() * total;
        auto it = std::upper_bound(cumulative.begin(), cumulative.end(), s);
        const auto index = static_cast<std::size_t>(
            std::min<std::ptrdiff_t>(it - cumulative.begin(), static_cast<std::ptrdiff_t>(triangles.size()) - 1));
        const auto& tri = triangles[index];

        auto r1 = static_cast<float>(random.random());
        auto r2 = static_cast<float>(random.random());
        if (r1 + r2 > 1.0f) {
            r1 = 1.0f - r1;
            r2 = 1.0f - r2;
        }
        const Vec3& a = vertices[tri[0]];
        const Vec3 local = a + r1 * (vertices[tri[1]] - a) + r2 * (vertices[tri[2]] - a);
        positions.push_back(crowd_math::transform_point(frame, local));
    }

    if (settings().get_bool("relax", false)) {
        relax_if_enabled(settings(), positions);
        for (auto& position : positions) {
            auto nearest = g.bvh.nearest_point(crowd_math::transform_point(inverse_frame, position));
            if (nearest) {
                position = crowd_math::transform_point(frame, nearest->point);
            }
        }
    }

    for (const auto& position : positions) {
        PlacementRequest next = request;
        next.position = position;
        auto result = forward(ctx, "Template", next);
        if (!result) {
            return result;
        }
    }
    return Ok();
}

// =============================================================================
// FormationNode
// =============================================================================

bool FormationNode::validate_settings(ValidationContext& ctx) const {
    bool ok = validate_count(ctx, *this);
    if (settings().get_int("ArrayRows", 1) < 1) {
        ctx.report(*this, "ArrayRows must be at least 1");
        ok = false;
    }
    return ok;
}

Result<void> FormationNode::evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) {
    const auto number = std::max<std::int64_t>(0, settings().get_int("noToPlace", 1));
    const auto rows = std::max<std::int64_t>(1, settings().get_int("ArrayRows", 1));

    const Vec3 row_step = crowd_math::rotate_euler(
        Vec3(static_cast<float>(settings().get_float("ArrayRowMargin", 0.0)), 0.0f, 0.0f),
        request.rotation) * request.scale;
    const Vec3 col_step = crowd_math::rotate_euler(
        Vec3(0.0f, static_cast<float>(settings().get_float("ArrayColumnMargin", 0.0)), 0.0f),
        request.rotation) * request.scale;

    auto place = [&](std::int64_t column, std::int64_t row) {
        PlacementRequest next = request;
        next.position = request.position + static_cast<float>(column) * col_step
                                         + static_cast<float>(row) * row_step;
        return forward(ctx, "Template", next);
    };

    const std::int64_t full_columns = number / rows;
    for (std::int64_t column = 0; column < full_columns; ++column) {
        for (std::int64_t row = 0; row < rows; ++row) {
            auto result = place(column, row);
            if (!result) {
                return result;
            }
        }
    }
    for (std::int64_t row = 0; row < number % rows; ++row) {
        auto result = place(full_columns, row);
        if (!result) {
            return result;
        }
    }
    return Ok();
}

// =============================================================================
// TargetNode
// =============================================================================

bool TargetNode::validate_settings(ValidationContext& ctx) const {
    const std::string type = settings().get_string("targetType", "object");
    if (type == "object") {
        return ctx.require_object_group(*this, "targetGroups");
    }
    if (type == "vertex") {
        return ctx.require_mesh(*this, "targetObject");
    }
    ctx.report(*this, fmt::format("unknown targetType '{}'", type));
    return false;
}

Result<void> TargetNode::evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) {
    const bool overwrite = settings().get_bool("overwritePosition", false);
    std::vector<std::pair<Vec3, Vec3>> targets;  // position, rotation

    if (settings().get_string("targetType", "object") == "object") {
        for (const auto& member : ctx.backend().object_group_members(settings().get_string("targetGroups"))) {
            const auto& t = member.transform;
            if (overwrite) {
                targets.emplace_back(t.location, t.rotation);
            } else {
                targets.emplace_back(
                    request.position + crowd_math::rotate_euler(t.location, request.rotation) * request.scale,
                    request.rotation + t.rotation);
            }
        }
    } else {
        const MeshData mesh = ctx.backend().mesh_data(settings().get_string("targetObject"));
        if (overwrite) {
            for (const auto& vertex : mesh.world_vertices()) {
                targets.emplace_back(vertex, mesh.transform.rotation);
            }
        } else {
            for (const auto& vertex : mesh.vertices) {
                targets.emplace_back(
                    request.position + crowd_math::rotate_euler(vertex, request.rotation) * request.scale,
                    request.rotation);
            }
        }
    }

    for (const auto& [position, rotation] : targets) {
        PlacementRequest next = request;
        next.position = position;
        next.rotation = rotation;
        auto result = forward(ctx, "Template", next);
        if (!result) {
            return result;
        }
    }
    return Ok();
}

} // namespace crowd_template
