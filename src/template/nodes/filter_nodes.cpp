/// @file filter_nodes.cpp
/// @brief Placement nodes that drop or project requests

#include <crowd_engine/template/nodes/filter_nodes.hpp>
#include <crowd_engine/core/log.hpp>

namespace crowd_template {

using crowd_core::Ok;
using crowd_core::Result;
using crowd_math::Vec3;

// =============================================================================
// ObstacleNode
// =============================================================================

bool ObstacleNode::validate_settings(ValidationContext& ctx) const {
    return ctx.require_object_group(*this, "obstacleGroup");
}

const crowd_spatial::VolumeOctree& ObstacleNode::octree(const ISceneBackend& backend) {
    return m_octree.get([&] {
        const auto members = backend.object_group_members(settings().get_string("obstacleGroup"));
        const Vec3 margin(static_cast<float>(settings().get_float("margin", 0.0)));

        std::vector<crowd_spatial::BoundingVolume> volumes;
        volumes.reserve(members.size());
        for (const auto& member : members) {
            volumes.push_back(crowd_spatial::BoundingVolume::make_box(
                member.transform.location, member.dimensions * 0.5f + margin));
        }

        crowd_core::template_logger()->debug("{}: built obstacle octree ({} volumes)", id(), volumes.size());
        return crowd_spatial::VolumeOctree(std::move(volumes));
    });
}

void ObstacleNode::prepare(const ISceneBackend& backend) {
    (void)octree(backend);
}

Result<void> ObstacleNode::evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) {
    if (octree(ctx.backend()).any_contains(request.position)) {
        ctx.record_drop(*this, DropReason::Obstacle);
        return Ok();
    }
    return forward(ctx, "Template", request);
}

// =============================================================================
// GroundNode
// =============================================================================

bool GroundNode::validate_settings(ValidationContext& ctx) const {
    return ctx.require_mesh(*this, "groundMesh");
}

const GroundNode::Ground& GroundNode::ground(const ISceneBackend& backend) {
    return m_ground.get([&] {
        const MeshData mesh = backend.mesh_data(settings().get_string("groundMesh"));
        const crowd_math::Mat4 linear = mesh.transform.linear_matrix();

        std::vector<Vec3> vertices;
        vertices.reserve(mesh.vertices.size());
        for (const auto& v : mesh.vertices) {
            vertices.push_back(crowd_math::transform_point(linear, v));
        }

        Ground g{mesh.transform.location, crowd_spatial::TriangleBvh(std::move(vertices), mesh.triangles)};
        crowd_core::template_logger()->debug("{}: built ground BVH ({} triangles)", id(), g.bvh.triangle_count());
        return g;
    });
}

void GroundNode::prepare(const ISceneBackend& backend) {
    (void)ground(backend);
}

Result<void> GroundNode::evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) {
    const Ground& g = ground(ctx.backend());
    const Vec3 point = request.position - g.origin;

    const auto down = g.bvh.ray_cast(point, crowd_math::vec3::DOWN);
    const auto up = g.bvh.ray_cast(point, crowd_math::vec3::UP);

    const crowd_spatial::RayHit* hit = nullptr;
    if (down && up) {
        hit = down->distance <= up->distance ? &*down : &*up;
    } else if (down) {
        hit = &*down;
    } else if (up) {
        hit = &*up;
    }

    if (!hit) {
        ctx.record_drop(*this, DropReason::GroundMiss);
        return Ok();
    }

    PlacementRequest next = request;
    next.position = hit->point + g.origin;
    return forward(ctx, "Template", next);
}

} // namespace crowd_template
