/// @file transform_nodes.cpp
/// @brief Placement nodes that modify a request and forward it

#include <crowd_engine/template/nodes/transform_nodes.hpp>
#include <crowd_engine/math/rotation.hpp>
#include <crowd_engine/core/log.hpp>

#include <fmt/format.h>

#include <numeric>

namespace crowd_template {

using crowd_core::Ok;
using crowd_core::Result;
using crowd_math::Vec3;

std::size_t weighted_index(std::span<const double> weights, double draw) {
    if (weights.empty()) {
        return 0;
    }
    double remaining = draw;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        remaining -= weights[i];
        if (remaining <= 0.0) {
            return i;
        }
    }
    return weights.size() - 1;
}

// =============================================================================
// OffsetNode
// =============================================================================

bool OffsetNode::validate_settings(ValidationContext& ctx) const {
    if (settings().get_string("referenceObject").empty()) {
        return true;
    }
    return ctx.require_object(*this, "referenceObject");
}

Result<void> OffsetNode::evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) {
    PlacementRequest next = request;
    if (settings().get_bool("overwrite", false)) {
        next.position = Vec3(0.0f);
        next.rotation = Vec3(0.0f);
    }

    const std::string reference = settings().get_string("referenceObject");
    if (!reference.empty()) {
        const auto transform = ctx.backend().object_transform(reference);
        next.position += transform.location;
        next.rotation += transform.rotation;
    }

    next.position += settings().get_vec3("locationOffset");
    next.rotation += crowd_math::radians(settings().get_vec3("rotationOffset"));
    return forward(ctx, "Template", next);
}

// =============================================================================
// RandomNode
// =============================================================================

Result<void> RandomNode::evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) {
    auto& random = ctx.random();
    PlacementRequest next = request;

    const double rot_diff = random.uniform(settings().get_float("minRandRot", 0.0),
                                           settings().get_float("maxRandRot", 0.0));
    next.rotation.z += crowd_math::radians(static_cast<float>(rot_diff));

    const double scale_diff = random.uniform(settings().get_float("minRandSz", 1.0),
                                             settings().get_float("maxRandSz", 1.0));
    next.scale *= static_cast<float>(scale_diff);

    if (settings().get_bool("randMat", false)) {
        const std::string prefix = settings().get_string("randMatPrefix");
        if (prefix.empty()) {
            ctx.warn(*this, "random material enabled without randMatPrefix, keeping materials");
        } else {
            std::vector<std::string> matches;
            for (const auto& name : ctx.backend().material_names()) {
                if (name.rfind(prefix, 0) == 0) {
                    matches.push_back(name);
                }
            }
            if (matches.empty()) {
                ctx.warn(*this, fmt::format("no material starts with '{}', keeping materials", prefix));
            } else {
                next.materials[settings().get_string("materialSlot", "0")] = matches[random.index(matches.size())];
            }
        }
    }

    return forward(ctx, "Template", next);
}

// =============================================================================
// PointTowardsNode
// =============================================================================

bool PointTowardsNode::validate_settings(ValidationContext& ctx) const {
    const std::string type = settings().get_string("PointType", "OBJECT");
    if (type != "OBJECT" && type != "MESH") {
        ctx.report(*this, fmt::format("unknown PointType '{}'", type));
        return false;
    }
    if (type == "MESH") {
        return ctx.require_mesh(*this, "PointObject");
    }
    return ctx.require_object(*this, "PointObject");
}

const PointTowardsNode::MeshTarget& PointTowardsNode::mesh_target(const ISceneBackend& backend) {
    return m_target.get([&] {
        const MeshData mesh = backend.mesh_data(settings().get_string("PointObject"));
        MeshTarget target;
        target.tree = crowd_spatial::KdTree::from_points(mesh.vertices);
        target.world = mesh.transform.matrix();
        target.inverse = glm::inverse(target.world);
        crowd_core::template_logger()->debug("{}: built vertex k-d tree ({} vertices)",
                                             id(), target.tree.size());
        return target;
    });
}

void PointTowardsNode::prepare(const ISceneBackend& backend) {
    if (mesh_mode()) {
        (void)mesh_target(backend);
    }
}

Result<void> PointTowardsNode::evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) {
    const std::string name = settings().get_string("PointObject");

    Vec3 point;
    if (mesh_mode()) {
        const MeshTarget& target = mesh_target(ctx.backend());
        const Vec3 local = crowd_math::transform_point(target.inverse, request.position);
        auto nearest = target.tree.nearest(local);
        point = nearest ? crowd_math::transform_point(target.world, nearest->point) : request.position;
    } else {
        point = ctx.backend().object_transform(name).location;
    }

    PlacementRequest next = request;
    next.rotation = crowd_math::track_to_euler(point - request.position);
    return forward(ctx, "Template", next);
}

// =============================================================================
// RandomMaterialNode
// =============================================================================

bool RandomMaterialNode::validate_settings(ValidationContext& ctx) const {
    const auto names = settings().get_string_array("materialNames");
    const auto weights = settings().get_float_array("materialWeights");

    bool ok = true;
    if (names.empty()) {
        ctx.report(*this, "materialNames must not be empty");
        ok = false;
    }
    if (names.size() != weights.size()) {
        ctx.report(*this, fmt::format("{} material names but {} weights", names.size(), weights.size()));
        ok = false;
    }
    for (double w : weights) {
        if (w < 0.0) {
            ctx.report(*this, "material weights must not be negative");
            ok = false;
            break;
        }
    }
    if (!weights.empty() && std::accumulate(weights.begin(), weights.end(), 0.0) <= 0.0) {
        ctx.report(*this, "material weights must not sum to zero");
        ok = false;
    }
    for (const auto& name : names) {
        if (!ctx.backend().has_material(name)) {
            ctx.report(*this, fmt::format("unknown material '{}'", name));
            ok = false;
        }
    }
    return ok;
}

Result<void> RandomMaterialNode::evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) {
    const auto names = settings().get_string_array("materialNames");
    const auto weights = settings().get_float_array("materialWeights");

    const double total = std::accumulate(weights.begin(), weights.end(), 0.0);
    const std::size_t choice = weighted_index(weights, ctx.random().random() * total);

    PlacementRequest next = request;
    next.materials[settings().get_string("materialSlot", "0")] = names[choice];
    return forward(ctx, "Template", next);
}

// =============================================================================
// SetTagNode
// =============================================================================

bool SetTagNode::validate_settings(ValidationContext& ctx) const {
    return ctx.require_string(*this, "tagName");
}

Result<void> SetTagNode::evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) {
    PlacementRequest next = request;
    next.tags[settings().get_string("tagName")] = settings().get_float("tagValue", 0.0);
    return forward(ctx, "Template", next);
}

} // namespace crowd_template
