/// @file geometry_nodes.cpp
/// @brief Geometry construction nodes

#include <crowd_engine/template/nodes/geometry_nodes.hpp>

#include <algorithm>

namespace crowd_template {

using crowd_core::Ok;
using crowd_core::Result;

// =============================================================================
// ObjectInputNode
// =============================================================================

bool ObjectInputNode::validate_settings(ValidationContext& ctx) const {
    return ctx.require_object(*this, "inputObject");
}

Result<GeometryResult> ObjectInputNode::evaluate_request(
    EvaluationContext& ctx, const GeometryRequest& request) {
    const std::string source = settings().get_string("inputObject");

    auto handle = ctx.backend().duplicate_object(source, request.deferred);
    if (!handle) {
        return handle.error();
    }

    GeometryResult result = GeometryResult::wrap(*handle);
    if (request.deferred) {
        result.deferred = DeferredGeometry{DeferredGeometry::Kind::Object, source, ""};
    } else if (!request.materials.empty()) {
        auto assigned = ctx.backend().assign_materials(result.object, request.materials);
        if (!assigned) {
            return assigned.error();
        }
    }
    return Ok(std::move(result));
}

// =============================================================================
// GroupInputNode
// =============================================================================

bool GroupInputNode::validate_settings(ValidationContext& ctx) const {
    if (!ctx.require_object_group(*this, "inputGroup")) {
        return false;
    }
    if (ctx.backend().object_group_members(settings().get_string("inputGroup")).empty()) {
        ctx.report(*this, "group '" + settings().get_string("inputGroup") + "' has no members");
        return false;
    }
    return true;
}

Result<GeometryResult> GroupInputNode::evaluate_request(
    EvaluationContext& ctx, const GeometryRequest& request) {
    const std::string group = settings().get_string("inputGroup");

    auto duplicated = ctx.backend().duplicate_group_members(group, request.deferred);
    if (!duplicated) {
        return duplicated.error();
    }

    GeometryResult result = GeometryResult::wrap(duplicated->top);
    if (request.deferred) {
        const auto members = ctx.backend().object_group_members(group);
        auto armature = std::find_if(members.begin(), members.end(),
                                     [](const GroupMember& m) { return m.is_armature(); });
        // Without an armature the group was duplicated in full
        if (armature != members.end()) {
            result.deferred = DeferredGeometry{DeferredGeometry::Kind::Group, group, armature->name};
        }
    }
    return Ok(std::move(result));
}

// =============================================================================
// GeoSwitchNode
// =============================================================================

Result<GeometryResult> GeoSwitchNode::evaluate_request(
    EvaluationContext& ctx, const GeometryRequest& request) {
    const double amount = settings().get_float("switchAmount", 0.5);
    if (ctx.random().random() < amount) {
        return forward(ctx, "Object 1", request);
    }
    return forward(ctx, "Object 2", request);
}

// =============================================================================
// ParentNode
// =============================================================================

bool ParentNode::validate_settings(ValidationContext& ctx) const {
    return ctx.require_string(*this, "parentTo");
}

Result<GeometryResult> ParentNode::evaluate_request(
    EvaluationContext& ctx, const GeometryRequest& request) {
    auto parent = forward(ctx, "Parent Group", request);
    if (!parent) {
        return parent;
    }
    auto child = forward(ctx, "Child Object", request);
    if (!child) {
        return child;
    }

    auto attached = ctx.backend().attach_to_bone(parent->object, child->object,
                                                 settings().get_string("parentTo"));
    if (!attached) {
        return attached.error();
    }
    return parent;
}

// =============================================================================
// LinkGroupNode
// =============================================================================

bool LinkGroupNode::validate_settings(ValidationContext& ctx) const {
    bool ok = ctx.require_string(*this, "sourcePath");
    ok = ctx.require_string(*this, "groupName") && ok;
    ok = ctx.require_string(*this, "rigObject") && ok;
    ok = ctx.require_string(*this, "constrainBone") && ok;
    return ok;
}

Result<GeometryResult> LinkGroupNode::evaluate_request(
    EvaluationContext& ctx, const GeometryRequest& request) {
    auto child = forward(ctx, "Objects", request);
    if (!child) {
        return child;
    }

    const std::string bone = settings().get_string("constrainBone");
    auto linked = ctx.backend().link_external_group(
        settings().get_string("sourcePath"), settings().get_string("groupName"),
        settings().get_string("rigObject"), bone, child->object);
    if (!linked) {
        return linked.error();
    }

    GeometryResult result = std::move(*child);
    result.rig_override = linked->rig;
    result.constrain_bone = bone;
    return Ok(std::move(result));
}

// =============================================================================
// ModifyBoneNode
// =============================================================================

bool ModifyBoneNode::validate_settings(ValidationContext& ctx) const {
    bool ok = ctx.require_string(*this, "boneName");
    ok = ctx.require_string(*this, "boneAttribute") && ok;
    ok = ctx.require_string(*this, "tagName") && ok;
    return ok;
}

Result<GeometryResult> ModifyBoneNode::evaluate_request(
    EvaluationContext& ctx, const GeometryRequest& request) {
    auto child = forward(ctx, "Objects", request);
    if (!child) {
        return child;
    }

    GeometryResult result = std::move(*child);
    result.bone_modifications[settings().get_string("boneName")][settings().get_string("boneAttribute")] =
        settings().get_string("tagName");
    return Ok(std::move(result));
}

} // namespace crowd_template
