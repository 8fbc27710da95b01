/// @file flow_nodes.cpp
/// @brief Terminal and branching placement nodes

#include <crowd_engine/template/nodes/flow_nodes.hpp>
#include <crowd_engine/core/log.hpp>

namespace crowd_template {

using crowd_core::Ok;
using crowd_core::Result;

// =============================================================================
// AgentNode
// =============================================================================

Result<void> AgentNode::evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) {
    const bool deferred = settings().get_bool("deferGeo", false);

    auto* objects = static_cast<IGeometryNode*>(input("Objects"));
    auto geometry = objects->evaluate(ctx, GeometryRequest::from_placement(request, deferred));
    if (!geometry) {
        return geometry.error();
    }

    auto& backend = ctx.backend();
    auto placed = backend.set_object_transform(geometry->object, request.transform());
    if (!placed) {
        return placed;
    }

    if (!deferred && !request.materials.empty()) {
        auto assigned = backend.assign_materials(geometry->object, request.materials);
        if (!assigned) {
            return assigned;
        }
    }

    AgentRegistration agent;
    agent.object = geometry->object;
    agent.brain_type = settings().get_string("brainType");
    agent.group = request.group;
    agent.tags = request.tags;
    agent.rig_override = geometry->rig_override;
    agent.constrain_bone = geometry->constrain_bone;
    agent.bone_modifications = geometry->bone_modifications;
    agent.deferred = geometry->deferred;

    auto registered = backend.register_agent(agent);
    if (!registered) {
        return registered;
    }

    ++ctx.stats().agents_registered;
    return Ok();
}

// =============================================================================
// TemplateSwitchNode
// =============================================================================

Result<void> TemplateSwitchNode::evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) {
    const double amount = settings().get_float("switchAmount", 0.5);
    if (ctx.random().random() < amount) {
        return forward(ctx, "Template 1", request);
    }
    return forward(ctx, "Template 2", request);
}

// =============================================================================
// CombineNode
// =============================================================================

Result<void> CombineNode::evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) {
    for (const auto& in : inputs()) {
        auto* child = static_cast<IPlacementNode*>(in.node);
        auto result = child->evaluate(ctx, request);
        if (!result) {
            return result;
        }
    }
    return Ok();
}

// =============================================================================
// AddToGroupNode
// =============================================================================

bool AddToGroupNode::validate_settings(ValidationContext& ctx) const {
    return ctx.require_string(*this, "groupName");
}

Result<bool> AddToGroupNode::prepare_group(EvaluationContext& ctx, const std::string& name) const {
    auto& backend = ctx.backend();

    if (!backend.agent_group_exists(name)) {
        auto created = backend.create_agent_group(name, AgentGroupType::Auto);
        if (!created) {
            return created.error();
        }
        return Ok(true);
    }

    if (backend.is_agent_group_frozen(name)) {
        return Ok(false);
    }

    if (backend.agent_group_type(name) != AgentGroupType::Auto) {
        crowd_core::template_logger()->debug("{}: group '{}' is manual, not placing into it", id(), name);
        return Ok(false);
    }

    auto reset = backend.reset_agent_group(name);
    if (!reset) {
        return reset.error();
    }
    auto created = backend.create_agent_group(name, AgentGroupType::Auto);
    if (!created) {
        return created.error();
    }
    return Ok(true);
}

Result<void> AddToGroupNode::evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) {
    const std::string name = settings().get_string("groupName");

    std::optional<bool> usable = ctx.prepared_group(name);
    if (!usable) {
        auto prepared = prepare_group(ctx, name);
        if (!prepared) {
            return prepared.error();
        }
        usable = *prepared;
        ctx.mark_group_prepared(name, *usable);
    }

    if (!*usable) {
        ctx.record_drop(*this, DropReason::FrozenGroup);
        return Ok();
    }

    PlacementRequest next = request;
    next.group = name;
    return forward(ctx, "Template", next);
}

} // namespace crowd_template
