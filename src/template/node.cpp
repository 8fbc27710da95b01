/// @file node.cpp
/// @brief Node base implementations

#include <crowd_engine/template/node.hpp>

#include <fmt/format.h>

namespace crowd_template {

using crowd_core::Result;

// =============================================================================
// INode
// =============================================================================

INode::INode(std::string id, std::string type_name, Settings settings)
    : id_(std::move(id))
    , type_name_(std::move(type_name))
    , settings_(std::move(settings)) {}

void INode::add_input(const std::string& slot, const std::string& node_id) {
    inputs_.push_back(InputSlot{slot, node_id, nullptr});
}

void INode::bind_input(std::size_t index, INode* node) {
    if (index < inputs_.size()) {
        inputs_[index].node = node;
    }
}

INode* INode::input(const std::string& slot) const {
    for (const auto& in : inputs_) {
        if (in.name == slot) {
            return in.node;
        }
    }
    return nullptr;
}

bool INode::validate(ValidationContext& ctx) const {
    bool ok = true;

    for (const auto& slot : required_inputs()) {
        bool present = false;
        for (const auto& in : inputs_) {
            if (in.name == slot) {
                present = true;
                break;
            }
        }
        if (!present) {
            ctx.report(*this, fmt::format("missing input '{}'", slot));
            ok = false;
        }
    }

    for (const auto& in : inputs_) {
        if (!in.node) {
            ctx.report(*this, fmt::format("input '{}' references unknown node '{}'", in.name, in.node_id));
            ok = false;
            continue;
        }
        if (in.node->family() != input_family()) {
            ctx.report(*this, fmt::format("input '{}' expects a {} node, got {} node '{}'",
                                          in.name, node_family_name(input_family()),
                                          node_family_name(in.node->family()), in.node_id));
            ok = false;
            continue;
        }
        if (!ctx.check(*in.node)) {
            ok = false;
        }
    }

    if (!validate_settings(ctx)) {
        ok = false;
    }
    return ok;
}

// =============================================================================
// IPlacementNode
// =============================================================================

Result<void> IPlacementNode::evaluate(EvaluationContext& ctx, const PlacementRequest& request) {
    count_evaluation();
    return evaluate_request(ctx, request);
}

Result<void> IPlacementNode::forward(
    EvaluationContext& ctx, const std::string& slot, const PlacementRequest& request) const {
    // Validation guarantees the slot is bound to a placement node
    auto* child = static_cast<IPlacementNode*>(input(slot));
    return child->evaluate(ctx, request);
}

// =============================================================================
// IGeometryNode
// =============================================================================

Result<GeometryResult> IGeometryNode::evaluate(
    EvaluationContext& ctx, const GeometryRequest& request) {
    count_evaluation();
    return evaluate_request(ctx, request);
}

Result<GeometryResult> IGeometryNode::forward(
    EvaluationContext& ctx, const std::string& slot, const GeometryRequest& request) const {
    auto* child = static_cast<IGeometryNode*>(input(slot));
    return child->evaluate(ctx, request);
}

} // namespace crowd_template
