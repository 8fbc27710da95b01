/// @file graph.cpp
/// @brief TemplateGraph implementation

#include <crowd_engine/template/graph.hpp>
#include <crowd_engine/core/log.hpp>

#include <fmt/format.h>

#include <unordered_set>

namespace crowd_template {

using crowd_core::Err;
using crowd_core::Error;
using crowd_core::ErrorCode;
using crowd_core::Ok;
using crowd_core::Result;
using crowd_core::TemplateError;

TemplateGraph::TemplateGraph(const GraphDescription& description, const NodeRegistry& registry) {
    for (const auto& desc : description.nodes) {
        if (by_id_.count(desc.id) > 0) {
            construction_issues_.push_back(ValidationIssue{
                desc.id, desc.type, TemplateError::duplicate_node(desc.id).message});
            continue;
        }

        auto node = registry.create_node(desc.type, desc.id, desc.settings);
        if (!node) {
            construction_issues_.push_back(ValidationIssue{
                desc.id, desc.type, TemplateError::unknown_node_type(desc.id, desc.type).message});
            continue;
        }

        for (const auto& [slot, target] : desc.inputs) {
            node->add_input(slot, target);
        }
        by_id_[desc.id] = node.get();
        nodes_.push_back(std::move(node));
    }

    // Resolve input references
    for (auto& node : nodes_) {
        const auto inputs = node->inputs();
        for (std::size_t i = 0; i < inputs.size(); ++i) {
            node->bind_input(i, find_node(inputs[i].node_id));
        }
    }
}

INode* TemplateGraph::find_node(const std::string& id) const {
    auto it = by_id_.find(id);
    return it == by_id_.end() ? nullptr : it->second;
}

std::vector<IPlacementNode*> TemplateGraph::roots() const {
    std::unordered_set<const INode*> referenced;
    for (const auto& node : nodes_) {
        for (const auto& in : node->inputs()) {
            if (in.node) {
                referenced.insert(in.node);
            }
        }
    }

    std::vector<IPlacementNode*> out;
    for (const auto& node : nodes_) {
        if (node->family() == NodeFamily::Placement && referenced.count(node.get()) == 0) {
            out.push_back(static_cast<IPlacementNode*>(node.get()));
        }
    }
    return out;
}

// =============================================================================
// Validation
// =============================================================================

ValidationReport TemplateGraph::validate(const ISceneBackend& backend) {
    ValidationContext ctx(backend);

    for (const auto& issue : construction_issues_) {
        crowd_core::template_logger()->warn("Validation: {} ({}): {}", issue.node_id, issue.node_type, issue.message);
    }

    for (const auto& node : nodes_) {
        ctx.check(*node);
    }

    ValidationReport report;
    report.issues = construction_issues_;
    auto node_issues = ctx.take_report();
    report.issues.insert(report.issues.end(), node_issues.issues.begin(), node_issues.issues.end());

    if (report.ok()) {
        crowd_core::template_logger()->info("Graph validated: {} nodes", nodes_.size());
    } else {
        crowd_core::template_logger()->warn("Graph validation failed: {} issue(s)", report.size());
    }

    report_ = report;
    return report;
}

void TemplateGraph::prepare_indices(const ISceneBackend& backend) {
    for (auto& node : nodes_) {
        node->prepare(backend);
    }
}

// =============================================================================
// Evaluation
// =============================================================================

Result<void> TemplateGraph::check_buildable() const {
    if (!report_) {
        return Err(TemplateError::not_validated());
    }
    if (!report_->ok()) {
        return Err(TemplateError::invalid_graph(report_->size()));
    }
    return Ok();
}

Result<void> TemplateGraph::evaluate_root(
    const std::string& root_id, EvaluationContext& ctx, const PlacementRequest& request) {
    INode* root = find_node(root_id);
    if (!root) {
        return Err(Error(ErrorCode::NotFound, fmt::format("Root node '{}' not found", root_id)));
    }
    if (root->family() != NodeFamily::Placement) {
        return Err(Error(ErrorCode::InvalidArgument,
                         fmt::format("Root node '{}' is not a placement node", root_id)));
    }

    auto result = static_cast<IPlacementNode*>(root)->evaluate(ctx, request);
    if (!result) {
        Error error = result.error();
        error.with_context("root", root_id);
        crowd_core::template_logger()->error("Build aborted: {}", crowd_core::build_error_chain(error));
        return error;
    }
    return Ok();
}

Result<BuildStats> TemplateGraph::build(
    const std::string& root_id, EvaluationContext& ctx, const PlacementRequest& request) {
    auto buildable = check_buildable();
    if (!buildable) {
        return buildable.error();
    }

    CROWD_LOG_SCOPE("build");
    ctx.begin_build();
    crowd_core::template_logger()->info("Build started from '{}'", root_id);

    auto result = evaluate_root(root_id, ctx, request);
    if (!result) {
        return result.error();
    }

    const BuildStats& stats = ctx.stats();
    crowd_core::template_logger()->info("Build finished: {} agents, {} dropped, {} warnings",
                                        stats.agents_registered, stats.total_dropped(), stats.warnings);
    return Ok(stats);
}

Result<BuildStats> TemplateGraph::build_all(EvaluationContext& ctx, const PlacementRequest& request) {
    auto buildable = check_buildable();
    if (!buildable) {
        return buildable.error();
    }

    CROWD_LOG_SCOPE("build_all");
    const auto root_nodes = roots();
    ctx.begin_build();
    crowd_core::template_logger()->info("Build started: {} root(s)", root_nodes.size());

    for (auto* root : root_nodes) {
        auto result = evaluate_root(root->id(), ctx, request);
        if (!result) {
            return result.error();
        }
    }

    const BuildStats& stats = ctx.stats();
    crowd_core::template_logger()->info("Build finished: {} agents, {} dropped, {} warnings",
                                        stats.agents_registered, stats.total_dropped(), stats.warnings);
    return Ok(stats);
}

} // namespace crowd_template
