#pragma once

/// @file graph.hpp
/// @brief Template graph construction, validation and evaluation

#include "registry.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace crowd_template {

// =============================================================================
// Declarative Description
// =============================================================================

/// @brief One node of a graph description
struct NodeDescription {
    std::string id;
    std::string type;
    Settings settings;
    std::vector<std::pair<std::string, std::string>> inputs;  ///< (slot, node id) in declared order
};

/// @brief Declarative graph from which a TemplateGraph is built
struct GraphDescription {
    std::vector<NodeDescription> nodes;
};

// =============================================================================
// TemplateGraph
// =============================================================================

/// @brief Owns the nodes of one graph and drives validation and builds
///
/// Construction never fails: unknown types, duplicate ids and dangling
/// inputs are reported by validate(). A graph must validate cleanly before
/// it can build.
class TemplateGraph {
public:
    explicit TemplateGraph(const GraphDescription& description,
                           const NodeRegistry& registry = NodeRegistry::instance());

    TemplateGraph(TemplateGraph&&) = default;
    TemplateGraph& operator=(TemplateGraph&&) = default;

    // ==========================================================================
    // Validation
    // ==========================================================================

    /// @brief Check every node against the backend
    ValidationReport validate(const ISceneBackend& backend);

    [[nodiscard]] bool is_validated() const { return report_.has_value(); }
    [[nodiscard]] bool is_valid() const { return report_ && report_->ok(); }
    [[nodiscard]] const std::optional<ValidationReport>& last_report() const { return report_; }

    /// @brief Build lazily constructed spatial indices now
    void prepare_indices(const ISceneBackend& backend);

    // ==========================================================================
    // Evaluation
    // ==========================================================================

    /// @brief Evaluate the placement node root_id with request
    [[nodiscard]] crowd_core::Result<BuildStats> build(
        const std::string& root_id, EvaluationContext& ctx,
        const PlacementRequest& request = PlacementRequest::identity());

    /// @brief Evaluate every root placement node in declaration order
    [[nodiscard]] crowd_core::Result<BuildStats> build_all(
        EvaluationContext& ctx, const PlacementRequest& request = PlacementRequest::identity());

    // ==========================================================================
    // Queries
    // ==========================================================================

    [[nodiscard]] INode* find_node(const std::string& id) const;
    [[nodiscard]] std::size_t size() const { return nodes_.size(); }

    /// @brief Placement nodes no other node references, in declaration order
    [[nodiscard]] std::vector<IPlacementNode*> roots() const;

private:
    [[nodiscard]] crowd_core::Result<void> check_buildable() const;
    [[nodiscard]] crowd_core::Result<void> evaluate_root(
        const std::string& root_id, EvaluationContext& ctx, const PlacementRequest& request);

    std::vector<std::unique_ptr<INode>> nodes_;
    std::unordered_map<std::string, INode*> by_id_;
    std::vector<ValidationIssue> construction_issues_;
    std::optional<ValidationReport> report_;
};

} // namespace crowd_template
