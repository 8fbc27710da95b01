#pragma once

/// @file flow_nodes.hpp
/// @brief Terminal and branching placement nodes

#include <crowd_engine/template/node.hpp>

namespace crowd_template {

/// @brief Builds the geometry subgraph and registers an agent
///
/// Settings: brainType, deferGeo
class AgentNode : public IPlacementNode {
public:
    static constexpr const char* TYPE_NAME = "TemplateNodeType";

    AgentNode(std::string id, Settings settings)
        : IPlacementNode(std::move(id), TYPE_NAME, std::move(settings)) {}

    [[nodiscard]] std::vector<std::string> required_inputs() const override { return {"Objects"}; }
    [[nodiscard]] NodeFamily input_family() const override { return NodeFamily::Geometry; }

protected:
    crowd_core::Result<void> evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) override;
};

/// @brief Forwards to "Template 1" with probability switchAmount, else "Template 2"
class TemplateSwitchNode : public IPlacementNode {
public:
    static constexpr const char* TYPE_NAME = "TemplateSwitchNodeType";

    TemplateSwitchNode(std::string id, Settings settings)
        : IPlacementNode(std::move(id), TYPE_NAME, std::move(settings)) {}

    [[nodiscard]] std::vector<std::string> required_inputs() const override {
        return {"Template 1", "Template 2"};
    }

protected:
    crowd_core::Result<void> evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) override;
};

/// @brief Forwards a copy of the request to every input in declared order
class CombineNode : public IPlacementNode {
public:
    static constexpr const char* TYPE_NAME = "CombineNodeType";

    CombineNode(std::string id, Settings settings)
        : IPlacementNode(std::move(id), TYPE_NAME, std::move(settings)) {}

protected:
    crowd_core::Result<void> evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) override;
};

/// @brief Redirects placement into the agent group groupName
///
/// The group is prepared once per build: created when missing, reset when of
/// auto type. Frozen and manual groups drop the branch.
class AddToGroupNode : public IPlacementNode {
public:
    static constexpr const char* TYPE_NAME = "AddToGroupNodeType";

    AddToGroupNode(std::string id, Settings settings)
        : IPlacementNode(std::move(id), TYPE_NAME, std::move(settings)) {}

    [[nodiscard]] std::vector<std::string> required_inputs() const override { return {"Template"}; }

protected:
    bool validate_settings(ValidationContext& ctx) const override;
    crowd_core::Result<void> evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) override;

private:
    crowd_core::Result<bool> prepare_group(EvaluationContext& ctx, const std::string& name) const;
};

} // namespace crowd_template
