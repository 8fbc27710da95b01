#pragma once

/// @file positioning_nodes.hpp
/// @brief Placement nodes that fan one request out into many

#include <crowd_engine/template/node.hpp>
#include <crowd_engine/spatial/bvh.hpp>

namespace crowd_template {

/// @brief Random positions around the request
///
/// Settings: noToPlace, locationType (radius, area or sector), radius, MaxX,
/// MaxY, direction, angle (degrees, half width), relax, relaxRadius,
/// relaxIterations
class RandomPositionNode : public IPlacementNode {
public:
    static constexpr const char* TYPE_NAME = "RandomPositionNodeType";

    RandomPositionNode(std::string id, Settings settings)
        : IPlacementNode(std::move(id), TYPE_NAME, std::move(settings)) {}

    [[nodiscard]] std::vector<std::string> required_inputs() const override { return {"Template"}; }

    /// Offset in the request plane before rotation
    [[nodiscard]] crowd_math::Vec3 draw_offset(RandomSource& random) const;

protected:
    bool validate_settings(ValidationContext& ctx) const override;
    crowd_core::Result<void> evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) override;
};

/// @brief Area-weighted random points on a guide mesh
///
/// Settings: guideMesh, noToPlace, positionMode (world or local), relax,
/// relaxRadius, relaxIterations
class MeshPositionNode : public IPlacementNode {
public:
    static constexpr const char* TYPE_NAME = "MeshPositionNodeType";

    MeshPositionNode(std::string id, Settings settings)
        : IPlacementNode(std::move(id), TYPE_NAME, std::move(settings)) {}

    [[nodiscard]] std::vector<std::string> required_inputs() const override { return {"Template"}; }

    void prepare(const ISceneBackend& backend) override;

    [[nodiscard]] bool index_built() const { return m_guide.is_built(); }

protected:
    bool validate_settings(ValidationContext& ctx) const override;
    crowd_core::Result<void> evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) override;

private:
    struct Guide {
        MeshData mesh;
        crowd_spatial::TriangleBvh bvh;  ///< Mesh-local space
    };

    const Guide& guide(const ISceneBackend& backend);

    LazyIndex<Guide> m_guide;
};

/// @brief Grid of ArrayRows rows and ceil(noToPlace / ArrayRows) columns
///
/// Settings: noToPlace, ArrayRows, ArrayRowMargin, ArrayColumnMargin
class FormationNode : public IPlacementNode {
public:
    static constexpr const char* TYPE_NAME = "FormationPositionNodeType";

    FormationNode(std::string id, Settings settings)
        : IPlacementNode(std::move(id), TYPE_NAME, std::move(settings)) {}

    [[nodiscard]] std::vector<std::string> required_inputs() const override { return {"Template"}; }

protected:
    bool validate_settings(ValidationContext& ctx) const override;
    crowd_core::Result<void> evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) override;
};

/// @brief One request per object of a group or per vertex of a mesh
///
/// Settings: targetType (object or vertex), targetGroups, targetObject,
/// overwritePosition
class TargetNode : public IPlacementNode {
public:
    static constexpr const char* TYPE_NAME = "TargetPositionNodeType";

    TargetNode(std::string id, Settings settings)
        : IPlacementNode(std::move(id), TYPE_NAME, std::move(settings)) {}

    [[nodiscard]] std::vector<std::string> required_inputs() const override { return {"Template"}; }

protected:
    bool validate_settings(ValidationContext& ctx) const override;
    crowd_core::Result<void> evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) override;
};

} // namespace crowd_template
