#pragma once

/// @file transform_nodes.hpp
/// @brief Placement nodes that modify a request and forward it

#include <crowd_engine/template/node.hpp>
#include <crowd_engine/spatial/kd_tree.hpp>

#include <span>

namespace crowd_template {

/// Index chosen by subtracting weights in order from draw until it is non-positive
///
/// draw is expected in [0, sum(weights)). Returns the last index if rounding
/// leaves the running value positive.
[[nodiscard]] std::size_t weighted_index(std::span<const double> weights, double draw);

/// @brief Resets or keeps the transform, then adds a reference object and a fixed offset
///
/// Settings: overwrite, referenceObject, locationOffset, rotationOffset (degrees)
class OffsetNode : public IPlacementNode {
public:
    static constexpr const char* TYPE_NAME = "OffsetNodeType";

    OffsetNode(std::string id, Settings settings)
        : IPlacementNode(std::move(id), TYPE_NAME, std::move(settings)) {}

    [[nodiscard]] std::vector<std::string> required_inputs() const override { return {"Template"}; }

protected:
    bool validate_settings(ValidationContext& ctx) const override;
    crowd_core::Result<void> evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) override;
};

/// @brief Random heading, scale and optional material by name prefix
///
/// Settings: minRandRot, maxRandRot (degrees), minRandSz, maxRandSz,
/// randMat, randMatPrefix, materialSlot
class RandomNode : public IPlacementNode {
public:
    static constexpr const char* TYPE_NAME = "RandomNodeType";

    RandomNode(std::string id, Settings settings)
        : IPlacementNode(std::move(id), TYPE_NAME, std::move(settings)) {}

    [[nodiscard]] std::vector<std::string> required_inputs() const override { return {"Template"}; }

protected:
    crowd_core::Result<void> evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) override;
};

/// @brief Turns local +Y towards an object origin or the nearest vertex of a mesh
///
/// Settings: PointObject, PointType (OBJECT or MESH)
class PointTowardsNode : public IPlacementNode {
public:
    static constexpr const char* TYPE_NAME = "PointTowardsNodeType";

    PointTowardsNode(std::string id, Settings settings)
        : IPlacementNode(std::move(id), TYPE_NAME, std::move(settings)) {}

    [[nodiscard]] std::vector<std::string> required_inputs() const override { return {"Template"}; }

    void prepare(const ISceneBackend& backend) override;

    [[nodiscard]] bool index_built() const { return m_target.is_built(); }

protected:
    bool validate_settings(ValidationContext& ctx) const override;
    crowd_core::Result<void> evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) override;

private:
    struct MeshTarget {
        crowd_spatial::KdTree tree;  ///< Mesh-local vertices
        crowd_math::Mat4 world{1.0f};
        crowd_math::Mat4 inverse{1.0f};
    };

    [[nodiscard]] bool mesh_mode() const { return settings().get_string("PointType", "OBJECT") == "MESH"; }
    const MeshTarget& mesh_target(const ISceneBackend& backend);

    LazyIndex<MeshTarget> m_target;
};

/// @brief Weighted random material choice
///
/// Settings: materialNames, materialWeights, materialSlot
class RandomMaterialNode : public IPlacementNode {
public:
    static constexpr const char* TYPE_NAME = "RandomMaterialNodeType";

    RandomMaterialNode(std::string id, Settings settings)
        : IPlacementNode(std::move(id), TYPE_NAME, std::move(settings)) {}

    [[nodiscard]] std::vector<std::string> required_inputs() const override { return {"Template"}; }

protected:
    bool validate_settings(ValidationContext& ctx) const override;
    crowd_core::Result<void> evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) override;
};

/// @brief Sets tagName to tagValue
class SetTagNode : public IPlacementNode {
public:
    static constexpr const char* TYPE_NAME = "SetTagNodeType";

    SetTagNode(std::string id, Settings settings)
        : IPlacementNode(std::move(id), TYPE_NAME, std::move(settings)) {}

    [[nodiscard]] std::vector<std::string> required_inputs() const override { return {"Template"}; }

protected:
    bool validate_settings(ValidationContext& ctx) const override;
    crowd_core::Result<void> evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) override;
};

} // namespace crowd_template
