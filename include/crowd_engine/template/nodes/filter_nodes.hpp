#pragma once

/// @file filter_nodes.hpp
/// @brief Placement nodes that drop or project requests

#include <crowd_engine/template/node.hpp>
#include <crowd_engine/spatial/bvh.hpp>
#include <crowd_engine/spatial/octree.hpp>

namespace crowd_template {

/// @brief Drops requests inside the padded bounding box of any obstacle
///
/// Settings: obstacleGroup, margin
class ObstacleNode : public IPlacementNode {
public:
    static constexpr const char* TYPE_NAME = "ObstacleNodeType";

    ObstacleNode(std::string id, Settings settings)
        : IPlacementNode(std::move(id), TYPE_NAME, std::move(settings)) {}

    [[nodiscard]] std::vector<std::string> required_inputs() const override { return {"Template"}; }

    void prepare(const ISceneBackend& backend) override;

    [[nodiscard]] bool index_built() const { return m_octree.is_built(); }

protected:
    bool validate_settings(ValidationContext& ctx) const override;
    crowd_core::Result<void> evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) override;

private:
    const crowd_spatial::VolumeOctree& octree(const ISceneBackend& backend);

    LazyIndex<crowd_spatial::VolumeOctree> m_octree;
};

/// @brief Projects requests onto a ground mesh along the vertical
///
/// Casts down and up from the position; the closer hit wins. Requests with
/// no hit are dropped.
/// Settings: groundMesh
class GroundNode : public IPlacementNode {
public:
    static constexpr const char* TYPE_NAME = "GroundNodeType";

    GroundNode(std::string id, Settings settings)
        : IPlacementNode(std::move(id), TYPE_NAME, std::move(settings)) {}

    [[nodiscard]] std::vector<std::string> required_inputs() const override { return {"Template"}; }

    void prepare(const ISceneBackend& backend) override;

    [[nodiscard]] bool index_built() const { return m_ground.is_built(); }

protected:
    bool validate_settings(ValidationContext& ctx) const override;
    crowd_core::Result<void> evaluate_request(EvaluationContext& ctx, const PlacementRequest& request) override;

private:
    struct Ground {
        crowd_math::Vec3 origin{0.0f};
        crowd_spatial::TriangleBvh bvh;  ///< World orientation, relative to origin
    };

    const Ground& ground(const ISceneBackend& backend);

    LazyIndex<Ground> m_ground;
};

} // namespace crowd_template
