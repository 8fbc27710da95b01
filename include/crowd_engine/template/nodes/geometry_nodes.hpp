#pragma once

/// @file geometry_nodes.hpp
/// @brief Geometry construction nodes

#include <crowd_engine/template/node.hpp>

namespace crowd_template {

/// @brief Duplicates a scene object
///
/// Settings: inputObject
class ObjectInputNode : public IGeometryNode {
public:
    static constexpr const char* TYPE_NAME = "ObjectInputNodeType";

    ObjectInputNode(std::string id, Settings settings)
        : IGeometryNode(std::move(id), TYPE_NAME, std::move(settings)) {}

protected:
    bool validate_settings(ValidationContext& ctx) const override;
    crowd_core::Result<GeometryResult> evaluate_request(
        EvaluationContext& ctx, const GeometryRequest& request) override;
};

/// @brief Duplicates every member of an object group
///
/// The armature member (or a synthesized anchor) is returned as the handle.
/// Settings: inputGroup
class GroupInputNode : public IGeometryNode {
public:
    static constexpr const char* TYPE_NAME = "GroupInputNodeType";

    GroupInputNode(std::string id, Settings settings)
        : IGeometryNode(std::move(id), TYPE_NAME, std::move(settings)) {}

protected:
    bool validate_settings(ValidationContext& ctx) const override;
    crowd_core::Result<GeometryResult> evaluate_request(
        EvaluationContext& ctx, const GeometryRequest& request) override;
};

/// @brief Picks "Object 1" with probability switchAmount, else "Object 2"
class GeoSwitchNode : public IGeometryNode {
public:
    static constexpr const char* TYPE_NAME = "GeoSwitchNodeType";

    GeoSwitchNode(std::string id, Settings settings)
        : IGeometryNode(std::move(id), TYPE_NAME, std::move(settings)) {}

    [[nodiscard]] std::vector<std::string> required_inputs() const override {
        return {"Object 1", "Object 2"};
    }

protected:
    crowd_core::Result<GeometryResult> evaluate_request(
        EvaluationContext& ctx, const GeometryRequest& request) override;
};

/// @brief Attaches "Child Object" to the bone parentTo of "Parent Group"
class ParentNode : public IGeometryNode {
public:
    static constexpr const char* TYPE_NAME = "ParentNodeType";

    ParentNode(std::string id, Settings settings)
        : IGeometryNode(std::move(id), TYPE_NAME, std::move(settings)) {}

    [[nodiscard]] std::vector<std::string> required_inputs() const override {
        return {"Parent Group", "Child Object"};
    }

protected:
    bool validate_settings(ValidationContext& ctx) const override;
    crowd_core::Result<GeometryResult> evaluate_request(
        EvaluationContext& ctx, const GeometryRequest& request) override;
};

/// @brief Links an external rig whose bone follows the child object
///
/// Settings: sourcePath, groupName, rigObject, constrainBone
class LinkGroupNode : public IGeometryNode {
public:
    static constexpr const char* TYPE_NAME = "LinkGroupNodeType";

    LinkGroupNode(std::string id, Settings settings)
        : IGeometryNode(std::move(id), TYPE_NAME, std::move(settings)) {}

    [[nodiscard]] std::vector<std::string> required_inputs() const override { return {"Objects"}; }

protected:
    bool validate_settings(ValidationContext& ctx) const override;
    crowd_core::Result<GeometryResult> evaluate_request(
        EvaluationContext& ctx, const GeometryRequest& request) override;
};

/// @brief Records a bone attribute driven by a tag
///
/// Settings: boneName, boneAttribute, tagName
class ModifyBoneNode : public IGeometryNode {
public:
    static constexpr const char* TYPE_NAME = "ModifyBoneNodeType";

    ModifyBoneNode(std::string id, Settings settings)
        : IGeometryNode(std::move(id), TYPE_NAME, std::move(settings)) {}

    [[nodiscard]] std::vector<std::string> required_inputs() const override { return {"Objects"}; }

protected:
    bool validate_settings(ValidationContext& ctx) const override;
    crowd_core::Result<GeometryResult> evaluate_request(
        EvaluationContext& ctx, const GeometryRequest& request) override;
};

} // namespace crowd_template
