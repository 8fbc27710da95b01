/// @file registry.cpp
/// @brief NodeRegistry implementation

#include <crowd_engine/template/registry.hpp>
#include <crowd_engine/template/nodes/filter_nodes.hpp>
#include <crowd_engine/template/nodes/flow_nodes.hpp>
#include <crowd_engine/template/nodes/geometry_nodes.hpp>
#include <crowd_engine/template/nodes/positioning_nodes.hpp>
#include <crowd_engine/template/nodes/transform_nodes.hpp>
#include <crowd_engine/core/log.hpp>

#include <algorithm>

namespace crowd_template {

NodeRegistry& NodeRegistry::instance() {
    static NodeRegistry registry = [] {
        NodeRegistry r;
        r.register_builtins();
        return r;
    }();
    return registry;
}

bool NodeRegistry::register_node(const std::string& name, NodeFamily family, NodeFactory factory) {
    if (types_.count(name) > 0) {
        crowd_core::template_logger()->warn("Node type '{}' is already registered", name);
        return false;
    }
    types_.emplace(name, NodeType{name, family, std::move(factory)});
    return true;
}

bool NodeRegistry::unregister_node(const std::string& name) {
    return types_.erase(name) > 0;
}

bool NodeRegistry::has_node(const std::string& name) const {
    return types_.count(name) > 0;
}

const NodeType* NodeRegistry::find(const std::string& name) const {
    auto it = types_.find(name);
    return it == types_.end() ? nullptr : &it->second;
}

std::unique_ptr<INode> NodeRegistry::create_node(
    const std::string& type, std::string id, Settings settings) const {
    const NodeType* node_type = find(type);
    if (!node_type) {
        return nullptr;
    }
    return node_type->factory(std::move(id), std::move(settings));
}

std::vector<std::string> NodeRegistry::type_names() const {
    std::vector<std::string> names;
    names.reserve(types_.size());
    for (const auto& [name, type] : types_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void NodeRegistry::register_builtins() {
    register_geometry_nodes();
    register_placement_nodes();
    register_positioning_nodes();
}

void NodeRegistry::register_geometry_nodes() {
    register_node<ObjectInputNode>();
    register_node<GroupInputNode>();
    register_node<GeoSwitchNode>();
    register_node<ParentNode>();
    register_node<LinkGroupNode>();
    register_node<ModifyBoneNode>();
}

void NodeRegistry::register_placement_nodes() {
    register_node<AgentNode>();
    register_node<TemplateSwitchNode>();
    register_node<CombineNode>();
    register_node<AddToGroupNode>();
    register_node<OffsetNode>();
    register_node<RandomNode>();
    register_node<PointTowardsNode>();
    register_node<RandomMaterialNode>();
    register_node<SetTagNode>();
}

void NodeRegistry::register_positioning_nodes() {
    register_node<RandomPositionNode>();
    register_node<MeshPositionNode>();
    register_node<FormationNode>();
    register_node<TargetNode>();
    register_node<ObstacleNode>();
    register_node<GroundNode>();
}

} // namespace crowd_template
