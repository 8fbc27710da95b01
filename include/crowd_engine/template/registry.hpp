#pragma once

/// @file registry.hpp
/// @brief Mapping from node type identifiers to node factories

#include "node.hpp"

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace crowd_template {

/// Creates a node from its id and settings
using NodeFactory = std::function<std::unique_ptr<INode>(std::string id, Settings settings)>;

/// @brief Registered node type
struct NodeType {
    std::string name;
    NodeFamily family = NodeFamily::Placement;
    NodeFactory factory;
};

// =============================================================================
// Node Registry
// =============================================================================

/// @brief Registry of available node types
class NodeRegistry {
public:
    NodeRegistry() = default;

    /// Shared registry with the built-in node types
    [[nodiscard]] static NodeRegistry& instance();

    // ==========================================================================
    // Registration
    // ==========================================================================

    /// @brief Register a node type; false if the name is taken
    bool register_node(const std::string& name, NodeFamily family, NodeFactory factory);

    /// @brief Register a node class exposing TYPE_NAME and an (id, settings) constructor
    template<typename T>
    bool register_node() {
        static_assert(std::is_base_of_v<INode, T>, "T must derive from INode");
        constexpr NodeFamily family = std::is_base_of_v<IGeometryNode, T>
            ? NodeFamily::Geometry : NodeFamily::Placement;
        return register_node(T::TYPE_NAME, family, [](std::string id, Settings settings) {
            return std::unique_ptr<INode>(std::make_unique<T>(std::move(id), std::move(settings)));
        });
    }

    /// @brief Remove a node type
    bool unregister_node(const std::string& name);

    [[nodiscard]] bool has_node(const std::string& name) const;
    [[nodiscard]] const NodeType* find(const std::string& name) const;

    // ==========================================================================
    // Node Creation
    // ==========================================================================

    /// @brief Create a node; null if the type is unknown
    [[nodiscard]] std::unique_ptr<INode> create_node(
        const std::string& type, std::string id, Settings settings) const;

    // ==========================================================================
    // Queries
    // ==========================================================================

    /// @brief Registered names, sorted
    [[nodiscard]] std::vector<std::string> type_names() const;

    [[nodiscard]] std::size_t size() const { return types_.size(); }

    // ==========================================================================
    // Built-in Nodes
    // ==========================================================================

    /// @brief Register all built-in node types
    void register_builtins();

    /// @brief Register geometry construction nodes
    void register_geometry_nodes();

    /// @brief Register terminal, branching and transform placement nodes
    void register_placement_nodes();

    /// @brief Register fan-out positioning and filter nodes
    void register_positioning_nodes();

private:
    std::unordered_map<std::string, NodeType> types_;
};

} // namespace crowd_template
