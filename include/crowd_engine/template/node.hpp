#pragma once

/// @file node.hpp
/// @brief Node interfaces of a template graph

#include "context.hpp"
#include "settings.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace crowd_template {

/// @brief Named input of a node
struct InputSlot {
    std::string name;
    std::string node_id;
    INode* node = nullptr;  ///< Resolved by the graph
};

// =============================================================================
// INode
// =============================================================================

/// @brief Common contract of placement and geometry nodes
class INode {
public:
    INode(std::string id, std::string type_name, Settings settings);
    virtual ~INode() = default;

    INode(const INode&) = delete;
    INode& operator=(const INode&) = delete;

    // Identity
    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] const std::string& type_name() const { return type_name_; }
    [[nodiscard]] virtual NodeFamily family() const = 0;
    [[nodiscard]] const Settings& settings() const { return settings_; }

    // Inputs
    [[nodiscard]] std::span<const InputSlot> inputs() const { return inputs_; }
    void add_input(const std::string& slot, const std::string& node_id);
    void bind_input(std::size_t index, INode* node);

    /// First node bound to slot, or null
    [[nodiscard]] INode* input(const std::string& slot) const;

    /// Slots that must be bound
    [[nodiscard]] virtual std::vector<std::string> required_inputs() const { return {}; }

    /// Family every input must belong to
    [[nodiscard]] virtual NodeFamily input_family() const { return NodeFamily::Placement; }

    /// @brief Check inputs, settings and children
    ///
    /// Pure: performs only backend lookups. Call through ValidationContext::check.
    bool validate(ValidationContext& ctx) const;

    /// Build lazily constructed indices ahead of the first evaluation
    virtual void prepare([[maybe_unused]] const ISceneBackend& backend) {}

    [[nodiscard]] std::uint64_t evaluation_count() const { return evaluation_count_; }

protected:
    /// Node-specific setting checks
    virtual bool validate_settings([[maybe_unused]] ValidationContext& ctx) const { return true; }

    void count_evaluation() { ++evaluation_count_; }

private:
    std::string id_;
    std::string type_name_;
    Settings settings_;
    std::vector<InputSlot> inputs_;
    std::uint64_t evaluation_count_ = 0;
};

// =============================================================================
// IPlacementNode
// =============================================================================

/// @brief Node that consumes placement requests
class IPlacementNode : public INode {
public:
    using INode::INode;

    [[nodiscard]] NodeFamily family() const final { return NodeFamily::Placement; }

    /// Evaluate one request; an error aborts the build
    [[nodiscard]] crowd_core::Result<void> evaluate(EvaluationContext& ctx, const PlacementRequest& request);

protected:
    [[nodiscard]] virtual crowd_core::Result<void> evaluate_request(
        EvaluationContext& ctx, const PlacementRequest& request) = 0;

    /// Evaluate the placement node bound to slot
    [[nodiscard]] crowd_core::Result<void> forward(
        EvaluationContext& ctx, const std::string& slot, const PlacementRequest& request) const;
};

// =============================================================================
// IGeometryNode
// =============================================================================

/// @brief Node that constructs geometry
class IGeometryNode : public INode {
public:
    using INode::INode;

    [[nodiscard]] NodeFamily family() const final { return NodeFamily::Geometry; }
    [[nodiscard]] NodeFamily input_family() const override { return NodeFamily::Geometry; }

    [[nodiscard]] crowd_core::Result<GeometryResult> evaluate(
        EvaluationContext& ctx, const GeometryRequest& request);

protected:
    [[nodiscard]] virtual crowd_core::Result<GeometryResult> evaluate_request(
        EvaluationContext& ctx, const GeometryRequest& request) = 0;

    /// Evaluate the geometry node bound to slot
    [[nodiscard]] crowd_core::Result<GeometryResult> forward(
        EvaluationContext& ctx, const std::string& slot, const GeometryRequest& request) const;
};

// =============================================================================
// LazyIndex
// =============================================================================

/// @brief Initialize-once cell for node-owned spatial indices
///
/// The value is built on first access and never changes afterwards.
template<typename T>
class LazyIndex {
public:
    template<typename Builder>
    const T& get(Builder&& build) {
        std::call_once(once_, [&] { value_.emplace(build()); });
        return *value_;
    }

    [[nodiscard]] bool is_built() const { return value_.has_value(); }

private:
    std::once_flag once_;
    std::optional<T> value_;
};

} // namespace crowd_template
