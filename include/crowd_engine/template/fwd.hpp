#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for crowd_template module

#include <compare>
#include <cstdint>
#include <functional>

namespace crowd_template {

// =============================================================================
// Strong Handle Types
// =============================================================================

/// @brief Strongly-typed handle of a scene object owned by the backend
struct ObjectHandle {
    std::uint64_t value{0};
    explicit operator bool() const { return value != 0; }
    bool operator==(const ObjectHandle&) const = default;
    auto operator<=>(const ObjectHandle&) const = default;
};

// =============================================================================
// Forward Declarations - Data Model
// =============================================================================

struct PlacementRequest;
struct GeometryRequest;
struct GeometryResult;
struct DeferredGeometry;
struct BuildStats;

class Settings;

// =============================================================================
// Forward Declarations - Backend
// =============================================================================

struct MeshData;
struct GroupMember;
struct DuplicatedGroup;
struct LinkedGroup;
struct AgentRegistration;
class ISceneBackend;
class MemoryScene;

// =============================================================================
// Forward Declarations - Evaluation
// =============================================================================

class RandomSource;
class EvaluationContext;
class ValidationContext;
struct ValidationIssue;
struct ValidationReport;

class INode;
class IPlacementNode;
class IGeometryNode;
class NodeRegistry;
class TemplateGraph;

struct NodeDescription;
struct GraphDescription;
struct EngineConfig;

// =============================================================================
// Enumerations
// =============================================================================

/// @brief Capability family of a node
enum class NodeFamily : std::uint8_t {
    Placement,
    Geometry,
};

/// @brief Placement type of an agent group
enum class AgentGroupType : std::uint8_t {
    Auto,    ///< Owned by the generator, reset before placement
    Manual,  ///< Hand-authored, never touched by the generator
};

/// @brief Reason a branch was dropped during evaluation
enum class DropReason : std::uint8_t {
    Obstacle,
    GroundMiss,
    FrozenGroup,
};

[[nodiscard]] const char* node_family_name(NodeFamily family);
[[nodiscard]] const char* drop_reason_name(DropReason reason);

} // namespace crowd_template

template<>
struct std::hash<crowd_template::ObjectHandle> {
    std::size_t operator()(const crowd_template::ObjectHandle& h) const noexcept {
        return std::hash<std::uint64_t>{}(h.value);
    }
};
