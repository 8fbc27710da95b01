#pragma once

/// @file types.hpp
/// @brief Values threaded through a template graph during evaluation

#include "fwd.hpp"
#include <crowd_engine/math/transform.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace crowd_template {

using crowd_math::Vec3;

/// Tag name -> initial value
using TagMap = std::map<std::string, double>;

/// Material slot (or original material name) -> replacement material
using MaterialMap = std::map<std::string, std::string>;

/// Bone name -> {attribute name -> tag name}
using BoneModifications = std::map<std::string, std::map<std::string, std::string>>;

// =============================================================================
// PlacementRequest
// =============================================================================

/// @brief Where and how an agent should be placed
///
/// Passed by value between placement nodes; every fork is an independent copy.
struct PlacementRequest {
    Vec3 position{0.0f};
    Vec3 rotation{0.0f};    ///< Euler XYZ, radians
    float scale = 1.0f;
    TagMap tags;
    std::string group;      ///< Target agent group
    MaterialMap materials;

    /// Request at the origin with unit scale
    [[nodiscard]] static PlacementRequest identity() { return PlacementRequest{}; }

    [[nodiscard]] crowd_math::Transform transform() const {
        return crowd_math::Transform::uniform(position, rotation, scale);
    }
};

// =============================================================================
// GeometryRequest / GeometryResult
// =============================================================================

/// @brief Transform and options handed to a geometry subgraph
struct GeometryRequest {
    Vec3 position{0.0f};
    Vec3 rotation{0.0f};
    float scale = 1.0f;
    MaterialMap materials;
    bool deferred = false;

    [[nodiscard]] static GeometryRequest from_placement(const PlacementRequest& request, bool deferred) {
        return GeometryRequest{request.position, request.rotation, request.scale,
                               request.materials, deferred};
    }
};

/// @brief Placeholder for geometry the host resolves later
struct DeferredGeometry {
    enum class Kind : std::uint8_t { Object, Group };

    Kind kind = Kind::Object;
    std::string source;    ///< Source object or group name
    std::string armature;  ///< Armature member for groups, empty for objects
};

/// @brief Geometry produced by a geometry node
struct GeometryResult {
    ObjectHandle object;
    std::optional<ObjectHandle> rig_override;
    std::optional<std::string> constrain_bone;
    BoneModifications bone_modifications;
    std::optional<DeferredGeometry> deferred;

    [[nodiscard]] static GeometryResult wrap(ObjectHandle handle) {
        GeometryResult result;
        result.object = handle;
        return result;
    }
};

// =============================================================================
// BuildStats
// =============================================================================

/// @brief Counters collected during one build
struct BuildStats {
    std::size_t agents_registered = 0;
    std::size_t dropped_obstacle = 0;
    std::size_t dropped_ground_miss = 0;
    std::size_t dropped_frozen_group = 0;
    std::size_t warnings = 0;

    void record_drop(DropReason reason) {
        switch (reason) {
            case DropReason::Obstacle: ++dropped_obstacle; break;
            case DropReason::GroundMiss: ++dropped_ground_miss; break;
            case DropReason::FrozenGroup: ++dropped_frozen_group; break;
        }
    }

    [[nodiscard]] std::size_t total_dropped() const {
        return dropped_obstacle + dropped_ground_miss + dropped_frozen_group;
    }
};

} // namespace crowd_template
