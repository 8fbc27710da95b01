#pragma once

/// @file backend.hpp
/// @brief Scene backend interface

#include "types.hpp"
#include <crowd_engine/core/error.hpp>

#include <array>
#include <string>
#include <vector>

namespace crowd_template {

// =============================================================================
// Snapshots
// =============================================================================

/// @brief Triangle mesh of a scene object
struct MeshData {
    std::vector<Vec3> vertices;                        ///< Object-local space
    std::vector<std::array<std::uint32_t, 3>> triangles;
    crowd_math::Transform transform;                   ///< Object world transform

    [[nodiscard]] std::vector<Vec3> world_vertices() const;
};

/// @brief Member of an object group
struct GroupMember {
    std::string name;
    std::string kind;    ///< "MESH", "ARMATURE", "EMPTY", ...
    std::string parent;  ///< Empty when the parent is outside the group
    crowd_math::Transform transform;
    Vec3 dimensions{0.0f};

    [[nodiscard]] bool is_armature() const { return kind == "ARMATURE"; }
};

/// @brief Result of duplicating every member of a group
struct DuplicatedGroup {
    ObjectHandle top;                   ///< Armature copy, or a synthesized anchor
    std::vector<ObjectHandle> members;
};

/// @brief Result of linking an external group
struct LinkedGroup {
    ObjectHandle object;
    ObjectHandle rig;
};

/// @brief Everything the backend needs to register an agent
struct AgentRegistration {
    ObjectHandle object;
    std::string brain_type;
    std::string group;
    TagMap tags;
    std::optional<ObjectHandle> rig_override;
    std::optional<std::string> constrain_bone;
    BoneModifications bone_modifications;
    std::optional<DeferredGeometry> deferred;
};

// =============================================================================
// ISceneBackend
// =============================================================================

/// @brief Host-side storage of objects, meshes, materials and agents
///
/// Const members are pure lookups and may be called during validation.
/// Snapshot getters assume the entity exists; validation guarantees that
/// before evaluation. Mutating calls report failures through Result and
/// abort the build.
class ISceneBackend {
public:
    virtual ~ISceneBackend() = default;

    // Lookups
    [[nodiscard]] virtual bool has_object(const std::string& name) const = 0;
    [[nodiscard]] virtual bool has_mesh(const std::string& name) const = 0;
    [[nodiscard]] virtual bool has_object_group(const std::string& name) const = 0;
    [[nodiscard]] virtual bool has_material(const std::string& name) const = 0;

    // Snapshots
    [[nodiscard]] virtual crowd_math::Transform object_transform(const std::string& name) const = 0;
    [[nodiscard]] virtual Vec3 object_dimensions(const std::string& name) const = 0;
    [[nodiscard]] virtual MeshData mesh_data(const std::string& name) const = 0;
    [[nodiscard]] virtual std::vector<GroupMember> object_group_members(const std::string& name) const = 0;
    [[nodiscard]] virtual std::vector<std::string> material_names() const = 0;

    // Agent groups
    [[nodiscard]] virtual bool agent_group_exists(const std::string& name) const = 0;
    [[nodiscard]] virtual bool is_agent_group_frozen(const std::string& name) const = 0;
    [[nodiscard]] virtual AgentGroupType agent_group_type(const std::string& name) const = 0;
    [[nodiscard]] virtual crowd_core::Result<void> reset_agent_group(const std::string& name) = 0;
    [[nodiscard]] virtual crowd_core::Result<void> create_agent_group(const std::string& name,
                                                                      AgentGroupType type) = 0;

    // Geometry
    [[nodiscard]] virtual crowd_core::Result<ObjectHandle> duplicate_object(
        const std::string& name, bool deferred) = 0;
    /// Copies keep their in-group parents and armature modifier targets. Deferred
    /// groups place only their armature; groups without one are copied in full.
    [[nodiscard]] virtual crowd_core::Result<DuplicatedGroup> duplicate_group_members(
        const std::string& group, bool deferred) = 0;
    [[nodiscard]] virtual crowd_core::Result<LinkedGroup> link_external_group(
        const std::string& source_path, const std::string& group,
        const std::string& rig_object, const std::string& constrain_bone,
        ObjectHandle constraint_target) = 0;
    [[nodiscard]] virtual crowd_core::Result<void> attach_to_bone(
        ObjectHandle parent, ObjectHandle child, const std::string& bone) = 0;
    [[nodiscard]] virtual crowd_core::Result<void> set_object_transform(
        ObjectHandle object, const crowd_math::Transform& transform) = 0;
    [[nodiscard]] virtual crowd_core::Result<void> assign_materials(
        ObjectHandle object, const MaterialMap& materials) = 0;

    // Agents
    [[nodiscard]] virtual crowd_core::Result<void> register_agent(const AgentRegistration& agent) = 0;
};

} // namespace crowd_template
