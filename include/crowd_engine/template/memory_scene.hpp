#pragma once

/// @file memory_scene.hpp
/// @brief In-memory scene backend

#include "backend.hpp"

#include <map>
#include <set>
#include <unordered_map>

namespace crowd_template {

/// @brief Scene backend that keeps everything in memory and records every mutation
///
/// Used by tests and by hosts that only need placement output.
class MemoryScene : public ISceneBackend {
public:
    /// Duplicated or placeholder object
    struct Instance {
        ObjectHandle handle;
        std::string source;
        bool deferred = false;
        crowd_math::Transform transform;
        MaterialMap materials;
        ObjectHandle parent;    ///< Duplicated group parent, or the group anchor
        ObjectHandle armature;  ///< Armature modifier target inside a duplicated group
    };

    struct Attachment {
        ObjectHandle parent;
        ObjectHandle child;
        std::string bone;
    };

    struct Link {
        std::string source_path;
        std::string group;
        std::string rig_object;
        std::string constrain_bone;
        ObjectHandle constraint_target;
        LinkedGroup result;
    };

    MemoryScene() = default;

    // =========================================================================
    // Scene Authoring
    // =========================================================================

    void add_object(const std::string& name, const crowd_math::Transform& transform = {},
                    const Vec3& dimensions = Vec3(1.0f), const std::string& kind = "MESH");
    void add_mesh(const std::string& name, const crowd_math::Transform& transform,
                  std::vector<Vec3> vertices, std::vector<std::array<std::uint32_t, 3>> triangles);
    void add_object_group(const std::string& name, std::vector<GroupMember> members);
    void add_material(const std::string& name);
    void add_agent_group(const std::string& name, AgentGroupType type, bool frozen = false);
    void add_external_file(const std::string& path);

    /// Make every later call of the named operation fail
    void fail_operation(const std::string& operation);

    // =========================================================================
    // Recorded State
    // =========================================================================

    [[nodiscard]] const std::vector<AgentRegistration>& agents() const { return m_agents; }
    [[nodiscard]] const std::vector<Instance>& instances() const { return m_instances; }
    [[nodiscard]] const std::vector<Attachment>& attachments() const { return m_attachments; }
    [[nodiscard]] const std::vector<Link>& links() const { return m_links; }
    [[nodiscard]] const Instance* find_instance(ObjectHandle handle) const;
    [[nodiscard]] std::size_t reset_count(const std::string& group) const;
    [[nodiscard]] std::vector<AgentRegistration> agents_in_group(const std::string& group) const;

    // =========================================================================
    // ISceneBackend
    // =========================================================================

    [[nodiscard]] bool has_object(const std::string& name) const override;
    [[nodiscard]] bool has_mesh(const std::string& name) const override;
    [[nodiscard]] bool has_object_group(const std::string& name) const override;
    [[nodiscard]] bool has_material(const std::string& name) const override;

    [[nodiscard]] crowd_math::Transform object_transform(const std::string& name) const override;
    [[nodiscard]] Vec3 object_dimensions(const std::string& name) const override;
    [[nodiscard]] MeshData mesh_data(const std::string& name) const override;
    [[nodiscard]] std::vector<GroupMember> object_group_members(const std::string& name) const override;
    [[nodiscard]] std::vector<std::string> material_names() const override;

    [[nodiscard]] bool agent_group_exists(const std::string& name) const override;
    [[nodiscard]] bool is_agent_group_frozen(const std::string& name) const override;
    [[nodiscard]] AgentGroupType agent_group_type(const std::string& name) const override;
    [[nodiscard]] crowd_core::Result<void> reset_agent_group(const std::string& name) override;
    [[nodiscard]] crowd_core::Result<void> create_agent_group(const std::string& name,
                                                              AgentGroupType type) override;

    [[nodiscard]] crowd_core::Result<ObjectHandle> duplicate_object(
        const std::string& name, bool deferred) override;
    [[nodiscard]] crowd_core::Result<DuplicatedGroup> duplicate_group_members(
        const std::string& group, bool deferred) override;
    [[nodiscard]] crowd_core::Result<LinkedGroup> link_external_group(
        const std::string& source_path, const std::string& group,
        const std::string& rig_object, const std::string& constrain_bone,
        ObjectHandle constraint_target) override;
    [[nodiscard]] crowd_core::Result<void> attach_to_bone(
        ObjectHandle parent, ObjectHandle child, const std::string& bone) override;
    [[nodiscard]] crowd_core::Result<void> set_object_transform(
        ObjectHandle object, const crowd_math::Transform& transform) override;
    [[nodiscard]] crowd_core::Result<void> assign_materials(
        ObjectHandle object, const MaterialMap& materials) override;

    [[nodiscard]] crowd_core::Result<void> register_agent(const AgentRegistration& agent) override;

private:
    struct Object {
        crowd_math::Transform transform;
        Vec3 dimensions{1.0f};
        std::string kind;
    };

    struct AgentGroup {
        AgentGroupType type = AgentGroupType::Auto;
        bool frozen = false;
    };

    [[nodiscard]] bool should_fail(const std::string& operation) const {
        return m_failing.count(operation) > 0;
    }
    ObjectHandle new_instance(const std::string& source, bool deferred,
                              const crowd_math::Transform& transform);
    Instance* find_instance_mut(ObjectHandle handle);

    std::map<std::string, Object> m_objects;
    std::map<std::string, MeshData> m_meshes;
    std::map<std::string, std::vector<GroupMember>> m_object_groups;
    std::set<std::string> m_materials;
    std::map<std::string, AgentGroup> m_agent_groups;
    std::set<std::string> m_external_files;
    std::set<std::string> m_failing;

    std::vector<Instance> m_instances;
    std::unordered_map<ObjectHandle, std::size_t> m_instance_index;
    std::vector<AgentRegistration> m_agents;
    std::vector<Attachment> m_attachments;
    std::vector<Link> m_links;
    std::map<std::string, std::size_t> m_resets;

    std::uint64_t m_next_handle = 1;
};

} // namespace crowd_template
