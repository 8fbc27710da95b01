/// @file memory_scene.cpp
/// @brief MemoryScene implementation

#include <crowd_engine/template/memory_scene.hpp>

#include <algorithm>
#include <iterator>

namespace crowd_template {

using crowd_core::BackendError;
using crowd_core::Err;
using crowd_core::Ok;
using crowd_core::Result;

// =============================================================================
// Scene Authoring
// =============================================================================

void MemoryScene::add_object(const std::string& name, const crowd_math::Transform& transform,
                             const Vec3& dimensions, const std::string& kind) {
    m_objects[name] = Object{transform, dimensions, kind};
}

void MemoryScene::add_mesh(const std::string& name, const crowd_math::Transform& transform,
                           std::vector<Vec3> vertices,
                           std::vector<std::array<std::uint32_t, 3>> triangles) {
    Vec3 lo(crowd_math::consts::MAX_FLOAT);
    Vec3 hi(-crowd_math::consts::MAX_FLOAT);
    for (const auto& v : vertices) {
        lo = glm::min(lo, v);
        hi = glm::max(hi, v);
    }
    const Vec3 dims = vertices.empty() ? Vec3(0.0f) : (hi - lo) * transform.scale;

    m_objects[name] = Object{transform, dims, "MESH"};
    m_meshes[name] = MeshData{std::move(vertices), std::move(triangles), transform};
}

void MemoryScene::add_object_group(const std::string& name, std::vector<GroupMember> members) {
    m_object_groups[name] = std::move(members);
}

void MemoryScene::add_material(const std::string& name) {
    m_materials.insert(name);
}

void MemoryScene::add_agent_group(const std::string& name, AgentGroupType type, bool frozen) {
    m_agent_groups[name] = AgentGroup{type, frozen};
}

void MemoryScene::add_external_file(const std::string& path) {
    m_external_files.insert(path);
}

void MemoryScene::fail_operation(const std::string& operation) {
    m_failing.insert(operation);
}

// =============================================================================
// Recorded State
// =============================================================================

const MemoryScene::Instance* MemoryScene::find_instance(ObjectHandle handle) const {
    auto it = m_instance_index.find(handle);
    return it == m_instance_index.end() ? nullptr : &m_instances[it->second];
}

MemoryScene::Instance* MemoryScene::find_instance_mut(ObjectHandle handle) {
    auto it = m_instance_index.find(handle);
    return it == m_instance_index.end() ? nullptr : &m_instances[it->second];
}

std::size_t MemoryScene::reset_count(const std::string& group) const {
    auto it = m_resets.find(group);
    return it == m_resets.end() ? 0 : it->second;
}

std::vector<AgentRegistration> MemoryScene::agents_in_group(const std::string& group) const {
    std::vector<AgentRegistration> out;
    std::copy_if(m_agents.begin(), m_agents.end(), std::back_inserter(out),
                 [&group](const AgentRegistration& a) { return a.group == group; });
    return out;
}

ObjectHandle MemoryScene::new_instance(const std::string& source, bool deferred,
                                       const crowd_math::Transform& transform) {
    Instance instance;
    instance.handle = ObjectHandle{m_next_handle++};
    instance.source = source;
    instance.deferred = deferred;
    instance.transform = transform;
    m_instance_index[instance.handle] = m_instances.size();
    m_instances.push_back(std::move(instance));
    return m_instances.back().handle;
}

// =============================================================================
// Lookups and Snapshots
// =============================================================================

bool MemoryScene::has_object(const std::string& name) const {
    return m_objects.count(name) > 0;
}

bool MemoryScene::has_mesh(const std::string& name) const {
    return m_meshes.count(name) > 0;
}

bool MemoryScene::has_object_group(const std::string& name) const {
    return m_object_groups.count(name) > 0;
}

bool MemoryScene::has_material(const std::string& name) const {
    return m_materials.count(name) > 0;
}

crowd_math::Transform MemoryScene::object_transform(const std::string& name) const {
    auto it = m_objects.find(name);
    return it == m_objects.end() ? crowd_math::Transform{} : it->second.transform;
}

Vec3 MemoryScene::object_dimensions(const std::string& name) const {
    auto it = m_objects.find(name);
    return it == m_objects.end() ? Vec3(0.0f) : it->second.dimensions;
}

MeshData MemoryScene::mesh_data(const std::string& name) const {
    auto it = m_meshes.find(name);
    return it == m_meshes.end() ? MeshData{} : it->second;
}

std::vector<GroupMember> MemoryScene::object_group_members(const std::string& name) const {
    auto it = m_object_groups.find(name);
    return it == m_object_groups.end() ? std::vector<GroupMember>{} : it->second;
}

std::vector<std::string> MemoryScene::material_names() const {
    return {m_materials.begin(), m_materials.end()};
}

// =============================================================================
// Agent Groups
// =============================================================================

bool MemoryScene::agent_group_exists(const std::string& name) const {
    return m_agent_groups.count(name) > 0;
}

bool MemoryScene::is_agent_group_frozen(const std::string& name) const {
    auto it = m_agent_groups.find(name);
    return it != m_agent_groups.end() && it->second.frozen;
}

AgentGroupType MemoryScene::agent_group_type(const std::string& name) const {
    auto it = m_agent_groups.find(name);
    return it == m_agent_groups.end() ? AgentGroupType::Auto : it->second.type;
}

Result<void> MemoryScene::reset_agent_group(const std::string& name) {
    if (should_fail("reset_agent_group")) {
        return Err(BackendError::operation_failed("reset_agent_group", name));
    }
    if (m_agent_groups.erase(name) == 0) {
        return Err(BackendError::not_found("reset_agent_group", name));
    }
    m_agents.erase(std::remove_if(m_agents.begin(), m_agents.end(),
                                  [&name](const AgentRegistration& a) { return a.group == name; }),
                   m_agents.end());
    ++m_resets[name];
    return Ok();
}

Result<void> MemoryScene::create_agent_group(const std::string& name, AgentGroupType type) {
    if (should_fail("create_agent_group")) {
        return Err(BackendError::operation_failed("create_agent_group", name));
    }
    m_agent_groups[name] = AgentGroup{type, false};
    return Ok();
}

// =============================================================================
// Geometry
// =============================================================================

Result<ObjectHandle> MemoryScene::duplicate_object(const std::string& name, bool deferred) {
    if (should_fail("duplicate_object")) {
        return Err<ObjectHandle>(BackendError::operation_failed("duplicate_object", name));
    }
    auto it = m_objects.find(name);
    if (it == m_objects.end()) {
        return Err<ObjectHandle>(BackendError::not_found("duplicate_object", name));
    }
    return Ok(new_instance(name, deferred, it->second.transform));
}

Result<DuplicatedGroup> MemoryScene::duplicate_group_members(const std::string& group, bool deferred) {
    if (should_fail("duplicate_group_members")) {
        return Err<DuplicatedGroup>(BackendError::operation_failed("duplicate_group_members", group));
    }
    auto it = m_object_groups.find(group);
    if (it == m_object_groups.end() || it->second.empty()) {
        return Err<DuplicatedGroup>(BackendError::not_found("duplicate_group_members", group));
    }

    const auto& members = it->second;
    auto armature = std::find_if(members.begin(), members.end(),
                                 [](const GroupMember& m) { return m.is_armature(); });

    DuplicatedGroup result;
    if (deferred && armature != members.end()) {
        // Only the armature stands in for the whole group
        result.top = new_instance(group + "/" + armature->name, true, armature->transform);
        result.members.push_back(result.top);
        return Ok(std::move(result));
    }

    std::map<std::string, ObjectHandle> copies;
    for (const auto& member : members) {
        const ObjectHandle copy = new_instance(group + "/" + member.name, false, member.transform);
        copies[member.name] = copy;
        result.members.push_back(copy);
    }

    if (armature != members.end()) {
        result.top = copies[armature->name];
    } else {
        // Anchor at the lowest member
        auto lowest = std::min_element(members.begin(), members.end(),
            [](const GroupMember& a, const GroupMember& b) {
                return a.transform.location.z < b.transform.location.z;
            });
        result.top = new_instance(group + "/anchor", false, lowest->transform);
    }

    // Keep parents inside the group; roots hang off the anchor
    for (const auto& member : members) {
        Instance* copy = find_instance_mut(copies[member.name]);
        auto parent = copies.find(member.parent);
        if (parent != copies.end()) {
            copy->parent = parent->second;
        } else if (armature == members.end()) {
            copy->parent = result.top;
        }
        if (armature != members.end() && !member.is_armature()) {
            copy->armature = result.top;
        }
    }
    return Ok(std::move(result));
}

Result<LinkedGroup> MemoryScene::link_external_group(
    const std::string& source_path, const std::string& group,
    const std::string& rig_object, const std::string& constrain_bone,
    ObjectHandle constraint_target) {
    if (should_fail("link_external_group")) {
        return Err<LinkedGroup>(BackendError::operation_failed("link_external_group", group));
    }
    if (m_external_files.count(source_path) == 0) {
        return Err<LinkedGroup>(BackendError::unreachable("link_external_group", source_path));
    }

    LinkedGroup linked;
    linked.object = new_instance(source_path + ":" + group, false, {});
    linked.rig = new_instance(source_path + ":" + rig_object, false, {});
    m_links.push_back(Link{source_path, group, rig_object, constrain_bone, constraint_target, linked});
    return Ok(linked);
}

Result<void> MemoryScene::attach_to_bone(ObjectHandle parent, ObjectHandle child, const std::string& bone) {
    if (should_fail("attach_to_bone")) {
        return Err(BackendError::operation_failed("attach_to_bone", bone));
    }
    m_attachments.push_back(Attachment{parent, child, bone});
    return Ok();
}

Result<void> MemoryScene::set_object_transform(ObjectHandle object, const crowd_math::Transform& transform) {
    Instance* instance = find_instance_mut(object);
    if (!instance) {
        return Err(BackendError::not_found("set_object_transform", std::to_string(object.value)));
    }
    instance->transform = transform;
    return Ok();
}

Result<void> MemoryScene::assign_materials(ObjectHandle object, const MaterialMap& materials) {
    Instance* instance = find_instance_mut(object);
    if (!instance) {
        return Err(BackendError::not_found("assign_materials", std::to_string(object.value)));
    }
    for (const auto& [slot, material] : materials) {
        if (!has_material(material)) {
            return Err(BackendError::not_found("assign_materials", material));
        }
        instance->materials[slot] = material;
    }
    return Ok();
}

// =============================================================================
// Agents
// =============================================================================

Result<void> MemoryScene::register_agent(const AgentRegistration& agent) {
    if (should_fail("register_agent")) {
        return Err(BackendError::operation_failed("register_agent", agent.brain_type));
    }
    m_agents.push_back(agent);
    return Ok();
}

} // namespace crowd_template
