// crowd_template geometry node tests

#include "harness.hpp"

using namespace crowd_test;

namespace {

GroupMember member(const std::string& name, const std::string& kind, const Vec3& location,
                   const std::string& parent = "") {
    GroupMember m;
    m.name = name;
    m.kind = kind;
    m.parent = parent;
    m.transform.location = location;
    return m;
}

const MemoryScene::Instance& instance_named(const MemoryScene& scene, const std::string& source) {
    for (const auto& instance : scene.instances()) {
        if (instance.source == source) {
            return instance;
        }
    }
    FAIL("no instance of " << source);
    return scene.instances().front();
}

/// Geometry node "geo" feeding an agent
GraphDescription agent_over(std::vector<NodeDescription> geometry, const Settings& agent_settings = {}) {
    GraphDescription graph;
    graph.nodes = std::move(geometry);
    Settings settings = agent_settings;
    settings.set("brainType", std::string{"walker"});
    graph.nodes.push_back(node("agent", "TemplateNodeType", settings, {{"Objects", "geo"}}));
    return graph;
}

} // namespace

TEST_CASE("Object input", "[template][geometry]") {
    Harness h;

    SECTION("duplicates the source object") {
        auto graph = agent_over({node("geo", "ObjectInputNodeType", {{"inputObject", std::string{"Cube"}}})});
        REQUIRE(h.run(graph, "agent").is_ok());
        REQUIRE(h.scene.instances().size() == 1);
        REQUIRE(h.scene.instances().front().source == "Cube");
        REQUIRE_FALSE(h.scene.instances().front().deferred);
    }

    SECTION("deferred geometry is tagged and skips materials") {
        h.scene.add_material("Red");
        auto graph = agent_over({node("geo", "ObjectInputNodeType", {{"inputObject", std::string{"Cube"}}})},
                                {{"deferGeo", true}});
        PlacementRequest request;
        request.materials["0"] = "Red";
        REQUIRE(h.run(graph, "agent", request).is_ok());

        const auto& agent = h.scene.agents().front();
        REQUIRE(agent.deferred.has_value());
        REQUIRE(agent.deferred->kind == DeferredGeometry::Kind::Object);
        REQUIRE(agent.deferred->source == "Cube");

        const auto& instance = h.instance_of(agent);
        REQUIRE(instance.deferred);
        REQUIRE(instance.materials.empty());
    }

    SECTION("unknown object fails validation") {
        auto report = h.load(agent_over({node("geo", "ObjectInputNodeType", {{"inputObject", std::string{"Sphere"}}})}));
        REQUIRE(report.for_node("geo").size() == 1);
    }

    SECTION("duplicate failure aborts the build") {
        h.scene.fail_operation("duplicate_object");
        auto result = h.run(agent_over({node("geo", "ObjectInputNodeType", {{"inputObject", std::string{"Cube"}}})}),
                            "agent");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == crowd_core::ErrorCode::BackendFailure);
        REQUIRE(h.scene.agents().empty());
    }
}

TEST_CASE("Group input", "[template][geometry]") {
    Harness h;
    h.scene.add_object_group("Rigged", {
        member("Body", "MESH", Vec3(0.0f, 0.0f, 1.0f)),
        member("Rig", "ARMATURE", Vec3(0.0f, 0.0f, 0.5f)),
    });
    h.scene.add_object_group("Props", {
        member("Hat", "MESH", Vec3(0.0f, 0.0f, 2.0f)),
        member("Shoes", "MESH", Vec3(0.0f, 0.0f, 0.1f)),
    });
    h.scene.add_object_group("Empty", {});

    SECTION("armature is the top object") {
        auto graph = agent_over({node("geo", "GroupInputNodeType", {{"inputGroup", std::string{"Rigged"}}})});
        REQUIRE(h.run(graph, "agent").is_ok());
        REQUIRE(h.scene.instances().size() == 2);
        REQUIRE(h.instance_of(h.scene.agents().front()).source == "Rigged/Rig");
    }

    SECTION("anchor at the lowest member without an armature") {
        auto graph = agent_over({node("geo", "GroupInputNodeType", {{"inputGroup", std::string{"Props"}}})});
        REQUIRE(h.run(graph, "agent").is_ok());
        REQUIRE(h.instance_of(h.scene.agents().front()).source == "Props/anchor");
    }

    SECTION("deferred group names its armature") {
        auto graph = agent_over({node("geo", "GroupInputNodeType", {{"inputGroup", std::string{"Rigged"}}})},
                                {{"deferGeo", true}});
        REQUIRE(h.run(graph, "agent").is_ok());
        REQUIRE(h.scene.instances().size() == 1);

        const auto& deferred = h.scene.agents().front().deferred;
        REQUIRE(deferred.has_value());
        REQUIRE(deferred->kind == DeferredGeometry::Kind::Group);
        REQUIRE(deferred->source == "Rigged");
        REQUIRE(deferred->armature == "Rig");
    }

    SECTION("copies keep in-group parents and armature targets") {
        h.scene.add_object_group("Dressed", {
            member("Rig", "ARMATURE", Vec3(0.0f)),
            member("Body", "MESH", Vec3(0.0f, 0.0f, 1.0f), "Rig"),
            member("Cap", "MESH", Vec3(0.0f, 0.0f, 2.0f), "Body"),
            member("Prop", "MESH", Vec3(1.0f, 0.0f, 0.0f), "Outside"),
        });
        auto graph = agent_over({node("geo", "GroupInputNodeType", {{"inputGroup", std::string{"Dressed"}}})});
        REQUIRE(h.run(graph, "agent").is_ok());

        const auto& rig = instance_named(h.scene, "Dressed/Rig");
        const auto& body = instance_named(h.scene, "Dressed/Body");
        const auto& cap = instance_named(h.scene, "Dressed/Cap");
        const auto& prop = instance_named(h.scene, "Dressed/Prop");

        REQUIRE(body.parent == rig.handle);
        REQUIRE(cap.parent == body.handle);
        REQUIRE_FALSE(prop.parent);
        REQUIRE_FALSE(rig.parent);

        REQUIRE(body.armature == rig.handle);
        REQUIRE(cap.armature == rig.handle);
        REQUIRE(prop.armature == rig.handle);
        REQUIRE_FALSE(rig.armature);
    }

    SECTION("roots hang off the anchor without an armature") {
        h.scene.add_object_group("Stack", {
            member("Base", "MESH", Vec3(0.0f)),
            member("Top", "MESH", Vec3(0.0f, 0.0f, 1.0f), "Base"),
        });
        auto graph = agent_over({node("geo", "GroupInputNodeType", {{"inputGroup", std::string{"Stack"}}})});
        REQUIRE(h.run(graph, "agent").is_ok());

        const auto& anchor = instance_named(h.scene, "Stack/anchor");
        const auto& base = instance_named(h.scene, "Stack/Base");
        REQUIRE(base.parent == anchor.handle);
        REQUIRE(instance_named(h.scene, "Stack/Top").parent == base.handle);
        REQUIRE_FALSE(base.armature);
    }

    SECTION("deferred group without an armature is copied in full") {
        auto graph = agent_over({node("geo", "GroupInputNodeType", {{"inputGroup", std::string{"Props"}}})},
                                {{"deferGeo", true}});
        REQUIRE(h.run(graph, "agent").is_ok());

        REQUIRE(h.scene.instances().size() == 3);
        for (const auto& instance : h.scene.instances()) {
            REQUIRE_FALSE(instance.deferred);
        }
        const auto& agent = h.scene.agents().front();
        REQUIRE_FALSE(agent.deferred.has_value());
        REQUIRE(h.instance_of(agent).source == "Props/anchor");
    }

    SECTION("empty group fails validation") {
        auto report = h.load(agent_over({node("geo", "GroupInputNodeType", {{"inputGroup", std::string{"Empty"}}})}));
        REQUIRE(report.for_node("geo").size() == 1);
    }
}

TEST_CASE("Geometry switch", "[template][geometry]") {
    Harness h;
    h.scene.add_object("Sphere");

    auto make = [](double amount) {
        return agent_over({
            node("cube", "ObjectInputNodeType", {{"inputObject", std::string{"Cube"}}}),
            node("sphere", "ObjectInputNodeType", {{"inputObject", std::string{"Sphere"}}}),
            node("geo", "GeoSwitchNodeType", {{"switchAmount", amount}},
                 {{"Object 1", "cube"}, {"Object 2", "sphere"}}),
        });
    };

    SECTION("amount 1") {
        REQUIRE(h.run(make(1.0), "agent").is_ok());
        REQUIRE(h.scene.instances().front().source == "Cube");
        REQUIRE(h.find<INode>("sphere")->evaluation_count() == 0);
    }

    SECTION("amount 0") {
        REQUIRE(h.run(make(0.0), "agent").is_ok());
        REQUIRE(h.scene.instances().front().source == "Sphere");
    }

    SECTION("placement input is rejected") {
        auto graph = make(0.5);
        graph.nodes.push_back(node("spread", "RandomPositionNodeType", {}, {{"Template", "agent"}}));
        graph.nodes[2].inputs[1].second = "spread";
        auto report = h.load(graph);
        REQUIRE(report.for_node("geo").size() == 1);
    }
}

TEST_CASE("Parent to bone", "[template][geometry]") {
    Harness h;
    h.scene.add_object("Hat");
    h.scene.add_object_group("Rigged", {
        member("Body", "MESH", Vec3(0.0f)),
        member("Rig", "ARMATURE", Vec3(0.0f)),
    });

    auto graph = agent_over({
        node("body", "GroupInputNodeType", {{"inputGroup", std::string{"Rigged"}}}),
        node("hat", "ObjectInputNodeType", {{"inputObject", std::string{"Hat"}}}),
        node("geo", "ParentNodeType", {{"parentTo", std::string{"Head"}}},
             {{"Parent Group", "body"}, {"Child Object", "hat"}}),
    });

    SECTION("attaches the child and returns the parent") {
        REQUIRE(h.run(graph, "agent").is_ok());
        REQUIRE(h.scene.attachments().size() == 1);

        const auto& attachment = h.scene.attachments().front();
        REQUIRE(attachment.bone == "Head");
        REQUIRE(h.scene.find_instance(attachment.child)->source == "Hat");
        REQUIRE(attachment.parent == h.scene.agents().front().object);
    }

    SECTION("empty bone fails validation") {
        graph.nodes[2].settings.set("parentTo", std::string{"  "});
        REQUIRE(h.load(graph).for_node("geo").size() == 1);
    }

    SECTION("attach failure aborts the build") {
        h.scene.fail_operation("attach_to_bone");
        REQUIRE(h.run(graph, "agent").is_err());
    }
}

TEST_CASE("Link external group", "[template][geometry]") {
    Harness h;
    auto graph = agent_over({
        node("cube", "ObjectInputNodeType", {{"inputObject", std::string{"Cube"}}}),
        node("geo", "LinkGroupNodeType", {
            {"sourcePath", std::string{"//library/crowd.blend"}},
            {"groupName", std::string{"Soldier"}},
            {"rigObject", std::string{"SoldierRig"}},
            {"constrainBone", std::string{"Root"}},
        }, {{"Objects", "cube"}}),
    });

    SECTION("links and overrides the rig") {
        h.scene.add_external_file("//library/crowd.blend");
        REQUIRE(h.run(graph, "agent").is_ok());
        REQUIRE(h.scene.links().size() == 1);

        const auto& link = h.scene.links().front();
        REQUIRE(link.group == "Soldier");
        REQUIRE(link.constrain_bone == "Root");

        const auto& agent = h.scene.agents().front();
        REQUIRE(agent.rig_override.has_value());
        REQUIRE(*agent.rig_override == link.result.rig);
        REQUIRE(agent.constrain_bone == std::optional<std::string>{"Root"});
        REQUIRE(link.constraint_target == agent.object);
    }

    SECTION("unreachable file aborts the build") {
        auto result = h.run(graph, "agent");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == crowd_core::ErrorCode::IOError);
        REQUIRE(h.scene.agents().empty());
    }

    SECTION("all names are required") {
        graph.nodes[1].settings.set("rigObject", std::string{});
        REQUIRE(h.load(graph).for_node("geo").size() == 1);
    }
}

TEST_CASE("Modify bone", "[template][geometry]") {
    Harness h;
    auto graph = agent_over({
        node("cube", "ObjectInputNodeType", {{"inputObject", std::string{"Cube"}}}),
        node("geo", "ModifyBoneNodeType", {
            {"boneName", std::string{"Spine"}},
            {"boneAttribute", std::string{"scale"}},
            {"tagName", std::string{"height"}},
        }, {{"Objects", "cube"}}),
    });

    REQUIRE(h.run(graph, "agent").is_ok());
    const auto& mods = h.scene.agents().front().bone_modifications;
    REQUIRE(mods.at("Spine").at("scale") == "height");
}
