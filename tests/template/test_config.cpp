// crowd_template configuration and graph description loading tests

#include "harness.hpp"

#include <filesystem>
#include <fstream>

using namespace crowd_test;
using crowd_core::ErrorCode;

namespace {

const char* const kCrowdGraph = R"({
    "nodes": [
        { "id": "geo", "type": "ObjectInputNodeType", "settings": { "inputObject": "Cube" } },
        { "id": "agent", "type": "TemplateNodeType",
          "settings": { "brainType": "walker", "deferGeo": false },
          "inputs": [ { "slot": "Objects", "node": "geo" } ] },
        { "id": "line", "type": "FormationPositionNodeType",
          "settings": { "noToPlace": 4, "ArrayColumnMargin": 1.5 },
          "inputs": { "Template": "agent" } }
    ]
})";

std::filesystem::path write_temp(const std::string& name, const std::string& contents) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << contents;
    return path;
}

} // namespace

// =============================================================================
// EngineConfig
// =============================================================================

TEST_CASE("Engine config defaults", "[template][config]") {
    auto config = engine_config_from_string("{}");
    REQUIRE(config.is_ok());
    REQUIRE(config->log_level == "info");
    REQUIRE_FALSE(config->log_to_file);
    REQUIRE_FALSE(config->random_seed.has_value());
    REQUIRE_FALSE(config->eager_spatial_indices);

    const auto log = config->log_config();
    REQUIRE(log.level == spdlog::level::info);
    REQUIRE_FALSE(log.file_enabled);
}

TEST_CASE("Engine config values", "[template][config]") {
    auto config = engine_config_from_string(R"({
        "log_level": "debug", "log_to_file": true, "log_directory": "out/logs",
        "random_seed": 42, "eager_spatial_indices": true
    })");
    REQUIRE(config.is_ok());
    REQUIRE(config->random_seed == std::optional<std::uint64_t>{42});
    REQUIRE(config->eager_spatial_indices);

    const auto log = config->log_config();
    REQUIRE(log.level == spdlog::level::debug);
    REQUIRE(log.file_enabled);
    REQUIRE(log.log_directory == "out/logs");

    // Same seed, same stream
    auto a = config->make_random_source();
    auto b = config->make_random_source();
    for (int i = 0; i < 10; ++i) {
        REQUIRE(a.random() == b.random());
    }
}

TEST_CASE("Engine config errors", "[template][config]") {
    SECTION("malformed JSON") {
        auto config = engine_config_from_string("{ not json");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::ParseError);
    }

    SECTION("unknown log level") {
        auto config = engine_config_from_string(R"({ "log_level": "chatty" })");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::ParseError);
    }

    SECTION("negative seed") {
        REQUIRE(engine_config_from_string(R"({ "random_seed": -3 })").is_err());
    }

    SECTION("not an object") {
        REQUIRE(engine_config_from_string("[1, 2]").is_err());
    }

    SECTION("missing file") {
        auto config = load_engine_config("/nonexistent/crowd_engine.json");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::IOError);
    }
}

TEST_CASE("Engine config from file", "[template][config]") {
    const auto path = write_temp("crowd_engine_config_test.json", R"({ "log_level": "warn" })");
    auto config = load_engine_config(path);
    std::filesystem::remove(path);

    REQUIRE(config.is_ok());
    REQUIRE(config->log_config().level == spdlog::level::warn);
}

TEST_CASE("Eager spatial indices", "[template][config]") {
    Harness h;
    add_plane(h.scene, "Ground", 10.0f, 0.0f);
    const auto description = single("GroundNodeType", {{"groundMesh", std::string{"Ground"}}});

    EngineConfig config;

    SECTION("lazy by default") {
        h.graph.emplace(description);
        REQUIRE(prepare_graph(*h.graph, h.scene, config).ok());
        REQUIRE_FALSE(h.find<GroundNode>("root")->index_built());
    }

    SECTION("built after validation when eager") {
        config.eager_spatial_indices = true;
        h.graph.emplace(description);
        REQUIRE(prepare_graph(*h.graph, h.scene, config).ok());
        REQUIRE(h.find<GroundNode>("root")->index_built());
    }

    SECTION("skipped for an invalid graph") {
        config.eager_spatial_indices = true;
        h.graph.emplace(single("GroundNodeType", {{"groundMesh", std::string{"Missing"}}}));
        REQUIRE_FALSE(prepare_graph(*h.graph, h.scene, config).ok());
        REQUIRE_FALSE(h.find<GroundNode>("root")->index_built());
    }
}

// =============================================================================
// Setting Values
// =============================================================================

TEST_CASE("Setting value conversion", "[template][config]") {
    REQUIRE(std::get<bool>(*parse_setting_value(nlohmann::json(true))));
    REQUIRE(std::get<std::int64_t>(*parse_setting_value(nlohmann::json(7))) == 7);
    REQUIRE(std::get<double>(*parse_setting_value(nlohmann::json(0.25))) == 0.25);
    REQUIRE(std::get<std::string>(*parse_setting_value(nlohmann::json("Cube"))) == "Cube");

    const auto names = parse_setting_value(nlohmann::json::parse(R"(["Red", "Blue"])"));
    REQUIRE(std::get<std::vector<std::string>>(*names) == std::vector<std::string>{"Red", "Blue"});

    const auto numbers = parse_setting_value(nlohmann::json::parse("[1, 2.5, 3]"));
    REQUIRE(std::get<std::vector<double>>(*numbers) == std::vector<double>{1.0, 2.5, 3.0});

    REQUIRE(parse_setting_value(nlohmann::json::parse(R"(["Red", 1])")).is_err());
    REQUIRE(parse_setting_value(nlohmann::json::parse(R"({ "nested": 1 })")).is_err());
    REQUIRE(parse_setting_value(nlohmann::json(nullptr)).is_err());
}

// =============================================================================
// GraphDescription
// =============================================================================

TEST_CASE("Graph description parsing", "[template][config]") {
    auto description = graph_description_from_string(kCrowdGraph);
    REQUIRE(description.is_ok());
    REQUIRE(description->nodes.size() == 3);

    const auto& agent = description->nodes[1];
    REQUIRE(agent.id == "agent");
    REQUIRE(agent.type == "TemplateNodeType");
    REQUIRE(agent.settings.get_string("brainType") == "walker");
    REQUIRE(agent.inputs.size() == 1);
    REQUIRE(agent.inputs[0].first == "Objects");
    REQUIRE(agent.inputs[0].second == "geo");

    const auto& line = description->nodes[2];
    REQUIRE(line.settings.get_int("noToPlace") == 4);
    REQUIRE(line.settings.get_float("ArrayColumnMargin") == 1.5);
    REQUIRE(line.inputs[0].first == "Template");
}

TEST_CASE("Input objects keep written slot order", "[template][config]") {
    auto description = graph_description_from_string(R"({
        "nodes": [ { "id": "all", "type": "CombineNodeType",
                     "inputs": { "Object 2": "b", "Object 1": "a", "Object 10": "c" } } ]
    })");
    REQUIRE(description.is_ok());

    const auto& inputs = description->nodes[0].inputs;
    REQUIRE(inputs.size() == 3);
    REQUIRE(inputs[0] == std::pair<std::string, std::string>{"Object 2", "b"});
    REQUIRE(inputs[1] == std::pair<std::string, std::string>{"Object 1", "a"});
    REQUIRE(inputs[2] == std::pair<std::string, std::string>{"Object 10", "c"});
}

TEST_CASE("Combine from JSON evaluates inputs as written", "[template][config]") {
    auto description = graph_description_from_string(R"({
        "nodes": [
            { "id": "geo", "type": "ObjectInputNodeType", "settings": { "inputObject": "Cube" } },
            { "id": "b", "type": "TemplateNodeType", "settings": { "brainType": "second" },
              "inputs": { "Objects": "geo" } },
            { "id": "a", "type": "TemplateNodeType", "settings": { "brainType": "first" },
              "inputs": { "Objects": "geo" } },
            { "id": "all", "type": "CombineNodeType", "inputs": { "Z": "b", "A": "a" } }
        ]
    })");
    REQUIRE(description.is_ok());

    Harness h;
    REQUIRE(h.run(*description, "all").is_ok());
    REQUIRE(h.scene.agents().size() == 2);
    REQUIRE(h.scene.agents()[0].brain_type == "second");
    REQUIRE(h.scene.agents()[1].brain_type == "first");
}

TEST_CASE("Parsed graph builds", "[template][config]") {
    auto description = graph_description_from_string(kCrowdGraph);
    REQUIRE(description.is_ok());

    Harness h;
    auto result = h.run(*description, "line");
    REQUIRE(result.is_ok());
    REQUIRE(result->agents_registered == 4);
}

TEST_CASE("Graph description errors", "[template][config]") {
    SECTION("missing nodes array") {
        auto description = graph_description_from_string(R"({ "graph": [] })");
        REQUIRE(description.is_err());
        REQUIRE(description.error().code() == ErrorCode::ParseError);
    }

    SECTION("node without type") {
        REQUIRE(graph_description_from_string(R"({ "nodes": [ { "id": "a" } ] })").is_err());
    }

    SECTION("bad setting names the node") {
        auto description = graph_description_from_string(
            R"({ "nodes": [ { "id": "a", "type": "SetTagNodeType", "settings": { "tagValue": null } } ] })");
        REQUIRE(description.is_err());
        const auto* node_id = description.error().get_context("node");
        REQUIRE(node_id != nullptr);
        REQUIRE(*node_id == "a");
        REQUIRE(*description.error().get_context("setting") == "tagValue");
    }

    SECTION("malformed input entry") {
        REQUIRE(graph_description_from_string(
            R"({ "nodes": [ { "id": "a", "type": "SetTagNodeType", "inputs": [ ["Template", "b"] ] } ] })").is_err());
    }
}

TEST_CASE("Graph description from file", "[template][config]") {
    const auto path = write_temp("crowd_engine_graph_test.json", kCrowdGraph);
    auto description = load_graph_description(path);
    std::filesystem::remove(path);

    REQUIRE(description.is_ok());
    REQUIRE(description->nodes.size() == 3);

    REQUIRE(load_graph_description("/nonexistent/graph.json").error().code() == ErrorCode::IOError);
}
