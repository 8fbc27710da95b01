/// @file config.cpp
/// @brief Engine configuration and graph description loading

#include <crowd_engine/template/config.hpp>

#include <fstream>
#include <sstream>

namespace crowd_template {

using crowd_core::Err;
using crowd_core::Error;
using crowd_core::ErrorCode;
using crowd_core::Ok;
using crowd_core::Result;

namespace {

Error parse_error(const std::string& message) {
    return Error(ErrorCode::ParseError, message);
}

template<typename Json>
Result<Json> parse_json(const std::string& json_str, const std::string& source) {
    try {
        return Ok(Json::parse(json_str));
    } catch (const nlohmann::json::parse_error& e) {
        return Err<Json>(parse_error("JSON parse error in " + source + ": " + e.what()));
    }
}

Result<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<std::string>(Error(ErrorCode::IOError, "Failed to open file: " + path.string()));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return Ok(buffer.str());
}

} // namespace

// =============================================================================
// EngineConfig
// =============================================================================

crowd_core::LogConfig EngineConfig::log_config() const {
    crowd_core::LogConfig config;
    config.file_enabled = log_to_file;
    config.log_directory = log_directory;
    config.level = crowd_core::parse_log_level(log_level).value_or(spdlog::level::info);
    return config;
}

RandomSource EngineConfig::make_random_source() const {
    return random_seed ? RandomSource(*random_seed) : RandomSource();
}

Result<EngineConfig> parse_engine_config(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<EngineConfig>(parse_error("Engine config must be a JSON object"));
    }

    EngineConfig config;

    if (j.contains("log_level")) {
        if (!j["log_level"].is_string()) {
            return Err<EngineConfig>(parse_error("'log_level' must be a string"));
        }
        config.log_level = j["log_level"].get<std::string>();
        if (!crowd_core::parse_log_level(config.log_level)) {
            return Err<EngineConfig>(parse_error("Unknown log level: " + config.log_level));
        }
    }
    if (j.contains("log_to_file") && j["log_to_file"].is_boolean()) {
        config.log_to_file = j["log_to_file"].get<bool>();
    }
    if (j.contains("log_directory") && j["log_directory"].is_string()) {
        config.log_directory = j["log_directory"].get<std::string>();
    }
    if (j.contains("random_seed") && !j["random_seed"].is_null()) {
        if (!j["random_seed"].is_number_unsigned()) {
            return Err<EngineConfig>(parse_error("'random_seed' must be a non-negative integer"));
        }
        config.random_seed = j["random_seed"].get<std::uint64_t>();
    }
    if (j.contains("eager_spatial_indices") && j["eager_spatial_indices"].is_boolean()) {
        config.eager_spatial_indices = j["eager_spatial_indices"].get<bool>();
    }

    return Ok(std::move(config));
}

Result<EngineConfig> engine_config_from_string(const std::string& json_str) {
    auto j = parse_json<nlohmann::json>(json_str, "engine config");
    if (!j) {
        return j.error();
    }
    return parse_engine_config(*j);
}

Result<EngineConfig> load_engine_config(const std::filesystem::path& path) {
    auto text = read_file(path);
    if (!text) {
        return text.error();
    }
    auto j = parse_json<nlohmann::json>(*text, path.string());
    if (!j) {
        return j.error();
    }
    return parse_engine_config(*j);
}

ValidationReport prepare_graph(TemplateGraph& graph, const ISceneBackend& backend, const EngineConfig& config) {
    ValidationReport report = graph.validate(backend);
    if (report.ok() && config.eager_spatial_indices) {
        graph.prepare_indices(backend);
    }
    return report;
}

// =============================================================================
// GraphDescription
// =============================================================================

namespace {

template<typename Json>
Result<SettingValue> setting_value_from(const Json& j) {
    if (j.is_boolean()) {
        return Ok<SettingValue>(j.template get<bool>());
    }
    if (j.is_number_integer()) {
        return Ok<SettingValue>(j.template get<std::int64_t>());
    }
    if (j.is_number_float()) {
        return Ok<SettingValue>(j.template get<double>());
    }
    if (j.is_string()) {
        return Ok<SettingValue>(j.template get<std::string>());
    }
    if (j.is_array()) {
        if (!j.empty() && j.front().is_string()) {
            std::vector<std::string> values;
            for (const auto& item : j) {
                if (!item.is_string()) {
                    return Err<SettingValue>(parse_error("Setting array mixes strings and other values"));
                }
                values.push_back(item.template get<std::string>());
            }
            return Ok<SettingValue>(std::move(values));
        }
        std::vector<double> values;
        for (const auto& item : j) {
            if (!item.is_number()) {
                return Err<SettingValue>(parse_error("Setting array mixes numbers and other values"));
            }
            values.push_back(item.template get<double>());
        }
        return Ok<SettingValue>(std::move(values));
    }
    return Err<SettingValue>(parse_error("Unsupported setting value: " + j.dump()));
}

} // namespace

Result<SettingValue> parse_setting_value(const nlohmann::json& j) {
    return setting_value_from(j);
}

Result<SettingValue> parse_setting_value(const nlohmann::ordered_json& j) {
    return setting_value_from(j);
}

Result<GraphDescription> parse_graph_description(const nlohmann::ordered_json& j) {
    if (!j.is_object() || !j.contains("nodes") || !j["nodes"].is_array()) {
        return Err<GraphDescription>(parse_error("Graph description needs a 'nodes' array"));
    }

    GraphDescription graph;
    for (const auto& node_json : j["nodes"]) {
        if (!node_json.is_object()) {
            return Err<GraphDescription>(parse_error("Graph node must be a JSON object"));
        }
        if (!node_json.contains("id") || !node_json["id"].is_string()) {
            return Err<GraphDescription>(parse_error("Graph node is missing 'id'"));
        }
        if (!node_json.contains("type") || !node_json["type"].is_string()) {
            return Err<GraphDescription>(parse_error(
                "Graph node '" + node_json["id"].get<std::string>() + "' is missing 'type'"));
        }

        NodeDescription node;
        node.id = node_json["id"].get<std::string>();
        node.type = node_json["type"].get<std::string>();

        if (node_json.contains("settings")) {
            const auto& settings = node_json["settings"];
            if (!settings.is_object()) {
                return Err<GraphDescription>(parse_error("Settings of '" + node.id + "' must be an object"));
            }
            for (const auto& [key, value] : settings.items()) {
                auto parsed = parse_setting_value(value);
                if (!parsed) {
                    Error error = parsed.error();
                    error.with_context("node", node.id).with_context("setting", key);
                    return error;
                }
                node.settings.set(key, std::move(*parsed));
            }
        }

        if (node_json.contains("inputs")) {
            const auto& inputs = node_json["inputs"];
            if (inputs.is_array()) {
                for (const auto& in : inputs) {
                    if (!in.is_object() || !in.contains("slot") || !in.contains("node") ||
                        !in["slot"].is_string() || !in["node"].is_string()) {
                        return Err<GraphDescription>(parse_error(
                            "Inputs of '" + node.id + "' need 'slot' and 'node' strings"));
                    }
                    node.inputs.emplace_back(in["slot"].get<std::string>(), in["node"].get<std::string>());
                }
            } else if (inputs.is_object()) {
                for (const auto& [slot, target] : inputs.items()) {
                    if (!target.is_string()) {
                        return Err<GraphDescription>(parse_error(
                            "Input '" + slot + "' of '" + node.id + "' must name a node"));
                    }
                    node.inputs.emplace_back(slot, target.get<std::string>());
                }
            } else {
                return Err<GraphDescription>(parse_error("Inputs of '" + node.id + "' must be an array or object"));
            }
        }

        graph.nodes.push_back(std::move(node));
    }

    return Ok(std::move(graph));
}

Result<GraphDescription> graph_description_from_string(const std::string& json_str) {
    auto j = parse_json<nlohmann::ordered_json>(json_str, "graph description");
    if (!j) {
        return j.error();
    }
    return parse_graph_description(*j);
}

Result<GraphDescription> load_graph_description(const std::filesystem::path& path) {
    auto text = read_file(path);
    if (!text) {
        return text.error();
    }
    auto j = parse_json<nlohmann::ordered_json>(*text, path.string());
    if (!j) {
        return j.error();
    }
    return parse_graph_description(*j);
}

} // namespace crowd_template
