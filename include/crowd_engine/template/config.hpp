#pragma once

/// @file config.hpp
/// @brief Engine configuration and graph description loading

#include "graph.hpp"
#include "random.hpp"
#include <crowd_engine/core/log.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace crowd_template {

// =============================================================================
// EngineConfig
// =============================================================================

/// @brief Host-level settings
///
/// Example:
/// @code
/// { "log_level": "debug", "log_to_file": true, "log_directory": "logs",
///   "random_seed": 42, "eager_spatial_indices": true }
/// @endcode
struct EngineConfig {
    std::string log_level = "info";
    bool log_to_file = false;
    std::string log_directory = "logs";
    std::optional<std::uint64_t> random_seed;  ///< Absent: seeded from std::random_device
    bool eager_spatial_indices = false;         ///< Build node indices right after validation

    [[nodiscard]] crowd_core::LogConfig log_config() const;
    [[nodiscard]] RandomSource make_random_source() const;
};

[[nodiscard]] crowd_core::Result<EngineConfig> parse_engine_config(const nlohmann::json& j);
[[nodiscard]] crowd_core::Result<EngineConfig> engine_config_from_string(const std::string& json_str);
[[nodiscard]] crowd_core::Result<EngineConfig> load_engine_config(const std::filesystem::path& path);

/// Validate graph, then build node indices when the config asks for eager indices and the graph is clean
ValidationReport prepare_graph(TemplateGraph& graph, const ISceneBackend& backend, const EngineConfig& config);

// =============================================================================
// GraphDescription
// =============================================================================

/// @brief Parse a graph description
///
/// @code
/// { "nodes": [
///     { "id": "geo", "type": "ObjectInputNodeType", "settings": { "inputObject": "Cube" } },
///     { "id": "agent", "type": "TemplateNodeType",
///       "settings": { "brainType": "walker" },
///       "inputs": [ { "slot": "Objects", "node": "geo" } ] } ] }
/// @endcode
///
/// Inputs may also be an object of slot -> node id; slots keep the order in
/// which they are written. Setting arrays must hold only strings or only numbers.
[[nodiscard]] crowd_core::Result<GraphDescription> parse_graph_description(const nlohmann::ordered_json& j);
[[nodiscard]] crowd_core::Result<GraphDescription> graph_description_from_string(const std::string& json_str);
[[nodiscard]] crowd_core::Result<GraphDescription> load_graph_description(const std::filesystem::path& path);

/// @brief Convert one JSON setting value
[[nodiscard]] crowd_core::Result<SettingValue> parse_setting_value(const nlohmann::json& j);
[[nodiscard]] crowd_core::Result<SettingValue> parse_setting_value(const nlohmann::ordered_json& j);

} // namespace crowd_template
