/// @file settings.cpp
/// @brief Settings implementation

#include <crowd_engine/template/settings.hpp>

namespace crowd_template {

const char* node_family_name(NodeFamily family) {
    switch (family) {
        case NodeFamily::Placement: return "Placement";
        case NodeFamily::Geometry: return "Geometry";
    }
    return "Unknown";
}

const char* drop_reason_name(DropReason reason) {
    switch (reason) {
        case DropReason::Obstacle: return "obstacle";
        case DropReason::GroundMiss: return "ground_miss";
        case DropReason::FrozenGroup: return "frozen_group";
    }
    return "unknown";
}

std::optional<SettingValue> Settings::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it == m_values.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Settings::get_bool(const std::string& key, bool default_value) const {
    auto it = m_values.find(key);
    if (it == m_values.end()) return default_value;
    if (auto* v = std::get_if<bool>(&it->second)) return *v;
    if (auto* v = std::get_if<std::int64_t>(&it->second)) return *v != 0;
    return default_value;
}

std::int64_t Settings::get_int(const std::string& key, std::int64_t default_value) const {
    auto it = m_values.find(key);
    if (it == m_values.end()) return default_value;
    if (auto* v = std::get_if<std::int64_t>(&it->second)) return *v;
    if (auto* v = std::get_if<double>(&it->second)) return static_cast<std::int64_t>(*v);
    return default_value;
}

double Settings::get_float(const std::string& key, double default_value) const {
    auto it = m_values.find(key);
    if (it == m_values.end()) return default_value;
    if (auto* v = std::get_if<double>(&it->second)) return *v;
    if (auto* v = std::get_if<std::int64_t>(&it->second)) return static_cast<double>(*v);
    return default_value;
}

std::string Settings::get_string(const std::string& key, const std::string& default_value) const {
    auto it = m_values.find(key);
    if (it == m_values.end()) return default_value;
    if (auto* v = std::get_if<std::string>(&it->second)) return *v;
    return default_value;
}

std::vector<std::string> Settings::get_string_array(
    const std::string& key, const std::vector<std::string>& default_value) const {
    auto it = m_values.find(key);
    if (it == m_values.end()) return default_value;
    if (auto* v = std::get_if<std::vector<std::string>>(&it->second)) return *v;
    return default_value;
}

std::vector<double> Settings::get_float_array(
    const std::string& key, const std::vector<double>& default_value) const {
    auto it = m_values.find(key);
    if (it == m_values.end()) return default_value;
    if (auto* v = std::get_if<std::vector<double>>(&it->second)) return *v;
    return default_value;
}

crowd_math::Vec3 Settings::get_vec3(const std::string& key, const crowd_math::Vec3& default_value) const {
    auto values = get_float_array(key);
    crowd_math::Vec3 result = default_value;
    for (std::size_t i = 0; i < values.size() && i < 3; ++i) {
        result[static_cast<int>(i)] = static_cast<float>(values[i]);
    }
    return result;
}

} // namespace crowd_template
