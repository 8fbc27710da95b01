#pragma once

/// @file settings.hpp
/// @brief Typed node settings

#include "fwd.hpp"
#include <crowd_engine/math/types.hpp>

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace crowd_template {

/// A single setting value
using SettingValue = std::variant<
    bool,
    std::int64_t,
    double,
    std::string,
    std::vector<std::string>,
    std::vector<double>
>;

/// @brief Named setting values of a node
///
/// Getters fall back to the supplied default when a key is missing or holds
/// an incompatible type. Integers and doubles convert to each other.
class Settings {
public:
    Settings() = default;
    Settings(std::initializer_list<std::pair<const std::string, SettingValue>> values)
        : m_values(values) {}

    void set(const std::string& key, SettingValue value) { m_values[key] = std::move(value); }

    [[nodiscard]] bool contains(const std::string& key) const { return m_values.count(key) > 0; }
    [[nodiscard]] std::optional<SettingValue> get(const std::string& key) const;

    [[nodiscard]] bool get_bool(const std::string& key, bool default_value = false) const;
    [[nodiscard]] std::int64_t get_int(const std::string& key, std::int64_t default_value = 0) const;
    [[nodiscard]] double get_float(const std::string& key, double default_value = 0.0) const;
    [[nodiscard]] std::string get_string(const std::string& key, const std::string& default_value = "") const;
    [[nodiscard]] std::vector<std::string> get_string_array(
        const std::string& key, const std::vector<std::string>& default_value = {}) const;
    [[nodiscard]] std::vector<double> get_float_array(
        const std::string& key, const std::vector<double>& default_value = {}) const;

    /// 3-element float array as a vector; missing components are taken from the default
    [[nodiscard]] crowd_math::Vec3 get_vec3(const std::string& key,
                                            const crowd_math::Vec3& default_value = crowd_math::Vec3(0.0f)) const;

    [[nodiscard]] std::size_t size() const { return m_values.size(); }
    [[nodiscard]] const std::map<std::string, SettingValue>& values() const { return m_values; }

private:
    std::map<std::string, SettingValue> m_values;
};

} // namespace crowd_template
