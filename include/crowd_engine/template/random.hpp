#pragma once

/// @file random.hpp
/// @brief Injected random stream shared by every node of a build

#include "fwd.hpp"

#include <cstddef>
#include <cstdint>
#include <random>

namespace crowd_template {

/// @brief Random source passed through the evaluation context
class RandomSource {
public:
    /// Seeded from std::random_device
    RandomSource();
    explicit RandomSource(std::uint64_t seed);

    void seed(std::uint64_t value);

    /// Uniform in [0, 1)
    [[nodiscard]] double random();

    /// Uniform in [min, max]; arguments may be given in either order
    [[nodiscard]] double uniform(double min, double max);

    /// Uniform index in [0, count); count must be non-zero
    [[nodiscard]] std::size_t index(std::size_t count);

private:
    std::mt19937_64 m_engine;
};

} // namespace crowd_template
