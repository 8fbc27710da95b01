/// @file random.cpp
/// @brief RandomSource implementation

#include <crowd_engine/template/random.hpp>

#include <algorithm>
#include <cmath>

namespace crowd_template {

RandomSource::RandomSource()
    : m_engine(std::random_device{}()) {}

RandomSource::RandomSource(std::uint64_t seed)
    : m_engine(seed) {}

void RandomSource::seed(std::uint64_t value) {
    m_engine.seed(value);
}

double RandomSource::random() {
    const double value = std::uniform_real_distribution<double>(0.0, 1.0)(m_engine);
    // generate_canonical may round up to 1.0
    return value < 1.0 ? value : std::nextafter(1.0, 0.0);
}

double RandomSource::uniform(double min, double max) {
    if (min > max) std::swap(min, max);
    if (min == max) return min;
    return min + (max - min) * random();
}

std::size_t RandomSource::index(std::size_t count) {
    return std::uniform_int_distribution<std::size_t>(0, count - 1)(m_engine);
}

} // namespace crowd_template
