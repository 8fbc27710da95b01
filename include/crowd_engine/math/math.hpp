#pragma once

/// @file math.hpp
/// @brief Main include header for crowd_math

#include "fwd.hpp"
#include "types.hpp"
#include "rotation.hpp"
#include "transform.hpp"
#include "bounds.hpp"
#include "ray.hpp"
#include "intersect.hpp"
