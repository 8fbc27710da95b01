#pragma once

/// @file spatial.hpp
/// @brief Main include header for crowd_spatial

#include "fwd.hpp"
#include "kd_tree.hpp"
#include "bvh.hpp"
#include "octree.hpp"
#include "relax.hpp"
