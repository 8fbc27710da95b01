#pragma once

/// @file template.hpp
/// @brief Main include header for crowd_template

#include "fwd.hpp"
#include "types.hpp"
#include "settings.hpp"
#include "random.hpp"
#include "backend.hpp"
#include "memory_scene.hpp"
#include "context.hpp"
#include "node.hpp"
#include "nodes/geometry_nodes.hpp"
#include "nodes/flow_nodes.hpp"
#include "nodes/transform_nodes.hpp"
#include "nodes/positioning_nodes.hpp"
#include "nodes/filter_nodes.hpp"
#include "registry.hpp"
#include "graph.hpp"
#include "config.hpp"
