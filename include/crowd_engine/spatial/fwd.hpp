#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for crowd_spatial module

namespace crowd_spatial {

struct KdItem;
struct KdNeighbor;
class KdTree;

struct RayHit;
struct NearestHit;
class TriangleBvh;

struct BoundingVolume;
class VolumeOctree;

} // namespace crowd_spatial
