#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for crowd_math types

#include <glm/fwd.hpp>

namespace crowd_math {

// =============================================================================
// Vector / Matrix / Quaternion Types (GLM aliases)
// =============================================================================
using Vec2 = glm::vec2;
using Vec3 = glm::vec3;
using Vec4 = glm::vec4;

using Mat3 = glm::mat3;
using Mat4 = glm::mat4;

using Quat = glm::quat;

// =============================================================================
// Forward Declarations
// =============================================================================
struct Transform;
struct AABB;
struct Sphere;
struct Ray;
struct TriangleHit;

} // namespace crowd_math
