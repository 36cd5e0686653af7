#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for gravwell_math types

#include <glm/fwd.hpp>

namespace gravwell_math {

// =============================================================================
// GLM Aliases
// =============================================================================
using Vec3 = glm::vec3;
using Vec4 = glm::vec4;
using Mat3 = glm::mat3;
using Quat = glm::quat;

// =============================================================================
// Forward Declarations (gravwell_math types)
// =============================================================================
struct Transform;
struct LocalBox;
struct OrientedBox;
struct BoxIntersection;

} // namespace gravwell_math
