#pragma once

/// @file types.hpp
/// @brief Core type definitions for gravwell_math

#define GLM_FORCE_RADIANS
#define GLM_ENABLE_EXPERIMENTAL

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtx/quaternion.hpp>
#include <glm/gtx/norm.hpp>

#include "fwd.hpp"
#include "constants.hpp"

namespace gravwell_math {

// =============================================================================
// Vector Constants
// =============================================================================

namespace vec3 {
    inline constexpr Vec3 ZERO  = Vec3(0.0f, 0.0f, 0.0f);
    inline constexpr Vec3 ONE   = Vec3(1.0f, 1.0f, 1.0f);
    inline constexpr Vec3 X     = Vec3(1.0f, 0.0f, 0.0f);
    inline constexpr Vec3 Y     = Vec3(0.0f, 1.0f, 0.0f);
    inline constexpr Vec3 Z     = Vec3(0.0f, 0.0f, 1.0f);
    inline constexpr Vec3 NEG_Z = Vec3(0.0f, 0.0f, -1.0f);

    // Local-space directions of every body
    inline constexpr Vec3 UP      = Y;
    inline constexpr Vec3 RIGHT   = X;
    inline constexpr Vec3 FORWARD = NEG_Z;
}

// =============================================================================
// Matrix Constants
// =============================================================================

namespace mat3 {
    inline const Mat3 IDENTITY = Mat3(1.0f);
}

// =============================================================================
// Quaternion Constants
// =============================================================================

namespace quat {
    inline const Quat IDENTITY = Quat(1.0f, 0.0f, 0.0f, 0.0f); // w, x, y, z
}

} // namespace gravwell_math
