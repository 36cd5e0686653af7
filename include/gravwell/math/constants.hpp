#pragma once

/// @file constants.hpp
/// @brief Mathematical constants for gravwell_math

#include <cmath>
#include <limits>

namespace gravwell_math {

namespace consts {

inline constexpr float PI = 3.14159265358979323846f;

inline constexpr float FRAC_PI_2 = 1.57079632679489661923f;

inline constexpr float DEG_TO_RAD = PI / 180.0f;

inline constexpr float RAD_TO_DEG = 180.0f / PI;

/// Small epsilon for floating point comparisons
inline constexpr float EPSILON = 1e-6f;

/// Larger epsilon for less precise comparisons
inline constexpr float EPSILON_LOOSE = 1e-4f;

inline constexpr float MAX_FLOAT = std::numeric_limits<float>::max();

inline constexpr float INFINITY_F = std::numeric_limits<float>::infinity();

} // namespace consts

} // namespace gravwell_math
