#pragma once

/// @file vec.hpp
/// @brief Vector utility functions for gravwell_math

#include "types.hpp"
#include <algorithm>
#include <cmath>

namespace gravwell_math {

// =============================================================================
// Core Vector Operations (GLM wrappers)
// =============================================================================

[[nodiscard]] inline float dot(const Vec3& a, const Vec3& b) noexcept {
    return glm::dot(a, b);
}

[[nodiscard]] inline Vec3 cross(const Vec3& a, const Vec3& b) noexcept {
    return glm::cross(a, b);
}

[[nodiscard]] inline float length(const Vec3& v) noexcept {
    return glm::length(v);
}

[[nodiscard]] inline float length_squared(const Vec3& v) noexcept {
    return glm::length2(v);
}

[[nodiscard]] inline float distance(const Vec3& a, const Vec3& b) noexcept {
    return glm::distance(a, b);
}

[[nodiscard]] inline float distance_squared(const Vec3& a, const Vec3& b) noexcept {
    return glm::length2(b - a);
}

// =============================================================================
// Vec3 Utilities
// =============================================================================

/// Normalize vector, returning zero if length is too small
[[nodiscard]] inline Vec3 normalize_or_zero(const Vec3& v) noexcept {
    const float len_sq = glm::length2(v);
    if (len_sq < consts::EPSILON * consts::EPSILON) {
        return vec3::ZERO;
    }
    return v * (1.0f / std::sqrt(len_sq));
}

/// Normalize vector, returning `fallback` if length is too small or not finite
[[nodiscard]] inline Vec3 normalize_or(const Vec3& v, const Vec3& fallback) noexcept {
    const float len_sq = glm::length2(v);
    if (!(len_sq >= consts::EPSILON * consts::EPSILON) || !std::isfinite(len_sq)) {
        return fallback;
    }
    return v * (1.0f / std::sqrt(len_sq));
}

/// Project vector onto another vector
[[nodiscard]] inline Vec3 project(const Vec3& v, const Vec3& onto) noexcept {
    const float len_sq = glm::length2(onto);
    if (len_sq < consts::EPSILON * consts::EPSILON) {
        return vec3::ZERO;
    }
    return onto * (glm::dot(v, onto) / len_sq);
}

/// Component of `v` perpendicular to the unit vector `n`
[[nodiscard]] inline Vec3 reject(const Vec3& v, const Vec3& n) noexcept {
    return v - n * glm::dot(v, n);
}

/// Scale `v` down so its length does not exceed `max_length`
/// @return true if `v` was shortened
inline bool clamp_length(Vec3& v, float max_length) noexcept {
    const float len_sq = glm::length2(v);
    if (len_sq <= max_length * max_length) {
        return false;
    }
    v *= max_length / std::sqrt(len_sq);
    return true;
}

[[nodiscard]] inline Vec3 abs(const Vec3& v) noexcept {
    return glm::abs(v);
}

/// Check if vector has any NaN or infinite components
[[nodiscard]] inline bool is_finite(const Vec3& v) noexcept {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

[[nodiscard]] inline float max_component(const Vec3& v) noexcept {
    return std::max({v.x, v.y, v.z});
}

[[nodiscard]] inline float min_component(const Vec3& v) noexcept {
    return std::min({v.x, v.y, v.z});
}

/// Check if two vectors are approximately equal
[[nodiscard]] inline bool approx_equal(const Vec3& a, const Vec3& b,
                                        float epsilon = consts::EPSILON) noexcept {
    return glm::all(glm::lessThan(glm::abs(a - b), Vec3(epsilon)));
}

} // namespace gravwell_math
