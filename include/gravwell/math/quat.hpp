#pragma once

/// @file quat.hpp
/// @brief Quaternion utility functions for gravwell_math

#include "types.hpp"
#include "vec.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace gravwell_math {

// =============================================================================
// Quaternion Creation Functions
// =============================================================================

/// Create quaternion from axis and angle
/// @param axis Rotation axis (must be normalized)
/// @param angle Angle in radians
[[nodiscard]] inline Quat quat_from_axis_angle(const Vec3& axis, float angle) noexcept {
    return glm::angleAxis(angle, axis);
}

[[nodiscard]] inline Quat quat_from_mat3(const Mat3& m) noexcept {
    return glm::quat_cast(m);
}

/// Minimal rotation taking one direction to another
/// @param from Source direction (must be normalized)
/// @param to Target direction (must be normalized)
/// @return Identity for parallel inputs, a half turn about a perpendicular axis for opposite ones
[[nodiscard]] inline Quat quat_from_rotation_arc(const Vec3& from, const Vec3& to) noexcept {
    float d = glm::dot(from, to);

    if (d >= 1.0f - consts::EPSILON) {
        return quat::IDENTITY;
    }

    if (d <= -1.0f + consts::EPSILON) {
        Vec3 axis = glm::cross(vec3::X, from);
        if (glm::length2(axis) < consts::EPSILON_LOOSE) {
            axis = glm::cross(vec3::Y, from);
        }
        return glm::angleAxis(consts::PI, glm::normalize(axis));
    }

    Vec3 axis = glm::cross(from, to);
    float s = std::sqrt((1.0f + d) * 2.0f);
    float inv_s = 1.0f / s;

    return Quat(s * 0.5f, axis.x * inv_s, axis.y * inv_s, axis.z * inv_s);
}

/// Rotation whose local +Y maps to `up` and local -Z maps to `forward`
/// @param up Unit up direction
/// @param forward Unit direction perpendicular to `up`
[[nodiscard]] inline Quat quat_from_up_forward(const Vec3& up, const Vec3& forward) noexcept {
    Vec3 right = glm::normalize(glm::cross(forward, up));
    Vec3 back = glm::cross(right, up);
    return glm::normalize(glm::quat_cast(Mat3(right, up, back)));
}

// =============================================================================
// Quaternion Operations
// =============================================================================

/// Normalize quaternion, returning identity if length is too small or not finite
[[nodiscard]] inline Quat normalize_or_identity(const Quat& q) noexcept {
    float len_sq = glm::length2(q);
    if (!(len_sq >= consts::EPSILON * consts::EPSILON) || !std::isfinite(len_sq)) {
        return quat::IDENTITY;
    }
    return q * (1.0f / std::sqrt(len_sq));
}

[[nodiscard]] inline bool is_finite(const Quat& q) noexcept {
    return std::isfinite(q.w) && std::isfinite(q.x) && std::isfinite(q.y) && std::isfinite(q.z);
}

[[nodiscard]] inline Quat inverse(const Quat& q) noexcept {
    return glm::inverse(q);
}

/// Spherical linear interpolation along the shortest arc
/// @param t Interpolation factor [0, 1]
[[nodiscard]] inline Quat slerp(const Quat& a, const Quat& b, float t) noexcept {
    return glm::slerp(a, b, t);
}

[[nodiscard]] inline Vec3 rotate(const Quat& q, const Vec3& v) noexcept {
    return q * v;
}

/// Convert quaternion to axis-angle representation
/// @return Pair of (axis, angle) where angle is in radians
[[nodiscard]] inline std::pair<Vec3, float> to_axis_angle(const Quat& q) noexcept {
    Quat normalized = glm::normalize(q);
    if (normalized.w < 0.0f) {
        normalized = -normalized;
    }
    float angle = 2.0f * std::acos(std::clamp(normalized.w, -1.0f, 1.0f));

    float s = std::sqrt(std::max(0.0f, 1.0f - normalized.w * normalized.w));
    Vec3 axis;

    if (s < consts::EPSILON) {
        axis = vec3::X;
    } else {
        axis = Vec3(normalized.x, normalized.y, normalized.z) / s;
    }

    return {axis, angle};
}

[[nodiscard]] inline Mat3 quat_to_mat3(const Quat& q) noexcept {
    return glm::mat3_cast(q);
}

/// Check if two quaternions represent approximately the same rotation
[[nodiscard]] inline bool approx_equal(const Quat& a, const Quat& b,
                                        float epsilon = consts::EPSILON) noexcept {
    return std::abs(glm::dot(a, b)) > 1.0f - epsilon;
}

/// Angle between two rotations in radians
[[nodiscard]] inline float angle_between(const Quat& a, const Quat& b) noexcept {
    float d = std::abs(glm::dot(a, b));
    return 2.0f * std::acos(std::clamp(d, 0.0f, 1.0f));
}

} // namespace gravwell_math
