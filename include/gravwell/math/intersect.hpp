#pragma once

/// @file intersect.hpp
/// @brief Separating-axis intersection test between oriented boxes

#include "types.hpp"
#include "vec.hpp"
#include "obb.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>

namespace gravwell_math {

// =============================================================================
// BoxIntersection
// =============================================================================

/// Result of a box-vs-box test
struct BoxIntersection {
    bool intersects = false;
    Vec3 normal = vec3::UP;     ///< Separating axis (b toward a), or struck face normal of b when intersecting
    Vec3 point = vec3::ZERO;    ///< Approximate contact point
    float separation = 0.0f;    ///< Gap when separated, minus the least overlap when intersecting

    [[nodiscard]] float penetration() const noexcept {
        return intersects ? -separation : 0.0f;
    }

    explicit operator bool() const noexcept { return intersects; }
};

namespace detail {

/// Cross products shorter than this are treated as parallel edges and skipped
inline constexpr float SAT_AXIS_EPSILON = 1e-6f;

/// Midpoint of the closest corner / closest-point pair across both boxes
[[nodiscard]] inline Vec3 closest_corner_midpoint(const OrientedBox& a, const OrientedBox& b) noexcept {
    float best = consts::MAX_FLOAT;
    Vec3 midpoint = (a.center + b.center) * 0.5f;

    auto scan = [&](const OrientedBox& from, const OrientedBox& onto) {
        for (const Vec3& corner : from.corners()) {
            const Vec3 cp = onto.closest_point(corner);
            const float d = distance_squared(corner, cp);
            if (d < best) {
                best = d;
                midpoint = (corner + cp) * 0.5f;
            }
        }
    };

    scan(a, b);
    scan(b, a);
    return midpoint;
}

/// Face normal of `box` nearest `point`: the local axis with the largest
/// coordinate / half-extent ratio, signed toward the point
[[nodiscard]] inline Vec3 nearest_face_normal(const OrientedBox& box, const Vec3& point) noexcept {
    const Vec3 local = box.to_local(point);
    int best_axis = 0;
    float best_ratio = -1.0f;
    for (int i = 0; i < 3; ++i) {
        const float ratio = std::abs(local[i]) / box.half_extents[i];
        if (ratio > best_ratio) {
            best_ratio = ratio;
            best_axis = i;
        }
    }
    return local[best_axis] >= 0.0f ? box.axis(best_axis) : -box.axis(best_axis);
}

} // namespace detail

// =============================================================================
// OBB vs OBB
// =============================================================================

/// Separating-axis test over the 15 candidate axes of two boxes.
/// `b` is treated as the struck box. Degenerate boxes are replaced by unit boxes.
[[nodiscard]] inline BoxIntersection intersect(const OrientedBox& a_in, const OrientedBox& b_in) noexcept {
    const OrientedBox a = a_in.sanitized();
    const OrientedBox b = b_in.sanitized();

    std::array<Vec3, 15> axes;
    std::size_t count = 0;
    for (int i = 0; i < 3; ++i) {
        axes[count++] = a.axis(i);
    }
    for (int i = 0; i < 3; ++i) {
        axes[count++] = b.axis(i);
    }
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            const Vec3 c = glm::cross(a.axis(i), b.axis(j));
            if (glm::length2(c) > detail::SAT_AXIS_EPSILON) {
                axes[count++] = glm::normalize(c);
            }
        }
    }

    const Vec3 offset = a.center - b.center;
    BoxIntersection result;
    float least_overlap = -consts::MAX_FLOAT;

    for (std::size_t k = 0; k < count; ++k) {
        const Vec3& axis = axes[k];
        const float dist = glm::dot(offset, axis);
        const float sep = std::abs(dist) - (a.projected_radius(axis) + b.projected_radius(axis));

        if (sep > 0.0f) {
            result.intersects = false;
            result.separation = sep;
            result.normal = dist >= 0.0f ? axis : -axis;
            result.point = detail::closest_corner_midpoint(a, b);
            return result;
        }
        least_overlap = std::max(least_overlap, sep);
    }

    result.intersects = true;
    result.separation = least_overlap;
    result.point = detail::closest_corner_midpoint(a, b);
    result.normal = detail::nearest_face_normal(b, result.point);
    return result;
}

} // namespace gravwell_math
