#pragma once

/// @file obb.hpp
/// @brief Oriented bounding box for gravwell_math

#include "types.hpp"
#include "vec.hpp"
#include "quat.hpp"
#include "transform.hpp"
#include <array>
#include <cmath>

namespace gravwell_math {

// =============================================================================
// LocalBox
// =============================================================================

/// Box dimensions in an owner's local space, fixed at registration
struct LocalBox {
    Vec3 offset = vec3::ZERO;          ///< Box center relative to the owner origin
    Vec3 half_extents = Vec3(0.5f);    ///< Half size along each local axis

    /// Create from full size
    static LocalBox from_size(const Vec3& size, const Vec3& offset = vec3::ZERO) noexcept {
        return LocalBox{offset, size * 0.5f};
    }
};

// =============================================================================
// OrientedBox
// =============================================================================

/// Box with arbitrary orientation: center, half extents, orthonormal basis
/// (columns of `rotation` are the box's local X, Y and Z axes in world space)
struct OrientedBox {
    Vec3 center = vec3::ZERO;
    Vec3 half_extents = Vec3(0.5f);
    Mat3 rotation = mat3::IDENTITY;

    // =========================================================================
    // Construction
    // =========================================================================

    /// Axis-aligned box of size 1 at `position`
    [[nodiscard]] static OrientedBox unit_at(const Vec3& position) noexcept {
        return OrientedBox{position, Vec3(0.5f), mat3::IDENTITY};
    }

    /// World box from an owner transform and a local box. Scale multiplies the extents.
    [[nodiscard]] static OrientedBox from_transform(const Transform& owner, const LocalBox& local) noexcept {
        OrientedBox box;
        box.center = owner.transform_point(local.offset);
        box.half_extents = local.half_extents * gravwell_math::abs(owner.scale_);
        box.rotation = quat_to_mat3(normalize_or_identity(owner.rotation));
        return box;
    }

    // =========================================================================
    // Properties
    // =========================================================================

    /// Local axis `i` (0 = X, 1 = Y, 2 = Z) in world space
    [[nodiscard]] Vec3 axis(int i) const noexcept {
        return rotation[i];
    }

    /// Radius of the sphere enclosing the box
    [[nodiscard]] float bounding_radius() const noexcept {
        return glm::length(half_extents);
    }

    /// Half-length of the box's shadow on a unit axis
    [[nodiscard]] float projected_radius(const Vec3& unit_axis) const noexcept {
        return half_extents.x * std::abs(glm::dot(rotation[0], unit_axis)) +
               half_extents.y * std::abs(glm::dot(rotation[1], unit_axis)) +
               half_extents.z * std::abs(glm::dot(rotation[2], unit_axis));
    }

    /// Finite center, finite positive extents, orthonormal rotation
    [[nodiscard]] bool is_valid() const noexcept {
        if (!gravwell_math::is_finite(center) || !gravwell_math::is_finite(half_extents)) {
            return false;
        }
        if (min_component(half_extents) <= consts::EPSILON) {
            return false;
        }
        for (int i = 0; i < 3; ++i) {
            const Vec3 col = rotation[i];
            if (!gravwell_math::is_finite(col)) {
                return false;
            }
            if (std::abs(glm::length2(col) - 1.0f) > 1e-3f) {
                return false;
            }
            if (std::abs(glm::dot(col, rotation[(i + 1) % 3])) > 1e-3f) {
                return false;
            }
        }
        return true;
    }

    /// This box if valid, otherwise a unit box at its center (origin when the center is not finite)
    [[nodiscard]] OrientedBox sanitized() const noexcept {
        if (is_valid()) {
            return *this;
        }
        return unit_at(gravwell_math::is_finite(center) ? center : vec3::ZERO);
    }

    [[nodiscard]] OrientedBox translated(const Vec3& offset) const noexcept {
        OrientedBox box = *this;
        box.center += offset;
        return box;
    }

    // =========================================================================
    // Point Queries
    // =========================================================================

    /// World point to box-local coordinates
    [[nodiscard]] Vec3 to_local(const Vec3& point) const noexcept {
        return glm::transpose(rotation) * (point - center);
    }

    [[nodiscard]] bool contains(const Vec3& point, float tolerance = 0.0f) const noexcept {
        const Vec3 local = to_local(point);
        return std::abs(local.x) <= half_extents.x + tolerance &&
               std::abs(local.y) <= half_extents.y + tolerance &&
               std::abs(local.z) <= half_extents.z + tolerance;
    }

    /// Closest point on or inside the box
    [[nodiscard]] Vec3 closest_point(const Vec3& point) const noexcept {
        const Vec3 local = glm::clamp(to_local(point), -half_extents, half_extents);
        return center + rotation * local;
    }

    [[nodiscard]] std::array<Vec3, 8> corners() const noexcept {
        const Vec3 ex = rotation[0] * half_extents.x;
        const Vec3 ey = rotation[1] * half_extents.y;
        const Vec3 ez = rotation[2] * half_extents.z;
        return {
            center - ex - ey - ez, center + ex - ey - ez,
            center - ex + ey - ez, center + ex + ey - ez,
            center - ex - ey + ez, center + ex - ey + ez,
            center - ex + ey + ez, center + ex + ey + ez,
        };
    }
};

/// Distance `a` must move along `unit_axis` to stop overlapping `b` on that axis.
/// Positive while the projections overlap; negative is the remaining gap.
[[nodiscard]] inline float overlap_along(const OrientedBox& a, const OrientedBox& b,
                                         const Vec3& unit_axis) noexcept {
    return a.projected_radius(unit_axis) + b.projected_radius(unit_axis) -
           glm::dot(a.center - b.center, unit_axis);
}

} // namespace gravwell_math
