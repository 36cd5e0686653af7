#pragma once

/// @file transform.hpp
/// @brief World transform (position, rotation, scale) for gravwell_math

#include "types.hpp"
#include "vec.hpp"
#include "quat.hpp"

namespace gravwell_math {

/// 3D transform with position, rotation and scale
struct Transform {
    Vec3 position = vec3::ZERO;
    Quat rotation = quat::IDENTITY;
    Vec3 scale_   = vec3::ONE;  // Named scale_ to avoid clashing with glm::scale

    Transform() noexcept = default;

    Transform(const Vec3& pos, const Quat& rot, const Vec3& scl) noexcept
        : position(pos), rotation(rot), scale_(scl) {}

    static Transform from_position(const Vec3& pos) noexcept {
        return Transform(pos, quat::IDENTITY, vec3::ONE);
    }

    static Transform from_position_rotation(const Vec3& pos, const Quat& rot) noexcept {
        return Transform(pos, rot, vec3::ONE);
    }

    // =========================================================================
    // Transformation
    // =========================================================================

    /// Transform a point (scale, then rotation, then translation)
    [[nodiscard]] Vec3 transform_point(const Vec3& point) const noexcept {
        return position + rotate(rotation, scale_ * point);
    }

    /// Transform a direction (rotation only)
    [[nodiscard]] Vec3 transform_direction(const Vec3& direction) const noexcept {
        return rotate(rotation, direction);
    }

    // =========================================================================
    // Direction Vectors
    // =========================================================================

    /// Forward direction (-Z in local space)
    [[nodiscard]] Vec3 forward() const noexcept {
        return rotate(rotation, vec3::FORWARD);
    }

    /// Right direction (+X in local space)
    [[nodiscard]] Vec3 right() const noexcept {
        return rotate(rotation, vec3::RIGHT);
    }

    /// Up direction (+Y in local space)
    [[nodiscard]] Vec3 up() const noexcept {
        return rotate(rotation, vec3::UP);
    }

    /// True when every component is finite
    [[nodiscard]] bool is_finite() const noexcept {
        return gravwell_math::is_finite(position) && gravwell_math::is_finite(rotation) &&
               gravwell_math::is_finite(scale_);
    }

    bool operator==(const Transform& other) const noexcept {
        return position == other.position &&
               rotation == other.rotation &&
               scale_ == other.scale_;
    }

    bool operator!=(const Transform& other) const noexcept {
        return !(*this == other);
    }
};

[[nodiscard]] inline bool approx_equal(const Transform& a, const Transform& b,
                                        float epsilon = consts::EPSILON) noexcept {
    return approx_equal(a.position, b.position, epsilon) &&
           approx_equal(a.rotation, b.rotation, epsilon) &&
           approx_equal(a.scale_, b.scale_, epsilon);
}

} // namespace gravwell_math
