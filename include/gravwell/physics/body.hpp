/// @file body.hpp
/// @brief Dynamic bodies (players and vehicles) for gravwell_physics

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <gravwell/math/obb.hpp>
#include <gravwell/math/quat.hpp>
#include <gravwell/math/transform.hpp>

#include <optional>
#include <string>
#include <variant>

namespace gravwell_physics {

// =============================================================================
// Body Kind Parameters
// =============================================================================

/// On-foot character
struct PlayerParams {
    gravwell_math::Vec3 half_extents{0.9f, 1.1f, 0.9f};
    float ground_offset = 0.5f;         ///< Height of the body origin above the surface
    bool snap_on_landing = true;        ///< Align fully on the landing tick
};

/// Drivable vehicle
struct VehicleParams {
    gravwell_math::Vec3 half_extents{1.5f, 1.0f, 3.0f};
    float target_height = 3.0f;         ///< Height of the body origin above the surface
    bool occupied = false;
    float parked_damping = 0.2f;        ///< Velocity multiplier while parked
    float stationary_speed = 0.5f;      ///< Parked below this speed
};

using BodyKind = std::variant<PlayerParams, VehicleParams>;

// =============================================================================
// Dynamic Body
// =============================================================================

/// A body moved by gravity and collision response
struct DynamicBody {
    std::string name;

    gravwell_math::Vec3 position{0.0f};
    gravwell_math::Vec3 velocity{0.0f};
    gravwell_math::Quat orientation = gravwell_math::quat::IDENTITY;

    float mass = 70.0f;
    float gravity_scale = 1.0f;
    float restitution = 0.2f;

    CelestialId soi;
    MotionState state = MotionState::Falling;
    std::optional<gravwell_math::Vec3> surface_normal;  ///< Only while supported
    CollidableId collidable;                            ///< Own box
    CollidableId support;                               ///< Only while StandingOnObject

    BodyKind kind;

    gravwell_math::Vec3 last_valid_position{0.0f};
    gravwell_math::Quat last_valid_orientation = gravwell_math::quat::IDENTITY;
    float last_valid_mass = 0.0f;

    SurfaceCallback on_landing;
    SurfaceCallback on_liftoff;

    [[nodiscard]] bool is_player() const { return std::holds_alternative<PlayerParams>(kind); }
    [[nodiscard]] bool is_vehicle() const { return std::holds_alternative<VehicleParams>(kind); }

    /// Height of the origin above the surface shell while grounded
    [[nodiscard]] float ground_offset() const;

    [[nodiscard]] gravwell_math::LocalBox local_box() const;
    [[nodiscard]] gravwell_math::Transform transform() const;

    /// Current world box
    [[nodiscard]] gravwell_math::OrientedBox box() const;

    /// Replace non-finite position, velocity, orientation and mass with the
    /// last valid values (zero velocity). Without a recorded mass the body
    /// gets unit mass.
    /// @return true if anything was repaired
    bool sanitize();

    /// Record the current pose as the recovery point
    void remember_valid();
};

} // namespace gravwell_physics
