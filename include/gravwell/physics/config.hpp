/// @file config.hpp
/// @brief Simulation tunables for gravwell_physics

#pragma once

#include "fwd.hpp"

#include <gravwell/core/error.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>

namespace gravwell_physics {

// =============================================================================
// Physics Configuration
// =============================================================================

/// Every tunable of the gravity and collision pipeline
struct PhysicsConfig {
    /// Gravity
    float gravity_constant = 40.0f;             ///< Surface gravity of every celestial body
    float vehicle_gravity_scale = 1.5f;         ///< Default gravity multiplier for vehicles

    /// Integration
    float max_speed = 120.0f;                   ///< Velocity cap before and after integration
    float substep_speed_threshold = 3.0f;       ///< One sub-step per this much speed
    std::uint32_t max_substeps = 64;

    /// Surface handling
    float ground_offset = 0.5f;                 ///< Player height above the surface shell
    float liftoff_threshold = 0.1f;             ///< Gap before a supported body starts falling
    float vehicle_target_height = 3.0f;         ///< Vehicle height above the surface shell

    /// Collision response
    float safety_buffer = 0.02f;                ///< Extra pushback beyond the penetration
    float slide_friction = 0.85f;               ///< Tangential multiplier on lateral contacts
    float ground_contact_threshold = 0.6f;      ///< normal . up above this is ground
    float ceiling_contact_threshold = -0.5f;    ///< normal . up below this is ceiling
    float default_restitution = 0.2f;

    /// Detection
    float broadphase_margin = 3.0f;             ///< Extra query radius around each body
    std::uint32_t sweep_samples = 8;            ///< Samples along a static sweep
    std::uint32_t sweep_refine_iterations = 6;  ///< Bisection steps after a sweep hit

    /// Orientation
    float alignment_rate = 8.0f;                ///< Players, exponential smoothing (1/s)
    float vehicle_alignment_rate = 12.0f;       ///< Vehicles, exponential smoothing (1/s)
    std::optional<float> fixed_alignment_factor;///< Per-tick slerp factor, overrides the rates

    /// Default masses
    float player_mass = 70.0f;
    float vehicle_mass = 1000.0f;

    [[nodiscard]] static PhysicsConfig defaults();

    /// Check ranges and orderings of all fields
    [[nodiscard]] gravwell_core::Result<void> validate() const;

    /// Read a config; absent keys keep their defaults
    [[nodiscard]] static gravwell_core::Result<PhysicsConfig> from_json(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json to_json() const;
};

} // namespace gravwell_physics
