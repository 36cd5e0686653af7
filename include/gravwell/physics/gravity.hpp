/// @file gravity.hpp
/// @brief Gravity integration, sub-stepping and motion state classification

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"

#include <gravwell/math/vec.hpp>

#include <cstdint>
#include <functional>
#include <optional>

namespace gravwell_physics {

// =============================================================================
// Integration Context
// =============================================================================

/// Everything a body integration reads besides the body itself
struct IntegrationContext {
    const CelestialRegistry& celestials;
    const CollisionRegistry& collidables;
    const CollisionResolver& resolver;
    BodyId self;                                        ///< Id passed to callbacks
    std::function<DynamicBody*(BodyId)> find_body;      ///< Other dynamic bodies, for impulses
};

/// Outcome of one body tick
struct IntegrationResult {
    std::optional<Contact> contact;         ///< First contact of the tick
    std::uint32_t substeps = 0;             ///< Sub-steps actually run
    bool capped = false;                    ///< Velocity was clamped to max_speed
    MotionState state = MotionState::Falling;
    std::optional<gravwell_math::Vec3> surface_normal;
    CollidableId support;
    bool landed = false;
    bool lifted_off = false;
};

// =============================================================================
// Gravity Integrator
// =============================================================================

class GravityIntegrator {
public:
    explicit GravityIntegrator(const PhysicsConfig& config) : m_config(config) {}
    explicit GravityIntegrator(PhysicsConfig&&) = delete;

    /// Advance one body by `dt`: cap, sub-step through the collision resolver,
    /// classify the motion state and apply gravity, snapping or friction
    IntegrationResult integrate(DynamicBody& body, float dt, const IntegrationContext& ctx) const;

    /// Inverse-square surface gravity: g * scale / (distance / radius)^2
    [[nodiscard]] static float gravity_magnitude(float distance, float radius, float g, float scale = 1.0f);

    /// Gravity with the configured constant
    [[nodiscard]] float gravity_magnitude(float distance, float radius, float scale = 1.0f) const {
        return gravity_magnitude(distance, radius, m_config.gravity_constant, scale);
    }

    /// clamp(ceil(speed / threshold), 1, max_substeps)
    [[nodiscard]] std::uint32_t substep_count(float speed) const;

    /// Clamp to max_speed. Returns true if the velocity was shortened.
    bool cap_velocity(gravwell_math::Vec3& velocity) const;

    /// Switch state and fire landing / liftoff exactly once per transition
    static void set_motion_state(DynamicBody& body, BodyId self, MotionState next,
                                 std::optional<gravwell_math::Vec3> normal, CollidableId support,
                                 IntegrationResult& result);

private:
    /// Body box moved toward the SOI still overlaps the supporting collidable
    [[nodiscard]] bool support_probe(const DynamicBody& body, const gravwell_math::Vec3& up,
                                     const CollisionRegistry& collidables) const;

    const PhysicsConfig& m_config;
};

} // namespace gravwell_physics
