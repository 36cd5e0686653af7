/// @file character.hpp
/// @brief Per-tick physics for player bodies

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"
#include "gravity.hpp"
#include "alignment.hpp"

namespace gravwell_physics {

/// Gravity, collision and surface alignment for a player
class PlayerPhysicsStep {
public:
    PlayerPhysicsStep(const PhysicsConfig& config, const GravityIntegrator& integrator,
                      const SurfaceAligner& aligner)
        : m_config(config)
        , m_integrator(integrator)
        , m_aligner(aligner)
    {}

    /// Integrate, then align toward the surface normal (or the radial up while
    /// unsupported). Alignment is skipped while falling and snaps on landing.
    IntegrationResult step(DynamicBody& body, float dt, const IntegrationContext& ctx) const;

private:
    const PhysicsConfig& m_config;
    const GravityIntegrator& m_integrator;
    const SurfaceAligner& m_aligner;
};

} // namespace gravwell_physics
