/// @file vehicle.hpp
/// @brief Per-tick physics for vehicle bodies

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"
#include "gravity.hpp"
#include "alignment.hpp"

namespace gravwell_physics {

/// Gravity, collision, parked damping and forced heading-preserving alignment
class VehiclePhysicsStep {
public:
    VehiclePhysicsStep(const PhysicsConfig& config, const GravityIntegrator& integrator,
                       const SurfaceAligner& aligner)
        : m_config(config)
        , m_integrator(integrator)
        , m_aligner(aligner)
    {}

    IntegrationResult step(DynamicBody& body, float dt, const IntegrationContext& ctx) const;

    /// Damp an unoccupied, supported, slow vehicle
    /// @return true if damping was applied
    static bool apply_parked_damping(DynamicBody& body);

private:
    const PhysicsConfig& m_config;
    const GravityIntegrator& m_integrator;
    const SurfaceAligner& m_aligner;
};

} // namespace gravwell_physics
