/// @file vehicle.cpp
/// @brief VehiclePhysicsStep implementation

#include <gravwell/physics/vehicle.hpp>
#include <gravwell/physics/body.hpp>
#include <gravwell/physics/celestial.hpp>

namespace gravwell_physics {

namespace gm = gravwell_math;

bool VehiclePhysicsStep::apply_parked_damping(DynamicBody& body) {
    const auto* params = std::get_if<VehicleParams>(&body.kind);
    if (!params || params->occupied || body.state == MotionState::Falling) {
        return false;
    }
    if (gm::length(body.velocity) >= params->stationary_speed) {
        return false;
    }
    body.velocity *= params->parked_damping;
    return true;
}

IntegrationResult VehiclePhysicsStep::step(DynamicBody& body, float dt, const IntegrationContext& ctx) const {
    IntegrationResult result = m_integrator.integrate(body, dt, ctx);
    apply_parked_damping(body);

    const CelestialBody& soi = ctx.celestials.resolve_soi(body.position);
    const gm::Vec3 radial_up = gm::normalize_or(body.position - soi.center, gm::vec3::UP);

    AlignmentOptions options;
    options.rate = m_config.vehicle_alignment_rate;
    options.dt = dt;
    options.fixed_factor = m_config.fixed_alignment_factor;
    options.preserve_forward = true;
    options.force = true;
    options.falling = body.state == MotionState::Falling;

    const AlignmentResult aligned = m_aligner.align(body.orientation, body.surface_normal.value_or(radial_up), options);
    body.orientation = aligned.orientation;
    return result;
}

} // namespace gravwell_physics
