/// @file character.cpp
/// @brief PlayerPhysicsStep implementation

#include <gravwell/physics/character.hpp>
#include <gravwell/physics/body.hpp>
#include <gravwell/physics/celestial.hpp>

namespace gravwell_physics {

namespace gm = gravwell_math;

IntegrationResult PlayerPhysicsStep::step(DynamicBody& body, float dt, const IntegrationContext& ctx) const {
    IntegrationResult result = m_integrator.integrate(body, dt, ctx);

    const CelestialBody& soi = ctx.celestials.resolve_soi(body.position);
    const gm::Vec3 radial_up = gm::normalize_or(body.position - soi.center, gm::vec3::UP);
    const gm::Vec3 target_up = body.surface_normal.value_or(radial_up);

    AlignmentOptions options;
    options.rate = m_config.alignment_rate;
    options.dt = dt;
    options.fixed_factor = m_config.fixed_alignment_factor;
    options.falling = body.state == MotionState::Falling;

    const auto* params = std::get_if<PlayerParams>(&body.kind);
    if (result.landed && params && params->snap_on_landing) {
        options.fixed_factor = 1.0f;
    }

    const AlignmentResult aligned = m_aligner.align(body.orientation, target_up, options);
    body.orientation = aligned.orientation;
    return result;
}

} // namespace gravwell_physics
