/// @file gravity.cpp
/// @brief GravityIntegrator implementation

#include <gravwell/physics/gravity.hpp>
#include <gravwell/physics/body.hpp>
#include <gravwell/physics/celestial.hpp>
#include <gravwell/physics/collision_registry.hpp>
#include <gravwell/physics/collision_resolver.hpp>

#include <gravwell/core/log.hpp>
#include <gravwell/math/intersect.hpp>

#include <algorithm>
#include <cmath>
#include <variant>
#include <vector>

namespace gravwell_physics {

namespace gm = gravwell_math;

namespace {

/// Candidates near the body, without its own box and without obstacles
/// anchored to another celestial body
std::vector<CollidableId> gather_candidates(const DynamicBody& body, const CollisionRegistry& collidables,
                                            const gm::Vec3& position, float reach, CelestialId soi) {
    std::vector<CollidableId> candidates = collidables.query_near(position, reach);
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(), [&](CollidableId id) {
        if (id == body.collidable) {
            return true;
        }
        const Collidable* entry = collidables.get(id);
        if (!entry) {
            return true;
        }
        if (const auto* obstacle = std::get_if<ObstacleCollider>(&entry->kind)) {
            return obstacle->anchor.is_valid() && obstacle->anchor != soi;
        }
        return false;
    }), candidates.end());
    return candidates;
}

/// Tangential velocity multiplier for one tick of surface friction
float friction_factor(float friction, float dt) {
    return std::clamp(1.0f - friction * dt, 0.0f, 1.0f);
}

} // anonymous namespace

// =============================================================================
// Helpers
// =============================================================================

float GravityIntegrator::gravity_magnitude(float distance, float radius, float g, float scale) {
    const float ratio = std::max(distance / radius, gm::consts::EPSILON);
    return g * scale / (ratio * ratio);
}

std::uint32_t GravityIntegrator::substep_count(float speed) const {
    if (!std::isfinite(speed) || speed <= 0.0f) {
        return 1;
    }
    const float steps = std::ceil(speed / m_config.substep_speed_threshold);
    const float max_steps = static_cast<float>(std::max<std::uint32_t>(m_config.max_substeps, 1));
    return static_cast<std::uint32_t>(std::clamp(steps, 1.0f, max_steps));
}

bool GravityIntegrator::cap_velocity(gm::Vec3& velocity) const {
    return gm::clamp_length(velocity, m_config.max_speed);
}

bool GravityIntegrator::support_probe(const DynamicBody& body, const gm::Vec3& up,
                                      const CollisionRegistry& collidables) const {
    const Collidable* support = collidables.get(body.support);
    if (!support || !support->active) {
        return false;
    }
    const gm::OrientedBox probe = body.box().translated(-up * m_config.liftoff_threshold);
    return gm::intersect(probe, support->box).intersects;
}

void GravityIntegrator::set_motion_state(DynamicBody& body, BodyId self, MotionState next,
                                         std::optional<gm::Vec3> normal, CollidableId support,
                                         IntegrationResult& result) {
    const MotionState previous = body.state;
    const std::optional<gm::Vec3> previous_normal = body.surface_normal;

    body.state = next;
    body.surface_normal = next == MotionState::Falling ? std::nullopt : normal;
    body.support = next == MotionState::StandingOnObject ? support : CollidableId::null();

    result.state = body.state;
    result.surface_normal = body.surface_normal;
    result.support = body.support;

    if (previous == next) {
        return;
    }

    gravwell_core::physics_logger()->debug("Body '{}' {} -> {}", body.name, to_string(previous), to_string(next));

    if (previous == MotionState::Falling) {
        result.landed = true;
        if (body.on_landing) {
            body.on_landing(self, body.surface_normal.value_or(gm::vec3::UP));
        }
    } else if (next == MotionState::Falling) {
        result.lifted_off = true;
        if (body.on_liftoff) {
            body.on_liftoff(self, previous_normal.value_or(gm::vec3::UP));
        }
    }
}

// =============================================================================
// Integration
// =============================================================================

IntegrationResult GravityIntegrator::integrate(DynamicBody& body, float dt, const IntegrationContext& ctx) const {
    IntegrationResult result;
    const MotionState previous = body.state;

    if (cap_velocity(body.velocity)) {
        result.capped = true;
        gravwell_core::physics_logger()->debug("Body '{}' velocity capped to {}", body.name, m_config.max_speed);
    }

    const std::uint32_t substeps = substep_count(gm::length(body.velocity));
    const float sub_dt = dt / static_cast<float>(substeps);

    for (std::uint32_t i = 0; i < substeps; ++i) {
        const CelestialBody& soi = ctx.celestials.resolve_soi(body.position);
        body.soi = soi.id;
        const gm::Vec3 up = gm::normalize_or(body.position - soi.center, body.surface_normal.value_or(gm::vec3::UP));

        KinematicState state{body.position, body.velocity, body.box()};
        const float reach = state.box.bounding_radius() + gm::length(body.velocity) * sub_dt +
                            m_config.broadphase_margin;
        const auto candidates = gather_candidates(body, ctx.collidables, body.position, reach, soi.id);

        ResolveParams params;
        params.dt = sub_dt;
        params.up = up;
        params.was_grounded = previous != MotionState::Falling;
        params.mass = body.mass;
        params.restitution = body.restitution;
        params.self = body.collidable;

        DynamicBody* partner_body = nullptr;
        KinematicState partner_state;
        auto partners = [&](const Contact& contact) -> std::optional<ImpulsePartner> {
            const Collidable* entry = ctx.collidables.get(contact.collidable);
            if (!entry || !ctx.find_body) {
                return std::nullopt;
            }
            const auto owner = owner_body(entry->kind);
            if (!owner) {
                return std::nullopt;
            }
            DynamicBody* other = ctx.find_body(*owner);
            if (!other || other == &body) {
                return std::nullopt;
            }
            partner_body = other;
            partner_state = KinematicState{other->position, other->velocity, other->box()};
            return ImpulsePartner{&partner_state, other->mass};
        };

        auto contact = ctx.resolver.resolve(state, params, candidates, ctx.collidables, partners);

        body.position = state.position;
        body.velocity = state.velocity;
        if (partner_body) {
            partner_body->position = partner_state.position;
            partner_body->velocity = partner_state.velocity;
        }
        ++result.substeps;

        if (contact) {
            result.contact = contact;
            break;
        }
    }

    // Classification against the SOI after the move
    const CelestialBody& soi = ctx.celestials.resolve_soi(body.position);
    body.soi = soi.id;
    const gm::Vec3 to_body = body.position - soi.center;
    const float distance = gm::length(to_body);
    const gm::Vec3 up = gm::normalize_or(to_body, body.surface_normal.value_or(gm::vec3::UP));
    const float radial = gm::dot(body.velocity, up);
    const float shell = soi.radius + body.ground_offset();

    MotionState next = MotionState::Falling;
    std::optional<gm::Vec3> normal;
    CollidableId support;

    if (distance <= shell) {
        next = MotionState::Grounded;
        normal = up;
    } else if (result.contact && result.contact->classification == ContactClass::Ground) {
        next = MotionState::StandingOnObject;
        normal = result.contact->normal;
        support = result.contact->collidable;
    } else if (previous == MotionState::Grounded &&
               !(distance > shell + m_config.liftoff_threshold && radial >= 0.0f)) {
        next = MotionState::Grounded;
        normal = up;
    } else if (previous == MotionState::StandingOnObject &&
               (support_probe(body, up, ctx.collidables) ||
                (radial < 0.0f && ctx.collidables.contains(body.support)))) {
        next = MotionState::StandingOnObject;
        normal = body.surface_normal.value_or(up);
        support = body.support;
    }

    const float friction = friction_factor(soi.friction, dt);
    switch (next) {
        case MotionState::Grounded: {
            body.position = soi.center + up * shell;
            body.velocity = gm::reject(body.velocity, up) * friction;
            break;
        }
        case MotionState::StandingOnObject: {
            const float vr = gm::dot(body.velocity, up);
            const float kept = std::max(vr, 0.0f);
            body.velocity = gm::reject(body.velocity, up) * friction + up * kept;
            break;
        }
        case MotionState::Falling: {
            const float g = gravity_magnitude(distance, soi.radius, body.gravity_scale);
            body.velocity -= up * (g * dt);
            break;
        }
    }

    if (cap_velocity(body.velocity)) {
        result.capped = true;
    }

    set_motion_state(body, ctx.self, next, normal, support, result);
    return result;
}

} // namespace gravwell_physics
