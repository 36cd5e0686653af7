/// @file collision_resolver.cpp
/// @brief CollisionResolver implementation

#include <gravwell/physics/collision_resolver.hpp>
#include <gravwell/physics/collision_registry.hpp>

#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace gravwell_physics {

namespace gm = gravwell_math;

namespace {

Contact make_contact(const gm::BoxIntersection& hit, const gm::OrientedBox& box, const gm::OrientedBox& target,
                     CollidableId id, const Collidable& entry) {
    Contact contact;
    contact.normal = gm::normalize_or(hit.normal, gm::vec3::UP);
    contact.point = hit.point;
    contact.penetration = std::max(gm::overlap_along(box, target, contact.normal), 0.0f);
    contact.collidable = id;
    contact.struck_type = entry.type();
    contact.struck_static = entry.is_static;
    return contact;
}

/// Static first, then earliest
bool precedes(const Contact& a, const Contact& b) {
    if (a.struck_static != b.struck_static) {
        return a.struck_static;
    }
    return a.toi_fraction < b.toi_fraction;
}

float inverse_mass(float mass) {
    return (std::isfinite(mass) && mass > 0.0f) ? 1.0f / mass : 0.0f;
}

} // anonymous namespace

// =============================================================================
// Detection
// =============================================================================

std::optional<Contact> CollisionResolver::detect(const SweepQuery& query,
                                                 std::span<const CollidableId> candidates,
                                                 const CollisionRegistry& registry) const {
    std::optional<Contact> best;
    auto consider = [&best](Contact contact) {
        if (!best || precedes(contact, *best)) {
            best = contact;
        }
    };

    // Pass 1: overlaps at the start pose
    for (CollidableId id : candidates) {
        if (id == query.self) {
            continue;
        }
        const Collidable* entry = registry.get(id);
        if (!entry || !entry->active) {
            continue;
        }
        const auto hit = gm::intersect(query.box, entry->box);
        if (hit) {
            consider(make_contact(hit, query.box, entry->box, id, *entry));
        }
    }

    // Pass 2: along the motion
    const gm::Vec3 displacement = query.velocity * query.dt;
    if (!best && gm::length_squared(displacement) > gm::consts::EPSILON * gm::consts::EPSILON) {
        const gm::OrientedBox end_box = query.box.translated(displacement);

        for (CollidableId id : candidates) {
            if (id == query.self) {
                continue;
            }
            const Collidable* entry = registry.get(id);
            if (!entry || !entry->active) {
                continue;
            }

            if (entry->is_static) {
                if (auto contact = sweep_static(query, id, *entry)) {
                    consider(*contact);
                }
                continue;
            }

            const auto hit = gm::intersect(end_box, entry->box);
            if (hit) {
                Contact contact = make_contact(hit, end_box, entry->box, id, *entry);
                contact.toi_fraction = 1.0f;
                contact.time_of_impact = query.dt;
                consider(contact);
            }
        }
    }

    if (best) {
        best->classification = classify(best->normal, query.up);
    }
    return best;
}

std::optional<Contact> CollisionResolver::sweep_static(const SweepQuery& query, CollidableId id,
                                                       const Collidable& target) const {
    const gm::Vec3 displacement = query.velocity * query.dt;
    const std::uint32_t samples = std::max<std::uint32_t>(m_config.sweep_samples, 1);

    float lo = 0.0f;
    float hi = -1.0f;
    for (std::uint32_t k = 1; k <= samples; ++k) {
        const float t = static_cast<float>(k) / static_cast<float>(samples);
        if (gm::intersect(query.box.translated(displacement * t), target.box)) {
            hi = t;
            break;
        }
        lo = t;
    }
    if (hi < 0.0f) {
        return std::nullopt;
    }

    for (std::uint32_t i = 0; i < m_config.sweep_refine_iterations; ++i) {
        const float mid = 0.5f * (lo + hi);
        if (gm::intersect(query.box.translated(displacement * mid), target.box)) {
            hi = mid;
        } else {
            lo = mid;
        }
    }

    // Normal from the first overlapping pose, depth at the last free one
    const auto hit = gm::intersect(query.box.translated(displacement * hi), target.box);
    Contact contact = make_contact(hit, query.box.translated(displacement * lo), target.box, id, target);
    contact.toi_fraction = lo;
    contact.time_of_impact = lo * query.dt;
    return contact;
}

ContactClass CollisionResolver::classify(const gm::Vec3& normal, const gm::Vec3& up) const {
    const float d = gm::dot(normal, up);
    if (d > m_config.ground_contact_threshold) {
        return ContactClass::Ground;
    }
    if (d < m_config.ceiling_contact_threshold) {
        return ContactClass::Ceiling;
    }
    return ContactClass::Lateral;
}

// =============================================================================
// Response
// =============================================================================

void CollisionResolver::respond(KinematicState& state, Contact& contact, const gm::OrientedBox& struck,
                                const gm::Vec3& up, bool was_grounded) const {
    const gm::Vec3& n = contact.normal;
    const float depth = std::max(gm::overlap_along(state.box, struck, n), 0.0f);
    const float push = depth + m_config.safety_buffer;
    contact.penetration = depth;

    switch (contact.classification) {
        case ContactClass::Ground: {
            const float vn = gm::dot(state.velocity, n);
            if (vn < 0.0f) {
                state.velocity -= n * vn;
            }
            state.translate(n * push);
            break;
        }
        case ContactClass::Ceiling: {
            const float vu = gm::dot(state.velocity, up);
            if (vu > 0.0f) {
                state.velocity -= up * vu;
            }
            state.translate(n * push);
            break;
        }
        case ContactClass::Lateral: {
            const float up_speed = gm::dot(state.velocity, up);

            const float vn = gm::dot(state.velocity, n);
            if (vn < 0.0f) {
                state.velocity -= n * vn;
            }
            const float vn_out = gm::dot(state.velocity, n);
            state.velocity = gm::reject(state.velocity, n) * m_config.slide_friction + n * vn_out;

            const gm::Vec3 flat = gm::reject(n, up);
            const float flat_sq = gm::length_squared(flat);
            if (was_grounded && flat_sq > gm::consts::EPSILON_LOOSE) {
                // Component along n still equals push
                state.translate(flat * (push / flat_sq));
                state.velocity = gm::reject(state.velocity, up) + up * up_speed;
            } else {
                state.translate(n * push);
            }
            break;
        }
    }
}

void CollisionResolver::respond_impulse(KinematicState& a, float mass_a, KinematicState& b, float mass_b,
                                        Contact& contact, float restitution) const {
    const gm::Vec3& n = contact.normal;
    float inv_a = inverse_mass(mass_a);
    float inv_b = inverse_mass(mass_b);
    if (inv_a + inv_b <= 0.0f) {
        inv_a = inv_b = 1.0f;
    }
    const float inv_sum = inv_a + inv_b;

    const float approach = gm::dot(a.velocity - b.velocity, n);
    if (approach < 0.0f) {
        const float e = std::clamp(restitution, 0.0f, 1.0f);
        const float j = -(1.0f + e) * approach / inv_sum;
        a.velocity += n * (j * inv_a);
        b.velocity -= n * (j * inv_b);
    }

    const float depth = std::max(gm::overlap_along(a.box, b.box, n), 0.0f);
    const float push = depth + m_config.safety_buffer;
    contact.penetration = depth;
    a.translate(n * (push * inv_a / inv_sum));
    b.translate(-n * (push * inv_b / inv_sum));
}

// =============================================================================
// Resolve
// =============================================================================

std::optional<Contact> CollisionResolver::resolve(KinematicState& state, const ResolveParams& params,
                                                  std::span<const CollidableId> candidates,
                                                  const CollisionRegistry& registry,
                                                  const PartnerLookup& partners) const {
    SweepQuery query;
    query.box = state.box;
    query.velocity = state.velocity;
    query.dt = params.dt;
    query.up = params.up;
    query.self = params.self;

    auto contact = detect(query, candidates, registry);
    if (!contact) {
        state.translate(state.velocity * params.dt);
        return std::nullopt;
    }

    state.translate(state.velocity * contact->time_of_impact);

    const Collidable* struck = registry.get(contact->collidable);

    // A grounded box hangs below the surface shell, so the side of a low
    // obstacle can resolve to its bottom face. Nothing below the body center
    // is a ceiling.
    if (struck && params.was_grounded && contact->classification == ContactClass::Ceiling &&
        gm::dot(struck->box.center - state.box.center, params.up) < 0.0f) {
        if (auto side = shallowest_side_face(state.box, struck->box, params.up)) {
            contact->normal = *side;
            contact->classification = ContactClass::Lateral;
        }
    }

    if (contact->classification == ContactClass::Lateral && partners) {
        if (auto partner = partners(*contact); partner && partner->state) {
            respond_impulse(state, params.mass, *partner->state, partner->mass, *contact, params.restitution);
            return contact;
        }
    }

    if (struck) {
        respond(state, *contact, struck->box, params.up, params.was_grounded);
    }
    return contact;
}

std::optional<gm::Vec3> CollisionResolver::shallowest_side_face(const gm::OrientedBox& box,
                                                                const gm::OrientedBox& struck,
                                                                const gm::Vec3& up) const {
    std::optional<gm::Vec3> best;
    float least = gm::consts::MAX_FLOAT;
    for (int i = 0; i < 3; ++i) {
        for (const float sign : {1.0f, -1.0f}) {
            const gm::Vec3 n = struck.axis(i) * sign;
            if (classify(n, up) != ContactClass::Lateral) {
                continue;
            }
            const float overlap = gm::overlap_along(box, struck, n);
            if (overlap < least) {
                least = overlap;
                best = n;
            }
        }
    }
    return best;
}

} // namespace gravwell_physics
