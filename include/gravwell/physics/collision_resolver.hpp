/// @file collision_resolver.hpp
/// @brief Contact detection, selection and response for moving boxes

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"

#include <gravwell/math/intersect.hpp>

#include <functional>
#include <optional>
#include <span>

namespace gravwell_physics {

// =============================================================================
// Resolver Inputs
// =============================================================================

/// Position, velocity and world box of a moving body, kept in sync by translate()
struct KinematicState {
    gravwell_math::Vec3 position{0.0f};
    gravwell_math::Vec3 velocity{0.0f};
    gravwell_math::OrientedBox box;

    void translate(const gravwell_math::Vec3& offset) {
        position += offset;
        box.center += offset;
    }
};

/// Motion of one box over one sub-step
struct SweepQuery {
    gravwell_math::OrientedBox box;
    gravwell_math::Vec3 velocity{0.0f};
    float dt = 0.0f;
    gravwell_math::Vec3 up{0.0f, 1.0f, 0.0f};
    CollidableId self;  ///< Never reported as a contact
};

struct ResolveParams {
    float dt = 0.0f;
    gravwell_math::Vec3 up{0.0f, 1.0f, 0.0f};
    bool was_grounded = false;  ///< Lateral pushes stay in the tangent plane
    float mass = 1.0f;
    float restitution = 0.2f;
    CollidableId self;
};

/// Dynamic body on the other side of a contact
struct ImpulsePartner {
    KinematicState* state = nullptr;
    float mass = 1.0f;
};

/// Maps a contact to the dynamic body that owns the struck collidable, if any
using PartnerLookup = std::function<std::optional<ImpulsePartner>(const Contact&)>;

// =============================================================================
// Collision Resolver
// =============================================================================

class CollisionResolver {
public:
    explicit CollisionResolver(const PhysicsConfig& config) : m_config(config) {}
    explicit CollisionResolver(PhysicsConfig&&) = delete;

    /// Earliest contact over the sub-step. Overlaps at the start pose win
    /// (TOI 0); otherwise static candidates are swept and the others are
    /// tested at the end pose. Static contacts precede non-static ones, then
    /// the smallest TOI, then candidate order.
    [[nodiscard]] std::optional<Contact> detect(const SweepQuery& query,
                                                std::span<const CollidableId> candidates,
                                                const CollisionRegistry& registry) const;

    [[nodiscard]] ContactClass classify(const gravwell_math::Vec3& normal,
                                        const gravwell_math::Vec3& up) const;

    /// Velocity and pushback against an immovable box
    void respond(KinematicState& state, Contact& contact, const gravwell_math::OrientedBox& struck,
                 const gravwell_math::Vec3& up, bool was_grounded) const;

    /// Momentum exchange between two dynamic bodies, `contact.normal` pointing toward `a`
    void respond_impulse(KinematicState& a, float mass_a, KinematicState& b, float mass_b,
                         Contact& contact, float restitution) const;

    /// Detect, move to the time of impact and respond. Without a contact the
    /// state moves by the full sub-step. For a grounded body, a ceiling
    /// contact with a box centered below it is answered as a side contact.
    std::optional<Contact> resolve(KinematicState& state, const ResolveParams& params,
                                   std::span<const CollidableId> candidates,
                                   const CollisionRegistry& registry,
                                   const PartnerLookup& partners = {}) const;

private:
    std::optional<Contact> sweep_static(const SweepQuery& query, CollidableId id,
                                        const Collidable& target) const;

    /// Face normal of `struck` in the lateral band along which `box` overlaps least
    [[nodiscard]] std::optional<gravwell_math::Vec3> shallowest_side_face(const gravwell_math::OrientedBox& box,
                                                                          const gravwell_math::OrientedBox& struck,
                                                                          const gravwell_math::Vec3& up) const;

    const PhysicsConfig& m_config;
};

} // namespace gravwell_physics
