/// @file types.hpp
/// @brief Core types for gravwell_physics

#pragma once

#include "fwd.hpp"

#include <gravwell/core/handle.hpp>
#include <gravwell/math/vec.hpp>

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <variant>

namespace gravwell_physics {

// =============================================================================
// Identifiers
// =============================================================================

/// Handle to a player or vehicle stored in a World
using BodyId = gravwell_core::Handle<DynamicBody>;

/// Handle to an entry in the CollisionRegistry
using CollidableId = gravwell_core::Handle<Collidable>;

/// Index of a celestial body in registration order
struct CelestialId {
    std::uint32_t value = std::numeric_limits<std::uint32_t>::max();

    [[nodiscard]] bool is_valid() const noexcept { return value != std::numeric_limits<std::uint32_t>::max(); }
    [[nodiscard]] static CelestialId invalid() { return CelestialId{}; }

    bool operator==(const CelestialId& other) const noexcept { return value == other.value; }
    bool operator!=(const CelestialId& other) const noexcept { return value != other.value; }
};

// =============================================================================
// Motion State
// =============================================================================

/// Exactly one of these holds for a dynamic body at the end of every tick
enum class MotionState : std::uint8_t {
    Falling,            ///< Under gravity, no support
    Grounded,           ///< Resting on the SOI surface shell
    StandingOnObject,   ///< Resting on a registered collidable
};

[[nodiscard]] const char* to_string(MotionState state);

// =============================================================================
// Collidable Kinds
// =============================================================================

enum class CollidableType : std::uint8_t {
    Player,
    Vehicle,
    StaticObstacle,
    DynamicProp,
};

[[nodiscard]] const char* to_string(CollidableType type);

/// Box of a player body
struct PlayerCollider {
    BodyId body;
};

/// Box of a vehicle body
struct VehicleCollider {
    BodyId body;
};

/// Immovable obstacle. When anchored, only bodies inside that celestial body's
/// sphere of influence test against it.
struct ObstacleCollider {
    CelestialId anchor;
};

/// Movable prop whose transform is driven from outside the simulation
struct PropCollider {};

using CollidableKind = std::variant<PlayerCollider, VehicleCollider, ObstacleCollider, PropCollider>;

[[nodiscard]] CollidableType type_of(const CollidableKind& kind);

/// Dynamic body owning the collidable, if any
[[nodiscard]] std::optional<BodyId> owner_body(const CollidableKind& kind);

// =============================================================================
// Contact Information
// =============================================================================

/// Contact classification by normal . up
enum class ContactClass : std::uint8_t {
    Ground,     ///< Walkable surface below the body
    Lateral,    ///< Wall, slide along it
    Ceiling,    ///< Surface above the body
};

[[nodiscard]] const char* to_string(ContactClass cls);

/// A selected contact between a moving body and a collidable
struct Contact {
    gravwell_math::Vec3 normal{0.0f, 1.0f, 0.0f};  ///< Unit, points away from the struck surface
    gravwell_math::Vec3 point{0.0f};               ///< Approximate world contact point
    float penetration = 0.0f;                      ///< Overlap depth at the contact pose
    float time_of_impact = 0.0f;                   ///< Seconds into the sub-step
    float toi_fraction = 0.0f;                     ///< Fraction of the sub-step [0, 1]
    CollidableId collidable;                       ///< Struck collidable
    CollidableType struck_type = CollidableType::StaticObstacle;
    bool struck_static = false;
    ContactClass classification = ContactClass::Lateral;
};

// =============================================================================
// Callbacks
// =============================================================================

/// Landing / liftoff notification with the surface normal involved
using SurfaceCallback = std::function<void(BodyId, const gravwell_math::Vec3& normal)>;

/// World-level notification for every resolved contact
using ContactCallback = std::function<void(BodyId, const Contact&)>;

// =============================================================================
// Physics Statistics
// =============================================================================

/// Tick counters. World::stats() holds the most recent tick (ticks is
/// cumulative there too), World::totals() the running sums.
struct PhysicsStats {
    std::uint64_t ticks = 0;
    std::uint32_t bodies_stepped = 0;
    std::uint32_t substeps = 0;
    std::uint32_t contacts = 0;
    std::uint32_t velocity_caps = 0;
    std::uint32_t degenerate_recoveries = 0;
    std::uint32_t bounds_fallbacks = 0;
    std::uint32_t landings = 0;
    std::uint32_t liftoffs = 0;

    /// Add another tick's counters; ticks is taken over
    void accumulate(const PhysicsStats& tick) {
        ticks = tick.ticks;
        bodies_stepped += tick.bodies_stepped;
        substeps += tick.substeps;
        contacts += tick.contacts;
        velocity_caps += tick.velocity_caps;
        degenerate_recoveries += tick.degenerate_recoveries;
        bounds_fallbacks += tick.bounds_fallbacks;
        landings += tick.landings;
        liftoffs += tick.liftoffs;
    }
};

} // namespace gravwell_physics
