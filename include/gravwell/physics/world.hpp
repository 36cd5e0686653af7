/// @file world.hpp
/// @brief Owner of celestial bodies, collidables and dynamic bodies

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"
#include "body.hpp"
#include "celestial.hpp"
#include "collision_registry.hpp"
#include "collision_resolver.hpp"
#include "gravity.hpp"
#include "alignment.hpp"
#include "character.hpp"
#include "vehicle.hpp"

#include <gravwell/core/error.hpp>
#include <gravwell/core/handle.hpp>

#include <optional>
#include <string>
#include <vector>

namespace gravwell_physics {

// =============================================================================
// Descriptors
// =============================================================================

struct PlayerDesc {
    std::string name = "player";
    gravwell_math::Vec3 position{0.0f};
    gravwell_math::Vec3 velocity{0.0f};
    gravwell_math::Quat orientation = gravwell_math::quat::IDENTITY;
    std::optional<float> mass;              ///< Defaults to PhysicsConfig::player_mass
    std::optional<float> gravity_scale;     ///< Defaults to 1
    std::optional<float> restitution;       ///< Defaults to PhysicsConfig::default_restitution
};

struct VehicleDesc {
    std::string name = "vehicle";
    gravwell_math::Vec3 position{0.0f};
    gravwell_math::Vec3 velocity{0.0f};
    gravwell_math::Quat orientation = gravwell_math::quat::IDENTITY;
    std::optional<float> mass;              ///< Defaults to PhysicsConfig::vehicle_mass
    std::optional<float> gravity_scale;     ///< Defaults to PhysicsConfig::vehicle_gravity_scale
    std::optional<float> restitution;
    bool occupied = false;
};

/// Immovable box, optionally attached to one celestial body
struct ObstacleDesc {
    std::string name;
    gravwell_math::Transform transform;
    gravwell_math::LocalBox box;
    CelestialId anchor;                     ///< Invalid for a free-floating obstacle
};

/// Externally driven box
struct PropDesc {
    std::string name;
    gravwell_math::Transform transform;
    gravwell_math::LocalBox box;
};

/// Replicated kinematic state of a body
struct BodySnapshot {
    gravwell_math::Vec3 position{0.0f};
    gravwell_math::Vec3 velocity{0.0f};
    gravwell_math::Quat orientation = gravwell_math::quat::IDENTITY;
};

// =============================================================================
// World
// =============================================================================

/// Single-threaded simulation. Bodies step in registration order and see the
/// other bodies' boxes as they were at the start of the tick.
/// Callbacks run inside step(); spawning, despawning, clear() and load_scene()
/// are refused until it returns.
class World {
public:
    explicit World(PhysicsConfig config = PhysicsConfig::defaults());
    ~World() = default;

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // =========================================================================
    // Scene Construction
    // =========================================================================

    /// Replace the whole world with a scene
    /// @return Spawned bodies in scene order
    gravwell_core::Result<std::vector<BodyId>> load_scene(const SceneConfig& scene);

    gravwell_core::Result<CelestialId> add_celestial(const CelestialDesc& desc);

    CollidableId add_obstacle(const ObstacleDesc& desc);
    CollidableId add_prop(const PropDesc& desc);

    /// Null handle when called from a callback during step()
    BodyId spawn_player(const PlayerDesc& desc);
    BodyId spawn_vehicle(const VehicleDesc& desc);

    /// Remove a body and its collidable. Fails during step().
    gravwell_core::Result<void> despawn(BodyId id);

    /// Remove everything
    void clear();

    // =========================================================================
    // Collidables
    // =========================================================================

    CollidableId register_collidable(const gravwell_math::Transform& owner, const gravwell_math::LocalBox& local,
                                     CollidableKind kind, bool is_static);

    /// Body-owned collidables are removed by despawn() only
    gravwell_core::Result<void> unregister_collidable(CollidableId id);

    gravwell_core::Result<void> set_collidable_transform(CollidableId id, const gravwell_math::Transform& transform);
    gravwell_core::Result<void> set_collidable_active(CollidableId id, bool active);

    [[nodiscard]] const CelestialBody& resolve_soi(const gravwell_math::Vec3& position) const {
        return m_celestials.resolve_soi(position);
    }

    // =========================================================================
    // Simulation
    // =========================================================================

    /// Advance every body once. Non-positive or non-finite dt is ignored.
    void step(float dt);

    // =========================================================================
    // Control
    // =========================================================================

    gravwell_core::Result<void> set_velocity(BodyId id, const gravwell_math::Vec3& velocity);
    gravwell_core::Result<void> add_velocity(BodyId id, const gravwell_math::Vec3& delta);

    /// Pre-multiply the orientation by `delta`
    gravwell_core::Result<void> rotate(BodyId id, const gravwell_math::Quat& delta);

    /// Vehicles only
    gravwell_core::Result<void> set_occupied(BodyId id, bool occupied);

    /// Overwrite position, velocity and orientation. Non-finite values are
    /// replaced by the last valid ones.
    gravwell_core::Result<void> apply_snapshot(BodyId id, const BodySnapshot& snapshot);
    [[nodiscard]] gravwell_core::Result<BodySnapshot> snapshot(BodyId id) const;

    // =========================================================================
    // Callbacks
    // =========================================================================

    gravwell_core::Result<void> on_landing(BodyId id, SurfaceCallback callback);
    gravwell_core::Result<void> on_liftoff(BodyId id, SurfaceCallback callback);

    /// Every contact resolved during step()
    void on_contact(ContactCallback callback) { m_on_contact = std::move(callback); }

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] const DynamicBody* body(BodyId id) const { return m_bodies.get(id); }

    [[nodiscard]] std::optional<gravwell_math::Vec3> position(BodyId id) const;
    [[nodiscard]] std::optional<gravwell_math::Vec3> velocity(BodyId id) const;
    [[nodiscard]] std::optional<gravwell_math::Quat> orientation(BodyId id) const;
    [[nodiscard]] std::optional<MotionState> state(BodyId id) const;
    [[nodiscard]] std::optional<gravwell_math::Vec3> surface_normal(BodyId id) const;
    [[nodiscard]] std::optional<CelestialId> soi_of(BodyId id) const;

    [[nodiscard]] bool is_falling(BodyId id) const;
    [[nodiscard]] bool is_grounded(BodyId id) const;
    [[nodiscard]] bool is_standing_on_object(BodyId id) const;

    [[nodiscard]] const std::vector<BodyId>& bodies() const noexcept { return m_order; }
    [[nodiscard]] std::size_t body_count() const noexcept { return m_bodies.len(); }

    /// Counters of the most recent tick
    [[nodiscard]] const PhysicsStats& stats() const noexcept { return m_stats; }
    /// Counters since construction or the last clear()
    [[nodiscard]] const PhysicsStats& totals() const noexcept { return m_totals; }
    [[nodiscard]] bool is_stepping() const noexcept { return m_stepping; }
    [[nodiscard]] const PhysicsConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const CelestialRegistry& celestials() const noexcept { return m_celestials; }
    [[nodiscard]] const CollisionRegistry& collidables() const noexcept { return m_collidables; }

private:
    BodyId insert_body(DynamicBody body);
    gravwell_core::Result<std::reference_wrapper<DynamicBody>> find_mut(BodyId id);
    void sync_body_colliders();

    PhysicsConfig m_config;
    CelestialRegistry m_celestials;
    CollisionRegistry m_collidables;

    CollisionResolver m_resolver;
    GravityIntegrator m_integrator;
    SurfaceAligner m_aligner;
    PlayerPhysicsStep m_player_step;
    VehiclePhysicsStep m_vehicle_step;

    gravwell_core::HandleMap<DynamicBody> m_bodies;
    std::vector<BodyId> m_order;

    PhysicsStats m_stats;
    PhysicsStats m_totals;
    ContactCallback m_on_contact;
    bool m_stepping = false;
};

} // namespace gravwell_physics
