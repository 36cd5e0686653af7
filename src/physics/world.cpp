/// @file world.cpp
/// @brief World implementation

#include <gravwell/physics/world.hpp>
#include <gravwell/physics/scene.hpp>

#include <gravwell/core/log.hpp>

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace gravwell_physics {

namespace gm = gravwell_math;

using gravwell_core::Err;
using gravwell_core::Ok;
using gravwell_core::PhysicsError;
using gravwell_core::Result;

namespace {

std::string describe(BodyId id) {
    return std::to_string(id.index()) + "v" + std::to_string(static_cast<int>(id.generation()));
}

/// Requested mass, or the configured default when absent or not positive
float resolve_mass(const std::optional<float>& requested, float fallback, const std::string& name) {
    if (!requested) {
        return fallback;
    }
    if (!std::isfinite(*requested) || *requested <= 0.0f) {
        gravwell_core::physics_logger()->warn("Body '{}' requested mass {}, using {}", name, *requested, fallback);
        return fallback;
    }
    return *requested;
}

/// Marks the world as inside step() for the lifetime of the scope
class SteppingScope {
public:
    explicit SteppingScope(bool& flag) : m_flag(flag) { m_flag = true; }
    ~SteppingScope() { m_flag = false; }

    SteppingScope(const SteppingScope&) = delete;
    SteppingScope& operator=(const SteppingScope&) = delete;

private:
    bool& m_flag;
};

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

World::World(PhysicsConfig config)
    : m_config(std::move(config))
    , m_resolver(m_config)
    , m_integrator(m_config)
    , m_player_step(m_config, m_integrator, m_aligner)
    , m_vehicle_step(m_config, m_integrator, m_aligner)
{
    auto valid = m_config.validate();
    if (!valid) {
        gravwell_core::physics_logger()->warn("Invalid physics config ({}), using defaults",
                                              valid.error().message());
        m_config = PhysicsConfig::defaults();
    }
}

void World::clear() {
    if (m_stepping) {
        gravwell_core::physics_logger()->error("clear() called during step, ignored");
        return;
    }
    m_bodies.clear();
    m_order.clear();
    m_collidables.clear();
    m_celestials.clear();
    m_stats = PhysicsStats{};
    m_totals = PhysicsStats{};
}

Result<std::vector<BodyId>> World::load_scene(const SceneConfig& scene) {
    if (m_stepping) {
        return Err<std::vector<BodyId>>(PhysicsError::invalid_parameter("load_scene", "not allowed during step"));
    }
    auto valid = scene.physics.validate();
    if (!valid) {
        return Err<std::vector<BodyId>>(valid.error());
    }

    clear();
    m_config = scene.physics;

    for (const auto& desc : scene.celestials) {
        auto added = add_celestial(desc);
        if (!added) {
            auto error = added.error();
            error.with_context("celestial", desc.name);
            return Err<std::vector<BodyId>>(error);
        }
    }

    for (const auto& obstacle : scene.obstacles) {
        auto transform = resolve_placement(obstacle.placement, m_celestials);
        if (!transform) {
            auto error = transform.error();
            error.with_context("obstacle", obstacle.name);
            return Err<std::vector<BodyId>>(error);
        }

        ObstacleDesc desc;
        desc.name = obstacle.name;
        desc.transform = *transform;
        desc.box = gm::LocalBox{obstacle.offset, obstacle.half_extents};
        if (!obstacle.anchor.empty()) {
            const CelestialBody* anchor = m_celestials.find(obstacle.anchor);
            if (!anchor) {
                return Err<std::vector<BodyId>>(
                    gravwell_core::ConfigError::invalid_value("anchor", "unknown body: " + obstacle.anchor));
            }
            desc.anchor = anchor->id;
        }
        add_obstacle(desc);
    }

    std::vector<BodyId> spawned;
    for (const auto& spawn : scene.spawns) {
        auto transform = resolve_placement(spawn.placement, m_celestials);
        if (!transform) {
            auto error = transform.error();
            error.with_context("spawn", spawn.name);
            return Err<std::vector<BodyId>>(error);
        }

        BodyId id;
        if (spawn.kind == SpawnKind::Player) {
            PlayerDesc desc;
            desc.name = spawn.name;
            desc.position = transform->position;
            desc.orientation = transform->rotation;
            desc.velocity = spawn.velocity;
            desc.mass = spawn.mass;
            id = spawn_player(desc);
        } else {
            VehicleDesc desc;
            desc.name = spawn.name;
            desc.position = transform->position;
            desc.orientation = transform->rotation;
            desc.velocity = spawn.velocity;
            desc.mass = spawn.mass;
            desc.occupied = spawn.occupied;
            id = spawn_vehicle(desc);
        }
        spawned.push_back(id);
    }

    gravwell_core::physics_logger()->info("Loaded scene: {} celestial bodies, {} obstacles, {} bodies",
                                          m_celestials.len(), scene.obstacles.size(), spawned.size());
    return Ok(std::move(spawned));
}

Result<CelestialId> World::add_celestial(const CelestialDesc& desc) {
    auto id = m_celestials.add(desc);
    if (!id) {
        gravwell_core::debug::record_error(id.error());
        gravwell_core::physics_logger()->warn("Rejected celestial body '{}': {}", desc.name, id.error().message());
    }
    return id;
}

CollidableId World::add_obstacle(const ObstacleDesc& desc) {
    CelestialId anchor = desc.anchor;
    if (anchor.is_valid() && !m_celestials.get(anchor)) {
        gravwell_core::physics_logger()->warn("Obstacle '{}' anchored to unknown celestial body, left unanchored",
                                              desc.name);
        anchor = CelestialId::invalid();
    }

    CollidableId id = m_collidables.register_collidable(desc.transform, desc.box, ObstacleCollider{anchor}, true);
    if (id && anchor.is_valid()) {
        auto attached = m_celestials.attach_obstacle(anchor, id);
        if (!attached) {
            gravwell_core::physics_logger()->warn("Failed to attach obstacle '{}': {}", desc.name,
                                                  attached.error().message());
        }
    }
    return id;
}

CollidableId World::add_prop(const PropDesc& desc) {
    return m_collidables.register_collidable(desc.transform, desc.box, PropCollider{}, false);
}

// =============================================================================
// Bodies
// =============================================================================

BodyId World::spawn_player(const PlayerDesc& desc) {
    DynamicBody body;
    body.name = desc.name;
    body.position = desc.position;
    body.velocity = desc.velocity;
    body.orientation = gm::normalize_or_identity(desc.orientation);
    body.mass = resolve_mass(desc.mass, m_config.player_mass, desc.name);
    body.gravity_scale = desc.gravity_scale.value_or(1.0f);
    body.restitution = desc.restitution.value_or(m_config.default_restitution);

    PlayerParams params;
    params.ground_offset = m_config.ground_offset;
    body.kind = params;

    return insert_body(std::move(body));
}

BodyId World::spawn_vehicle(const VehicleDesc& desc) {
    DynamicBody body;
    body.name = desc.name;
    body.position = desc.position;
    body.velocity = desc.velocity;
    body.orientation = gm::normalize_or_identity(desc.orientation);
    body.mass = resolve_mass(desc.mass, m_config.vehicle_mass, desc.name);
    body.gravity_scale = desc.gravity_scale.value_or(m_config.vehicle_gravity_scale);
    body.restitution = desc.restitution.value_or(m_config.default_restitution);

    VehicleParams params;
    params.target_height = m_config.vehicle_target_height;
    params.occupied = desc.occupied;
    body.kind = params;

    return insert_body(std::move(body));
}

BodyId World::insert_body(DynamicBody body) {
    if (m_stepping) {
        gravwell_core::physics_logger()->error("Cannot spawn '{}' during step", body.name);
        return BodyId::null();
    }
    if (body.sanitize()) {
        gravwell_core::physics_logger()->warn("Body '{}' spawned with degenerate values, repaired", body.name);
    }
    body.remember_valid();
    body.soi = m_celestials.resolve_soi(body.position).id;

    const bool vehicle = body.is_vehicle();
    BodyId id = m_bodies.insert(std::move(body));
    if (id.is_null()) {
        gravwell_core::physics_logger()->error("Body storage exhausted");
        return id;
    }

    DynamicBody* stored = m_bodies.get_mut(id);
    CollidableKind kind = vehicle ? CollidableKind{VehicleCollider{id}} : CollidableKind{PlayerCollider{id}};
    stored->collidable = m_collidables.register_collidable(stored->transform(), stored->local_box(), kind, false);
    m_order.push_back(id);

    gravwell_core::physics_logger()->debug("Spawned {} '{}' ({})", vehicle ? "vehicle" : "player",
                                           stored->name, describe(id));
    return id;
}

Result<void> World::despawn(BodyId id) {
    if (m_stepping) {
        return Err(PhysicsError::invalid_parameter("despawn", "not allowed during step"));
    }
    auto removed = m_bodies.remove(id);
    if (!removed) {
        return Err(PhysicsError::missing_body(describe(id)));
    }
    m_order.erase(std::remove(m_order.begin(), m_order.end(), id), m_order.end());

    auto unregistered = m_collidables.unregister(removed->collidable);
    if (!unregistered) {
        gravwell_core::physics_logger()->warn("Despawned body '{}' had no collidable", removed->name);
    }
    return Ok();
}

Result<std::reference_wrapper<DynamicBody>> World::find_mut(BodyId id) {
    DynamicBody* body = m_bodies.get_mut(id);
    if (!body) {
        return Err<std::reference_wrapper<DynamicBody>>(PhysicsError::missing_body(describe(id)));
    }
    return Ok(std::ref(*body));
}

// =============================================================================
// Collidables
// =============================================================================

CollidableId World::register_collidable(const gm::Transform& owner, const gm::LocalBox& local,
                                        CollidableKind kind, bool is_static) {
    return m_collidables.register_collidable(owner, local, std::move(kind), is_static);
}

Result<void> World::unregister_collidable(CollidableId id) {
    const Collidable* entry = m_collidables.get(id);
    if (entry && owner_body(entry->kind)) {
        return Err(PhysicsError::invalid_parameter("collidable", "owned by a dynamic body, despawn the body"));
    }
    auto result = m_collidables.unregister(id);
    if (result) {
        m_celestials.detach_obstacle(id);
    }
    return result;
}

Result<void> World::set_collidable_transform(CollidableId id, const gm::Transform& transform) {
    return m_collidables.set_owner_transform(id, transform);
}

Result<void> World::set_collidable_active(CollidableId id, bool active) {
    return m_collidables.set_active(id, active);
}

void World::sync_body_colliders() {
    for (BodyId id : m_order) {
        const DynamicBody* body = m_bodies.get(id);
        if (!body) {
            continue;
        }
        auto result = m_collidables.set_owner_transform(body->collidable, body->transform());
        if (!result) {
            gravwell_core::physics_logger()->warn("Body '{}' lost its collidable: {}", body->name,
                                                  result.error().message());
        }
    }
    m_stats.bounds_fallbacks += static_cast<std::uint32_t>(m_collidables.update_all());
}

// =============================================================================
// Simulation
// =============================================================================

void World::step(float dt) {
    if (!std::isfinite(dt) || dt <= 0.0f) {
        gravwell_core::physics_logger()->warn("Ignoring step with invalid dt {}", dt);
        return;
    }

    const std::uint64_t ticks = m_stats.ticks + 1;
    m_stats = PhysicsStats{};
    m_stats.ticks = ticks;

    sync_body_colliders();

    SteppingScope stepping(m_stepping);
    const std::vector<BodyId> order = m_order;
    for (BodyId id : order) {
        DynamicBody* body = m_bodies.get_mut(id);
        if (!body) {
            continue;
        }

        if (body->sanitize()) {
            ++m_stats.degenerate_recoveries;
            gravwell_core::debug::record_error(PhysicsError::degenerate_input(body->name));
            gravwell_core::physics_logger()->warn("Body '{}' had degenerate state, restored last valid pose",
                                                  body->name);
        }

        IntegrationContext ctx{m_celestials, m_collidables, m_resolver, id,
                               [this](BodyId other) { return m_bodies.get_mut(other); }};

        const IntegrationResult result = std::visit([&](const auto& params) {
            using P = std::decay_t<decltype(params)>;
            if constexpr (std::is_same_v<P, PlayerParams>) {
                return m_player_step.step(*body, dt, ctx);
            } else {
                return m_vehicle_step.step(*body, dt, ctx);
            }
        }, body->kind);

        ++m_stats.bodies_stepped;
        m_stats.substeps += result.substeps;
        m_stats.velocity_caps += result.capped ? 1 : 0;
        m_stats.landings += result.landed ? 1 : 0;
        m_stats.liftoffs += result.lifted_off ? 1 : 0;

        if (result.contact) {
            ++m_stats.contacts;
            if (m_on_contact) {
                m_on_contact(id, *result.contact);
            }
        }

        if (body->sanitize()) {
            ++m_stats.degenerate_recoveries;
            gravwell_core::debug::record_error(PhysicsError::degenerate_input(body->name));
            gravwell_core::physics_logger()->warn("Body '{}' integrated to a degenerate state, restored",
                                                  body->name);
        }
        body->remember_valid();
    }

    sync_body_colliders();
    m_totals.accumulate(m_stats);
}

// =============================================================================
// Control
// =============================================================================

Result<void> World::set_velocity(BodyId id, const gm::Vec3& velocity) {
    auto body = find_mut(id);
    if (!body) {
        return Err(body.error());
    }
    if (!gm::is_finite(velocity)) {
        return Err(PhysicsError::degenerate_input("velocity"));
    }
    body->get().velocity = velocity;
    return Ok();
}

Result<void> World::add_velocity(BodyId id, const gm::Vec3& delta) {
    auto body = find_mut(id);
    if (!body) {
        return Err(body.error());
    }
    if (!gm::is_finite(delta)) {
        return Err(PhysicsError::degenerate_input("velocity"));
    }
    body->get().velocity += delta;
    return Ok();
}

Result<void> World::rotate(BodyId id, const gm::Quat& delta) {
    auto body = find_mut(id);
    if (!body) {
        return Err(body.error());
    }
    if (!gm::is_finite(delta)) {
        return Err(PhysicsError::degenerate_input("rotation"));
    }
    DynamicBody& b = body->get();
    b.orientation = gm::normalize_or_identity(gm::normalize_or_identity(delta) * b.orientation);
    return Ok();
}

Result<void> World::set_occupied(BodyId id, bool occupied) {
    auto body = find_mut(id);
    if (!body) {
        return Err(body.error());
    }
    auto* params = std::get_if<VehicleParams>(&body->get().kind);
    if (!params) {
        return Err(PhysicsError::invalid_parameter("body", "not a vehicle"));
    }
    params->occupied = occupied;
    return Ok();
}

Result<void> World::apply_snapshot(BodyId id, const BodySnapshot& snapshot) {
    auto body = find_mut(id);
    if (!body) {
        return Err(body.error());
    }
    DynamicBody& b = body->get();
    b.position = snapshot.position;
    b.velocity = snapshot.velocity;
    b.orientation = snapshot.orientation;
    if (b.sanitize()) {
        ++m_stats.degenerate_recoveries;
        if (!m_stepping) {
            // step() folds m_stats into the totals itself
            ++m_totals.degenerate_recoveries;
        }
        gravwell_core::debug::record_error(PhysicsError::degenerate_input(b.name));
        gravwell_core::physics_logger()->warn("Snapshot for '{}' contained degenerate values", b.name);
    }
    b.remember_valid();

    auto synced = m_collidables.set_owner_transform(b.collidable, b.transform());
    if (!synced) {
        return synced;
    }
    return m_collidables.update_bounds(b.collidable);
}

Result<BodySnapshot> World::snapshot(BodyId id) const {
    const DynamicBody* b = m_bodies.get(id);
    if (!b) {
        return Err<BodySnapshot>(PhysicsError::missing_body(describe(id)));
    }
    return Ok(BodySnapshot{b->position, b->velocity, b->orientation});
}

// =============================================================================
// Callbacks
// =============================================================================

Result<void> World::on_landing(BodyId id, SurfaceCallback callback) {
    auto body = find_mut(id);
    if (!body) {
        return Err(body.error());
    }
    body->get().on_landing = std::move(callback);
    return Ok();
}

Result<void> World::on_liftoff(BodyId id, SurfaceCallback callback) {
    auto body = find_mut(id);
    if (!body) {
        return Err(body.error());
    }
    body->get().on_liftoff = std::move(callback);
    return Ok();
}

// =============================================================================
// Accessors
// =============================================================================

std::optional<gm::Vec3> World::position(BodyId id) const {
    const DynamicBody* b = m_bodies.get(id);
    return b ? std::optional<gm::Vec3>(b->position) : std::nullopt;
}

std::optional<gm::Vec3> World::velocity(BodyId id) const {
    const DynamicBody* b = m_bodies.get(id);
    return b ? std::optional<gm::Vec3>(b->velocity) : std::nullopt;
}

std::optional<gm::Quat> World::orientation(BodyId id) const {
    const DynamicBody* b = m_bodies.get(id);
    return b ? std::optional<gm::Quat>(b->orientation) : std::nullopt;
}

std::optional<MotionState> World::state(BodyId id) const {
    const DynamicBody* b = m_bodies.get(id);
    return b ? std::optional<MotionState>(b->state) : std::nullopt;
}

std::optional<gm::Vec3> World::surface_normal(BodyId id) const {
    const DynamicBody* b = m_bodies.get(id);
    return b ? b->surface_normal : std::nullopt;
}

std::optional<CelestialId> World::soi_of(BodyId id) const {
    const DynamicBody* b = m_bodies.get(id);
    return b ? std::optional<CelestialId>(b->soi) : std::nullopt;
}

bool World::is_falling(BodyId id) const {
    return state(id) == MotionState::Falling;
}

bool World::is_grounded(BodyId id) const {
    return state(id) == MotionState::Grounded;
}

bool World::is_standing_on_object(BodyId id) const {
    return state(id) == MotionState::StandingOnObject;
}

} // namespace gravwell_physics
